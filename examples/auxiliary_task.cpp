/**
 * @file auxiliary_task.cpp
 * @brief Schedules two logging tasks from the render thread every 1024 periods.
 *
 * @copyright GPL-2.0-or-later
 */

#include "belart/belart.h"
#include "rtio/headless_engine.h"

#include <cstdio>
#include <optional>
#include <vector>

namespace {

class Printer {
public:
    explicit Printer(std::vector<belart::AuxiliaryTask> tasks)
        : tasks_(std::move(tasks))
    {}

    static std::optional<Printer> create(belart::SetupContext& ctx) {
        std::vector<belart::AuxiliaryTask> tasks;

        auto first = ctx.create_auxiliary_task(
            [] { BELART_LOG_INFO("EXAMPLE", "this is a string"); }, 10, "printing_stuff");
        if (!first) {
            return std::nullopt;
        }
        tasks.push_back(std::move(*first));

        auto second = ctx.create_auxiliary_task(
            [] { BELART_LOG_INFO("EXAMPLE", "this is another string"); }, 10, "printing_more_stuff");
        if (!second) {
            return std::nullopt;
        }
        tasks.push_back(std::move(*second));

        return Printer(std::move(tasks));
    }

    void render(belart::RenderContext& ctx) noexcept {
        if (period_ % 1024 == 0) {
            for (const auto& task : tasks_) {
                // Fails only once the engine has stopped the task; render must not log
                (void)ctx.schedule_auxiliary_task(task);
            }
        }
        ++period_;
    }

private:
    std::vector<belart::AuxiliaryTask> tasks_;
    size_t period_ = 0;
};

} // anonymous namespace

int main() {
    rtio::HeadlessEngine engine;
    auto result = belart::Runtime(&Printer::create, engine).run();
    if (!result) {
        std::fprintf(stderr, "%s\n", result.error().format().c_str());
        return 1;
    }
    return 0;
}
