#include "config/config.h"
#include "engine/optimizer.h"
#include "io/bundle_loader.h"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [bundle.json] [--now YYYY-MM-DDTHH:MM:SSZ]\n";
}

void print_result(const queueforge::OptimizationResult& result) {
    using namespace queueforge;

    std::cout << fmt::format("{:<4} {:<10} {:<12} {:<21} {:<21} {:>8}\n", "#", "Job", "Machine",
                             "Start", "End", "Late");
    for (const auto& sj : result.optimized_schedule) {
        std::cout << fmt::format("{:<4} {:<10} {:<12} {:<21} {:<21} {:>8}\n", sj.sequence_number,
                                 sj.job.id,
                                 sj.unassignable ? "(none)" : sj.assigned_machine,
                                 format_iso_time(sj.scheduled_start),
                                 format_iso_time(sj.scheduled_end), sj.is_late() ? "yes" : "no");
    }

    std::cout << "\nKey metrics\n";
    for (const auto& [name, value] : result.key_metrics) {
        std::cout << fmt::format("  {:<16} {}\n", name, value);
    }

    std::cout << "\nScenarios\n";
    for (const auto& s : result.alternative_schedules) {
        std::cout << fmt::format("  {:<18} makespan {:.1f}h  span {:.1f}h  on-time {:.0f}%  cost {:.0f}\n",
                                 s.name, s.makespan, s.schedule_span, s.on_time_rate, s.total_cost);
    }

    const auto& alerts = result.alerts_and_recommendations;
    if (!alerts.urgent_actions.empty() || !alerts.capacity_warnings.empty()) {
        std::cout << "\nAlerts\n";
        for (const auto& a : alerts.urgent_actions) std::cout << "  ! " << a << "\n";
        for (const auto& a : alerts.capacity_warnings) std::cout << "  ~ " << a << "\n";
    }

    std::cout << "\nRecommendations\n";
    for (const auto& r : result.recommendations) std::cout << "  - " << r << "\n";
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        auto& config = queueforge::get_config();

        spdlog::set_level(spdlog::level::from_str(config.log_level));

        std::string input = config.input_path;
        std::string now_text = config.reference_time;
        for (int i = 1; i < argc; ++i) {
            if (std::strcmp(argv[i], "--now") == 0) {
                if (i + 1 >= argc) {
                    print_usage(argv[0]);
                    return 2;
                }
                now_text = argv[++i];
            } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
                print_usage(argv[0]);
                return 0;
            } else {
                input = argv[i];
            }
        }

        if (input.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        queueforge::TimePoint now = queueforge::Clock::now();
        if (!now_text.empty() && !queueforge::parse_iso_time(now_text, now)) {
            throw std::invalid_argument("Invalid reference time: " + now_text);
        }

        spdlog::info("Optimizing {} at {}", input, queueforge::format_iso_time(now));

        auto bundle = queueforge::load_bundle(input);
        queueforge::JobQueueOptimizer optimizer(config);
        auto result = optimizer.optimize(bundle, now);

        print_result(result);
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
