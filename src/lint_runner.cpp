#include "lint_runner.hpp"
#include "compact_log.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <mutex>
#include <queue>
#include <thread>

namespace doclint {

int exit_code_for(const LintOutcome& outcome) {
    if (!outcome) return kExitFailure;
    return outcome->empty() ? kExitPass : kExitViolations;
}

LintRunner::LintRunner(LintConfig config)
    : config_(std::move(config)),
      discoverer_(config_.discovery),
      scanner_(config_.patterns) {}

LintOutcome LintRunner::run() const {
    auto files = discoverer_.discover_tree();
    if (!files) {
        return std::unexpected(LintErrorInfo{LintError::DiscoveryFailed, files.error().message});
    }
    return scan_all(*files);
}

LintOutcome LintRunner::run(ChangedFileProvider& provider, const std::string& change_id) const {
    auto files = discoverer_.discover_changed(provider, change_id);
    if (!files) {
        return std::unexpected(LintErrorInfo{LintError::ChangeLookupFailed, files.error().message});
    }
    return scan_all(*files);
}

Report LintRunner::scan_all(const std::vector<std::filesystem::path>& files) const {
    Report report;
    size_t num_threads = std::min(std::max<size_t>(config_.jobs, 1), files.size());

    if (num_threads <= 1) {
        for (const auto& file : files) report.add(scanner_.scan_file(file));
        return report;
    }

    std::queue<const std::filesystem::path*> task_queue;
    for (const auto& file : files) task_queue.push(&file);
    std::mutex queue_mutex;
    std::mutex report_mutex;

    auto worker = [&]() {
        while (true) {
            const std::filesystem::path* task;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (task_queue.empty()) return;
                task = task_queue.front();
                task_queue.pop();
            }
            auto result = scanner_.scan_file(*task);
            if (result.clean()) continue;
            std::lock_guard<std::mutex> lock(report_mutex);
            report.add(std::move(result));
        }
    };

    compact::Writer::debug(fmt::format("scanning {} files on {} threads", files.size(), num_threads));
    {
        std::vector<std::jthread> workers;
        workers.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) workers.emplace_back(worker);
    }
    return report;
}

} // namespace doclint
