#include "codebox/tools/tool_executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <deque>

namespace codebox::tools {

// ThreadPool
ThreadPool::ThreadPool(size_t num_threads) {
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            while (true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    condition_.wait(lock, [this] {
                        return stop_ || !tasks_.empty();
                    });

                    if (stop_ && tasks_.empty()) {
                        return;
                    }

                    task = std::move(tasks_.front());
                    tasks_.pop();
                }

                task();
            }
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

// ToolExecutor
ToolExecutor::ToolExecutor(ToolRegistry& registry, const ConcurrencyConfig& config)
    : registry_(registry)
    , config_(config)
{
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(std::max(1, config.thread_pool_size)));
}

ToolExecutor::~ToolExecutor() = default;

Result<ToolResult, Error> ToolExecutor::execute(const ToolCall& call, const ToolContext& ctx) {
    auto start = std::chrono::steady_clock::now();

    auto result = registry_.execute(call.tool_name, call.arguments, ctx);

    auto end = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<Duration>(end - start);

    if (result.is_ok()) {
        auto& res = result.value();
        res.tool_call_id = call.id;
        record_execution(res.success, false, duration);
    } else {
        const auto code = result.error().code;
        spdlog::warn("Tool call {} ({}) failed: {}", call.id, call.tool_name, result.error().full_message());
        record_execution(false, code == ErrorCode::ToolTimeout || code == ErrorCode::DeadlineExceeded,
                         duration);
    }

    return result;
}

std::vector<ToolResult> ToolExecutor::execute_batch(const std::vector<ToolCall>& calls,
                                                    const ToolContext& ctx) {
    if (calls.empty()) {
        return {};
    }

    // Limit parallel execution
    const size_t max_parallel = std::min(
        static_cast<size_t>(std::max(1, config_.max_parallel_tools)),
        calls.size()
    );

    std::vector<ToolResult> results;
    results.reserve(calls.size());

    // Sliding window: the oldest call is collected before one more is
    // submitted, which also keeps results in call order
    std::deque<std::future<ToolResult>> in_flight;

    auto collect_oldest = [&] {
        results.push_back(in_flight.front().get());
        in_flight.pop_front();
    };

    for (const auto& call : calls) {
        if (in_flight.size() == max_parallel) {
            collect_oldest();
        }

        in_flight.push_back(pool_->submit([this, call, ctx]() -> ToolResult {
            auto result = execute(call, ctx);
            if (result.is_ok()) {
                return std::move(result).value();
            } else {
                return ToolResult{
                    .tool_call_id = call.id,
                    .success = false,
                    .content = "",
                    .error_message = result.error().full_message()
                };
            }
        }));
    }

    while (!in_flight.empty()) {
        collect_oldest();
    }

    return results;
}

ToolExecutor::Stats ToolExecutor::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void ToolExecutor::reset_stats() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = Stats{};
}

void ToolExecutor::record_execution(bool success, bool timed_out, Duration time) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.total_executions++;
    if (success) {
        stats_.successful++;
    } else {
        stats_.failed++;
    }
    if (timed_out) {
        stats_.timeouts++;
    }
    stats_.total_time += time;
}

}  // namespace codebox::tools
