#pragma once

/// @file include/matchcast/deadline.hpp
/// @brief Bounded-time invocation of collaborator lookups.
///
/// # Module: DeadlineRunner
///
/// ## Responsibility
/// Run one collaborator lookup on a worker thread and wait at most a fixed
/// timeout for it, so that an unresponsive collaborator cannot hold the
/// caller.
///
/// ## Guarantees
/// - A lookup that answers in time is joined before `call` returns.
/// - A lookup that misses its deadline is kept by the runner, reaped by a
///   later `call` once it finishes, and joined at the latest when the runner
///   is destroyed. No worker outlives its runner, so collaborators need only
///   outlive the object that owns the runner.
/// - Callables must capture by value; their result is dropped after a
///   timeout.

#include "matchcast/errors.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace matchcast {

class DeadlineRunner {
public:
    DeadlineRunner() = default;
    DeadlineRunner(const DeadlineRunner&)            = delete;
    DeadlineRunner& operator=(const DeadlineRunner&) = delete;

    /// Joins every abandoned lookup still running.
    ~DeadlineRunner() {
        std::lock_guard lock(mutex_);
        for (auto& w : abandoned_) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
    }

    /// Invoke `fn` and wait at most `timeout` for its result.
    ///
    /// Exceptions raised by `fn` are rethrown unchanged in the caller.
    ///
    /// # Throws
    /// `TransientError` when `timeout` elapses first.
    template <typename Fn>
    [[nodiscard]] std::invoke_result_t<Fn>
    call(Fn fn, std::chrono::milliseconds timeout, std::string_view what) {
        using Result = std::invoke_result_t<Fn>;

        std::packaged_task<Result()> task(std::move(fn));
        std::future<Result> result = task.get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::thread worker([task = std::move(task), done]() mutable {
            task();
            done->store(true, std::memory_order_release);
        });

        if (result.wait_for(timeout) != std::future_status::ready) {
            abandon(std::move(worker), std::move(done));
            throw TransientError(
                fmt::format("{} timed out after {} ms", what, timeout.count()));
        }
        worker.join();
        return result.get();
    }

    /// Timed-out lookups not yet reaped.
    [[nodiscard]] std::size_t abandoned() const {
        std::lock_guard lock(mutex_);
        return abandoned_.size();
    }

private:
    struct Worker {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void abandon(std::thread thread, std::shared_ptr<std::atomic<bool>> done) {
        std::lock_guard lock(mutex_);
        std::erase_if(abandoned_, [](Worker& w) {
            if (!w.done->load(std::memory_order_acquire)) {
                return false;
            }
            w.thread.join();
            return true;
        });
        abandoned_.push_back(Worker{std::move(thread), std::move(done)});
    }

    mutable std::mutex  mutex_;
    std::vector<Worker> abandoned_;
};

}  // namespace matchcast
