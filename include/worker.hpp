#pragma once
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <ranges>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

// Runs blocking jobs (bazel, disk) off the UI thread. At most one job per key is in
// flight; a second request for the same key is dropped, not queued. Results are
// only ever handed over on the thread that calls drain(), so UI state is never
// touched from a worker.
//
// Jobs must own everything they touch: on destruction unfinished jobs are detached
// and their results dropped.
template <typename Result>
class BackgroundWorker {
public:
    using Job = std::function<Result()>;
    using Wake = std::function<void()>;
    using Apply = std::function<void(const std::string& key, Result)>;

    BackgroundWorker() = default;
    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;

    ~BackgroundWorker() {
        for (auto& [key, task] : in_flight_) {
            if (task.thread.joinable()) task.thread.detach();
        }
    }

    // Returns false when a job with this key is still running.
    // wake runs on the worker thread once the result is available.
    bool request(const std::string& key, Job job, Wake wake = {}) {
        if (in_flight_.contains(key)) {
            return false;
        }

        std::promise<Result> promise;
        Task task;
        task.future = promise.get_future();
        task.thread = std::thread(
            [job = std::move(job), wake = std::move(wake), promise = std::move(promise)]() mutable {
                try {
                    promise.set_value(job());
                } catch (...) {
                    promise.set_exception(std::current_exception());
                }
                if (wake) wake();
            });
        in_flight_.emplace(key, std::move(task));
        return true;
    }

    [[nodiscard]] bool in_flight(const std::string& key) const {
        return in_flight_.contains(key);
    }

    [[nodiscard]] bool busy() const {
        return !in_flight_.empty();
    }

    // Call on the UI thread. Hands finished results to apply and releases their keys
    // first, so apply may request new work. A job's exception is rethrown here once
    // every other finished result has been applied.
    size_t drain(const Apply& apply) {
        std::vector<std::pair<std::string, Task>> ready;
        for (auto it = in_flight_.begin(); it != in_flight_.end();) {
            if (it->second.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                ++it;
                continue;
            }
            ready.emplace_back(it->first, std::move(it->second));
            it = in_flight_.erase(it);
        }

        for (auto& task : ready | std::views::values) {
            if (task.thread.joinable()) task.thread.join();
        }

        std::exception_ptr failure;
        for (auto& [key, task] : ready) {
            try {
                apply(key, task.future.get());
            } catch (...) {
                if (!failure) failure = std::current_exception();
            }
        }
        if (failure) std::rethrow_exception(failure);
        return ready.size();
    }

    // Blocks until the job for key finishes, then drains whatever is ready.
    size_t wait(const std::string& key, const Apply& apply) {
        if (const auto it = in_flight_.find(key); it != in_flight_.end()) {
            it->second.future.wait();
        }
        return drain(apply);
    }

private:
    struct Task {
        std::future<Result> future;
        std::thread thread;
    };

    std::unordered_map<std::string, Task> in_flight_;
};
