#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

namespace tare::internal {

    // Mutex-guarded FIFO; the only lock shared between workers
    template <typename T>
    class dispatch_queue {
      public:
        explicit dispatch_queue(std::vector<T> items) : items_{items.begin(), items.end()} {}

        // Empty once drained or once `stop` is requested
        std::optional<T> pop(const std::stop_token& stop) {
            std::lock_guard lock{mutex_};
            if (stop.stop_requested() || items_.empty()) {
                return std::nullopt;
            }
            auto item = std::move(items_.front());
            items_.pop_front();
            return item;
        }

      private:
        std::mutex mutex_;
        std::deque<T> items_;
    };

    /*
     * Runs `body(worker_index, stop)` on `workers` threads and joins them. Each body is expected to
     * drain a shared dispatch_queue; per-worker state lives inside the body.
     */
    inline void run_workers(
            size_t workers, std::stop_token stop, const std::function<void(size_t, std::stop_token)>& body) {
        std::vector<std::jthread> threads{};
        threads.reserve(workers);
        for (size_t i = 0U; i < workers; ++i) {
            threads.emplace_back([&body, i, stop]() { body(i, stop); });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

}  // namespace tare::internal
