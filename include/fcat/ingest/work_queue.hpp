/**
 * @file work_queue.hpp
 * @brief Blocking FIFO that knows when a self-feeding job has drained
 *
 * Tree walking pushes new directories while it pops old ones, so "queue
 * empty" does not mean "done". Every push counts one outstanding task;
 * workers call task_done() after handling an item. pop() returns nullopt
 * once the queue is empty and nothing is outstanding, or after shutdown().
 *
 * EXAMPLE:
 * WorkQueue<fs::path> queue;
 * queue.push(root);
 * // on each worker:
 * while (auto dir = queue.pop()) {
 *     visit(*dir, queue);   // may push subdirectories
 *     queue.task_done();
 * }
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace fcat::ingest {

template<typename T>
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
            ++outstanding_;
        }
        cv_.notify_one();
    }

    /**
     * @brief Pop the next item
     *
     * BLOCKS: until an item is available, all work is done, or shutdown
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() {
            return !queue_.empty() || outstanding_ == 0 || shutdown_;
        });

        if (queue_.empty() || shutdown_) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /// Mark one popped item as fully handled.
    void task_done() {
        bool drained = false;
        {
            std::unique_lock lock(mutex_);
            if (outstanding_ > 0) {
                --outstanding_;
            }
            drained = outstanding_ == 0;
        }
        if (drained) {
            cv_.notify_all();
        }
    }

    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    std::size_t outstanding() const {
        std::unique_lock lock(mutex_);
        return outstanding_;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t outstanding_ = 0;
    bool shutdown_ = false;
};

} // namespace fcat::ingest
