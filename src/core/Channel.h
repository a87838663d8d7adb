#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

#include "logging.h"

namespace vin {

enum class Priority {
    Normal,
    High    // Ahead of all normal items, behind earlier high items
};

/*! Multi-producer, single-consumer FIFO between two threads.
 *
 *  A bounded channel that is full evicts its oldest droppable item to make room.
 *  Items that are not droppable are never evicted; if nothing can be evicted the
 *  new item is admitted anyway.
 *
 *  After close(), pop() still returns the items that were queued before, and
 *  push() fails.
 */
template <typename T>
class Channel
{
public:
    using type_t = T;
    using droppable_t = std::function<bool(const T&)>;

    explicit Channel(std::string name, size_t capacity = 0, droppable_t droppable = {})
        : name_{std::move(name)}, capacity_{capacity}, droppable_{std::move(droppable)} {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool push(T&& data, Priority priority = Priority::Normal)
    {
        bool evicted = false, overfull = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return false;
            }

            if (capacity_ && queue_.size() >= capacity_) {
                evicted = evictOne();
                overfull = !evicted;
            }

            if (priority == Priority::High) {
                queue_.insert(queue_.begin() + static_cast<std::ptrdiff_t>(high_count_),
                              Entry{std::move(data), true});
                ++high_count_;
            } else {
                queue_.push_back(Entry{std::move(data), false});
            }
        }
        cv_.notify_one();

        if (evicted) {
            LOG_WARN << "Channel " << name_ << " is full. Dropped the oldest droppable item.";
        } else if (overfull) {
            LOG_WARN << "Channel " << name_ << " is over capacity (" << capacity_
                     << ") with no droppable items.";
        }
        return true;
    }

    // Blocks until an item is available or the channel is closed and empty
    bool pop(T &out)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&]{ return !queue_.empty() || closed_; });
        return takeFront(out);
    }

    template <typename Rep, typename Period>
    bool popFor(T &out, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [&]{ return !queue_.empty() || closed_; });
        return takeFront(out);
    }

    bool tryPop(T &out)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return takeFront(out);
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const noexcept {
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    const std::string& name() const noexcept {
        return name_;
    }

private:
    struct Entry {
        T value;
        bool high{};
    };

    // Called with the lock held
    bool takeFront(T& out) {
        if (queue_.empty()) {
            return false;
        }
        auto& front = queue_.front();
        if (front.high) {
            --high_count_;
        }
        out = std::move(front.value);
        queue_.pop_front();
        return true;
    }

    // Called with the lock held
    bool evictOne() {
        if (!droppable_) {
            return false;
        }
        for (auto it = queue_.begin(); it != queue_.end(); ++it) {
            if (droppable_(it->value)) {
                if (it->high) {
                    --high_count_;
                }
                queue_.erase(it);
                return true;
            }
        }
        return false;
    }

    const std::string name_;
    const size_t capacity_;
    const droppable_t droppable_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Entry> queue_;
    size_t high_count_{};
    std::atomic_bool closed_{false};
};

} // ns
