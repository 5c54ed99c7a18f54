#pragma once

/*
    MXR SPATIAL RENDERER

    FILE: event_queue.hpp
    MODULE: core
    PURPOSE: Mutex-guarded inbox. Sensing and input threads enqueue,
            the update thread drains the whole backlog once per tick.
*/


#include <mutex>
#include <utility>
#include <vector>

namespace mxr
{
    template<typename T>
    class LockingQueue
    {
    public:
        void enqueue(T item)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
        }

        void enqueue(std::vector<T> items)
        {
            if (items.empty()) return;
            std::lock_guard<std::mutex> lock(mutex_);
            for (T& it : items)
            {
                items_.push_back(std::move(it));
            }
        }

        // Returns the backlog in insertion order and leaves the queue empty.
        std::vector<T> drain_all()
        {
            std::vector<T> out{};
            {
                std::lock_guard<std::mutex> lock(mutex_);
                out.swap(items_);
            }
            return out;
        }

        size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return items_.size();
        }

        bool empty() const
        {
            return size() == 0;
        }

    private:
        mutable std::mutex mutex_{};
        std::vector<T> items_{};
    };
}
