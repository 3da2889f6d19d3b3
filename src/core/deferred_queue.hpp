#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace termdeck
{

// Task queue drained once per event-loop tick. Producers may post from any
// thread; the owning loop calls drain() between passes so that posted work
// never runs inside the pass that posted it.
//
// Tasks posted while draining are kept for the next drain().
class DeferredQueue
{
   public:
    using Task = std::function<void()>;

    DeferredQueue() = default;

    DeferredQueue(const DeferredQueue&)            = delete;
    DeferredQueue& operator=(const DeferredQueue&) = delete;

    void post(Task task)
    {
        if (!task)
            return;
        std::lock_guard lock(mutex_);
        pending_.push_back(std::move(task));
    }

    // Runs the tasks that were pending when the call started. Returns the
    // number executed.
    size_t drain()
    {
        std::vector<Task> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(pending_);
        }
        for (auto& task : batch)
            task();
        return batch.size();
    }

    bool empty() const
    {
        std::lock_guard lock(mutex_);
        return pending_.empty();
    }

    size_t size() const
    {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::vector<Task>  pending_;
};

}   // namespace termdeck
