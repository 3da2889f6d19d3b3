#include "active_tab_store.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <utility>
#include <termdeck/logger.hpp>
#include <vector>

#include "deferred_queue.hpp"

namespace termdeck
{

struct ActiveTabStore::State
{
    struct Subscriber
    {
        uint64_t             id = 0;
        std::optional<TabId> watched;   // Set for is-active subscribers
        ValueCallback        on_value;
        ActiveCallback       on_active;
        TabId                last_value;
        bool                 last_active = false;
    };

    mutable std::mutex      mutex;
    TabId                   value;
    bool                    flush_pending = false;
    uint64_t                next_id       = 1;
    std::vector<Subscriber> subscribers;

    void remove(uint64_t id)
    {
        std::lock_guard lock(mutex);
        std::erase_if(subscribers, [id](const Subscriber& s) { return s.id == id; });
    }

    bool subscribed(uint64_t id) const
    {
        std::lock_guard lock(mutex);
        return std::any_of(subscribers.begin(), subscribers.end(), [id](const Subscriber& s) { return s.id == id; });
    }

    size_t flush()
    {
        std::vector<std::pair<uint64_t, std::function<void()>>> calls;
        {
            std::lock_guard lock(mutex);
            flush_pending = false;
            for (auto& sub : subscribers)
            {
                if (sub.watched)
                {
                    bool now = value == *sub.watched;
                    if (now == sub.last_active)
                        continue;
                    sub.last_active = now;
                    if (sub.on_active)
                        calls.emplace_back(sub.id, [cb = sub.on_active, now] { cb(now); });
                }
                else
                {
                    if (value == sub.last_value)
                        continue;
                    sub.last_value = value;
                    if (sub.on_value)
                        calls.emplace_back(sub.id, [cb = sub.on_value, v = value] { cb(v); });
                }
            }
        }
        // Outside the lock: callbacks may read or write the store, and may
        // drop a Subscription whose call is still queued in this flush.
        size_t delivered = 0;
        for (auto& [id, call] : calls)
        {
            if (!subscribed(id))
                continue;
            call();
            ++delivered;
        }
        return delivered;
    }
};

// ─── Subscription ────────────────────────────────────────────────────────────

ActiveTabStore::Subscription::Subscription(std::weak_ptr<void> state, uint64_t id)
    : state_(std::move(state)), id_(id)
{
}

ActiveTabStore::Subscription::Subscription(Subscription&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_)
{
    other.id_ = 0;
}

ActiveTabStore::Subscription& ActiveTabStore::Subscription::operator=(Subscription&& other) noexcept
{
    if (this != &other)
    {
        reset();
        state_    = std::move(other.state_);
        id_       = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void ActiveTabStore::Subscription::reset()
{
    if (id_ != 0)
    {
        if (auto locked = state_.lock())
            std::static_pointer_cast<State>(locked)->remove(id_);
    }
    state_.reset();
    id_ = 0;
}

// ─── ActiveTabStore ──────────────────────────────────────────────────────────

ActiveTabStore::ActiveTabStore(DeferredQueue& queue, TabId initial)
    : queue_(queue), state_(std::make_shared<State>())
{
    state_->value = std::move(initial);
}

ActiveTabStore::~ActiveTabStore() = default;

TabId ActiveTabStore::get() const
{
    std::lock_guard lock(state_->mutex);
    return state_->value;
}

bool ActiveTabStore::is_active(const TabId& tab_id) const
{
    std::lock_guard lock(state_->mutex);
    return state_->value == tab_id;
}

void ActiveTabStore::set(const TabId& tab_id)
{
    bool schedule = false;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->value == tab_id)
            return;
        state_->value = tab_id;
        if (!state_->flush_pending)
        {
            state_->flush_pending = true;
            schedule              = true;
        }
    }
    TERMDECK_LOG_DEBUG("store", "active tab -> {}", tab_id);

    if (schedule)
    {
        std::weak_ptr<State> weak = state_;
        queue_.post(
            [weak]
            {
                if (auto state = weak.lock())
                    state->flush();
            });
    }
}

ActiveTabStore::Subscription ActiveTabStore::subscribe(ValueCallback cb)
{
    std::lock_guard   lock(state_->mutex);
    State::Subscriber sub;
    sub.id         = state_->next_id++;
    sub.on_value   = std::move(cb);
    sub.last_value = state_->value;
    state_->subscribers.push_back(std::move(sub));
    return Subscription(state_, state_->subscribers.back().id);
}

ActiveTabStore::Subscription ActiveTabStore::subscribe_is_active(const TabId& tab_id, ActiveCallback cb)
{
    std::lock_guard   lock(state_->mutex);
    State::Subscriber sub;
    sub.id          = state_->next_id++;
    sub.watched     = tab_id;
    sub.on_active   = std::move(cb);
    sub.last_active = state_->value == tab_id;
    state_->subscribers.push_back(std::move(sub));
    return Subscription(state_, state_->subscribers.back().id);
}

size_t ActiveTabStore::flush()
{
    return state_->flush();
}

size_t ActiveTabStore::subscriber_count() const
{
    std::lock_guard lock(state_->mutex);
    return state_->subscribers.size();
}

bool ActiveTabStore::notification_pending() const
{
    std::lock_guard lock(state_->mutex);
    return state_->flush_pending;
}

}   // namespace termdeck
