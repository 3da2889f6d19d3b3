#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <termdeck/fwd.hpp>

namespace termdeck
{

class DeferredQueue;

inline constexpr const char* DEFAULT_HOME_TAB_ID = "vault";

/**
 * ActiveTabStore: The single active-tab scalar shared by many observers.
 *
 * get() always returns the latest committed value. set() commits at once but
 * never calls a subscriber: it posts one coalesced flush onto the
 * DeferredQueue, and subscribers run from that flush on the next tick.
 * A subscriber is called at most once per flush, and only when the value it
 * observes (the raw id, or "is my tab active") differs from what it last saw.
 */
class ActiveTabStore
{
   public:
    using ValueCallback  = std::function<void(const TabId& active)>;
    using ActiveCallback = std::function<void(bool is_active)>;

    // Unsubscribes on destruction. Safe to outlive the store.
    class Subscription
    {
       public:
        Subscription() = default;
        ~Subscription() { reset(); }

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        Subscription(const Subscription&)            = delete;
        Subscription& operator=(const Subscription&) = delete;

        void reset();
        bool active() const { return id_ != 0 && !state_.expired(); }

       private:
        friend class ActiveTabStore;
        Subscription(std::weak_ptr<void> state, uint64_t id);

        std::weak_ptr<void> state_;
        uint64_t            id_ = 0;
    };

    explicit ActiveTabStore(DeferredQueue& queue, TabId initial = DEFAULT_HOME_TAB_ID);
    ~ActiveTabStore();

    ActiveTabStore(const ActiveTabStore&)            = delete;
    ActiveTabStore& operator=(const ActiveTabStore&) = delete;

    TabId get() const;
    bool  is_active(const TabId& tab_id) const;

    void set(const TabId& tab_id);

    [[nodiscard]] Subscription subscribe(ValueCallback cb);
    [[nodiscard]] Subscription subscribe_is_active(const TabId& tab_id, ActiveCallback cb);

    // Delivers pending changes. Normally run by the DeferredQueue; callable
    // directly by loops that do not use one. Returns the number of callbacks
    // invoked.
    size_t flush();

    size_t subscriber_count() const;
    bool   notification_pending() const;

   private:
    struct State;

    DeferredQueue&         queue_;
    std::shared_ptr<State> state_;
};

}   // namespace termdeck
