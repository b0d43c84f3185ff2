#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace rxdnssd
{

// Cancellation handle of a stream subscription.
// Copies share state. Teardowns added to it run exactly once, on the first
// call to Unsubscribe(), outside of the internal lock.
class Subscription
{
public:
    using Key = std::uint64_t;

    Subscription();

    void Unsubscribe() const;
    [[nodiscard]] bool IsUnsubscribed() const;

    // Runs the teardown immediately if already unsubscribed and returns 0.
    Key Add(std::function<void()> teardown) const;
    Key Add(const Subscription& child) const;
    // Forgets a teardown without running it.
    void Remove(Key key) const;

private:
    struct State
    {
        std::mutex mutex;
        bool unsubscribed{false};
        Key next_key{1};
        std::map<Key, std::function<void()>> teardowns;
    };

    std::shared_ptr<State> m_state;
};

}
