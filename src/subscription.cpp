#include "rxdnssd/subscription.hpp"

namespace rxdnssd
{

Subscription::Subscription()
: m_state(std::make_shared<State>())
{}

void Subscription::Unsubscribe() const
{
    std::map<Key, std::function<void()>> teardowns;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (m_state->unsubscribed) {
            return;
        }
        m_state->unsubscribed = true;
        teardowns.swap(m_state->teardowns);
    }

    for (auto& [key, teardown] : teardowns) {
        teardown();
    }
}

bool Subscription::IsUnsubscribed() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->unsubscribed;
}

Subscription::Key Subscription::Add(std::function<void()> teardown) const
{
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        if (!m_state->unsubscribed) {
            const Key key = m_state->next_key++;
            m_state->teardowns.emplace(key, std::move(teardown));
            return key;
        }
    }
    teardown();
    return 0;
}

Subscription::Key Subscription::Add(const Subscription& child) const
{
    return Add([child]() {
        child.Unsubscribe();
    });
}

void Subscription::Remove(Key key) const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->teardowns.erase(key);
}

}
