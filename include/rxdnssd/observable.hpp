#pragma once

#include "rxdnssd/log.hpp"
#include "rxdnssd/subscription.hpp"
#include "rxdnssd/types.hpp"

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace rxdnssd
{

// What FlatMap does when one of its inner streams fails.
enum class ErrorPolicy
{
    // Log the failure and treat the inner stream as finished
    Isolate,
    // Fail the whole stream, cancelling the source and all other inner streams
    Propagate
};

// Receiving end of a stream.
// Events are delivered one at a time under the emit lock and dropped once a
// terminal event was delivered or the subscription was cancelled.
// A terminal event cancels the subscription, releasing its resources.
template <typename T>
class Subscriber
{
public:
    using NextFn = std::function<void(const T&)>;
    using ErrorFn = std::function<void(std::exception_ptr)>;
    using CompletedFn = std::function<void()>;

    Subscriber(NextFn on_next, ErrorFn on_error, CompletedFn on_completed, Subscription subscription = Subscription())
    : m_onNext(std::move(on_next))
    , m_onError(std::move(on_error))
    , m_onCompleted(std::move(on_completed))
    , m_subscription(std::move(subscription))
    {}

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    void OnNext(const T& value)
    {
        std::exception_ptr error;
        {
            std::lock_guard<std::recursive_mutex> lock(m_emitMutex);
            if (m_stopped || m_subscription.IsUnsubscribed()) {
                return;
            }
            if (m_onNext) {
                try {
                    m_onNext(value);
                } catch (...) {
                    // A throwing consumer fails its own subscription
                    error = std::current_exception();
                }
            }
        }
        if (error) {
            OnError(error);
        }
    }

    void OnError(std::exception_ptr error)
    {
        {
            std::lock_guard<std::recursive_mutex> lock(m_emitMutex);
            if (m_stopped || m_subscription.IsUnsubscribed()) {
                return;
            }
            m_stopped = true;
            if (m_onError) {
                m_onError(error);
            } else {
                Log(LogLevel::Error, "Unhandled stream error: " + DescribeError(error));
            }
        }
        m_subscription.Unsubscribe();
    }

    void OnCompleted()
    {
        {
            std::lock_guard<std::recursive_mutex> lock(m_emitMutex);
            if (m_stopped || m_subscription.IsUnsubscribed()) {
                return;
            }
            m_stopped = true;
            if (m_onCompleted) {
                m_onCompleted();
            }
        }
        m_subscription.Unsubscribe();
    }

    [[nodiscard]] bool IsUnsubscribed() const { return m_subscription.IsUnsubscribed(); }
    void Unsubscribe() { m_subscription.Unsubscribe(); }

    [[nodiscard]] const Subscription& GetSubscription() const { return m_subscription; }

    Subscription::Key Add(std::function<void()> teardown) { return m_subscription.Add(std::move(teardown)); }
    Subscription::Key Add(const Subscription& child) { return m_subscription.Add(child); }
    void Remove(Subscription::Key key) { m_subscription.Remove(key); }

private:
    NextFn m_onNext;
    ErrorFn m_onError;
    CompletedFn m_onCompleted;
    Subscription m_subscription;

    std::recursive_mutex m_emitMutex;
    bool m_stopped{false};
};

// Cold stream: nothing happens until Subscribe() is called, and every call
// runs the subscribe function again for a new, independent subscriber.
template <typename T>
class Observable
{
public:
    using SubscriberPtr = std::shared_ptr<Subscriber<T>>;
    using OnSubscribe = std::function<void(const SubscriberPtr&)>;

    explicit Observable(OnSubscribe on_subscribe)
    : m_onSubscribe(std::move(on_subscribe))
    {}

    // Exceptions thrown while subscribing are delivered as OnError.
    void Subscribe(const SubscriberPtr& subscriber) const
    {
        if (subscriber->IsUnsubscribed()) {
            return;
        }
        try {
            m_onSubscribe(subscriber);
        } catch (...) {
            subscriber->OnError(std::current_exception());
        }
    }

    Subscription Subscribe(typename Subscriber<T>::NextFn on_next,
                           typename Subscriber<T>::ErrorFn on_error = {},
                           typename Subscriber<T>::CompletedFn on_completed = {}) const
    {
        auto subscriber = std::make_shared<Subscriber<T>>(std::move(on_next), std::move(on_error), std::move(on_completed));
        Subscribe(subscriber);
        return subscriber->GetSubscription();
    }

    template <typename Transformer>
    auto Compose(Transformer&& transformer) const -> decltype(transformer(std::declval<const Observable<T>&>()))
    {
        return transformer(*this);
    }

    // Emissions of both streams in arrival order. Completes when both completed,
    // fails as soon as one fails, which also cancels the other.
    Observable<T> MergeWith(const Observable<T>& other) const
    {
        const std::vector<Observable<T>> sources{*this, other};
        return Observable<T>([sources](const SubscriberPtr& downstream) {
            auto remaining = std::make_shared<std::atomic<std::size_t>>(sources.size());
            for (const auto& source : sources) {
                auto inner = std::make_shared<Subscriber<T>>(
                    [downstream](const T& value) {
                        downstream->OnNext(value);
                    },
                    [downstream](std::exception_ptr error) {
                        downstream->OnError(error);
                    },
                    [downstream, remaining]() {
                        if (--(*remaining) == 0) {
                            downstream->OnCompleted();
                        }
                    });
                downstream->Add(inner->GetSubscription());
                source.Subscribe(inner);
            }
        });
    }

    // Maps every emission to a stream and merges all of them into the result.
    // Cancelling the result cancels the source and every running inner stream.
    Observable<T> FlatMap(std::function<Observable<T>(const T&)> func, ErrorPolicy policy = ErrorPolicy::Propagate) const
    {
        const Observable<T> source = *this;
        return Observable<T>([source, func, policy](const SubscriberPtr& downstream) {
            // The source plus every running inner stream
            auto active = std::make_shared<std::atomic<std::size_t>>(1);
            auto finish = [downstream, active]() {
                if (--(*active) == 0) {
                    downstream->OnCompleted();
                }
            };

            auto upstream = std::make_shared<Subscriber<T>>(
                [downstream, func, policy, active, finish](const T& value) {
                    const Observable<T> inner = func(value);
                    ++(*active);

                    auto key = std::make_shared<std::atomic<Subscription::Key>>(0);
                    auto innerSubscriber = std::make_shared<Subscriber<T>>(
                        [downstream](const T& innerValue) {
                            downstream->OnNext(innerValue);
                        },
                        [downstream, policy, finish, key](std::exception_ptr error) {
                            if (policy == ErrorPolicy::Propagate) {
                                downstream->OnError(error);
                                return;
                            }
                            Log(LogLevel::Warn, "Inner stream failed, continuing: " + DescribeError(error));
                            downstream->Remove(key->load());
                            finish();
                        },
                        [downstream, finish, key]() {
                            downstream->Remove(key->load());
                            finish();
                        });
                    key->store(downstream->Add(innerSubscriber->GetSubscription()));
                    inner.Subscribe(innerSubscriber);
                },
                [downstream](std::exception_ptr error) {
                    downstream->OnError(error);
                },
                finish);
            downstream->Add(upstream->GetSubscription());
            source.Subscribe(upstream);
        });
    }

    static Observable<T> Just(T value)
    {
        return Observable<T>([value](const SubscriberPtr& subscriber) {
            subscriber->OnNext(value);
            subscriber->OnCompleted();
        });
    }

    static Observable<T> Error(std::exception_ptr error)
    {
        return Observable<T>([error](const SubscriberPtr& subscriber) {
            subscriber->OnError(error);
        });
    }

private:
    OnSubscribe m_onSubscribe;
};

}
