#pragma once

#include "rxdnssd/discovery_service.hpp"
#include "rxdnssd/observable.hpp"

#include <functional>
#include <memory>

namespace rxdnssd
{

template <typename T>
using ServiceCreator = std::function<std::unique_ptr<ServiceHandle>(const std::shared_ptr<Subscriber<T>>&)>;

// Turns one discovery operation into a stream.
// The creator starts the operation for each subscriber and hands it the
// subscriber as sink. If the creator throws the subscriber gets the error
// and nothing else. The returned handle is cancelled exactly once, when the
// subscription is cancelled or the stream terminates.
template <typename T>
Observable<T> CreateObservable(ServiceCreator<T> creator)
{
    return Observable<T>([creator](const std::shared_ptr<Subscriber<T>>& subscriber) {
        std::shared_ptr<ServiceHandle> handle = creator(subscriber);
        if (!handle) {
            throw DiscoveryError(ErrorCode::Unknown, "Discovery service returned no handle");
        }
        subscriber->Add([handle]() {
            handle->Cancel();
        });
    });
}

}
