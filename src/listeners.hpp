#pragma once

#include "rxdnssd/discovery_service.hpp"
#include "rxdnssd/observable.hpp"
#include "rxdnssd/service_record_builder.hpp"
#include "rxdnssd/types.hpp"

#include <memory>

namespace rxdnssd
{

using RecordSubscriber = std::shared_ptr<Subscriber<ServiceRecord>>;

// Each browse reply becomes one record carrying only the identity.
BrowseListener MakeBrowseListener(RecordSubscriber subscriber);

// The resolve reply completes the record with host, port and TXT, then the stream completes.
ResolveListener MakeResolveListener(RecordSubscriber subscriber, ServiceRecord record);

// Each address answer is added to the shared builder and the cumulative snapshot emitted.
QueryListener MakeQueryListener(RecordSubscriber subscriber, std::shared_ptr<ServiceRecordBuilder> builder);

// The confirmation becomes the requested record with the name, type and domain actually assigned.
RegisterListener MakeRegisterListener(RecordSubscriber subscriber, ServiceRecord requested);

}
