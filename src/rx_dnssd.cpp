#include "rxdnssd/rx_dnssd.hpp"
#include "rxdnssd/create_observable.hpp"
#include "rxdnssd/log.hpp"
#include "rxdnssd/service_record_builder.hpp"
#include "rxdnssd/txt_record.hpp"

#include "listeners.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <tuple>
#include <vector>

#include <fmt/core.h>

namespace rxdnssd
{

namespace
{

RecordObservable QueryAddresses(const std::shared_ptr<DiscoveryService>& service, const ServiceRecord& record,
                                const std::shared_ptr<ServiceRecordBuilder>& builder, RecordType type)
{
    return CreateObservable<ServiceRecord>([service, record, builder, type](const RecordSubscriber& subscriber) {
        if (record.hostname.empty()) {
            throw DiscoveryError(ErrorCode::BadParam,
                fmt::format("Cannot query {} records of {}, it has not been resolved", ToString(type), record.service_name));
        }
        Log(LogLevel::Debug, fmt::format("Querying {} records of {} on interface {}", ToString(type), record.hostname, record.interface_index));
        return service->QueryRecord(record.interface_index, record.hostname, type, kClassInternet,
                                    MakeQueryListener(subscriber, builder));
    });
}

// Enrichment streams still running per service instance, so that a removed
// instance can stop its resolve or address queries.
class RunningEnrichments : public std::enable_shared_from_this<RunningEnrichments>
{
public:
    using Identity = std::tuple<std::string, std::string, std::string, std::uint32_t>;

    static Identity IdentityOf(const ServiceRecord& record)
    {
        return Identity(record.service_name, record.reg_type, record.domain, record.interface_index);
    }

    RecordObservable Track(const ServiceRecord& record, RecordObservable inner)
    {
        auto self = shared_from_this();
        const auto identity = IdentityOf(record);
        return RecordObservable([self, identity, inner](const RecordSubscriber& subscriber) {
            self->Add(identity, subscriber);
            inner.Subscribe(subscriber);
        });
    }

    // Completes every stream of the instance, which cancels their operations
    void Release(const ServiceRecord& record)
    {
        std::vector<std::weak_ptr<Subscriber<ServiceRecord>>> released;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_running.find(IdentityOf(record));
            if (it == m_running.end()) {
                return;
            }
            released.swap(it->second);
            m_running.erase(it);
        }
        for (const auto& weak : released) {
            if (auto subscriber = weak.lock()) {
                subscriber->OnCompleted();
            }
        }
    }

private:
    void Add(const Identity& identity, const RecordSubscriber& subscriber)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        // Forget streams that finished by themselves
        for (auto it = m_running.begin(); it != m_running.end();) {
            auto& subscribers = it->second;
            subscribers.erase(std::remove_if(subscribers.begin(), subscribers.end(), [](const auto& weak) {
                auto running = weak.lock();
                return !running || running->IsUnsubscribed();
            }), subscribers.end());
            it = subscribers.empty() ? m_running.erase(it) : std::next(it);
        }
        m_running[identity].push_back(subscriber);
    }

    std::mutex m_mutex;
    std::map<Identity, std::vector<std::weak_ptr<Subscriber<ServiceRecord>>>> m_running;
};

// Applies enrich to every record that is not removed and merges the results.
// A removed record ends the enrichment of its instance before it is passed on.
RecordTransformer MakeTransformer(ErrorPolicy policy, std::function<RecordObservable(const ServiceRecord&)> enrich)
{
    return [policy, enrich](const RecordObservable& source) {
        return RecordObservable([source, policy, enrich](const RecordSubscriber& downstream) {
            auto running = std::make_shared<RunningEnrichments>();
            source.FlatMap([running, enrich](const ServiceRecord& record) {
                if (record.IsRemoved()) {
                    running->Release(record);
                    return RecordObservable::Just(record);
                }
                return running->Track(record, enrich(record));
            }, policy).Subscribe(downstream);
        });
    };
}

}

RxDnssd::RxDnssd(std::shared_ptr<DiscoveryService> service, RxDnssdSettings settings)
: m_service(std::move(service))
, m_settings(std::move(settings))
{
    if (!m_service) {
        throw DiscoveryError(ErrorCode::BadParam, "No discovery service");
    }
}

RecordObservable RxDnssd::Browse(const std::string& reg_type, const std::string& domain) const
{
    auto service = m_service;
    const auto interface_index = m_settings.interface_index;
    return CreateObservable<ServiceRecord>([service, interface_index, reg_type, domain](const RecordSubscriber& subscriber) {
        Log(LogLevel::Debug, fmt::format("Browsing for {} in {}", reg_type, domain));
        return service->Browse(interface_index, reg_type, domain, MakeBrowseListener(subscriber));
    });
}

RecordObservable RxDnssd::Register(const ServiceRecord& record) const
{
    auto service = m_service;
    return CreateObservable<ServiceRecord>([service, record](const RecordSubscriber& subscriber) {
        const TxtRecord txt(record.txt_records);
        Log(LogLevel::Debug, fmt::format("Registering {} as {} port {}", record.service_name, record.reg_type, record.port));
        return service->Register(record.interface_index, record.service_name, record.reg_type, record.domain,
                                 record.hostname, record.port, txt, MakeRegisterListener(subscriber, record));
    });
}

RecordTransformer RxDnssd::Resolve() const
{
    auto service = m_service;
    return MakeTransformer(m_settings.error_policy, [service](const ServiceRecord& record) {
        return CreateObservable<ServiceRecord>([service, record](const RecordSubscriber& subscriber) {
            Log(LogLevel::Debug, fmt::format("Resolving {}", record.service_name));
            return service->Resolve(record.interface_index, record.service_name, record.reg_type, record.domain,
                                    MakeResolveListener(subscriber, record));
        });
    });
}

RecordTransformer RxDnssd::QueryRecords() const
{
    auto service = m_service;
    return MakeTransformer(m_settings.error_policy, [service](const ServiceRecord& record) {
        auto builder = std::make_shared<ServiceRecordBuilder>(record);
        return QueryAddresses(service, record, builder, RecordType::A)
            .MergeWith(QueryAddresses(service, record, builder, RecordType::AAAA));
    });
}

RecordTransformer RxDnssd::QueryIPv4Records() const
{
    auto service = m_service;
    return MakeTransformer(m_settings.error_policy, [service](const ServiceRecord& record) {
        return QueryAddresses(service, record, std::make_shared<ServiceRecordBuilder>(record), RecordType::A);
    });
}

RecordTransformer RxDnssd::QueryIPv6Records() const
{
    auto service = m_service;
    return MakeTransformer(m_settings.error_policy, [service](const ServiceRecord& record) {
        return QueryAddresses(service, record, std::make_shared<ServiceRecordBuilder>(record), RecordType::AAAA);
    });
}

}
