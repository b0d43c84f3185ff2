#pragma once

#include "rxdnssd/discovery_service.hpp"
#include "rxdnssd/observable.hpp"
#include "rxdnssd/types.hpp"

#include <functional>
#include <memory>
#include <string>

namespace rxdnssd
{

using RecordObservable = Observable<ServiceRecord>;
using RecordTransformer = std::function<RecordObservable(const RecordObservable&)>;

struct RxDnssdSettings
{
    // What happens to a browse session when enriching one of its records fails
    ErrorPolicy error_policy{ErrorPolicy::Isolate};
    // Interface browsed on, kAllInterfaces for every interface
    std::uint32_t interface_index{kAllInterfaces};
};

// DNS-SD operations as streams of ServiceRecord.
//
//     rxdnssd.Browse("_ipp._tcp.", "local.")
//         .Compose(rxdnssd.Resolve())
//         .Compose(rxdnssd.QueryRecords())
//         .Subscribe([](const ServiceRecord& record) { ... });
//
// Every transformer passes removed records through untouched and never starts
// an operation for them. Transformers keep the discovery service alive, so
// the streams may outlive this object.
class RxDnssd
{
public:
    explicit RxDnssd(std::shared_ptr<DiscoveryService> service, RxDnssdSettings settings = RxDnssdSettings());

    // Added and removed instances of reg_type, for example "_http._tcp.".
    [[nodiscard]] RecordObservable Browse(const std::string& reg_type, const std::string& domain) const;

    // Registers record and emits it with the name actually assigned once the
    // registration is confirmed. Cancelling the subscription unregisters it.
    [[nodiscard]] RecordObservable Register(const ServiceRecord& record) const;

    // Adds hostname, port and TXT records.
    [[nodiscard]] RecordTransformer Resolve() const;
    // Adds IPv4 and IPv6 addresses; both queries run concurrently.
    [[nodiscard]] RecordTransformer QueryRecords() const;
    [[nodiscard]] RecordTransformer QueryIPv4Records() const;
    [[nodiscard]] RecordTransformer QueryIPv6Records() const;

    [[nodiscard]] const RxDnssdSettings& Settings() const { return m_settings; }

private:
    std::shared_ptr<DiscoveryService> m_service;
    RxDnssdSettings m_settings;
};

}
