#pragma once

#include "rxdnssd/discovery_service.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace rxdnssd
{

struct MdnsSettings
{
    // Longest time the notification thread waits for incoming packets
    std::chrono::milliseconds poll_interval{100};
    // First delay between repeated browse and address queries, doubled after each query
    std::chrono::milliseconds query_interval{1000};
    std::chrono::milliseconds max_query_interval{60000};
    // Resolve fails with ErrorCode::Timeout when no SRV record arrived in time
    std::chrono::milliseconds resolve_timeout{5000};
    std::size_t max_sockets{32};
    // Host name registered services are announced on, without ".local."
    std::string hostname{"myhost"};
    std::uint32_t ttl{120};
};

class MdnsEngine;

// DiscoveryService on top of mdns.h.
// Opens one socket per interface and address family for queries plus two
// responder sockets on the mDNS port, and runs one notification thread that
// sends queries, parses responses and invokes the listeners.
class MdnsDiscoveryService : public DiscoveryService
{
public:
    explicit MdnsDiscoveryService(MdnsSettings settings = MdnsSettings());
    // Operations still running when the notification thread stops, because of
    // this destructor or a socket error, fail with ErrorCode::ServiceNotRunning.
    ~MdnsDiscoveryService() override;

    std::unique_ptr<ServiceHandle> Browse(std::uint32_t interface_index,
                                          const std::string& reg_type,
                                          const std::string& domain,
                                          BrowseListener listener) override;

    std::unique_ptr<ServiceHandle> Resolve(std::uint32_t interface_index,
                                           const std::string& service_name,
                                           const std::string& reg_type,
                                           const std::string& domain,
                                           ResolveListener listener) override;

    std::unique_ptr<ServiceHandle> QueryRecord(std::uint32_t interface_index,
                                               const std::string& fullname,
                                               RecordType record_type,
                                               std::uint16_t record_class,
                                               QueryListener listener) override;

    std::unique_ptr<ServiceHandle> Register(std::uint32_t interface_index,
                                            const std::string& service_name,
                                            const std::string& reg_type,
                                            const std::string& domain,
                                            const std::string& host,
                                            std::uint16_t port,
                                            const TxtRecord& txt_record,
                                            RegisterListener listener) override;

private:
    std::shared_ptr<MdnsEngine> m_engine;
};

}
