#pragma once

#include "rxdnssd/txt_record.hpp"
#include "rxdnssd/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace rxdnssd
{

struct BrowseReply
{
    ServiceFlags flags{ServiceFlags::Added};
    std::uint32_t interface_index{kAllInterfaces};
    std::string service_name;
    std::string reg_type;
    std::string domain;
};

struct ResolveReply
{
    std::uint32_t interface_index{kAllInterfaces};
    std::string fullname; // "<service_name>.<reg_type>.<domain>"
    std::string host_target;
    std::uint16_t port{0};
    std::vector<std::uint8_t> txt_record; // TXT rdata as received
};

struct QueryReply
{
    std::uint32_t interface_index{kAllInterfaces};
    std::string fullname;
    RecordType record_type{RecordType::A};
    std::uint16_t record_class{kClassInternet};
    std::vector<std::uint8_t> rdata;
    std::uint32_t ttl{0};
};

struct RegisterReply
{
    std::string service_name;
    std::string reg_type;
    std::string domain;
};

template <typename Reply>
struct Listener
{
    std::function<void(const Reply&)> on_reply;
    std::function<void(const DiscoveryError&)> on_failure;
};

using BrowseListener = Listener<BrowseReply>;
using ResolveListener = Listener<ResolveReply>;
using QueryListener = Listener<QueryReply>;
using RegisterListener = Listener<RegisterReply>;

// A running discovery operation. Cancel() stops it and releases its resources;
// calling it again has no effect. Once Cancel() returned no new events are
// delivered to the listener; a callback already running may still finish.
class ServiceHandle
{
public:
    virtual ~ServiceHandle() = default;
    virtual void Cancel() = 0;
};

// Discovery engine. Each call starts one operation whose listener is invoked
// from the engine's notification thread. Calls throw DiscoveryError when the
// operation cannot be started.
class DiscoveryService
{
public:
    virtual ~DiscoveryService() = default;

    virtual std::unique_ptr<ServiceHandle> Browse(std::uint32_t interface_index,
                                                  const std::string& reg_type,
                                                  const std::string& domain,
                                                  BrowseListener listener) = 0;

    virtual std::unique_ptr<ServiceHandle> Resolve(std::uint32_t interface_index,
                                                   const std::string& service_name,
                                                   const std::string& reg_type,
                                                   const std::string& domain,
                                                   ResolveListener listener) = 0;

    virtual std::unique_ptr<ServiceHandle> QueryRecord(std::uint32_t interface_index,
                                                       const std::string& fullname,
                                                       RecordType record_type,
                                                       std::uint16_t record_class,
                                                       QueryListener listener) = 0;

    // An empty host registers the service on the local host.
    virtual std::unique_ptr<ServiceHandle> Register(std::uint32_t interface_index,
                                                    const std::string& service_name,
                                                    const std::string& reg_type,
                                                    const std::string& domain,
                                                    const std::string& host,
                                                    std::uint16_t port,
                                                    const TxtRecord& txt_record,
                                                    RegisterListener listener) = 0;
};

}
