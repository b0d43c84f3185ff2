#pragma once

#include "rxdnssd/types.hpp"

#include <functional>
#include <mutex>

namespace rxdnssd
{

// Accumulates the best known snapshot of one logical service.
// The address queries of a record share one builder and may call it from
// different threads, so every member takes the builder lock.
class ServiceRecordBuilder
{
public:
    explicit ServiceRecordBuilder(ServiceRecord record);

    ServiceRecordBuilder& Flags(ServiceFlags flags);
    ServiceRecordBuilder& Hostname(std::string hostname);
    ServiceRecordBuilder& Port(std::uint16_t port);
    ServiceRecordBuilder& TxtRecords(std::map<std::string, std::string> txt_records);
    ServiceRecordBuilder& AddAddress(const IpAddress& address);

    // Adds the address and hands the updated snapshot to publish before the
    // lock is released, so concurrent callers publish in the order they update.
    void AddAddress(const IpAddress& address, const std::function<void(const ServiceRecord&)>& publish);

    [[nodiscard]] ServiceRecord Build() const;

private:
    mutable std::mutex m_mutex;
    ServiceRecord m_record;
};

}
