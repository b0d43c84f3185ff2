#include "rxdnssd/service_record_builder.hpp"

namespace rxdnssd
{

ServiceRecordBuilder::ServiceRecordBuilder(ServiceRecord record)
: m_record(std::move(record))
{}

ServiceRecordBuilder& ServiceRecordBuilder::Flags(ServiceFlags flags)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.flags = flags;
    return *this;
}

ServiceRecordBuilder& ServiceRecordBuilder::Hostname(std::string hostname)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.hostname = std::move(hostname);
    return *this;
}

ServiceRecordBuilder& ServiceRecordBuilder::Port(std::uint16_t port)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.port = port;
    return *this;
}

ServiceRecordBuilder& ServiceRecordBuilder::TxtRecords(std::map<std::string, std::string> txt_records)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.txt_records = std::move(txt_records);
    return *this;
}

ServiceRecordBuilder& ServiceRecordBuilder::AddAddress(const IpAddress& address)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.addresses.insert(address);
    return *this;
}

void ServiceRecordBuilder::AddAddress(const IpAddress& address, const std::function<void(const ServiceRecord&)>& publish)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_record.addresses.insert(address);
    const ServiceRecord snapshot = m_record;
    publish(snapshot);
}

ServiceRecord ServiceRecordBuilder::Build() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_record;
}

}
