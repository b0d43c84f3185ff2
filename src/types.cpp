#include "rxdnssd/types.hpp"

#ifdef _WIN32
#include <Ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

#include <algorithm>
#include <tuple>

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace rxdnssd
{

std::string ToString(RecordType type)
{
    switch (type) {
        case RecordType::A: return "A";
        case RecordType::PTR: return "PTR";
        case RecordType::TXT: return "TXT";
        case RecordType::AAAA: return "AAAA";
        case RecordType::SRV: return "SRV";
        case RecordType::ANY: return "ANY";
    }
    return fmt::format("TYPE{}", static_cast<std::uint16_t>(type));
}

std::string ToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::BadParam: return "bad parameter";
        case ErrorCode::NoMemory: return "no memory";
        case ErrorCode::ServiceNotRunning: return "service not running";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::NameConflict: return "name conflict";
        case ErrorCode::BadTxtRecord: return "bad txt record";
    }
    return "";
}

DiscoveryError::DiscoveryError(ErrorCode code, const std::string& what)
: std::runtime_error(fmt::format("{} ({})", what, ToString(code)))
, m_code(code)
{}

std::string DescribeError(const std::exception_ptr& error)
{
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

std::string ToString(ServiceFlags flags)
{
    switch (flags) {
        case ServiceFlags::Added: return "added";
        case ServiceFlags::Removed: return "removed";
    }
    return "";
}

IpAddress IpAddress::FromRecordData(AddressFamily family, const std::vector<std::uint8_t>& rdata)
{
    char buffer[INET6_ADDRSTRLEN] = {0};
    const char* converted = nullptr;
    if (family == AddressFamily::IPv4) {
        if (rdata.size() != 4) {
            throw DiscoveryError(ErrorCode::BadParam, fmt::format("A record data has {} bytes, expected 4", rdata.size()));
        }
        struct in_addr addr;
        std::copy(rdata.begin(), rdata.end(), reinterpret_cast<std::uint8_t*>(&addr));
        converted = inet_ntop(AF_INET, &addr, buffer, sizeof(buffer));
    } else {
        if (rdata.size() != 16) {
            throw DiscoveryError(ErrorCode::BadParam, fmt::format("AAAA record data has {} bytes, expected 16", rdata.size()));
        }
        struct in6_addr addr;
        std::copy(rdata.begin(), rdata.end(), reinterpret_cast<std::uint8_t*>(&addr));
        converted = inet_ntop(AF_INET6, &addr, buffer, sizeof(buffer));
    }
    if (converted == nullptr) {
        throw DiscoveryError(ErrorCode::BadParam, "Unable to convert address record data");
    }
    return IpAddress{family, std::string(converted)};
}

bool operator==(const IpAddress& lhs, const IpAddress& rhs)
{
    return lhs.family == rhs.family
        && lhs.address == rhs.address;
}

bool operator!=(const IpAddress& lhs, const IpAddress& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const IpAddress& lhs, const IpAddress& rhs)
{
    return std::tie(lhs.family, lhs.address) < std::tie(rhs.family, rhs.address);
}

std::ostream& operator<<(std::ostream& os, const IpAddress& address)
{
    if (address.family == AddressFamily::IPv6) {
        os << "[" << address.address << "]";
    } else {
        os << address.address;
    }
    return os;
}

bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return lhs.flags == rhs.flags
        && lhs.interface_index == rhs.interface_index
        && lhs.service_name == rhs.service_name
        && lhs.reg_type == rhs.reg_type
        && lhs.domain == rhs.domain
        && lhs.hostname == rhs.hostname
        && lhs.port == rhs.port
        && lhs.txt_records == rhs.txt_records
        && lhs.addresses == rhs.addresses;
}

bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs)
{
    return !(lhs == rhs);
}

std::string ToString(const ServiceRecord& record)
{
    std::vector<std::string> addresses;
    for (const auto& address : record.addresses) {
        addresses.push_back(address.address);
    }
    // printer._ipp._tcp.local. if 3 added -> printer.local.:631 txt {} addresses [...]
    return fmt::format("{}.{}{} if {} {} -> {}:{} txt {} addresses [{}]",
        record.service_name, record.reg_type, record.domain, record.interface_index, ToString(record.flags),
        record.hostname, record.port, record.txt_records, fmt::join(addresses, ", "));
}

std::ostream& operator<<(std::ostream& os, const ServiceRecord& record)
{
    os << ToString(record);
    return os;
}

}
