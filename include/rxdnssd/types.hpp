#pragma once

#include <cstdint>
#include <exception>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace rxdnssd
{

// From mdns.h mdns_record_type
enum class RecordType : std::uint16_t {
    A = 1, // Address
    PTR = 12, // Domain name pointer
    TXT = 16, // Arbitrary text string
    AAAA = 28, // IP6 Address [Thomson]
    SRV = 33, // Server Selection [RFC2782]
    ANY = 255 // Any available records
};
std::string ToString(RecordType type);

constexpr std::uint16_t kClassInternet = 1;
constexpr std::uint32_t kAllInterfaces = 0;

enum class ErrorCode {
    Unknown,
    BadParam,
    NoMemory,
    ServiceNotRunning,
    Timeout,
    NameConflict,
    BadTxtRecord
};
std::string ToString(ErrorCode code);

// Thrown by discovery engines when an operation cannot be started, and passed
// to listeners when a running operation fails.
class DiscoveryError : public std::runtime_error
{
public:
    DiscoveryError(ErrorCode code, const std::string& what);

    [[nodiscard]] ErrorCode Code() const { return m_code; }

private:
    ErrorCode m_code;
};

// what() of the stored exception, for logging.
std::string DescribeError(const std::exception_ptr& error);

enum class ServiceFlags {
    Added,
    Removed
};
std::string ToString(ServiceFlags flags);

enum class AddressFamily {
    IPv4,
    IPv6
};

struct IpAddress {
    AddressFamily family{AddressFamily::IPv4};
    std::string address; // example: "192.168.1.10", "fe80::1"

    // Builds an address from A (4 bytes) or AAAA (16 bytes) rdata.
    // Throws DiscoveryError(BadParam) when the length does not match the family.
    static IpAddress FromRecordData(AddressFamily family, const std::vector<std::uint8_t>& rdata);
};
bool operator==(const IpAddress& lhs, const IpAddress& rhs);
bool operator!=(const IpAddress& lhs, const IpAddress& rhs);
bool operator<(const IpAddress& lhs, const IpAddress& rhs);
std::ostream& operator<<(std::ostream& os, const IpAddress& address);

// One discovered or registered service instance.
// Fields are filled progressively: browse sets the identity, resolve adds
// hostname/port/txt and address queries add the addresses.
struct ServiceRecord {
    ServiceFlags flags{ServiceFlags::Added};
    std::uint32_t interface_index{kAllInterfaces};

    std::string service_name; // example: "printer"
    std::string reg_type; // example: "_ipp._tcp."
    std::string domain; // example: "local."

    std::string hostname; // example: "printer.local."
    std::uint16_t port{0};
    std::map<std::string, std::string> txt_records;
    std::set<IpAddress> addresses;

    [[nodiscard]] bool IsRemoved() const { return flags == ServiceFlags::Removed; }
};
bool operator==(const ServiceRecord& lhs, const ServiceRecord& rhs);
bool operator!=(const ServiceRecord& lhs, const ServiceRecord& rhs);
std::string ToString(const ServiceRecord& record);
std::ostream& operator<<(std::ostream& os, const ServiceRecord& record);

}
