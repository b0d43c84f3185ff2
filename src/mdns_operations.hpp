#pragma once

#include "rxdnssd/discovery_service.hpp"
#include "rxdnssd/mdns_discovery_service.hpp"
#include "mdns_utils.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace rxdnssd
{

using Clock = std::chrono::steady_clock;

inline constexpr char kDnsSdName[] = "_services._dns-sd._udp.local.";
inline constexpr char kDefaultDomain[] = "local.";
inline constexpr std::uint16_t kClassMask = 0x7fff; // strips the cache flush / unicast response bit

// Appends the root label dot if missing
std::string Qualify(std::string name);
std::string ToLower(std::string_view str);
bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs);

// One resource record (or question) of a packet being parsed.
// `from` is only valid while the packet is dispatched.
struct ParsedRecord
{
	int socket{-1};
	bool responder{false};
	std::uint32_t interface_index{kAllInterfaces};
	const struct sockaddr* from{nullptr};
	std::size_t addrlen{0};
	mdns_entry_type_t entry{MDNS_ENTRYTYPE_ANSWER};
	std::uint16_t query_id{0};
	std::uint16_t rtype{0};
	std::uint16_t rclass{0};
	std::uint32_t ttl{0};

	std::string name;
	std::string target; // PTR name or SRV target
	std::uint16_t port{0}; // SRV
	std::vector<std::uint8_t> rdata; // A, AAAA and TXT

	[[nodiscard]] bool IsQuestion() const { return entry == MDNS_ENTRYTYPE_QUESTION; }
};

// Repeats a query with a doubling delay, the first one is due immediately.
class QuerySchedule
{
public:
	QuerySchedule(std::chrono::milliseconds first, std::chrono::milliseconds max);

	bool Due(Clock::time_point now);

private:
	Clock::time_point m_next{};
	std::chrono::milliseconds m_interval;
	std::chrono::milliseconds m_max;
};

// What operations need from the engine running them.
class OperationHost
{
public:
	virtual ~OperationHost() = default;

	virtual bool SendQuery(mdns_record_type_t type, const std::string& name, std::uint32_t interface_index) = 0;
	// Forgets an operation that finished by itself
	virtual void Remove(std::uint64_t id) = 0;
	[[nodiscard]] virtual const OpenSocketsData& ResponderSockets() const = 0;
};

// One running browse, resolve, query or registration.
// HandleRecord, Tick and Stop are only called on the notification thread.
class Operation
{
public:
	explicit Operation(std::uint32_t interface_index)
	: m_interfaceIndex(interface_index)
	{}

	virtual ~Operation() = default;

	virtual void HandleRecord(OperationHost& host, const ParsedRecord& record) = 0;
	virtual void Tick(OperationHost& host, Clock::time_point now) = 0;
	virtual void Stop(OperationHost&) {}
	virtual void Fail(const DiscoveryError& error) = 0;

	// False if the operation already finished or was cancelled
	bool Finish() { return !m_finished.exchange(true, std::memory_order_acq_rel); }
	[[nodiscard]] bool Finished() const { return m_finished.load(std::memory_order_acquire); }

	[[nodiscard]] std::uint64_t Id() const { return m_id; }
	void SetId(std::uint64_t id) { m_id = id; }

	[[nodiscard]] bool OnInterface(std::uint32_t interface_index) const
	{
		return m_interfaceIndex == kAllInterfaces
			|| interface_index == kAllInterfaces
			|| interface_index == m_interfaceIndex;
	}

protected:
	std::uint32_t m_interfaceIndex;

private:
	std::uint64_t m_id{0};
	std::atomic<bool> m_finished{false};
};

// PTR queries for "<reg_type><domain>". New instances are reported as added,
// goodbye packets (TTL 0) of known instances as removed.
class BrowseOperation : public Operation
{
public:
	BrowseOperation(std::uint32_t interface_index, const std::string& reg_type, const std::string& domain,
	                BrowseListener listener, const MdnsSettings& settings);

	void Tick(OperationHost& host, Clock::time_point now) override;
	void HandleRecord(OperationHost& host, const ParsedRecord& record) override;
	void Fail(const DiscoveryError& error) override;

private:
	std::string m_regType;
	std::string m_domain;
	std::string m_serviceType;
	BrowseListener m_listener;
	QuerySchedule m_schedule;
	std::map<std::string, std::uint32_t> m_known; // instance -> interface it was found on
};

// SRV and TXT queries for one instance. The reply is sent on the tick after
// the SRV record arrived, so a TXT record in the same packet is included.
class ResolveOperation : public Operation
{
public:
	ResolveOperation(std::uint32_t interface_index, const std::string& service_name, const std::string& reg_type,
	                 const std::string& domain, ResolveListener listener, const MdnsSettings& settings);

	void Tick(OperationHost& host, Clock::time_point now) override;
	void HandleRecord(OperationHost& host, const ParsedRecord& record) override;
	void Fail(const DiscoveryError& error) override;

private:
	std::string m_fullname;
	ResolveListener m_listener;
	QuerySchedule m_schedule;
	Clock::time_point m_deadline;
	ResolveReply m_reply;
	bool m_resolved{false};
};

// Repeated queries for one record type, every distinct answer reported once.
class QueryOperation : public Operation
{
public:
	QueryOperation(std::uint32_t interface_index, const std::string& fullname, RecordType record_type,
	               std::uint16_t record_class, QueryListener listener, const MdnsSettings& settings);

	void Tick(OperationHost& host, Clock::time_point now) override;
	void HandleRecord(OperationHost& host, const ParsedRecord& record) override;
	void Fail(const DiscoveryError& error) override;

private:
	std::string m_fullname;
	RecordType m_recordType;
	std::uint16_t m_recordClass;
	QueryListener m_listener;
	QuerySchedule m_schedule;
	std::set<std::vector<std::uint8_t>> m_seen;
};

// Running operations of an engine, shared between the notification thread and
// the threads starting and cancelling operations.
class OperationTable
{
public:
	// Assigns the operation its id, throws ServiceNotRunning after Shutdown()
	std::uint64_t Add(std::shared_ptr<Operation> operation);
	// Forgets a cancelled operation and queues it for TakeCancelled()
	void Cancel(const std::shared_ptr<Operation>& operation);
	void Remove(std::uint64_t id);

	[[nodiscard]] std::vector<std::shared_ptr<Operation>> Active() const;
	[[nodiscard]] std::size_t Size() const;
	std::vector<std::shared_ptr<Operation>> TakeCancelled();

	// Stops the cancelled operations, then stops and fails every operation
	// still running with error. The table is empty afterwards.
	void Shutdown(OperationHost& host, const DiscoveryError& error);

private:
	mutable std::mutex m_mutex;
	std::uint64_t m_nextId{1};
	std::map<std::uint64_t, std::shared_ptr<Operation>> m_operations;
	std::vector<std::shared_ptr<Operation>> m_cancelled;
	bool m_closed{false};
};

}
