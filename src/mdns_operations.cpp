#include "mdns_operations.hpp"
#include "rxdnssd/log.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include <fmt/format.h>

namespace rxdnssd
{

std::string Qualify(std::string name)
{
	if (name.empty() || name.back() != '.') {
		name += '.';
	}
	return name;
}

std::string ToLower(std::string_view str)
{
	std::string lower(str);
	std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
		return static_cast<char>(std::tolower(c));
	});
	return lower;
}

bool EqualsIgnoreCase(std::string_view lhs, std::string_view rhs)
{
	return lhs.size() == rhs.size() && ToLower(lhs) == ToLower(rhs);
}

QuerySchedule::QuerySchedule(std::chrono::milliseconds first, std::chrono::milliseconds max)
: m_interval(first)
, m_max(max)
{}

bool QuerySchedule::Due(Clock::time_point now)
{
	if (now < m_next) {
		return false;
	}
	m_next = now + m_interval;
	m_interval = std::min(m_interval * 2, m_max);
	return true;
}

BrowseOperation::BrowseOperation(std::uint32_t interface_index, const std::string& reg_type, const std::string& domain,
                                 BrowseListener listener, const MdnsSettings& settings)
: Operation(interface_index)
, m_regType(Qualify(reg_type))
, m_domain(Qualify(domain.empty() ? kDefaultDomain : domain))
, m_serviceType(m_regType + m_domain)
, m_listener(std::move(listener))
, m_schedule(settings.query_interval, settings.max_query_interval)
{}

void BrowseOperation::Tick(OperationHost& host, Clock::time_point now)
{
	if (m_schedule.Due(now)) {
		host.SendQuery(MDNS_RECORDTYPE_PTR, m_serviceType, m_interfaceIndex);
	}
}

void BrowseOperation::HandleRecord(OperationHost&, const ParsedRecord& record)
{
	if (record.IsQuestion() || record.rtype != MDNS_RECORDTYPE_PTR || !EqualsIgnoreCase(record.name, m_serviceType)) {
		return;
	}

	// "<service_name>.<reg_type><domain>"
	const std::string& instance = record.target;
	const std::size_t label_end = instance.size() - m_serviceType.size() - 1;
	if (instance.size() <= m_serviceType.size() + 1
		|| instance[label_end] != '.'
		|| !EqualsIgnoreCase(std::string_view(instance).substr(label_end + 1), m_serviceType)) {
		Log(LogLevel::Debug, fmt::format("Ignoring PTR {} for {}", instance, m_serviceType));
		return;
	}

	BrowseReply reply;
	reply.interface_index = record.interface_index;
	reply.service_name = instance.substr(0, label_end);
	reply.reg_type = m_regType;
	reply.domain = m_domain;

	// Answers arrive on the per interface sockets and on the shared responder
	// sockets, so instances are keyed by name only
	const auto key = ToLower(instance);
	if (record.ttl > 0) {
		if (!m_known.emplace(key, record.interface_index).second) {
			return;
		}
		reply.flags = ServiceFlags::Added;
	} else {
		auto it = m_known.find(key);
		if (it == m_known.end()) {
			return;
		}
		reply.interface_index = it->second;
		m_known.erase(it);
		reply.flags = ServiceFlags::Removed;
	}
	Log(LogLevel::Debug, fmt::format("Browse {}: {} {}", m_serviceType, ToString(reply.flags), reply.service_name));
	m_listener.on_reply(reply);
}

void BrowseOperation::Fail(const DiscoveryError& error)
{
	if (m_listener.on_failure) {
		m_listener.on_failure(error);
	}
}

ResolveOperation::ResolveOperation(std::uint32_t interface_index, const std::string& service_name, const std::string& reg_type,
                                   const std::string& domain, ResolveListener listener, const MdnsSettings& settings)
: Operation(interface_index)
, m_fullname(fmt::format("{}.{}{}", service_name, Qualify(reg_type), Qualify(domain.empty() ? kDefaultDomain : domain)))
, m_listener(std::move(listener))
, m_schedule(settings.query_interval, settings.max_query_interval)
, m_deadline(Clock::now() + settings.resolve_timeout)
{
	m_reply.interface_index = interface_index;
	m_reply.fullname = m_fullname;
}

void ResolveOperation::Tick(OperationHost& host, Clock::time_point now)
{
	if (m_resolved) {
		if (!Finish()) {
			return;
		}
		host.Remove(Id());
		Log(LogLevel::Debug, fmt::format("Resolved {} to {}:{}", m_fullname, m_reply.host_target, m_reply.port));
		m_listener.on_reply(m_reply);
		return;
	}
	if (now >= m_deadline) {
		if (!Finish()) {
			return;
		}
		host.Remove(Id());
		Fail(DiscoveryError(ErrorCode::Timeout, fmt::format("No SRV record received for {}", m_fullname)));
		return;
	}
	if (m_schedule.Due(now)) {
		host.SendQuery(MDNS_RECORDTYPE_SRV, m_fullname, m_interfaceIndex);
		host.SendQuery(MDNS_RECORDTYPE_TXT, m_fullname, m_interfaceIndex);
	}
}

void ResolveOperation::HandleRecord(OperationHost&, const ParsedRecord& record)
{
	if (record.IsQuestion() || record.ttl == 0 || !EqualsIgnoreCase(record.name, m_fullname)) {
		return;
	}
	if (record.rtype == MDNS_RECORDTYPE_TXT) {
		m_reply.txt_record = record.rdata;
	} else if (record.rtype == MDNS_RECORDTYPE_SRV && !m_resolved) {
		m_reply.interface_index = record.interface_index;
		m_reply.host_target = record.target;
		m_reply.port = record.port;
		m_resolved = true;
	}
}

void ResolveOperation::Fail(const DiscoveryError& error)
{
	if (m_listener.on_failure) {
		m_listener.on_failure(error);
	}
}

QueryOperation::QueryOperation(std::uint32_t interface_index, const std::string& fullname, RecordType record_type,
                               std::uint16_t record_class, QueryListener listener, const MdnsSettings& settings)
: Operation(interface_index)
, m_fullname(Qualify(fullname))
, m_recordType(record_type)
, m_recordClass(record_class)
, m_listener(std::move(listener))
, m_schedule(settings.query_interval, settings.max_query_interval)
{}

void QueryOperation::Tick(OperationHost& host, Clock::time_point now)
{
	if (m_schedule.Due(now)) {
		host.SendQuery(static_cast<mdns_record_type_t>(m_recordType), m_fullname, m_interfaceIndex);
	}
}

void QueryOperation::HandleRecord(OperationHost&, const ParsedRecord& record)
{
	if (record.IsQuestion()
		|| record.rtype != static_cast<std::uint16_t>(m_recordType)
		|| (record.rclass & kClassMask) != m_recordClass
		|| !EqualsIgnoreCase(record.name, m_fullname)) {
		return;
	}

	if (record.ttl > 0) {
		if (!m_seen.insert(record.rdata).second) {
			return;
		}
	} else if (m_seen.erase(record.rdata) == 0) {
		return;
	}

	QueryReply reply;
	reply.interface_index = record.interface_index;
	reply.fullname = m_fullname;
	reply.record_type = m_recordType;
	reply.record_class = m_recordClass;
	reply.rdata = record.rdata;
	reply.ttl = record.ttl;
	m_listener.on_reply(reply);
}

void QueryOperation::Fail(const DiscoveryError& error)
{
	if (m_listener.on_failure) {
		m_listener.on_failure(error);
	}
}

std::uint64_t OperationTable::Add(std::shared_ptr<Operation> operation)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_closed) {
		throw DiscoveryError(ErrorCode::ServiceNotRunning, "mDNS discovery is not running");
	}
	const auto id = m_nextId++;
	operation->SetId(id);
	m_operations.emplace(id, std::move(operation));
	return id;
}

void OperationTable::Cancel(const std::shared_ptr<Operation>& operation)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_operations.erase(operation->Id()) > 0) {
		m_cancelled.push_back(operation);
	}
}

void OperationTable::Remove(std::uint64_t id)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_operations.erase(id);
}

std::vector<std::shared_ptr<Operation>> OperationTable::Active() const
{
	std::vector<std::shared_ptr<Operation>> operations;
	std::lock_guard<std::mutex> lock(m_mutex);
	operations.reserve(m_operations.size());
	for (const auto& entry : m_operations) {
		operations.push_back(entry.second);
	}
	return operations;
}

std::size_t OperationTable::Size() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_operations.size();
}

std::vector<std::shared_ptr<Operation>> OperationTable::TakeCancelled()
{
	std::vector<std::shared_ptr<Operation>> cancelled;
	std::lock_guard<std::mutex> lock(m_mutex);
	cancelled.swap(m_cancelled);
	return cancelled;
}

void OperationTable::Shutdown(OperationHost& host, const DiscoveryError& error)
{
	for (const auto& operation : TakeCancelled()) {
		operation->Stop(host);
	}

	std::vector<std::shared_ptr<Operation>> running;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_closed = true;
		for (auto& entry : m_operations) {
			if (entry.second->Finish()) {
				running.push_back(entry.second);
			}
		}
		m_operations.clear();
	}
	// Registrations still running say goodbye before their listener hears about it
	for (const auto& operation : running) {
		operation->Stop(host);
		operation->Fail(error);
	}
}

}
