#include "rxdnssd/mdns_discovery_service.hpp"
#include "rxdnssd/log.hpp"
#include "mdns_operations.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <sys/select.h>
#include <sys/socket.h>

#include <fmt/format.h>

namespace rxdnssd
{

class MdnsEngine : public OperationHost, public std::enable_shared_from_this<MdnsEngine>
{
public:
	explicit MdnsEngine(MdnsSettings settings);
	~MdnsEngine() override;

	void Start();
	void Stop();

	std::unique_ptr<ServiceHandle> Add(std::shared_ptr<Operation> operation);
	// Forgets a cancelled operation, its Stop() runs on the notification thread
	void Cancel(const std::shared_ptr<Operation>& operation);

	bool SendQuery(mdns_record_type_t type, const std::string& name, std::uint32_t interface_index) override;
	void Remove(std::uint64_t id) override;

	[[nodiscard]] const MdnsSettings& Settings() const { return m_settings; }
	[[nodiscard]] const OpenSocketsData& ResponderSockets() const override { return m_serviceSockets; }

private:
	struct SocketContext
	{
		MdnsEngine* engine;
		int socket;
		std::uint32_t interface_index;
		bool responder;
	};

	static int RecordCallback(int sock, const struct sockaddr* from, size_t addrlen, mdns_entry_type_t entry,
	                          uint16_t query_id, uint16_t rtype, uint16_t rclass, uint32_t ttl, const void* data,
	                          size_t size, size_t name_offset, size_t name_length, size_t record_offset,
	                          size_t record_length, void* user_data);

	void ListenLoop();
	// Runs on the notification thread once the loop exited
	void Shutdown();
	void Dispatch(const ParsedRecord& record);
	void RunTicks(Clock::time_point now);
	void StopCancelled();

	MdnsSettings m_settings;
	OpenSocketsData m_clientSockets;
	OpenSocketsData m_serviceSockets;
	std::vector<SocketContext> m_contexts;

	OperationTable m_operations;
	std::string m_stopReason{"mDNS discovery stopped"}; // only touched on the notification thread

	std::atomic<bool> m_running{false};
	std::thread m_listenThread;
};

namespace
{

class OperationHandle : public ServiceHandle
{
public:
	OperationHandle(std::weak_ptr<MdnsEngine> engine, std::shared_ptr<Operation> operation)
	: m_engine(std::move(engine))
	, m_operation(std::move(operation))
	{}

	~OperationHandle() override
	{
		Cancel();
	}

	void Cancel() override
	{
		if (!m_operation->Finish()) {
			return;
		}
		if (auto engine = m_engine.lock()) {
			engine->Cancel(m_operation);
		}
	}

private:
	std::weak_ptr<MdnsEngine> m_engine;
	std::shared_ptr<Operation> m_operation;
};

// Announces a service on the responder sockets and answers questions for it.
// The mdns_record_t members point into the strings of this object.
class RegisterOperation : public Operation
{
public:
	RegisterOperation(std::uint32_t interface_index, const std::string& service_name, const std::string& reg_type,
	                  const std::string& domain, const std::string& host, std::uint16_t port,
	                  const TxtRecord& txt_record, RegisterListener listener, const MdnsSettings& settings,
	                  const OpenSocketsData& addresses)
	: Operation(interface_index)
	, m_serviceName(service_name)
	, m_regType(Qualify(reg_type))
	, m_domain(Qualify(domain.empty() ? kDefaultDomain : domain))
	, m_port(port)
	, m_listener(std::move(listener))
	{
		const std::string hostname = host.empty() ? settings.hostname : host;

		// Build the "<_service-name>._tcp.local." string
		m_service = m_regType + m_domain;
		// Build the service instance "<name>.<_service-name>._tcp.local." string
		m_serviceInstance = fmt::format("{}.{}", m_serviceName, m_service);
		// Build the "<hostname>.local." string
		m_hostnameQualified = hostname.find('.') == std::string::npos ? fmt::format("{}.{}", hostname, m_domain) : Qualify(hostname);

		for (const auto& entry : txt_record) {
			m_txt.emplace_back(entry.key, entry.value.value_or(""));
		}

		m_hasIpv4 = addresses.has_ipv4;
		m_hasIpv6 = addresses.has_ipv6;

		// PTR record reverse mapping "<_service-name>._tcp.local." to
		// "<name>.<_service-name>._tcp.local."
		m_recordPtr = MakeRecord(m_service, MDNS_RECORDTYPE_PTR, settings.ttl);
		m_recordPtr.data.ptr.name = Convert(m_serviceInstance);

		// SRV record mapping "<name>.<_service-name>._tcp.local." to
		// "<hostname>.local." with port. Set weight & priority to 0.
		m_recordSrv = MakeRecord(m_serviceInstance, MDNS_RECORDTYPE_SRV, settings.ttl);
		m_recordSrv.data.srv.name = Convert(m_hostnameQualified);
		m_recordSrv.data.srv.port = m_port;
		m_recordSrv.data.srv.priority = 0;
		m_recordSrv.data.srv.weight = 0;

		// A/AAAA records mapping "<hostname>.local." to IPv4/IPv6 addresses
		m_recordA = MakeRecord(m_hostnameQualified, MDNS_RECORDTYPE_A, settings.ttl);
		m_recordA.data.a.addr = addresses.service_address_ipv4;
		m_recordAaaa = MakeRecord(m_hostnameQualified, MDNS_RECORDTYPE_AAAA, settings.ttl);
		m_recordAaaa.data.aaaa.addr = addresses.service_address_ipv6;

		// TXT key/value pairs for the instance, coalesced into one record by the library
		for (const auto& [key, value] : m_txt) {
			mdns_record_t record = MakeRecord(m_serviceInstance, MDNS_RECORDTYPE_TXT, settings.ttl);
			record.data.txt.key = Convert(key);
			record.data.txt.value = Convert(value);
			m_recordsTxt.push_back(record);
		}
	}

	void Tick(OperationHost& host, Clock::time_point) override
	{
		if (m_announced) {
			return;
		}
		m_announced = true;

		Log(LogLevel::Info, fmt::format("Announcing {} on {}:{}", m_serviceInstance, m_hostnameQualified, m_port));
		const auto additional = Additional(true, m_hasIpv4, m_hasIpv6);
		std::array<char, 2048> buffer;
		for (const auto& socket : host.ResponderSockets().sockets) {
			if (mdns_announce_multicast(socket, buffer.data(), buffer.size(), m_recordPtr, nullptr, 0, additional.data(), additional.size()) < 0) {
				Log(LogLevel::Warn, fmt::format("Failed to announce {}: {}", m_serviceInstance, strerror(errno)));
			}
		}

		RegisterReply reply;
		reply.service_name = m_serviceName;
		reply.reg_type = m_regType;
		reply.domain = m_domain;
		m_listener.on_reply(reply);
	}

	void Stop(OperationHost& host) override
	{
		if (!m_announced) {
			return;
		}

		Log(LogLevel::Info, fmt::format("Sending goodbye for {}", m_serviceInstance));
		const auto additional = Additional(true, m_hasIpv4, m_hasIpv6);
		std::array<char, 2048> buffer;
		for (const auto& socket : host.ResponderSockets().sockets) {
			if (mdns_goodbye_multicast(socket, buffer.data(), buffer.size(), m_recordPtr, nullptr, 0, additional.data(), additional.size()) < 0) {
				Log(LogLevel::Warn, fmt::format("Failed to send goodbye for {}: {}", m_serviceInstance, strerror(errno)));
			}
		}
	}

	void HandleRecord(OperationHost&, const ParsedRecord& record) override
	{
		if (!record.IsQuestion() || !record.responder || !m_announced) {
			return;
		}

		const bool any = record.rtype == MDNS_RECORDTYPE_ANY;
		if (EqualsIgnoreCase(record.name, kDnsSdName)) {
			if (record.rtype == MDNS_RECORDTYPE_PTR || any) {
				// The PTR query was for the DNS-SD domain, answer with a PTR record for the
				// service type we advertise
				mdns_record_t answer = MakeRecord(record.name, MDNS_RECORDTYPE_PTR, m_recordPtr.ttl);
				answer.data.ptr.name = Convert(m_service);
				SendAnswer(record, answer, {});
			}
		} else if (EqualsIgnoreCase(record.name, m_service)) {
			if (record.rtype == MDNS_RECORDTYPE_PTR || any) {
				SendAnswer(record, m_recordPtr, Additional(true, m_hasIpv4, m_hasIpv6));
			}
		} else if (EqualsIgnoreCase(record.name, m_serviceInstance)) {
			if (record.rtype == MDNS_RECORDTYPE_SRV || any) {
				SendAnswer(record, m_recordSrv, Additional(false, m_hasIpv4, m_hasIpv6));
			}
		} else if (EqualsIgnoreCase(record.name, m_hostnameQualified)) {
			if ((record.rtype == MDNS_RECORDTYPE_A || any) && m_hasIpv4) {
				SendAnswer(record, m_recordA, Additional(false, false, m_hasIpv6));
			} else if ((record.rtype == MDNS_RECORDTYPE_AAAA || any) && m_hasIpv6) {
				SendAnswer(record, m_recordAaaa, Additional(false, m_hasIpv4, false));
			}
		}
	}

	void Fail(const DiscoveryError& error) override
	{
		if (m_listener.on_failure) {
			m_listener.on_failure(error);
		}
	}

private:
	static mdns_record_t MakeRecord(std::string_view name, mdns_record_type_t type, std::uint32_t ttl)
	{
		mdns_record_t record;
		std::memset(&record, 0, sizeof(record));
		record.name = Convert(name);
		record.type = type;
		record.rclass = 0;
		record.ttl = ttl;
		return record;
	}

	[[nodiscard]] std::vector<mdns_record_t> Additional(bool srv, bool a, bool aaaa) const
	{
		std::vector<mdns_record_t> additional;
		if (srv) {
			additional.push_back(m_recordSrv);
		}
		if (a) {
			additional.push_back(m_recordA);
		}
		if (aaaa) {
			additional.push_back(m_recordAaaa);
		}
		additional.insert(additional.end(), m_recordsTxt.begin(), m_recordsTxt.end());
		return additional;
	}

	void SendAnswer(const ParsedRecord& record, const mdns_record_t& answer, const std::vector<mdns_record_t>& additional) const
	{
		// Send the answer, unicast or multicast depending on flag in query
		const bool unicast = (record.rclass & MDNS_UNICAST_RESPONSE) != 0;
		Log(LogLevel::Debug, fmt::format("Query {} type {} from {} --> answer ({})", record.name, record.rtype,
		                                 IPAddressToString(record.from, record.addrlen), unicast ? "unicast" : "multicast"));

		std::array<char, 1024> sendbuffer;
		int result;
		if (unicast) {
			result = mdns_query_answer_unicast(record.socket, record.from, record.addrlen, sendbuffer.data(), sendbuffer.size(),
			                                   record.query_id, static_cast<mdns_record_type_t>(record.rtype),
			                                   record.name.data(), record.name.size(), answer, nullptr, 0,
			                                   additional.data(), additional.size());
		} else {
			result = mdns_query_answer_multicast(record.socket, sendbuffer.data(), sendbuffer.size(), answer, nullptr, 0,
			                                     additional.data(), additional.size());
		}
		if (result < 0) {
			Log(LogLevel::Warn, fmt::format("Failed to answer query for {}: {}", record.name, strerror(errno)));
		}
	}

	std::string m_serviceName;
	std::string m_regType;
	std::string m_domain;
	std::string m_service;
	std::string m_serviceInstance;
	std::string m_hostnameQualified;
	std::uint16_t m_port;
	std::vector<std::pair<std::string, std::string>> m_txt;
	RegisterListener m_listener;

	bool m_hasIpv4{false};
	bool m_hasIpv6{false};
	mdns_record_t m_recordPtr;
	mdns_record_t m_recordSrv;
	mdns_record_t m_recordA;
	mdns_record_t m_recordAaaa;
	std::vector<mdns_record_t> m_recordsTxt;

	bool m_announced{false};
};

// Questions and answers share the mDNS port, the QR bit of the header tells them apart
bool IsResponse(int socket)
{
	std::array<std::uint8_t, 4> header;
	const auto peeked = recv(socket, header.data(), header.size(), MSG_PEEK);
	return peeked == static_cast<ssize_t>(header.size()) && (header[2] & 0x80) != 0;
}

template <typename Reply>
void ValidateListener(const Listener<Reply>& listener)
{
	if (!listener.on_reply) {
		throw DiscoveryError(ErrorCode::BadParam, "Listener has no reply callback");
	}
}

}

MdnsEngine::MdnsEngine(MdnsSettings settings)
: m_settings(std::move(settings))
{}

MdnsEngine::~MdnsEngine()
{
	Stop();
}

void MdnsEngine::Start()
{
	if (m_running.load(std::memory_order_acquire)) {
		return;
	}

	m_clientSockets = OpenClientSockets(0, m_settings.max_sockets);
	if (m_clientSockets.sockets.empty()) {
		Log(LogLevel::Error, "Failed to open any client sockets.");
		throw DiscoveryError(ErrorCode::ServiceNotRunning, "Failed to open any client sockets.");
	}
	m_serviceSockets = OpenServiceSockets();
	if (m_serviceSockets.sockets.empty()) {
		Log(LogLevel::Warn, "Failed to open mDNS responder sockets, registrations will not be answered.");
	}

	const auto num_sockets = m_clientSockets.sockets.size();
	Log(LogLevel::Info, fmt::format("Opened {} socket{} for DNS Service Discovery.", num_sockets, num_sockets > 1 ? "s" : ""));

	for (std::size_t i = 0; i < m_clientSockets.sockets.size(); ++i) {
		m_contexts.push_back(SocketContext{this, m_clientSockets.sockets[i], m_clientSockets.interface_indices[i], false});
	}
	for (std::size_t i = 0; i < m_serviceSockets.sockets.size(); ++i) {
		m_contexts.push_back(SocketContext{this, m_serviceSockets.sockets[i], m_serviceSockets.interface_indices[i], true});
	}

	m_running.store(true, std::memory_order_release);
	m_listenThread = std::thread([self = shared_from_this()]() {
		self->ListenLoop();
		self->Shutdown();
	});
}

void MdnsEngine::Stop()
{
	m_running.store(false, std::memory_order_release);
	if (!m_listenThread.joinable()) {
		return;
	}

	Log(LogLevel::Info, "mDNS discovery stopping.");
	if (m_listenThread.get_id() == std::this_thread::get_id()) {
		// Stopped from a listener, the loop shuts down after the current packet
		m_listenThread.detach();
	} else {
		m_listenThread.join();
	}
}

void MdnsEngine::Shutdown()
{
	// Registrations still running say goodbye, every live listener is told the engine is gone
	m_operations.Shutdown(*this, DiscoveryError(ErrorCode::ServiceNotRunning, m_stopReason));

	CloseSockets(m_clientSockets);
	CloseSockets(m_serviceSockets);
	m_contexts.clear();

	Log(LogLevel::Info, "mDNS discovery stopped.");
}

std::unique_ptr<ServiceHandle> MdnsEngine::Add(std::shared_ptr<Operation> operation)
{
	if (!m_running.load(std::memory_order_acquire)) {
		throw DiscoveryError(ErrorCode::ServiceNotRunning, "mDNS discovery is not running");
	}
	m_operations.Add(operation);
	return std::make_unique<OperationHandle>(weak_from_this(), std::move(operation));
}

void MdnsEngine::Cancel(const std::shared_ptr<Operation>& operation)
{
	m_operations.Cancel(operation);
}

void MdnsEngine::Remove(std::uint64_t id)
{
	m_operations.Remove(id);
}

bool MdnsEngine::SendQuery(mdns_record_type_t type, const std::string& name, std::uint32_t interface_index)
{
	std::array<char, 1024> buffer;
	bool sent = false;
	for (std::size_t i = 0; i < m_clientSockets.sockets.size(); ++i) {
		if (interface_index != kAllInterfaces && m_clientSockets.interface_indices[i] != interface_index) {
			continue;
		}
		if (mdns_query_send(m_clientSockets.sockets[i], type, name.data(), name.size(), buffer.data(), buffer.size(), 0) < 0) {
			Log(LogLevel::Warn, fmt::format("Failed to send {} query for {}: {}", ToString(static_cast<RecordType>(type)), name, strerror(errno)));
		} else {
			sent = true;
		}
	}
	return sent;
}

int MdnsEngine::RecordCallback(int sock, const struct sockaddr* from, size_t addrlen, mdns_entry_type_t entry,
                               uint16_t query_id, uint16_t rtype, uint16_t rclass, uint32_t ttl, const void* data,
                               size_t size, size_t name_offset, size_t, size_t record_offset,
                               size_t record_length, void* user_data)
{
	const auto context = static_cast<SocketContext*>(user_data);

	ParsedRecord record;
	record.socket = sock;
	record.responder = context->responder;
	record.interface_index = context->interface_index;
	record.from = from;
	record.addrlen = addrlen;
	record.entry = entry;
	record.query_id = query_id;
	record.rtype = rtype;
	record.rclass = rclass;
	record.ttl = ttl;

	char namebuffer[256];
	size_t offset = name_offset;
	record.name = ToStdString(mdns_string_extract(data, size, &offset, namebuffer, sizeof(namebuffer)));

	if (entry != MDNS_ENTRYTYPE_QUESTION) {
		if (rtype == MDNS_RECORDTYPE_PTR) {
			char targetbuffer[256];
			record.target = ToStdString(mdns_record_parse_ptr(data, size, record_offset, record_length, targetbuffer, sizeof(targetbuffer)));
		} else if (rtype == MDNS_RECORDTYPE_SRV) {
			char targetbuffer[256];
			const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length, targetbuffer, sizeof(targetbuffer));
			record.target = ToStdString(srv.name);
			record.port = srv.port;
		} else if ((rtype == MDNS_RECORDTYPE_A || rtype == MDNS_RECORDTYPE_AAAA || rtype == MDNS_RECORDTYPE_TXT)
		           && record_offset + record_length <= size) {
			const auto* rdata = static_cast<const std::uint8_t*>(data) + record_offset;
			record.rdata.assign(rdata, rdata + record_length);
		}
	}

	context->engine->Dispatch(record);
	return 0;
}

void MdnsEngine::ListenLoop()
{
	std::array<char, 4096> buffer;
	const auto poll_usec = std::chrono::duration_cast<std::chrono::microseconds>(m_settings.poll_interval).count();

	while (m_running.load(std::memory_order_acquire)) {
		RunTicks(Clock::now());
		StopCancelled();

		int nfds = 0;
		fd_set readfs;
		FD_ZERO(&readfs);
		for (const auto& context : m_contexts) {
			if (context.socket >= nfds)
				nfds = context.socket + 1;
			FD_SET(context.socket, &readfs);
		}

		struct timeval timeout;
		timeout.tv_sec = static_cast<decltype(timeout.tv_sec)>(poll_usec / 1000000);
		timeout.tv_usec = static_cast<decltype(timeout.tv_usec)>(poll_usec % 1000000);

		const int ready = select(nfds, &readfs, nullptr, nullptr, &timeout);
		if (ready < 0) {
			if (errno == EINTR) {
				continue;
			}
			m_stopReason = fmt::format("select() failed: {}", strerror(errno));
			Log(LogLevel::Error, m_stopReason);
			m_running.store(false, std::memory_order_release);
			break;
		}

		for (auto& context : m_contexts) {
			if (!FD_ISSET(context.socket, &readfs)) {
				continue;
			}
			if (context.responder && !IsResponse(context.socket)) {
				mdns_socket_listen(context.socket, buffer.data(), buffer.size(), RecordCallback, &context);
			} else {
				mdns_query_recv(context.socket, buffer.data(), buffer.size(), RecordCallback, &context, 0);
			}
		}
	}
}

void MdnsEngine::Dispatch(const ParsedRecord& record)
{
	// Listeners run without the lock so they can cancel operations
	for (const auto& operation : m_operations.Active()) {
		if (!operation->Finished() && operation->OnInterface(record.interface_index)) {
			operation->HandleRecord(*this, record);
		}
	}
}

void MdnsEngine::RunTicks(Clock::time_point now)
{
	for (const auto& operation : m_operations.Active()) {
		if (!operation->Finished()) {
			operation->Tick(*this, now);
		}
	}
}

void MdnsEngine::StopCancelled()
{
	for (const auto& operation : m_operations.TakeCancelled()) {
		operation->Stop(*this);
	}
}

MdnsDiscoveryService::MdnsDiscoveryService(MdnsSettings settings)
: m_engine(std::make_shared<MdnsEngine>(std::move(settings)))
{
	m_engine->Start();
}

MdnsDiscoveryService::~MdnsDiscoveryService()
{
	m_engine->Stop();
}

std::unique_ptr<ServiceHandle> MdnsDiscoveryService::Browse(std::uint32_t interface_index,
                                                            const std::string& reg_type,
                                                            const std::string& domain,
                                                            BrowseListener listener)
{
	ValidateListener(listener);
	if (reg_type.empty()) {
		throw DiscoveryError(ErrorCode::BadParam, "Browse needs a registration type");
	}
	return m_engine->Add(std::make_shared<BrowseOperation>(interface_index, reg_type, domain, std::move(listener), m_engine->Settings()));
}

std::unique_ptr<ServiceHandle> MdnsDiscoveryService::Resolve(std::uint32_t interface_index,
                                                             const std::string& service_name,
                                                             const std::string& reg_type,
                                                             const std::string& domain,
                                                             ResolveListener listener)
{
	ValidateListener(listener);
	if (service_name.empty() || reg_type.empty()) {
		throw DiscoveryError(ErrorCode::BadParam, "Resolve needs a service name and a registration type");
	}
	return m_engine->Add(std::make_shared<ResolveOperation>(interface_index, service_name, reg_type, domain, std::move(listener), m_engine->Settings()));
}

std::unique_ptr<ServiceHandle> MdnsDiscoveryService::QueryRecord(std::uint32_t interface_index,
                                                                 const std::string& fullname,
                                                                 RecordType record_type,
                                                                 std::uint16_t record_class,
                                                                 QueryListener listener)
{
	ValidateListener(listener);
	if (fullname.empty()) {
		throw DiscoveryError(ErrorCode::BadParam, "Query needs a name");
	}
	return m_engine->Add(std::make_shared<QueryOperation>(interface_index, fullname, record_type, record_class, std::move(listener), m_engine->Settings()));
}

std::unique_ptr<ServiceHandle> MdnsDiscoveryService::Register(std::uint32_t interface_index,
                                                              const std::string& service_name,
                                                              const std::string& reg_type,
                                                              const std::string& domain,
                                                              const std::string& host,
                                                              std::uint16_t port,
                                                              const TxtRecord& txt_record,
                                                              RegisterListener listener)
{
	ValidateListener(listener);
	if (service_name.empty() || reg_type.empty()) {
		throw DiscoveryError(ErrorCode::BadParam, "Register needs a service name and a registration type");
	}
	if (m_engine->ResponderSockets().sockets.empty()) {
		throw DiscoveryError(ErrorCode::ServiceNotRunning, "No mDNS responder sockets");
	}
	return m_engine->Add(std::make_shared<RegisterOperation>(interface_index, service_name, reg_type, domain, host, port,
	                                                          txt_record, std::move(listener), *m_engine));
}

}
