#pragma once

#include <mdns.h>

#include "rxdnssd/log.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

#include <fmt/core.h>

namespace rxdnssd
{

inline mdns_string_t Convert(std::string_view str)
{
    return mdns_string_t{str.data(), str.size()};
}

inline std::string ToStdString(const mdns_string_t& str)
{
    return std::string(str.str, str.length);
}

inline std::string IPV4AddressToString(const sockaddr_in *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret == 0) {
    if (addr->sin_port != 0) {
	  return fmt::format("{}:{}", host, service);
    } else {
	  return fmt::format("{}", host);
    }
  }
  return "";
}

inline std::string IPV6AddressToString(const sockaddr_in6 *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo((const struct sockaddr *)addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret == 0) {
    if (addr->sin6_port != 0) {
	  return fmt::format("[{}]:{}", host, service);
    } else {
	  return fmt::format("{}", host);
    }
  }
  return "";
}

inline std::string IPAddressToString(const sockaddr *addr, size_t addrlen) {
  if (addr->sa_family == AF_INET6) {
    return IPV6AddressToString((const struct sockaddr_in6 *)addr, addrlen);
  }
  return IPV4AddressToString((const struct sockaddr_in *)addr, addrlen);
}

struct OpenSocketsData {
	std::vector<int> sockets;
	// Interface of each socket, 0 for sockets listening on every interface
	std::vector<std::uint32_t> interface_indices;
	struct sockaddr_in service_address_ipv4;
	struct sockaddr_in6 service_address_ipv6;
	bool has_ipv4{false};
	bool has_ipv6{false};
};

inline OpenSocketsData OpenClientSockets(int port, std::size_t max_sockets = 64) {
	OpenSocketsData returnData;
	std::memset(&returnData.service_address_ipv4, 0, sizeof(returnData.service_address_ipv4));
	std::memset(&returnData.service_address_ipv6, 0, sizeof(returnData.service_address_ipv6));
	// When sending, each socket can only send to one network interface
	// Thus we need to open one socket for each interface and address family

	struct ifaddrs* ifaddr = nullptr;
	struct ifaddrs* ifa = nullptr;

	if (getifaddrs(&ifaddr) < 0) {
		Log(LogLevel::Warn, "Unable to get interface addresses");
		return returnData;
	}

	for (ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
		if (!ifa->ifa_addr)
			continue;
		if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
			continue;
		if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
			continue;

		const std::uint32_t interface_index = if_nametoindex(ifa->ifa_name);

		if (ifa->ifa_addr->sa_family == AF_INET) {
			struct sockaddr_in* saddr = (struct sockaddr_in*)ifa->ifa_addr;
			if (saddr->sin_addr.s_addr != htonl(INADDR_LOOPBACK)) {
				if (!returnData.has_ipv4) {
					returnData.service_address_ipv4 = *saddr;
					returnData.has_ipv4 = true;
				}
				if (returnData.sockets.size() < max_sockets) {
					saddr->sin_port = htons(port);
					int sock = mdns_socket_open_ipv4(saddr);
					if (sock >= 0) {
						returnData.sockets.push_back(sock);
						returnData.interface_indices.push_back(interface_index);
						const auto addr = IPV4AddressToString(saddr, sizeof(struct sockaddr_in));
						Log(LogLevel::Debug, fmt::format("Socket opened for interface {} ({}) with local IPv4 address: {}", ifa->ifa_name, interface_index, addr));
					}
				}
			}
		} else if (ifa->ifa_addr->sa_family == AF_INET6) {
			struct sockaddr_in6* saddr = (struct sockaddr_in6*)ifa->ifa_addr;
			// Ignore link-local addresses
			if (saddr->sin6_scope_id)
				continue;
			const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                   0, 0, 0, 0, 0, 0, 0, 1};
			const unsigned char localhost_mapped[] = {0, 0, 0,    0,    0,    0, 0, 0,
			                                          0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
			if (memcmp(saddr->sin6_addr.s6_addr, localhost, 16) &&
			    memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16)) {
				if (!returnData.has_ipv6) {
					returnData.service_address_ipv6 = *saddr;
					returnData.has_ipv6 = true;
				}
				if (returnData.sockets.size() < max_sockets) {
					saddr->sin6_port = htons(port);
					int sock = mdns_socket_open_ipv6(saddr);
					if (sock >= 0) {
						returnData.sockets.push_back(sock);
						returnData.interface_indices.push_back(interface_index);
						const auto addr = IPV6AddressToString(saddr, sizeof(struct sockaddr_in6));
						Log(LogLevel::Debug, fmt::format("Socket opened for interface {} ({}) with local IPv6 address: {}", ifa->ifa_name, interface_index, addr));
					}
				}
			}
		}
	}

	freeifaddrs(ifaddr);

	return returnData;
}

inline OpenSocketsData OpenServiceSockets() {
	// When receiving, each socket can receive data from all network interfaces
	// Thus we only need to open one socket for each address family

	// Call the client socket function to enumerate and get local addresses,
	// but not open the actual sockets
	auto openSocketData = OpenClientSockets(0, 0);

	/// IPv4
	{
		struct sockaddr_in sock_addr;
		memset(&sock_addr, 0, sizeof(struct sockaddr_in));
		sock_addr.sin_family = AF_INET;
		sock_addr.sin_addr.s_addr = INADDR_ANY;
		sock_addr.sin_port = htons(MDNS_PORT);
#ifdef __APPLE__
		sock_addr.sin_len = sizeof(struct sockaddr_in);
#endif
		int sock = mdns_socket_open_ipv4(&sock_addr);
		if (sock >= 0) {
			openSocketData.sockets.push_back(sock);
			openSocketData.interface_indices.push_back(0);
		}
	}

	/// IPv6
	{
		struct sockaddr_in6 sock_addr;
		memset(&sock_addr, 0, sizeof(struct sockaddr_in6));
		sock_addr.sin6_family = AF_INET6;
		sock_addr.sin6_addr = in6addr_any;
		sock_addr.sin6_port = htons(MDNS_PORT);
#ifdef __APPLE__
		sock_addr.sin6_len = sizeof(struct sockaddr_in6);
#endif
		int sock = mdns_socket_open_ipv6(&sock_addr);
		if (sock >= 0) {
			openSocketData.sockets.push_back(sock);
			openSocketData.interface_indices.push_back(0);
		}
	}

	return openSocketData;
}

inline void CloseSockets(OpenSocketsData& data)
{
	for (const auto& socket : data.sockets) {
		mdns_socket_close(socket);
	}
	data.sockets.clear();
	data.interface_indices.clear();
}

}
