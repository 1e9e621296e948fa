#pragma once

#include "mdns.h"

#include <cstring>
#include <string>
#include <vector>

#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <unistd.h>

#include <fmt/core.h>

#include "mdns_discover/log.hpp"

namespace mdns_discover
{

inline std::string ToString(mdns_string_t str)
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

// Owns a set of mDNS sockets, closes them on destruction
class SocketSet
{
public:
	explicit SocketSet(std::vector<int> sockets)
	: m_sockets(std::move(sockets))
	{}

	~SocketSet()
	{
		for (const auto sock : m_sockets) {
			mdns_socket_close(sock);
		}
	}

	SocketSet(const SocketSet&) = delete;
	SocketSet& operator=(const SocketSet&) = delete;

	[[nodiscard]] const std::vector<int>& Sockets() const { return m_sockets; }
	[[nodiscard]] bool Empty() const { return m_sockets.empty(); }

private:
	std::vector<int> m_sockets;
};

inline std::vector<int> OpenClientSockets(int port, std::size_t max_sockets = 32) {
	// When sending, each socket can only send to one network interface
	// Thus we need to open one socket for each interface and address family
	std::vector<int> sockets;

	struct ifaddrs* ifaddr = nullptr;
	struct ifaddrs* ifa = nullptr;

	if (getifaddrs(&ifaddr) < 0) {
		Log(LogLevel::Warn, "Unable to get interface addresses");
		return sockets;
	}

	for (ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
		if (!ifa->ifa_addr)
			continue;
		if (!(ifa->ifa_flags & IFF_UP) || !(ifa->ifa_flags & IFF_MULTICAST))
			continue;
		if ((ifa->ifa_flags & IFF_LOOPBACK) || (ifa->ifa_flags & IFF_POINTOPOINT))
			continue;
		if (sockets.size() >= max_sockets)
			break;

		if (ifa->ifa_addr->sa_family == AF_INET) {
			struct sockaddr_in* saddr = (struct sockaddr_in*)ifa->ifa_addr;
			if (saddr->sin_addr.s_addr != htonl(INADDR_LOOPBACK)) {
				saddr->sin_port = htons(port);
				int sock = mdns_socket_open_ipv4(saddr);
				if (sock >= 0) {
					sockets.push_back(sock);
					const auto addr = IPV4AddressToString(saddr, sizeof(struct sockaddr_in));
					Log(LogLevel::Debug, fmt::format("Socket opened on {} for local IPv4 address: {}", ifa->ifa_name, addr));
				}
			}
		} else if (ifa->ifa_addr->sa_family == AF_INET6) {
			struct sockaddr_in6* saddr = (struct sockaddr_in6*)ifa->ifa_addr;
			// Ignore link-local addresses
			if (saddr->sin6_scope_id)
				continue;
			const unsigned char localhost[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                   0, 0, 0, 0, 0, 0, 0, 1};
			const unsigned char localhost_mapped[] = {0, 0, 0, 0, 0, 0, 0, 0,
			                                          0, 0, 0xff, 0xff, 0x7f, 0, 0, 1};
			if (memcmp(saddr->sin6_addr.s6_addr, localhost, 16) &&
			    memcmp(saddr->sin6_addr.s6_addr, localhost_mapped, 16)) {
				saddr->sin6_port = htons(port);
				int sock = mdns_socket_open_ipv6(saddr);
				if (sock >= 0) {
					sockets.push_back(sock);
					const auto addr = IPV6AddressToString(saddr, sizeof(struct sockaddr_in6));
					Log(LogLevel::Debug, fmt::format("Socket opened on {} for local IPv6 address: {}", ifa->ifa_name, addr));
				}
			}
		}
	}

	freeifaddrs(ifaddr);

	return sockets;
}

}
