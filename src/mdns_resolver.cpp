#include "mdns_discover/resolver.hpp"
#include "mdns_discover/errors.hpp"
#include "mdns_discover/log.hpp"
#include "mdns_discover/record_join.hpp"
#include "mdns_discover/txt.hpp"
#include "mdns_utils.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <deque>
#include <string_view>

#include <sys/select.h>

#include <fmt/core.h>

namespace mdns_discover
{

namespace
{

constexpr auto kRequeryInterval = std::chrono::seconds(1);

class MdnsBrowseStream : public BrowseStream
{
public:
	MdnsBrowseStream(std::shared_ptr<SocketSet> sockets, std::string query_name, Clock::time_point deadline)
	: m_sockets(std::move(sockets))
	, m_joiner(std::move(query_name))
	, m_deadline(deadline)
	{}

	StreamStatus Next(ServiceEntry& entry) override
	{
		while (true) {
			if (!m_ready.empty()) {
				entry = std::move(m_ready.front());
				m_ready.pop_front();
				return StreamStatus::Entry;
			}

			const auto now = Clock::now();
			if (now >= m_deadline) {
				return StreamStatus::DeadlineExceeded;
			}
			if (now >= m_nextQuery) {
				SendQueries();
			}

			const auto wait = std::chrono::duration_cast<std::chrono::microseconds>(std::min(m_deadline, m_nextQuery) - now);
			struct timeval timeout;
			timeout.tv_sec = static_cast<time_t>(wait.count() / 1000000);
			timeout.tv_usec = static_cast<suseconds_t>(wait.count() % 1000000);

			int nfds = 0;
			fd_set readfs;
			FD_ZERO(&readfs);
			for (const auto sock : m_sockets->Sockets()) {
				if (sock >= nfds)
					nfds = sock + 1;
				FD_SET(sock, &readfs);
			}

			const int res = select(nfds, &readfs, nullptr, nullptr, &timeout);
			if (res < 0) {
				if (errno == EINTR) {
					continue;
				}
				Log(LogLevel::Warn, fmt::format("select() failed while browsing {}: {}", m_joiner.QueryName(), strerror(errno)));
				return StreamStatus::Closed;
			}
			for (const auto sock : m_sockets->Sockets()) {
				if (FD_ISSET(sock, &readfs)) {
					mdns_query_recv(sock, m_buffer.data(), m_buffer.size(), QueryCallback, this, 0);
				}
			}
			Publish();
		}
	}

	// Sends the PTR query plus follow-up queries for incomplete instances.
	// Returns the number of sockets that accepted the PTR query.
	std::size_t SendQueries()
	{
		std::size_t sent = 0;
		for (const auto sock : m_sockets->Sockets()) {
			if (mdns_query_send(sock, MDNS_RECORDTYPE_PTR, m_joiner.QueryName().data(), m_joiner.QueryName().size(), m_buffer.data(), m_buffer.size(), 0) >= 0) {
				++sent;
			} else {
				Log(LogLevel::Debug, fmt::format("Failed to send mDNS query for {}: {}", m_joiner.QueryName(), strerror(errno)));
			}
		}

		for (const auto& query : m_joiner.PendingQueries()) {
			if (query.type == FollowUpQuery::Type::Srv) {
				SendFollowUp(MDNS_RECORDTYPE_SRV, query.name);
			} else {
				SendFollowUp(MDNS_RECORDTYPE_A, query.name);
				SendFollowUp(MDNS_RECORDTYPE_AAAA, query.name);
			}
		}

		m_nextQuery = Clock::now() + kRequeryInterval;
		return sent;
	}

private:
	static int QueryCallback(int sock, const struct sockaddr* from, size_t addrlen,
	                         mdns_entry_type_t entry, uint16_t query_id, uint16_t rtype,
	                         uint16_t rclass, uint32_t ttl, const void* data, size_t size,
	                         size_t name_offset, size_t name_length, size_t record_offset,
	                         size_t record_length, void* user_data)
	{
		(void)sock;
		(void)from;
		(void)addrlen;
		(void)query_id;
		(void)rclass;
		(void)ttl;
		(void)name_length;
		if (entry == MDNS_ENTRYTYPE_QUESTION) {
			return 0;
		}
		auto stream = static_cast<MdnsBrowseStream*>(user_data);
		stream->HandleRecord(rtype, data, size, name_offset, record_offset, record_length);
		return 0;
	}

	void SendFollowUp(mdns_record_type_t type, const std::string& name)
	{
		for (const auto sock : m_sockets->Sockets()) {
			mdns_query_send(sock, type, name.data(), name.size(), m_buffer.data(), m_buffer.size(), 0);
		}
	}

	// Decodes one answer and hands it to the joiner
	void HandleRecord(uint16_t rtype, const void* data, size_t size, size_t name_offset,
	                  size_t record_offset, size_t record_length)
	{
		char entrybuffer[256];
		char namebuffer[256];
		size_t offset = name_offset;
		const std::string name = ToString(mdns_string_extract(data, size, &offset, entrybuffer, sizeof(entrybuffer)));

		if (rtype == MDNS_RECORDTYPE_PTR) {
			const mdns_string_t namestr = mdns_record_parse_ptr(data, size, record_offset, record_length,
			                                                    namebuffer, sizeof(namebuffer));
			m_joiner.AddPtr(name, ToString(namestr));
		} else if (rtype == MDNS_RECORDTYPE_SRV) {
			const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
			                                                    namebuffer, sizeof(namebuffer));
			m_joiner.AddSrv(name, ToString(srv.name), srv.port);
		} else if (rtype == MDNS_RECORDTYPE_A) {
			struct sockaddr_in addr;
			memset(&addr, 0, sizeof(addr));
			mdns_record_parse_a(data, size, record_offset, record_length, &addr);
			addr.sin_port = 0;
			m_joiner.AddAddress(name, IPV4AddressToString(&addr, sizeof(addr)), false);
		} else if (rtype == MDNS_RECORDTYPE_AAAA) {
			struct sockaddr_in6 addr;
			memset(&addr, 0, sizeof(addr));
			mdns_record_parse_aaaa(data, size, record_offset, record_length, &addr);
			addr.sin6_port = 0;
			m_joiner.AddAddress(name, IPV6AddressToString(&addr, sizeof(addr)), true);
		} else if (rtype == MDNS_RECORDTYPE_TXT) {
			// Raw character strings, mdns_record_parse_txt() drops or rewrites some of them
			if (record_offset > size || record_length > size - record_offset) {
				return;
			}
			const std::string_view rdata(static_cast<const char*>(data) + record_offset, record_length);
			m_joiner.AddTxt(name, SplitTxtRdata(rdata));
		}
	}

	void Publish()
	{
		for (auto& entry : m_joiner.TakeChanged()) {
			m_ready.push_back(std::move(entry));
		}
	}

	std::shared_ptr<SocketSet> m_sockets;
	RecordJoiner m_joiner;
	Clock::time_point m_deadline;
	Clock::time_point m_nextQuery{};
	std::deque<ServiceEntry> m_ready;
	std::array<char, 2048> m_buffer;
};

class MdnsResolver : public Resolver
{
public:
	MdnsResolver()
	: m_sockets(std::make_shared<SocketSet>(OpenClientSockets(0)))
	{
		const auto num_sockets = m_sockets->Sockets().size();
		if (num_sockets == 0) {
			throw DiscoveryError(ErrorCode::ResolverInitFailed, "failed to open any client sockets");
		}
		Log(LogLevel::Debug, fmt::format("Opened {} socket{} for mDNS browsing.", num_sockets, num_sockets > 1 ? "s" : ""));
	}

	std::unique_ptr<BrowseStream> Browse(const std::string& service_type, const std::string& domain,
	                                     Clock::time_point deadline) override
	{
		auto query_name = QueryName(service_type, domain);
		auto stream = std::make_unique<MdnsBrowseStream>(m_sockets, query_name, deadline);
		if (stream->SendQueries() == 0) {
			throw DiscoveryError(ErrorCode::BrowseFailed,
			                     fmt::format("could not send query for {}: {}", query_name, strerror(errno)));
		}
		Log(LogLevel::Debug, fmt::format("Sent mDNS query for {}", query_name));
		return stream;
	}

private:
	std::shared_ptr<SocketSet> m_sockets;
};

}

std::unique_ptr<Resolver> MakeMdnsResolver()
{
	return std::make_unique<MdnsResolver>();
}

}
