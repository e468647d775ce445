#pragma once

#include "mdns.h"
#include "service_finder/types.hpp"
#include "service_finder/log.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace service_finder
{

inline EntryType ParseEntryType(mdns_entry_type_t old_entry_type) {
	switch (old_entry_type) {
		case MDNS_ENTRYTYPE_QUESTION : return EntryType::QUESTION;
		case MDNS_ENTRYTYPE_ANSWER : return EntryType::ANSWER;
		case MDNS_ENTRYTYPE_AUTHORITY : return EntryType::AUTHORITY;
		case MDNS_ENTRYTYPE_ADDITIONAL : return EntryType::ADDITIONAL;
	}
	return EntryType::UNKNOWN;
}

inline std::string IPAddressToString(const sockaddr *addr, size_t addrlen) {
  char host[NI_MAXHOST] = {0};
  char service[NI_MAXSERV] = {0};
  const int ret = getnameinfo(addr, (socklen_t)addrlen, host, NI_MAXHOST, service, NI_MAXSERV, NI_NUMERICSERV | NI_NUMERICHOST);
  if (ret != 0) {
    return "";
  }
  if (addr->sa_family == AF_INET6) {
    return fmt::format("[{}]:{}", host, service);
  }
  return fmt::format("{}:{}", host, service);
}

// Sockets bound to the mDNS port on all interfaces, so both the answers to
// our queries and unsolicited announcements and goodbyes arrive on them.
// Each socket can receive data from all network interfaces, thus we only
// need one per address family.
inline std::vector<int> OpenServiceSockets(bool use_ipv6) {
	std::vector<int> sockets;

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
			sockets.push_back(sock);
			Log(LogLevel::Debug, fmt::format("Socket {} opened for IPv4 mDNS.", sock));
		} else {
			Log(LogLevel::Warn, fmt::format("Failed to open IPv4 mDNS socket: {}", strerror(errno)));
		}
	}

	/// IPv6
	if (use_ipv6) {
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
			sockets.push_back(sock);
			Log(LogLevel::Debug, fmt::format("Socket {} opened for IPv6 mDNS.", sock));
		} else {
			Log(LogLevel::Debug, fmt::format("No IPv6 mDNS socket: {}", strerror(errno)));
		}
	}

	return sockets;
}

// Turns one resource record handed out by mdns_query_recv() into a Record
inline Record ParseRecord(const struct sockaddr* from, size_t addrlen,
                          mdns_entry_type_t entry, uint16_t rtype,
                          uint16_t rclass, uint32_t ttl, const void* data, size_t size,
                          size_t name_offset, size_t record_offset, size_t record_length)
{
	RecordHeader header;
	header.ip_address = IPAddressToString(from, addrlen);
	header.entry_type = ParseEntryType(entry);
	char entrybuffer[256];
	// entrystr example: "_services._dns-sd._udp.local."
	const mdns_string_t entrystr = mdns_string_extract(data, size, &name_offset, entrybuffer, sizeof(entrybuffer));
	header.entry_string = std::string(entrystr.str, entrystr.length);
	header.record_type = rtype;
	header.rclass = rclass;
	header.ttl = ttl;

	if (rtype == MDNS_RECORDTYPE_PTR) {
		DomainNamePointerRecord ptrRecord;
		ptrRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_string_t namestr = mdns_record_parse_ptr(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		ptrRecord.name_string = std::string(namestr.str, namestr.length);
		return ptrRecord;
	}
	if (rtype == MDNS_RECORDTYPE_SRV) {
		ServiceRecord srvRecord;
		srvRecord.header = std::move(header);

		char namebuffer[256];
		const mdns_record_srv_t srv = mdns_record_parse_srv(data, size, record_offset, record_length,
		                                                    namebuffer, sizeof(namebuffer));
		srvRecord.target = std::string(srv.name.str, srv.name.length);
		srvRecord.priority = srv.priority;
		srvRecord.weight = srv.weight;
		srvRecord.port = srv.port;
		return srvRecord;
	}
	if (rtype == MDNS_RECORDTYPE_A) {
		ARecord aRecord;
		aRecord.header = std::move(header);

		struct sockaddr_in addr;
		memset(&addr, 0, sizeof(addr));
		mdns_record_parse_a(data, size, record_offset, record_length, &addr);
		memcpy(aRecord.address.data(), &addr.sin_addr.s_addr, aRecord.address.size());
		return aRecord;
	}
	if (rtype == MDNS_RECORDTYPE_TXT) {
		TXTRecord txtRecord;
		txtRecord.header = std::move(header);

		mdns_record_txt_t txtbuffer[128];
		const size_t parsed = mdns_record_parse_txt(data, size, record_offset, record_length, txtbuffer,
		                                            sizeof(txtbuffer) / sizeof(mdns_record_txt_t));
		for (size_t itxt = 0; itxt < parsed; ++itxt) {
			txtRecord.txt.emplace_back(std::string(txtbuffer[itxt].key.str, txtbuffer[itxt].key.length),
			                           std::string(txtbuffer[itxt].value.str, txtbuffer[itxt].value.length));
		}
		return txtRecord;
	}

	AnyRecord anyRecord;
	anyRecord.header = std::move(header);
	return anyRecord;
}

}
