#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace service_finder
{

// Raw IPv4 address, network byte order
using Ipv4Address = std::array<std::uint8_t, 4>;

using TxtProperties = std::vector<std::pair<std::string, std::string>>;

enum class EntryType {
    UNKNOWN,
    QUESTION,
    ANSWER,
    AUTHORITY,
    ADDITIONAL
};
std::string ToString(EntryType entry);

struct RecordHeader {
    std::string ip_address; // Sender, possibly including port
    EntryType entry_type{EntryType::UNKNOWN};
    std::string entry_string; // example: "_services._dns-sd._udp.local."

    std::uint16_t record_type{0}; // As on the wire, see mdns_record_type_t
    std::uint16_t rclass{0};
    std::uint32_t ttl{0}; // Seconds, 0 means goodbye
};

struct DomainNamePointerRecord {
    RecordHeader header;

    std::string name_string; // examples: "_http._tcp.local.", "Printer1._ipp._tcp.local."
};

struct ServiceRecord {
    RecordHeader header;

    std::string target; // examples: "printer.local."
    std::uint16_t priority{0};
    std::uint16_t weight{0};
    std::uint16_t port{0};
};

struct ARecord {
    RecordHeader header;

    Ipv4Address address{};
};

struct TXTRecord {
    RecordHeader header;

    TxtProperties txt;
};

struct AnyRecord {
    RecordHeader header;
};

using Record = std::variant<AnyRecord,
                            DomainNamePointerRecord,
                            ServiceRecord,
                            ARecord,
                            TXTRecord>;
std::string ToString(const Record& record);

// What the engine knows about one service instance
struct ServiceInfo {
    std::string type; // "_ipp._tcp.local."
    std::string name; // "Printer1._ipp._tcp.local."
    std::string server; // "printer.local."
    std::uint16_t port{0};
    std::vector<Ipv4Address> addresses; // Possibly empty
    TxtProperties properties;
};

// A DNS-SD service type seen on the network
struct ServiceTypeRecord {
    std::string type_name;
};

// A resolved service instance, as listed on the console
struct ServiceInstanceRecord {
    std::string instance_name;
    std::string address;
    std::string device_name;
};
bool operator==(const ServiceInstanceRecord& lhs, const ServiceInstanceRecord& rhs);

}
