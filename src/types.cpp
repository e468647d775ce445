#include "service_finder/types.hpp"
#include "service_finder/service_name.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace service_finder
{

std::string ToString(EntryType entry)
{
    switch (entry) {
        case EntryType::QUESTION: return "question";
        case EntryType::ANSWER: return "answer";
        case EntryType::AUTHORITY: return "authority";
        case EntryType::ADDITIONAL: return "additional";
        case EntryType::UNKNOWN: break;
    }
    return "unknown";
}

namespace
{

std::string HeaderString(const RecordHeader& header)
{
    return fmt::format("{} : {} {}", header.ip_address, ToString(header.entry_type), header.entry_string);
}

struct RecordFormatter
{
    std::string operator()(const DomainNamePointerRecord& record) const
    {
        return fmt::format("{} PTR {} rclass {:#x} ttl {}", HeaderString(record.header), record.name_string,
                           record.header.rclass, record.header.ttl);
    }

    std::string operator()(const ServiceRecord& record) const
    {
        return fmt::format("{} SRV {} priority {} weight {} port {}", HeaderString(record.header), record.target,
                           record.priority, record.weight, record.port);
    }

    std::string operator()(const ARecord& record) const
    {
        return fmt::format("{} A {}", HeaderString(record.header), Ipv4ToString(record.address));
    }

    std::string operator()(const TXTRecord& record) const
    {
        return fmt::format("{} TXT {}", HeaderString(record.header), record.txt);
    }

    std::string operator()(const AnyRecord& record) const
    {
        return fmt::format("{} type {} rclass {:#x} ttl {}", HeaderString(record.header), record.header.record_type,
                           record.header.rclass, record.header.ttl);
    }
};

}

std::string ToString(const Record& record)
{
    return std::visit(RecordFormatter{}, record);
}

bool operator==(const ServiceInstanceRecord& lhs, const ServiceInstanceRecord& rhs)
{
    return lhs.instance_name == rhs.instance_name
        && lhs.address == rhs.address
        && lhs.device_name == rhs.device_name;
}

}
