#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace service_finder
{
namespace netbios
{

inline constexpr std::uint16_t kPort = 137;
inline constexpr std::uint16_t kNodeStatusType = 0x0021;
inline constexpr std::uint16_t kInternetClass = 0x0001;

struct NameEntry
{
    std::string name; // Trailing spaces removed
    std::uint8_t suffix{0}; // 0x00 workstation, 0x20 file server, ...
    std::uint16_t flags{0};

    [[nodiscard]] bool IsGroup() const { return (flags & 0x8000) != 0; }
};

// Node status request for the wildcard name "*"
std::vector<std::uint8_t> EncodeStatusQuery(std::uint16_t transaction_id);

// Name table from a node status response, nullopt if the packet is not
// a well-formed answer to transaction_id
std::optional<std::vector<NameEntry>> ParseStatusResponse(const std::uint8_t* data, std::size_t size,
                                                          std::uint16_t transaction_id);

// First unique workstation name of the table
std::optional<std::string> MachineName(const std::vector<NameEntry>& entries);

}
}
