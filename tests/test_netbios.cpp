#include <gtest/gtest.h>

#include "service_finder/netbios.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace service_finder;

namespace {

void PutU16(std::vector<std::uint8_t>& out, std::uint16_t value) {
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value & 0xff));
}

void PutEntry(std::vector<std::uint8_t>& out, const std::string& name, std::uint8_t suffix, std::uint16_t flags) {
    std::string padded = name;
    padded.resize(15, ' ');
    out.insert(out.end(), padded.begin(), padded.end());
    out.push_back(suffix);
    PutU16(out, flags);
}

struct Entry {
    std::string name;
    std::uint8_t suffix;
    std::uint16_t flags;
};

// Node status response the way Windows and Samba send it
std::vector<std::uint8_t> MakeResponse(std::uint16_t id, const std::vector<Entry>& entries,
                                       bool compressed_name = false, std::uint16_t flags = 0x8400) {
    std::vector<std::uint8_t> packet;
    PutU16(packet, id);
    PutU16(packet, flags);
    PutU16(packet, 0);
    PutU16(packet, 1);
    PutU16(packet, 0);
    PutU16(packet, 0);

    if (compressed_name) {
        packet.push_back(0xc0);
        packet.push_back(0x0c);
    } else {
        const auto query = netbios::EncodeStatusQuery(id);
        // Name of the question starts right after the header
        packet.insert(packet.end(), query.begin() + 12, query.begin() + 12 + 34);
    }

    PutU16(packet, netbios::kNodeStatusType);
    PutU16(packet, netbios::kInternetClass);
    PutU16(packet, 0);
    PutU16(packet, 0);

    const std::size_t statistics = 6 + 40;
    PutU16(packet, static_cast<std::uint16_t>(1 + entries.size() * 18 + statistics));
    packet.push_back(static_cast<std::uint8_t>(entries.size()));
    for (const auto& entry : entries) {
        PutEntry(packet, entry.name, entry.suffix, entry.flags);
    }
    packet.insert(packet.end(), statistics, 0);
    return packet;
}

}

TEST(NetBiosQuery, EncodesWildcardNodeStatusRequest) {
    const auto packet = netbios::EncodeStatusQuery(0x1234);
    ASSERT_EQ(packet.size(), 50u);

    EXPECT_EQ(packet[0], 0x12);
    EXPECT_EQ(packet[1], 0x34);
    EXPECT_EQ(packet[2], 0x00);
    EXPECT_EQ(packet[3], 0x00);
    EXPECT_EQ(packet[5], 1);  // one question

    EXPECT_EQ(packet[12], 32);
    // '*' = 0x2A -> 'C' 'K', NUL padding -> 'A' 'A'
    EXPECT_EQ(packet[13], 'C');
    EXPECT_EQ(packet[14], 'K');
    for (std::size_t i = 15; i < 45; ++i) {
        EXPECT_EQ(packet[i], 'A') << "at offset " << i;
    }
    EXPECT_EQ(packet[45], 0);

    EXPECT_EQ(packet[46], 0x00);
    EXPECT_EQ(packet[47], 0x21);
    EXPECT_EQ(packet[48], 0x00);
    EXPECT_EQ(packet[49], 0x01);
}

TEST(NetBiosResponse, ParsesNameTable) {
    const auto packet = MakeResponse(0x0101, {
        {"WORKGROUP", 0x00, 0x8400},
        {"DESKTOP-42", 0x00, 0x0400},
        {"DESKTOP-42", 0x20, 0x0400},
    });

    const auto entries = netbios::ParseStatusResponse(packet.data(), packet.size(), 0x0101);
    ASSERT_TRUE(entries.has_value());
    ASSERT_EQ(entries->size(), 3u);
    EXPECT_EQ((*entries)[0].name, "WORKGROUP");
    EXPECT_TRUE((*entries)[0].IsGroup());
    EXPECT_EQ((*entries)[1].name, "DESKTOP-42");
    EXPECT_FALSE((*entries)[1].IsGroup());
    EXPECT_EQ((*entries)[2].suffix, 0x20);

    EXPECT_EQ(netbios::MachineName(*entries), "DESKTOP-42");
}

TEST(NetBiosResponse, AcceptsCompressedAnswerName) {
    const auto packet = MakeResponse(7, {{"NAS", 0x00, 0x0400}}, true);
    const auto entries = netbios::ParseStatusResponse(packet.data(), packet.size(), 7);
    ASSERT_TRUE(entries.has_value());
    EXPECT_EQ(netbios::MachineName(*entries), "NAS");
}

TEST(NetBiosResponse, RejectsOtherTransaction) {
    const auto packet = MakeResponse(7, {{"NAS", 0x00, 0x0400}});
    EXPECT_FALSE(netbios::ParseStatusResponse(packet.data(), packet.size(), 8).has_value());
}

TEST(NetBiosResponse, RejectsErrorResponse) {
    const auto packet = MakeResponse(7, {{"NAS", 0x00, 0x0400}}, false, 0x8403);
    EXPECT_FALSE(netbios::ParseStatusResponse(packet.data(), packet.size(), 7).has_value());
}

TEST(NetBiosResponse, RejectsOurOwnQuery) {
    const auto packet = netbios::EncodeStatusQuery(9);
    EXPECT_FALSE(netbios::ParseStatusResponse(packet.data(), packet.size(), 9).has_value());
}

TEST(NetBiosResponse, RejectsTruncatedPacket) {
    auto packet = MakeResponse(7, {{"NAS", 0x00, 0x0400}, {"NAS", 0x20, 0x0400}});
    packet.resize(packet.size() - 60);
    EXPECT_FALSE(netbios::ParseStatusResponse(packet.data(), packet.size(), 7).has_value());
    EXPECT_FALSE(netbios::ParseStatusResponse(packet.data(), 5, 7).has_value());
    EXPECT_FALSE(netbios::ParseStatusResponse(nullptr, 0, 7).has_value());
}

TEST(NetBiosResponse, NoMachineNameWithoutUniqueWorkstationEntry) {
    std::vector<netbios::NameEntry> entries;
    netbios::NameEntry group;
    group.name = "WORKGROUP";
    group.suffix = 0x00;
    group.flags = 0x8000;
    entries.push_back(group);

    netbios::NameEntry server;
    server.name = "FILES";
    server.suffix = 0x20;
    entries.push_back(server);

    EXPECT_FALSE(netbios::MachineName(entries).has_value());
}
