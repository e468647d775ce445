#include "service_finder/netbios.hpp"
#include "service_finder/name_resolver.hpp"
#include "service_finder/log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>

#include <fmt/format.h>

namespace service_finder
{
namespace netbios
{

namespace
{

constexpr std::size_t kHeaderSize = 12;
constexpr std::size_t kEncodedNameLength = 32;
constexpr std::size_t kNameEntrySize = 18;
constexpr std::size_t kNetBiosNameLength = 15;

std::uint16_t ReadU16(const std::uint8_t* data)
{
    return static_cast<std::uint16_t>((data[0] << 8) | data[1]);
}

void WriteU16(std::vector<std::uint8_t>& out, std::uint16_t value)
{
    out.push_back(static_cast<std::uint8_t>(value >> 8));
    out.push_back(static_cast<std::uint8_t>(value & 0xff));
}

// Skips a possibly compressed DNS name, returns false if it runs off the packet
bool SkipName(const std::uint8_t* data, std::size_t size, std::size_t& offset)
{
    while (offset < size) {
        const std::uint8_t length = data[offset];
        if (length == 0) {
            ++offset;
            return true;
        }
        if ((length & 0xc0) == 0xc0) {
            offset += 2;
            return offset <= size;
        }
        offset += 1 + length;
    }
    return false;
}

}

std::vector<std::uint8_t> EncodeStatusQuery(std::uint16_t transaction_id)
{
    std::vector<std::uint8_t> packet;
    packet.reserve(kHeaderSize + 2 + kEncodedNameLength + 4);

    WriteU16(packet, transaction_id);
    WriteU16(packet, 0x0000); // query, no recursion
    WriteU16(packet, 1); // questions
    WriteU16(packet, 0);
    WriteU16(packet, 0);
    WriteU16(packet, 0);

    // "*" padded with NULs, first-level encoded as two 'A'-based nibbles per byte
    std::array<std::uint8_t, 16> raw{};
    raw[0] = '*';
    packet.push_back(static_cast<std::uint8_t>(kEncodedNameLength));
    for (const auto byte : raw) {
        packet.push_back(static_cast<std::uint8_t>('A' + (byte >> 4)));
        packet.push_back(static_cast<std::uint8_t>('A' + (byte & 0x0f)));
    }
    packet.push_back(0);

    WriteU16(packet, kNodeStatusType);
    WriteU16(packet, kInternetClass);
    return packet;
}

std::optional<std::vector<NameEntry>> ParseStatusResponse(const std::uint8_t* data, std::size_t size,
                                                          std::uint16_t transaction_id)
{
    if (data == nullptr || size < kHeaderSize) {
        return std::nullopt;
    }
    if (ReadU16(data) != transaction_id) {
        return std::nullopt;
    }
    const std::uint16_t flags = ReadU16(data + 2);
    if ((flags & 0x8000) == 0 || (flags & 0x000f) != 0) {
        // Not a response, or an error rcode
        return std::nullopt;
    }
    if (ReadU16(data + 6) == 0) {
        return std::nullopt;
    }

    std::size_t offset = kHeaderSize;
    if (!SkipName(data, size, offset)) {
        return std::nullopt;
    }
    // type, class, ttl, rdlength
    if (offset + 10 > size) {
        return std::nullopt;
    }
    if (ReadU16(data + offset) != kNodeStatusType) {
        return std::nullopt;
    }
    const std::uint16_t rdlength = ReadU16(data + offset + 8);
    offset += 10;
    if (rdlength < 1 || offset + rdlength > size) {
        return std::nullopt;
    }

    const std::size_t count = data[offset++];
    if (offset + count * kNameEntrySize > size) {
        return std::nullopt;
    }

    std::vector<NameEntry> entries;
    entries.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* entry = data + offset + i * kNameEntrySize;
        NameEntry name_entry;
        name_entry.name.assign(reinterpret_cast<const char*>(entry), kNetBiosNameLength);
        const auto last = name_entry.name.find_last_not_of(std::string(" \0", 2));
        name_entry.name.erase(last == std::string::npos ? 0 : last + 1);
        name_entry.suffix = entry[kNetBiosNameLength];
        name_entry.flags = ReadU16(entry + kNetBiosNameLength + 1);
        entries.push_back(std::move(name_entry));
    }
    return entries;
}

std::optional<std::string> MachineName(const std::vector<NameEntry>& entries)
{
    for (const auto& entry : entries) {
        if (entry.suffix == 0x00 && !entry.IsGroup() && !entry.name.empty()) {
            return entry.name;
        }
    }
    return std::nullopt;
}

}

namespace
{

// Closes the query socket on every way out of Resolve()
class ScopedSocket
{
public:
    ScopedSocket()
    : m_fd(::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP))
    {
        if (m_fd < 0) {
            throw std::system_error(errno, std::generic_category(), "NetBIOS socket");
        }
    }

    ~ScopedSocket()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }

    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;

    [[nodiscard]] int Get() const { return m_fd; }

private:
    int m_fd;
};

std::uint16_t NextTransactionId()
{
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> distribution(1, 0xffff);
    return static_cast<std::uint16_t>(distribution(generator));
}

}

NetBiosStrategy::NetBiosStrategy(std::chrono::milliseconds timeout)
: m_timeout(timeout)
{}

std::optional<std::string> NetBiosStrategy::Resolve(const std::string& address)
{
    struct sockaddr_in target;
    std::memset(&target, 0, sizeof(target));
    target.sin_family = AF_INET;
    target.sin_port = htons(netbios::kPort);
    if (inet_pton(AF_INET, address.c_str(), &target.sin_addr) != 1) {
        throw std::invalid_argument(fmt::format("'{}' is not an IPv4 address", address));
    }

    ScopedSocket sock;
    const std::uint16_t transaction_id = NextTransactionId();
    const auto query = netbios::EncodeStatusQuery(transaction_id);
    if (::sendto(sock.Get(), query.data(), query.size(), 0, reinterpret_cast<const struct sockaddr*>(&target),
                 sizeof(target)) < 0) {
        throw std::system_error(errno, std::generic_category(), "NetBIOS send");
    }

    const auto deadline = std::chrono::steady_clock::now() + m_timeout;
    std::array<std::uint8_t, 1024> buffer;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw std::runtime_error(fmt::format("timed out after {} ms", m_timeout.count()));
        }

        struct pollfd pfd;
        pfd.fd = sock.Get();
        pfd.events = POLLIN;
        pfd.revents = 0;
        const int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category(), "NetBIOS poll");
        }
        if (ready == 0) {
            continue;
        }

        struct sockaddr_in from;
        socklen_t fromlen = sizeof(from);
        const ssize_t received = ::recvfrom(sock.Get(), buffer.data(), buffer.size(), 0,
                                            reinterpret_cast<struct sockaddr*>(&from), &fromlen);
        if (received < 0) {
            throw std::system_error(errno, std::generic_category(), "NetBIOS receive");
        }
        if (from.sin_addr.s_addr != target.sin_addr.s_addr) {
            continue;
        }

        const auto entries = netbios::ParseStatusResponse(buffer.data(), static_cast<std::size_t>(received),
                                                          transaction_id);
        if (!entries) {
            continue;
        }
        return netbios::MachineName(*entries);
    }
}

bool NetBiosAvailable()
{
#ifdef SERVICE_FINDER_WITH_NETBIOS
    const int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd < 0) {
        Log(LogLevel::Debug, fmt::format("Cannot open a UDP socket for NetBIOS: {}", std::strerror(errno)));
        return false;
    }
    ::close(fd);
    return true;
#else
    return false;
#endif
}

}
