#include "service_finder/service_name.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

#include <fmt/format.h>

namespace service_finder
{

namespace
{

constexpr std::string_view kTcpTrailer = "._tcp.local.";
constexpr std::string_view kUdpTrailer = "._udp.local.";
constexpr std::string_view kLocalTrailer = ".local.";

constexpr std::size_t kMaxNameLength = 256;
constexpr std::size_t kMaxServiceLabelLength = 15;
constexpr std::size_t kMaxInstanceLength = 63;

bool EndsWith(std::string_view str, std::string_view suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Same semantics as splitting on every '.', empty pieces are kept
std::vector<std::string> SplitLabels(std::string_view str)
{
    std::vector<std::string> labels;
    std::size_t start = 0;
    while (true) {
        const auto dot = str.find('.', start);
        if (dot == std::string_view::npos) {
            labels.emplace_back(str.substr(start));
            break;
        }
        labels.emplace_back(str.substr(start, dot - start));
        start = dot + 1;
    }
    return labels;
}

void CheckServiceLabel(std::string_view service_name, bool strict)
{
    if (service_name.front() != '_') {
        throw BadTypeInNameError(fmt::format("Service name ({}) must start with '_'", service_name));
    }

    const std::string_view label = service_name.substr(1);
    if (strict && label.size() > kMaxServiceLabelLength) {
        throw BadTypeInNameError(fmt::format("Service name ({}) must be <= {} bytes", label, kMaxServiceLabelLength));
    }
    if (label.find("--") != std::string_view::npos) {
        throw BadTypeInNameError(fmt::format("Service name ({}) must not contain '--'", label));
    }
    const bool has_letter = std::any_of(label.begin(), label.end(), [](char c) {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    });
    if (!has_letter) {
        throw BadTypeInNameError(fmt::format("Service name ({}) must contain at least one letter (eg: 'A-Z')", label));
    }
    if (label.front() == '-' || label.back() == '-') {
        throw BadTypeInNameError(fmt::format("Service name ({}) may not start or end with '-'", label));
    }
    const bool allowed = std::all_of(label.begin(), label.end(), [strict](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || (!strict && c == '_');
    });
    if (!allowed) {
        throw BadTypeInNameError(fmt::format(
            "Service name ({}) must contain only these characters: A-Z, a-z, 0-9, hyphen ('-'){}", label,
            strict ? "" : ", underscore ('_')"));
    }
}

}

std::string NormalizeName(std::string_view name)
{
    std::string normalized(name);
    if (normalized.empty() || normalized.back() != '.') {
        normalized += '.';
    }
    return normalized;
}

std::string ServiceTypeName(std::string_view name, bool strict)
{
    if (name.size() > kMaxNameLength) {
        throw BadTypeInNameError(fmt::format("Full name ({}) must be <= {} bytes", name, kMaxNameLength));
    }

    std::vector<std::string> remaining;
    std::string trailer;
    bool has_protocol = false;
    if (EndsWith(name, kTcpTrailer) || EndsWith(name, kUdpTrailer)) {
        remaining = SplitLabels(name.substr(0, name.size() - kTcpTrailer.size()));
        trailer = std::string(name.substr(name.size() - kTcpTrailer.size()));
        has_protocol = true;
    } else if (strict) {
        throw BadTypeInNameError(
            fmt::format("Type '{}' must end with '{}' or '{}'", name, kTcpTrailer, kUdpTrailer));
    } else if (EndsWith(name, kLocalTrailer)) {
        remaining = SplitLabels(name.substr(0, name.size() - kLocalTrailer.size()));
        trailer = std::string(kLocalTrailer.substr(1));
    } else {
        throw BadTypeInNameError(fmt::format("Type '{}' must end with '{}'", name, kLocalTrailer));
    }

    std::string service_name;
    if (has_protocol) {
        service_name = remaining.back();
        remaining.pop_back();
        if (service_name.empty()) {
            throw BadTypeInNameError(fmt::format("No Service name found in '{}'", name));
        }
        if (remaining.size() == 1 && remaining.front().empty()) {
            throw BadTypeInNameError(fmt::format("Type '{}' must not start with '.'", name));
        }
        CheckServiceLabel(service_name, strict);
        service_name += '.';
    }

    if (!remaining.empty() && remaining.back() == "_sub") {
        remaining.pop_back();
        if (remaining.empty() || remaining.front().empty()) {
            throw BadTypeInNameError(fmt::format("_sub requires a subtype name in '{}'", name));
        }
    }

    if (!remaining.empty()) {
        std::string instance = remaining.front();
        for (std::size_t i = 1; i < remaining.size(); ++i) {
            instance += '.';
            instance += remaining[i];
        }
        if (instance.size() > kMaxInstanceLength) {
            throw BadTypeInNameError(fmt::format("Too long: '{}'", instance));
        }
        const bool has_control = std::any_of(instance.begin(), instance.end(), [](char c) {
            const auto uc = static_cast<unsigned char>(c);
            return uc < 0x20 || uc == 0x7f;
        });
        if (has_control) {
            throw BadTypeInNameError(
                fmt::format("Ascii control character 0x00-0x1F and 0x7F illegal in '{}'", instance));
        }
    }

    // "_http." + "_tcp.local." with the leading dot of the trailer dropped
    if (has_protocol) {
        return service_name + trailer.substr(1);
    }
    return trailer;
}

std::string CacheKey(std::string_view name)
{
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return key;
}

std::string Ipv4ToString(const Ipv4Address& address)
{
    struct in_addr addr;
    std::memcpy(&addr.s_addr, address.data(), address.size());
    char buffer[INET_ADDRSTRLEN] = {0};
    if (inet_ntop(AF_INET, &addr, buffer, sizeof(buffer)) == nullptr) {
        return fmt::format("{}.{}.{}.{}", address[0], address[1], address[2], address[3]);
    }
    return buffer;
}

}
