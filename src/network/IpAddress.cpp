#include "s3meter/network/IpAddress.h"

#include <arpa/inet.h>
#include <cstring>

namespace s3meter {
namespace network {

IpAddress IpAddress::FromV4(std::uint32_t hostOrder) {
    IpAddress a;
    a.family_ = kV4;
    a.bytes_[0] = static_cast<std::uint8_t>(hostOrder >> 24);
    a.bytes_[1] = static_cast<std::uint8_t>(hostOrder >> 16);
    a.bytes_[2] = static_cast<std::uint8_t>(hostOrder >> 8);
    a.bytes_[3] = static_cast<std::uint8_t>(hostOrder);
    return a;
}

IpAddress IpAddress::FromBytes(Family family, const std::uint8_t* bytes) {
    IpAddress a;
    if (!bytes || family == kInvalid) return a;
    a.family_ = family;
    std::memcpy(a.bytes_.data(), bytes, family == kV4 ? 4 : 16);
    return a;
}

IpAddress IpAddress::Parse(const std::string& text) {
    IpAddress a;
    if (text.empty()) return a;

    in_addr v4;
    if (::inet_pton(AF_INET, text.c_str(), &v4) == 1) {
        a.family_ = kV4;
        std::memcpy(a.bytes_.data(), &v4.s_addr, 4);
        return a;
    }

    std::string s = text;
    auto pct = s.find('%');
    if (pct != std::string::npos) {
        if (pct == 0 || pct + 1 == s.size()) return a;
        s.resize(pct);
    }
    in6_addr v6;
    if (::inet_pton(AF_INET6, s.c_str(), &v6) == 1) {
        a.family_ = kV6;
        std::memcpy(a.bytes_.data(), v6.s6_addr, 16);
    }
    return a;
}

bool IpAddress::SplitHostPort(const std::string& text, std::string* host, std::string* port) {
    if (text.empty()) return false;
    std::string h, p;
    if (text[0] == '[') {
        auto close = text.find(']');
        if (close == std::string::npos) return false;
        if (close + 1 >= text.size() || text[close + 1] != ':') return false;
        h = text.substr(1, close - 1);
        p = text.substr(close + 2);
    } else {
        auto colon = text.rfind(':');
        if (colon == std::string::npos) return false;
        // More than one colon without brackets is a bare IPv6 literal, not host:port.
        if (text.find(':') != colon) return false;
        h = text.substr(0, colon);
        p = text.substr(colon + 1);
    }
    if (p.empty()) return false;
    for (char c : p) {
        if (c < '0' || c > '9') return false;
    }
    if (host) *host = h;
    if (port) *port = p;
    return true;
}

IpAddress IpAddress::ParseHostPort(const std::string& text) {
    std::string host;
    if (SplitHostPort(text, &host, nullptr)) {
        return Parse(host);
    }
    // "[::1]" without a port.
    if (text.size() > 2 && text.front() == '[' && text.back() == ']') {
        return Parse(text.substr(1, text.size() - 2));
    }
    return Parse(text);
}

bool IpAddress::isV4Mapped() const {
    if (family_ != kV6) return false;
    for (int i = 0; i < 10; ++i) {
        if (bytes_[i] != 0) return false;
    }
    return bytes_[10] == 0xff && bytes_[11] == 0xff;
}

IpAddress IpAddress::Unmap() const {
    if (!isV4Mapped()) return *this;
    return FromBytes(kV4, bytes_.data() + 12);
}

std::uint32_t IpAddress::v4() const {
    if (family_ != kV4) return 0;
    return (static_cast<std::uint32_t>(bytes_[0]) << 24) |
           (static_cast<std::uint32_t>(bytes_[1]) << 16) |
           (static_cast<std::uint32_t>(bytes_[2]) << 8) |
           static_cast<std::uint32_t>(bytes_[3]);
}

std::string IpAddress::toString() const {
    char buf[INET6_ADDRSTRLEN] = "";
    if (family_ == kV4) {
        ::inet_ntop(AF_INET, bytes_.data(), buf, sizeof buf);
    } else if (family_ == kV6) {
        ::inet_ntop(AF_INET6, bytes_.data(), buf, sizeof buf);
    } else {
        return "invalid";
    }
    return buf;
}

} // namespace network
} // namespace s3meter
