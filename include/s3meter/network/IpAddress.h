#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace s3meter {
namespace network {

// IPv4 or IPv6 address, or the invalid sentinel (default constructed).
// Bytes are kept in network order; IPv4 uses the first 4 bytes.
class IpAddress {
public:
    enum Family { kInvalid, kV4, kV6 };

    IpAddress() : family_(kInvalid), bytes_{} {}

    static IpAddress FromV4(std::uint32_t hostOrder);
    static IpAddress FromBytes(Family family, const std::uint8_t* bytes);

    // Literal address only ("10.0.0.1", "::1"). An IPv6 zone suffix ("%eth0") is dropped.
    static IpAddress Parse(const std::string& text);

    // Strips an optional port ("1.2.3.4:80", "[::1]:80") and parses the host part.
    // A bare IPv6 literal without brackets is parsed as-is.
    static IpAddress ParseHostPort(const std::string& text);

    // Returns the host part of "host:port" / "[host]:port"; false when there is no port suffix.
    static bool SplitHostPort(const std::string& text, std::string* host, std::string* port);

    bool valid() const { return family_ != kInvalid; }
    Family family() const { return family_; }
    bool isV4() const { return family_ == kV4; }
    bool isV6() const { return family_ == kV6; }

    // "::ffff:a.b.c.d"
    bool isV4Mapped() const;
    // The embedded IPv4 address for a mapped address, otherwise a copy of *this.
    IpAddress Unmap() const;

    std::size_t size() const { return family_ == kV4 ? 4 : (family_ == kV6 ? 16 : 0); }
    const std::uint8_t* bytes() const { return bytes_.data(); }
    std::uint32_t v4() const;

    std::string toString() const;

    bool operator==(const IpAddress& o) const { return family_ == o.family_ && bytes_ == o.bytes_; }
    bool operator!=(const IpAddress& o) const { return !(*this == o); }
    bool operator<(const IpAddress& o) const {
        if (family_ != o.family_) return family_ < o.family_;
        return bytes_ < o.bytes_;
    }

private:
    Family family_;
    std::array<std::uint8_t, 16> bytes_;
};

} // namespace network
} // namespace s3meter
