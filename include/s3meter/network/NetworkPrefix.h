#pragma once

#include <string>

#include "s3meter/network/IpAddress.h"

namespace s3meter {
namespace network {

// An IP network in canonical form: host bits are always zero, so
// "10.1.2.3/8" and "10.0.0.0/8" compare equal.
class NetworkPrefix {
public:
    NetworkPrefix() : length_(0) {}
    // Masks `addr` to `length` bits; `length` is clamped to the family width.
    NetworkPrefix(const IpAddress& addr, int length);

    // "addr/len". The length is mandatory, decimal, without sign or leading zeros.
    // IPv4-mapped IPv6 prefixes ("::ffff:10.0.0.0/104") are stored as IPv4.
    static bool Parse(const std::string& text, NetworkPrefix* out);

    bool valid() const { return addr_.valid(); }
    const IpAddress& address() const { return addr_; }
    int length() const { return length_; }

    bool Contains(const IpAddress& a) const;

    // First and last address covered by the prefix.
    IpAddress First() const { return addr_; }
    IpAddress Last() const;

    std::string toString() const;

    bool operator==(const NetworkPrefix& o) const { return addr_ == o.addr_ && length_ == o.length_; }
    bool operator!=(const NetworkPrefix& o) const { return !(*this == o); }
    bool operator<(const NetworkPrefix& o) const {
        if (addr_ != o.addr_) return addr_ < o.addr_;
        return length_ < o.length_;
    }

private:
    IpAddress addr_;
    int length_;
};

} // namespace network
} // namespace s3meter
