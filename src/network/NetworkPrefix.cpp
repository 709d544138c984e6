#include "s3meter/network/NetworkPrefix.h"

#include <cstdint>
#include <cstring>

namespace s3meter {
namespace network {

namespace {

// Zero (or set, when `fill` is true) every bit past `length`.
void ApplyMask(std::uint8_t* bytes, std::size_t size, int length, bool fill) {
    for (std::size_t i = 0; i < size; ++i) {
        int bitsHere = length - static_cast<int>(i) * 8;
        std::uint8_t keep;
        if (bitsHere >= 8) {
            keep = 0xff;
        } else if (bitsHere <= 0) {
            keep = 0x00;
        } else {
            keep = static_cast<std::uint8_t>(0xff << (8 - bitsHere));
        }
        bytes[i] = fill ? static_cast<std::uint8_t>(bytes[i] | ~keep)
                        : static_cast<std::uint8_t>(bytes[i] & keep);
    }
}

bool ParseLength(const std::string& s, int maxBits, int* out) {
    if (s.empty() || s.size() > 3) return false;
    if (s.size() > 1 && s[0] == '0') return false;
    int v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    if (v > maxBits) return false;
    *out = v;
    return true;
}

} // namespace

NetworkPrefix::NetworkPrefix(const IpAddress& addr, int length) : length_(0) {
    if (!addr.valid()) return;
    const int maxBits = static_cast<int>(addr.size()) * 8;
    if (length < 0) length = 0;
    if (length > maxBits) length = maxBits;

    std::uint8_t buf[16];
    std::memcpy(buf, addr.bytes(), addr.size());
    ApplyMask(buf, addr.size(), length, false);
    addr_ = IpAddress::FromBytes(addr.family(), buf);
    length_ = length;
}

bool NetworkPrefix::Parse(const std::string& text, NetworkPrefix* out) {
    if (!out) return false;
    auto slash = text.find('/');
    if (slash == std::string::npos) return false;

    const std::string ipPart = text.substr(0, slash);
    if (ipPart.find('%') != std::string::npos) return false;
    IpAddress ip = IpAddress::Parse(ipPart);
    if (!ip.valid()) return false;

    int length = 0;
    if (!ParseLength(text.substr(slash + 1), static_cast<int>(ip.size()) * 8, &length)) return false;

    if (ip.isV4Mapped() && length >= 96) {
        *out = NetworkPrefix(ip.Unmap(), length - 96);
    } else {
        *out = NetworkPrefix(ip, length);
    }
    return true;
}

bool NetworkPrefix::Contains(const IpAddress& a) const {
    if (!valid() || !a.valid()) return false;
    if (a.family() == addr_.family() && NetworkPrefix(a, length_).addr_ == addr_) return true;
    if (a.isV4Mapped() && addr_.isV4()) return NetworkPrefix(a.Unmap(), length_).addr_ == addr_;
    return false;
}

IpAddress NetworkPrefix::Last() const {
    if (!valid()) return IpAddress();
    std::uint8_t buf[16];
    std::memcpy(buf, addr_.bytes(), addr_.size());
    ApplyMask(buf, addr_.size(), length_, true);
    return IpAddress::FromBytes(addr_.family(), buf);
}

std::string NetworkPrefix::toString() const {
    if (!valid()) return "invalid";
    return addr_.toString() + "/" + std::to_string(length_);
}

} // namespace network
} // namespace s3meter
