#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "s3meter/network/IpAddress.h"
#include "s3meter/network/NetworkPrefix.h"

namespace s3meter {
namespace network {

class PrefixSet;
using PrefixSetPtr = std::shared_ptr<const PrefixSet>;

// Immutable set of networks. Overlapping prefixes are merged into disjoint
// sorted ranges at build time; lookups are a binary search per family.
// Safe for concurrent readers without locking.
class PrefixSet {
public:
    // Called once for every token that is not a valid "addr/len".
    using WarnFn = std::function<void(const std::string& token)>;

    // Tokens are separated by any of ", \t\n\r;". Invalid tokens are skipped.
    // Returns nullptr when the text holds no valid prefix.
    // Without a warn callback, skipped tokens are logged at WARN level.
    static PrefixSetPtr Build(const std::string& configText, const WarnFn& warn = WarnFn());

    static PrefixSetPtr FromPrefixes(std::vector<NetworkPrefix> prefixes);

    // False for a null set or an invalid address.
    static bool Contains(const PrefixSetPtr& set, const IpAddress& addr) {
        return set && set->Contains(addr);
    }

    bool Contains(const IpAddress& addr) const;

    // Distinct canonical prefixes, sorted.
    const std::vector<NetworkPrefix>& prefixes() const { return prefixes_; }
    bool empty() const { return prefixes_.empty(); }
    std::string toString() const;

private:
    // Only FromPrefixes can name the token, so only it constructs sets.
    struct Token {
        explicit Token() = default;
    };

public:
    PrefixSet(Token, std::vector<NetworkPrefix> prefixes);

private:
    struct Range {
        IpAddress first;
        IpAddress last;
    };

    static std::vector<Range> MergeRanges(const std::vector<NetworkPrefix>& prefixes, IpAddress::Family family);
    static bool Lookup(const std::vector<Range>& ranges, const IpAddress& addr);

    std::vector<NetworkPrefix> prefixes_;
    std::vector<Range> v4_;
    std::vector<Range> v6_;
};

} // namespace network
} // namespace s3meter
