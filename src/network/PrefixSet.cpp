#include "s3meter/network/PrefixSet.h"
#include "s3meter/common/Logger.h"

#include <algorithm>
#include <memory>

namespace s3meter {
namespace network {

namespace {

bool IsSeparator(char c) {
    return c == ',' || c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ';';
}

std::vector<std::string> SplitTokens(const std::string& text) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && IsSeparator(text[i])) ++i;
        size_t j = i;
        while (j < text.size() && !IsSeparator(text[j])) ++j;
        if (j > i) out.push_back(text.substr(i, j - i));
        i = j;
    }
    return out;
}

} // namespace

PrefixSetPtr PrefixSet::Build(const std::string& configText, const WarnFn& warn) {
    std::vector<NetworkPrefix> parsed;
    for (const auto& token : SplitTokens(configText)) {
        NetworkPrefix p;
        if (!NetworkPrefix::Parse(token, &p)) {
            if (warn) {
                warn(token);
            } else {
                LOG_WARN << "Ignoring invalid CIDR entry: " << token;
            }
            continue;
        }
        parsed.push_back(p);
    }
    return FromPrefixes(std::move(parsed));
}

PrefixSetPtr PrefixSet::FromPrefixes(std::vector<NetworkPrefix> prefixes) {
    prefixes.erase(std::remove_if(prefixes.begin(), prefixes.end(),
                                  [](const NetworkPrefix& p) { return !p.valid(); }),
                   prefixes.end());
    if (prefixes.empty()) return nullptr;
    return std::make_shared<const PrefixSet>(Token(), std::move(prefixes));
}

PrefixSet::PrefixSet(Token, std::vector<NetworkPrefix> prefixes) : prefixes_(std::move(prefixes)) {
    std::sort(prefixes_.begin(), prefixes_.end());
    prefixes_.erase(std::unique(prefixes_.begin(), prefixes_.end()), prefixes_.end());
    v4_ = MergeRanges(prefixes_, IpAddress::kV4);
    v6_ = MergeRanges(prefixes_, IpAddress::kV6);
}

std::vector<PrefixSet::Range> PrefixSet::MergeRanges(const std::vector<NetworkPrefix>& prefixes,
                                                     IpAddress::Family family) {
    std::vector<Range> ranges;
    for (const auto& p : prefixes) {
        if (p.address().family() != family) continue;
        ranges.push_back(Range{p.First(), p.Last()});
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const Range& a, const Range& b) { return a.first < b.first; });

    // CIDR blocks either nest or are disjoint, so a single pass suffices.
    std::vector<Range> merged;
    for (const auto& r : ranges) {
        if (!merged.empty() && !(merged.back().last < r.first)) {
            if (merged.back().last < r.last) merged.back().last = r.last;
            continue;
        }
        merged.push_back(r);
    }
    return merged;
}

bool PrefixSet::Lookup(const std::vector<Range>& ranges, const IpAddress& addr) {
    // First range starting after addr; the candidate is the one before it.
    auto it = std::upper_bound(ranges.begin(), ranges.end(), addr,
                               [](const IpAddress& a, const Range& r) { return a < r.first; });
    if (it == ranges.begin()) return false;
    --it;
    return !(it->last < addr);
}

bool PrefixSet::Contains(const IpAddress& addr) const {
    if (!addr.valid()) return false;
    // A mapped address matches its IPv4 form and any IPv6 range covering ::ffff:0:0/96.
    if (addr.isV4Mapped()) return Lookup(v4_, addr.Unmap()) || Lookup(v6_, addr);
    if (addr.isV4()) return Lookup(v4_, addr);
    return Lookup(v6_, addr);
}

std::string PrefixSet::toString() const {
    std::string out;
    for (const auto& p : prefixes_) {
        if (!out.empty()) out += ",";
        out += p.toString();
    }
    return out;
}

} // namespace network
} // namespace s3meter
