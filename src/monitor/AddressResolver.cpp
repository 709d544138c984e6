#include "s3meter/monitor/AddressResolver.h"

#include <cctype>

namespace s3meter {
namespace monitor {

namespace {

std::string TrimCopy(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    size_t j = s.size();
    while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1]))) --j;
    return s.substr(i, j - i);
}

} // namespace

AddressResolver::Policy AddressResolver::PolicyFromConfig(const common::Config& conf) {
    Policy p;
    p.trustForwardedFor = conf.GetBool("traffic", "trust_forwarded_for", true);
    return p;
}

network::IpAddress AddressResolver::FirstForwardedFor(const std::string& xff) {
    // "client, proxy1, proxy2"
    const std::string first = TrimCopy(xff.substr(0, xff.find(',')));
    if (first.empty()) return network::IpAddress();
    return network::IpAddress::ParseHostPort(first);
}

network::IpAddress AddressResolver::ClientAddress(const protocol::HttpRequest& req) const {
    if (policy_.trustForwardedFor) {
        const std::string xff = req.getHeader("X-Forwarded-For");
        if (!xff.empty()) {
            network::IpAddress a = FirstForwardedFor(xff);
            if (a.valid()) return a;
        }
    }
    return network::IpAddress::ParseHostPort(TrimCopy(req.peerAddress()));
}

} // namespace monitor
} // namespace s3meter
