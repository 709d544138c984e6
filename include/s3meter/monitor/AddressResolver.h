#pragma once

#include <string>

#include "s3meter/common/Config.h"
#include "s3meter/network/IpAddress.h"
#include "s3meter/protocol/HttpRequest.h"

namespace s3meter {
namespace monitor {

// Best-effort client address for accounting.
//
// The first X-Forwarded-For entry wins over the socket peer, because the
// gateway normally runs behind load balancers. Any client can send that
// header, so the result is only fit for metrics and billing, never for
// access decisions.
class AddressResolver {
public:
    struct Policy {
        bool trustForwardedFor{true};
    };

    // [traffic] trust_forwarded_for
    static Policy PolicyFromConfig(const common::Config& conf);

    AddressResolver() = default;
    explicit AddressResolver(Policy policy) : policy_(policy) {}

    // Invalid address when neither source parses.
    network::IpAddress ClientAddress(const protocol::HttpRequest& req) const;

    // First entry of an X-Forwarded-For value, port stripped.
    static network::IpAddress FirstForwardedFor(const std::string& xff);

    const Policy& policy() const { return policy_; }

private:
    Policy policy_;
};

} // namespace monitor
} // namespace s3meter
