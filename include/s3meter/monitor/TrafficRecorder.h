#pragma once

#include <chrono>
#include <string>

#include "s3meter/common/Config.h"
#include "s3meter/monitor/AddressResolver.h"
#include "s3meter/monitor/MetricsSink.h"
#include "s3meter/network/PrefixSet.h"
#include "s3meter/protocol/HttpRequest.h"
#include "s3meter/protocol/S3Path.h"

namespace s3meter {
namespace monitor {

// Environment variable naming the internal networks; wins over the config file.
constexpr const char* kInternalCidrsEnv = "S3_INTERNAL_CIDRS";

// Builds the internal network set from $S3_INTERNAL_CIDRS or [traffic] internal_cidrs.
// Returns nullptr when neither names a valid prefix.
network::PrefixSetPtr LoadInternalNetworks(const common::Config& conf);

// Byte and first-byte accounting called from inside S3 handlers.
// Sent bytes are split into total and external (client outside the internal
// networks), so egress can be billed only for externally routed traffic.
class TrafficRecorder {
public:
    TrafficRecorder(MetricsSink* sink,
                    network::PrefixSetPtr internal,
                    AddressResolver resolver = AddressResolver(),
                    protocol::BucketExtractor extractor = protocol::ExtractBucketAndObject);

    void TimeToFirstByte(const std::string& action,
                         std::chrono::steady_clock::time_point start,
                         const protocol::HttpRequest& req) const;
    void BytesReceived(long long n, const protocol::HttpRequest& req) const;
    void BytesSent(long long n, const protocol::HttpRequest& req) const;

    bool IsInternal(const protocol::HttpRequest& req) const;

    // Swaps the internal network snapshot; readers never block.
    void SetInternalNetworks(network::PrefixSetPtr internal);
    network::PrefixSetPtr InternalNetworks() const;

private:
    MetricsSink* sink_;
    network::PrefixSetPtr internal_;
    AddressResolver resolver_;
    protocol::BucketExtractor extractor_;
};

} // namespace monitor
} // namespace s3meter
