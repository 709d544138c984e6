#include "s3meter/monitor/TrafficRecorder.h"
#include "s3meter/common/Logger.h"

#include <atomic>
#include <memory>
#include <utility>

namespace s3meter {
namespace monitor {

network::PrefixSetPtr LoadInternalNetworks(const common::Config& conf) {
    const std::string raw = conf.GetStringEnv("traffic", "internal_cidrs", kInternalCidrsEnv);
    network::PrefixSetPtr set = network::PrefixSet::Build(raw);
    if (set) {
        LOG_INFO << "Internal networks: " << set->prefixes().size() << " prefix(es) " << set->toString();
    } else {
        LOG_INFO << "No internal networks configured, all traffic counts as external";
    }
    return set;
}

TrafficRecorder::TrafficRecorder(MetricsSink* sink,
                                 network::PrefixSetPtr internal,
                                 AddressResolver resolver,
                                 protocol::BucketExtractor extractor)
    : sink_(sink),
      internal_(std::move(internal)),
      resolver_(resolver),
      extractor_(std::move(extractor)) {}

void TrafficRecorder::SetInternalNetworks(network::PrefixSetPtr internal) {
    std::atomic_store(&internal_, std::move(internal));
}

network::PrefixSetPtr TrafficRecorder::InternalNetworks() const {
    return std::atomic_load(&internal_);
}

bool TrafficRecorder::IsInternal(const protocol::HttpRequest& req) const {
    return network::PrefixSet::Contains(InternalNetworks(), resolver_.ClientAddress(req));
}

void TrafficRecorder::TimeToFirstByte(const std::string& action,
                                      std::chrono::steady_clock::time_point start,
                                      const protocol::HttpRequest& req) const {
    const std::string bucket = protocol::BucketOf(extractor_, req);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    const double ms = static_cast<double>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    sink_->ObserveTimeToFirstByteMs(action, bucket, ms);
    sink_->RecordBucketActive(bucket);
}

void TrafficRecorder::BytesReceived(long long n, const protocol::HttpRequest& req) const {
    const std::string bucket = protocol::BucketOf(extractor_, req);
    sink_->RecordBucketActive(bucket);
    if (n <= 0) return;
    sink_->AddBytesReceived(bucket, n);
}

void TrafficRecorder::BytesSent(long long n, const protocol::HttpRequest& req) const {
    const std::string bucket = protocol::BucketOf(extractor_, req);
    sink_->RecordBucketActive(bucket);
    if (n <= 0) return;
    if (!IsInternal(req)) {
        sink_->AddExternalBytesSent(bucket, n);
    }
    sink_->AddBytesSent(bucket, n);
}

} // namespace monitor
} // namespace s3meter
