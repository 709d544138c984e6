#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "s3meter/common/noncopyable.h"
#include "s3meter/monitor/MetricsSink.h"

namespace s3meter {
namespace monitor {

// In-process MetricsSink. Every series value is a relaxed atomic; the family
// mutex is only taken to find or create a series. Each family keeps at most
// kMaxSeries label combinations, further ones are folded into an "OTHER" series.
class Stats : public MetricsSink, common::noncopyable {
public:
    using Labels = std::vector<std::string>;

    static constexpr const char* kInFlight = "s3meter_request_in_flight";
    static constexpr const char* kRequestSeconds = "s3meter_request_seconds";
    static constexpr const char* kRequestTotal = "s3meter_request_total";
    static constexpr const char* kReadTotal = "s3meter_bucket_read_total";
    static constexpr const char* kWriteTotal = "s3meter_bucket_write_total";
    static constexpr const char* kOtherTotal = "s3meter_bucket_other_total";
    static constexpr const char* kTimeToFirstByte = "s3meter_time_to_first_byte_millisecond";
    static constexpr const char* kReceivedBytes = "s3meter_bucket_received_bytes_total";
    static constexpr const char* kSentBytes = "s3meter_bucket_sent_bytes_total";
    static constexpr const char* kExternalSentBytes = "s3meter_bucket_external_sent_bytes_total";
    static constexpr const char* kBucketLastActive = "s3meter_bucket_last_active_seconds";

    static constexpr size_t kMaxSeries = 1024;

    static Stats& Instance();

    Stats();
    ~Stats() override;

    void IncInFlight(const std::string& action) override;
    void DecInFlight(const std::string& action) override;
    void ObserveRequestSeconds(const std::string& action, const std::string& bucket, double seconds) override;
    void IncRequest(const std::string& action, int status, const std::string& bucket) override;
    void IncRead(const std::string& bucket) override;
    void IncWrite(const std::string& bucket) override;
    void IncOther(const std::string& bucket) override;
    void ObserveTimeToFirstByteMs(const std::string& action, const std::string& bucket, double ms) override;
    void AddBytesReceived(const std::string& bucket, long long n) override;
    void AddBytesSent(const std::string& bucket, long long n) override;
    void AddExternalBytesSent(const std::string& bucket, long long n) override;
    void RecordBucketActive(const std::string& bucket) override;

    // Current value of a counter or gauge series; 0 when it was never touched.
    long long Value(const std::string& metric, const Labels& labels) const;
    unsigned long long HistogramCount(const std::string& metric, const Labels& labels) const;
    double HistogramSum(const std::string& metric, const Labels& labels) const;
    // Unix seconds of the last activity on the bucket, 0 if never seen.
    long long BucketLastActive(const std::string& bucket) const;

    // Prometheus text exposition format.
    std::string ToPrometheus() const;
    // Compact per-bucket billing summary.
    std::string ToJson() const;

    // Zeroes every counter and histogram in place. Series stay registered and
    // the in-flight gauge is left alone, since requests may still be running.
    void Reset();

private:
    struct ScalarFamily;
    struct HistogramFamily;

    const ScalarFamily* FindScalar(const std::string& metric) const;
    const HistogramFamily* FindHistogram(const std::string& metric) const;

    std::chrono::system_clock::time_point startTime_;

    std::unique_ptr<ScalarFamily> inFlight_;
    std::unique_ptr<ScalarFamily> requests_;
    std::unique_ptr<ScalarFamily> reads_;
    std::unique_ptr<ScalarFamily> writes_;
    std::unique_ptr<ScalarFamily> others_;
    std::unique_ptr<ScalarFamily> received_;
    std::unique_ptr<ScalarFamily> sent_;
    std::unique_ptr<ScalarFamily> externalSent_;
    std::unique_ptr<ScalarFamily> lastActive_;
    std::unique_ptr<HistogramFamily> requestSeconds_;
    std::unique_ptr<HistogramFamily> ttfb_;
};

} // namespace monitor
} // namespace s3meter
