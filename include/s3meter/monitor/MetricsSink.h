#pragma once

#include <string>

namespace s3meter {
namespace monitor {

// Write-only recording interface for request accounting.
// Implementations must tolerate concurrent calls from any request thread.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void IncInFlight(const std::string& action) = 0;
    virtual void DecInFlight(const std::string& action) = 0;

    virtual void ObserveRequestSeconds(const std::string& action, const std::string& bucket, double seconds) = 0;
    virtual void IncRequest(const std::string& action, int status, const std::string& bucket) = 0;

    virtual void IncRead(const std::string& bucket) = 0;
    virtual void IncWrite(const std::string& bucket) = 0;
    virtual void IncOther(const std::string& bucket) = 0;

    virtual void ObserveTimeToFirstByteMs(const std::string& action, const std::string& bucket, double ms) = 0;
    virtual void AddBytesReceived(const std::string& bucket, long long n) = 0;
    virtual void AddBytesSent(const std::string& bucket, long long n) = 0;
    virtual void AddExternalBytesSent(const std::string& bucket, long long n) = 0;

    virtual void RecordBucketActive(const std::string& bucket) = 0;
};

} // namespace monitor
} // namespace s3meter
