#pragma once

#include <functional>
#include <string>

#include "s3meter/common/noncopyable.h"
#include "s3meter/monitor/MetricsSink.h"
#include "s3meter/protocol/HttpRequest.h"
#include "s3meter/protocol/HttpResponse.h"
#include "s3meter/protocol/S3Path.h"

namespace s3meter {
namespace monitor {

using Handler = std::function<void(const protocol::HttpRequest&, protocol::ResponseWriter*)>;

// Holds the in-flight gauge up for one request; released on every exit path.
class ScopedInFlight : common::noncopyable {
public:
    ScopedInFlight(MetricsSink* sink, const std::string& action) : sink_(sink), action_(action) {
        sink_->IncInFlight(action_);
    }
    ~ScopedInFlight() { sink_->DecInFlight(action_); }

private:
    MetricsSink* sink_;
    const std::string& action_;
};

// Wraps S3 handlers with request accounting:
//   - in-flight gauge per action
//   - latency histogram and status-coded request counter per (action, bucket)
//   - one read, write or other billing counter (plus a read for conditional writes)
// The bucket label is blanked for 403 responses. Handler exceptions pass
// through untouched; only the in-flight gauge is settled for them.
class Instrumentation {
public:
    explicit Instrumentation(MetricsSink* sink,
                             protocol::BucketExtractor extractor = protocol::ExtractBucketAndObject);

    // `sink` must outlive every handler returned here.
    Handler Wrap(Handler inner, const std::string& action) const;

private:
    MetricsSink* sink_;
    protocol::BucketExtractor extractor_;
};

} // namespace monitor
} // namespace s3meter
