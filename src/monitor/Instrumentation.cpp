#include "s3meter/monitor/Instrumentation.h"
#include "s3meter/monitor/OperationClassifier.h"
#include "s3meter/protocol/StatusResponseWriter.h"

#include <chrono>
#include <utility>

namespace s3meter {
namespace monitor {

Instrumentation::Instrumentation(MetricsSink* sink, protocol::BucketExtractor extractor)
    : sink_(sink), extractor_(std::move(extractor)) {}

Handler Instrumentation::Wrap(Handler inner, const std::string& action) const {
    MetricsSink* sink = sink_;
    protocol::BucketExtractor extractor = extractor_;
    return [sink, extractor, inner, action](const protocol::HttpRequest& req, protocol::ResponseWriter* w) {
        ScopedInFlight inFlight(sink, action);

        std::string bucket = protocol::BucketOf(extractor, req);

        protocol::StatusResponseWriter recorder(w);
        const auto start = std::chrono::steady_clock::now();
        inner(req, &recorder);
        const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        if (recorder.status() == protocol::k403Forbidden) {
            bucket.clear();
        }
        sink->RecordBucketActive(bucket);
        sink->ObserveRequestSeconds(action, bucket, elapsed);
        sink->IncRequest(action, recorder.status(), bucket);

        const OperationCategory category = OperationClassifier::Classify(action, req.getMethod());
        const bool conditional = category == OperationCategory::kWrite && OperationClassifier::IsConditional(req);
        for (OperationCategory event : OperationClassifier::BillingEvents(category, conditional)) {
            switch (event) {
                case OperationCategory::kRead: sink->IncRead(bucket); break;
                case OperationCategory::kWrite: sink->IncWrite(bucket); break;
                default: sink->IncOther(bucket); break;
            }
        }
    };
}

} // namespace monitor
} // namespace s3meter
