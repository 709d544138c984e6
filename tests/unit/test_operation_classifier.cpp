#include "s3meter/monitor/OperationClassifier.h"
#include "s3meter/common/Logger.h"

#include <cassert>
#include <vector>

using s3meter::monitor::OperationCategory;
using s3meter::monitor::OperationClassifier;
using s3meter::protocol::HttpRequest;

static OperationCategory C(const std::string& action, HttpRequest::Method m = HttpRequest::kInvalid) {
    return OperationClassifier::Classify(action, m);
}

void testActionNames() {
    assert(C("GetObject") == OperationCategory::kRead);
    assert(C("HeadObject") == OperationCategory::kRead);
    assert(C("GetBucketAcl") == OperationCategory::kRead);
    assert(C("PutObject") == OperationCategory::kWrite);
    assert(C("CompleteMultipartUpload") == OperationCategory::kWrite);
    assert(C("NewMultipartUpload") == OperationCategory::kWrite);
    assert(C("AbortMultipartUpload") == OperationCategory::kWrite);
    assert(C("CopyObject") == OperationCategory::kWrite);
    assert(C("DeleteMultipleObjects") == OperationCategory::kWrite);
    assert(C("ListObjectsV2") == OperationCategory::kWrite);
    assert(C("PostPolicy") == OperationCategory::kWrite);
    assert(C("CreateBucket") == OperationCategory::kWrite);
    assert(C("putobject") == OperationCategory::kWrite);
}

void testReadRulesWinOverWriteRules() {
    // Both "get" and "list"/"put" appear: the read rule is checked first.
    assert(C("GetObjectList") == OperationCategory::kRead);
    assert(C("PutBucketTagging", HttpRequest::kPut) == OperationCategory::kWrite);
    assert(C("GetObjectRetention", HttpRequest::kPut) == OperationCategory::kRead);
    assert(C("HEADBUCKET") == OperationCategory::kRead);
}

void testMethodFallback() {
    assert(C("Unknown", HttpRequest::kDelete) == OperationCategory::kWrite);
    assert(C("Unknown", HttpRequest::kPut) == OperationCategory::kWrite);
    assert(C("Unknown", HttpRequest::kPost) == OperationCategory::kWrite);
    assert(C("Unknown", HttpRequest::kGet) == OperationCategory::kRead);
    assert(C("", HttpRequest::kHead) == OperationCategory::kRead);
    assert(C("Options", HttpRequest::kOptions) == OperationCategory::kOther);
    assert(C("Status", HttpRequest::kPatch) == OperationCategory::kOther);
    assert(C("", HttpRequest::kInvalid) == OperationCategory::kOther);
}

void testConditionalHeaders() {
    HttpRequest plain;
    assert(!OperationClassifier::IsConditional(plain));

    const char* headers[] = {
        "If-Match", "If-None-Match", "If-Modified-Since", "If-Unmodified-Since",
        "x-amz-copy-source-if-match", "x-amz-copy-source-if-none-match",
        "x-amz-copy-source-if-modified-since", "x-amz-copy-source-if-unmodified-since",
    };
    for (const char* h : headers) {
        HttpRequest req;
        req.setHeader(h, "\"etag\"");
        assert(OperationClassifier::IsConditional(req));
    }

    HttpRequest lower;
    lower.setHeader("if-match", "*");
    assert(OperationClassifier::IsConditional(lower));

    HttpRequest empty;
    empty.setHeader("If-Match", "");
    assert(!OperationClassifier::IsConditional(empty));

    HttpRequest unrelated;
    unrelated.setHeader("If-Range", "\"etag\"");
    assert(!OperationClassifier::IsConditional(unrelated));
}

void testBillingEvents() {
    using V = std::vector<OperationCategory>;
    assert(OperationClassifier::BillingEvents(OperationCategory::kRead, false) == V{OperationCategory::kRead});
    assert(OperationClassifier::BillingEvents(OperationCategory::kRead, true) == V{OperationCategory::kRead});
    assert(OperationClassifier::BillingEvents(OperationCategory::kWrite, false) == V{OperationCategory::kWrite});
    assert((OperationClassifier::BillingEvents(OperationCategory::kWrite, true) ==
            V{OperationCategory::kWrite, OperationCategory::kRead}));
    assert(OperationClassifier::BillingEvents(OperationCategory::kOther, true) == V{OperationCategory::kOther});

    assert(std::string(s3meter::monitor::CategoryName(OperationCategory::kWrite)) == "write");
}

int main() {
    s3meter::common::Logger::Instance().SetLevel(s3meter::common::LogLevel::ERROR);

    testActionNames();
    testReadRulesWinOverWriteRules();
    testMethodFallback();
    testConditionalHeaders();
    testBillingEvents();

    LOG_INFO << "OperationClassifier tests PASS";
    return 0;
}
