#pragma once

#include <string>
#include <vector>

#include "s3meter/protocol/HttpRequest.h"

namespace s3meter {
namespace monitor {

enum class OperationCategory { kRead, kWrite, kOther };

const char* CategoryName(OperationCategory c);

// Maps an S3 action name to a billing category.
//
// Rules are checked in order, first match wins:
//   1. action contains "get" or "head"                      -> Read
//   2. action contains put/post/delete/copy/create/complete/
//      abort/uploadpart/list/multipart                      -> Write
//   3. method GET/HEAD -> Read, PUT/POST/DELETE -> Write, else Other
// Matching is case-insensitive, so "ListObjectsV2" is a Write.
class OperationClassifier {
public:
    static OperationCategory Classify(const std::string& action, protocol::HttpRequest::Method method);

    // Presence of any non-empty If-Match, If-None-Match, If-Modified-Since,
    // If-Unmodified-Since or their x-amz-copy-source-if-* counterparts.
    static bool IsConditional(const protocol::HttpRequest& req);

    // Counters to bump for one request. A conditional write also bills a read.
    static std::vector<OperationCategory> BillingEvents(OperationCategory category, bool conditional);
};

} // namespace monitor
} // namespace s3meter
