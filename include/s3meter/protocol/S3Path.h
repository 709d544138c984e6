#pragma once

#include <functional>
#include <string>
#include <utility>

#include "s3meter/protocol/HttpRequest.h"

namespace s3meter {
namespace protocol {

// (bucket, object) for a request; both may be empty.
using BucketExtractor = std::function<std::pair<std::string, std::string>(const HttpRequest&)>;

// Path-style addressing: "/bucket/dir/key" -> ("bucket", "dir/key").
// The service root "/" yields an empty bucket.
std::pair<std::string, std::string> ExtractBucketAndObject(const HttpRequest& req);

// Runs `extractor` and returns the bucket. A missing extractor or one that
// throws yields an empty bucket; the failure is logged, never rethrown.
std::string BucketOf(const BucketExtractor& extractor, const HttpRequest& req);

} // namespace protocol
} // namespace s3meter
