#include "s3meter/protocol/S3Path.h"
#include "s3meter/common/Logger.h"

#include <exception>

namespace s3meter {
namespace protocol {

std::pair<std::string, std::string> ExtractBucketAndObject(const HttpRequest& req) {
    const std::string& path = req.path();
    size_t start = 0;
    while (start < path.size() && path[start] == '/') ++start;
    if (start >= path.size()) return {std::string(), std::string()};

    // A query string glued onto the path is not part of the key.
    size_t end = path.find('?', start);
    if (end == std::string::npos) end = path.size();

    size_t slash = path.find('/', start);
    if (slash == std::string::npos || slash >= end) {
        return {path.substr(start, end - start), std::string()};
    }
    return {path.substr(start, slash - start), path.substr(slash + 1, end - slash - 1)};
}

std::string BucketOf(const BucketExtractor& extractor, const HttpRequest& req) {
    if (!extractor) return std::string();
    try {
        return extractor(req).first;
    } catch (const std::exception& e) {
        LOG_WARN << "Bucket extraction failed for " << req.path() << ": " << e.what();
        return std::string();
    }
}

} // namespace protocol
} // namespace s3meter
