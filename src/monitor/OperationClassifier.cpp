#include "s3meter/monitor/OperationClassifier.h"

#include <algorithm>
#include <cctype>

namespace s3meter {
namespace monitor {

namespace {

struct ActionRule {
    std::vector<const char*> needles;
    OperationCategory category;
};

// Order matters: "GetObject" must not fall into the write patterns first.
const std::vector<ActionRule>& ActionRules() {
    static const std::vector<ActionRule> rules = {
        {{"get", "head"}, OperationCategory::kRead},
        {{"put", "post", "delete", "copy", "create", "complete", "abort", "uploadpart", "list", "multipart"},
         OperationCategory::kWrite},
    };
    return rules;
}

const char* const kConditionalHeaders[] = {
    "If-Match",
    "If-None-Match",
    "If-Modified-Since",
    "If-Unmodified-Since",
    "X-Amz-Copy-Source-If-Match",
    "X-Amz-Copy-Source-If-None-Match",
    "X-Amz-Copy-Source-If-Modified-Since",
    "X-Amz-Copy-Source-If-Unmodified-Since",
};

std::string ToLower(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* CategoryName(OperationCategory c) {
    switch (c) {
        case OperationCategory::kRead: return "read";
        case OperationCategory::kWrite: return "write";
        default: return "other";
    }
}

OperationCategory OperationClassifier::Classify(const std::string& action, protocol::HttpRequest::Method method) {
    const std::string a = ToLower(action);
    for (const auto& rule : ActionRules()) {
        for (const char* needle : rule.needles) {
            if (a.find(needle) != std::string::npos) return rule.category;
        }
    }

    switch (method) {
        case protocol::HttpRequest::kGet:
        case protocol::HttpRequest::kHead:
            return OperationCategory::kRead;
        case protocol::HttpRequest::kPut:
        case protocol::HttpRequest::kPost:
        case protocol::HttpRequest::kDelete:
            return OperationCategory::kWrite;
        default:
            return OperationCategory::kOther;
    }
}

bool OperationClassifier::IsConditional(const protocol::HttpRequest& req) {
    for (const char* h : kConditionalHeaders) {
        if (req.hasHeader(h)) return true;
    }
    return false;
}

std::vector<OperationCategory> OperationClassifier::BillingEvents(OperationCategory category, bool conditional) {
    switch (category) {
        case OperationCategory::kRead:
            return {OperationCategory::kRead};
        case OperationCategory::kWrite:
            if (conditional) return {OperationCategory::kWrite, OperationCategory::kRead};
            return {OperationCategory::kWrite};
        default:
            return {OperationCategory::kOther};
    }
}

} // namespace monitor
} // namespace s3meter
