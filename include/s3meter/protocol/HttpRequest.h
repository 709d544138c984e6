#pragma once

#include <string>
#include <map>
#include <cstddef>

namespace s3meter {
namespace protocol {

// Header names compare case-insensitively ("if-match" == "If-Match").
struct HeaderLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderLess>;

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions, kPatch
    };

    HttpRequest() : method_(kInvalid) {}

    bool setMethod(const std::string& m) {
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "OPTIONS") method_ = kOptions;
        else if (m == "PATCH") method_ = kPatch;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }
    void setMethod(Method m) { method_ = m; }

    Method getMethod() const { return method_; }
    const char* methodString() const { return MethodString(method_); }

    static const char* MethodString(Method m) {
        switch (m) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kOptions: return "OPTIONS";
            case kPatch: return "PATCH";
            default: return "UNKNOWN";
        }
    }

    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    void setQuery(const std::string& query) { query_ = query; }
    const std::string& query() const { return query_; }

    // Transport-level peer, usually "ip:port" as reported by the socket layer.
    void setPeerAddress(const std::string& peer) { peerAddress_ = peer; }
    const std::string& peerAddress() const { return peerAddress_; }

    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it != headers_.end() ? it->second : std::string();
    }

    bool hasHeader(const std::string& field) const {
        return !getHeader(field).empty();
    }

    void setHeader(const std::string& field, const std::string& value) {
        headers_[field] = value;
    }

    const HeaderMap& headers() const { return headers_; }

private:
    Method method_;
    std::string path_;
    std::string query_;
    std::string peerAddress_;
    HeaderMap headers_;
};

} // namespace protocol
} // namespace s3meter
