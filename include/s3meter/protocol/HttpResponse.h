#pragma once

#include <string>
#include <cstddef>

#include "s3meter/protocol/HttpRequest.h"

namespace s3meter {
namespace protocol {

enum HttpStatusCode {
    kUnknown,
    k200Ok = 200,
    k403Forbidden = 403,
};

// Sink a handler writes its response into. WriteHeader() fixes the status;
// the first Write() without it implies 200.
class ResponseWriter {
public:
    virtual ~ResponseWriter() = default;

    virtual HeaderMap& headers() = 0;
    virtual void WriteHeader(int status) = 0;
    virtual size_t Write(const char* data, size_t len) = 0;

    size_t Write(const std::string& data) { return Write(data.data(), data.size()); }
};

// Buffers the whole response in memory.
class HttpResponse : public ResponseWriter {
public:
    HttpResponse() : statusCode_(kUnknown), wroteHeader_(false) {}

    HeaderMap& headers() override { return headers_; }
    const HeaderMap& headers() const { return headers_; }

    void WriteHeader(int status) override {
        if (wroteHeader_) return;
        statusCode_ = status;
        wroteHeader_ = true;
    }

    size_t Write(const char* data, size_t len) override {
        if (!wroteHeader_) WriteHeader(k200Ok);
        body_.append(data, len);
        return len;
    }
    using ResponseWriter::Write;

    int statusCode() const { return statusCode_; }
    const std::string& body() const { return body_; }

private:
    int statusCode_;
    bool wroteHeader_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace s3meter
