#pragma once

#include "s3meter/protocol/HttpResponse.h"

namespace s3meter {
namespace protocol {

// Forwards everything to the wrapped writer and remembers the status code.
// Status starts at 200 so a handler that only writes a body reports success.
class StatusResponseWriter : public ResponseWriter {
public:
    explicit StatusResponseWriter(ResponseWriter* inner)
        : inner_(inner), status_(k200Ok), wroteHeader_(false) {}

    HeaderMap& headers() override { return inner_->headers(); }

    void WriteHeader(int status) override {
        if (!wroteHeader_) {
            status_ = status;
            wroteHeader_ = true;
        }
        inner_->WriteHeader(status);
    }

    size_t Write(const char* data, size_t len) override {
        wroteHeader_ = true;
        return inner_->Write(data, len);
    }
    using ResponseWriter::Write;

    int status() const { return status_; }

private:
    ResponseWriter* inner_;
    int status_;
    bool wroteHeader_;
};

} // namespace protocol
} // namespace s3meter
