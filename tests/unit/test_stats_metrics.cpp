#include "s3meter/monitor/Stats.h"
#include "s3meter/common/Logger.h"

#include <atomic>
#include <cassert>
#include <string>
#include <thread>

using s3meter::monitor::Stats;

static bool Has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

void testPrometheusExport() {
    Stats s;
    s.IncInFlight("GetObject");
    s.IncRequest("GetObject", 200, "photos");
    s.IncRequest("GetObject", 200, "photos");
    s.ObserveRequestSeconds("GetObject", "photos", 0.003);
    s.IncRead("photos");
    s.IncWrite("photos");
    s.IncOther("photos");
    s.AddBytesReceived("photos", 10);
    s.AddBytesSent("photos", 20);
    s.AddExternalBytesSent("photos", 5);
    s.ObserveTimeToFirstByteMs("GetObject", "photos", 3);
    s.RecordBucketActive("photos");

    const std::string text = s.ToPrometheus();
    assert(Has(text, "# TYPE s3meter_request_in_flight gauge"));
    assert(Has(text, "s3meter_request_in_flight{type=\"GetObject\"} 1"));
    assert(Has(text, "s3meter_request_total{type=\"GetObject\",code=\"200\",bucket=\"photos\"} 2"));
    assert(Has(text, "# TYPE s3meter_request_seconds histogram"));
    assert(Has(text, "s3meter_request_seconds_bucket{type=\"GetObject\",bucket=\"photos\",le=\"+Inf\"} 1"));
    assert(Has(text, "s3meter_request_seconds_count{type=\"GetObject\",bucket=\"photos\"} 1"));
    assert(Has(text, "s3meter_bucket_read_total{bucket=\"photos\"} 1"));
    assert(Has(text, "s3meter_bucket_write_total{bucket=\"photos\"} 1"));
    assert(Has(text, "s3meter_bucket_other_total{bucket=\"photos\"} 1"));
    assert(Has(text, "s3meter_bucket_received_bytes_total{bucket=\"photos\"} 10"));
    assert(Has(text, "s3meter_bucket_sent_bytes_total{bucket=\"photos\"} 20"));
    assert(Has(text, "s3meter_bucket_external_sent_bytes_total{bucket=\"photos\"} 5"));
    assert(Has(text, "s3meter_time_to_first_byte_millisecond_count{type=\"GetObject\",bucket=\"photos\"} 1"));
    assert(Has(text, "s3meter_bucket_last_active_seconds{bucket=\"photos\"}"));
}

void testHistogramBucketsAreCumulative() {
    Stats s;
    s.ObserveTimeToFirstByteMs("GetObject", "b", 1);
    s.ObserveTimeToFirstByteMs("GetObject", "b", 3);
    s.ObserveTimeToFirstByteMs("GetObject", "b", 1e9);

    const std::string text = s.ToPrometheus();
    assert(Has(text, "s3meter_time_to_first_byte_millisecond_bucket{type=\"GetObject\",bucket=\"b\",le=\"1\"} 1"));
    assert(Has(text, "s3meter_time_to_first_byte_millisecond_bucket{type=\"GetObject\",bucket=\"b\",le=\"2\"} 1"));
    assert(Has(text, "s3meter_time_to_first_byte_millisecond_bucket{type=\"GetObject\",bucket=\"b\",le=\"4\"} 2"));
    assert(Has(text, "s3meter_time_to_first_byte_millisecond_bucket{type=\"GetObject\",bucket=\"b\",le=\"+Inf\"} 3"));
    assert(s.HistogramCount(Stats::kTimeToFirstByte, {"GetObject", "b"}) == 3);
}

void testLabelEscaping() {
    Stats s;
    s.IncRead("we\"ird\\bucket");
    const std::string text = s.ToPrometheus();
    assert(Has(text, "bucket=\"we\\\"ird\\\\bucket\""));
    const std::string json = s.ToJson();
    assert(Has(json, "\"bucket\": \"we\\\"ird\\\\bucket\""));
}

void testJsonSummary() {
    Stats s;
    s.IncRequest("PutObject", 200, "docs");
    s.IncWrite("docs");
    s.IncRead("docs");
    s.AddBytesSent("docs", 100);
    s.AddExternalBytesSent("docs", 40);
    s.IncInFlight("PutObject");

    const std::string json = s.ToJson();
    assert(Has(json, "\"total_requests\": 1"));
    assert(Has(json, "\"in_flight\": {\"PutObject\": 1}"));
    assert(Has(json, "\"bucket\": \"docs\", \"read\": 1, \"write\": 1, \"other\": 0"));
    assert(Has(json, "\"sent_bytes\": 100, \"external_sent_bytes\": 40"));
}

void testNegativeAndEmptyInputs() {
    Stats s;
    s.AddBytesSent("b", -5);
    s.AddBytesReceived("b", 0);
    assert(s.Value(Stats::kSentBytes, {"b"}) == 0);
    assert(s.Value(Stats::kReceivedBytes, {"b"}) == 0);

    s.RecordBucketActive("");
    assert(s.BucketLastActive("") == 0);

    assert(s.Value("no_such_metric", {"b"}) == 0);
    assert(s.HistogramCount("no_such_metric", {"b"}) == 0);
}

void testCardinalityBound() {
    Stats s;
    for (size_t i = 0; i < Stats::kMaxSeries + 10; ++i) {
        s.IncRead("bucket-" + std::to_string(i));
    }
    assert(s.Value(Stats::kReadTotal, {"bucket-0"}) == 1);
    assert(s.Value(Stats::kReadTotal, {"OTHER"}) == 10);
    assert(s.Value(Stats::kReadTotal, {"bucket-" + std::to_string(Stats::kMaxSeries + 5)}) == 0);
}

void testReset() {
    Stats s;
    s.IncWrite("b");
    s.ObserveTimeToFirstByteMs("GetObject", "b", 3);
    s.IncInFlight("PutObject");
    s.Reset();
    assert(s.Value(Stats::kWriteTotal, {"b"}) == 0);
    assert(s.HistogramCount(Stats::kTimeToFirstByte, {"GetObject", "b"}) == 0);
    assert(s.HistogramSum(Stats::kTimeToFirstByte, {"GetObject", "b"}) == 0.0);
    assert(Has(s.ToPrometheus(), "s3meter_bucket_write_total{bucket=\"b\"} 0"));

    // A request running across the reset still settles the gauge to zero.
    assert(s.Value(Stats::kInFlight, {"PutObject"}) == 1);
    s.DecInFlight("PutObject");
    assert(s.Value(Stats::kInFlight, {"PutObject"}) == 0);

    s.IncWrite("b");
    assert(s.Value(Stats::kWriteTotal, {"b"}) == 1);
}

void testResetWhileRecording() {
    Stats s;
    std::atomic<bool> done{false};
    std::thread writer([&] {
        while (!done.load()) {
            s.IncInFlight("GetObject");
            s.IncRead("hot");
            s.ObserveRequestSeconds("GetObject", "hot", 0.001);
            s.DecInFlight("GetObject");
        }
    });
    for (int i = 0; i < 200; ++i) s.Reset();
    done.store(true);
    writer.join();
    assert(s.Value(Stats::kInFlight, {"GetObject"}) == 0);
}

int main() {
    s3meter::common::Logger::Instance().SetLevel(s3meter::common::LogLevel::ERROR);

    testPrometheusExport();
    testHistogramBucketsAreCumulative();
    testLabelEscaping();
    testJsonSummary();
    testNegativeAndEmptyInputs();
    testCardinalityBound();
    testReset();
    testResetWhileRecording();

    // The process-wide instance is usable as a sink too.
    Stats::Instance().IncRead("global");
    assert(Stats::Instance().Value(Stats::kReadTotal, {"global"}) == 1);

    LOG_INFO << "Stats tests PASS";
    return 0;
}
