#include "s3meter/monitor/Stats.h"

#include <algorithm>
#include <cstdio>
#include <map>
#include <memory>
#include <sstream>

namespace s3meter {
namespace monitor {

namespace {

constexpr char kKeySep = '\x1f';
const char* const kOverflowLabel = "OTHER";

std::string JoinKey(const Stats::Labels& values) {
    std::string key;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) key.push_back(kKeySep);
        key += values[i];
    }
    return key;
}

Stats::Labels SplitKey(const std::string& key, size_t n) {
    Stats::Labels out;
    out.reserve(n);
    size_t start = 0;
    for (size_t i = 0; i + 1 < n; ++i) {
        size_t pos = key.find(kKeySep, start);
        if (pos == std::string::npos) break;
        out.push_back(key.substr(start, pos - start));
        start = pos + 1;
    }
    out.push_back(key.substr(start));
    out.resize(n);
    return out;
}

void AtomicAdd(std::atomic<double>& target, double v) {
    double cur = target.load(std::memory_order_relaxed);
    while (!target.compare_exchange_weak(cur, cur + v, std::memory_order_relaxed)) {
    }
}

std::vector<double> ExponentialBuckets(double start, double factor, int count) {
    std::vector<double> out;
    out.reserve(count);
    double v = start;
    for (int i = 0; i < count; ++i) {
        out.push_back(v);
        v *= factor;
    }
    return out;
}

std::string EscapeLabel(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else out.push_back(c);
    }
    return out;
}

std::string EscapeJson(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof buf, "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string LabelSet(const Stats::Labels& names, const Stats::Labels& values,
                     const std::string& extraName = "", const std::string& extraValue = "") {
    std::string out = "{";
    bool first = true;
    for (size_t i = 0; i < names.size() && i < values.size(); ++i) {
        if (!first) out += ",";
        first = false;
        out += names[i] + "=\"" + EscapeLabel(values[i]) + "\"";
    }
    if (!extraName.empty()) {
        if (!first) out += ",";
        out += extraName + "=\"" + extraValue + "\"";
    }
    out += "}";
    return out;
}

std::string FormatBound(double b) {
    std::ostringstream ss;
    ss << b;
    return ss.str();
}

// Series storage shared by scalar and histogram families. Entries are never
// erased, so pointers handed out stay valid for the life of the map.
template <typename Series>
class SeriesMap {
public:
    template <typename Factory>
    Series* Get(const Stats::Labels& values, size_t labelCount, Factory make) {
        std::string key = JoinKey(values);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(key);
        if (it != series_.end()) return it->second.get();
        if (series_.size() >= Stats::kMaxSeries) {
            key = JoinKey(Stats::Labels(labelCount, kOverflowLabel));
            it = series_.find(key);
            if (it != series_.end()) return it->second.get();
        }
        auto created = make();
        Series* raw = created.get();
        series_.emplace(key, std::move(created));
        return raw;
    }

    const Series* Find(const Stats::Labels& values) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = series_.find(JoinKey(values));
        return it != series_.end() ? it->second.get() : nullptr;
    }

    // Sorted by key so exports are stable.
    std::vector<std::pair<std::string, const Series*>> Snapshot() const {
        std::vector<std::pair<std::string, const Series*>> out;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            out.reserve(series_.size());
            for (const auto& kv : series_) out.emplace_back(kv.first, kv.second.get());
        }
        std::sort(out.begin(), out.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        return out;
    }

    template <typename Fn>
    void ForEach(Fn fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& kv : series_) fn(*kv.second);
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Series>> series_;
};

struct HistogramSeries {
    explicit HistogramSeries(size_t n) : buckets(std::make_unique<std::atomic<unsigned long long>[]>(n)), size(n) {
        Zero();
    }

    void Zero() {
        for (size_t i = 0; i < size; ++i) buckets[i].store(0, std::memory_order_relaxed);
        count.store(0, std::memory_order_relaxed);
        sum.store(0.0, std::memory_order_relaxed);
    }

    // Per-bucket (non-cumulative) counts; values above the last bound only reach count.
    std::unique_ptr<std::atomic<unsigned long long>[]> buckets;
    size_t size;
    std::atomic<unsigned long long> count{0};
    std::atomic<double> sum{0.0};
};

} // namespace

struct Stats::ScalarFamily {
    ScalarFamily(const char* n, const char* h, const char* t, Labels labels)
        : name(n), help(h), type(t), labelNames(std::move(labels)) {}

    std::atomic<long long>* Get(const Labels& values) {
        return series.Get(values, labelNames.size(), [] { return std::make_unique<std::atomic<long long>>(0); });
    }

    long long Load(const Labels& values) const {
        const auto* s = series.Find(values);
        return s ? s->load(std::memory_order_relaxed) : 0;
    }

    const char* name;
    const char* help;
    const char* type;
    Labels labelNames;
    SeriesMap<std::atomic<long long>> series;
};

struct Stats::HistogramFamily {
    HistogramFamily(const char* n, const char* h, Labels labels, std::vector<double> b)
        : name(n), help(h), labelNames(std::move(labels)), bounds(std::move(b)) {}

    void Observe(const Labels& values, double v) {
        const size_t n = bounds.size();
        HistogramSeries* s = series.Get(values, labelNames.size(), [n] { return std::make_unique<HistogramSeries>(n); });
        auto it = std::lower_bound(bounds.begin(), bounds.end(), v);
        if (it != bounds.end()) {
            s->buckets[it - bounds.begin()].fetch_add(1, std::memory_order_relaxed);
        }
        s->count.fetch_add(1, std::memory_order_relaxed);
        AtomicAdd(s->sum, v);
    }

    const char* name;
    const char* help;
    Labels labelNames;
    std::vector<double> bounds;
    SeriesMap<HistogramSeries> series;
};

Stats& Stats::Instance() {
    static Stats instance;
    return instance;
}

Stats::Stats()
    : startTime_(std::chrono::system_clock::now()),
      inFlight_(std::make_unique<ScalarFamily>(kInFlight, "Requests currently being served.", "gauge",
                                               Labels{"type"})),
      requests_(std::make_unique<ScalarFamily>(kRequestTotal, "Requests by action and status code.", "counter",
                                               Labels{"type", "code", "bucket"})),
      reads_(std::make_unique<ScalarFamily>(kReadTotal, "Billable read operations.", "counter", Labels{"bucket"})),
      writes_(std::make_unique<ScalarFamily>(kWriteTotal, "Billable write operations.", "counter", Labels{"bucket"})),
      others_(std::make_unique<ScalarFamily>(kOtherTotal, "Operations that are neither read nor write.", "counter",
                                             Labels{"bucket"})),
      received_(std::make_unique<ScalarFamily>(kReceivedBytes, "Bytes received from clients.", "counter",
                                               Labels{"bucket"})),
      sent_(std::make_unique<ScalarFamily>(kSentBytes, "Bytes sent to clients.", "counter", Labels{"bucket"})),
      externalSent_(std::make_unique<ScalarFamily>(kExternalSentBytes,
                                                   "Bytes sent to clients outside the internal networks.",
                                                   "counter", Labels{"bucket"})),
      lastActive_(std::make_unique<ScalarFamily>(kBucketLastActive, "Unix time of the last request on a bucket.",
                                                 "gauge", Labels{"bucket"})),
      requestSeconds_(std::make_unique<HistogramFamily>(kRequestSeconds, "Request latency in seconds.",
                                                        Labels{"type", "bucket"}, ExponentialBuckets(0.0001, 2, 24))),
      ttfb_(std::make_unique<HistogramFamily>(kTimeToFirstByte, "Time to first byte in milliseconds.",
                                              Labels{"type", "bucket"}, ExponentialBuckets(1, 2, 18))) {}

Stats::~Stats() = default;

void Stats::IncInFlight(const std::string& action) {
    inFlight_->Get({action})->fetch_add(1, std::memory_order_relaxed);
}

void Stats::DecInFlight(const std::string& action) {
    inFlight_->Get({action})->fetch_sub(1, std::memory_order_relaxed);
}

void Stats::ObserveRequestSeconds(const std::string& action, const std::string& bucket, double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    requestSeconds_->Observe({action, bucket}, seconds);
}

void Stats::IncRequest(const std::string& action, int status, const std::string& bucket) {
    requests_->Get({action, std::to_string(status), bucket})->fetch_add(1, std::memory_order_relaxed);
}

void Stats::IncRead(const std::string& bucket) {
    reads_->Get({bucket})->fetch_add(1, std::memory_order_relaxed);
}

void Stats::IncWrite(const std::string& bucket) {
    writes_->Get({bucket})->fetch_add(1, std::memory_order_relaxed);
}

void Stats::IncOther(const std::string& bucket) {
    others_->Get({bucket})->fetch_add(1, std::memory_order_relaxed);
}

void Stats::ObserveTimeToFirstByteMs(const std::string& action, const std::string& bucket, double ms) {
    if (ms < 0.0) ms = 0.0;
    ttfb_->Observe({action, bucket}, ms);
}

void Stats::AddBytesReceived(const std::string& bucket, long long n) {
    if (n <= 0) return;
    received_->Get({bucket})->fetch_add(n, std::memory_order_relaxed);
}

void Stats::AddBytesSent(const std::string& bucket, long long n) {
    if (n <= 0) return;
    sent_->Get({bucket})->fetch_add(n, std::memory_order_relaxed);
}

void Stats::AddExternalBytesSent(const std::string& bucket, long long n) {
    if (n <= 0) return;
    externalSent_->Get({bucket})->fetch_add(n, std::memory_order_relaxed);
}

void Stats::RecordBucketActive(const std::string& bucket) {
    // Requests outside any bucket (service level calls) are not tracked.
    if (bucket.empty()) return;
    const long long now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    lastActive_->Get({bucket})->store(now, std::memory_order_relaxed);
}

const Stats::ScalarFamily* Stats::FindScalar(const std::string& metric) const {
    const ScalarFamily* all[] = {inFlight_.get(), requests_.get(), reads_.get(), writes_.get(),
                                 others_.get(), received_.get(), sent_.get(), externalSent_.get(),
                                 lastActive_.get()};
    for (const auto* f : all) {
        if (metric == f->name) return f;
    }
    return nullptr;
}

const Stats::HistogramFamily* Stats::FindHistogram(const std::string& metric) const {
    if (metric == requestSeconds_->name) return requestSeconds_.get();
    if (metric == ttfb_->name) return ttfb_.get();
    return nullptr;
}

long long Stats::Value(const std::string& metric, const Labels& labels) const {
    const ScalarFamily* f = FindScalar(metric);
    return f ? f->Load(labels) : 0;
}

unsigned long long Stats::HistogramCount(const std::string& metric, const Labels& labels) const {
    const HistogramFamily* f = FindHistogram(metric);
    if (!f) return 0;
    const HistogramSeries* s = f->series.Find(labels);
    return s ? s->count.load(std::memory_order_relaxed) : 0;
}

double Stats::HistogramSum(const std::string& metric, const Labels& labels) const {
    const HistogramFamily* f = FindHistogram(metric);
    if (!f) return 0.0;
    const HistogramSeries* s = f->series.Find(labels);
    return s ? s->sum.load(std::memory_order_relaxed) : 0.0;
}

long long Stats::BucketLastActive(const std::string& bucket) const {
    return lastActive_->Load({bucket});
}

std::string Stats::ToPrometheus() const {
    std::ostringstream ss;

    auto dumpScalar = [&ss](const ScalarFamily& f) {
        ss << "# HELP " << f.name << " " << f.help << "\n";
        ss << "# TYPE " << f.name << " " << f.type << "\n";
        for (const auto& kv : f.series.Snapshot()) {
            ss << f.name << LabelSet(f.labelNames, SplitKey(kv.first, f.labelNames.size()))
               << " " << kv.second->load(std::memory_order_relaxed) << "\n";
        }
    };

    auto dumpHistogram = [&ss](const HistogramFamily& f) {
        ss << "# HELP " << f.name << " " << f.help << "\n";
        ss << "# TYPE " << f.name << " histogram\n";
        for (const auto& kv : f.series.Snapshot()) {
            const Labels values = SplitKey(kv.first, f.labelNames.size());
            const HistogramSeries* s = kv.second;
            unsigned long long cumulative = 0;
            for (size_t i = 0; i < f.bounds.size(); ++i) {
                cumulative += s->buckets[i].load(std::memory_order_relaxed);
                ss << f.name << "_bucket" << LabelSet(f.labelNames, values, "le", FormatBound(f.bounds[i]))
                   << " " << cumulative << "\n";
            }
            const unsigned long long count = s->count.load(std::memory_order_relaxed);
            ss << f.name << "_bucket" << LabelSet(f.labelNames, values, "le", "+Inf") << " " << count << "\n";
            ss << f.name << "_sum" << LabelSet(f.labelNames, values) << " "
               << s->sum.load(std::memory_order_relaxed) << "\n";
            ss << f.name << "_count" << LabelSet(f.labelNames, values) << " " << count << "\n";
        }
    };

    dumpScalar(*inFlight_);
    dumpHistogram(*requestSeconds_);
    dumpScalar(*requests_);
    dumpScalar(*reads_);
    dumpScalar(*writes_);
    dumpScalar(*others_);
    dumpHistogram(*ttfb_);
    dumpScalar(*received_);
    dumpScalar(*sent_);
    dumpScalar(*externalSent_);
    dumpScalar(*lastActive_);
    return ss.str();
}

std::string Stats::ToJson() const {
    auto now = std::chrono::system_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - startTime_).count();

    struct BucketRow {
        long long read{0};
        long long write{0};
        long long other{0};
        long long received{0};
        long long sent{0};
        long long externalSent{0};
        long long lastActive{0};
    };
    std::map<std::string, BucketRow> rows;
    auto collect = [&rows](const ScalarFamily& f, long long BucketRow::*field) {
        for (const auto& kv : f.series.Snapshot()) {
            rows[kv.first].*field = kv.second->load(std::memory_order_relaxed);
        }
    };
    collect(*reads_, &BucketRow::read);
    collect(*writes_, &BucketRow::write);
    collect(*others_, &BucketRow::other);
    collect(*received_, &BucketRow::received);
    collect(*sent_, &BucketRow::sent);
    collect(*externalSent_, &BucketRow::externalSent);
    collect(*lastActive_, &BucketRow::lastActive);

    long long totalRequests = 0;
    for (const auto& kv : requests_->series.Snapshot()) {
        totalRequests += kv.second->load(std::memory_order_relaxed);
    }

    std::stringstream ss;
    ss << "{\n";
    ss << "  \"uptime_sec\": " << uptime << ",\n";
    ss << "  \"total_requests\": " << totalRequests << ",\n";

    ss << "  \"in_flight\": {";
    {
        const auto inflight = inFlight_->series.Snapshot();
        for (size_t i = 0; i < inflight.size(); ++i) {
            ss << (i ? ", " : "") << "\"" << EscapeJson(inflight[i].first) << "\": "
               << inflight[i].second->load(std::memory_order_relaxed);
        }
    }
    ss << "},\n";

    ss << "  \"buckets\": [\n";
    size_t i = 0;
    for (const auto& kv : rows) {
        const BucketRow& r = kv.second;
        ss << "    {\"bucket\": \"" << EscapeJson(kv.first) << "\""
           << ", \"read\": " << r.read
           << ", \"write\": " << r.write
           << ", \"other\": " << r.other
           << ", \"received_bytes\": " << r.received
           << ", \"sent_bytes\": " << r.sent
           << ", \"external_sent_bytes\": " << r.externalSent
           << ", \"last_active\": " << r.lastActive << "}"
           << (++i < rows.size() ? "," : "") << "\n";
    }
    ss << "  ]\n";
    ss << "}";
    return ss.str();
}

void Stats::Reset() {
    auto zero = [](std::atomic<long long>& v) { v.store(0, std::memory_order_relaxed); };
    requests_->series.ForEach(zero);
    reads_->series.ForEach(zero);
    writes_->series.ForEach(zero);
    others_->series.ForEach(zero);
    received_->series.ForEach(zero);
    sent_->series.ForEach(zero);
    externalSent_->series.ForEach(zero);
    lastActive_->series.ForEach(zero);
    requestSeconds_->series.ForEach([](HistogramSeries& h) { h.Zero(); });
    ttfb_->series.ForEach([](HistogramSeries& h) { h.Zero(); });
}

} // namespace monitor
} // namespace s3meter
