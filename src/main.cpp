#include "s3meter/common/Config.h"
#include "s3meter/common/Logger.h"
#include "s3meter/monitor/AddressResolver.h"
#include "s3meter/monitor/OperationClassifier.h"
#include "s3meter/monitor/TrafficRecorder.h"
#include "s3meter/network/PrefixSet.h"
#include "s3meter/protocol/HttpRequest.h"
#include "s3meter/protocol/S3Path.h"
#include <unistd.h>
#include <getopt.h>
#include <cstdio>
#include <string>

namespace {

void Usage(const char* prog) {
    printf("Usage: %s [-c config_file] [-C] [-a peer] [-x forwarded_for] [-A action] [-m method]\n"
           "          [-p path] [-H 'Name: value']...\n", prog);
    printf("  -C  print the internal network set and exit\n");
    printf("  -a  transport peer address, e.g. 10.0.0.1:51234\n");
    printf("  -x  X-Forwarded-For header value\n");
    printf("  -A  S3 action name, e.g. PutObject\n");
    printf("  -m  HTTP method (default GET)\n");
    printf("  -p  request path (default /)\n");
    printf("  -H  extra request header, repeatable\n");
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace s3meter;

    std::string configFile;
    bool checkOnly = false;
    std::string action;
    std::string method = "GET";
    protocol::HttpRequest req;
    req.setPath("/");

    int ch;
    while ((ch = getopt(argc, argv, "c:Ca:x:A:m:p:H:h")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'a':
                req.setPeerAddress(optarg);
                break;
            case 'x':
                req.setHeader("X-Forwarded-For", optarg);
                break;
            case 'A':
                action = optarg;
                break;
            case 'm':
                method = optarg;
                break;
            case 'p':
                req.setPath(optarg);
                break;
            case 'H': {
                std::string h = optarg;
                auto colon = h.find(':');
                if (colon == std::string::npos) {
                    fprintf(stderr, "bad header (want 'Name: value'): %s\n", optarg);
                    return 2;
                }
                std::string value = h.substr(colon + 1);
                while (!value.empty() && value[0] == ' ') value.erase(0, 1);
                req.setHeader(h.substr(0, colon), value);
                break;
            }
            case 'h':
                Usage(argv[0]);
                return 0;
            default:
                Usage(argv[0]);
                return 2;
        }
    }

    auto& conf = common::Config::Instance();
    if (!configFile.empty() && !conf.Load(configFile)) {
        LOG_ERROR << "Failed to load config, using defaults.";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));

    network::PrefixSetPtr internal = monitor::LoadInternalNetworks(conf);

    if (checkOnly) {
        const size_t n = internal ? internal->prefixes().size() : 0;
        printf("internal_prefixes=%zu\n", n);
        if (internal) {
            for (const auto& p : internal->prefixes()) printf("  %s\n", p.toString().c_str());
        }
        return 0;
    }

    if (!req.setMethod(method)) {
        LOG_WARN << "Unknown method " << method << ", classifying by action only";
    }

    monitor::AddressResolver resolver(monitor::AddressResolver::PolicyFromConfig(conf));
    const network::IpAddress client = resolver.ClientAddress(req);
    const bool isInternal = network::PrefixSet::Contains(internal, client);
    const monitor::OperationCategory category = monitor::OperationClassifier::Classify(action, req.getMethod());
    const bool conditional = monitor::OperationClassifier::IsConditional(req);

    printf("method=%s\n", req.methodString());
    printf("client=%s\n", client.toString().c_str());
    printf("network=%s\n", isInternal ? "internal" : "external");
    printf("bucket=%s\n", protocol::ExtractBucketAndObject(req).first.c_str());
    printf("category=%s\n", monitor::CategoryName(category));
    printf("conditional=%s\n", conditional ? "yes" : "no");
    printf("billing=");
    bool first = true;
    for (auto e : monitor::OperationClassifier::BillingEvents(category, conditional)) {
        printf("%s%s", first ? "" : ",", monitor::CategoryName(e));
        first = false;
    }
    printf("\n");
    return 0;
}
