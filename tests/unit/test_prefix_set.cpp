#include "s3meter/network/PrefixSet.h"
#include "s3meter/common/Logger.h"

#include <cassert>
#include <sstream>
#include <string>
#include <vector>

using s3meter::network::IpAddress;
using s3meter::network::PrefixSet;
using s3meter::network::PrefixSetPtr;

static bool Internal(const PrefixSetPtr& set, const std::string& ip) {
    return PrefixSet::Contains(set, IpAddress::Parse(ip));
}

void testBasicMembership() {
    PrefixSetPtr set = PrefixSet::Build("10.0.0.0/8");
    assert(set);
    assert(Internal(set, "10.1.2.3"));
    assert(!Internal(set, "8.8.8.8"));
    assert(!Internal(set, "11.0.0.0"));
    assert(Internal(set, "10.255.255.255"));
}

void testSeparators() {
    PrefixSetPtr set = PrefixSet::Build(" 10.0.0.0/8, 172.16.0.0/12;192.168.0.0/16\n\t100.64.0.0/10\r\n");
    assert(set);
    assert(set->prefixes().size() == 4);
    assert(Internal(set, "172.20.1.1"));
    assert(Internal(set, "192.168.44.2"));
    assert(Internal(set, "100.100.0.1"));
    assert(!Internal(set, "172.32.0.1"));
    assert(!Internal(set, "1.1.1.1"));
}

void testEmptyAndInvalidConfig() {
    assert(!PrefixSet::Build(""));
    assert(!PrefixSet::Build("   \n\t ;, "));
    assert(!PrefixSet::Build("garbage, 10.0.0.0, 300.1.1.1/8", [](const std::string&) {}));

    PrefixSetPtr none;
    assert(!Internal(none, "127.0.0.1"));
    assert(!Internal(none, "10.0.0.1"));
}

void testInvalidTokensSkipped() {
    std::vector<std::string> skipped;
    PrefixSetPtr set = PrefixSet::Build("bogus 10.0.0.0/8 1.2.3.4/40;192.168.1.0/24",
                                        [&skipped](const std::string& t) { skipped.push_back(t); });
    assert(set);
    assert(set->prefixes().size() == 2);
    assert(skipped.size() == 2);
    assert(skipped[0] == "bogus");
    assert(skipped[1] == "1.2.3.4/40");
    assert(Internal(set, "192.168.1.77"));
    assert(!Internal(set, "192.168.2.1"));
}

void testDefaultWarningGoesToLog() {
    std::ostringstream captured;
    auto& logger = s3meter::common::Logger::Instance();
    logger.SetOutput(&captured);
    logger.SetColor(false);
    logger.SetLevel(s3meter::common::LogLevel::WARN);

    PrefixSetPtr set = PrefixSet::Build("10.0.0.0/8,not-a-cidr");
    assert(set);
    assert(captured.str().find("not-a-cidr") != std::string::npos);
    assert(captured.str().find("WARN") != std::string::npos);

    logger.SetOutput(nullptr);
    logger.SetLevel(s3meter::common::LogLevel::ERROR);
}

void testDedupAndOverlap() {
    PrefixSetPtr set = PrefixSet::Build("10.1.2.3/8 10.0.0.0/8 10.20.0.0/16 10.0.0.0/8");
    assert(set);
    assert(set->prefixes().size() == 2);
    assert(set->toString() == "10.0.0.0/8,10.20.0.0/16");
    assert(Internal(set, "10.20.1.1"));
    assert(Internal(set, "10.99.1.1"));

    // Nested ranges listed narrowest first still cover the wide one.
    PrefixSetPtr nested = PrefixSet::Build("192.168.1.0/24 192.168.0.0/16 192.169.0.0/16");
    assert(Internal(nested, "192.168.200.1"));
    assert(Internal(nested, "192.169.0.1"));
    assert(!Internal(nested, "192.170.0.1"));
}

void testIpv6() {
    PrefixSetPtr set = PrefixSet::Build("fd00::/8, 2001:db8::/32, 10.0.0.0/8");
    assert(set);
    assert(Internal(set, "fd12:3456::1"));
    assert(Internal(set, "2001:db8:1::1"));
    assert(!Internal(set, "2001:db9::1"));
    assert(!Internal(set, "::1"));
    // IPv4 prefixes do not match unrelated IPv6 space.
    assert(!Internal(set, "::a00:1"));
}

void testMappedAddresses() {
    PrefixSetPtr set = PrefixSet::Build("10.0.0.0/8");
    assert(Internal(set, "::ffff:10.2.3.4"));
    assert(!Internal(set, "::ffff:8.8.8.8"));

    // IPv6 ranges that cover ::ffff:0:0/96 match mapped addresses too.
    assert(Internal(PrefixSet::Build("::/0"), "::ffff:1.2.3.4"));
    assert(Internal(PrefixSet::Build("::ffff:0:0/80"), "::ffff:1.2.3.4"));
    assert(Internal(PrefixSet::Build("::/64"), "::ffff:1.2.3.4"));
    assert(!Internal(PrefixSet::Build("2001:db8::/32"), "::ffff:1.2.3.4"));

    // A plain IPv4 address never matches an IPv6 range, even ::/0.
    assert(!Internal(PrefixSet::Build("::/0"), "1.2.3.4"));
    assert(!Internal(PrefixSet::Build("0.0.0.0/0"), "2001:db8::1"));

    // Mixed families in one set.
    PrefixSetPtr mixed = PrefixSet::Build("10.0.0.0/8 fd00::/8 ::ffff:0:0/80");
    assert(Internal(mixed, "10.9.9.9"));
    assert(Internal(mixed, "::ffff:10.9.9.9"));
    assert(Internal(mixed, "fd12::1"));
    assert(!Internal(mixed, "8.8.8.8"));
    assert(Internal(mixed, "::ffff:8.8.8.8"));
    assert(!Internal(mixed, "2001:db8::1"));

    // A mapped prefix of /96 or longer is the equivalent IPv4 prefix.
    assert(Internal(PrefixSet::Build("::ffff:0:0/96"), "8.8.8.8"));
}

void testInvalidAddress() {
    PrefixSetPtr set = PrefixSet::Build("0.0.0.0/0, ::/0");
    assert(set);
    assert(!PrefixSet::Contains(set, IpAddress()));
    assert(Internal(set, "8.8.8.8"));
    assert(Internal(set, "2001:4860::8888"));
}

int main() {
    s3meter::common::Logger::Instance().SetLevel(s3meter::common::LogLevel::ERROR);

    testBasicMembership();
    testSeparators();
    testEmptyAndInvalidConfig();
    testInvalidTokensSkipped();
    testDefaultWarningGoesToLog();
    testDedupAndOverlap();
    testIpv6();
    testMappedAddresses();
    testInvalidAddress();

    LOG_INFO << "PrefixSet tests PASS";
    return 0;
}
