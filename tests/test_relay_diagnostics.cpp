#include <gtest/gtest.h>
#include "client/relay_diagnostics.hpp"

#include <algorithm>

using namespace riglink;
using namespace riglink::client;

namespace {

RelayTestResults results(bool fwd_tcp, bool fwd_udp, bool upnp_tcp, bool upnp_udp, bool hole_punch) {
    RelayTestResults r;
    r.forward_tcp_port_working = fwd_tcp;
    r.forward_udp_port_working = fwd_udp;
    r.upnp_tcp_port_working = upnp_tcp;
    r.upnp_udp_port_working = upnp_udp;
    r.nat_supports_hole_punch = hole_punch;
    return r;
}

} // anonymous namespace

TEST(RelayDiagnosticsTest, ForwardedPortsPass) {
    EXPECT_TRUE(relay_test_passed(results(true, true, false, false, false)));
}

TEST(RelayDiagnosticsTest, UpnpPortsPass) {
    EXPECT_TRUE(relay_test_passed(results(false, false, true, true, false)));
}

TEST(RelayDiagnosticsTest, BothMechanismsFail) {
    EXPECT_FALSE(relay_test_passed(results(true, true, true, true, false)));
}

TEST(RelayDiagnosticsTest, AllFalseFails) {
    EXPECT_FALSE(relay_test_passed(results(false, false, false, false, false)));
}

TEST(RelayDiagnosticsTest, HolePunchFails) {
    EXPECT_FALSE(relay_test_passed(results(true, true, false, false, true)));
    EXPECT_FALSE(relay_test_passed(results(false, false, true, true, true)));
}

TEST(RelayDiagnosticsTest, PartialForwardFails) {
    EXPECT_FALSE(relay_test_passed(results(true, false, false, false, false)));
    EXPECT_FALSE(relay_test_passed(results(false, false, true, false, false)));
}

TEST(RelayDiagnosticsTest, SummaryListsEveryCheck) {
    auto summary = relay_test_summary(results(true, false, true, false, false));

    EXPECT_NE(summary.find("Forward Tcp Port:\ttrue"), std::string::npos);
    EXPECT_NE(summary.find("Forward Udp Port:\tfalse"), std::string::npos);
    EXPECT_NE(summary.find("UPNP Tcp Port:\t\ttrue"), std::string::npos);
    EXPECT_NE(summary.find("UPNP Udp Port:\t\tfalse"), std::string::npos);
    EXPECT_NE(summary.find("Nat Hole Punch:\t\tfalse"), std::string::npos);
    EXPECT_EQ(std::count(summary.begin(), summary.end(), '\n'), 4);
}
