#include "client/relay_diagnostics.hpp"

#include <format>

namespace riglink::client {

bool relay_test_passed(const RelayTestResults& r) {
    bool forwarded = r.forward_tcp_port_working && r.forward_udp_port_working &&
                     !r.upnp_tcp_port_working && !r.upnp_udp_port_working;
    bool upnp = !r.forward_tcp_port_working && !r.forward_udp_port_working &&
                r.upnp_tcp_port_working && r.upnp_udp_port_working;
    return (forwarded || upnp) && !r.nat_supports_hole_punch;
}

std::string relay_test_summary(const RelayTestResults& r) {
    return std::format("Forward Tcp Port:\t{}\n"
                       "Forward Udp Port:\t{}\n"
                       "UPNP Tcp Port:\t\t{}\n"
                       "UPNP Udp Port:\t\t{}\n"
                       "Nat Hole Punch:\t\t{}",
                       r.forward_tcp_port_working, r.forward_udp_port_working,
                       r.upnp_tcp_port_working, r.upnp_udp_port_working,
                       r.nat_supports_hole_punch);
}

} // namespace riglink::client
