#pragma once

#include "common/types.hpp"

#include <string>

namespace riglink::client {

// A relay path works when exactly one of port forwarding or UPnP covers both
// TCP and UDP and the NAT was not needed for hole punching.
bool relay_test_passed(const RelayTestResults& results);

// Five "<check>: true|false" lines for display
std::string relay_test_summary(const RelayTestResults& results);

} // namespace riglink::client
