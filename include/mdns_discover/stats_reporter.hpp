#pragma once

#include <iostream>
#include <vector>

#include "mdns_discover/resolver.hpp"
#include "mdns_discover/types.hpp"

namespace mdns_discover
{

// Human readable run summary: elapsed time, distinct service types, instances,
// rate, suppressed timeouts and errors, followed by every service type ordered
// by descending instance count. Does nothing when `enabled` is false.
void PrintSummary(const std::vector<Service>& discovered, Clock::time_point start, bool enabled,
                  const DiscoveryStats& stats, bool color, std::ostream& os = std::cerr);

}
