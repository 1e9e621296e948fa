#pragma once

#include <string>
#include <vector>

namespace mdns_discover
{

// Service types compiled in from data/*.txt, in file then line order
const std::vector<std::string>& BuiltinServiceTypes();

}
