#include "mdns_discover/catalog.hpp"

namespace mdns_discover
{

const std::vector<std::string>& BuiltinServiceTypes()
{
    static const std::vector<std::string> kServiceTypes = {
#include "catalog_data.inc"
    };
    return kServiceTypes;
}

}
