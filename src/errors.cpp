#include "mdns_discover/errors.hpp"

#include <algorithm>
#include <array>

#include <fmt/core.h>

namespace mdns_discover
{

namespace
{

constexpr std::array<ErrorCode, 5> kExitPrecedence = {
    ErrorCode::ResolverInitFailed,
    ErrorCode::BrowseFailed,
    ErrorCode::TimedOutZero,
    ErrorCode::Internal,
    ErrorCode::NoServicesConfigured,
};

std::string Describe(ErrorCode code, const std::string& detail)
{
    if (detail.empty()) {
        return ToString(code);
    }
    return fmt::format("{}: {}", ToString(code), detail);
}

}

std::string ToString(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None: return "ok";
        case ErrorCode::ResolverInitFailed: return "resolver init failed";
        case ErrorCode::BrowseFailed: return "browse failed";
        case ErrorCode::TimedOutZero: return "timeout no results";
        case ErrorCode::NoServicesConfigured: return "no built-in services configured";
        case ErrorCode::Internal: return "internal error";
    }
    return "";
}

DiscoveryError::DiscoveryError(ErrorCode code, const std::string& detail)
: std::runtime_error(Describe(code, detail))
, m_code(code)
{}

ExitCode ExitCodeFor(ErrorCode code)
{
    switch (code) {
        case ErrorCode::None: return ExitCode::Ok;
        case ErrorCode::ResolverInitFailed: return ExitCode::ResolverInit;
        case ErrorCode::BrowseFailed: return ExitCode::BrowseFailed;
        case ErrorCode::TimedOutZero: return ExitCode::TimeoutZero;
        case ErrorCode::NoServicesConfigured: return ExitCode::Usage;
        case ErrorCode::Internal: return ExitCode::RuntimeError;
    }
    return ExitCode::RuntimeError;
}

ExitCode SelectExitCode(const std::vector<ErrorCode>& codes)
{
    for (const auto code : kExitPrecedence) {
        if (std::find(codes.begin(), codes.end(), code) != codes.end()) {
            return ExitCodeFor(code);
        }
    }
    return ExitCode::Ok;
}

}
