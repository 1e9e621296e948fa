#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace mdns_discover
{

enum class ErrorCode {
    None,
    ResolverInitFailed,   // fatal to one query, never to a multi-service run
    BrowseFailed,         // same
    TimedOutZero,         // deadline passed without a single result
    NoServicesConfigured, // empty catalog, nothing to do
    Internal              // unexpected exception escaped a worker
};
std::string ToString(ErrorCode code);

// Process exit statuses
enum class ExitCode : int {
    Ok = 0,
    RuntimeError = 1,
    Usage = 2,
    ResolverInit = 3,
    BrowseFailed = 4,
    TimeoutZero = 5
};

// Thrown by resolvers and by DiscoverAll, carries its classification
class DiscoveryError : public std::runtime_error
{
public:
    DiscoveryError(ErrorCode code, const std::string& detail);

    [[nodiscard]] ErrorCode Code() const noexcept { return m_code; }

private:
    ErrorCode m_code;
};

// Bad flags, values or subcommands
class UsageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

ExitCode ExitCodeFor(ErrorCode code);

// Picks the exit code of the highest-precedence classification present.
// Precedence: ResolverInitFailed, BrowseFailed, TimedOutZero, Internal, NoServicesConfigured.
ExitCode SelectExitCode(const std::vector<ErrorCode>& codes);

}
