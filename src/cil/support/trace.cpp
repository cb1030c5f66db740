//===----------------------------------------------------------------------===//
//
// Part of the CilKit project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the trace channel. The environment lookup happens lazily through
// a function-local static so concurrent first calls initialise it exactly once;
// the flag itself is atomic so a tool can override it from its command line.
// Each line is assembled before it is written so lines from different threads
// do not interleave mid-message.
//
//===----------------------------------------------------------------------===//

#include "cil/support/trace.hpp"

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

namespace cil::support
{

bool parseTraceFlag(const char *value) noexcept
{
    if (!value || value[0] == '\0')
        return false;
    return std::strcmp(value, "0") != 0;
}

namespace
{
std::atomic<bool> &traceFlag() noexcept
{
    static std::atomic<bool> flag{parseTraceFlag(std::getenv(kTraceEnvVar))};
    return flag;
}
} // namespace

bool isTraceEnabled() noexcept
{
    return traceFlag().load(std::memory_order_relaxed);
}

void setTraceEnabled(bool enabled) noexcept
{
    traceFlag().store(enabled, std::memory_order_relaxed);
}

void trace(std::string_view channel, std::string_view message)
{
    if (!isTraceEnabled())
        return;
    std::string line;
    line.reserve(channel.size() + message.size() + 8);
    line.append("[cil:");
    line.append(channel);
    line.append("] ");
    line.append(message);
    line.push_back('\n');
    std::cerr << line;
}

} // namespace cil::support
