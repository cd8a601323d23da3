#ifndef DIAGNOSTICS_H
#define DIAGNOSTICS_H

#include <string>
#include <cstdint>
#include <functional>
#include <string_view>

namespace tcpengine
{

enum class diagnostic_level : std::uint8_t
{
    kInfo,
    kWarning,
    kError,
};

struct diagnostic_message
{
    diagnostic_level level = diagnostic_level::kInfo;
    std::string text;
};

// Receives every diagnostic an engine emits, in addition to the log.
// Called from whichever thread produced the diagnostic.
using diagnostic_sink = std::function<void(const diagnostic_message&)>;

[[nodiscard]] constexpr std::string_view to_string(const diagnostic_level level)
{
    switch (level)
    {
        case diagnostic_level::kInfo:
            return "INF";
        case diagnostic_level::kWarning:
            return "WRN";
        case diagnostic_level::kError:
            return "ERR";
    }
    return "UNK";
}

}    // namespace tcpengine

#endif
