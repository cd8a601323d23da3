#include <string>
#include <cstddef>
#include <cstdint>

#include "config.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    if (size == 0)
    {
        return 0;
    }

    const std::string input(reinterpret_cast<const char*>(data), size);

    const auto cfg = tcpengine::deserialize_config_with_error(input);
    if (cfg)
    {
        // anything accepted must dump back to an accepted document
        const auto again = tcpengine::deserialize_config_with_error(tcpengine::dump_config(*cfg));
        if (!again)
        {
            __builtin_trap();
        }
    }

    return 0;
}
