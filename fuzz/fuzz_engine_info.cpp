#include <cstddef>
#include <cstdint>
#include <string_view>

#include "engine_info.h"

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    const std::string_view json(reinterpret_cast<const char*>(data), size);

    const auto info = tcpengine::deserialize_execution_engine_info(json);
    if (info)
    {
        const auto decoded = tcpengine::deserialize_execution_engine_info(tcpengine::serialize_engine_info(*info));
        if (!decoded || *decoded != *info)
        {
            __builtin_trap();
        }
    }

    (void)tcpengine::deserialize_runner_engine_info(json);
    return 0;
}
