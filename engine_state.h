#ifndef ENGINE_STATE_H
#define ENGINE_STATE_H

#include <cstdint>
#include <string_view>

namespace tcpengine
{

// Declaration order is the expected progression of a connection.
enum class engine_state : std::uint8_t
{
    kUnknown = 0,
    kInitialized,
    kListening,
    kNegotiating,
    kConnected,
    kDisconnecting,
    kDisconnected,
};

[[nodiscard]] std::string_view to_string(engine_state state);

[[nodiscard]] constexpr bool is_disposing(const engine_state state)
{
    return state == engine_state::kDisconnecting || state == engine_state::kDisconnected;
}

}    // namespace tcpengine

#endif
