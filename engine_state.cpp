#include <string_view>

#include "engine_state.h"

namespace tcpengine
{

std::string_view to_string(const engine_state state)
{
    switch (state)
    {
        case engine_state::kUnknown:
            return "Unknown";
        case engine_state::kInitialized:
            return "Initialized";
        case engine_state::kListening:
            return "Listening";
        case engine_state::kNegotiating:
            return "Negotiating";
        case engine_state::kConnected:
            return "Connected";
        case engine_state::kDisconnecting:
            return "Disconnecting";
        case engine_state::kDisconnected:
            return "Disconnected";
    }
    return "Invalid";
}

}    // namespace tcpengine
