#ifndef ENGINE_ERRORS_H
#define ENGINE_ERRORS_H

#include <type_traits>

#include <boost/system/error_code.hpp>

namespace tcpengine
{

// Contract violations. Runtime failures use boost::system::errc.
enum class engine_errc : int
{
    kInvalidState = 1,
    kAlreadyDisposed,
    kUnsetProperty,
};

[[nodiscard]] const boost::system::error_category& engine_category() noexcept;

[[nodiscard]] inline boost::system::error_code make_error_code(const engine_errc e) noexcept
{
    return {static_cast<int>(e), engine_category()};
}

}    // namespace tcpengine

namespace boost::system
{
template <>
struct is_error_code_enum<tcpengine::engine_errc> : std::true_type
{
};
}    // namespace boost::system

#endif
