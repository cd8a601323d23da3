#include <string>

#include "engine_errors.h"

namespace tcpengine
{

namespace
{

class engine_category_impl : public boost::system::error_category
{
   public:
    [[nodiscard]] const char* name() const noexcept override { return "tcpengine"; }

    [[nodiscard]] std::string message(const int ev) const override
    {
        switch (static_cast<engine_errc>(ev))
        {
            case engine_errc::kInvalidState:
                return "operation not valid in the current engine state";
            case engine_errc::kAlreadyDisposed:
                return "engine already disposed";
            case engine_errc::kUnsetProperty:
                return "property has not been set";
        }
        return "unknown tcpengine error";
    }
};

}    // namespace

const boost::system::error_category& engine_category() noexcept
{
    static const engine_category_impl category;
    return category;
}

}    // namespace tcpengine
