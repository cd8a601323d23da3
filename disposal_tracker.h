#ifndef DISPOSAL_TRACKER_H
#define DISPOSAL_TRACKER_H

#include <mutex>
#include <chrono>
#include <future>
#include <string>
#include <vector>
#include <expected>
#include <functional>

#include <boost/system/error_code.hpp>

namespace tcpengine
{

// Cleanup actions registered as resources are acquired and released in reverse
// registration order, exactly once. A failing action does not stop the others.
class disposal_tracker
{
   public:
    using action = std::function<boost::system::error_code()>;
    using async_action = std::function<std::future<boost::system::error_code>()>;

    struct failure
    {
        std::string name;
        std::string reason;
    };

    static constexpr auto kDefaultAsyncTimeout = std::chrono::milliseconds(5000);

    explicit disposal_tracker(std::chrono::milliseconds async_timeout = kDefaultAsyncTimeout);

    disposal_tracker(const disposal_tracker&) = delete;
    disposal_tracker& operator=(const disposal_tracker&) = delete;

    [[nodiscard]] boost::system::error_code add_action(std::string name, action fn);
    [[nodiscard]] boost::system::error_code add_async_action(std::string name, async_action fn);

    // Returns the failed actions, or engine_errc::kAlreadyDisposed on a second call.
    [[nodiscard]] std::expected<std::vector<failure>, boost::system::error_code> dispose();

    [[nodiscard]] bool disposed() const;
    [[nodiscard]] std::size_t size() const;

   private:
    struct entry
    {
        std::string name;
        action sync_fn;
        async_action async_fn;
    };

    [[nodiscard]] boost::system::error_code add_entry(entry e);
    [[nodiscard]] boost::system::error_code run_entry(entry& e) const;

    mutable std::mutex mutex_;
    std::vector<entry> entries_;
    bool disposed_ = false;
    std::chrono::milliseconds async_timeout_;
};

}    // namespace tcpengine

#endif
