#ifndef STOP_DISPATCH_H
#define STOP_DISPATCH_H

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <cstdint>
#include <utility>
#include <type_traits>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/error_code.hpp>

namespace tcpengine::detail
{

constexpr auto kCleanupDispatchWaitTimeout = std::chrono::milliseconds(1000);

enum class dispatch_timeout_policy : std::uint8_t
{
    kNoInline,
    kRunInline,
};

// Runs a cleanup step on the executor that owns the sockets and waits for its result.
// The step runs inline when the io_context is stopped or this thread already runs the executor.
// On timeout the caller either gets errc::timed_out while the step stays queued, or the
// step runs inline. It never runs twice.
template <typename Executor, typename Fn>
[[nodiscard]] boost::system::error_code dispatch_cleanup_or_run_inline(boost::asio::io_context& io_context,
                                                                       const Executor& executor,
                                                                       Fn&& fn,
                                                                       const dispatch_timeout_policy timeout_policy = dispatch_timeout_policy::kRunInline,
                                                                       const std::chrono::milliseconds timeout = kCleanupDispatchWaitTimeout)
{
    if (io_context.stopped() || executor.running_in_this_thread())
    {
        return std::forward<Fn>(fn)();
    }

    using fn_type = std::decay_t<Fn>;

    struct dispatch_state
    {
        std::atomic<bool> executed{false};
        std::promise<boost::system::error_code> dispatch_done;
        fn_type handler;

        explicit dispatch_state(fn_type h) : handler(std::move(h)) {}
    };

    auto state = std::make_shared<dispatch_state>(std::forward<Fn>(fn));
    auto future = state->dispatch_done.get_future();

    boost::asio::dispatch(executor,
                          [state]()
                          {
                              boost::system::error_code ec;
                              bool expected = false;
                              if (state->executed.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
                              {
                                  ec = state->handler();
                              }
                              state->dispatch_done.set_value(ec);
                          });

    if (future.wait_for(timeout) == std::future_status::ready)
    {
        return future.get();
    }
    if (timeout_policy != dispatch_timeout_policy::kRunInline)
    {
        return boost::system::errc::make_error_code(boost::system::errc::timed_out);
    }

    bool expected = false;
    if (state->executed.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return state->handler();
    }
    // The io thread picked it up between the timeout and now.
    return future.get();
}

}    // namespace tcpengine::detail

#endif
