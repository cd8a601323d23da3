#include <mutex>
#include <chrono>
#include <future>
#include <string>
#include <vector>
#include <utility>
#include <exception>

#include <boost/system/error_code.hpp>

#include "log.h"
#include "engine_errors.h"
#include "disposal_tracker.h"

namespace tcpengine
{

disposal_tracker::disposal_tracker(const std::chrono::milliseconds async_timeout) : async_timeout_(async_timeout) {}

boost::system::error_code disposal_tracker::add_action(std::string name, action fn)
{
    return add_entry(entry{.name = std::move(name), .sync_fn = std::move(fn), .async_fn = nullptr});
}

boost::system::error_code disposal_tracker::add_async_action(std::string name, async_action fn)
{
    return add_entry(entry{.name = std::move(name), .sync_fn = nullptr, .async_fn = std::move(fn)});
}

boost::system::error_code disposal_tracker::add_entry(entry e)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (disposed_)
    {
        LOG_WARN("disposal action {} registered after disposal", e.name);
        return engine_errc::kAlreadyDisposed;
    }
    entries_.push_back(std::move(e));
    return {};
}

std::expected<std::vector<disposal_tracker::failure>, boost::system::error_code> disposal_tracker::dispose()
{
    std::vector<entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disposed_)
        {
            return std::unexpected(make_error_code(engine_errc::kAlreadyDisposed));
        }
        disposed_ = true;
        entries.swap(entries_);
    }

    std::vector<failure> failures;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it)
    {
        try
        {
            if (const auto ec = run_entry(*it); ec)
            {
                failures.push_back(failure{.name = it->name, .reason = ec.message()});
            }
        }
        catch (const std::exception& ex)
        {
            failures.push_back(failure{.name = it->name, .reason = ex.what()});
        }
        catch (...)
        {
            failures.push_back(failure{.name = it->name, .reason = "unknown exception"});
        }
        LOG_TRACE("disposal action {} done", it->name);
    }
    return failures;
}

boost::system::error_code disposal_tracker::run_entry(entry& e) const
{
    if (e.sync_fn)
    {
        return e.sync_fn();
    }
    if (!e.async_fn)
    {
        return {};
    }

    auto future = e.async_fn();
    if (!future.valid())
    {
        return {};
    }
    if (future.wait_for(async_timeout_) != std::future_status::ready)
    {
        return boost::system::errc::make_error_code(boost::system::errc::timed_out);
    }
    return future.get();
}

bool disposal_tracker::disposed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return disposed_;
}

std::size_t disposal_tracker::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}    // namespace tcpengine
