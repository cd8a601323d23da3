#include <cerrno>
#include <string>
#include <string_view>

#include <poll.h>
#include <unistd.h>

#include <boost/asio/error.hpp>

#include "log.h"
#include "line_reader.h"

namespace tcpengine
{

line_reader::line_reader(const int fd, const std::chrono::milliseconds poll_interval) : fd_(fd), poll_interval_(poll_interval) {}

boost::system::error_code line_reader::run(const line_handler& on_line)
{
    std::string pending;
    char buffer[4096];
    for (;;)
    {
        if (stop_requested())
        {
            return boost::asio::error::operation_aborted;
        }

        pollfd pfd{.fd = fd_, .events = POLLIN, .revents = 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (ready < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            const boost::system::error_code ec(errno, boost::system::system_category());
            LOG_WARN("line reader poll fd {} failed {}", fd_, ec.message());
            return ec;
        }
        if (ready == 0)
        {
            continue;
        }
        if ((pfd.revents & POLLNVAL) != 0)
        {
            LOG_WARN("line reader fd {} is not open", fd_);
            return boost::asio::error::bad_descriptor;
        }

        const auto n = ::read(fd_, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR || errno == EAGAIN)
            {
                continue;
            }
            const boost::system::error_code ec(errno, boost::system::system_category());
            LOG_WARN("line reader read fd {} failed {}", fd_, ec.message());
            return ec;
        }
        if (n == 0)
        {
            if (!pending.empty() && !stop_requested())
            {
                on_line(pending);
            }
            LOG_DEBUG("line reader fd {} reached eof", fd_);
            return {};
        }

        pending.append(buffer, static_cast<std::size_t>(n));
        std::size_t start = 0;
        for (auto end = pending.find('\n', start); end != std::string::npos; end = pending.find('\n', start))
        {
            if (stop_requested())
            {
                return boost::asio::error::operation_aborted;
            }
            std::string_view line(pending.data() + start, end - start);
            if (!line.empty() && line.back() == '\r')
            {
                line.remove_suffix(1);
            }
            on_line(std::string(line));
            start = end + 1;
        }
        pending.erase(0, start);
    }
}

}    // namespace tcpengine
