#ifndef LINE_READER_H
#define LINE_READER_H

#include <atomic>
#include <chrono>
#include <string>
#include <functional>

#include <boost/system/error_code.hpp>

namespace tcpengine
{

// Reads newline terminated lines from a descriptor. The descriptor is polled, so a thread
// blocked in run() notices stop() within one poll interval and can be joined.
class line_reader
{
   public:
    using line_handler = std::function<void(const std::string& line)>;

    static constexpr auto kDefaultPollInterval = std::chrono::milliseconds(100);

    explicit line_reader(int fd, std::chrono::milliseconds poll_interval = kDefaultPollInterval);

    line_reader(const line_reader&) = delete;
    line_reader& operator=(const line_reader&) = delete;

    // Delivers each line without its terminator until EOF, a read error or stop(). A last
    // line without a newline is still delivered at EOF, nothing is delivered after stop().
    // Returns {} on EOF and operation_aborted when stopped.
    boost::system::error_code run(const line_handler& on_line);

    void stop() { stop_requested_.store(true, std::memory_order_release); }
    [[nodiscard]] bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

   private:
    int fd_;
    std::chrono::milliseconds poll_interval_;
    std::atomic<bool> stop_requested_{false};
};

}    // namespace tcpengine

#endif
