#ifndef BUFFERED_TCP_CLIENT_H
#define BUFFERED_TCP_CLIENT_H

#include <deque>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "log_context.h"

namespace tcpengine
{

using boost::asio::ip::tcp;
using boost::asio::awaitable;

using io_strand = boost::asio::strand<boost::asio::io_context::executor_type>;

// Frames a connected socket into EOM terminated records. Reads and writes both run
// on the owning engine's strand; each frame goes out in a single write so concurrent
// senders never interleave bytes.
class buffered_tcp_client : public std::enable_shared_from_this<buffered_tcp_client>
{
   public:
    // Called on the strand with one frame, terminator stripped.
    using frame_handler = std::function<void(std::string_view frame)>;
    using termination_handler = std::function<void(const boost::system::error_code& ec)>;

    buffered_tcp_client(engine_context ctx, io_strand strand, std::shared_ptr<tcp::socket> socket, std::size_t max_frame_size);

    void set_frame_handler(frame_handler handler) { frame_handler_ = std::move(handler); }
    // Invoked once when the read side fails for any reason other than EOF or close.
    void set_abnormal_termination_handler(termination_handler handler) { abnormal_termination_handler_ = std::move(handler); }

    void start();

    // Queues an already encoded frame. Frames sent after close are dropped.
    void send(std::string frame);

    // Flushes queued frames then stops the read loop. The socket is left open for its owner.
    [[nodiscard]] std::future<boost::system::error_code> async_close();

    // Flushes queued frames then closes the socket as well. Nothing to wait on, so it is
    // safe to call from a handler already running on the strand.
    void close_when_flushed();

    [[nodiscard]] bool closed() const { return closed_.load(std::memory_order_acquire); }
    [[nodiscard]] std::uint64_t frames_sent() const { return frames_sent_.load(std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t frames_received() const { return frames_received_.load(std::memory_order_relaxed); }

   private:
    awaitable<void> read_loop();
    void on_read_finished(const boost::system::error_code& ec);

    void enqueue(std::string frame);
    void do_write();
    void on_write(const boost::system::error_code& ec);
    void finish_close(const boost::system::error_code& ec);
    void shutdown_socket();

   private:
    engine_context ctx_;
    io_strand strand_;
    std::shared_ptr<tcp::socket> socket_;
    std::size_t max_frame_size_;
    frame_handler frame_handler_;
    termination_handler abnormal_termination_handler_;

    std::deque<std::string> write_queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool reading_ = false;
    bool close_socket_on_finish_ = false;
    std::vector<std::promise<boost::system::error_code>> close_waiters_;
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> frames_sent_{0};
    std::atomic<std::uint64_t> frames_received_{0};
};

}    // namespace tcpengine

#endif
