#include <future>
#include <memory>
#include <string>
#include <utility>
#include <string_view>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "log.h"
#include "engine_protocol.h"
#include "buffered_tcp_client.h"

namespace tcpengine
{

buffered_tcp_client::buffered_tcp_client(engine_context ctx, io_strand strand, std::shared_ptr<tcp::socket> socket, const std::size_t max_frame_size)
    : ctx_(std::move(ctx)), strand_(std::move(strand)), socket_(std::move(socket)), max_frame_size_(max_frame_size)
{
}

void buffered_tcp_client::start()
{
    boost::asio::co_spawn(strand_, [self = shared_from_this()]() { return self->read_loop(); }, boost::asio::detached);
}

awaitable<void> buffered_tcp_client::read_loop()
{
    reading_ = true;
    std::string buffer;
    for (;;)
    {
        boost::system::error_code ec;
        const auto n = co_await boost::asio::async_read_until(
            *socket_, boost::asio::dynamic_buffer(buffer, max_frame_size_), protocol::kEndOfMessage, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            on_read_finished(ec);
            co_return;
        }

        const std::string frame = buffer.substr(0, n - 1);
        buffer.erase(0, n);
        frames_received_.fetch_add(1, std::memory_order_relaxed);
        LOG_CTX_TRACE(ctx_, "{} frame {} bytes {}", log_event::kRecv, frame.size(), protocol::printable_frame(frame));
        if (closing_)
        {
            continue;
        }
        if (frame_handler_)
        {
            frame_handler_(frame);
        }
    }
}

void buffered_tcp_client::on_read_finished(const boost::system::error_code& ec)
{
    reading_ = false;
    if (ec == boost::asio::error::eof)
    {
        LOG_CTX_INFO(ctx_, "{} peer closed connection", log_event::kRecv);
        return;
    }
    if (ec == boost::asio::error::operation_aborted || closing_)
    {
        LOG_CTX_DEBUG(ctx_, "{} read loop stopped", log_event::kRecv);
        return;
    }

    auto reason = ec;
    if (ec == boost::asio::error::not_found)
    {
        reason = boost::system::errc::make_error_code(boost::system::errc::message_size);
        LOG_CTX_ERROR(ctx_, "{} frame exceeds {} bytes", log_event::kRecv, max_frame_size_);
    }
    else
    {
        LOG_CTX_ERROR(ctx_, "{} read failed {}", log_event::kRecv, ec.message());
    }
    if (abnormal_termination_handler_)
    {
        abnormal_termination_handler_(reason);
    }
}

void buffered_tcp_client::send(std::string frame)
{
    boost::asio::post(strand_, [self = shared_from_this(), frame = std::move(frame)]() mutable { self->enqueue(std::move(frame)); });
}

void buffered_tcp_client::enqueue(std::string frame)
{
    if (closing_ || closed())
    {
        LOG_CTX_DEBUG(ctx_, "{} dropped frame after close {}", log_event::kSend, protocol::printable_frame(frame));
        return;
    }
    write_queue_.push_back(std::move(frame));
    if (!writing_)
    {
        do_write();
    }
}

void buffered_tcp_client::do_write()
{
    writing_ = true;
    const auto& frame = write_queue_.front();
    boost::asio::async_write(*socket_,
                             boost::asio::buffer(frame),
                             boost::asio::bind_executor(strand_,
                                                        [self = shared_from_this()](const boost::system::error_code& ec, std::size_t)
                                                        { self->on_write(ec); }));
}

void buffered_tcp_client::on_write(const boost::system::error_code& ec)
{
    if (ec)
    {
        LOG_CTX_WARN(ctx_, "{} write failed {} dropping {} frames", log_event::kSend, ec.message(), write_queue_.size());
        write_queue_.clear();
        writing_ = false;
        if (closing_)
        {
            finish_close(ec);
        }
        return;
    }

    LOG_CTX_TRACE(ctx_, "{} frame {}", log_event::kSend, protocol::printable_frame(write_queue_.front()));
    write_queue_.pop_front();
    frames_sent_.fetch_add(1, std::memory_order_relaxed);
    if (!write_queue_.empty())
    {
        do_write();
        return;
    }
    writing_ = false;
    if (closing_)
    {
        finish_close({});
    }
}

std::future<boost::system::error_code> buffered_tcp_client::async_close()
{
    std::promise<boost::system::error_code> promise;
    auto future = promise.get_future();
    boost::asio::post(strand_,
                      [self = shared_from_this(), promise = std::move(promise)]() mutable
                      {
                          if (self->closed())
                          {
                              promise.set_value({});
                              return;
                          }
                          self->close_waiters_.push_back(std::move(promise));
                          self->closing_ = true;
                          if (!self->writing_)
                          {
                              self->finish_close({});
                          }
                      });
    return future;
}

void buffered_tcp_client::close_when_flushed()
{
    boost::asio::post(strand_,
                      [self = shared_from_this()]()
                      {
                          self->close_socket_on_finish_ = true;
                          if (self->closed())
                          {
                              self->shutdown_socket();
                              return;
                          }
                          self->closing_ = true;
                          if (!self->writing_)
                          {
                              self->finish_close({});
                          }
                      });
}

void buffered_tcp_client::finish_close(const boost::system::error_code& ec)
{
    if (reading_)
    {
        boost::system::error_code cancel_ec;
        socket_->cancel(cancel_ec);
        if (cancel_ec)
        {
            LOG_CTX_DEBUG(ctx_, "{} cancel read failed {}", log_event::kDispose, cancel_ec.message());
        }
    }
    closed_.store(true, std::memory_order_release);
    LOG_CTX_DEBUG(ctx_, "{} client closed sent {} received {}", log_event::kDispose, frames_sent(), frames_received());
    if (close_socket_on_finish_)
    {
        shutdown_socket();
    }

    auto waiters = std::move(close_waiters_);
    close_waiters_.clear();
    for (auto& waiter : waiters)
    {
        waiter.set_value(ec);
    }
}

void buffered_tcp_client::shutdown_socket()
{
    if (!socket_->is_open())
    {
        return;
    }
    boost::system::error_code ec;
    socket_->shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected)
    {
        LOG_CTX_DEBUG(ctx_, "{} socket shutdown failed {}", log_event::kDispose, ec.message());
    }
    socket_->close(ec);
    if (ec)
    {
        LOG_CTX_WARN(ctx_, "{} socket close failed {}", log_event::kDispose, ec.message());
    }
}

}    // namespace tcpengine
