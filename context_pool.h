#ifndef CONTEXT_POOL_H
#define CONTEXT_POOL_H

#include <atomic>
#include <memory>
#include <vector>
#include <cstddef>

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace tcpengine
{

// One io_context per thread. Engines pick a context round robin and keep it for life.
class io_context_pool
{
   public:
    io_context_pool(std::size_t pool_size, boost::system::error_code& ec);

    io_context_pool(const io_context_pool&) = delete;
    io_context_pool& operator=(const io_context_pool&) = delete;

    // Blocks until every context has stopped.
    void run();
    void stop();

    [[nodiscard]] boost::asio::io_context& get_io_context();
    [[nodiscard]] std::size_t size() const { return io_contexts_.size(); }

   private:
    std::atomic<std::size_t> next_io_context_{0};
    std::vector<std::shared_ptr<boost::asio::io_context>> io_contexts_;
    std::vector<std::shared_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>> work_guards_;
};

}    // namespace tcpengine

#endif
