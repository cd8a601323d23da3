#include <mutex>
#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "test_util.h"
#include "engine_info.h"
#include "engine_errors.h"
#include "engine_protocol.h"
#include "tcp_execution_engine.h"

namespace tcpengine
{

class tcp_execution_engine_test : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        acceptor_ = std::make_unique<tcp::acceptor>(acceptor_io_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        port_ = acceptor_->local_endpoint().port();
        ASSERT_FALSE(info_.set_test_assembly_unique_id("asm-7"));
        ASSERT_FALSE(info_.set_test_framework_display_name("NUnit"));
    }

    std::shared_ptr<tcp_execution_engine> make_engine(const execution_engine_info& info)
    {
        execution_engine_handlers handlers;
        handlers.on_find = [this](const std::string& id) { record("find " + id); };
        handlers.on_run = [this](const std::string& id) { record("run " + id); };
        handlers.on_cancel = [this](const std::string& id) { record("cancel " + id); };
        handlers.on_quit = [this]() { record("quit"); };
        return std::make_shared<tcp_execution_engine>(io_.context(), test::test_engine_options("e1"), info, std::move(handlers), recorder_.sink());
    }

    std::shared_ptr<tcp_execution_engine> make_engine() { return make_engine(info_); }

    // Connects the engine to the fake runner and completes INFO negotiation.
    void negotiate(const std::shared_ptr<tcp_execution_engine>& engine)
    {
        ASSERT_FALSE(engine->start(port_));
        ASSERT_TRUE(runner_.accept(*acceptor_));
        EXPECT_EQ(engine->state(), engine_state::kNegotiating);

        runner_.write(test::frame_of("INFO", R"({"protocolVersion":"1.0"})") + '\0');
        const auto reply = runner_.read_frame();
        ASSERT_TRUE(reply.has_value());
        EXPECT_EQ(*reply, test::frame_of("INFO", serialize_engine_info(info_)));
        ASSERT_TRUE(test::wait_until([&engine]() { return engine->state() == engine_state::kConnected; }, test::kWaitTimeout));
    }

    void record(std::string event)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    [[nodiscard]] std::vector<std::string> events() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

    test::io_thread io_;
    test::diagnostic_recorder recorder_;
    boost::asio::io_context acceptor_io_;
    std::unique_ptr<tcp::acceptor> acceptor_;
    std::uint16_t port_ = 0;
    test::raw_peer runner_;
    execution_engine_info info_;

    mutable std::mutex mutex_;
    std::vector<std::string> events_;
};

TEST_F(tcp_execution_engine_test, StartRequiresCompleteInfo)
{
    const auto engine = make_engine(execution_engine_info{});
    EXPECT_EQ(engine->start(port_), boost::system::errc::make_error_code(boost::system::errc::invalid_argument));
    EXPECT_EQ(engine->state(), engine_state::kInitialized);
}

TEST_F(tcp_execution_engine_test, StartRequiresSharedOwnership)
{
    tcp_execution_engine engine(io_.context(), test::test_engine_options(), info_, execution_engine_handlers{}, recorder_.sink());
    EXPECT_EQ(engine.start(port_), make_error_code(engine_errc::kInvalidState));
}

TEST_F(tcp_execution_engine_test, StartFailsWhenRunnerIsGone)
{
    acceptor_->close();
    const auto engine = make_engine();
    EXPECT_TRUE(engine->start(port_));
    EXPECT_EQ(engine->state(), engine_state::kInitialized);
    EXPECT_TRUE(recorder_.contains("connect to runner port " + std::to_string(port_) + " failed"));
}

TEST_F(tcp_execution_engine_test, HandshakeAnswersRunnerInfo)
{
    const auto engine = make_engine();
    negotiate(engine);

    ASSERT_TRUE(engine->runner_info().has_value());
    EXPECT_EQ(engine->runner_info()->protocol_version(), "1.0");
    EXPECT_TRUE(recorder_.contains("execution(e1): engine state transition from Negotiating to Connected"));
    EXPECT_EQ(engine->start(port_), make_error_code(engine_errc::kInvalidState));
}

TEST_F(tcp_execution_engine_test, OperationsBeforeHandshakeIgnored)
{
    const auto engine = make_engine();
    ASSERT_FALSE(engine->start(port_));
    ASSERT_TRUE(runner_.accept(*acceptor_));

    runner_.write(test::frame_of("FIND", "op-0") + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("execution(e1): received FIND while Negotiating, ignoring it"); }, test::kWaitTimeout));
    EXPECT_TRUE(events().empty());
}

TEST_F(tcp_execution_engine_test, OperationsReachCallbacksInOrder)
{
    const auto engine = make_engine();
    negotiate(engine);

    runner_.write(test::frame_of("FIND", "op-1") + '\0');
    runner_.write(test::frame_of("RUN", "op-2") + '\0');
    runner_.write(test::frame_of("CANCEL", "op-3") + '\0');
    runner_.write(std::string("CANCEL") + '\0');
    runner_.write(std::string("QUIT") + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return events().size() == 5; }, test::kWaitTimeout));

    EXPECT_EQ(events(), (std::vector<std::string>{"find op-1", "run op-2", "cancel op-3", "cancel ", "quit"}));
    EXPECT_TRUE(engine->quit_requested());
}

TEST_F(tcp_execution_engine_test, OperationWithoutIdDiagnosed)
{
    const auto engine = make_engine();
    negotiate(engine);

    runner_.write(std::string("RUN") + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("execution(e1): RUN data is missing the operation ID"); }, test::kWaitTimeout));
    EXPECT_TRUE(events().empty());
}

TEST_F(tcp_execution_engine_test, RunnerSideCommandsRejected)
{
    const auto engine = make_engine();
    negotiate(engine);

    runner_.write(test::frame_of("MSG", test::frame_of("op", "{}")) + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("execution(e1): received unknown command 'MSG"); }, test::kWaitTimeout));
}

TEST_F(tcp_execution_engine_test, SendMessageWritesFrame)
{
    const auto engine = make_engine();
    negotiate(engine);

    EXPECT_FALSE(engine->send_message("op-1", R"({"type":"testStarting"})"));
    EXPECT_EQ(runner_.read_frame(), std::optional<std::string>(test::frame_of("MSG", test::frame_of("op-1", R"({"type":"testStarting"})"))));

    const auto invalid = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    EXPECT_EQ(engine->send_message(test::frame_of("op", "1"), "{}"), invalid);
    EXPECT_EQ(engine->send_message("op-1", std::string("{}") + '\0'), invalid);
    EXPECT_FALSE(runner_.read_frame(std::chrono::milliseconds(200)).has_value());
}

TEST_F(tcp_execution_engine_test, SendMessageWithoutRunnerIsDiagnosedNoop)
{
    const auto engine = make_engine();
    EXPECT_FALSE(engine->send_message("op-1", "{}"));
    EXPECT_TRUE(recorder_.contains("execution(e1): MSG called when there is no connected runner"));
}

TEST_F(tcp_execution_engine_test, CallbackCanReplyWithMessages)
{
    std::shared_ptr<tcp_execution_engine> engine;
    execution_engine_handlers handlers;
    handlers.on_run = [&engine](const std::string& id)
    {
        (void)engine->send_message(id, R"({"type":"started"})");
        (void)engine->send_message(id, R"({"type":"completed"})");
    };
    engine = std::make_shared<tcp_execution_engine>(io_.context(), test::test_engine_options("e1"), info_, std::move(handlers), recorder_.sink());
    negotiate(engine);

    runner_.write(test::frame_of("RUN", "op-9") + '\0');
    EXPECT_EQ(runner_.read_frame(), std::optional<std::string>(test::frame_of("MSG", test::frame_of("op-9", R"({"type":"started"})"))));
    EXPECT_EQ(runner_.read_frame(), std::optional<std::string>(test::frame_of("MSG", test::frame_of("op-9", R"({"type":"completed"})"))));
    EXPECT_FALSE(engine->dispose());
}

TEST_F(tcp_execution_engine_test, DisposeClosesWithoutQuit)
{
    const auto engine = make_engine();
    negotiate(engine);

    EXPECT_FALSE(engine->dispose());
    EXPECT_EQ(engine->state(), engine_state::kDisconnected);
    EXPECT_FALSE(runner_.read_frame().has_value());
    EXPECT_TRUE(runner_.wait_closed());
}

}    // namespace tcpengine
