#include <mutex>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <optional>
#include <stdexcept>

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

#include "test_util.h"
#include "engine_errors.h"
#include "engine_message.h"
#include "engine_protocol.h"
#include "tcp_runner_engine.h"

namespace tcpengine
{

namespace
{

constexpr std::string_view kExecutionInfo = R"({"protocolVersion":"1.0","testAssemblyUniqueID":"asm-42","testFrameworkDisplayName":"xUnit.net"})";

struct dispatched_message
{
    std::string operation_id;
    engine_message message;
};

}    // namespace

class tcp_runner_engine_test : public ::testing::Test
{
   protected:
    std::shared_ptr<tcp_runner_engine> make_runner(config::engine_t options = test::test_engine_options("r1"))
    {
        return std::make_shared<tcp_runner_engine>(
            io_.context(),
            options,
            [this](const std::string& operation_id, const engine_message& message)
            {
                if (throw_from_dispatcher_.load())
                {
                    throw std::runtime_error("dispatcher rejected message");
                }
                std::lock_guard<std::mutex> lock(mutex_);
                dispatched_.push_back(dispatched_message{.operation_id = operation_id, .message = message});
                return keep_going_.load();
            },
            recorder_.sink());
    }

    std::uint16_t start(const std::shared_ptr<tcp_runner_engine>& runner)
    {
        const auto port = runner->start();
        EXPECT_TRUE(port.has_value());
        return port.value_or(0);
    }

    // Connects the raw peer, consumes the runner INFO and answers it.
    void negotiate(const std::shared_ptr<tcp_runner_engine>& runner, test::raw_peer& peer, const std::string_view info_json = kExecutionInfo)
    {
        ASSERT_TRUE(peer.connect(start(runner)));
        const auto info = peer.read_frame();
        ASSERT_TRUE(info.has_value());
        ASSERT_EQ(*info, test::frame_of("INFO", R"({"protocolVersion":"1.0"})"));
        peer.write(test::frame_of("INFO", info_json) + '\0');
        ASSERT_TRUE(test::wait_until([&runner]() { return runner->state() == engine_state::kConnected; }, test::kWaitTimeout));
    }

    [[nodiscard]] std::vector<dispatched_message> dispatched() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dispatched_;
    }

    test::io_thread io_;
    test::diagnostic_recorder recorder_;
    std::atomic<bool> keep_going_{true};
    std::atomic<bool> throw_from_dispatcher_{false};

    mutable std::mutex mutex_;
    std::vector<dispatched_message> dispatched_;
};

TEST_F(tcp_runner_engine_test, StartListensOnLoopbackAndSendsInfo)
{
    const auto runner = make_runner();
    EXPECT_EQ(runner->state(), engine_state::kInitialized);

    const auto port = start(runner);
    ASSERT_NE(port, 0);
    EXPECT_EQ(runner->port(), port);
    EXPECT_EQ(runner->state(), engine_state::kListening);
    EXPECT_TRUE(recorder_.contains("Listening on tcp://localhost:" + std::to_string(port) + "/"));

    test::raw_peer peer;
    ASSERT_TRUE(peer.connect(port));
    const auto info = peer.read_frame();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(*info, test::frame_of("INFO", R"({"protocolVersion":"1.0"})"));
    EXPECT_EQ(runner->state(), engine_state::kNegotiating);
    EXPECT_TRUE(recorder_.contains("runner(r1): engine state transition from Listening to Negotiating"));
}

TEST_F(tcp_runner_engine_test, StartRequiresSharedOwnership)
{
    tcp_runner_engine runner(io_.context(), test::test_engine_options(), nullptr, recorder_.sink());
    const auto port = runner.start();
    ASSERT_FALSE(port.has_value());
    EXPECT_EQ(port.error(), make_error_code(engine_errc::kInvalidState));
    EXPECT_EQ(runner.state(), engine_state::kInitialized);
}

TEST_F(tcp_runner_engine_test, StartTwiceRejected)
{
    const auto runner = make_runner();
    (void)start(runner);
    const auto again = runner->start();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), make_error_code(engine_errc::kInvalidState));
    EXPECT_EQ(runner->state(), engine_state::kListening);
}

TEST_F(tcp_runner_engine_test, NegotiationRecordsExecutionInfo)
{
    const auto runner = make_runner();
    EXPECT_EQ(runner->test_assembly_unique_id().error(), make_error_code(engine_errc::kInvalidState));
    EXPECT_EQ(runner->test_framework_display_name().error(), make_error_code(engine_errc::kInvalidState));

    test::raw_peer peer;
    negotiate(runner, peer);

    EXPECT_EQ(runner->test_assembly_unique_id().value(), "asm-42");
    EXPECT_EQ(runner->test_framework_display_name().value(), "xUnit.net");
    ASSERT_TRUE(runner->negotiated_info().has_value());
    EXPECT_EQ(runner->negotiated_info()->protocol_version(), "1.0");
}

TEST_F(tcp_runner_engine_test, InfoWithoutFieldsLeavesAccessorsInvalid)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer, R"({"protocolVersion":"1.0","testFrameworkDisplayName":"fw"})");

    EXPECT_EQ(runner->test_assembly_unique_id().error(), make_error_code(engine_errc::kInvalidState));
    EXPECT_EQ(runner->test_framework_display_name().value(), "fw");
}

TEST_F(tcp_runner_engine_test, DuplicateInfoIgnored)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    peer.write(test::frame_of("INFO", R"({"testAssemblyUniqueID":"other"})") + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("runner(r1): received INFO while Connected, ignoring it"); }, test::kWaitTimeout));
    EXPECT_EQ(runner->test_assembly_unique_id().value(), "asm-42");
    EXPECT_EQ(runner->state(), engine_state::kConnected);
}

TEST_F(tcp_runner_engine_test, MalformedInfoKeepsNegotiating)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    ASSERT_TRUE(peer.connect(start(runner)));
    ASSERT_TRUE(peer.read_frame().has_value());

    peer.write(std::string("INFO") + '\0');
    peer.write(test::frame_of("INFO", "{not json") + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("error processing request 'INFO\\x1f{not json'"); }, test::kWaitTimeout));
    EXPECT_TRUE(recorder_.contains("runner(r1): INFO data is missing the JSON"));
    EXPECT_EQ(runner->state(), engine_state::kNegotiating);
}

TEST_F(tcp_runner_engine_test, UnknownProtocolVersionWarnsAndConnects)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer, R"({"protocolVersion":"7.3","testAssemblyUniqueID":"a","testFrameworkDisplayName":"b"})");
    EXPECT_TRUE(recorder_.contains("unrecognized protocol version '7.3'"));
    EXPECT_EQ(runner->negotiated_info()->protocol_version(), "7.3");
}

TEST_F(tcp_runner_engine_test, SendsWithoutPeerAreDiagnosedNoops)
{
    const auto runner = make_runner();
    EXPECT_FALSE(runner->send_find("op-1"));
    (void)start(runner);
    EXPECT_FALSE(runner->send_run("op-2"));
    runner->send_quit();

    EXPECT_TRUE(recorder_.contains("runner(r1): FIND called when there is no connected execution engine"));
    EXPECT_TRUE(recorder_.contains("runner(r1): RUN called when there is no connected execution engine"));
    EXPECT_TRUE(recorder_.contains("runner(r1): QUIT called when there is no connected execution engine"));
    EXPECT_FALSE(recorder_.contains("Request sent"));
    EXPECT_EQ(runner->state(), engine_state::kListening);
}

TEST_F(tcp_runner_engine_test, InvalidOperationIdRejected)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    const auto invalid = boost::system::errc::make_error_code(boost::system::errc::invalid_argument);
    EXPECT_EQ(runner->send_find(test::frame_of("a", "b")), invalid);
    EXPECT_EQ(runner->send_cancel(std::string("a") + '\0'), invalid);
    EXPECT_FALSE(runner->send_run(""));

    const auto frame = peer.read_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(*frame, "RUN" + std::string(1, protocol::kSeparator));
}

TEST_F(tcp_runner_engine_test, OperationsReachPeerInOrder)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    EXPECT_FALSE(runner->send_find("op-1"));
    EXPECT_FALSE(runner->send_run("op-2"));
    EXPECT_FALSE(runner->send_cancel("op-3"));

    EXPECT_EQ(peer.read_frame(), std::optional<std::string>(test::frame_of("FIND", "op-1")));
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>(test::frame_of("RUN", "op-2")));
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>(test::frame_of("CANCEL", "op-3")));
    EXPECT_TRUE(recorder_.contains("Request sent: FIND op-1"));
}

TEST_F(tcp_runner_engine_test, MessagesReachDispatcher)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    peer.write(test::frame_of("MSG", test::frame_of("op-1", R"({"type":"testPassed","name":"a"})")) + '\0');
    peer.write(test::frame_of("MSG", test::frame_of("op-1", R"({"note":"no type"})")) + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return dispatched().size() == 2; }, test::kWaitTimeout));

    const auto messages = dispatched();
    EXPECT_EQ(messages[0].operation_id, "op-1");
    EXPECT_EQ(messages[0].message.type, "testPassed");
    EXPECT_EQ(messages[0].message.json, R"({"type":"testPassed","name":"a"})");
    EXPECT_TRUE(messages[1].message.type.empty());
    EXPECT_FALSE(runner->cancel_requested());
}

TEST_F(tcp_runner_engine_test, MalformedMessagesDiagnosed)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    peer.write(std::string("MSG") + '\0');
    peer.write(test::frame_of("MSG", "op-1") + '\0');
    peer.write(test::frame_of("MSG", test::frame_of("op-1", "[1]")) + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("error processing request 'MSG\\x1fop-1\\x1f[1]'"); }, test::kWaitTimeout));

    EXPECT_TRUE(recorder_.contains("runner(r1): MSG data is missing the operation ID and JSON"));
    EXPECT_TRUE(recorder_.contains("runner(r1): MSG data is missing the JSON"));
    EXPECT_TRUE(dispatched().empty());
    EXPECT_EQ(runner->state(), engine_state::kConnected);
}

TEST_F(tcp_runner_engine_test, DispatcherStopSendsCancelOnce)
{
    keep_going_ = false;
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    // frames off the socket are dispatched one at a time on the strand
    for (int i = 0; i < 5; ++i)
    {
        peer.write(test::frame_of("MSG", test::frame_of("op-1", R"({"type":"testFailed"})")) + '\0');
    }
    ASSERT_TRUE(test::wait_until([this]() { return dispatched().size() == 5; }, test::kWaitTimeout));

    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("CANCEL"));
    EXPECT_FALSE(peer.read_frame(std::chrono::milliseconds(200)).has_value());
    EXPECT_TRUE(runner->cancel_requested());
}

TEST_F(tcp_runner_engine_test, ConcurrentStopsSendCancelOnce)
{
    keep_going_ = false;
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    constexpr int kThreads = 8;
    const auto frame = test::frame_of("MSG", test::frame_of("op-1", R"({"type":"testFailed"})"));
    std::atomic<bool> go{false};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i)
    {
        threads.emplace_back(
            [&go, &runner, &frame]()
            {
                while (!go.load())
                {
                    std::this_thread::yield();
                }
                runner->process_request(frame);
            });
    }
    go = true;
    for (auto& thread : threads)
    {
        thread.join();
    }

    EXPECT_EQ(dispatched().size(), static_cast<std::size_t>(kThreads));
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("CANCEL"));
    EXPECT_FALSE(peer.read_frame(std::chrono::milliseconds(200)).has_value());
    EXPECT_TRUE(runner->cancel_requested());
}

TEST_F(tcp_runner_engine_test, DispatcherExceptionDiagnosed)
{
    throw_from_dispatcher_ = true;
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    peer.write(test::frame_of("MSG", test::frame_of("op-1", "{}")) + '\0');
    ASSERT_TRUE(test::wait_until([this]() { return recorder_.contains("dispatcher rejected message"); }, test::kWaitTimeout));
    EXPECT_EQ(runner->state(), engine_state::kConnected);
}

TEST_F(tcp_runner_engine_test, DisposeSendsQuitThenCloses)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    EXPECT_FALSE(runner->dispose());
    EXPECT_EQ(runner->state(), engine_state::kDisconnected);
    EXPECT_TRUE(runner->quit_sent());

    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT"));
    EXPECT_TRUE(peer.wait_closed());
    EXPECT_EQ(runner->dispose(), make_error_code(engine_errc::kAlreadyDisposed));
    EXPECT_EQ(recorder_.count(diagnostic_level::kError), 0U);
}

TEST_F(tcp_runner_engine_test, ExplicitQuitNotRepeatedOnDispose)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    runner->send_quit();
    runner->send_quit();
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT"));

    EXPECT_FALSE(runner->dispose());
    EXPECT_FALSE(peer.read_frame().has_value());
    EXPECT_TRUE(peer.wait_closed());
    EXPECT_EQ(recorder_.count("Request sent: QUIT"), 1U);
}

TEST_F(tcp_runner_engine_test, QuitRacingDisposeIsNeverLost)
{
    for (int i = 0; i < 25; ++i)
    {
        const auto runner = make_runner();
        test::raw_peer peer;
        negotiate(runner, peer);

        std::atomic<bool> go{false};
        std::thread quitter(
            [&go, &runner]()
            {
                while (!go.load())
                {
                    std::this_thread::yield();
                }
                runner->send_quit();
            });
        go = true;
        EXPECT_FALSE(runner->dispose());
        quitter.join();

        EXPECT_TRUE(runner->quit_sent());
        EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT")) << "iteration " << i;
        EXPECT_FALSE(peer.read_frame(std::chrono::milliseconds(200)).has_value()) << "iteration " << i;
        EXPECT_TRUE(peer.wait_closed()) << "iteration " << i;
    }
}

TEST_F(tcp_runner_engine_test, QuitAfterDisposeStartsLeavesItToTeardown)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    EXPECT_FALSE(runner->dispose());
    runner->send_quit();

    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT"));
    EXPECT_TRUE(peer.wait_closed());
    EXPECT_TRUE(recorder_.contains("runner(r1): QUIT called after the engine was disposed"));
    EXPECT_EQ(recorder_.count("Request sent: QUIT"), 0U);
}

TEST_F(tcp_runner_engine_test, DisposeBeforeConnectionClosesListener)
{
    const auto runner = make_runner();
    const auto port = start(runner);

    EXPECT_FALSE(runner->dispose());
    EXPECT_EQ(runner->state(), engine_state::kDisconnected);

    test::raw_peer peer;
    EXPECT_FALSE(peer.connect(port));
}

TEST_F(tcp_runner_engine_test, SendsAfterDisposeAreDiagnosedNoops)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);
    EXPECT_FALSE(runner->dispose());

    EXPECT_FALSE(runner->send_find("late"));
    EXPECT_TRUE(recorder_.contains("runner(r1): FIND called after the engine was disposed"));
    EXPECT_FALSE(recorder_.contains("Request sent: FIND late"));
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT"));
    EXPECT_TRUE(peer.wait_closed());
}

TEST_F(tcp_runner_engine_test, OversizedFrameBroadcastsError)
{
    auto options = test::test_engine_options("r1");
    options.max_frame_size = 64;
    const auto runner = make_runner(options);
    test::raw_peer peer;
    negotiate(runner, peer, R"({"testAssemblyUniqueID":"a"})");

    peer.write(std::string(256, 'z'));
    ASSERT_TRUE(test::wait_until([this]() { return !dispatched().empty(); }, test::kWaitTimeout));

    const auto messages = dispatched();
    EXPECT_EQ(messages[0].operation_id, protocol::kBroadcastOperationId);
    EXPECT_EQ(messages[0].message.type, kErrorMessageType);
    EXPECT_TRUE(recorder_.contains("runner(r1): connection terminated abnormally"));
}

TEST_F(tcp_runner_engine_test, PeerDisconnectIsNotBroadcast)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    peer.close();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_TRUE(dispatched().empty());
    EXPECT_FALSE(runner->dispose());
}

TEST_F(tcp_runner_engine_test, ConcurrentSendsProduceWholeFrames)
{
    const auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    constexpr int kThreads = 4;
    constexpr int kPerThread = 25;
    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t)
    {
        senders.emplace_back(
            [&runner, t]()
            {
                for (int i = 0; i < kPerThread; ++i)
                {
                    EXPECT_FALSE(runner->send_run("op-" + std::to_string(t) + "-" + std::to_string(i)));
                }
            });
    }
    for (auto& sender : senders)
    {
        sender.join();
    }

    for (int n = 0; n < kThreads * kPerThread; ++n)
    {
        const auto frame = peer.read_frame();
        ASSERT_TRUE(frame.has_value());
        const auto parts = protocol::split_on_separator(*frame);
        EXPECT_EQ(parts.head, "RUN");
        ASSERT_TRUE(parts.tail.has_value());
        EXPECT_EQ(parts.tail->substr(0, 3), "op-");
    }
}

TEST_F(tcp_runner_engine_test, DestructionQuitsAndCloses)
{
    auto runner = make_runner();
    test::raw_peer peer;
    negotiate(runner, peer);

    runner.reset();
    EXPECT_EQ(peer.read_frame(), std::optional<std::string>("QUIT"));
    EXPECT_TRUE(peer.wait_closed());
}

TEST_F(tcp_runner_engine_test, LastOwnerReleasedInDispatcherStillQuits)
{
    std::shared_ptr<tcp_runner_engine> owner;
    std::atomic<bool> released{false};
    owner = std::make_shared<tcp_runner_engine>(
        io_.context(),
        test::test_engine_options("r1"),
        [&owner, &released](const std::string&, const engine_message&)
        {
            owner.reset();
            released = true;
            return true;
        },
        recorder_.sink());

    test::raw_peer peer;
    negotiate(owner, peer);
    peer.write(test::frame_of("MSG", test::frame_of("op-1", R"({"type":"testFailed"})")) + '\0');

    // well under close_timeout_ms, so a teardown stuck waiting on its own strand fails here
    EXPECT_EQ(peer.read_frame(std::chrono::milliseconds(1000)), std::optional<std::string>("QUIT"));
    EXPECT_TRUE(peer.wait_closed());
    ASSERT_TRUE(test::wait_until([&released]() { return released.load(); }, test::kWaitTimeout));
    EXPECT_EQ(recorder_.count("cleanup of"), 0U);
    EXPECT_TRUE(recorder_.contains("runner(r1): engine state transition from Disconnecting to Disconnected"));
}

}    // namespace tcpengine
