#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <cstdio>
#include <csignal>
#include <cstdint>
#include <cstring>
#include <charconv>
#include <functional>
#include <string_view>

#include <boost/system/error_code.hpp>
#include <boost/asio/signal_set.hpp>

#include <unistd.h>

#include "log.h"
#include "config.h"
#include "engine_info.h"
#include "line_reader.h"
#include "context_pool.h"
#include "engine_message.h"
#include "tcp_runner_engine.h"
#include "tcp_execution_engine.h"

namespace
{

constexpr std::size_t kWorkerThreads = 1;

struct shutdown_state
{
    std::atomic<bool> stop_requested = {false};
    std::thread shutdown_thread;
};

void print_usage(const char* prog)
{
    std::fputs("Usage:\n", stdout);
    std::fprintf(stdout, "%s -c <config>                Run the runner role, one operation per stdin line\n", prog);
    std::fprintf(stdout, "%s -c <config> engine <port>  Run the execution role against a runner port\n", prog);
    std::fprintf(stdout, "%s config                     Dump default configuration\n", prog);
}

int parse_config_from_file(const std::string& file, tcpengine::config& cfg)
{
    const auto parsed = tcpengine::parse_config_with_error(file);
    if (!parsed)
    {
        const auto& error = parsed.error();
        std::fprintf(stderr, "parse config failed path %s reason %s\n", error.path.c_str(), error.reason.c_str());
        return -1;
    }
    cfg = *parsed;
    return 0;
}

bool parse_port(const char* text, std::uint16_t& port)
{
    const std::string_view value(text);
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), port);
    return ec == std::errc() && ptr == value.data() + value.size() && port != 0;
}

bool register_signal(boost::asio::signal_set& signals, const int signal, const char* signal_name)
{
    boost::system::error_code ec;
    signals.add(signal, ec);
    if (!ec)
    {
        return true;
    }
    LOG_ERROR("fatal failed to register {} error {}", signal_name, ec.message());
    return false;
}

// Disposal must not run on an io thread, so shutdown gets its own thread.
void begin_shutdown(tcpengine::io_context_pool& pool, shutdown_state& state, std::function<void()> release)
{
    bool expected = false;
    if (!state.stop_requested.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        return;
    }
    state.shutdown_thread = std::thread(
        [&pool, release = std::move(release)]()
        {
            release();
            pool.stop();
        });
}

void register_shutdown_signals(boost::asio::signal_set& signals, tcpengine::io_context_pool& pool, shutdown_state& state, const std::function<void()>& release)
{
    if (!register_signal(signals, SIGINT, "sigint") || !register_signal(signals, SIGTERM, "sigterm"))
    {
        begin_shutdown(pool, state, release);
        return;
    }
    signals.async_wait(
        [&pool, &state, release](const boost::system::error_code& error, int signal)
        {
            if (error)
            {
                return;
            }
            LOG_INFO("received signal {} shutting down", signal);
            begin_shutdown(pool, state, release);
        });
}

void dispose_engine(tcpengine::tcp_engine& engine)
{
    if (const auto ec = engine.dispose(); ec)
    {
        LOG_WARN("{} dispose {}", engine.display_name(), ec.message());
    }
}

void apply_input_line(tcpengine::tcp_runner_engine& runner, const std::string& line)
{
    if (line.empty())
    {
        return;
    }
    const auto space = line.find(' ');
    const std::string command = space == std::string::npos ? std::string("find") : line.substr(0, space);
    const std::string operation_id = space == std::string::npos ? line : line.substr(space + 1);

    boost::system::error_code ec;
    if (command == "find")
    {
        ec = runner.send_find(operation_id);
    }
    else if (command == "run")
    {
        ec = runner.send_run(operation_id);
    }
    else if (command == "cancel")
    {
        ec = runner.send_cancel(operation_id);
    }
    else if (command == "quit")
    {
        runner.send_quit();
    }
    else
    {
        std::fprintf(stderr, "unknown command %s, expected find, run, cancel or quit\n", command.c_str());
        return;
    }
    if (ec)
    {
        std::fprintf(stderr, "%s %s failed %s\n", command.c_str(), operation_id.c_str(), ec.message().c_str());
    }
}

int run_runner(const tcpengine::config& cfg, tcpengine::io_context_pool& pool)
{
    auto& io_context = pool.get_io_context();
    const auto runner = std::make_shared<tcpengine::tcp_runner_engine>(
        io_context,
        cfg.engine,
        [](const std::string& operation_id, const tcpengine::engine_message& message)
        {
            std::fprintf(stdout, "MSG %s %s\n", operation_id.c_str(), message.json.c_str());
            std::fflush(stdout);
            return true;
        });

    const auto port = runner->start();
    if (!port)
    {
        LOG_ERROR("runner start failed {}", port.error().message());
        return 1;
    }
    std::fprintf(stdout, "%u\n", static_cast<unsigned>(*port));
    std::fflush(stdout);

    shutdown_state state;
    const std::function<void()> release = [runner]()
    {
        runner->send_quit();
        dispose_engine(*runner);
    };

    boost::asio::signal_set signals(io_context);
    register_shutdown_signals(signals, pool, state, release);

    tcpengine::line_reader input(STDIN_FILENO);
    std::thread input_thread(
        [&pool, &state, &input, runner, release]()
        {
            const auto ec = input.run([&runner](const std::string& line) { apply_input_line(*runner, line); });
            if (ec && ec != boost::asio::error::operation_aborted)
            {
                LOG_WARN("stdin closed {}", ec.message());
            }
            begin_shutdown(pool, state, release);
        });

    pool.run();
    input.stop();
    input_thread.join();
    // the input thread may start shutdown itself, so it is joined first
    if (state.shutdown_thread.joinable())
    {
        state.shutdown_thread.join();
    }
    return 0;
}

int run_execution(const tcpengine::config& cfg, tcpengine::io_context_pool& pool, const std::uint16_t port)
{
    tcpengine::execution_engine_info info;
    if (info.set_test_assembly_unique_id(cfg.execution.test_assembly_unique_id) ||
        info.set_test_framework_display_name(cfg.execution.test_framework_display_name))
    {
        LOG_ERROR("execution section needs test_assembly_unique_id and test_framework_display_name");
        return 1;
    }

    shutdown_state state;
    std::shared_ptr<tcpengine::tcp_execution_engine> engine;
    const std::function<void()> release = [&engine]() { dispose_engine(*engine); };

    tcpengine::execution_engine_handlers handlers;
    handlers.on_find = [&engine](const std::string& operation_id)
    {
        const auto ec = engine->send_message(operation_id, R"({"type":"discovered"})");
        LOG_INFO("find {} reply {}", operation_id, ec.message());
    };
    handlers.on_run = [&engine](const std::string& operation_id)
    {
        if (const auto ec = engine->send_message(operation_id, R"({"type":"started"})"); ec)
        {
            LOG_WARN("run {} reply {}", operation_id, ec.message());
            return;
        }
        (void)engine->send_message(operation_id, R"({"type":"completed"})");
    };
    handlers.on_cancel = [](const std::string& operation_id) { LOG_INFO("cancel {}", operation_id); };
    handlers.on_quit = [&pool, &state, &release]() { begin_shutdown(pool, state, release); };

    engine = std::make_shared<tcpengine::tcp_execution_engine>(pool.get_io_context(), cfg.engine, info, std::move(handlers));
    if (const auto ec = engine->start(port); ec)
    {
        LOG_ERROR("execution engine start failed {}", ec.message());
        return 1;
    }

    boost::asio::signal_set signals(pool.get_io_context());
    register_shutdown_signals(signals, pool, state, release);

    pool.run();
    if (state.shutdown_thread.joinable())
    {
        state.shutdown_thread.join();
    }
    return 0;
}

int run_with_config(const char* prog, const char* config_path, int argc, char** argv)
{
    tcpengine::config cfg;
    if (parse_config_from_file(config_path, cfg) != 0)
    {
        print_usage(prog);
        return -1;
    }

    std::uint16_t port = 0;
    const bool execution_role = argc > 3 && std::strcmp(argv[3], "engine") == 0;
    if (argc > 3 && (!execution_role || argc != 5 || !parse_port(argv[4], port)))
    {
        print_usage(prog);
        return -1;
    }

    tcpengine::init_log(cfg.log.file);
    tcpengine::set_level(cfg.log.level);

    boost::system::error_code ec;
    tcpengine::io_context_pool pool(kWorkerThreads, ec);
    if (ec)
    {
        tcpengine::shutdown_log();
        return 1;
    }

    const int rc = execution_role ? run_execution(cfg, pool, port) : run_runner(cfg, pool);
    LOG_INFO("{} {} shutdown", prog, execution_role ? "execution" : "runner");
    tcpengine::shutdown_log();
    return rc;
}

}    // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    const char* mode = argv[1];
    if (std::strcmp(mode, "config") == 0)
    {
        const std::string default_config = tcpengine::dump_default_config();
        std::fputs(default_config.c_str(), stdout);
        std::fputc('\n', stdout);
        return 0;
    }

    if (std::strcmp(mode, "-c") != 0 || argc <= 2)
    {
        print_usage(argv[0]);
        return -1;
    }
    return run_with_config(argv[0], argv[2], argc, argv);
}
