// 1. Standard Library
#include <algorithm>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// 2. Third Party
#include <boost/asio.hpp>
#include <boost/program_options.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "Client.hpp"
#include "ClientError.hpp"
#include "LocalFile.hpp"
#include "PartialFileGuard.hpp"
#include "Types.hpp"
#include "config.hpp"

namespace po = boost::program_options;

using renterd::core::ClientError;
using renterd::core::ErrorKind;

namespace {

struct Options {
    std::string config_path = "config.toml";
    std::string command;
    std::vector<std::string> args;
    std::optional<std::string> bucket;
    std::optional<std::string> content_type;
    uint64_t offset = 0;
    std::optional<uint64_t> length;
};

void setup_logging(const renterd::core::AppConfig& cfg) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 5 * MEGABYTE;
    constexpr size_t MAX_FILES = 3;
    if (!cfg.log.file.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            cfg.log.file, MAX_SIZE, MAX_FILES);
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
    }

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("renterd", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    auto level = spdlog::level::from_str(cfg.log.level);
    if (level == spdlog::level::off && cfg.log.level != "off") {
        level = spdlog::level::info;
    }
    if (cfg.client.verbose_logging) {
        level = spdlog::level::trace;
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

void print_usage(const po::options_description& desc) {
    std::cerr << "Usage: renterd_fetch [--config FILE] <command> [args]\n"
                 "  get <remote-path> <local-file> [--bucket B] [--offset N] [--length N]\n"
                 "  put <local-file> <remote-path> [--bucket B] [--content-type T]\n"
                 "  rm <remote-path> [--bucket B]\n"
                 "  state\n\n"
              << desc << "\n";
}

void require_args(const Options& opts, size_t count) {
    if (opts.args.size() != count) {
        throw std::invalid_argument("`" + opts.command + "` expects " + std::to_string(count) +
                                    " argument(s), got " + std::to_string(opts.args.size()));
    }
}

// --- Commands ---

asio::awaitable<void> run_get(const renterd::api::Client& client, const Options& opts,
                              size_t chunk_size) {
    require_args(opts, 2);
    const auto& remote = opts.args[0];
    const std::filesystem::path local = opts.args[1];

    auto object = co_await client.worker().objects().download(remote, opts.bucket);
    if (!object) {
        throw ClientError(ErrorKind::NotFound, "object `" + remote + "` not found");
    }

    std::unique_ptr<renterd::core::SeekableObjectStream> stream;
    if (opts.offset > 0) {
        stream = co_await object->open_seekable_stream(opts.offset);
    } else {
        stream = object->open_stream();
    }

    auto ex = co_await asio::this_coro::executor;
    renterd::infra::PartialFileGuard guard(local);
    auto file = renterd::infra::OpenForWrite(ex, local);

    uint64_t remaining = opts.length.value_or(std::numeric_limits<uint64_t>::max());
    uint64_t written = 0;
    uint64_t last_logged_mb = 0;
    while (remaining > 0) {
        const auto want = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_size));
        auto result = co_await stream->read(want);
        co_await renterd::infra::WriteAll(file, result.bytes);
        written += result.bytes.size();
        remaining -= result.bytes.size();

        if (written / MEGABYTE >= last_logged_mb + 10) {
            last_logged_mb = written / MEGABYTE;
            spdlog::info("... {} MB downloaded", last_logged_mb);
        }
        if (result.end_of_object || result.bytes.empty()) {
            break;
        }
    }
    stream->close();
    file.close();
    guard.disarm();
    spdlog::info("Downloaded {} bytes of `{}` to {}", written, remote, local.string());
}

asio::awaitable<void> run_put(const renterd::api::Client& client, const Options& opts) {
    require_args(opts, 2);
    auto ex = co_await asio::this_coro::executor;
    auto source = std::make_shared<renterd::infra::FileByteSource>(ex, opts.args[0]);
    co_await client.worker().objects().upload(opts.args[1], std::move(source), opts.content_type,
                                              opts.bucket);
}

asio::awaitable<void> run_rm(const renterd::api::Client& client, const Options& opts) {
    require_args(opts, 1);
    co_await client.worker().objects().remove(opts.args[0], opts.bucket, false);
}

asio::awaitable<void> run_state(const renterd::api::Client& client) {
    auto bus = co_await client.bus().state();
    spdlog::info("bus: {} {} ({}, {}), started {}", bus.common.network, bus.common.version,
                 bus.common.commit, bus.common.os, bus.common.start_time);

    auto worker = co_await client.worker().state();
    spdlog::info("worker `{}`: {} {}, started {}", worker.id, worker.common.network,
                 worker.common.version, worker.common.start_time);

    try {
        auto autopilot = co_await client.autopilot().state();
        spdlog::info("autopilot: configured={} migrating={} pruning={} scanning={} uptime={}ms",
                     autopilot.configured, autopilot.migrating, autopilot.pruning,
                     autopilot.scanning, autopilot.uptime.count());
    } catch (const ClientError& e) {
        if (e.kind() != ErrorKind::NotFound) {
            throw;
        }
        spdlog::warn("autopilot is not enabled on this node");
    }
}

asio::awaitable<void> run_command(const renterd::api::Client& client, const Options& opts,
                                  size_t chunk_size) {
    if (opts.command == "get") {
        co_await run_get(client, opts, chunk_size);
    } else if (opts.command == "put") {
        co_await run_put(client, opts);
    } else if (opts.command == "rm") {
        co_await run_rm(client, opts);
    } else if (opts.command == "state") {
        co_await run_state(client);
    } else {
        throw std::invalid_argument("unknown command `" + opts.command + "`");
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    Options opts;
    uint64_t length = 0;

    po::options_description desc("Options");
    desc.add_options()
        ("help,h", "show this message")
        ("config,c", po::value(&opts.config_path), "configuration file (config.toml)")
        ("bucket,b", po::value<std::string>(), "bucket the object lives in")
        ("content-type", po::value<std::string>(), "content type of an upload")
        ("offset", po::value(&opts.offset), "first byte to download")
        ("length", po::value(&length), "number of bytes to download")
        ("command", po::value(&opts.command), "get, put, rm or state")
        ("args", po::value(&opts.args), "command arguments");

    po::positional_options_description positional;
    positional.add("command", 1);
    positional.add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                  vm);
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << e.what() << "\n";
        print_usage(desc);
        return EXIT_FAILURE;
    }
    if (vm.count("help") || opts.command.empty()) {
        print_usage(desc);
        return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }
    if (vm.count("bucket")) opts.bucket = vm["bucket"].as<std::string>();
    if (vm.count("content-type")) opts.content_type = vm["content-type"].as<std::string>();
    if (vm.count("length")) opts.length = length;

    try {
        // 1. Configuration
        auto cfg = renterd::core::LoadConfig(opts.config_path);
        setup_logging(cfg);

        // 2. Client Setup
        asio::io_context ioc;
        renterd::api::Client client(ioc.get_executor(), cfg.client);

        // 3. Graceful Shutdown Signal
        asio::cancellation_signal cancel;
        asio::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait([&cancel](const boost::system::error_code& ec, int signal_number) {
            if (ec) return;
            spdlog::info("Stop signal ({}) received. Cancelling...", signal_number);
            cancel.emit(asio::cancellation_type::terminal);
        });

        // 4. Run
        std::exception_ptr failure;
        asio::co_spawn(ioc, run_command(client, opts, cfg.client.stream.chunk_size),
                       asio::bind_cancellation_slot(
                           cancel.slot(), [&failure, &signals](std::exception_ptr e) {
                               failure = e;
                               signals.cancel();
                           }));
        ioc.run();

        if (failure) {
            std::rethrow_exception(failure);
        }
    } catch (const ClientError& e) {
        spdlog::critical("{} error: {}", renterd::core::to_string(e.kind()), e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
