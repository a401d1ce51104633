#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <charconv>
#include <cli/progress_display.h>
#include <core/constant/path.h>
#include <core/network/client/file_sender.h>
#include <core/network/client/session_relay.h>
#include <core/network/server/controller/common_controller.h>
#include <core/network/server/controller/relay_controller.h>
#include <core/network/server/http_server.h>
#include <core/network/server/transfer_server.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
namespace net = boost::asio;
namespace po = boost::program_options;

using namespace filerelay;

namespace {

void PrintUsage(const po::options_description& global) {
    std::cout << "filerelay - framed TCP file transfer with an HTTP session relay\n\n"
              << "Usage:\n"
              << "  filerelay [options] receive [--address A] [--port P] [--save-dir D] "
                 "[--max-size BYTES]\n"
              << "  filerelay [options] relay [--address A] [--port P]\n"
              << "  filerelay [options] demo\n"
              << "  filerelay [options] send HOST[:PORT] FILE [--name NAME] [--timeout SECONDS]\n"
              << "  filerelay [options] config [--save]\n"
              << "  filerelay help\n\n"
              << global << "\n";
}

// Runs the io_context on every hardware thread, this one included
void RunIoContext(net::io_context& io_context) {
    unsigned int num_threads = std::max(1u, std::thread::hardware_concurrency());
    std::vector<std::thread> threads;
    for (unsigned int i = 1; i < num_threads; ++i) {
        threads.emplace_back([&io_context]() {
            try {
                io_context.run();
            } catch (const std::exception& e) {
                spdlog::error("IO thread error: {}", e.what());
            }
        });
    }
    io_context.run();
    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

core::ReceiverOptions ToReceiverOptions(const core::ReceiverSettings& receiver) {
    return core::ReceiverOptions{
        .save_dir = receiver.save_dir,
        .policy = core::ReceivePolicy{
            .max_file_size = receiver.max_file_size,
            .allowed_extensions = receiver.allowed_extensions,
        },
        .io_chunk_size = receiver.io_chunk_size,
    };
}

// Receiver and relay share the same shutdown: stop listening, drain, cancel
struct Services {
    std::unique_ptr<core::TransferServer> receiver;
    std::unique_ptr<core::SessionRelay> relay;
    std::unique_ptr<core::HttpServer> http_server;
    std::unique_ptr<core::CommonController> common_controller;
    std::unique_ptr<core::RelayController> relay_controller;
};

bool StartReceiver(net::io_context& io_context, Services& services, cli::ProgressDisplay& display) {
    const auto& receiver = core::settings.receiver;
    services.receiver = std::make_unique<core::TransferServer>(io_context,
                                                               ToReceiverOptions(receiver),
                                                               display.callback());
    if (!services.receiver->Start(receiver.address, receiver.port)) {
        return false;
    }
    std::cout << "Receiving on " << receiver.address << ":" << services.receiver->port()
              << ", saving to " << receiver.save_dir.string() << "\n";
    return true;
}

bool StartRelay(net::io_context& io_context, Services& services, cli::ProgressDisplay& display) {
    const auto& relay = core::settings.relay;
    services.relay = std::make_unique<core::SessionRelay>(
        io_context,
        core::RelayOptions{.connect_timeout = relay.connect_timeout},
        display.callback());
    services.http_server = std::make_unique<core::HttpServer>(io_context, relay.max_chunk_size);
    services.common_controller = std::make_unique<core::CommonController>(*services.http_server,
                                                                          *services.relay);
    services.relay_controller = std::make_unique<core::RelayController>(*services.http_server,
                                                                        *services.relay);
    if (!services.http_server->Start(relay.address, relay.port)) {
        return false;
    }
    std::cout << "Relay listening on http://" << relay.address << ":"
              << services.http_server->port() << "\n";
    return true;
}

int Serve(bool with_receiver, bool with_relay) {
    try {
        net::io_context io_context;
        cli::ProgressDisplay display;
        Services services;

        if (with_receiver && !StartReceiver(io_context, services, display)) {
            return 1;
        }
        if (with_relay && !StartRelay(io_context, services, display)) {
            return 1;
        }
        std::cout << "Press Ctrl+C to stop...\n";

        net::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal_number);
            if (services.http_server) {
                services.http_server->Stop();
            }
            if (services.relay) {
                services.relay->CancelAll();
            }
            if (services.receiver) {
                net::co_spawn(io_context,
                              services.receiver->Drain(core::settings.receiver.shutdown_grace),
                              net::detached);
            }
        });

        RunIoContext(io_context);
        spdlog::info("Shut down cleanly.");
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Server error: {}", e.what());
        return 1;
    }
}

std::optional<std::pair<std::string, std::uint16_t>> ParseDestination(const std::string& text) {
    std::string host = text;
    std::uint16_t port = core::settings.receiver.port;
    auto colon = text.rfind(':');
    if (colon != std::string::npos) {
        host = text.substr(0, colon);
        std::string_view digits(text.data() + colon + 1, text.size() - colon - 1);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), port);
        if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()
            || port == 0) {
            return std::nullopt;
        }
    }
    if (host.empty()) {
        return std::nullopt;
    }
    return std::make_pair(host, port);
}

int SendFile(const std::string& destination, const fs::path& file, core::SendOptions options) {
    auto parsed = ParseDestination(destination);
    if (!parsed) {
        std::cerr << "Error: invalid destination '" << destination << "', expected HOST[:PORT]\n";
        return 1;
    }
    auto [host, port] = *parsed;

    net::io_context io_context;
    cli::ProgressDisplay display;
    core::FileSender sender(display.callback());

    int exit_code = 1;
    net::co_spawn(io_context,
                  sender.SendFile(host, port, file, std::move(options)),
                  [&](std::exception_ptr e, core::Result<core::CompletionMessage> result) {
                      if (e) {
                          try {
                              std::rethrow_exception(e);
                          } catch (const std::exception& ex) {
                              std::cerr << "Error: " << ex.what() << "\n";
                          }
                          return;
                      }
                      if (!result) {
                          std::cerr << "Error (" << core::ErrorKindToString(result.error().kind)
                                    << "): " << result.error().message << "\n";
                          return;
                      }
                      if (!result->done()) {
                          std::cerr << "Receiver error: " << result->message << "\n";
                          return;
                      }
                      std::cout << "Saved as '" << result->saved_as << "' ("
                                << result->bytes_received << " bytes"
                                << (result->renamed ? ", renamed" : "") << ")\n"
                                << "sha256 " << result->sha256 << "\n";
                      exit_code = 0;
                  });
    io_context.run();
    return exit_code;
}

void PrintConfig(const fs::path& config_path) {
    const auto& s = core::settings;
    std::cout << "Configuration (" << config_path.string() << "):\n"
              << " receiver.address        " << s.receiver.address << "\n"
              << " receiver.port           " << s.receiver.port << "\n"
              << " receiver.save-dir       " << s.receiver.save_dir.string() << "\n"
              << " receiver.max-file-size  " << s.receiver.max_file_size << "\n"
              << " receiver.allowed-ext    ";
    if (s.receiver.allowed_extensions.empty()) {
        std::cout << "(any)";
    }
    for (const auto& extension : s.receiver.allowed_extensions) {
        std::cout << extension << " ";
    }
    std::cout << "\n"
              << " receiver.io-chunk-size  " << s.receiver.io_chunk_size << "\n"
              << " receiver.shutdown-grace " << s.receiver.shutdown_grace.count() << "s\n"
              << " relay.address           " << s.relay.address << "\n"
              << " relay.port              " << s.relay.port << "\n"
              << " relay.connect-timeout   " << s.relay.connect_timeout.count() << "s\n"
              << " relay.max-chunk-size    " << s.relay.max_chunk_size << "\n"
              << " log.level               " << s.log.level << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    po::options_description global("Global options");
    global.add_options()("help,h", "show this help")(
        "config,c", po::value<std::string>(), "configuration file")(
        "log-level,l", po::value<std::string>(), "trace, debug, info, warn, error or off");

    po::options_description hidden;
    hidden.add_options()("command", po::value<std::string>())(
        "args", po::value<std::vector<std::string>>());
    po::options_description all;
    all.add(global).add(hidden);

    po::positional_options_description positional;
    positional.add("command", 1).add("args", -1);

    po::variables_map vm;
    po::parsed_options parsed = [&]() {
        try {
            return po::command_line_parser(argc, argv)
                .options(all)
                .positional(positional)
                .allow_unregistered()
                .run();
        } catch (const po::error& e) {
            std::cerr << "Error: " << e.what() << "\n";
            std::exit(1);
        }
    }();
    po::store(parsed, vm);
    po::notify(vm);

    if (vm.count("help") || !vm.count("command")) {
        PrintUsage(global);
        return vm.count("help") ? 0 : 1;
    }

    fs::path config_path = vm.count("config") ? fs::path(vm["config"].as<std::string>())
                                              : core::DefaultConfigPath();
    core::InitConfig(config_path);
    if (vm.count("log-level")) {
        core::settings.log.level = vm["log-level"].as<std::string>();
    }
    auto level = core::Logger::ParseLevel(core::settings.log.level);
    if (!level) {
        std::cerr << "Error: unknown log level '" << core::settings.log.level << "'\n";
        return 1;
    }
    core::Logger logger(core::LoggerOptions{.level = *level, .log_dir = core::path::kLogDir});

    std::string command = vm["command"].as<std::string>();
    std::vector<std::string> rest = po::collect_unrecognized(parsed.options, po::include_positional);
    rest.erase(rest.begin());

    try {
        if (command == "receive") {
            po::options_description desc("Receive options");
            desc.add_options()("address,a", po::value<std::string>(), "listen address")(
                "port,p", po::value<std::uint16_t>(), "listen port")(
                "save-dir,s", po::value<std::string>(), "directory for received files")(
                "max-size", po::value<std::uint64_t>(), "largest accepted file in bytes");
            po::variables_map options;
            po::store(po::command_line_parser(rest).options(desc).run(), options);
            po::notify(options);

            auto& receiver = core::settings.receiver;
            if (options.count("address")) {
                receiver.address = options["address"].as<std::string>();
            }
            if (options.count("port")) {
                receiver.port = options["port"].as<std::uint16_t>();
            }
            if (options.count("save-dir")) {
                receiver.save_dir = options["save-dir"].as<std::string>();
            }
            if (options.count("max-size")) {
                receiver.max_file_size = options["max-size"].as<std::uint64_t>();
            }
            return Serve(true, false);
        } else if (command == "relay") {
            po::options_description desc("Relay options");
            desc.add_options()("address,a", po::value<std::string>(), "listen address")(
                "port,p", po::value<std::uint16_t>(), "listen port");
            po::variables_map options;
            po::store(po::command_line_parser(rest).options(desc).run(), options);
            po::notify(options);

            auto& relay = core::settings.relay;
            if (options.count("address")) {
                relay.address = options["address"].as<std::string>();
            }
            if (options.count("port")) {
                relay.port = options["port"].as<std::uint16_t>();
            }
            return Serve(false, true);
        } else if (command == "demo") {
            return Serve(true, true);
        } else if (command == "send") {
            po::options_description desc("Send options");
            desc.add_options()("destination", po::value<std::string>()->required(), "HOST[:PORT]")(
                "file", po::value<std::string>()->required(), "file to send")(
                "name,n", po::value<std::string>(), "name to request on the receiver")(
                "timeout,t", po::value<unsigned int>(), "connect timeout in seconds");
            po::positional_options_description send_positional;
            send_positional.add("destination", 1).add("file", 1);
            po::variables_map options;
            po::store(
                po::command_line_parser(rest).options(desc).positional(send_positional).run(),
                options);
            po::notify(options);

            core::SendOptions send_options;
            send_options.chunk_size = core::settings.receiver.io_chunk_size;
            send_options.connect_timeout = core::settings.relay.connect_timeout;
            if (options.count("name")) {
                send_options.remote_name = options["name"].as<std::string>();
            }
            if (options.count("timeout")) {
                send_options.connect_timeout = std::chrono::seconds(
                    options["timeout"].as<unsigned int>());
            }
            return SendFile(options["destination"].as<std::string>(),
                            options["file"].as<std::string>(),
                            std::move(send_options));
        } else if (command == "config") {
            po::options_description desc("Config options");
            desc.add_options()("save", "write the effective configuration back to the file");
            po::variables_map options;
            po::store(po::command_line_parser(rest).options(desc).run(), options);
            po::notify(options);

            PrintConfig(config_path);
            if (options.count("save")) {
                return core::SaveConfig() ? 0 : 1;
            }
            return 0;
        } else if (command == "help") {
            PrintUsage(global);
            return 0;
        } else {
            std::cerr << "Error: unknown command '" << command << "'\n";
            PrintUsage(global);
            return 1;
        }
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
