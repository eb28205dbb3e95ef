#include "stdinc.hpp"

#include "parley/net.hpp"
#include "parley/portable/asio/asio-execution-context.hpp"
#include "parley/room/room-api.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>

namespace parley {

constexpr int k_max_threads = 64;

struct Config {
  bool show_help{false};
  string url{""};
  string user{""};
  string room{""};
  bool insecure{false};
  int threads{1};
  std::optional<logging::LogLevel> log_level{};
};

static void show_help(const char* exec) {
  cout << format(R"V0G0N(

   Usage: {} -u <url> --user <name> --room <name> [OPTIONS...]

      Joins a room on a room server, and prints every response and
      notification until interrupted.

   Options:

      -u, --url <url>     ws:// or wss:// url of the room server.
      --user <name>       The user to join as.
      --room <name>       The room to join.
      --insecure          Do not verify the server's certificate.
      --threads <n>       Number of io threads, 1 to 64; default is 1.
      --log-level <name>  trace, debug, info, warn, err, critical or off.

)V0G0N",
                 exec)
       << endl;
}

// ------------------------------------------------------------------------------------- RoomPrinter

class RoomPrinter final : public room::RoomListener {
private:
  enum : int64_t { k_join_id = 1, k_leave_id = 2 };

  const Config& config_;
  thunk_type on_finished_;
  room::RoomApi* api_ = nullptr;
  std::atomic<bool> failed_{false};

public:
  RoomPrinter(const Config& config, thunk_type on_finished)
      : config_{config}, on_finished_{std::move(on_finished)} {}

  void attach(room::RoomApi& api) { api_ = &api; }
  bool failed() const noexcept { return failed_.load(); }

  void leave() {
    if (api_ == nullptr)
      return;
    INFO("leaving room '{}'", config_.room);
    api_->send_leave_room(k_leave_id);
    api_->disconnect_websocket();
  }

  void on_room_connected() override {
    INFO("connected, joining room '{}' as '{}'", config_.room, config_.user);
    api_->send_join_room(config_.user, config_.room, k_join_id);
  }

  void on_room_response(const room::RoomResponse& response) override {
    cout << format("response id={}: {}", response.id, response.values.dump()) << endl;
  }

  void on_room_error(const room::RoomError& error) override {
    cout << format("error id={}: {} (code={}): {}", error.id, error.code.message(),
                   error.server_code, error.message)
         << endl;
    if (error.id == k_join_id) {
      failed_.store(true);
      api_->disconnect_websocket();
    }
  }

  void on_room_notification(const room::RoomNotification& notification) override {
    cout << format("{} [{}]: {}", notification.method, str(notification.event()),
                   notification.params.dump())
         << endl;
  }

  void on_room_disconnected(uint16_t code, std::string_view reason, bool remote) override {
    INFO("disconnected, code={}, reason='{}', remote={}", code, reason, remote);
    if (code != net::k_close_normal)
      failed_.store(true);
    on_finished_();
  }
};

// -------------------------------------------------------------------------------------------- main

int main(int argc, char** argv) {
  Config config;
  auto has_error = false;

  for (int i = 1; i < argc; ++i) {
    string arg = argv[i];
    try {
      if (arg == "-h" || arg == "--help") {
        config.show_help = true;
      } else if (arg == "-u" || arg == "--url") {
        config.url = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--user") {
        config.user = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--room") {
        config.room = cli::safe_arg_str(argc, argv, i);
      } else if (arg == "--insecure") {
        config.insecure = true;
      } else if (arg == "--threads") {
        config.threads = cli::safe_arg_int(argc, argv, i, 1, k_max_threads);
      } else if (arg == "--log-level") {
        const auto name = cli::safe_arg_str(argc, argv, i);
        config.log_level = logging::parse_level(name);
        if (!config.log_level.has_value()) {
          cout << format("unknown log level: '{}'", name) << endl;
          has_error = true;
        }
      } else {
        cout << format("unexpected argument: '{}'", arg) << endl;
        has_error = true;
      }
    } catch (std::runtime_error& e) {
      cout << format("Error on command-line: {}", e.what()) << endl;
      has_error = true;
    }
  }

  if (config.show_help) {
    show_help(argv[0]);
    return EXIT_SUCCESS;
  }

  if (config.url.empty() || config.user.empty() || config.room.empty()) {
    cout << format("the url, user and room must all be specified") << endl;
    has_error = true;
  }

  if (has_error) {
    cout << format("aborting...") << endl;
    return EXIT_FAILURE;
  }

  if (config.log_level.has_value())
    logging::set_level(*config.log_level);

  boost::asio::io_context io_context;
  boost::asio::signal_set signals{io_context, SIGINT, SIGTERM};
  net::AsioExecutionContext pool{io_context, std::size_t(config.threads)};
  RoomPrinter printer{config, [&signals, &pool]() {
                        boost::system::error_code ec;
                        signals.cancel(ec);
                        if (ec)
                          WARN("failed to cancel signal handlers: {}", ec.message());
                        pool.release();
                      }};

  net::WebsocketTransport::Config ws_config;
  ws_config.verify_peer = !config.insecure;

  try {
    room::RoomApi api{io_context,
                      {.url = config.url},
                      net::WebsocketTransport::make_factory(io_context, ws_config),
                      printer};
    printer.attach(api);

    signals.async_wait([&printer](const boost::system::error_code& ec, int signal_number) {
      if (ec)
        return; // cancelled
      INFO("caught signal {}", signal_number);
      printer.leave();
    });

    api.connect_websocket();
    INFO("connecting to {} with {} io thread(s)", config.url, pool.size());
    pool.run();
    pool.join();
  } catch (std::runtime_error& e) {
    LOG_ERR("{}", e.what());
    return EXIT_FAILURE;
  }

  return printer.failed() ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace parley

int main(int argc, char** argv) { return parley::main(argc, argv); }
