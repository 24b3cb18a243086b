#include "relay.hpp"

#include <csignal>
#include <cstring>

#include <atomic>
#include <iostream>

namespace {

std::atomic<relay::Server*> g_server{nullptr};

void handle_signal(int) {
  relay::Server* server = g_server.load();
  if (server != nullptr)
    server->stop();
}

void install_signal_handlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handle_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

}  // namespace

// Usage: relay_server [port]
int main(int argc, char* argv[]) {
  relay::ServerConfig config;
  auto from_env = relay::ServerConfig::from_env();
  if (from_env.has_value()) {
    config = from_env.value();
  } else {
    RELAY_LOG_WARN(std::string("Ignoring environment configuration: ") +
                   relay::error_code_name(from_env.get_error()));
  }

  if (argc > 1) {
    auto port = relay::parse_port(argv[1]);
    if (!port.has_value()) {
      std::cerr << "Invalid port: " << argv[1] << std::endl;
      return 1;
    }
    config.port = port.value();
  }

  relay::Logger::set_debug(config.debug);

  try {
    relay::Server server(config);
    g_server.store(&server);
    install_signal_handlers();

    server.run();

    g_server.store(nullptr);
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR(std::string("Fatal: ") + e.what());
    return 1;
  }

  return 0;
}
