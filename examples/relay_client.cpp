#include "client_view.hpp"
#include "relay.hpp"

#include <cerrno>
#include <cstring>

#include <iostream>
#include <poll.h>
#include <sockpp/tcp_connector.h>
#include <sstream>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

// Line-oriented client: relay_client [host] [port] [user]
//   /join <room>  /leave <room>  /send <room> <text>  /heartbeat  /quit

namespace {

using relay::proto::MessageType;
using nlohmann::json;

bool send_frame(int fd, MessageType type, const relay::proto::Payload& payload = relay::proto::Payload{}) {
  relay::proto::Bytes frame = relay::proto::encode_frame(type, payload);
  size_t off = 0;
  while (off < frame.size()) {
    ssize_t n = ::send(fd, frame.data() + off, frame.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      std::cerr << "send failed: " << std::strerror(errno) << std::endl;
      return false;
    }
    off += static_cast<size_t>(n);
  }
  return true;
}

relay::proto::Payload as_json(json body) {
  return relay::proto::Payload(std::in_place_type<json>, std::move(body));
}

// Returns false when the client should exit.
bool handle_command(int fd, const std::string& line) {
  std::istringstream in(line);
  std::string cmd;
  in >> cmd;

  if (cmd == "/quit" || cmd == "/exit")
    return false;
  if (cmd == "/heartbeat")
    return send_frame(fd, MessageType::kHeartbeat);
  if (cmd == "/join" || cmd == "/leave") {
    std::string room;
    in >> room;
    if (room.empty()) {
      std::cout << "Usage: " << cmd << " <room>" << std::endl;
      return true;
    }
    return send_frame(fd, cmd == "/join" ? MessageType::kJoinRoom : MessageType::kLeaveRoom,
                      as_json({{"room", room}}));
  }
  if (cmd == "/send") {
    std::string room;
    in >> room;
    std::string text;
    std::getline(in >> std::ws, text);
    if (room.empty() || text.empty()) {
      std::cout << "Usage: /send <room> <text>" << std::endl;
      return true;
    }
    return send_frame(fd, MessageType::kMessage, as_json({{"room", room}, {"content", text}}));
  }
  if (!cmd.empty())
    std::cout << "Commands: /join <room>, /leave <room>, /send <room> <text>, /heartbeat, /quit" << std::endl;
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string host = argc > 1 ? argv[1] : "localhost";
  std::string user = argc > 3 ? argv[3] : "cli-user";
  uint16_t port = 4000;
  if (argc > 2) {
    auto parsed = relay::parse_port(argv[2]);
    if (!parsed.has_value()) {
      std::cerr << "Invalid port: " << argv[2] << std::endl;
      return 1;
    }
    port = parsed.value();
  }

  sockpp::initialize();
  sockpp::tcp_connector conn;
  try {
    if (!conn.connect(sockpp::inet_address(host, port))) {
      std::cerr << "Failed to connect to " << host << ":" << port << std::endl;
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Failed to resolve " << host << ": " << e.what() << std::endl;
    return 1;
  }

  int fd = conn.handle();
  std::cout << "Connected to Relay server " << host << ":" << port << std::endl;
  if (!send_frame(fd, MessageType::kHello, as_json({{"userId", user}, {"clientVersion", relay::kServerVersion}})))
    return 1;

  relay::ByteBuffer rx;
  pollfd fds[2] = {{STDIN_FILENO, POLLIN, 0}, {fd, POLLIN, 0}};
  bool running = true;
  while (running) {
    if (::poll(fds, 2, -1) < 0) {
      if (errno == EINTR)
        continue;
      std::cerr << "poll failed: " << std::strerror(errno) << std::endl;
      break;
    }

    if (fds[0].revents & (POLLIN | POLLHUP)) {
      // Consume every complete line already buffered by std::cin
      do {
        std::string line;
        if (!std::getline(std::cin, line)) {
          running = false;
        } else {
          running = handle_command(fd, line);
        }
      } while (running && std::cin.rdbuf()->in_avail() > 0);
    }

    if (running && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
      uint8_t* dst = rx.prepare(relay::Connection::kReadChunkSize);
      ssize_t n = ::recv(fd, dst, relay::Connection::kReadChunkSize, 0);
      if (n <= 0) {
        std::cout << "Disconnected from server" << std::endl;
        break;
      }
      rx.commit(static_cast<size_t>(n));

      while (true) {
        auto extracted = relay::proto::extract_frame(rx.view());
        if (!extracted.has_value()) {
          std::cerr << "Protocol error: " << relay::error_code_name(extracted.get_error()) << std::endl;
          return 1;
        }
        if (extracted.value().status == relay::proto::ExtractStatus::kNeedMore)
          break;
        auto decoded = relay::proto::decode_frame(extracted.value().frame);
        size_t consumed = extracted.value().consumed;
        if (decoded.has_value()) {
          std::cout << relay::client::format_frame(decoded.value()) << std::endl;
        } else {
          std::cerr << "Undecodable frame: " << relay::error_code_name(decoded.get_error()) << std::endl;
        }
        rx.advance(consumed);
      }
    }
  }

  std::cout << "Goodbye!" << std::endl;
  return 0;
}
