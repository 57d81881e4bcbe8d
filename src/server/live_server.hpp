#pragma once
/// @file live_server.hpp
/// @brief Boost.Beast WebSocket + HTTP server streaming simulation state to
///        presentation clients and receiving their control commands.

#include <utility>

#include <boost/asio.hpp>
#include <boost/beast.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lbsim {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ws = beast::websocket;
using tcp = net::ip::tcp;

/// @brief Produces the full-state JSON sent to each newly opened client.
using SnapshotProvider = std::function<std::string()>;

/// @brief Invoked on the I/O thread for every text message a client sends.
using CommandHandler = std::function<void(const std::string &)>;

/// @brief One connected client: serves a static file, or upgrades to
///        WebSocket and stays open.
class LiveSession : public std::enable_shared_from_this<LiveSession> {
public:
  using OpenHandler = std::function<void(const std::shared_ptr<LiveSession> &)>;

  LiveSession(tcp::socket socket, std::string web_root,
              CommandHandler on_command, OpenHandler on_open);

  /// @brief Read the first HTTP request and dispatch it.
  void run();

  /// @brief Queue a text frame. Safe from any thread.
  void send(std::string message);

  [[nodiscard]] auto is_open() const -> bool;

  /// @brief True once the connection has ended (HTTP served, closed, or
  ///        failed). Finished sessions are pruned by the server.
  [[nodiscard]] auto finished() const -> bool { return finished_.load(); }

private:
  void on_accept(beast::error_code ec);
  void do_read();
  void on_read(beast::error_code ec, std::size_t bytes_transferred);
  void do_write();
  void handle_http_request(const http::request<http::string_body> &req);
  auto serve_file(const std::string &path) -> http::response<http::string_body>;
  static auto mime_type(const std::string &path) -> std::string;

  ws::stream<beast::tcp_stream> ws_;
  beast::flat_buffer buffer_;
  http::request<http::string_body> req_;
  std::atomic<bool> is_websocket_{false};
  std::atomic<bool> finished_{false};
  std::string web_root_;
  CommandHandler on_command_;
  OpenHandler on_open_;

  // Frames waiting to be written; touched only on the session's executor.
  std::deque<std::string> outbox_;
  bool writing_ = false;
};

/// @brief Accepts clients and broadcasts messages to every open WebSocket.
class LiveServer {
public:
  /// @param port     TCP port to listen on (0 picks a free one).
  /// @param web_root Directory of static presentation files.
  LiveServer(unsigned short port, std::string web_root);

  /// @brief Accept connections. Blocks in io_context::run() until stop().
  void run();

  void stop();

  /// @brief Send @p message to every open WebSocket client.
  void broadcast(const std::string &message);

  void set_snapshot_provider(SnapshotProvider provider);
  void set_command_handler(CommandHandler handler);

  [[nodiscard]] auto port() const -> unsigned short;
  [[nodiscard]] auto client_count() -> std::size_t;

private:
  void do_accept();

  net::io_context ioc_{1};
  tcp::acceptor acceptor_;
  std::string web_root_;
  SnapshotProvider snapshot_provider_;
  CommandHandler command_handler_;

  std::mutex sessions_mutex_;
  std::vector<std::shared_ptr<LiveSession>> sessions_;
};

} // namespace lbsim
