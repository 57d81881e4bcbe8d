/// @file live_server.cpp
/// @brief Implementation of the Boost.Beast live state server.

#include "server/live_server.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace lbsim {

// ─── LiveSession ────────────────────────────────────────────────────────

LiveSession::LiveSession(tcp::socket socket, std::string web_root,
                         CommandHandler on_command, OpenHandler on_open)
    : ws_{std::move(socket)}, web_root_{std::move(web_root)},
      on_command_{std::move(on_command)}, on_open_{std::move(on_open)} {}

void LiveSession::run() {
  http::async_read(
      ws_.next_layer(), buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        if (ec) {
          self->finished_ = true;
          return;
        }

        if (ws::is_upgrade(self->req_)) {
          self->ws_.async_accept(self->req_, [self](beast::error_code ec2) {
            self->on_accept(ec2);
          });
        } else {
          self->handle_http_request(self->req_);
        }
      });
}

void LiveSession::on_accept(beast::error_code ec) {
  if (ec) {
    finished_ = true;
    return;
  }
  is_websocket_ = true;
  buffer_.consume(buffer_.size());
  if (on_open_) {
    on_open_(shared_from_this());
  }
  do_read();
}

void LiveSession::do_read() {
  ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec,
                                                      std::size_t bytes) {
    self->on_read(ec, bytes);
  });
}

void LiveSession::on_read(beast::error_code ec,
                          std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != ws::error::closed) {
      std::cerr << "[LiveServer] read error: " << ec.message() << "\n";
    }
    finished_ = true;
    return;
  }

  if (on_command_) {
    auto msg = beast::buffers_to_string(buffer_.data());
    if (!msg.empty()) {
      on_command_(msg);
    }
  }
  buffer_.consume(buffer_.size());
  do_read();
}

void LiveSession::send(std::string message) {
  net::post(ws_.get_executor(),
            [self = shared_from_this(), msg = std::move(message)]() mutable {
              if (!self->is_websocket_)
                return;
              self->outbox_.push_back(std::move(msg));
              if (!self->writing_) {
                self->do_write();
              }
            });
}

void LiveSession::do_write() {
  writing_ = true;
  ws_.text(true);
  ws_.async_write(
      net::buffer(outbox_.front()),
      [self = shared_from_this()](beast::error_code ec, std::size_t) {
        self->outbox_.pop_front();
        if (ec) {
          self->outbox_.clear();
          self->writing_ = false;
          self->finished_ = true;
          return;
        }
        if (self->outbox_.empty()) {
          self->writing_ = false;
        } else {
          self->do_write();
        }
      });
}

auto LiveSession::is_open() const -> bool {
  return is_websocket_ && ws_.is_open();
}

void LiveSession::handle_http_request(
    const http::request<http::string_body> &req) {
  auto target = std::string(req.target());
  if (target == "/")
    target = "/index.html";

  auto response = serve_file(target);
  response.set(http::field::server, "lbsim/0.1");
  // One request per connection; the socket closes after the write.
  response.keep_alive(false);
  response.prepare_payload();

  beast::error_code ec;
  http::write(ws_.next_layer(), response, ec);
  if (ec) {
    std::cerr << "[LiveServer] write error: " << ec.message() << "\n";
  }
  finished_ = true;
}

auto LiveSession::serve_file(const std::string &path)
    -> http::response<http::string_body> {
  // Refuse anything that tries to climb out of the web root.
  if (path.find("..") != std::string::npos) {
    http::response<http::string_body> res{http::status::bad_request, 11};
    res.set(http::field::content_type, "text/plain");
    res.body() = "400 Bad Request";
    return res;
  }

  const auto full_path = web_root_ + path;
  if (!std::filesystem::is_regular_file(full_path)) {
    http::response<http::string_body> res{http::status::not_found, 11};
    res.set(http::field::content_type, "text/plain");
    res.body() = "404 Not Found: " + path;
    return res;
  }

  std::ifstream file(full_path, std::ios::binary);
  std::ostringstream ss;
  ss << file.rdbuf();

  http::response<http::string_body> res{http::status::ok, 11};
  res.set(http::field::content_type, mime_type(path));
  res.set(http::field::access_control_allow_origin, "*");
  res.body() = ss.str();
  return res;
}

auto LiveSession::mime_type(const std::string &path) -> std::string {
  const auto ext = std::filesystem::path(path).extension().string();
  if (ext == ".html")
    return "text/html";
  if (ext == ".css")
    return "text/css";
  if (ext == ".js")
    return "application/javascript";
  if (ext == ".json")
    return "application/json";
  if (ext == ".svg")
    return "image/svg+xml";
  return "application/octet-stream";
}

// ─── LiveServer ─────────────────────────────────────────────────────────

LiveServer::LiveServer(unsigned short port, std::string web_root)
    : acceptor_{ioc_, tcp::endpoint{tcp::v4(), port}},
      web_root_{std::move(web_root)} {
  acceptor_.set_option(net::socket_base::reuse_address(true));
}

void LiveServer::run() {
  std::cout << "[LiveServer] Listening on http://localhost:" << port()
            << "\n";
  do_accept();
  ioc_.run();
}

void LiveServer::stop() { ioc_.stop(); }

auto LiveServer::port() const -> unsigned short {
  return acceptor_.local_endpoint().port();
}

void LiveServer::do_accept() {
  acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
    if (ec) {
      std::cerr << "[LiveServer] accept error: " << ec.message() << "\n";
      return;
    }

    auto session = std::make_shared<LiveSession>(
        std::move(socket), web_root_, command_handler_,
        [this](const std::shared_ptr<LiveSession> &s) {
          if (snapshot_provider_) {
            s->send(snapshot_provider_());
          }
        });

    {
      std::lock_guard lock(sessions_mutex_);
      std::erase_if(sessions_, [](const auto &s) { return s->finished(); });
      sessions_.push_back(session);
    }

    session->run();
    do_accept();
  });
}

void LiveServer::broadcast(const std::string &message) {
  std::lock_guard lock(sessions_mutex_);
  for (auto &session : sessions_) {
    session->send(message);
  }
}

auto LiveServer::client_count() -> std::size_t {
  std::lock_guard lock(sessions_mutex_);
  return static_cast<std::size_t>(
      std::count_if(sessions_.begin(), sessions_.end(),
                    [](const auto &s) { return s->is_open(); }));
}

void LiveServer::set_snapshot_provider(SnapshotProvider provider) {
  snapshot_provider_ = std::move(provider);
}

void LiveServer::set_command_handler(CommandHandler handler) {
  command_handler_ = std::move(handler);
}

} // namespace lbsim
