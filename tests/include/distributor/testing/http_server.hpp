#pragma once

#include <boost/asio/buffers_iterator.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/streambuf.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

namespace distributor::testing {

/// Canned HTTP/1.1 reply with a JSON body.
inline std::string http_response(const std::string_view status_line,
                                 const std::string_view body) {
  return "HTTP/1.1 " + std::string{status_line} +
         "\r\nContent-Type: application/json\r\nContent-Length: " +
         std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" +
         std::string{body};
}

/// Single-connection HTTP server on 127.0.0.1 with an ephemeral port.
///
/// Records the request head and answers with `response`. Without a
/// response the connection is held open until the client closes it.
class loopback_http_server final {
 public:
  explicit loopback_http_server(std::optional<std::string> response)
      : acceptor_{ioc_, {boost::asio::ip::make_address("127.0.0.1"), 0}},
        response_{std::move(response)},
        thread_{[this] { serve(); }} {}

  loopback_http_server(const loopback_http_server&) = delete;
  loopback_http_server& operator=(const loopback_http_server&) = delete;

  ~loopback_http_server() {
    if (!accepted_) {
      // Unblock accept() when no client ever connected.
      auto ec = boost::system::error_code{};
      auto socket = boost::asio::ip::tcp::socket{ioc_};
      socket.connect(acceptor_.local_endpoint(), ec);
    }
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  uint16_t port() const { return acceptor_.local_endpoint().port(); }

  std::string base_url(const std::string_view base_path = {}) const {
    return "http://127.0.0.1:" + std::to_string(port()) +
           std::string{base_path};
  }

  /// Request line and headers; waits for the connection to finish.
  const std::string& request() {
    if (thread_.joinable()) {
      thread_.join();
    }
    return request_;
  }

 private:
  void serve() {
    auto ec = boost::system::error_code{};
    auto socket = boost::asio::ip::tcp::socket{ioc_};
    acceptor_.accept(socket, ec);
    accepted_ = true;
    if (ec) {
      return;
    }

    auto buffer = boost::asio::streambuf{};
    auto size = boost::asio::read_until(socket, buffer, "\r\n\r\n", ec);
    if (ec) {
      return;
    }
    auto data = buffer.data();
    request_.assign(boost::asio::buffers_begin(data),
                    boost::asio::buffers_begin(data) + size);

    if (!response_) {
      auto sink = std::array<char, 256>{};
      while (!ec) {
        socket.read_some(boost::asio::buffer(sink), ec);
      }
      return;
    }
    boost::asio::write(socket, boost::asio::buffer(*response_), ec);
    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  }

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::optional<std::string> response_;
  std::string request_;
  std::atomic<bool> accepted_{false};
  std::thread thread_;
};

}  // namespace distributor::testing
