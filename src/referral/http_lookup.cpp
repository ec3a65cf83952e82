#include <distributor/referral/http_lookup.hpp>

#include <spdlog/spdlog.h>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>
#include <array>
#include <memory>
#include <utility>

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

using namespace distributor::schema;

namespace {

constexpr auto kHttpScheme = std::string_view{"http://"};

std::string host_header(const distributor::referral::http_endpoint_t& endpoint) {
  if (endpoint.port == "80") {
    return endpoint.host;
  }
  return endpoint.host + ":" + endpoint.port;
}

class lookup_session final
    : public std::enable_shared_from_this<lookup_session> {
 public:
  lookup_session(asio::io_context& ioc, const std::chrono::milliseconds timeout)
      : resolver_{ioc}, stream_{ioc}, timeout_{timeout} {}

  void run(const distributor::referral::http_endpoint_t& endpoint,
           const std::string& target) {
    request_.version(11);
    request_.method(http::verb::get);
    request_.target(target);
    request_.set(http::field::host, host_header(endpoint));
    request_.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request_.set(http::field::accept, "application/json");

    resolver_.async_resolve(
        endpoint.host, endpoint.port,
        beast::bind_front_handler(&lookup_session::on_resolve,
                                  shared_from_this()));
  }

  const distributor::referral::lookup_result_t& result() const {
    return result_;
  }

  bool finished() const { return finished_; }

 private:
  void fail(const std::string_view stage, const beast::error_code& ec) {
    result_.success = false;
    if (ec == beast::error::timeout) {
      result_.message =
          "timed out after " + std::to_string(timeout_.count()) + "ms";
    } else {
      result_.message = std::string{stage} + ": " + ec.message();
    }
    finished_ = true;
  }

  void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      return fail("resolve", ec);
    }
    stream_.expires_after(timeout_);
    stream_.async_connect(results,
                          beast::bind_front_handler(&lookup_session::on_connect,
                                                    shared_from_this()));
  }

  void on_connect(beast::error_code ec, tcp::resolver::endpoint_type) {
    if (ec) {
      return fail("connect", ec);
    }
    stream_.expires_after(timeout_);
    http::async_write(stream_, request_,
                      beast::bind_front_handler(&lookup_session::on_write,
                                                shared_from_this()));
  }

  void on_write(beast::error_code ec, std::size_t) {
    if (ec) {
      return fail("write", ec);
    }
    http::async_read(stream_, buffer_, response_,
                     beast::bind_front_handler(&lookup_session::on_read,
                                               shared_from_this()));
  }

  void on_read(beast::error_code ec, std::size_t) {
    if (ec) {
      return fail("read", ec);
    }
    const auto status = response_.result_int();
    result_ = distributor::referral::parse_lookup_response(response_.body());
    if (status < 200 || status >= 300) {
      // Any non-2xx reply fails the tier whatever its body claims.
      auto detail = std::move(result_.message);
      result_ = distributor::referral::lookup_result_t{};
      result_.message = "HTTP " + std::to_string(status);
      if (!detail.empty()) {
        result_.message += ": " + detail;
      }
    }
    finished_ = true;

    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != beast::errc::not_connected) {
      spdlog::debug("Referral lookup shutdown: {}", ec.message());
    }
  }

  tcp::resolver resolver_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  http::request<http::empty_body> request_;
  http::response<http::string_body> response_;
  std::chrono::milliseconds timeout_;
  distributor::referral::lookup_result_t result_;
  bool finished_{false};
};

distributor::referral::lookup_result_t http_get(
    const distributor::referral::http_endpoint_t& endpoint,
    const std::string& target,
    const std::chrono::milliseconds timeout) {
  auto ioc = asio::io_context{};
  auto session = std::make_shared<lookup_session>(ioc, timeout);
  session->run(endpoint, target);
  // Bounds name resolution too, which tcp_stream's expiry does not cover.
  ioc.run_for(timeout);
  if (!session->finished()) {
    ioc.stop();
    return distributor::referral::lookup_result_t{
        .success = false,
        .referrer_wallet = std::nullopt,
        .message = "timed out after " + std::to_string(timeout.count()) +
                   "ms"};
  }
  return session->result();
}

}  // namespace

namespace distributor::referral {

std::optional<http_endpoint_t> parse_http_url(const std::string_view url,
                                              std::string& error) {
  if (!url.starts_with(kHttpScheme)) {
    error = "referral URL must start with http://";
    return std::nullopt;
  }
  auto rest = url.substr(kHttpScheme.size());
  auto endpoint = http_endpoint_t{};

  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  if (slash != std::string_view::npos) {
    endpoint.base_path = std::string{rest.substr(slash)};
    while (!endpoint.base_path.empty() && endpoint.base_path.back() == '/') {
      endpoint.base_path.pop_back();
    }
  }

  auto colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    auto port = authority.substr(colon + 1);
    if (port.empty() || port.size() > 5 ||
        port.find_first_not_of("0123456789") != std::string_view::npos ||
        std::stoul(std::string{port}) > 65535) {
      error = "invalid port in referral URL: " + std::string{url};
      return std::nullopt;
    }
    endpoint.port = std::string{port};
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) {
    error = "missing host in referral URL: " + std::string{url};
    return std::nullopt;
  }
  endpoint.host = std::string{authority};
  return endpoint;
}

std::string url_encode(const std::string_view value) {
  static constexpr auto kHex = std::string_view{"0123456789ABCDEF"};
  auto out = std::string{};
  out.reserve(value.size());
  for (const auto c : value) {
    const auto byte = static_cast<uint8_t>(c);
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
        (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(c);
      continue;
    }
    out.push_back('%');
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0f]);
  }
  return out;
}

lookup_result_t parse_lookup_response(const std::string_view body) {
  auto result = lookup_result_t{};
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded() || !json.is_object()) {
    result.message = "malformed lookup response";
    return result;
  }
  if (json.contains("message") && json["message"].is_string()) {
    result.message = json["message"].get<std::string>();
  }
  if (!json.contains("success") || !json["success"].is_boolean() ||
      !json["success"].get<bool>()) {
    return result;
  }
  if (!json.contains("referrerWallet") || !json["referrerWallet"].is_string()) {
    result.success = true;
    return result;
  }
  auto wallet = json["referrerWallet"].get<std::string>();
  auto address = try_make_address(wallet);
  if (!address) {
    result.message = "referrer wallet is not a base58 address: " + wallet;
    return result;
  }
  result.success = true;
  result.referrer_wallet = *address;
  return result;
}

std::optional<referral_lookup_t> make_http_lookup(
    const http_lookup_options_t& options,
    std::string& error,
    const lookup_tier tier) {
  auto endpoint = parse_http_url(options.base_url, error);
  if (!endpoint) {
    return std::nullopt;
  }
  if (options.timeout.count() <= 0) {
    error = "referral lookup timeout must be positive";
    return std::nullopt;
  }
  auto prefix =
      tier == lookup_tier::second && !options.second_tier_path_prefix.empty()
          ? options.second_tier_path_prefix
          : options.path_prefix;
  if (prefix.empty() || prefix.front() != '/') {
    prefix.insert(std::begin(prefix), '/');
  }
  spdlog::debug("{} referral lookups go to http://{}:{}{}{}",
                to_string(tier), endpoint->host, endpoint->port,
                endpoint->base_path, prefix);

  return referral_lookup_t{
      [endpoint = std::move(*endpoint), prefix = std::move(prefix),
       timeout = options.timeout](const std::string_view key) {
        auto target = endpoint.base_path + prefix + url_encode(key);
        return http_get(endpoint, target, timeout);
      }};
}

}  // namespace distributor::referral
