#pragma once

#include <distributor/referral/lookup.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace distributor::referral {

inline constexpr auto kDefaultLookupPathPrefix =
    std::string_view{"/api/whitelist/get-referrer/"};
/// Endpoint of services that expose referrer-of-referrer separately.
inline constexpr auto kReferrerOfReferrerPathPrefix =
    std::string_view{"/api/whitelist/get-referrer-of-referrer/"};
inline constexpr auto kDefaultLookupTimeout = std::chrono::milliseconds{5000};

struct http_lookup_options_t final {
  /// `http://host[:port][/base-path]`. TLS endpoints are not supported.
  std::string base_url;
  std::string path_prefix{kDefaultLookupPathPrefix};
  /// Prefix for second-tier lookups. Empty reuses `path_prefix`.
  std::string second_tier_path_prefix;
  std::chrono::milliseconds timeout{kDefaultLookupTimeout};
};

struct http_endpoint_t final {
  std::string host;
  std::string port{"80"};
  /// Path component of the base URL without a trailing slash.
  std::string base_path;

  bool operator==(const http_endpoint_t&) const = default;
};

std::optional<http_endpoint_t> parse_http_url(std::string_view url,
                                              std::string& error);

/// Percent-encode everything outside the RFC 3986 unreserved set.
std::string url_encode(std::string_view value);

/// Interpret a `{ success, referrerWallet, message }` JSON body.
///
/// Malformed JSON, a non-object body, or a wallet that is not a base58
/// address all yield an unsuccessful result with an explanatory message.
lookup_result_t parse_lookup_response(std::string_view body);

/// Build a lookup that issues `GET <base-url><path-prefix><key>` per call,
/// each bounded by `options.timeout`. Second-tier lookups use
/// `second_tier_path_prefix` when it is set.
///
/// Any non-2xx status fails the lookup with an `HTTP <status>` message.
std::optional<referral_lookup_t> make_http_lookup(
    const http_lookup_options_t& options,
    std::string& error,
    lookup_tier tier = lookup_tier::first);

}  // namespace distributor::referral
