#pragma once
#include <distributor/common/critical.hpp>
#include <distributor/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>

namespace distributor::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  /// Encoding a fixed-layout value cannot fail short of a codec defect,
  /// which is fatal.
  template <typename T>
  distributor::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const distributor::schema::bytes_view_t& bytes);
};

template <typename T>
distributor::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    distributor::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const distributor::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace distributor::schema::encoding
