#pragma once
#include <distributor/schema/primitives.hpp>
#include <optional>

namespace distributor::schema::encoding {

// The codec is chosen at build time by tag. Callers hold an
// encoder<some_tag> and never see the library behind it.
template <typename Library>
struct encoder {
  template <typename T>
  distributor::schema::bytes_t encode(const T& obj);

  template <typename T>
  std::optional<T> try_decode(const distributor::schema::bytes_view_t& bytes);
};

}  // namespace distributor::schema::encoding
