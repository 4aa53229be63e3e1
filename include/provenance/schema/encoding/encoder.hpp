#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <span>

namespace provenance::schema::encoding {

// The wire codec is a build time choice: callers name encoder<Tag> and the
// tag's specialization binds it to a concrete library. Hot swapping codecs
// is not supported.
template <typename Library>
struct encoder {
  template <typename T>
  provenance::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, provenance::schema::bytes_t& out);

  template <typename T>
  T decode(const provenance::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const provenance::schema::bytes_view_t& bytes);
};

}  // namespace provenance::schema::encoding
