#pragma once
#include <accredit/schema/primitives.hpp>
#include <optional>
#include <span>

namespace accredit::schema::encoding {

// Encoder backend is selected at build time through the Library tag; there is
// a single SCALE specialization today. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  accredit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, accredit::schema::bytes_t& out);

  template <typename T>
  T decode(const accredit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const accredit::schema::bytes_view_t& bytes);
};

}  // namespace accredit::schema::encoding
