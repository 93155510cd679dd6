#pragma once
#include <accredit/common/critical.hpp>
#include <accredit/schema/app_info.hpp>
#include <accredit/schema/certificate.hpp>
#include <accredit/schema/encoding/encoder.hpp>
#include <accredit/schema/registry_event.hpp>
#include <accredit/schema/transaction.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace accredit::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  accredit::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, accredit::schema::bytes_t& out);

  template <typename T>
  T decode(const accredit::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const accredit::schema::bytes_view_t& bytes);
};

template <typename T>
accredit::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    accredit::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        accredit::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const accredit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    accredit::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const accredit::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace accredit::schema::encoding
