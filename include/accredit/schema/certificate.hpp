#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: certificate.
// Registry record: binds a recipient to a course label, the issuer that
// minted it and the block time of issuance. Written once, never updated.
namespace accredit::schema {

template <uint16_t Version>
struct certificate;

template <>
struct certificate<1> final {
  uint16_t version{1};
  account_id_t recipient{};
  std::string course;
  account_id_t issuer{};
  timestamp_milliseconds_t issue_date{};

  bool operator==(const certificate<1>&) const = default;
};

using certificate_t = certificate<1>;

}  // namespace accredit::schema
