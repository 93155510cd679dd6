#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>

// Schema type: issuer approved.
// Notification raised on every owner grant, including repeated grants.
namespace accredit::schema {

template <uint16_t Version>
struct issuer_approved;

template <>
struct issuer_approved<1> final {
  uint16_t version{1};
  account_id_t issuer{};

  bool operator==(const issuer_approved<1>&) const = default;
};

using issuer_approved_t = issuer_approved<1>;

}  // namespace accredit::schema
