#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>

// Schema type: issuer revoked.
// Notification raised on every owner revoke, including repeated revokes.
namespace accredit::schema {

template <uint16_t Version>
struct issuer_revoked;

template <>
struct issuer_revoked<1> final {
  uint16_t version{1};
  account_id_t issuer{};

  bool operator==(const issuer_revoked<1>&) const = default;
};

using issuer_revoked_t = issuer_revoked<1>;

}  // namespace accredit::schema
