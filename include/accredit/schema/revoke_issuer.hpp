#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>

// Schema type: revoke issuer.
// Registry operation: owner-only withdrawal of issuing rights. Certificates
// already issued by `issuer` stay valid.
namespace accredit::schema {

template <uint16_t Version>
struct revoke_issuer;

template <>
struct revoke_issuer<1> final {
  uint16_t version{1};
  account_id_t issuer{};
};

using revoke_issuer_t = revoke_issuer<1>;

}  // namespace accredit::schema
