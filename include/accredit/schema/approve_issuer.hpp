#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>

// Schema type: approve issuer.
// Registry operation: owner-only grant of issuing rights to `issuer`.
namespace accredit::schema {

template <uint16_t Version>
struct approve_issuer;

template <>
struct approve_issuer<1> final {
  uint16_t version{1};
  account_id_t issuer{};
};

using approve_issuer_t = approve_issuer<1>;

}  // namespace accredit::schema
