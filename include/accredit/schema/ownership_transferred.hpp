#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>

// Schema type: ownership transferred.
// Notification raised when the owning authority changes hands.
namespace accredit::schema {

template <uint16_t Version>
struct ownership_transferred;

template <>
struct ownership_transferred<1> final {
  uint16_t version{1};
  account_id_t previous_owner{};
  account_id_t new_owner{};

  bool operator==(const ownership_transferred<1>&) const = default;
};

using ownership_transferred_t = ownership_transferred<1>;

}  // namespace accredit::schema
