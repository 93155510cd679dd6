#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: certificate issued.
// Notification raised after a certificate has been minted and stored.
namespace accredit::schema {

template <uint16_t Version>
struct certificate_issued;

template <>
struct certificate_issued<1> final {
  uint16_t version{1};
  certificate_id_t certificate_id{};
  account_id_t recipient{};
  std::string course;
  account_id_t issuer{};

  bool operator==(const certificate_issued<1>&) const = default;
};

using certificate_issued_t = certificate_issued<1>;

}  // namespace accredit::schema
