#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: issue certificate.
// Registry operation: an authorized issuer mints a certificate for
// `recipient`; the signer of the enclosing transaction becomes the issuer.
namespace accredit::schema {

template <uint16_t Version>
struct issue_certificate;

template <>
struct issue_certificate<1> final {
  uint16_t version{1};
  account_id_t recipient{};
  std::string course;
};

using issue_certificate_t = issue_certificate<1>;

}  // namespace accredit::schema
