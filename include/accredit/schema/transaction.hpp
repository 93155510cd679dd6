#pragma once
#include <accredit/schema/approve_issuer.hpp>
#include <accredit/schema/issue_certificate.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/revoke_issuer.hpp>
#include <accredit/schema/transfer_ownership.hpp>
#include <variant>

namespace accredit::schema {

using transaction_payload_t = std::variant<issue_certificate_t,
                                           approve_issuer_t,
                                           revoke_issuer_t,
                                           transfer_ownership_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  account_id_t signer{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace accredit::schema
