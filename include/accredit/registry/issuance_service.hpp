#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/registry/identifier_allocator.hpp>
#include <accredit/registry/issuer_registry.hpp>
#include <accredit/registry/record_store.hpp>
#include <accredit/schema/certificate.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/transaction_error_code.hpp>
#include <accredit/token/state/unique_ownership.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace accredit::registry {

inline constexpr std::size_t kMaxCourseLength = 256;

using ownership_ledger_t =
    accredit::token::unique_ownership<accredit::token::state_ledger_tag>;

/// Certificate issuance and verification.
class issuance_service final {
 public:
  issuance_service(const issuer_registry& issuers,
                   identifier_allocator& identifiers,
                   record_store& records,
                   ownership_ledger_t& tokens);

  /// Issue a certificate to `recipient` on behalf of `context.caller`.
  ///
  /// The caller must be an authorized issuer. The recipient must not be the
  /// zero account and the course must hold 1..kMaxCourseLength bytes. All
  /// checks run before the identifier is allocated, so a rejected call leaves
  /// the sequence, the ledger and the record store untouched.
  ///
  /// Returns the new identifier, or std::nullopt with `error` set.
  std::optional<accredit::schema::certificate_id_t> issue_certificate(
      call_context& context,
      const accredit::schema::account_id_t& recipient,
      const std::string& course,
      accredit::schema::transaction_error_code& error);

  /// Return the certificate for a minted identifier, std::nullopt otherwise.
  std::optional<accredit::schema::certificate_t> verify_certificate(
      accredit::schema::certificate_id_t certificate_id) const;

 private:
  const issuer_registry& issuers_;
  identifier_allocator& identifiers_;
  record_store& records_;
  ownership_ledger_t& tokens_;
};

}  // namespace accredit::registry
