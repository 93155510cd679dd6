#pragma once
#include <accredit/registry/call_context.hpp>
#include <accredit/storage/overlay.hpp>
#include <accredit/token/unique_ownership.hpp>

namespace accredit::token {

/// Ownership ledger kept in registry state next to the certificates, so a
/// mint commits or rolls back together with the issuance that caused it.
struct state_ledger_tag {};

template <>
struct unique_ownership<state_ledger_tag> final {
  unique_ownership(accredit::registry::encoder_t& encoder,
                   accredit::storage::overlay& state);

  void mint(accredit::schema::certificate_id_t token_id,
            const accredit::schema::account_id_t& owner);
  bool exists(accredit::schema::certificate_id_t token_id) const;
  std::optional<accredit::schema::account_id_t> owner_of(
      accredit::schema::certificate_id_t token_id) const;
  uint64_t balance_of(const accredit::schema::account_id_t& owner) const;

 private:
  accredit::registry::encoder_t& encoder_;
  accredit::storage::overlay& state_;
};

}  // namespace accredit::token
