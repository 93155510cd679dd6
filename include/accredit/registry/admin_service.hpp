#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/registry/issuer_registry.hpp>
#include <accredit/registry/ownership.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/transaction_error_code.hpp>

namespace accredit::registry {

/// Owner-gated mutations of the issuer allow-list and of ownership itself.
///
/// Every operation checks the owner gate before touching state. On failure
/// `error` is set, false is returned and nothing is written or emitted.
/// Repeated grants and revokes are accepted and still raise their
/// notification.
class admin_service final {
 public:
  admin_service(ownership& owner_gate, issuer_registry& issuers);

  bool grant(call_context& context,
             const accredit::schema::account_id_t& issuer,
             accredit::schema::transaction_error_code& error);

  bool revoke(call_context& context,
              const accredit::schema::account_id_t& issuer,
              accredit::schema::transaction_error_code& error);

  bool transfer_ownership(call_context& context,
                          const accredit::schema::account_id_t& new_owner,
                          accredit::schema::transaction_error_code& error);

 private:
  bool check_owner(const call_context& context,
                   const accredit::schema::account_id_t& target,
                   accredit::schema::transaction_error_code& error) const;

  ownership& owner_gate_;
  issuer_registry& issuers_;
};

}  // namespace accredit::registry
