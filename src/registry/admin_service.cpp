#include <spdlog/spdlog.h>
#include <accredit/registry/admin_service.hpp>
#include <accredit/schema/issuer_approved.hpp>
#include <accredit/schema/issuer_revoked.hpp>
#include <accredit/schema/ownership_transferred.hpp>

using namespace accredit::schema;

namespace accredit::registry {

admin_service::admin_service(ownership& owner_gate, issuer_registry& issuers)
    : owner_gate_{owner_gate}, issuers_{issuers} {}

bool admin_service::check_owner(const call_context& context,
                                const account_id_t& target,
                                transaction_error_code& error) const {
  if (!owner_gate_.is_owner(context.caller)) {
    spdlog::debug("Rejecting owner-only call from {}",
                  to_hex(context.caller));
    error = transaction_error_code::unauthorized;
    return false;
  }
  if (is_zero(target)) {
    error = transaction_error_code::invalid_account;
    return false;
  }
  return true;
}

bool admin_service::grant(call_context& context,
                          const account_id_t& issuer,
                          transaction_error_code& error) {
  if (!check_owner(context, issuer, error)) {
    return false;
  }
  issuers_.set_authorized(issuer, true);
  context.events.emplace_back(issuer_approved_t{.issuer = issuer});
  spdlog::info("Issuer {} approved", to_hex(issuer));
  return true;
}

bool admin_service::revoke(call_context& context,
                           const account_id_t& issuer,
                           transaction_error_code& error) {
  if (!check_owner(context, issuer, error)) {
    return false;
  }
  issuers_.set_authorized(issuer, false);
  context.events.emplace_back(issuer_revoked_t{.issuer = issuer});
  spdlog::info("Issuer {} revoked", to_hex(issuer));
  return true;
}

bool admin_service::transfer_ownership(call_context& context,
                                       const account_id_t& new_owner,
                                       transaction_error_code& error) {
  if (!check_owner(context, new_owner, error)) {
    return false;
  }
  owner_gate_.set_owner(new_owner);
  context.events.emplace_back(ownership_transferred_t{
      .previous_owner = context.caller, .new_owner = new_owner});
  spdlog::info("Ownership transferred from {} to {}", to_hex(context.caller),
               to_hex(new_owner));
  return true;
}

}  // namespace accredit::registry
