#include <accredit/common/critical.hpp>
#include <accredit/schema/key/registry_keys.hpp>
#include <accredit/token/state/unique_ownership.hpp>

namespace accredit::token {

unique_ownership<state_ledger_tag>::unique_ownership(
    accredit::registry::encoder_t& encoder,
    accredit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

void unique_ownership<state_ledger_tag>::mint(
    const accredit::schema::certificate_id_t token_id,
    const accredit::schema::account_id_t& owner) {
  if (accredit::schema::is_zero(owner)) {
    accredit::common::critical("cannot mint to the zero account");
  }
  if (exists(token_id)) {
    spdlog::error("Token {} already minted", token_id);
    accredit::common::critical("token already minted");
  }

  auto owner_key =
      accredit::schema::key::make_token_owner_key(encoder_, token_id);
  state_.put(encoder_,
             accredit::schema::bytes_view_t{owner_key.data(), owner_key.size()},
             owner);

  auto balance_key =
      accredit::schema::key::make_token_balance_key(encoder_, owner);
  state_.put(encoder_,
             accredit::schema::bytes_view_t{balance_key.data(),
                                            balance_key.size()},
             uint64_t{balance_of(owner) + 1});
}

bool unique_ownership<state_ledger_tag>::exists(
    const accredit::schema::certificate_id_t token_id) const {
  return owner_of(token_id).has_value();
}

std::optional<accredit::schema::account_id_t>
unique_ownership<state_ledger_tag>::owner_of(
    const accredit::schema::certificate_id_t token_id) const {
  auto key = accredit::schema::key::make_token_owner_key(encoder_, token_id);
  return state_.get<accredit::schema::account_id_t>(
      encoder_, accredit::schema::bytes_view_t{key.data(), key.size()});
}

uint64_t unique_ownership<state_ledger_tag>::balance_of(
    const accredit::schema::account_id_t& owner) const {
  auto key = accredit::schema::key::make_token_balance_key(encoder_, owner);
  return state_
      .get<uint64_t>(encoder_,
                     accredit::schema::bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

}  // namespace accredit::token
