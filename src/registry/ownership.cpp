#include <accredit/registry/ownership.hpp>
#include <accredit/schema/key/registry_keys.hpp>

namespace accredit::registry {

ownership::ownership(encoder_t& encoder, accredit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

std::optional<accredit::schema::account_id_t> ownership::owner() const {
  auto key = accredit::schema::key::make_owner_key(encoder_);
  return state_.get<accredit::schema::account_id_t>(
      encoder_, accredit::schema::bytes_view_t{key.data(), key.size()});
}

bool ownership::is_owner(const accredit::schema::account_id_t& identity) const {
  auto current = owner();
  return current.has_value() && *current == identity;
}

void ownership::set_owner(const accredit::schema::account_id_t& identity) {
  auto key = accredit::schema::key::make_owner_key(encoder_);
  state_.put(encoder_, accredit::schema::bytes_view_t{key.data(), key.size()},
             identity);
}

}  // namespace accredit::registry
