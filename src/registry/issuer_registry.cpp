#include <accredit/registry/issuer_registry.hpp>
#include <accredit/schema/key/registry_keys.hpp>

namespace accredit::registry {

issuer_registry::issuer_registry(encoder_t& encoder,
                                 accredit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

bool issuer_registry::is_authorized(
    const accredit::schema::account_id_t& identity) const {
  auto key = accredit::schema::key::make_issuer_key(encoder_, identity);
  return state_
      .get<bool>(encoder_,
                 accredit::schema::bytes_view_t{key.data(), key.size()})
      .value_or(false);
}

void issuer_registry::set_authorized(
    const accredit::schema::account_id_t& identity,
    const bool authorized) {
  auto key = accredit::schema::key::make_issuer_key(encoder_, identity);
  state_.put(encoder_, accredit::schema::bytes_view_t{key.data(), key.size()},
             authorized);
}

}  // namespace accredit::registry
