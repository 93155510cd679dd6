#include <accredit/common/critical.hpp>
#include <accredit/registry/record_store.hpp>
#include <accredit/schema/key/registry_keys.hpp>

namespace accredit::registry {

record_store::record_store(encoder_t& encoder,
                           accredit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

void record_store::put(const accredit::schema::certificate_id_t certificate_id,
                       const accredit::schema::certificate_t& certificate) {
  if (contains(certificate_id)) {
    spdlog::error("Certificate {} already recorded", certificate_id);
    accredit::common::critical("certificate identifier reused");
  }
  auto key =
      accredit::schema::key::make_certificate_key(encoder_, certificate_id);
  state_.put(encoder_, accredit::schema::bytes_view_t{key.data(), key.size()},
             certificate);
}

std::optional<accredit::schema::certificate_t> record_store::get(
    const accredit::schema::certificate_id_t certificate_id) const {
  auto key =
      accredit::schema::key::make_certificate_key(encoder_, certificate_id);
  return state_.get<accredit::schema::certificate_t>(
      encoder_, accredit::schema::bytes_view_t{key.data(), key.size()});
}

bool record_store::contains(
    const accredit::schema::certificate_id_t certificate_id) const {
  auto key =
      accredit::schema::key::make_certificate_key(encoder_, certificate_id);
  return state_
      .load(accredit::schema::bytes_view_t{key.data(), key.size()})
      .has_value();
}

}  // namespace accredit::registry
