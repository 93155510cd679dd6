#include <accredit/common/critical.hpp>
#include <accredit/registry/identifier_allocator.hpp>
#include <accredit/schema/key/registry_keys.hpp>

#include <limits>

namespace accredit::registry {

identifier_allocator::identifier_allocator(encoder_t& encoder,
                                           accredit::storage::overlay& state)
    : encoder_{encoder}, state_{state} {}

accredit::schema::certificate_id_t identifier_allocator::next() {
  using id_limits_t =
      std::numeric_limits<accredit::schema::certificate_id_t>;
  auto allocated = peek();
  if (allocated == id_limits_t::max()) {
    accredit::common::critical("certificate identifier space exhausted");
  }
  auto key = accredit::schema::key::make_certificate_sequence_key(encoder_);
  state_.put(encoder_, accredit::schema::bytes_view_t{key.data(), key.size()},
             accredit::schema::certificate_id_t{allocated + 1});
  return allocated;
}

accredit::schema::certificate_id_t identifier_allocator::peek() const {
  auto key = accredit::schema::key::make_certificate_sequence_key(encoder_);
  return state_
      .get<accredit::schema::certificate_id_t>(
          encoder_, accredit::schema::bytes_view_t{key.data(), key.size()})
      .value_or(0);
}

}  // namespace accredit::registry
