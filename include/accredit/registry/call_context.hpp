#pragma once

#include <accredit/schema/encoding/scale/encoder.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/registry_event.hpp>
#include <vector>

namespace accredit::registry {

using encoder_t = accredit::schema::encoding::encoder<
    accredit::schema::encoding::scale_encoder_tag>;

/// Host-supplied facts about the call being executed (signer and block time)
/// plus the notifications it raised so far.
struct call_context final {
  accredit::schema::account_id_t caller{};
  accredit::schema::timestamp_milliseconds_t timestamp{};
  std::vector<accredit::schema::registry_event_t> events;
};

}  // namespace accredit::registry
