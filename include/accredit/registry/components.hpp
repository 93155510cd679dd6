#pragma once

#include <accredit/registry/admin_service.hpp>
#include <accredit/registry/call_context.hpp>
#include <accredit/registry/identifier_allocator.hpp>
#include <accredit/registry/issuance_service.hpp>
#include <accredit/registry/issuer_registry.hpp>
#include <accredit/registry/ownership.hpp>
#include <accredit/registry/record_store.hpp>
#include <accredit/storage/overlay.hpp>

namespace accredit::registry {

/// The registry wired over a single state layer. Cheap to build; the engine
/// builds one per transaction and one per query.
struct components final {
  components(encoder_t& encoder, accredit::storage::overlay& state)
      : identifiers{encoder, state},
        issuers{encoder, state},
        owner_gate{encoder, state},
        records{encoder, state},
        tokens{encoder, state},
        admin{owner_gate, issuers},
        issuance{issuers, identifiers, records, tokens} {}

  components(const components&) = delete;
  components& operator=(const components&) = delete;

  identifier_allocator identifiers;
  issuer_registry issuers;
  ownership owner_gate;
  record_store records;
  ownership_ledger_t tokens;
  admin_service admin;
  issuance_service issuance;
};

}  // namespace accredit::registry
