#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/storage/overlay.hpp>

namespace accredit::registry {

/// Issuer allow-list. Identities never granted read as not authorized.
///
/// This type holds no access policy of its own; owner gating lives in
/// `admin_service`.
class issuer_registry final {
 public:
  issuer_registry(encoder_t& encoder, accredit::storage::overlay& state);

  bool is_authorized(const accredit::schema::account_id_t& identity) const;

  void set_authorized(const accredit::schema::account_id_t& identity,
                      bool authorized);

 private:
  encoder_t& encoder_;
  accredit::storage::overlay& state_;
};

}  // namespace accredit::registry
