#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/storage/overlay.hpp>
#include <optional>

namespace accredit::registry {

/// Owning authority of the registry. Written once at genesis and afterwards
/// only through `admin_service::transfer_ownership`.
class ownership final {
 public:
  ownership(encoder_t& encoder, accredit::storage::overlay& state);

  std::optional<accredit::schema::account_id_t> owner() const;

  bool is_owner(const accredit::schema::account_id_t& identity) const;

  void set_owner(const accredit::schema::account_id_t& identity);

 private:
  encoder_t& encoder_;
  accredit::storage::overlay& state_;
};

}  // namespace accredit::registry
