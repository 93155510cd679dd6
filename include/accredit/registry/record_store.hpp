#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/schema/certificate.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/storage/overlay.hpp>
#include <optional>

namespace accredit::registry {

/// Write-once mapping from certificate identifier to certificate.
class record_store final {
 public:
  record_store(encoder_t& encoder, accredit::storage::overlay& state);

  /// Insert a record under a fresh identifier. Writing an identifier twice is
  /// an invariant breach and terminates the process.
  void put(accredit::schema::certificate_id_t certificate_id,
           const accredit::schema::certificate_t& certificate);

  std::optional<accredit::schema::certificate_t> get(
      accredit::schema::certificate_id_t certificate_id) const;

  bool contains(accredit::schema::certificate_id_t certificate_id) const;

 private:
  encoder_t& encoder_;
  accredit::storage::overlay& state_;
};

}  // namespace accredit::registry
