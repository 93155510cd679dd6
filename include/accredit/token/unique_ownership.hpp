#pragma once
#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <optional>

namespace accredit::token {

/// Exclusive identifier-to-owner binding consumed by the registry.
///
/// The backend is chosen through the Library tag. It carries no transfer or
/// approval semantics; identifiers are bound once and stay bound.
template <typename Library>
struct unique_ownership {
  /// Bind `token_id` to `owner`. Binding an already bound identifier or the
  /// zero owner is an invariant breach.
  void mint(accredit::schema::certificate_id_t token_id,
            const accredit::schema::account_id_t& owner);

  /// True once `token_id` has been minted.
  bool exists(accredit::schema::certificate_id_t token_id) const;

  std::optional<accredit::schema::account_id_t> owner_of(
      accredit::schema::certificate_id_t token_id) const;

  /// Number of identifiers bound to `owner`.
  uint64_t balance_of(const accredit::schema::account_id_t& owner) const;
};

}  // namespace accredit::token
