#pragma once
#include <accredit/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace accredit::storage {

using key_value_entry_t =
    std::pair<accredit::schema::bytes_t, accredit::schema::bytes_t>;

/// Last committed block checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  accredit::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const accredit::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const accredit::schema::bytes_view_t& key,
           const T& value);

  /// Return the raw encoded value at key, or std::nullopt when missing.
  std::optional<accredit::schema::bytes_t> load(
      const accredit::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;

  /// Persist the most recent committed checkpoint (height + state_root).
  void save_committed_state(const committed_state& state) const;

  /// Atomically write all entries together with the committed checkpoint.
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace accredit::storage
