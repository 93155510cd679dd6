#pragma once
#include <accredit/schema/primitives.hpp>
#include <accredit/storage/rocksdb/storage.hpp>
#include <accredit/storage/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace accredit::storage {

/// Uncommitted write layer over the storage backend.
///
/// Reads fall through this layer, then the parent layer (if any), then
/// storage. Writes stay in memory until merged into the parent or handed to
/// `storage::commit_batch`. Dropping an overlay discards its writes, which is
/// how a failed transaction leaves no trace.
class overlay final {
 public:
  using backing_t = storage<rocksdb_storage_tag>;

  explicit overlay(const backing_t& backing, overlay* parent = nullptr);

  overlay(const overlay&) = delete;
  overlay& operator=(const overlay&) = delete;
  overlay(overlay&&) = delete;
  overlay& operator=(overlay&&) = delete;

  std::optional<accredit::schema::bytes_t> load(
      const accredit::schema::bytes_view_t& key) const;

  void store(const accredit::schema::bytes_view_t& key,
             accredit::schema::bytes_t value);

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const accredit::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const accredit::schema::bytes_view_t& key,
           const T& value);

  /// Move all writes into the parent layer. Requires a parent.
  void merge();

  /// Drop all writes held by this layer.
  void discard();

  /// Writes held by this layer, ordered by key.
  std::vector<key_value_entry_t> entries() const;

  bool empty() const;

 private:
  const backing_t& backing_;
  overlay* parent_{nullptr};
  std::map<accredit::schema::bytes_t, accredit::schema::bytes_t> writes_;
};

template <typename T, typename Encoder>
std::optional<T> overlay::get(Encoder& encoder,
                              const accredit::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      accredit::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void overlay::put(Encoder& encoder,
                  const accredit::schema::bytes_view_t& key,
                  const T& value) {
  store(key, encoder.encode(value));
}

}  // namespace accredit::storage
