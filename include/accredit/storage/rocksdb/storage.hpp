#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <accredit/common/critical.hpp>
#include <accredit/schema/encoding/scale/encoder.hpp>
#include <accredit/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>

namespace accredit::storage {

namespace detail {

using encoder_t = accredit::schema::encoding::encoder<
    accredit::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedHeightKey =
    std::string_view{"SYS|APP|COMMITTED_HEIGHT"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const accredit::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline std::string encode_committed_state(const committed_state& state) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{state.height, state.state_root});
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const accredit::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const accredit::schema::bytes_view_t& key,
           const T& value);

  std::optional<accredit::schema::bytes_t> load(
      const accredit::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void save_committed_state(const committed_state& state) const;
  void commit_batch(const std::vector<key_value_entry_t>& entries,
                    const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const accredit::schema::bytes_view_t& key) const {
  auto value = load(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      accredit::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const accredit::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    accredit::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(accredit::schema::bytes_view_t{encoded_value.data(),
                                                      encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    accredit::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<accredit::schema::bytes_t>
storage<rocksdb_storage_tag>::load(
    const accredit::schema::bytes_view_t& key) const {
  if (!database) {
    accredit::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    accredit::common::critical("Failed to get value from RocksDB");
  }
  return accredit::schema::bytes_t(std::begin(value), std::end(value));
}

inline std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto committed_raw = load(accredit::schema::make_bytes_view(
      std::string_view{detail::kCommittedHeightKey}));
  if (!committed_raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, accredit::schema::hash32_t>>(
          accredit::schema::bytes_view_t{committed_raw->data(),
                                         committed_raw->size()});
  if (!decoded.has_value()) {
    accredit::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

inline void storage<rocksdb_storage_tag>::save_committed_state(
    const committed_state& state) const {
  commit_batch({}, state);
}

inline void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<key_value_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    accredit::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(
        detail::to_slice(accredit::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            accredit::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      accredit::common::critical("failed writing key into commit batch");
    }
  }

  auto state_status = batch.Put(std::string{detail::kCommittedHeightKey},
                                detail::encode_committed_state(state));
  if (!state_status.ok()) {
    accredit::common::critical("failed writing committed height into batch");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit batch to RocksDB: {}",
                  write_status.ToString());
    accredit::common::critical("failed to commit batch");
  }
}

}  // namespace accredit::storage
