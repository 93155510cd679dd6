#include <accredit/schema/encoding/scale/encoder.hpp>
#include <accredit/storage/overlay.hpp>
#include <accredit/storage/rocksdb/storage.hpp>
#include <accredit/storage/storage.hpp>
#include <accredit/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t =
    accredit::storage::storage<accredit::storage::rocksdb_storage_tag>;
using encoder_t = accredit::schema::encoding::encoder<
    accredit::schema::encoding::scale_encoder_tag>;

accredit::schema::bytes_t key_of(const std::string& name) {
  return accredit::schema::make_bytes(name);
}

accredit::schema::bytes_view_t view_of(const accredit::schema::bytes_t& key) {
  return accredit::schema::bytes_view_t{key.data(), key.size()};
}

class storage_types : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = accredit::testing::make_db_path("accredit_storage");
    storage_ = accredit::storage::make_storage<
        accredit::storage::rocksdb_storage_tag>(db_path_);
  }

  void TearDown() override {
    storage_.database.reset();
    accredit::testing::remove_path(db_path_);
  }

  std::string db_path_;
  encoder_t encoder_;
  storage_t storage_;
};

}  // namespace

TEST(storage_defaults, defaults_are_stable) {
  auto committed = accredit::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_TRUE(accredit::schema::is_zero(committed.state_root));

  auto entry = accredit::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST_F(storage_types, missing_committed_state_reads_as_nullopt) {
  EXPECT_FALSE(storage_.load_committed_state().has_value());
}

TEST_F(storage_types, committed_state_round_trips) {
  auto state = accredit::storage::committed_state{
      .height = 42, .state_root = accredit::testing::make_hash(10)};
  storage_.save_committed_state(state);

  auto loaded = storage_.load_committed_state();
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->height, state.height);
  EXPECT_EQ(loaded->state_root, state.state_root);
}

TEST_F(storage_types, put_and_get_round_trip_values) {
  auto key = key_of("plain");
  storage_.put(encoder_, view_of(key), uint64_t{77});
  EXPECT_EQ(storage_.get<uint64_t>(encoder_, view_of(key)), uint64_t{77});

  auto missing = key_of("missing");
  EXPECT_FALSE(storage_.get<uint64_t>(encoder_, view_of(missing)).has_value());
}

TEST_F(storage_types, commit_batch_writes_entries_and_checkpoint) {
  auto first = key_of("first");
  auto second = key_of("second");
  auto entries = std::vector<accredit::storage::key_value_entry_t>{
      {first, encoder_.encode(uint64_t{1})},
      {second, encoder_.encode(std::string{"two"})}};
  storage_.commit_batch(entries, accredit::storage::committed_state{
                                     .height = 3,
                                     .state_root =
                                         accredit::testing::make_hash(3)});

  EXPECT_EQ(storage_.get<uint64_t>(encoder_, view_of(first)), uint64_t{1});
  EXPECT_EQ(storage_.get<std::string>(encoder_, view_of(second)),
            std::string{"two"});
  auto committed = storage_.load_committed_state();
  ASSERT_TRUE(committed.has_value());
  EXPECT_EQ(committed->height, 3);
}

TEST_F(storage_types, overlay_reads_fall_through_to_storage) {
  auto key = key_of("base");
  storage_.put(encoder_, view_of(key), uint64_t{5});

  auto layer = accredit::storage::overlay{storage_};
  EXPECT_EQ(layer.get<uint64_t>(encoder_, view_of(key)), uint64_t{5});

  layer.put(encoder_, view_of(key), uint64_t{6});
  EXPECT_EQ(layer.get<uint64_t>(encoder_, view_of(key)), uint64_t{6});
  EXPECT_EQ(storage_.get<uint64_t>(encoder_, view_of(key)), uint64_t{5});
}

TEST_F(storage_types, nested_overlay_merges_into_parent_only) {
  auto key = key_of("nested");
  auto block = accredit::storage::overlay{storage_};
  {
    auto tx = accredit::storage::overlay{storage_, &block};
    tx.put(encoder_, view_of(key), uint64_t{9});
    EXPECT_TRUE(block.empty());
    tx.merge();
    EXPECT_TRUE(tx.empty());
  }
  EXPECT_EQ(block.get<uint64_t>(encoder_, view_of(key)), uint64_t{9});
  EXPECT_FALSE(storage_.load(view_of(key)).has_value());
  EXPECT_EQ(block.entries().size(), 1u);
}

TEST_F(storage_types, discarded_overlay_leaves_no_trace) {
  auto key = key_of("discarded");
  auto block = accredit::storage::overlay{storage_};
  {
    auto tx = accredit::storage::overlay{storage_, &block};
    tx.put(encoder_, view_of(key), uint64_t{1});
    tx.discard();
    tx.merge();
  }
  EXPECT_TRUE(block.empty());
  EXPECT_FALSE(block.load(view_of(key)).has_value());
}

TEST_F(storage_types, overlay_entries_are_ordered_by_key) {
  auto layer = accredit::storage::overlay{storage_};
  layer.store(view_of(key_of("b")), accredit::schema::bytes_t{2});
  layer.store(view_of(key_of("a")), accredit::schema::bytes_t{1});

  auto entries = layer.entries();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].first, key_of("a"));
  EXPECT_EQ(entries[1].first, key_of("b"));
}

TEST(storage_defaults, merge_without_parent_is_fatal) {
  auto detached = storage_t{};
  auto layer = accredit::storage::overlay{detached};
  EXPECT_DEATH(layer.merge(), "");
}
