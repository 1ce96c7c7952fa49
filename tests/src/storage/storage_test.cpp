#include <domp/storage/rocksdb/storage.hpp>
#include <domp/storage/storage.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace domp::schema;

namespace {

event_t make_event(const uint8_t seed) {
  return event_t{.id = domp::testing::make_hash(seed),
                 .author_key = domp::testing::make_hash(static_cast<uint8_t>(seed + 1)),
                 .created_at = domp::testing::kGenesis + seed,
                 .kind = 301,
                 .tags = {{"ref", std::string(64, 'a'), "", "reply"}},
                 .content = R"({"bid_amount_satoshis":5})"};
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = domp::storage::committed_state{};
  EXPECT_EQ(committed.event_count, 0u);
  EXPECT_EQ(committed.committed_at, 0u);
}

TEST(storage, events_load_in_sequence_order) {
  auto db = domp::testing::make_db_path("domp_storage_events");
  {
    auto storage = domp::storage::make_storage<domp::storage::rocksdb_storage_tag>(db);
    EXPECT_TRUE(storage.load_events().empty());
    // Little-endian keys put 256 ahead of 1 byte-wise.
    storage.append_event(256, make_event(30));
    storage.append_event(1, make_event(10));
    storage.append_event(2, make_event(20));

    auto events = storage.load_events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].sequence, 1u);
    EXPECT_EQ(events[1].sequence, 2u);
    EXPECT_EQ(events[2].sequence, 256u);
    EXPECT_EQ(events[0].event.id, make_event(10).id);
    EXPECT_EQ(events[2].event.tags, make_event(30).tags);
    EXPECT_EQ(events[2].event.content, make_event(30).content);
  }
  {
    auto reopened =
        domp::storage::make_storage<domp::storage::rocksdb_storage_tag>(db);
    EXPECT_EQ(reopened.load_events().size(), 3u);
  }
  domp::testing::remove_path(db);
}

TEST(storage, preimages_are_kept_per_transaction) {
  auto db = domp::testing::make_db_path("domp_storage_preimage");
  {
    auto storage = domp::storage::make_storage<domp::storage::rocksdb_storage_tag>(db);
    auto transaction_id = domp::testing::make_hash(1);
    EXPECT_FALSE(storage.load_preimage(transaction_id).has_value());
    storage.save_preimage(transaction_id, domp::testing::make_hash(90));
    EXPECT_EQ(storage.load_preimage(transaction_id), domp::testing::make_hash(90));
    EXPECT_FALSE(storage.load_preimage(domp::testing::make_hash(2)).has_value());
    // Preimages never show up in the event log.
    EXPECT_TRUE(storage.load_events().empty());
  }
  domp::testing::remove_path(db);
}

TEST(storage, committed_state_round_trips) {
  auto db = domp::testing::make_db_path("domp_storage_committed");
  {
    auto storage = domp::storage::make_storage<domp::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());
    storage.save_committed_state(domp::storage::committed_state{
        .event_count = 42,
        .state_digest = domp::testing::make_hash(10),
        .committed_at = domp::testing::kGenesis});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->event_count, 42u);
    EXPECT_EQ(loaded->state_digest, domp::testing::make_hash(10));
    EXPECT_EQ(loaded->committed_at, domp::testing::kGenesis);
  }
  domp::testing::remove_path(db);
}
