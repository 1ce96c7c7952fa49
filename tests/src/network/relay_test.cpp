#include <domp/builder/event_builder.hpp>
#include <domp/network/relay.hpp>
#include <domp/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>

using namespace domp::schema;

namespace {

event_t make_listing(const domp::builder::event_builder& author,
                     const std::string& name) {
  auto event = author.publish_with_pow(
      product_listing_t{.product_name = name,
                        .description = "x",
                        .price_satoshis = 100},
      2);
  EXPECT_TRUE(event.has_value());
  return *event;
}

}  // namespace

TEST(jsonl_relay, published_events_are_read_back_in_order) {
  auto path = domp::testing::make_db_path("domp_relay") + ".jsonl";
  auto clock = domp::testing::manual_clock{};
  auto seller = domp::builder::event_builder{domp::testing::make_keys(1), clock.fn()};
  auto relay = domp::network::jsonl_relay{path};

  auto first = make_listing(seller, "First");
  clock.advance(10);
  auto second = make_listing(seller, "Second");
  ASSERT_TRUE(relay.publish(first).ok());
  ASSERT_TRUE(relay.publish(second).ok());

  auto stream = relay.subscribe(domp::network::filter_t{});
  auto events = domp::network::collect(*stream);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].id, first.id);
  EXPECT_EQ(events[1].id, second.id);
  EXPECT_FALSE(stream->next().has_value());

  stream->restart();
  EXPECT_EQ(domp::network::collect(*stream).size(), 2u);
  domp::testing::remove_path(path);
}

TEST(jsonl_relay, unverifiable_events_are_not_published) {
  auto path = domp::testing::make_db_path("domp_relay_bad") + ".jsonl";
  auto relay = domp::network::jsonl_relay{path};
  auto event = make_listing(
      domp::builder::event_builder{domp::testing::make_keys(1)}, "Lens");
  event.content = R"({"product_name":"Forged"})";
  EXPECT_EQ(relay.publish(event).code, error_code::id_mismatch);

  auto stream = relay.subscribe(domp::network::filter_t{});
  EXPECT_FALSE(stream->next().has_value());
  domp::testing::remove_path(path);
}

TEST(jsonl_relay, filter_selects_kind_author_time_and_limit) {
  auto path = domp::testing::make_db_path("domp_relay_filter") + ".jsonl";
  auto clock = domp::testing::manual_clock{};
  auto seller = domp::builder::event_builder{domp::testing::make_keys(1), clock.fn()};
  auto other = domp::builder::event_builder{domp::testing::make_keys(2), clock.fn()};
  auto relay = domp::network::jsonl_relay{path};

  auto early = make_listing(seller, "Early");
  clock.advance(100);
  auto late = make_listing(seller, "Late");
  auto foreign = make_listing(other, "Foreign");
  for (const auto& event : {early, late, foreign}) {
    ASSERT_TRUE(relay.publish(event).ok());
  }
  {
    auto garbage = std::ofstream{path, std::ios::app};
    garbage << "{not an event}\n\n";
  }

  auto by_author = relay.subscribe(
      domp::network::filter_t{.authors = {seller.public_key()}});
  EXPECT_EQ(domp::network::collect(*by_author).size(), 2u);

  auto since = relay.subscribe(domp::network::filter_t{
      .since = domp::testing::kGenesis + 50});
  auto recent = domp::network::collect(*since);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].id, late.id);

  auto limited = relay.subscribe(domp::network::filter_t{.limit = 1});
  EXPECT_EQ(domp::network::collect(*limited).size(), 1u);

  auto bids = relay.subscribe(domp::network::filter_t{.kinds = {301}});
  EXPECT_TRUE(domp::network::collect(*bids).empty());
  domp::testing::remove_path(path);
}

TEST(jsonl_relay, missing_file_is_an_empty_stream) {
  auto relay = domp::network::jsonl_relay{
      domp::testing::make_db_path("domp_relay_missing") + ".jsonl"};
  auto stream = relay.subscribe(domp::network::filter_t{});
  EXPECT_FALSE(stream->next().has_value());
}
