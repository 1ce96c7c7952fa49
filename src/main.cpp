#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <domp/common/clock.hpp>
#include <domp/execution/engine.hpp>
#include <domp/network/relay.hpp>
#include <domp/payment/memory_gateway.hpp>
#include <filesystem>
#include <iostream>
#include <set>
#include <string>

using namespace domp::schema;

namespace {

namespace po = boost::program_options;

void print_transactions(const domp::execution::engine& engine) {
  auto transactions = engine.list_transactions();
  std::cout << "Transactions (" << transactions.size() << ")\n";
  for (const auto& transaction : transactions) {
    std::cout << "  " << short_hex(transaction.id) << "  "
              << to_string(transaction.status) << "  '"
              << transaction.listing.product_name << "' "
              << transaction.listing.price_satoshis << " sats, "
              << transaction.bids.size() << " bid(s), "
              << transaction.chain.size() << " event(s)\n";
    auto escrow = engine.find_escrow(transaction.id);
    if (!escrow) {
      continue;
    }
    std::cout << "      escrow " << to_string(escrow->state) << "  purchase "
              << escrow->purchase_amount << ", buyer collateral "
              << escrow->buyer_collateral << ", seller collateral "
              << escrow->seller_collateral << ", timeout " << escrow->timeout
              << '\n';
    if (escrow->distribution) {
      std::cout << "      distribution  seller +"
                << escrow->distribution->to_seller << ", buyer +"
                << escrow->distribution->to_buyer << '\n';
    }
  }
}

void print_reputation(const domp::execution::engine& engine,
                      const timestamp_seconds_t now) {
  auto participants = std::set<public_key_t>{};
  for (const auto& transaction : engine.list_transactions()) {
    participants.insert(transaction.listing.seller);
    for (const auto& bid : transaction.bids) {
      participants.insert(bid.buyer);
    }
    if (transaction.arbitrator) {
      participants.insert(*transaction.arbitrator);
    }
  }
  auto summaries = engine.reputation().compare(
      std::vector<public_key_t>{participants.begin(), participants.end()}, now);
  std::cout << "Reputation (" << summaries.size() << ")\n";
  for (const auto& summary : summaries) {
    std::cout << "  " << short_hex(summary.subject) << "  score "
              << summary.overall_score << ", trust " << summary.trust_score
              << ", " << summary.transaction_count << " review(s) from "
              << summary.unique_reviewers << ", " << summary.volume_btc()
              << " BTC, " << to_string(summary.reliability) << '\n';
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_path = std::string{};
  auto data_dir = std::string{};
  auto relay_log = std::string{};
  auto ledger_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto policy = market_policy_t{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"DOMP node"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file")(
      "data-dir,d", po::value<std::string>(&data_dir),
      "Directory of the RocksDB event store; empty keeps state in memory")(
      "relay-log,r", po::value<std::string>(&relay_log),
      "JSON-lines relay log to ingest")(
      "ledger,l", po::value<std::string>(&ledger_path),
      "Payment ledger file loaded at start and saved at exit")(
      "pow-difficulty",
      po::value<uint32_t>(&policy.anti_spam.min_pow_difficulty)
          ->default_value(policy.anti_spam.min_pow_difficulty),
      "Minimum proof-of-work difficulty in leading zero bits")(
      "min-payment",
      po::value<amount_sats_t>(&policy.anti_spam.min_payment_sats)
          ->default_value(policy.anti_spam.min_payment_sats),
      "Minimum payment proof in satoshis")(
      "collateral-ratio",
      po::value<double>(&policy.min_buyer_collateral_ratio)
          ->default_value(policy.min_buyer_collateral_ratio),
      "Minimum buyer collateral as a fraction of the bid")(
      "max-skew",
      po::value<duration_seconds_t>(&policy.max_future_skew_seconds)
          ->default_value(policy.max_future_skew_seconds),
      "Accepted clock skew for event timestamps in seconds")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value("domp.log"),
      "Log file path");
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    po::store(po::parse_config_file(
                  vm["config"].as<std::string>().c_str(), description),
              vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "domp", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto gateway = domp::payment::memory_gateway{};
  if (!ledger_path.empty() && std::filesystem::exists(ledger_path)) {
    if (!gateway.load(ledger_path)) {
      spdlog::error("Payment ledger '{}' is unreadable", ledger_path);
      spdlog::shutdown();
      return 1;
    }
    spdlog::info("Loaded payment ledger {}", ledger_path);
  }

  auto options = domp::execution::engine_options_t{.policy = policy};
  if (!data_dir.empty()) {
    std::filesystem::create_directories(data_dir);
    options.db_path = (std::filesystem::path{data_dir} / "events").string();
  }
  auto engine = domp::execution::engine{gateway, options};
  engine.subscribe([](const notification_t& notification) {
    if (!notification.status) {
      return;
    }
    spdlog::debug("transaction {} -> {}",
                  notification.transaction_id
                      ? short_hex(*notification.transaction_id)
                      : std::string{"-"},
                  to_string(*notification.status));
  });

  auto exit_code = 0;
  if (!options.db_path.empty()) {
    auto replayed = engine.replay();
    if (!replayed.ok) {
      spdlog::error("Event store replay failed: {}", replayed.error);
      exit_code = 1;
    }
  }

  if (!relay_log.empty()) {
    auto relay = domp::network::jsonl_relay{relay_log};
    auto stream = relay.subscribe(domp::network::filter_t{});
    auto results = engine.ingest_batch(domp::network::collect(*stream));
    auto accepted = std::size_t{0};
    auto duplicates = std::size_t{0};
    for (const auto& result : results) {
      if (result.duplicate) {
        ++duplicates;
      } else if (result.ok()) {
        ++accepted;
      }
    }
    spdlog::info("Relay log {}: {} accepted, {} duplicate, {} rejected",
                 relay_log, accepted, duplicates,
                 results.size() - accepted - duplicates);
  }

  engine.commit();

  print_transactions(engine);
  print_reputation(engine, domp::common::system_now());

  if (!ledger_path.empty() && !gateway.save(ledger_path)) {
    spdlog::error("Payment ledger '{}' could not be written", ledger_path);
    exit_code = 1;
  }

  spdlog::shutdown();
  return exit_code;
}
