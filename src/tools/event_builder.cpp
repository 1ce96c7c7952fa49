#include <boost/program_options.hpp>
#include <domp/antispam/validator.hpp>
#include <domp/builder/event_builder.hpp>
#include <domp/codec/content_codec.hpp>
#include <domp/codec/event_codec.hpp>
#include <domp/common/critical.hpp>
#include <domp/crypto/sign.hpp>
#include <domp/network/relay.hpp>
#include <domp/schema/event_kind.hpp>

#include <cstdint>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>

using namespace domp::schema;

namespace {

namespace po = boost::program_options;

std::string read_input(const po::variables_map& vm, const std::string& name) {
  if (vm.contains(name)) {
    return vm[name].as<std::string>();
  }
  return std::string{std::istreambuf_iterator<char>{std::cin},
                     std::istreambuf_iterator<char>{}};
}

uint16_t parse_kind(const std::string& value) {
  if (auto named = try_from_string<event_kind_t>(value)) {
    return static_cast<uint16_t>(*named);
  }
  auto number = try_parse_u64(value);
  if (!number || *number > UINT16_MAX ||
      !try_make_event_kind(static_cast<uint16_t>(*number))) {
    domp::common::critical("kind must be a marketplace kind name or number");
  }
  return static_cast<uint16_t>(*number);
}

hash32_t get_hash32(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    domp::common::critical("missing required hash argument");
  }
  auto hash = try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    domp::common::critical("hash arguments must be 64 hex characters");
  }
  return *hash;
}

domp::crypto::keypair_t load_keys(const po::variables_map& vm) {
  auto keys = domp::crypto::keypair_from_secret(get_hash32(vm, "secret"));
  if (!keys) {
    domp::common::critical("secret key is not a valid Ed25519 seed");
  }
  return *keys;
}

unsigned_event_t apply_proof(const domp::builder::event_builder& builder,
                             const unsigned_event_t& event,
                             const po::variables_map& vm) {
  if (vm.contains("ln-hash")) {
    return builder.with_payment(
        event, payment_proof_t{.payment_hash = get_hash32(vm, "ln-hash"),
                               .amount_sats = vm["ln-amount"].as<uint64_t>()});
  }
  if (vm.contains("ref-event")) {
    return builder.with_reference(event, get_hash32(vm, "ref-event"),
                                  parse_kind(vm["ref-kind"].as<std::string>()));
  }
  auto mined = builder.with_pow(event, vm["pow"].as<uint32_t>());
  if (!mined) {
    domp::common::critical("proof-of-work search failed");
  }
  return *mined;
}

void emit(const event_t& event, const po::variables_map& vm) {
  std::cout << domp::codec::to_json(event) << '\n';
  if (!vm.contains("relay-log")) {
    return;
  }
  auto relay = domp::network::jsonl_relay{vm["relay-log"].as<std::string>()};
  auto published = relay.publish(event);
  if (!published.ok()) {
    std::cerr << "publish failed: " << published.log << '\n';
  }
}

int validate(const std::string& raw) {
  auto error = std::string{};
  auto event = domp::codec::try_from_json(raw, error);
  if (!event) {
    std::cout << "malformed_event: " << error << '\n';
    return 1;
  }
  auto verified = domp::codec::verify(*event);
  if (!verified.ok()) {
    std::cout << to_string(verified.code) << ": " << verified.log << '\n';
    return 1;
  }
  auto code = error_code::ok;
  auto proof = domp::antispam::parse_proof(event->tags, code, error);
  if (!proof) {
    std::cout << to_string(code) << ": " << error << '\n';
    return 1;
  }
  if (auto pow = std::get_if<pow_proof_t>(&*proof)) {
    auto bits = domp::antispam::leading_zero_bits(event->id);
    if (bits < pow->difficulty) {
      std::cout << "insufficient_difficulty: " << bits << " < "
                << pow->difficulty << '\n';
      return 1;
    }
  }
  auto content = domp::codec::try_parse_content(event->kind, event->content,
                                                error);
  if (!content) {
    std::cout << "malformed_content: " << error << '\n';
    return 1;
  }
  std::cout << "ok " << to_hex(event->id) << " kind " << event->kind << '\n';
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  domp_event_builder keygen\n"
            << "  domp_event_builder build --secret <hex> --kind <kind> "
               "[--content <json>] [proof options]\n"
            << "  domp_event_builder mine --secret <hex> --pow <bits> "
               "[--event <json>]\n"
            << "  domp_event_builder validate [--event <json>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"domp_event_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|build|mine|validate")("secret", po::value<std::string>(),
                                    "32-byte Ed25519 seed hex")(
      "kind", po::value<std::string>(), "event kind name or number")(
      "content", po::value<std::string>(),
      "content JSON; read from stdin when absent")(
      "root", po::value<std::string>(), "transaction root event id hex")(
      "relay-hint", po::value<std::string>()->default_value(""),
      "relay URL written into ref tags")(
      "created-at", po::value<uint64_t>(),
      "created_at override in unix seconds")(
      "pow", po::value<uint32_t>()->default_value(8),
      "proof-of-work difficulty in leading zero bits")(
      "ln-hash", po::value<std::string>(), "settled payment hash hex")(
      "ln-amount", po::value<uint64_t>()->default_value(10),
      "settled payment amount in sats")(
      "ref-event", po::value<std::string>(),
      "own accepted event used as reference proof")(
      "ref-kind", po::value<std::string>()->default_value("product_listing"),
      "kind of the reference event")(
      "event", po::value<std::string>(),
      "wire event JSON; read from stdin when absent")(
      "relay-log", po::value<std::string>(),
      "append the built event to this JSON-lines relay log");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto keys = domp::crypto::generate_keypair();
    if (!keys) {
      domp::common::critical("key generation failed");
    }
    std::cout << "secret " << to_hex(keys->secret_key) << '\n'
              << "pubkey " << to_hex(keys->public_key) << '\n';
    return 0;
  }

  if (command == "build") {
    if (!vm.contains("kind")) {
      domp::common::critical("build mode requires --kind");
    }
    auto kind = parse_kind(vm["kind"].as<std::string>());
    auto error = std::string{};
    auto content =
        domp::codec::try_parse_content(kind, read_input(vm, "content"), error);
    if (!content) {
      std::cerr << "invalid content: " << error << '\n';
      return 1;
    }
    auto clock = domp::common::make_system_clock();
    if (vm.contains("created-at")) {
      clock = [created_at = vm["created-at"].as<uint64_t>()] {
        return created_at;
      };
    }
    auto builder = domp::builder::event_builder{
        load_keys(vm), clock, vm["relay-hint"].as<std::string>()};
    auto root = vm.contains("root") ? std::optional{get_hash32(vm, "root")}
                                    : std::nullopt;
    auto event = builder.sign(apply_proof(builder, builder.build(*content, root), vm));
    if (!event) {
      domp::common::critical("event could not be signed");
    }
    emit(*event, vm);
    return 0;
  }

  if (command == "mine") {
    auto error = std::string{};
    auto parsed = domp::codec::try_from_json(read_input(vm, "event"), error);
    if (!parsed) {
      std::cerr << "invalid event: " << error << '\n';
      return 1;
    }
    auto keys = load_keys(vm);
    if (keys.public_key != parsed->author_key) {
      domp::common::critical("secret does not belong to the event author");
    }
    auto builder = domp::builder::event_builder{keys};
    auto mined = builder.with_pow(
        unsigned_event_t{.author_key = parsed->author_key,
                         .created_at = parsed->created_at,
                         .kind = parsed->kind,
                         .tags = parsed->tags,
                         .content = parsed->content},
        vm["pow"].as<uint32_t>());
    if (!mined) {
      domp::common::critical("proof-of-work search failed");
    }
    auto event = builder.sign(*mined);
    if (!event) {
      domp::common::critical("event could not be signed");
    }
    emit(*event, vm);
    return 0;
  }

  if (command == "validate") {
    return validate(read_input(vm, "event"));
  }

  domp::common::critical("command must be keygen|build|mine|validate");
}
