#include <domp/crypto/hash.hpp>
#include <domp/payment/memory_gateway.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <map>

using namespace domp::schema;

namespace domp::payment {

namespace {

using json = nlohmann::json;

inline constexpr auto kInvoicePrefix = std::string_view{"lnbcrt"};
inline constexpr auto kHashSeparator = std::string_view{"1p"};

}  // namespace

std::optional<hash32_t> parse_invoice_hash(const std::string_view invoice) {
  if (!invoice.starts_with(kInvoicePrefix)) {
    return std::nullopt;
  }
  auto separator = invoice.rfind(kHashSeparator);
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  return try_make_hash32(invoice.substr(separator + kHashSeparator.size()));
}

memory_gateway::memory_gateway(domp::common::clock_fn_t clock)
    : clock_(std::move(clock)) {}

std::optional<invoice_t> memory_gateway::create_invoice(
    const public_key_t& payee,
    const amount_sats_t amount_sats,
    const std::string_view memo,
    const duration_seconds_t expiry_seconds) {
  if (amount_sats == 0) {
    return std::nullopt;
  }
  auto preimage = domp::crypto::random_array<32>();
  auto payment_hash =
      domp::crypto::sha256(bytes_view_t{preimage.data(), preimage.size()});
  auto record = invoice_record_t{
      .invoice = invoice_t{.invoice = fmt::format("{}{}{}{}", kInvoicePrefix,
                                                  amount_sats, kHashSeparator,
                                                  to_hex(payment_hash)),
                           .payment_hash = payment_hash,
                           .amount_sats = amount_sats,
                           .payee = payee,
                           .memo = std::string{memo},
                           .expires_at = clock_() + expiry_seconds},
      .preimage = preimage};

  auto lock = std::scoped_lock{mutex_};
  auto [it, inserted] = invoices_.emplace(payment_hash, std::move(record));
  if (!inserted) {
    return std::nullopt;
  }
  return it->second.invoice;
}

std::optional<payment_receipt_t> memory_gateway::await_payment(
    const hash32_t& payment_hash,
    const std::chrono::milliseconds timeout) {
  auto lock = std::unique_lock{mutex_};
  auto is_paid = [&] {
    auto it = invoices_.find(payment_hash);
    return it != invoices_.end() && it->second.paid_at.has_value();
  };
  if (!paid_.wait_for(lock, timeout, is_paid)) {
    return std::nullopt;
  }
  const auto& record = invoices_.at(payment_hash);
  return payment_receipt_t{.preimage = record.preimage,
                           .paid_at = *record.paid_at};
}

pay_result_t memory_gateway::pay(const std::string_view invoice,
                                 const public_key_t& payer) {
  auto result = pay_result_t{};
  auto payment_hash = parse_invoice_hash(invoice);
  if (!payment_hash) {
    result.error = "unrecognised invoice";
    return result;
  }
  result.payment_hash = *payment_hash;

  {
    auto lock = std::scoped_lock{mutex_};
    auto it = invoices_.find(*payment_hash);
    if (it == invoices_.end()) {
      result.error = "unknown invoice";
      return result;
    }
    auto& record = it->second;
    auto now = clock_();
    if (record.paid_at) {
      result.error = "invoice already paid";
      return result;
    }
    if (now > record.invoice.expires_at) {
      result.error = "invoice expired";
      return result;
    }
    auto& payer_balance = balances_[payer];
    if (payer_balance < record.invoice.amount_sats) {
      result.error = "insufficient balance";
      return result;
    }
    payer_balance -= record.invoice.amount_sats;
    balances_[record.invoice.payee] += record.invoice.amount_sats;
    record.paid_at = now;
    settled_[*payment_hash] =
        settled_payment_t{.payment_hash = *payment_hash,
                          .amount_sats = record.invoice.amount_sats,
                          .payee = record.invoice.payee,
                          .settled_at = now};
    result.status = pay_status_t::succeeded;
    result.preimage = record.preimage;
  }
  paid_.notify_all();
  spdlog::debug("settled payment {}", short_hex(*payment_hash));
  return result;
}

std::optional<settled_payment_t> memory_gateway::lookup(
    const hash32_t& payment_hash) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = settled_.find(payment_hash);
  if (it == settled_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void memory_gateway::deposit(const public_key_t& account,
                             const amount_sats_t amount_sats) {
  auto lock = std::scoped_lock{mutex_};
  balances_[account] += amount_sats;
}

amount_sats_t memory_gateway::balance_of(const public_key_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

bool memory_gateway::save(const std::string_view path) const {
  auto out = std::ofstream{std::string{path}, std::ios::trunc};
  if (!out) {
    spdlog::error("cannot open payment ledger '{}' for writing", path);
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  for (const auto& [payment_hash, record] : invoices_) {
    auto line = json{{"type", "invoice"},
                     {"invoice", record.invoice.invoice},
                     {"payment_hash", to_hex(payment_hash)},
                     {"amount_sats", record.invoice.amount_sats},
                     {"payee", to_hex(record.invoice.payee)},
                     {"memo", record.invoice.memo},
                     {"expires_at", record.invoice.expires_at},
                     {"preimage", to_hex(record.preimage)}};
    if (record.paid_at) {
      line["paid_at"] = *record.paid_at;
    }
    out << line.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
  }
  for (const auto& [account, amount] : balances_) {
    auto line = json{{"type", "balance"},
                     {"account", to_hex(account)},
                     {"amount_sats", amount}};
    out << line.dump() << '\n';
  }
  return static_cast<bool>(out);
}

bool memory_gateway::load(const std::string_view path) {
  auto in = std::ifstream{std::string{path}};
  if (!in) {
    return false;
  }
  // Parse the whole file first; the ledger is only touched once every line
  // has been read.
  auto invoices = std::map<hash32_t, invoice_record_t>{};
  auto settled = std::map<hash32_t, settled_payment_t>{};
  auto balances = std::map<public_key_t, amount_sats_t>{};
  auto line = std::string{};
  auto line_number = std::size_t{0};
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    auto entry = json::parse(line, nullptr, false);
    if (entry.is_discarded() || !entry.is_object()) {
      spdlog::warn("payment ledger '{}' line {} is not JSON", path,
                   line_number);
      return false;
    }
    try {
      auto type = entry.at("type").get<std::string>();
      if (type == "balance") {
        auto account =
            try_from_hex_array<32>(entry.at("account").get<std::string>());
        if (!account) {
          spdlog::warn("payment ledger '{}' line {} has a bad account", path,
                       line_number);
          return false;
        }
        balances[*account] = entry.at("amount_sats").get<amount_sats_t>();
        continue;
      }
      if (type != "invoice") {
        continue;
      }
      auto payment_hash =
          try_make_hash32(entry.at("payment_hash").get<std::string>());
      auto payee = try_from_hex_array<32>(entry.at("payee").get<std::string>());
      auto preimage =
          try_from_hex_array<32>(entry.at("preimage").get<std::string>());
      if (!payment_hash || !payee || !preimage) {
        spdlog::warn("payment ledger '{}' line {} has a bad invoice", path,
                     line_number);
        return false;
      }
      auto record = invoice_record_t{
          .invoice =
              invoice_t{.invoice = entry.at("invoice").get<std::string>(),
                        .payment_hash = *payment_hash,
                        .amount_sats =
                            entry.at("amount_sats").get<amount_sats_t>(),
                        .payee = *payee,
                        .memo = entry.value("memo", std::string{}),
                        .expires_at = entry.at("expires_at")
                                          .get<timestamp_seconds_t>()},
          .preimage = *preimage};
      if (entry.contains("paid_at")) {
        record.paid_at = entry.at("paid_at").get<timestamp_seconds_t>();
        settled[*payment_hash] =
            settled_payment_t{.payment_hash = *payment_hash,
                              .amount_sats = record.invoice.amount_sats,
                              .payee = record.invoice.payee,
                              .settled_at = *record.paid_at};
      }
      invoices[*payment_hash] = std::move(record);
    } catch (const json::exception& ex) {
      spdlog::warn("payment ledger '{}' line {}: {}", path, line_number,
                   ex.what());
      return false;
    }
  }

  auto lock = std::scoped_lock{mutex_};
  for (auto& [payment_hash, record] : invoices) {
    invoices_[payment_hash] = std::move(record);
  }
  for (const auto& [payment_hash, payment] : settled) {
    settled_[payment_hash] = payment;
  }
  for (const auto& [account, amount] : balances) {
    balances_[account] = amount;
  }
  paid_.notify_all();
  return true;
}

}  // namespace domp::payment
