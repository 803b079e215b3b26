#include "Ledger.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace icpt {

// ========== JSON forms ==========

nlohmann::json Ledger::TokenInfo::toJson() const {
  nlohmann::json j;
  j["name"] = name;
  j["symbol"] = symbol;
  j["decimals"] = decimals;
  j["totalSupply"] = totalSupply;
  return j;
}

nlohmann::json Ledger::TransferRecord::toJson() const {
  nlohmann::json j;
  j["sequence"] = sequence;
  j["from"] = from ? nlohmann::json(from->toText()) : nlohmann::json(nullptr);
  j["to"] = to ? nlohmann::json(to->toText()) : nlohmann::json(nullptr);
  j["amount"] = amount;
  j["timestamp"] = timestamp;
  return j;
}

nlohmann::json Ledger::State::toJson() const {
  nlohmann::json j;
  j["token"] = token.toJson();
  j["owner"] = owner.toText();

  nlohmann::json accounts = nlohmann::json::array();
  for (const auto &[identity, balance] : mBalances) {
    accounts.push_back({{"identity", identity.toText()}, {"balance", balance}});
  }
  j["accounts"] = accounts;

  nlohmann::json records = nlohmann::json::array();
  for (const auto &record : transfers) {
    records.push_back(record.toJson());
  }
  j["transfers"] = records;
  return j;
}

namespace {

Ledger::Roe<Identity> identityFromJson(const nlohmann::json &j,
                                       const std::string &field) {
  if (!j.is_string()) {
    return Ledger::Error(Ledger::E_STATE, field + " must be a string");
  }
  auto result = Identity::fromText(j.get<std::string>());
  if (!result) {
    return Ledger::Error(Ledger::E_STATE,
                         field + ": " + result.error().message);
  }
  return *result;
}

Ledger::Roe<Amount> amountFromJson(const nlohmann::json &j,
                                   const std::string &field) {
  Amount amount;
  if (!Amount::fromJson(j, amount)) {
    return Ledger::Error(Ledger::E_STATE, field + " is not a valid amount");
  }
  return amount;
}

Ledger::Roe<uint64_t> unsignedFromJson(const nlohmann::json &j,
                                        const std::string &field,
                                        uint64_t max = UINT64_MAX) {
  if (!j.is_number_unsigned()) {
    return Ledger::Error(Ledger::E_STATE,
                         field + " must be an unsigned integer");
  }
  uint64_t value = j.get<uint64_t>();
  if (value > max) {
    return Ledger::Error(Ledger::E_STATE, field + " out of range: " +
                                              std::to_string(value));
  }
  return value;
}

} // namespace

Ledger::Roe<Ledger::State> Ledger::State::fromJson(const nlohmann::json &j) {
  State state;
  try {
    const auto &token = j.at("token");
    state.token.name = token.at("name").get<std::string>();
    state.token.symbol = token.at("symbol").get<std::string>();
    auto decimals =
        unsignedFromJson(token.at("decimals"), "token.decimals", UINT8_MAX);
    if (!decimals) {
      return decimals.error();
    }
    state.token.decimals = static_cast<uint8_t>(*decimals);
    auto supply = amountFromJson(token.at("totalSupply"), "token.totalSupply");
    if (!supply) {
      return supply.error();
    }
    state.token.totalSupply = *supply;

    auto owner = identityFromJson(j.at("owner"), "owner");
    if (!owner) {
      return owner.error();
    }
    state.owner = *owner;

    for (const auto &account : j.at("accounts")) {
      auto identity = identityFromJson(account.at("identity"), "account identity");
      if (!identity) {
        return identity.error();
      }
      auto balance = amountFromJson(account.at("balance"), "account balance");
      if (!balance) {
        return balance.error();
      }
      if (!state.mBalances.emplace(*identity, *balance).second) {
        return Error(E_STATE, "Duplicate account: " + identity->toText());
      }
    }

    for (const auto &item : j.at("transfers")) {
      TransferRecord record;
      auto sequence = unsignedFromJson(item.at("sequence"), "transfer sequence");
      if (!sequence) {
        return sequence.error();
      }
      record.sequence = *sequence;
      if (!item.at("from").is_null()) {
        auto from = identityFromJson(item.at("from"), "transfer from");
        if (!from) {
          return from.error();
        }
        record.from = *from;
      }
      if (!item.at("to").is_null()) {
        auto to = identityFromJson(item.at("to"), "transfer to");
        if (!to) {
          return to.error();
        }
        record.to = *to;
      }
      auto amount = amountFromJson(item.at("amount"), "transfer amount");
      if (!amount) {
        return amount.error();
      }
      record.amount = *amount;
      auto timestamp =
          unsignedFromJson(item.at("timestamp"), "transfer timestamp");
      if (!timestamp) {
        return timestamp.error();
      }
      record.timestamp = *timestamp;
      state.transfers.push_back(record);
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_STATE, "Malformed ledger state: " + std::string(e.what()));
  }
  return state;
}

Ledger::Roe<Ledger::InitConfig>
Ledger::InitConfig::fromJson(const nlohmann::json &j) {
  InitConfig config;
  if (!j.is_object()) {
    return Error(E_STATE, "Config must be a JSON object");
  }

  try {
    if (j.contains("token")) {
      const auto &token = j.at("token");
      if (token.contains("name")) {
        config.name = token.at("name").get<std::string>();
      }
      if (token.contains("symbol")) {
        config.symbol = token.at("symbol").get<std::string>();
      }
      if (token.contains("decimals")) {
        auto decimals = unsignedFromJson(token.at("decimals"),
                                         "token.decimals", UINT8_MAX);
        if (!decimals) {
          return decimals.error();
        }
        config.decimals = static_cast<uint8_t>(*decimals);
      }
      if (token.contains("initialSupply")) {
        auto supply = amountFromJson(token.at("initialSupply"),
                                     "token.initialSupply");
        if (!supply) {
          return supply.error();
        }
        config.initialSupply = *supply;
      }
    }
    if (j.contains("owner")) {
      auto owner = identityFromJson(j.at("owner"), "owner");
      if (!owner) {
        return owner.error();
      }
      config.owner = *owner;
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_STATE, "Malformed config: " + std::string(e.what()));
  }
  return config;
}

// ========== Lifecycle ==========

Ledger::Ledger() : Module("icpt.ledger"), clock_(utl::getCurrentTimeNanos) {}

Ledger::Roe<void> Ledger::init(const InitConfig &config) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);

  if (initialized_) {
    return Error(E_STATE, "Ledger is already initialized");
  }
  if (config.owner.isEmpty()) {
    return Error(E_IDENTITY, "Owner identity must not be empty");
  }

  State state;
  state.token.name = config.name;
  state.token.symbol = config.symbol;
  state.token.decimals = config.decimals;
  state.token.totalSupply = config.initialSupply;
  state.owner = config.owner;
  state.mBalances[config.owner] = config.initialSupply;

  if (!config.initialSupply.isZero()) {
    TransferRecord record;
    record.sequence = 0;
    record.to = config.owner;
    record.amount = config.initialSupply;
    record.timestamp = clock_();
    state.transfers.push_back(record);
  }

  if (commitHook_) {
    auto result = commitHook_(state);
    if (!result) {
      return Error(E_STORAGE,
                   "Failed to commit initial state: " + result.error().message);
    }
  }

  {
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    state_ = std::move(state);
    initialized_ = true;
  }

  log().info << "Ledger initialized with owner: " << config.owner;
  log().info << "Token " << config.symbol << " (" << config.name << ", "
             << static_cast<int>(config.decimals)
             << " decimals), initial supply " << config.initialSupply;
  return {};
}

Ledger::Roe<void> Ledger::restore(const State &state) {
  auto verifyResult = verifyInvariants(state);
  if (!verifyResult) {
    return Error(E_STATE,
                 "Refusing to restore state: " + verifyResult.error().message);
  }

  std::lock_guard<std::mutex> writeLock(writeMutex_);
  {
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    state_ = state;
    initialized_ = true;
  }

  log().debug << "Restored ledger: " << state.mBalances.size()
              << " accounts, " << state.transfers.size()
              << " transfers, owner " << state.owner;
  return {};
}

bool Ledger::isInitialized() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return initialized_;
}

Ledger::State Ledger::snapshot() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_;
}

void Ledger::setCommitHook(CommitHook hook) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  commitHook_ = std::move(hook);
}

void Ledger::setClock(Clock clock) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  clock_ = std::move(clock);
}

// ========== Internal helpers ==========
// All of these run with writeMutex_ held. state_ only changes under that
// mutex, so reading it here needs no reader lock.

Ledger::Roe<void> Ledger::checkReady(const std::string &operation) const {
  if (!initialized_) {
    return reject(E_STATE, operation + ": ledger is not initialized");
  }
  return {};
}

Ledger::Error Ledger::reject(int32_t code, const std::string &message) const {
  log().warning << "Rejected: " << message;
  return Error(code, message);
}

Amount Ledger::balanceOf(const Identity &identity) const {
  auto it = state_.mBalances.find(identity);
  if (it == state_.mBalances.end()) {
    return Amount();
  }
  return it->second;
}

Ledger::TransferRecord
Ledger::makeRecord(const std::optional<Identity> &from,
                   const std::optional<Identity> &to,
                   const Amount &amount) const {
  TransferRecord record;
  record.sequence = state_.transfers.size();
  record.from = from;
  record.to = to;
  record.amount = amount;
  // Timestamps never go backwards in the log, even if the clock does
  record.timestamp = clock_();
  if (!state_.transfers.empty()) {
    record.timestamp =
        std::max(record.timestamp, state_.transfers.back().timestamp);
  }
  return record;
}

void Ledger::apply(State &state, Change &change) {
  for (auto &[identity, balance] : change.balances) {
    state.mBalances[identity] = balance;
  }
  if (change.totalSupply) {
    state.token.totalSupply = *change.totalSupply;
  }
  if (change.record) {
    state.transfers.push_back(std::move(*change.record));
  }
  if (change.owner) {
    state.owner = *change.owner;
  }
}

Ledger::Roe<void> Ledger::commit(Change change) {
  if (commitHook_) {
    State candidate = state_;
    apply(candidate, change);
    auto result = commitHook_(candidate);
    if (!result) {
      log().error << "Commit failed: " << result.error().message;
      return Error(E_STORAGE, "Failed to commit: " + result.error().message);
    }
    std::unique_lock<std::shared_mutex> lock(stateMutex_);
    state_ = std::move(candidate);
    return {};
  }

  std::unique_lock<std::shared_mutex> lock(stateMutex_);
  apply(state_, change);
  return {};
}

// ========== Mutations ==========

Ledger::Roe<void> Ledger::createWallet(const Identity &caller) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  auto ready = checkReady("create_wallet");
  if (!ready) {
    return ready;
  }
  if (caller.isEmpty()) {
    return reject(E_IDENTITY, "create_wallet: caller identity is empty");
  }

  if (state_.mBalances.count(caller) > 0) {
    log().debug << "Wallet already exists: " << caller;
    return {};
  }

  Change change;
  change.balances.emplace_back(caller, Amount());
  auto result = commit(std::move(change));
  if (!result) {
    return result;
  }
  log().info << "Created wallet: " << caller;
  return {};
}

Ledger::Roe<void> Ledger::mint(const Identity &caller,
                               const Identity &recipient,
                               const Amount &amount) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  auto ready = checkReady("mint");
  if (!ready) {
    return ready;
  }
  if (caller != state_.owner) {
    return reject(E_UNAUTHORIZED, "mint: caller " + caller.toText() +
                                      " is not the owner");
  }
  if (amount.isZero()) {
    return reject(E_INVALID_AMOUNT, "mint: amount must be positive");
  }
  if (recipient.isEmpty()) {
    return reject(E_IDENTITY, "mint: recipient identity is empty");
  }

  Amount newSupply;
  if (!state_.token.totalSupply.checkedAdd(amount, newSupply)) {
    return reject(E_OVERFLOW, "mint: total supply would overflow");
  }
  Amount newBalance;
  if (!balanceOf(recipient).checkedAdd(amount, newBalance)) {
    return reject(E_OVERFLOW, "mint: recipient balance would overflow");
  }

  Change change;
  change.balances.emplace_back(recipient, newBalance);
  change.totalSupply = newSupply;
  change.record = makeRecord(std::nullopt, recipient, amount);
  uint64_t sequence = change.record->sequence;

  auto result = commit(std::move(change));
  if (!result) {
    return result;
  }
  log().info << "Minted " << amount << " to " << recipient << " (seq "
             << sequence << ")";
  return {};
}

Ledger::Roe<void> Ledger::transfer(const Identity &caller,
                                   const Identity &recipient,
                                   const Amount &amount) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  auto ready = checkReady("transfer");
  if (!ready) {
    return ready;
  }
  if (amount.isZero()) {
    return reject(E_INVALID_AMOUNT, "transfer: amount must be positive");
  }
  if (caller.isEmpty() || recipient.isEmpty()) {
    return reject(E_IDENTITY, "transfer: identity is empty");
  }
  if (caller == recipient) {
    return reject(E_SAME_ACCOUNT,
                  "transfer: cannot transfer to self (" + caller.toText() + ")");
  }

  Amount newFromBalance;
  if (!balanceOf(caller).checkedSub(amount, newFromBalance)) {
    return reject(E_INSUFFICIENT_BALANCE,
                  "transfer: insufficient balance for " + caller.toText());
  }
  Amount newToBalance;
  if (!balanceOf(recipient).checkedAdd(amount, newToBalance)) {
    return reject(E_OVERFLOW, "transfer: recipient balance would overflow");
  }

  // Debit and credit go out in the same change set
  Change change;
  change.balances.emplace_back(caller, newFromBalance);
  change.balances.emplace_back(recipient, newToBalance);
  change.record = makeRecord(caller, recipient, amount);
  uint64_t sequence = change.record->sequence;

  auto result = commit(std::move(change));
  if (!result) {
    return result;
  }
  log().info << "Transferred " << amount << " from " << caller << " to "
             << recipient << " (seq " << sequence << ")";
  return {};
}

Ledger::Roe<void> Ledger::burn(const Identity &caller, const Amount &amount) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  auto ready = checkReady("burn");
  if (!ready) {
    return ready;
  }
  if (amount.isZero()) {
    return reject(E_INVALID_AMOUNT, "burn: amount must be positive");
  }
  if (caller.isEmpty()) {
    return reject(E_IDENTITY, "burn: caller identity is empty");
  }

  Amount newBalance;
  if (!balanceOf(caller).checkedSub(amount, newBalance)) {
    return reject(E_INSUFFICIENT_BALANCE,
                  "burn: insufficient balance for " + caller.toText());
  }
  // Cannot fail while supply equals the sum of balances
  Amount newSupply;
  if (!state_.token.totalSupply.checkedSub(amount, newSupply)) {
    log().critical << "Total supply " << state_.token.totalSupply
                   << " is below a single balance";
    return Error(E_STATE, "burn: total supply is inconsistent");
  }

  Change change;
  change.balances.emplace_back(caller, newBalance);
  change.totalSupply = newSupply;
  change.record = makeRecord(caller, std::nullopt, amount);
  uint64_t sequence = change.record->sequence;

  auto result = commit(std::move(change));
  if (!result) {
    return result;
  }
  log().info << "Burned " << amount << " from " << caller << " (seq "
             << sequence << ")";
  return {};
}

Ledger::Roe<void> Ledger::changeOwner(const Identity &caller,
                                      const Identity &newOwner) {
  std::lock_guard<std::mutex> writeLock(writeMutex_);
  auto ready = checkReady("change_owner");
  if (!ready) {
    return ready;
  }
  if (caller != state_.owner) {
    return reject(E_UNAUTHORIZED, "change_owner: caller " + caller.toText() +
                                      " is not the owner");
  }
  if (newOwner.isEmpty()) {
    return reject(E_IDENTITY, "change_owner: new owner identity is empty");
  }
  if (newOwner == state_.owner) {
    log().debug << "Owner unchanged: " << newOwner;
    return {};
  }

  Change change;
  change.owner = newOwner;
  auto result = commit(std::move(change));
  if (!result) {
    return result;
  }
  log().info << "Owner changed to: " << newOwner;
  return {};
}

// ========== Queries ==========

Amount Ledger::getBalance(const Identity &identity) const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return balanceOf(identity);
}

bool Ledger::hasAccount(const Identity &identity) const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.mBalances.count(identity) > 0;
}

size_t Ledger::getAccountCount() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.mBalances.size();
}

Ledger::TokenInfo Ledger::getTokenInfo() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.token;
}

Identity Ledger::getOwner() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.owner;
}

uint64_t Ledger::getNextSequence() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.transfers.size();
}

std::vector<Ledger::TransferRecord> Ledger::getTransferHistory() const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  return state_.transfers;
}

std::vector<Ledger::TransferRecord>
Ledger::getTransferHistory(uint64_t fromSequence, size_t maxCount) const {
  std::shared_lock<std::shared_mutex> lock(stateMutex_);
  const auto &transfers = state_.transfers;
  if (fromSequence >= transfers.size()) {
    return {};
  }
  auto begin = transfers.begin() + static_cast<std::ptrdiff_t>(fromSequence);
  size_t available = transfers.size() - static_cast<size_t>(fromSequence);
  size_t count = maxCount == 0 ? available : std::min(maxCount, available);
  return std::vector<TransferRecord>(
      begin, begin + static_cast<std::ptrdiff_t>(count));
}

Ledger::Roe<void> Ledger::verifyInvariants() const {
  return verifyInvariants(snapshot());
}

Ledger::Roe<void> Ledger::verifyInvariants(const State &state) {
  if (state.owner.isEmpty()) {
    return Error(E_STATE, "Owner is not set");
  }

  Amount sum;
  for (const auto &[identity, balance] : state.mBalances) {
    if (identity.isEmpty()) {
      return Error(E_STATE, "Account with empty identity");
    }
    if (!sum.checkedAdd(balance, sum)) {
      return Error(E_STATE, "Sum of balances overflows");
    }
  }
  if (sum != state.token.totalSupply) {
    return Error(E_STATE, "Total supply " + state.token.totalSupply.toString() +
                              " does not match sum of balances " +
                              sum.toString());
  }

  uint64_t lastTimestamp = 0;
  for (size_t i = 0; i < state.transfers.size(); ++i) {
    const auto &record = state.transfers[i];
    if (record.sequence != i) {
      return Error(E_STATE, "Transfer log gap at position " +
                                std::to_string(i) + ": found sequence " +
                                std::to_string(record.sequence));
    }
    if (!record.from && !record.to) {
      return Error(E_STATE, "Transfer " + std::to_string(i) +
                                " has neither source nor destination");
    }
    if (record.amount.isZero()) {
      return Error(E_STATE, "Transfer " + std::to_string(i) + " has zero amount");
    }
    if (record.timestamp < lastTimestamp) {
      return Error(E_STATE,
                   "Transfer " + std::to_string(i) + " goes back in time");
    }
    lastTimestamp = record.timestamp;
  }
  return {};
}

} // namespace icpt
