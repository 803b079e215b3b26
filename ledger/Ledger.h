#pragma once

#include "Amount.h"
#include "Identity.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace icpt {

/**
 * Ledger - single-asset token ledger.
 *
 * Owns the account table, the token metadata, the transfer log and the
 * owner. Mutations are serialized and become visible in one step; queries
 * always see a fully committed state.
 */
class Ledger : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_UNAUTHORIZED = 1;
  constexpr static int32_t E_INVALID_AMOUNT = 2;
  constexpr static int32_t E_INSUFFICIENT_BALANCE = 3;
  constexpr static int32_t E_OVERFLOW = 4;
  constexpr static int32_t E_SAME_ACCOUNT = 5;
  constexpr static int32_t E_STATE = 6;
  constexpr static int32_t E_STORAGE = 7;
  constexpr static int32_t E_IDENTITY = 8;

  constexpr static const char *DEFAULT_NAME = "ICP Token";
  constexpr static const char *DEFAULT_SYMBOL = "ICPT";
  constexpr static uint8_t DEFAULT_DECIMALS = 8;
  constexpr static uint64_t DEFAULT_INITIAL_SUPPLY =
      1'000'000'000'000'000'000ULL; // 10^18 base units

  struct TokenInfo {
    std::string name;
    std::string symbol;
    uint8_t decimals{ DEFAULT_DECIMALS };
    Amount totalSupply;

    bool operator==(const TokenInfo &other) const {
      return name == other.name && symbol == other.symbol &&
             decimals == other.decimals && totalSupply == other.totalSupply;
    }

    nlohmann::json toJson() const;
  };

  /**
   * One completed mint, transfer or burn.
   * A mint has no source, a burn has no destination.
   */
  struct TransferRecord {
    uint64_t sequence{ 0 };
    std::optional<Identity> from;
    std::optional<Identity> to;
    Amount amount;
    uint64_t timestamp{ 0 }; // nanoseconds since epoch

    bool isMint() const { return !from.has_value(); }
    bool isBurn() const { return !to.has_value(); }

    bool operator==(const TransferRecord &other) const {
      return sequence == other.sequence && from == other.from &&
             to == other.to && amount == other.amount &&
             timestamp == other.timestamp;
    }

    nlohmann::json toJson() const;
  };

  // Everything the ledger owns, as one value
  struct State {
    TokenInfo token;
    Identity owner;
    std::map<Identity, Amount> mBalances;
    std::vector<TransferRecord> transfers;

    nlohmann::json toJson() const;
    static Roe<State> fromJson(const nlohmann::json &j);
  };

  struct InitConfig {
    std::string name{ DEFAULT_NAME };
    std::string symbol{ DEFAULT_SYMBOL };
    uint8_t decimals{ DEFAULT_DECIMALS };
    Amount initialSupply{ DEFAULT_INITIAL_SUPPLY };
    Identity owner;

    /**
     * Read the "token" section and "owner" of a config document.
     * Missing keys keep their defaults.
     */
    static Roe<InitConfig> fromJson(const nlohmann::json &j);
  };

  /**
   * Called with the post-state of every mutation before it becomes visible.
   * Returning an error aborts the mutation.
   */
  using CommitHook = std::function<Roe<void>(const State &)>;
  using Clock = std::function<uint64_t()>;

  Ledger();
  ~Ledger() override = default;

  /**
   * Deploy the ledger: set token metadata and owner, and credit the initial
   * supply to the owner (logged as a mint with sequence 0).
   */
  Roe<void> init(const InitConfig &config);

  /**
   * Adopt a previously persisted state after checking its invariants.
   */
  Roe<void> restore(const State &state);

  bool isInitialized() const;
  State snapshot() const;

  void setCommitHook(CommitHook hook);
  void setClock(Clock clock);

  // Mutations
  Roe<void> createWallet(const Identity &caller);
  Roe<void> mint(const Identity &caller, const Identity &recipient,
                 const Amount &amount);
  Roe<void> transfer(const Identity &caller, const Identity &recipient,
                     const Amount &amount);
  Roe<void> burn(const Identity &caller, const Amount &amount);
  Roe<void> changeOwner(const Identity &caller, const Identity &newOwner);

  // Queries
  Amount getBalance(const Identity &identity) const;
  bool hasAccount(const Identity &identity) const;
  size_t getAccountCount() const;
  TokenInfo getTokenInfo() const;
  Identity getOwner() const;
  uint64_t getNextSequence() const;
  std::vector<TransferRecord> getTransferHistory() const;

  /**
   * Page through the transfer log.
   * @param fromSequence First sequence number to return
   * @param maxCount Maximum number of records, 0 for no limit
   */
  std::vector<TransferRecord> getTransferHistory(uint64_t fromSequence,
                                                 size_t maxCount) const;

  /** Check all ledger invariants on the current state. */
  Roe<void> verifyInvariants() const;
  static Roe<void> verifyInvariants(const State &state);

private:
  // A validated mutation, applied in one step
  struct Change {
    std::vector<std::pair<Identity, Amount>> balances; // new absolute values
    std::optional<Amount> totalSupply;
    std::optional<TransferRecord> record;
    std::optional<Identity> owner;
  };

  Roe<void> commit(Change change);
  static void apply(State &state, Change &change);

  Roe<void> checkReady(const std::string &operation) const;
  Error reject(int32_t code, const std::string &message) const;
  Amount balanceOf(const Identity &identity) const;
  TransferRecord makeRecord(const std::optional<Identity> &from,
                            const std::optional<Identity> &to,
                            const Amount &amount) const;

  State state_;
  bool initialized_{ false };
  Clock clock_;
  CommitHook commitHook_;

  // Serializes mutations; held for validation and commit
  mutable std::mutex writeMutex_;
  // Guards state_ against readers; taken exclusively only to publish
  mutable std::shared_mutex stateMutex_;
};

} // namespace icpt
