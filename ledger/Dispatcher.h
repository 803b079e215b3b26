#ifndef ICPT_LEDGER_DISPATCHER_H
#define ICPT_LEDGER_DISPATCHER_H

#include "Amount.h"
#include "Identity.h"
#include "Ledger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace icpt {

/**
 * Dispatcher - maps each ledger request type to its handler.
 *
 * The set of request types is closed; anything else is rejected with
 * E_REQUEST. Ledger failures are passed through with the ledger's code.
 */
class Dispatcher : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_REQUEST = -1;

  struct Request {
    constexpr static uint16_t T_NONE = 0;
    constexpr static uint16_t T_CREATE_WALLET = 1;
    constexpr static uint16_t T_MINT = 2;
    constexpr static uint16_t T_TRANSFER = 3;
    constexpr static uint16_t T_BURN = 4;
    constexpr static uint16_t T_CHANGE_OWNER = 5;
    constexpr static uint16_t T_GET_BALANCE = 6;
    constexpr static uint16_t T_GET_TOKEN_INFO = 7;
    constexpr static uint16_t T_GET_TRANSFER_HISTORY = 8;

    uint16_t type{ T_NONE };
    Identity caller;
    Identity target;         // recipient, new owner or queried identity
    Amount amount;
    uint64_t fromSequence{ 0 }; // history paging
    uint64_t maxCount{ 0 };     // 0 = no limit

    /**
     * Decode a request object, e.g.
     * {"type": "transfer", "caller": "alice", "to": "bob", "amount": "200"}
     */
    static Roe<Request> fromJson(const nlohmann::json &j);
    nlohmann::json toJson() const;

    static std::string typeName(uint16_t type);
    static bool typeFromName(const std::string &name, uint16_t &type);
  };

  explicit Dispatcher(Ledger &ledger);
  ~Dispatcher() override = default;

  Roe<nlohmann::json> handle(const Request &request);

  /**
   * Text entry point: parse, dispatch and always answer with a JSON document.
   * Failures look like {"error": "...", "code": n}.
   */
  std::string handleRequest(const std::string &request);

private:
  Roe<nlohmann::json> okResponse(const Ledger::Roe<void> &result) const;

  Ledger &ledger_;
};

} // namespace icpt

#endif // ICPT_LEDGER_DISPATCHER_H
