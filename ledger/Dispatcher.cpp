#include "Dispatcher.h"
#include "../lib/Utilities.h"

namespace icpt {

namespace {

struct TypeEntry {
  uint16_t type;
  const char *name;
};

const TypeEntry TYPE_NAMES[] = {
    {Dispatcher::Request::T_CREATE_WALLET, "create_wallet"},
    {Dispatcher::Request::T_MINT, "mint"},
    {Dispatcher::Request::T_TRANSFER, "transfer"},
    {Dispatcher::Request::T_BURN, "burn"},
    {Dispatcher::Request::T_CHANGE_OWNER, "change_owner"},
    {Dispatcher::Request::T_GET_BALANCE, "get_balance"},
    {Dispatcher::Request::T_GET_TOKEN_INFO, "get_token_info"},
    {Dispatcher::Request::T_GET_TRANSFER_HISTORY, "get_transfer_history"},
};

Dispatcher::Roe<Identity> readIdentity(const nlohmann::json &j,
                                       const std::string &field) {
  if (!j.contains(field)) {
    return Dispatcher::Error(Dispatcher::E_REQUEST, "missing " + field + " field");
  }
  if (!j[field].is_string()) {
    return Dispatcher::Error(Dispatcher::E_REQUEST, field + " must be a string");
  }
  auto result = Identity::fromText(j[field].get<std::string>());
  if (!result) {
    return Dispatcher::Error(Dispatcher::E_REQUEST,
                             field + ": " + result.error().message);
  }
  return *result;
}

Dispatcher::Roe<Amount> readAmount(const nlohmann::json &j) {
  if (!j.contains("amount")) {
    return Dispatcher::Error(Dispatcher::E_REQUEST, "missing amount field");
  }
  Amount amount;
  if (!Amount::fromJson(j["amount"], amount)) {
    return Dispatcher::Error(Dispatcher::E_REQUEST,
                             "amount must be an unsigned decimal integer");
  }
  return amount;
}

Dispatcher::Roe<uint64_t> readOptionalCount(const nlohmann::json &j,
                                            const std::string &field) {
  if (!j.contains(field)) {
    return uint64_t(0);
  }
  if (!j[field].is_number_unsigned()) {
    return Dispatcher::Error(Dispatcher::E_REQUEST,
                             field + " must be an unsigned integer");
  }
  return j[field].get<uint64_t>();
}

nlohmann::json errorJson(int32_t code, const std::string &message) {
  nlohmann::json resp;
  resp["error"] = message;
  resp["code"] = code;
  return resp;
}

} // namespace

std::string Dispatcher::Request::typeName(uint16_t type) {
  for (const auto &entry : TYPE_NAMES) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

bool Dispatcher::Request::typeFromName(const std::string &name,
                                       uint16_t &type) {
  for (const auto &entry : TYPE_NAMES) {
    if (name == entry.name) {
      type = entry.type;
      return true;
    }
  }
  return false;
}

Dispatcher::Roe<Dispatcher::Request>
Dispatcher::Request::fromJson(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
    return Error(E_REQUEST, "missing type field");
  }

  Request request;
  std::string name = j["type"].get<std::string>();
  if (!typeFromName(name, request.type)) {
    return Error(E_REQUEST, "unknown request type: " + name);
  }

  // Fields each request type needs
  bool needsCaller = false;
  const char *targetField = nullptr;
  bool needsAmount = false;
  switch (request.type) {
  case T_CREATE_WALLET:
    needsCaller = true;
    break;
  case T_MINT:
  case T_TRANSFER:
    needsCaller = true;
    targetField = "to";
    needsAmount = true;
    break;
  case T_BURN:
    needsCaller = true;
    needsAmount = true;
    break;
  case T_CHANGE_OWNER:
    needsCaller = true;
    targetField = "newOwner";
    break;
  case T_GET_BALANCE:
    targetField = "identity";
    break;
  default:
    break;
  }

  if (needsCaller) {
    auto caller = readIdentity(j, "caller");
    if (!caller) {
      return caller.error();
    }
    request.caller = *caller;
  }
  if (targetField) {
    auto target = readIdentity(j, targetField);
    if (!target) {
      return target.error();
    }
    request.target = *target;
  }
  if (needsAmount) {
    auto amount = readAmount(j);
    if (!amount) {
      return amount.error();
    }
    request.amount = *amount;
  }
  if (request.type == T_GET_TRANSFER_HISTORY) {
    auto fromSequence = readOptionalCount(j, "fromSequence");
    if (!fromSequence) {
      return fromSequence.error();
    }
    request.fromSequence = *fromSequence;
    auto maxCount = readOptionalCount(j, "maxCount");
    if (!maxCount) {
      return maxCount.error();
    }
    request.maxCount = *maxCount;
  }
  return request;
}

nlohmann::json Dispatcher::Request::toJson() const {
  nlohmann::json j;
  j["type"] = typeName(type);
  switch (type) {
  case T_CREATE_WALLET:
    j["caller"] = caller.toText();
    break;
  case T_MINT:
  case T_TRANSFER:
    j["caller"] = caller.toText();
    j["to"] = target.toText();
    j["amount"] = amount;
    break;
  case T_BURN:
    j["caller"] = caller.toText();
    j["amount"] = amount;
    break;
  case T_CHANGE_OWNER:
    j["caller"] = caller.toText();
    j["newOwner"] = target.toText();
    break;
  case T_GET_BALANCE:
    j["identity"] = target.toText();
    break;
  case T_GET_TRANSFER_HISTORY:
    j["fromSequence"] = fromSequence;
    j["maxCount"] = maxCount;
    break;
  default:
    break;
  }
  return j;
}

Dispatcher::Dispatcher(Ledger &ledger)
    : Module("icpt.dispatcher"), ledger_(ledger) {}

Dispatcher::Roe<nlohmann::json>
Dispatcher::okResponse(const Ledger::Roe<void> &result) const {
  if (!result) {
    return Error(result.error().code, result.error().message);
  }
  nlohmann::json resp;
  resp["status"] = "ok";
  return resp;
}

Dispatcher::Roe<nlohmann::json> Dispatcher::handle(const Request &request) {
  log().debug << "Handling " << Request::typeName(request.type);

  switch (request.type) {
  case Request::T_CREATE_WALLET:
    return okResponse(ledger_.createWallet(request.caller));
  case Request::T_MINT:
    return okResponse(
        ledger_.mint(request.caller, request.target, request.amount));
  case Request::T_TRANSFER:
    return okResponse(
        ledger_.transfer(request.caller, request.target, request.amount));
  case Request::T_BURN:
    return okResponse(ledger_.burn(request.caller, request.amount));
  case Request::T_CHANGE_OWNER:
    return okResponse(ledger_.changeOwner(request.caller, request.target));
  case Request::T_GET_BALANCE: {
    nlohmann::json resp;
    resp["status"] = "ok";
    resp["identity"] = request.target.toText();
    resp["balance"] = ledger_.getBalance(request.target);
    return resp;
  }
  case Request::T_GET_TOKEN_INFO: {
    nlohmann::json resp;
    resp["status"] = "ok";
    resp["token"] = ledger_.getTokenInfo().toJson();
    resp["owner"] = ledger_.getOwner().toText();
    return resp;
  }
  case Request::T_GET_TRANSFER_HISTORY: {
    auto records = ledger_.getTransferHistory(
        request.fromSequence, static_cast<size_t>(request.maxCount));
    nlohmann::json transfers = nlohmann::json::array();
    for (const auto &record : records) {
      transfers.push_back(record.toJson());
    }
    nlohmann::json resp;
    resp["status"] = "ok";
    resp["transfers"] = transfers;
    resp["nextSequence"] = ledger_.getNextSequence();
    return resp;
  }
  default:
    return Error(E_REQUEST,
                 "unknown request type: " + std::to_string(request.type));
  }
}

std::string Dispatcher::handleRequest(const std::string &request) {
  log().debug << "Received request (" << request.size() << " bytes)";

  auto jsonResult = utl::parseJsonRequest(request);
  if (jsonResult.isError()) {
    return errorJson(E_REQUEST, jsonResult.error().message).dump();
  }

  auto reqResult = Request::fromJson(jsonResult.value());
  if (!reqResult) {
    log().warning << "Bad request: " << reqResult.error().message;
    return errorJson(reqResult.error().code, reqResult.error().message).dump();
  }

  auto result = handle(*reqResult);
  if (!result) {
    return errorJson(result.error().code, result.error().message).dump();
  }
  return result->dump();
}

} // namespace icpt
