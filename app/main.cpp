#include "../ledger/Dispatcher.h"
#include "../ledger/Ledger.h"
#include "../ledger/StateStore.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <iostream>
#include <string>

namespace {

constexpr const char *CONFIG_FILE = "config.json";

icpt::Roe<nlohmann::json> loadConfig(const std::string &workDir) {
  std::string path = (std::filesystem::path(workDir) / CONFIG_FILE).string();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return nlohmann::json::object();
  }
  return icpt::utl::loadJsonFile(path);
}

bool setupLogging(const nlohmann::json &config, bool debug) {
  auto rootLogger = icpt::logging::getRootLogger();
  icpt::logging::Level level = icpt::logging::Level::WARNING;
  if (config.contains("logLevel") && config["logLevel"].is_string()) {
    if (!icpt::logging::parseLevel(config["logLevel"].get<std::string>(),
                                   level)) {
      std::cerr << "Error: Unknown logLevel in config: "
                << config["logLevel"].get<std::string>() << "\n";
      return false;
    }
  }
  if (debug) {
    level = icpt::logging::Level::DEBUG;
  }
  rootLogger.setLevel(level);

  if (config.contains("logFile") && config["logFile"].is_string()) {
    try {
      rootLogger.addFileHandler(config["logFile"].get<std::string>(), level);
    } catch (const std::runtime_error &e) {
      std::cerr << "Error: " << e.what() << "\n";
      return false;
    }
  }
  return true;
}

icpt::Roe<icpt::Identity> parseIdentity(const std::string &text,
                                        const std::string &what) {
  auto result = icpt::Identity::fromText(text);
  if (!result) {
    return icpt::Error(1, what + ": " + result.error().message);
  }
  return *result;
}

icpt::Roe<icpt::Amount> parseAmount(const std::string &text) {
  icpt::Amount amount;
  if (!icpt::Amount::fromString(text, amount)) {
    return icpt::Error(1, "Invalid amount: " + text);
  }
  return amount;
}

int printResult(const icpt::Dispatcher::Roe<nlohmann::json> &result) {
  if (!result) {
    std::cerr << "Error: " << result.error().message << " (code "
              << result.error().code << ")\n";
    return 1;
  }
  std::cout << result->dump(2) << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"icpt-ledger - single-asset token ledger"};
  app.require_subcommand(1);
  app.footer(
      "Amounts are integers in base units. Identities are plain text or "
      "0x-prefixed hex.\n"
      "The work directory may hold a config.json with the keys token.name, "
      "token.symbol, token.decimals, token.initialSupply, owner, logLevel "
      "and logFile.");

  std::string workDir = ".";
  app.add_option("-d,--work-dir", workDir,
                 "Work directory holding config.json and the ledger state")
      ->capture_default_str();

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string caller;
  std::string target;
  std::string amountText;

  auto *init_cmd = app.add_subcommand(
      "init", "Deploy the ledger; the initial supply goes to the owner");
  std::string initOwner;
  init_cmd->add_option("--owner", initOwner,
                       "Owner identity (overrides config.json)");

  auto *create_cmd =
      app.add_subcommand("create-wallet", "Create an empty wallet (idempotent)");
  create_cmd->add_option("--caller", caller, "Caller identity")->required();

  auto *mint_cmd = app.add_subcommand("mint", "Mint new tokens (owner only)");
  mint_cmd->add_option("--caller", caller, "Caller identity")->required();
  mint_cmd->add_option("to", target, "Recipient identity")->required();
  mint_cmd->add_option("amount", amountText, "Amount to mint")->required();

  auto *transfer_cmd =
      app.add_subcommand("transfer", "Transfer tokens to another identity");
  transfer_cmd->add_option("--caller", caller, "Caller identity")->required();
  transfer_cmd->add_option("to", target, "Recipient identity")->required();
  transfer_cmd->add_option("amount", amountText, "Amount to transfer")
      ->required();

  auto *burn_cmd = app.add_subcommand("burn", "Burn tokens of the caller");
  burn_cmd->add_option("--caller", caller, "Caller identity")->required();
  burn_cmd->add_option("amount", amountText, "Amount to burn")->required();

  auto *owner_cmd =
      app.add_subcommand("change-owner", "Hand ownership to another identity");
  owner_cmd->add_option("--caller", caller, "Caller identity")->required();
  owner_cmd->add_option("new-owner", target, "New owner identity")->required();

  auto *balance_cmd = app.add_subcommand("balance", "Get the balance of an identity");
  balance_cmd->add_option("identity", target, "Identity to query")->required();

  auto *info_cmd = app.add_subcommand("info", "Get token info and owner");

  auto *history_cmd = app.add_subcommand("history", "List the transfer log");
  uint64_t fromSequence = 0;
  uint64_t maxCount = 0;
  history_cmd->add_option("--from", fromSequence, "First sequence number")
      ->default_val(0);
  history_cmd->add_option("--limit", maxCount, "Maximum records (0 = all)")
      ->default_val(0);

  auto *verify_cmd =
      app.add_subcommand("verify", "Check the ledger invariants of the stored state");

  auto *exec_cmd = app.add_subcommand("exec", "Run a JSON request");
  std::string requestText;
  exec_cmd->add_option("request", requestText,
                       "Request, e.g. {\"type\":\"get_token_info\"}")
      ->required();

  CLI11_PARSE(app, argc, argv);

  auto configResult = loadConfig(workDir);
  if (!configResult) {
    std::cerr << "Error: " << configResult.error().message << "\n";
    return 1;
  }
  const nlohmann::json &config = configResult.value();
  if (!setupLogging(config, debug)) {
    return 1;
  }
  auto logger = icpt::logging::getLogger("icpt.app");

  icpt::StateStore store;
  auto storeResult = store.init(workDir);
  if (!storeResult) {
    std::cerr << "Error: " << storeResult.error().message << "\n";
    return 1;
  }

  icpt::Ledger ledger;
  // Every mutation is written out before it becomes visible
  ledger.setCommitHook(
      [&store](const icpt::Ledger::State &state) -> icpt::Ledger::Roe<void> {
        auto result = store.save(state);
        if (!result) {
          return icpt::Ledger::Error(icpt::Ledger::E_STORAGE,
                                     result.error().message);
        }
        return {};
      });

  if (init_cmd->parsed()) {
    if (store.exists()) {
      std::cerr << "Error: Ledger already initialized at "
                << store.getStatePath() << "\n";
      return 1;
    }
    auto initConfig = icpt::Ledger::InitConfig::fromJson(config);
    if (!initConfig) {
      std::cerr << "Error: " << initConfig.error().message << "\n";
      return 1;
    }
    if (!initOwner.empty()) {
      auto owner = parseIdentity(initOwner, "owner");
      if (!owner) {
        std::cerr << "Error: " << owner.error().message << "\n";
        return 1;
      }
      initConfig->owner = *owner;
    }
    auto result = ledger.init(*initConfig);
    if (!result) {
      std::cerr << "Error: " << result.error().message << "\n";
      return 1;
    }
    nlohmann::json resp;
    resp["status"] = "ok";
    resp["token"] = ledger.getTokenInfo().toJson();
    resp["owner"] = ledger.getOwner().toText();
    resp["stateFile"] = store.getStatePath();
    std::cout << resp.dump(2) << "\n";
    return 0;
  }

  auto stateResult = store.load();
  if (!stateResult) {
    std::cerr << "Error: " << stateResult.error().message << "\n";
    std::cerr << "Run '" << argv[0] << " -d " << workDir
              << " init' to create a ledger.\n";
    return 1;
  }
  auto restoreResult = ledger.restore(*stateResult);
  if (!restoreResult) {
    std::cerr << "Error: " << restoreResult.error().message << "\n";
    return 1;
  }

  icpt::Dispatcher dispatcher(ledger);

  if (exec_cmd->parsed()) {
    std::string response = dispatcher.handleRequest(requestText);
    std::cout << response << "\n";
    auto parsed = nlohmann::json::parse(response, nullptr, false);
    return parsed.is_object() && parsed.contains("error") ? 1 : 0;
  }

  if (verify_cmd->parsed()) {
    // restore() already checked the invariants; report what was checked
    nlohmann::json resp;
    resp["status"] = "ok";
    resp["accounts"] = ledger.getAccountCount();
    resp["transfers"] = ledger.getNextSequence();
    resp["totalSupply"] = ledger.getTokenInfo().totalSupply;
    std::cout << resp.dump(2) << "\n";
    return 0;
  }

  using Request = icpt::Dispatcher::Request;
  Request request;

  auto fillCaller = [&]() -> bool {
    auto id = parseIdentity(caller, "caller");
    if (!id) {
      std::cerr << "Error: " << id.error().message << "\n";
      return false;
    }
    request.caller = *id;
    return true;
  };
  auto fillTarget = [&](const std::string &what) -> bool {
    auto id = parseIdentity(target, what);
    if (!id) {
      std::cerr << "Error: " << id.error().message << "\n";
      return false;
    }
    request.target = *id;
    return true;
  };
  auto fillAmount = [&]() -> bool {
    auto amount = parseAmount(amountText);
    if (!amount) {
      std::cerr << "Error: " << amount.error().message << "\n";
      return false;
    }
    request.amount = *amount;
    return true;
  };

  bool ok = true;
  if (create_cmd->parsed()) {
    request.type = Request::T_CREATE_WALLET;
    ok = fillCaller();
  } else if (mint_cmd->parsed()) {
    request.type = Request::T_MINT;
    ok = fillCaller() && fillTarget("recipient") && fillAmount();
  } else if (transfer_cmd->parsed()) {
    request.type = Request::T_TRANSFER;
    ok = fillCaller() && fillTarget("recipient") && fillAmount();
  } else if (burn_cmd->parsed()) {
    request.type = Request::T_BURN;
    ok = fillCaller() && fillAmount();
  } else if (owner_cmd->parsed()) {
    request.type = Request::T_CHANGE_OWNER;
    ok = fillCaller() && fillTarget("new owner");
  } else if (balance_cmd->parsed()) {
    request.type = Request::T_GET_BALANCE;
    ok = fillTarget("identity");
  } else if (info_cmd->parsed()) {
    request.type = Request::T_GET_TOKEN_INFO;
  } else if (history_cmd->parsed()) {
    request.type = Request::T_GET_TRANSFER_HISTORY;
    request.fromSequence = fromSequence;
    request.maxCount = maxCount;
  }
  if (!ok) {
    return 1;
  }

  logger.debug << "Request: " << request.toJson().dump();
  return printResult(dispatcher.handle(request));
}
