#include "StateStore.h"
#include "../lib/Utilities.h"

#include <filesystem>

namespace icpt {

StateStore::StateStore() : Module("icpt.store") {}

StateStore::Roe<void> StateStore::init(const std::string &workDir) {
  if (workDir.empty()) {
    return Error(E_IO, "Work directory must not be empty");
  }

  std::error_code ec;
  if (!std::filesystem::exists(workDir, ec)) {
    if (!std::filesystem::create_directories(workDir, ec)) {
      return Error(E_IO, "Failed to create work directory: " + workDir);
    }
  }

  workDir_ = workDir;
  statePath_ = (std::filesystem::path(workDir) / STATE_FILE).string();
  log().debug << "State file: " << statePath_;
  return {};
}

bool StateStore::exists() const {
  std::error_code ec;
  return !statePath_.empty() && std::filesystem::exists(statePath_, ec);
}

StateStore::Roe<Ledger::State> StateStore::load() const {
  if (!exists()) {
    return Error(E_IO, "No ledger state found at " + statePath_);
  }

  auto docResult = utl::loadJsonFile(statePath_);
  if (!docResult) {
    return Error(E_FORMAT, docResult.error().message);
  }
  const auto &doc = docResult.value();

  if (!doc.is_object() || !doc.contains("magic") || !doc.contains("version") ||
      !doc.contains("checksum") || !doc.contains("state")) {
    return Error(E_FORMAT, "Incomplete state file: " + statePath_);
  }
  if (doc["magic"] != MAGIC) {
    return Error(E_FORMAT, "Not a ledger state file: " + statePath_);
  }
  if (!doc["version"].is_number_unsigned() ||
      doc["version"].get<uint64_t>() != CURRENT_VERSION) {
    return Error(E_FORMAT, "Unsupported state file version: " +
                               doc["version"].dump());
  }

  std::string checksum = utl::sha256(doc["state"].dump());
  if (!doc["checksum"].is_string() ||
      doc["checksum"].get<std::string>() != checksum) {
    log().error << "Checksum mismatch in " << statePath_;
    return Error(E_CHECKSUM, "State file checksum mismatch: " + statePath_);
  }

  auto stateResult = Ledger::State::fromJson(doc["state"]);
  if (!stateResult) {
    return Error(E_FORMAT, stateResult.error().message);
  }

  log().debug << "Loaded state with " << stateResult->transfers.size()
              << " transfers";
  return *stateResult;
}

StateStore::Roe<void> StateStore::save(const Ledger::State &state) {
  if (statePath_.empty()) {
    return Error(E_IO, "State store is not initialized");
  }

  nlohmann::json stateJson = state.toJson();
  nlohmann::json doc;
  doc["magic"] = MAGIC;
  doc["version"] = CURRENT_VERSION;
  doc["checksum"] = utl::sha256(stateJson.dump());
  doc["state"] = stateJson;

  auto result = utl::writeFileAtomic(statePath_, doc.dump(2));
  if (!result) {
    log().error << "Failed to save state: " << result.error().message;
    return Error(E_IO, result.error().message);
  }

  log().debug << "Saved state (" << state.transfers.size() << " transfers)";
  return {};
}

} // namespace icpt
