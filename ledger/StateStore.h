#ifndef ICPT_LEDGER_STATE_STORE_H
#define ICPT_LEDGER_STATE_STORE_H

#include "Ledger.h"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <string>

namespace icpt {

/**
 * StateStore - keeps the ledger state in a work directory.
 *
 * The state is stored as a single JSON document:
 *   {"magic": "ICPT", "version": 1, "checksum": "<sha256>", "state": {...}}
 * The checksum covers the serialized "state" member. Saves replace the file
 * atomically, so a crash leaves either the old or the new state.
 */
class StateStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_IO = 1;
  constexpr static int32_t E_FORMAT = 2;
  constexpr static int32_t E_CHECKSUM = 3;

  constexpr static const char *MAGIC = "ICPT";
  constexpr static uint32_t CURRENT_VERSION = 1;
  constexpr static const char *STATE_FILE = "ledger_state.json";

  StateStore();
  ~StateStore() override = default;

  /**
   * Point the store at a work directory (created if missing).
   */
  Roe<void> init(const std::string &workDir);

  const std::string &getStatePath() const { return statePath_; }
  bool exists() const;

  Roe<Ledger::State> load() const;
  Roe<void> save(const Ledger::State &state);

private:
  std::string workDir_;
  std::string statePath_;
};

} // namespace icpt

#endif // ICPT_LEDGER_STATE_STORE_H
