#include "StateStore.h"
#include "Utilities.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace icpt;

class StateStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "icpt-state-store-test";
    cleanupTestDir();
  }

  void TearDown() override { cleanupTestDir(); }

  void cleanupTestDir() {
    std::error_code ec;
    if (std::filesystem::exists(testDir_, ec)) {
      std::filesystem::remove_all(testDir_, ec);
    }
  }

  Ledger::State makeState() {
    Ledger ledger;
    Ledger::InitConfig config;
    config.owner = Identity("alice");
    config.initialSupply = Amount(1000);
    EXPECT_TRUE(ledger.init(config).isOk());
    EXPECT_TRUE(ledger.transfer(Identity("alice"), Identity("bob"), Amount(40))
                    .isOk());
    EXPECT_TRUE(ledger.burn(Identity("bob"), Amount(5)).isOk());
    return ledger.snapshot();
  }

  nlohmann::json readDoc(const StateStore &store) {
    auto doc = utl::loadJsonFile(store.getStatePath());
    EXPECT_TRUE(doc.isOk());
    return doc.valueOr(nlohmann::json());
  }

  void writeDoc(const StateStore &store, const nlohmann::json &doc) {
    std::ofstream out(store.getStatePath(), std::ios::trunc);
    out << doc.dump(2);
  }

  std::filesystem::path testDir_;
};

TEST_F(StateStoreTest, InitCreatesWorkDir) {
  StateStore store;
  ASSERT_TRUE(store.init((testDir_ / "nested").string()).isOk());
  EXPECT_TRUE(std::filesystem::is_directory(testDir_ / "nested"));
  EXPECT_FALSE(store.exists());
  EXPECT_EQ(std::filesystem::path(store.getStatePath()).filename().string(),
            StateStore::STATE_FILE);
}

TEST_F(StateStoreTest, InitRejectsEmptyDir) {
  StateStore store;
  auto result = store.init("");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, StateStore::E_IO);
}

TEST_F(StateStoreTest, SaveThenLoad) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  auto state = makeState();

  ASSERT_TRUE(store.save(state).isOk());
  EXPECT_TRUE(store.exists());

  auto loaded = store.load();
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;
  EXPECT_EQ(loaded->toJson(), state.toJson());
  EXPECT_EQ(loaded->transfers, state.transfers);
  EXPECT_EQ(loaded->token, state.token);
}

TEST_F(StateStoreTest, DocumentHeader) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  ASSERT_TRUE(store.save(makeState()).isOk());

  auto doc = readDoc(store);
  EXPECT_EQ(doc["magic"], StateStore::MAGIC);
  EXPECT_EQ(doc["version"], StateStore::CURRENT_VERSION);
  EXPECT_EQ(doc["checksum"], utl::sha256(doc["state"].dump()));
}

TEST_F(StateStoreTest, LoadMissingFileFails) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  auto result = store.load();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, StateStore::E_IO);
}

TEST_F(StateStoreTest, TamperedStateFailsChecksum) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  ASSERT_TRUE(store.save(makeState()).isOk());

  auto doc = readDoc(store);
  doc["state"]["accounts"][0]["balance"] = "999999";
  writeDoc(store, doc);

  auto result = store.load();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, StateStore::E_CHECKSUM);
}

TEST_F(StateStoreTest, WrongMagicOrVersionRejected) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  ASSERT_TRUE(store.save(makeState()).isOk());
  auto doc = readDoc(store);

  auto badMagic = doc;
  badMagic["magic"] = "XXXX";
  writeDoc(store, badMagic);
  auto magicResult = store.load();
  ASSERT_TRUE(magicResult.isError());
  EXPECT_EQ(magicResult.error().code, StateStore::E_FORMAT);

  auto badVersion = doc;
  badVersion["version"] = 2;
  writeDoc(store, badVersion);
  auto versionResult = store.load();
  ASSERT_TRUE(versionResult.isError());
  EXPECT_EQ(versionResult.error().code, StateStore::E_FORMAT);

  auto incomplete = doc;
  incomplete.erase("checksum");
  writeDoc(store, incomplete);
  EXPECT_EQ(store.load().error().code, StateStore::E_FORMAT);
}

TEST_F(StateStoreTest, GarbageFileRejected) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());
  {
    std::ofstream out(store.getStatePath());
    out << "not a ledger";
  }
  auto result = store.load();
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, StateStore::E_FORMAT);
}

TEST_F(StateStoreTest, LedgerSurvivesRestart) {
  StateStore store;
  ASSERT_TRUE(store.init(testDir_.string()).isOk());

  {
    Ledger ledger;
    ledger.setCommitHook([&store](const Ledger::State &state) {
      auto result = store.save(state);
      if (!result) {
        return Ledger::Roe<void>(
            Ledger::Error(Ledger::E_STORAGE, result.error().message));
      }
      return Ledger::Roe<void>();
    });
    Ledger::InitConfig config;
    config.owner = Identity("alice");
    config.initialSupply = Amount(100);
    ASSERT_TRUE(ledger.init(config).isOk());
    ASSERT_TRUE(
        ledger.mint(Identity("alice"), Identity("bob"), Amount(25)).isOk());
    ASSERT_TRUE(ledger.changeOwner(Identity("alice"), Identity("bob")).isOk());
  }

  auto loaded = store.load();
  ASSERT_TRUE(loaded.isOk()) << loaded.error().message;

  Ledger restarted;
  ASSERT_TRUE(restarted.restore(*loaded).isOk());
  EXPECT_EQ(restarted.getOwner(), Identity("bob"));
  EXPECT_EQ(restarted.getBalance(Identity("bob")), Amount(25));
  EXPECT_EQ(restarted.getTokenInfo().totalSupply, Amount(125));
  EXPECT_EQ(restarted.getNextSequence(), 2u);
}
