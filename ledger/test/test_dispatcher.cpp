#include "Dispatcher.h"
#include <gtest/gtest.h>

using namespace icpt;

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    Ledger::InitConfig config;
    config.name = "Test Token";
    config.symbol = "TST";
    config.decimals = 2;
    config.initialSupply = Amount(1000000);
    config.owner = Identity("alice");
    ASSERT_TRUE(ledger_.init(config).isOk());
  }

  nlohmann::json call(const nlohmann::json &request) {
    return nlohmann::json::parse(dispatcher_.handleRequest(request.dump()));
  }

  Ledger ledger_;
  Dispatcher dispatcher_{ ledger_ };
};

TEST_F(DispatcherTest, GetTokenInfo) {
  auto resp = call({{"type", "get_token_info"}});
  EXPECT_EQ(resp["status"], "ok");
  EXPECT_EQ(resp["token"]["name"], "Test Token");
  EXPECT_EQ(resp["token"]["symbol"], "TST");
  EXPECT_EQ(resp["token"]["decimals"], 2);
  EXPECT_EQ(resp["token"]["totalSupply"], "1000000");
  EXPECT_EQ(resp["owner"], "alice");
}

TEST_F(DispatcherTest, MintTransferBurnThroughRequests) {
  EXPECT_EQ(call({{"type", "mint"},
                  {"caller", "alice"},
                  {"to", "bob"},
                  {"amount", "500"}})["status"],
            "ok");
  EXPECT_EQ(call({{"type", "transfer"},
                  {"caller", "bob"},
                  {"to", "carol"},
                  {"amount", 200}})["status"],
            "ok");
  EXPECT_EQ(call({{"type", "burn"}, {"caller", "carol"}, {"amount", "50"}})
                ["status"],
            "ok");

  auto bob = call({{"type", "get_balance"}, {"identity", "bob"}});
  EXPECT_EQ(bob["identity"], "bob");
  EXPECT_EQ(bob["balance"], "300");
  auto carol = call({{"type", "get_balance"}, {"identity", "carol"}});
  EXPECT_EQ(carol["balance"], "150");

  EXPECT_EQ(ledger_.getTokenInfo().totalSupply, Amount(1000450));
}

TEST_F(DispatcherTest, LedgerErrorsKeepTheirCode) {
  auto unauthorized = call(
      {{"type", "mint"}, {"caller", "bob"}, {"to", "bob"}, {"amount", "1"}});
  EXPECT_EQ(unauthorized["code"], Ledger::E_UNAUTHORIZED);
  EXPECT_TRUE(unauthorized["error"].is_string());
  EXPECT_FALSE(unauthorized.contains("status"));

  auto invalid = call(
      {{"type", "transfer"}, {"caller", "alice"}, {"to", "bob"}, {"amount", "0"}});
  EXPECT_EQ(invalid["code"], Ledger::E_INVALID_AMOUNT);

  auto insufficient =
      call({{"type", "burn"}, {"caller", "bob"}, {"amount", "1"}});
  EXPECT_EQ(insufficient["code"], Ledger::E_INSUFFICIENT_BALANCE);

  auto self = call({{"type", "transfer"},
                    {"caller", "alice"},
                    {"to", "alice"},
                    {"amount", "1"}});
  EXPECT_EQ(self["code"], Ledger::E_SAME_ACCOUNT);

  auto owner =
      call({{"type", "change_owner"}, {"caller", "bob"}, {"newOwner", "bob"}});
  EXPECT_EQ(owner["code"], Ledger::E_UNAUTHORIZED);
}

TEST_F(DispatcherTest, HugeAmountOverflows) {
  auto resp = call({{"type", "mint"},
                    {"caller", "alice"},
                    {"to", "bob"},
                    {"amount", Amount::max().toString()}});
  EXPECT_EQ(resp["code"], Ledger::E_OVERFLOW);
  EXPECT_EQ(ledger_.getTokenInfo().totalSupply, Amount(1000000));
}

TEST_F(DispatcherTest, MalformedRequestsAreRejected) {
  EXPECT_EQ(nlohmann::json::parse(dispatcher_.handleRequest("not json"))["code"],
            Dispatcher::E_REQUEST);

  auto unknown = call({{"type", "approve"}});
  EXPECT_EQ(unknown["code"], Dispatcher::E_REQUEST);

  auto missingCaller = call({{"type", "burn"}, {"amount", "1"}});
  EXPECT_EQ(missingCaller["code"], Dispatcher::E_REQUEST);

  auto negative = call(
      {{"type", "transfer"}, {"caller", "alice"}, {"to", "bob"}, {"amount", -5}});
  EXPECT_EQ(negative["code"], Dispatcher::E_REQUEST);

  auto badIdentity = call({{"type", "get_balance"}, {"identity", "0xnothex"}});
  EXPECT_EQ(badIdentity["code"], Dispatcher::E_REQUEST);

  auto badCount =
      call({{"type", "get_transfer_history"}, {"maxCount", "ten"}});
  EXPECT_EQ(badCount["code"], Dispatcher::E_REQUEST);

  EXPECT_EQ(ledger_.getNextSequence(), 1u);
}

TEST_F(DispatcherTest, CreateWalletAndChangeOwner) {
  EXPECT_EQ(call({{"type", "create_wallet"}, {"caller", "dave"}})["status"],
            "ok");
  EXPECT_TRUE(ledger_.hasAccount(Identity("dave")));

  EXPECT_EQ(call({{"type", "change_owner"},
                  {"caller", "alice"},
                  {"newOwner", "dave"}})["status"],
            "ok");
  EXPECT_EQ(call({{"type", "get_token_info"}})["owner"], "dave");
}

TEST_F(DispatcherTest, TransferHistoryPaging) {
  for (int i = 1; i <= 3; ++i) {
    ASSERT_TRUE(
        ledger_.transfer(Identity("alice"), Identity("bob"), Amount(i)).isOk());
  }

  auto all = call({{"type", "get_transfer_history"}});
  ASSERT_EQ(all["transfers"].size(), 4u);
  EXPECT_EQ(all["nextSequence"], 4);
  EXPECT_TRUE(all["transfers"][0]["from"].is_null());
  EXPECT_EQ(all["transfers"][0]["to"], "alice");
  EXPECT_EQ(all["transfers"][3]["amount"], "3");

  auto page = call(
      {{"type", "get_transfer_history"}, {"fromSequence", 1}, {"maxCount", 2}});
  ASSERT_EQ(page["transfers"].size(), 2u);
  EXPECT_EQ(page["transfers"][0]["sequence"], 1);
  EXPECT_EQ(page["transfers"][1]["sequence"], 2);
}

TEST_F(DispatcherTest, RequestJsonRoundTrip) {
  Dispatcher::Request request;
  request.type = Dispatcher::Request::T_TRANSFER;
  request.caller = Identity("alice");
  request.target = Identity("bob");
  request.amount = Amount::fromParts(2, 5);

  auto j = request.toJson();
  EXPECT_EQ(j["type"], "transfer");
  EXPECT_EQ(j["to"], "bob");

  auto parsed = Dispatcher::Request::fromJson(j);
  ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
  EXPECT_EQ(parsed->type, Dispatcher::Request::T_TRANSFER);
  EXPECT_EQ(parsed->caller, request.caller);
  EXPECT_EQ(parsed->target, request.target);
  EXPECT_EQ(parsed->amount, request.amount);
}

TEST_F(DispatcherTest, TypeNames) {
  uint16_t type = 0;
  EXPECT_TRUE(Dispatcher::Request::typeFromName("get_transfer_history", type));
  EXPECT_EQ(type, Dispatcher::Request::T_GET_TRANSFER_HISTORY);
  EXPECT_FALSE(Dispatcher::Request::typeFromName("Transfer", type));
  EXPECT_EQ(Dispatcher::Request::typeName(Dispatcher::Request::T_CHANGE_OWNER),
            "change_owner");
  EXPECT_EQ(Dispatcher::Request::typeName(99), "unknown");
}

TEST_F(DispatcherTest, UnknownTypeInHandle) {
  Dispatcher::Request request;
  auto result = dispatcher_.handle(request);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Dispatcher::E_REQUEST);
}
