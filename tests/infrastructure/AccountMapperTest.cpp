#include "infrastructure/AccountMapper.hpp"

#include "domain/Errors.hpp"

#include <gtest/gtest.h>

using json = nlohmann::json;
using sgw::domain::ValidationError;
using sgw::infrastructure::AccountMapper;

class AccountMapperTest : public ::testing::Test {
protected:
    AccountMapper mapper;
};

TEST_F(AccountMapperTest, ParsesWallet) {
    auto wallet = mapper.wallet_from_json(json::parse(R"({
        "bzzBalance": "1000000000000000000",
        "nativeTokenBalance": "5",
        "chainID": 100,
        "walletAddress": "0xdeadbeef"
    })"));
    EXPECT_EQ(wallet.wallet_address, "0xdeadbeef");
    EXPECT_EQ(wallet.bzz_balance, "1000000000000000000");
}

TEST_F(AccountMapperTest, WalletBalanceIsOptional) {
    auto wallet = mapper.wallet_from_json(json{{"walletAddress", "0xdeadbeef"}});
    EXPECT_FALSE(wallet.bzz_balance.has_value());
    EXPECT_TRUE(mapper.to_json(wallet)["bzzBalance"].is_null());
}

TEST_F(AccountMapperTest, WalletWithoutAddressIsInvalid) {
    EXPECT_THROW(mapper.wallet_from_json(json{{"bzzBalance", "1"}}), ValidationError);
    EXPECT_THROW(mapper.wallet_from_json(json::array()), ValidationError);
}

TEST_F(AccountMapperTest, ParsesChequebookFromBothResponses) {
    auto chequebook = mapper.chequebook_from_json(
        json{{"chequebookAddress", "0xc0ffee"}},
        json{{"totalBalance", "900"}, {"availableBalance", "800"}});

    EXPECT_EQ(chequebook.chequebook_address, "0xc0ffee");
    EXPECT_EQ(chequebook.available_balance, "800");
    EXPECT_EQ(chequebook.total_balance, "900");
}

TEST_F(AccountMapperTest, NumericBalancesBecomeText) {
    auto chequebook = mapper.chequebook_from_json(
        json{{"chequebookAddress", "0xc0ffee"}},
        json{{"totalBalance", 900}, {"availableBalance", 800}});
    EXPECT_EQ(chequebook.available_balance, "800");
    EXPECT_EQ(chequebook.total_balance, "900");
}

TEST_F(AccountMapperTest, ChequebookWithoutAddressIsInvalid) {
    EXPECT_THROW(mapper.chequebook_from_json(json::object(), json::object()), ValidationError);
}

TEST_F(AccountMapperTest, SerializesChequebook) {
    auto out = mapper.to_json(sgw::domain::ChequebookInfo{"0xc0ffee", "800", std::nullopt});
    EXPECT_EQ(out["chequebookAddress"], "0xc0ffee");
    EXPECT_EQ(out["availableBalance"], "800");
    EXPECT_TRUE(out["totalBalance"].is_null());
}
