#include <accredit/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

namespace {

using accredit::testing::make_account;

}  // namespace

TEST(unique_ownership, mint_records_owner_and_balance) {
  auto fixture =
      accredit::testing::registry_fixture{"accredit_tokens", make_account(1)};
  auto& tokens = fixture.registry().tokens;

  EXPECT_FALSE(tokens.exists(0));
  EXPECT_EQ(tokens.balance_of(make_account(2)), 0u);

  tokens.mint(0, make_account(2));
  tokens.mint(1, make_account(2));
  tokens.mint(2, make_account(3));

  EXPECT_TRUE(tokens.exists(0));
  EXPECT_EQ(tokens.owner_of(1), make_account(2));
  EXPECT_EQ(tokens.owner_of(2), make_account(3));
  EXPECT_FALSE(tokens.owner_of(3).has_value());
  EXPECT_EQ(tokens.balance_of(make_account(2)), 2u);
  EXPECT_EQ(tokens.balance_of(make_account(3)), 1u);
}

TEST(unique_ownership, minting_an_existing_token_is_fatal) {
  auto fixture =
      accredit::testing::registry_fixture{"accredit_tokens", make_account(1)};
  fixture.registry().tokens.mint(0, make_account(2));
  EXPECT_DEATH(fixture.registry().tokens.mint(0, make_account(3)), "");
}

TEST(unique_ownership, minting_to_zero_account_is_fatal) {
  auto fixture =
      accredit::testing::registry_fixture{"accredit_tokens", make_account(1)};
  EXPECT_DEATH(
      fixture.registry().tokens.mint(0, accredit::schema::make_zero_hash()),
      "");
}
