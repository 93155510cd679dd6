#include <accredit/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <variant>

namespace {

using accredit::schema::transaction_error_code;
using accredit::testing::make_account;

class admin_service : public ::testing::Test {
 protected:
  admin_service() : fixture_{"accredit_admin", make_account(1)} {}

  accredit::testing::registry_fixture fixture_;
};

}  // namespace

TEST_F(admin_service, owner_grants_issuer_and_emits_event) {
  auto context = fixture_.context_for(make_account(1));
  auto error = transaction_error_code{};
  ASSERT_TRUE(
      fixture_.registry().admin.grant(context, make_account(2), error));
  EXPECT_TRUE(fixture_.registry().issuers.is_authorized(make_account(2)));

  ASSERT_EQ(context.events.size(), 1u);
  EXPECT_EQ(context.events[0],
            accredit::schema::registry_event_t{
                accredit::schema::issuer_approved_t{.issuer = make_account(2)}});
}

TEST_F(admin_service, non_owner_cannot_grant) {
  auto context = fixture_.context_for(make_account(5));
  auto error = transaction_error_code{};
  EXPECT_FALSE(
      fixture_.registry().admin.grant(context, make_account(5), error));
  EXPECT_EQ(error, transaction_error_code::unauthorized);
  EXPECT_FALSE(fixture_.registry().issuers.is_authorized(make_account(5)));
  EXPECT_TRUE(context.events.empty());
}

TEST_F(admin_service, non_owner_cannot_revoke) {
  auto owner = fixture_.context_for(make_account(1));
  auto error = transaction_error_code{};
  ASSERT_TRUE(fixture_.registry().admin.grant(owner, make_account(2), error));

  auto context = fixture_.context_for(make_account(2));
  EXPECT_FALSE(
      fixture_.registry().admin.revoke(context, make_account(2), error));
  EXPECT_EQ(error, transaction_error_code::unauthorized);
  EXPECT_TRUE(fixture_.registry().issuers.is_authorized(make_account(2)));
}

TEST_F(admin_service, zero_identity_is_rejected) {
  auto context = fixture_.context_for(make_account(1));
  auto error = transaction_error_code{};
  EXPECT_FALSE(fixture_.registry().admin.grant(
      context, accredit::schema::make_zero_hash(), error));
  EXPECT_EQ(error, transaction_error_code::invalid_account);
  EXPECT_FALSE(fixture_.registry().admin.transfer_ownership(
      context, accredit::schema::make_zero_hash(), error));
  EXPECT_EQ(error, transaction_error_code::invalid_account);
  EXPECT_TRUE(context.events.empty());
}

TEST_F(admin_service, repeated_grant_and_revoke_are_accepted) {
  auto context = fixture_.context_for(make_account(1));
  auto error = transaction_error_code{};
  auto& admin = fixture_.registry().admin;
  EXPECT_TRUE(admin.grant(context, make_account(2), error));
  EXPECT_TRUE(admin.grant(context, make_account(2), error));
  EXPECT_TRUE(admin.revoke(context, make_account(2), error));
  EXPECT_TRUE(admin.revoke(context, make_account(2), error));
  EXPECT_FALSE(fixture_.registry().issuers.is_authorized(make_account(2)));
  EXPECT_EQ(context.events.size(), 4u);
}

TEST_F(admin_service, transfer_moves_the_owner_gate) {
  auto context = fixture_.context_for(make_account(1));
  auto error = transaction_error_code{};
  auto& admin = fixture_.registry().admin;
  ASSERT_TRUE(admin.transfer_ownership(context, make_account(7), error));
  EXPECT_EQ(fixture_.registry().owner_gate.owner(), make_account(7));
  ASSERT_EQ(context.events.size(), 1u);
  EXPECT_EQ(context.events[0],
            accredit::schema::registry_event_t{
                accredit::schema::ownership_transferred_t{
                    .previous_owner = make_account(1),
                    .new_owner = make_account(7)}});

  auto former = fixture_.context_for(make_account(1));
  EXPECT_FALSE(admin.grant(former, make_account(3), error));
  EXPECT_EQ(error, transaction_error_code::unauthorized);

  auto current = fixture_.context_for(make_account(7));
  EXPECT_TRUE(admin.grant(current, make_account(3), error));
}

TEST_F(admin_service, non_owner_cannot_transfer_ownership) {
  auto context = fixture_.context_for(make_account(5));
  auto error = transaction_error_code{};
  EXPECT_FALSE(fixture_.registry().admin.transfer_ownership(
      context, make_account(5), error));
  EXPECT_EQ(error, transaction_error_code::unauthorized);
  EXPECT_EQ(fixture_.registry().owner_gate.owner(), make_account(1));
  EXPECT_TRUE(context.events.empty());
}
