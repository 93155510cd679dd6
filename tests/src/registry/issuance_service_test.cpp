#include <accredit/testing/registry_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using accredit::schema::transaction_error_code;
using accredit::testing::make_account;

const auto kOwner = make_account(1);
const auto kIssuer = make_account(2);
const auto kRecipient = make_account(3);
const auto kStranger = make_account(4);

class issuance_service : public ::testing::Test {
 protected:
  issuance_service() : fixture_{"accredit_issuance", kOwner} {
    auto context = fixture_.context_for(kOwner);
    auto error = transaction_error_code{};
    EXPECT_TRUE(fixture_.registry().admin.grant(context, kIssuer, error));
  }

  std::optional<accredit::schema::certificate_id_t> issue(
      const accredit::schema::account_id_t& caller,
      const accredit::schema::account_id_t& recipient,
      const std::string& course,
      transaction_error_code& error,
      const accredit::schema::timestamp_milliseconds_t timestamp = 1000) {
    auto context = fixture_.context_for(caller, timestamp);
    auto id = fixture_.registry().issuance.issue_certificate(
        context, recipient, course, error);
    events_ = context.events;
    return id;
  }

  accredit::testing::registry_fixture fixture_;
  std::vector<accredit::schema::registry_event_t> events_;
};

}  // namespace

TEST_F(issuance_service, authorized_issuer_issues_and_verifies) {
  auto error = transaction_error_code{};
  auto id = issue(kIssuer, kRecipient, "Algorithms", error, 1700000000000);
  ASSERT_EQ(id, 0u);

  auto certificate = fixture_.registry().issuance.verify_certificate(0);
  ASSERT_TRUE(certificate.has_value());
  EXPECT_EQ(certificate->recipient, kRecipient);
  EXPECT_EQ(certificate->course, "Algorithms");
  EXPECT_EQ(certificate->issuer, kIssuer);
  EXPECT_EQ(certificate->issue_date, 1700000000000u);

  EXPECT_EQ(fixture_.registry().tokens.owner_of(0), kRecipient);
  EXPECT_EQ(fixture_.registry().tokens.balance_of(kRecipient), 1u);
}

TEST_F(issuance_service, issuance_emits_certificate_issued) {
  auto error = transaction_error_code{};
  ASSERT_TRUE(issue(kIssuer, kRecipient, "Algorithms", error).has_value());
  ASSERT_EQ(events_.size(), 1u);
  EXPECT_EQ(events_[0], accredit::schema::registry_event_t{
                            accredit::schema::certificate_issued_t{
                                .certificate_id = 0,
                                .recipient = kRecipient,
                                .course = "Algorithms",
                                .issuer = kIssuer}});
}

TEST_F(issuance_service, identifiers_increase_without_gaps) {
  auto error = transaction_error_code{};
  for (auto expected = uint64_t{0}; expected < 5; ++expected) {
    EXPECT_EQ(issue(kIssuer, kRecipient, "Course", error), expected);
  }
  EXPECT_EQ(fixture_.registry().tokens.balance_of(kRecipient), 5u);
}

TEST_F(issuance_service, unauthorized_caller_changes_nothing) {
  auto error = transaction_error_code{};
  EXPECT_FALSE(issue(kStranger, kRecipient, "Algorithms", error).has_value());
  EXPECT_EQ(error, transaction_error_code::unauthorized);
  EXPECT_TRUE(events_.empty());
  EXPECT_EQ(fixture_.registry().identifiers.peek(), 0u);
  EXPECT_FALSE(fixture_.registry().tokens.exists(0));
  EXPECT_FALSE(fixture_.registry().records.contains(0));
}

TEST_F(issuance_service, owner_is_not_implicitly_an_issuer) {
  auto error = transaction_error_code{};
  EXPECT_FALSE(issue(kOwner, kRecipient, "Algorithms", error).has_value());
  EXPECT_EQ(error, transaction_error_code::unauthorized);
}

TEST_F(issuance_service, revoked_issuer_is_rejected_and_old_records_remain) {
  auto error = transaction_error_code{};
  ASSERT_EQ(issue(kIssuer, kRecipient, "Algorithms", error), 0u);

  auto context = fixture_.context_for(kOwner);
  ASSERT_TRUE(fixture_.registry().admin.revoke(context, kIssuer, error));

  EXPECT_FALSE(issue(kIssuer, kRecipient, "Compilers", error).has_value());
  EXPECT_EQ(error, transaction_error_code::unauthorized);
  auto certificate = fixture_.registry().issuance.verify_certificate(0);
  ASSERT_TRUE(certificate.has_value());
  EXPECT_EQ(certificate->issuer, kIssuer);
}

TEST_F(issuance_service, authorization_is_checked_before_arguments) {
  auto error = transaction_error_code{};
  EXPECT_FALSE(issue(kStranger, accredit::schema::make_zero_hash(), "", error)
                   .has_value());
  EXPECT_EQ(error, transaction_error_code::unauthorized);
}

TEST_F(issuance_service, zero_recipient_is_rejected) {
  auto error = transaction_error_code{};
  EXPECT_FALSE(issue(kIssuer, accredit::schema::make_zero_hash(), "Algorithms",
                     error)
                   .has_value());
  EXPECT_EQ(error, transaction_error_code::invalid_recipient);
  EXPECT_EQ(fixture_.registry().identifiers.peek(), 0u);
}

TEST_F(issuance_service, course_length_is_bounded) {
  auto error = transaction_error_code{};
  EXPECT_FALSE(issue(kIssuer, kRecipient, "", error).has_value());
  EXPECT_EQ(error, transaction_error_code::invalid_course);

  auto too_long = std::string(accredit::registry::kMaxCourseLength + 1, 'x');
  EXPECT_FALSE(issue(kIssuer, kRecipient, too_long, error).has_value());
  EXPECT_EQ(error, transaction_error_code::invalid_course);

  auto longest = std::string(accredit::registry::kMaxCourseLength, 'x');
  EXPECT_EQ(issue(kIssuer, kRecipient, longest, error), 0u);
}

TEST_F(issuance_service, same_recipient_and_course_yield_distinct_records) {
  auto error = transaction_error_code{};
  EXPECT_EQ(issue(kIssuer, kRecipient, "Algorithms", error), 0u);
  EXPECT_EQ(issue(kIssuer, kRecipient, "Algorithms", error), 1u);
  EXPECT_EQ(fixture_.registry().issuance.verify_certificate(0),
            fixture_.registry().issuance.verify_certificate(1));
}

TEST_F(issuance_service, unknown_identifier_is_not_found) {
  EXPECT_FALSE(
      fixture_.registry().issuance.verify_certificate(0).has_value());
  EXPECT_FALSE(
      fixture_.registry().issuance.verify_certificate(12345).has_value());
}

TEST_F(issuance_service, recording_an_identifier_twice_is_fatal) {
  auto error = transaction_error_code{};
  ASSERT_EQ(issue(kIssuer, kRecipient, "Algorithms", error), 0u);
  auto certificate = *fixture_.registry().records.get(0);
  EXPECT_DEATH(fixture_.registry().records.put(0, certificate), "");
}
