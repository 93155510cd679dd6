#include <gtest/gtest.h>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/registry_event.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = accredit::schema::bytes_t(32, 0xAB);
  auto hash = accredit::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = accredit::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_short_and_malformed_input) {
  EXPECT_FALSE(accredit::schema::try_make_hash32(std::string_view{"0x0102"})
                   .has_value());
  EXPECT_FALSE(accredit::schema::try_make_hash32(
                   std::string_view{"zz02030405060708090a0b0c0d0e0f10"
                                    "1112131415161718191a1b1c1d1e1f20"})
                   .has_value());
}

TEST(primitives, make_zero_hash_is_zero) {
  auto zero = accredit::schema::make_zero_hash();
  EXPECT_TRUE(accredit::schema::is_zero(zero));

  auto non_zero = zero;
  non_zero[31] = 1;
  EXPECT_FALSE(accredit::schema::is_zero(non_zero));
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = accredit::schema::bytes_t{0x00, 0x0F, 0xA0, 0xFE, 0xFF};
  auto encoded = accredit::schema::to_hex(payload);
  EXPECT_EQ(encoded, "000fa0feff");
  EXPECT_EQ(accredit::schema::from_hex(encoded), payload);
  EXPECT_EQ(accredit::schema::from_hex("0X000FA0FEFF"), payload);
}

TEST(primitives, try_from_hex_rejects_odd_length) {
  EXPECT_FALSE(accredit::schema::try_from_hex("abc").has_value());
}

TEST(primitives, event_type_names_round_trip) {
  using accredit::schema::event_type_t;
  EXPECT_EQ(accredit::schema::to_string(event_type_t::certificate_issued),
            "certificate_issued");
  EXPECT_EQ(accredit::schema::try_from_string<event_type_t>(
                "ownership_transferred"),
            event_type_t::ownership_transferred);
  EXPECT_FALSE(
      accredit::schema::try_from_string<event_type_t>("minted").has_value());
}

TEST(primitives, event_type_follows_variant_alternative) {
  auto event = accredit::schema::registry_event_t{
      accredit::schema::issuer_revoked_t{}};
  EXPECT_EQ(accredit::schema::event_type(event),
            accredit::schema::event_type_t::issuer_revoked);
}
