#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: registry keys.
// Defines canonical key prefixes and key codecs for registry state, the token
// ownership ledger and the notification stream.
namespace accredit::schema::key {

inline constexpr std::string_view kChainIdKeyPrefix{"SYS|STATE|CHAIN_ID|"};
inline constexpr std::string_view kOwnerKeyPrefix{"SYS|STATE|OWNER|"};
inline constexpr std::string_view kIssuerKeyPrefix{"SYS|STATE|ISSUER|"};
inline constexpr std::string_view kCertificateSeqKeyPrefix{
    "SYS|STATE|CERTIFICATE_SEQ|"};
inline constexpr std::string_view kCertificateKeyPrefix{
    "SYS|STATE|CERTIFICATE|"};
inline constexpr std::string_view kTokenOwnerKeyPrefix{
    "SYS|STATE|TOKEN_OWNER|"};
inline constexpr std::string_view kTokenBalanceKeyPrefix{
    "SYS|STATE|TOKEN_BALANCE|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
accredit::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                            std::string_view prefix,
                                            const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
accredit::schema::bytes_t make_chain_id_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kChainIdKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
accredit::schema::bytes_t make_owner_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kOwnerKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
accredit::schema::bytes_t make_issuer_key(
    Encoder& encoder,
    const accredit::schema::account_id_t& issuer) {
  return make_prefixed_key(encoder, kIssuerKeyPrefix, issuer);
}

template <typename Encoder>
accredit::schema::bytes_t make_certificate_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kCertificateSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
accredit::schema::bytes_t make_certificate_key(
    Encoder& encoder,
    const accredit::schema::certificate_id_t certificate_id) {
  return make_prefixed_key(encoder, kCertificateKeyPrefix, certificate_id);
}

template <typename Encoder>
accredit::schema::bytes_t make_token_owner_key(
    Encoder& encoder,
    const accredit::schema::certificate_id_t token_id) {
  return make_prefixed_key(encoder, kTokenOwnerKeyPrefix, token_id);
}

template <typename Encoder>
accredit::schema::bytes_t make_token_balance_key(
    Encoder& encoder,
    const accredit::schema::account_id_t& owner) {
  return make_prefixed_key(encoder, kTokenBalanceKeyPrefix, owner);
}

template <typename Encoder>
accredit::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
accredit::schema::bytes_t make_event_key(Encoder& encoder, uint64_t event_id) {
  return make_prefixed_key(encoder, kEventPrefix, event_id);
}

}  // namespace accredit::schema::key
