#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace accredit::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using account_id_t = hash32_t;  // On chain identity reference
using certificate_id_t = uint64_t;
using timestamp_milliseconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

}  // namespace accredit::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
