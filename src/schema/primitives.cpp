#include <accredit/common/critical.hpp>
#include <accredit/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace accredit::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<accredit::schema::bytes_t> try_from_hex_internal(
    std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = accredit::schema::bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<accredit::schema::hash32_t> try_make_hash32_internal(
    std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }

  auto hash = accredit::schema::hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    accredit::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string& bytes) {
  return make_hash32(std::string_view{bytes});
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_hash32_internal(bytes);
  if (!hash.has_value()) {
    accredit::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string& bytes) {
  return try_make_hash32_internal(bytes);
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_hash32_internal(bytes);
}

hash32_t make_zero_hash() {
  return {};
}

bool is_zero(const hash32_t& hash) {
  return std::ranges::all_of(hash, [](const uint8_t byte) { return byte == 0; });
}

std::string to_hex(const accredit::schema::bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    accredit::common::critical("invalid hex input");
  }
  return *decoded;
}

}  // namespace accredit::schema
