#pragma once
#include <accredit/schema/primitives.hpp>
#include <string_view>

namespace accredit::blake3 {

accredit::schema::hash32_t hash(const std::string_view& str);
accredit::schema::hash32_t hash(const accredit::schema::bytes_view_t& bytes);

}  // namespace accredit::blake3
