#pragma once

#include <accredit/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace accredit::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t version{1};
  std::string data{"accredit-registry"};
  std::string app_version{"0.1.0"};
  int64_t last_block_height{};
  hash32_t last_block_state_root{};
};

using app_info_t = app_info<1>;

}  // namespace accredit::schema
