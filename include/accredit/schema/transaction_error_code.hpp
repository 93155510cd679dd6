#pragma once

#include <cstdint>

namespace accredit::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  unauthorized = 10,
  invalid_recipient = 11,
  invalid_course = 12,
  invalid_account = 13,
};

}  // namespace accredit::schema
