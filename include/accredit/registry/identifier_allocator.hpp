#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/storage/overlay.hpp>

namespace accredit::registry {

/// Monotonic certificate identifier sequence, starting at 0.
class identifier_allocator final {
 public:
  identifier_allocator(encoder_t& encoder, accredit::storage::overlay& state);

  /// Return the next unused identifier and advance the sequence.
  accredit::schema::certificate_id_t next();

  /// Identifier the next call to next() will return.
  accredit::schema::certificate_id_t peek() const;

 private:
  encoder_t& encoder_;
  accredit::storage::overlay& state_;
};

}  // namespace accredit::registry
