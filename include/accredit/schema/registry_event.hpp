#pragma once

#include <accredit/schema/certificate_issued.hpp>
#include <accredit/schema/enum_string.hpp>
#include <accredit/schema/issuer_approved.hpp>
#include <accredit/schema/issuer_revoked.hpp>
#include <accredit/schema/ownership_transferred.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

// Schema type: registry event.
// Append-only notification stream. Each committed event is persisted as a
// numbered record so observers can replay it by id range.
namespace accredit::schema {

using registry_event_t = std::variant<certificate_issued_t,
                                      issuer_approved_t,
                                      issuer_revoked_t,
                                      ownership_transferred_t>;

enum class event_type_t : uint8_t {
  certificate_issued = 0,
  issuer_approved = 1,
  issuer_revoked = 2,
  ownership_transferred = 3
};

inline constexpr auto kEventTypeMappings = std::array{
    std::pair<std::string_view, event_type_t>{"certificate_issued",
                                              event_type_t::certificate_issued},
    std::pair<std::string_view, event_type_t>{"issuer_approved",
                                              event_type_t::issuer_approved},
    std::pair<std::string_view, event_type_t>{"issuer_revoked",
                                              event_type_t::issuer_revoked},
    std::pair<std::string_view, event_type_t>{
        "ownership_transferred", event_type_t::ownership_transferred},
};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings).value_or("unknown");
}

inline event_type_t event_type(const registry_event_t& event) {
  return static_cast<event_type_t>(event.index());
}

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  uint64_t height{};
  uint32_t transaction_index{};
  registry_event_t event;
};

using event_record_t = event_record<1>;

}  // namespace accredit::schema
