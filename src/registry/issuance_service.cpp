#include <spdlog/spdlog.h>
#include <accredit/common/critical.hpp>
#include <accredit/registry/issuance_service.hpp>
#include <accredit/schema/certificate_issued.hpp>

using namespace accredit::schema;

namespace accredit::registry {

issuance_service::issuance_service(const issuer_registry& issuers,
                                   identifier_allocator& identifiers,
                                   record_store& records,
                                   ownership_ledger_t& tokens)
    : issuers_{issuers},
      identifiers_{identifiers},
      records_{records},
      tokens_{tokens} {}

std::optional<certificate_id_t> issuance_service::issue_certificate(
    call_context& context,
    const account_id_t& recipient,
    const std::string& course,
    transaction_error_code& error) {
  if (!issuers_.is_authorized(context.caller)) {
    spdlog::debug("Rejecting issuance from unauthorized caller {}",
                  to_hex(context.caller));
    error = transaction_error_code::unauthorized;
    return std::nullopt;
  }
  if (is_zero(recipient)) {
    error = transaction_error_code::invalid_recipient;
    return std::nullopt;
  }
  if (course.empty() || course.size() > kMaxCourseLength) {
    error = transaction_error_code::invalid_course;
    return std::nullopt;
  }

  auto certificate_id = identifiers_.next();
  tokens_.mint(certificate_id, recipient);
  records_.put(certificate_id, certificate_t{.recipient = recipient,
                                             .course = course,
                                             .issuer = context.caller,
                                             .issue_date = context.timestamp});
  context.events.emplace_back(
      certificate_issued_t{.certificate_id = certificate_id,
                           .recipient = recipient,
                           .course = course,
                           .issuer = context.caller});
  spdlog::info("Certificate {} issued to {} by {}", certificate_id,
               to_hex(recipient), to_hex(context.caller));
  return certificate_id;
}

std::optional<certificate_t> issuance_service::verify_certificate(
    const certificate_id_t certificate_id) const {
  if (!tokens_.exists(certificate_id)) {
    return std::nullopt;
  }
  auto certificate = records_.get(certificate_id);
  if (!certificate) {
    spdlog::error("Token {} minted without a certificate record",
                  certificate_id);
    accredit::common::critical("certificate record missing for minted token");
  }
  return certificate;
}

}  // namespace accredit::registry
