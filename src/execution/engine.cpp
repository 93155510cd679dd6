#include <spdlog/spdlog.h>
#include <accredit/blake3/hash.hpp>
#include <accredit/common/critical.hpp>
#include <accredit/execution/engine.hpp>
#include <accredit/schema/encoding/scale/encoder.hpp>
#include <accredit/schema/key/registry_keys.hpp>
#include <accredit/schema/query_error_code.hpp>
#include <accredit/schema/transaction_error_code.hpp>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace accredit::schema;

namespace {

using encoder_t = accredit::schema::encoding::encoder<
    accredit::schema::encoding::scale_encoder_tag>;

accredit::schema::hash32_t fold_state_root(
    const accredit::schema::hash32_t& seed,
    const accredit::schema::bytes_t& tx,
    uint64_t height,
    uint64_t index) {
  auto material = accredit::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 32);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return accredit::blake3::hash(
      accredit::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<accredit::schema::transaction_t> decode_transaction(
    const accredit::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<accredit::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

std::string_view describe(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::invalid_chain_id:
      return "invalid chain id";
    case transaction_error_code::unauthorized:
      return "unauthorized";
    case transaction_error_code::invalid_recipient:
      return "invalid recipient";
    case transaction_error_code::invalid_course:
      return "invalid course";
    case transaction_error_code::invalid_account:
      return "invalid account";
  }
  return "unknown error";
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       const std::string_view codespace,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

}  // namespace

namespace accredit::execution {

engine::engine(
    accredit::schema::encoding::encoder<
        accredit::schema::encoding::scale_encoder_tag>& encoder,
    accredit::storage::storage<accredit::storage::rocksdb_storage_tag>& storage,
    const genesis_config& genesis)
    : encoder_{encoder}, storage_{storage}, pending_state_{storage} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing registry engine");
  load_persisted_state();
  initialize_genesis(genesis);
  spdlog::info("Registry engine ready at height {} on chain {}",
               last_committed_height_, to_hex(chain_id_));
}

transaction_result_t engine::check_transaction(
    const accredit::schema::bytes_view_t& raw_tx) const {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "accredit.checktx", decode_error);
  }
  return validate_transaction(*maybe_tx, "accredit.checktx");
}

transaction_result_t engine::validate_transaction(
    const accredit::schema::transaction_t& tx,
    const std::string_view codespace) const {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version, codespace,
        "expected version 1");
  }
  if (tx.chain_id != chain_id_) {
    return make_error_result(transaction_error_code::invalid_chain_id,
                             codespace);
  }
  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    accredit::registry::components& registry,
    accredit::registry::call_context& context,
    const accredit::schema::transaction_t& tx) {
  auto result = transaction_result_t{};
  auto error = transaction_error_code{};
  auto ok = std::visit(
      overloaded{
          [&](const issue_certificate_t& operation) {
            auto certificate_id = registry.issuance.issue_certificate(
                context, operation.recipient, operation.course, error);
            if (certificate_id) {
              result.data = encoder_.encode(*certificate_id);
              result.info = "certificate issued";
            }
            return certificate_id.has_value();
          },
          [&](const approve_issuer_t& operation) {
            result.info = "issuer approved";
            return registry.admin.grant(context, operation.issuer, error);
          },
          [&](const revoke_issuer_t& operation) {
            result.info = "issuer revoked";
            return registry.admin.revoke(context, operation.issuer, error);
          },
          [&](const transfer_ownership_t& operation) {
            result.info = "ownership transferred";
            return registry.admin.transfer_ownership(
                context, operation.new_owner, error);
          }},
      tx.payload);

  if (!ok) {
    return make_error_result(error, "accredit.registry");
  }
  result.events = context.events;
  return result;
}

block_result_t engine::finalize_block(
    uint64_t height,
    accredit::schema::timestamp_milliseconds_t block_time,
    const std::vector<accredit::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  // Blocks extend the committed chain by exactly one height.
  auto expected_height = static_cast<uint64_t>(last_committed_height_) + 1;
  if (height != expected_height) {
    spdlog::error("Rejecting block at height {}, expected {}", height,
                  expected_height);
    for (size_t i = 0; i < txs.size(); ++i) {
      result.tx_results.push_back(make_error_result(
          transaction_error_code::invalid_transaction, "accredit.finalize",
          "unexpected block height"));
    }
    result.state_root = last_committed_state_root_;
    return result;
  }

  if (!pending_state_.empty() || !pending_events_.empty()) {
    spdlog::warn("Dropping uncommitted block at height {}", pending_height_);
    pending_state_.discard();
    pending_events_.clear();
  }

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(
        accredit::schema::bytes_view_t{txs[i].data(), txs[i].size()},
        decode_error);
    if (!maybe_tx) {
      result.tx_results.push_back(
          make_error_result(transaction_error_code::invalid_transaction,
                            "accredit.finalize", decode_error));
      continue;
    }

    auto validation = validate_transaction(*maybe_tx, "accredit.finalize");
    if (validation.code != 0) {
      result.tx_results.push_back(std::move(validation));
      continue;
    }

    auto tx_state = accredit::storage::overlay{storage_, &pending_state_};
    auto registry = accredit::registry::components{encoder_, tx_state};
    auto context = accredit::registry::call_context{
        .caller = maybe_tx->signer, .timestamp = block_time};
    auto tx_result = execute_operation(registry, context, *maybe_tx);
    if (tx_result.code == 0) {
      record_events(tx_state, height, static_cast<uint32_t>(i),
                    context.events);
      tx_state.merge();
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    } else {
      spdlog::debug("Transaction {} at height {} rejected: {}", i, height,
                    tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

void engine::record_events(
    accredit::storage::overlay& state,
    uint64_t height,
    uint32_t transaction_index,
    const std::vector<accredit::schema::registry_event_t>& events) {
  auto sequence_key = key::make_event_sequence_key(encoder_);
  auto sequence_view =
      bytes_view_t{sequence_key.data(), sequence_key.size()};
  auto next_id = state.get<uint64_t>(encoder_, sequence_view).value_or(0);
  for (const auto& event : events) {
    auto record = event_record_t{.event_id = next_id,
                                 .height = height,
                                 .transaction_index = transaction_index,
                                 .event = event};
    auto event_key = key::make_event_key(encoder_, next_id);
    state.put(encoder_, bytes_view_t{event_key.data(), event_key.size()},
              record);
    pending_events_.push_back(std::move(record));
    ++next_id;
  }
  state.put(encoder_, sequence_view, next_id);
}

commit_result_t engine::commit() {
  auto published = std::vector<event_record_t>{};
  auto listener = event_listener_t{};
  auto result = commit_result_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (pending_height_ > 0) {
      last_committed_height_ = pending_height_;
      last_committed_state_root_ = pending_state_root_;
      pending_height_ = 0;
    }

    storage_.commit_batch(
        pending_state_.entries(),
        accredit::storage::committed_state{
            .height = last_committed_height_,
            .state_root = last_committed_state_root_});
    pending_state_.discard();
    published = std::exchange(pending_events_, {});
    listener = event_listener_;

    result.committed_height = last_committed_height_;
    result.state_root = last_committed_state_root_;
    spdlog::info("Committed height {} with {} event(s)",
                 last_committed_height_, published.size());
  }

  for (const auto& record : published) {
    spdlog::debug("Event {} {}", record.event_id,
                  to_string(event_type(record.event)));
    if (listener) {
      listener(record);
    }
  }
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const accredit::schema::bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = "accredit.query";

  auto fail = [&](const query_error_code code, std::string log) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    return result;
  };

  auto state = accredit::storage::overlay{storage_};
  auto registry = accredit::registry::components{encoder_, state};

  if (path == "/engine/info") {
    result.value = encoder_.encode(std::tuple{
        last_committed_height_, last_committed_state_root_, chain_id_});
    return result;
  }
  if (path == "/certificate") {
    auto certificate_id = encoder_.try_decode<certificate_id_t>(data);
    if (!certificate_id) {
      return fail(query_error_code::invalid_key, "invalid certificate id");
    }
    auto certificate = registry.issuance.verify_certificate(*certificate_id);
    if (!certificate) {
      return fail(query_error_code::not_found, "certificate not found");
    }
    result.value = encoder_.encode(*certificate);
    return result;
  }
  if (path == "/certificate/next_id") {
    result.value = encoder_.encode(registry.identifiers.peek());
    return result;
  }
  if (path == "/issuer") {
    auto issuer = encoder_.try_decode<account_id_t>(data);
    if (!issuer) {
      return fail(query_error_code::invalid_key, "invalid account");
    }
    result.value = encoder_.encode(registry.issuers.is_authorized(*issuer));
    return result;
  }
  if (path == "/owner") {
    auto owner = registry.owner_gate.owner();
    if (!owner) {
      return fail(query_error_code::not_found, "owner not set");
    }
    result.value = encoder_.encode(*owner);
    return result;
  }
  if (path == "/token/owner") {
    auto token_id = encoder_.try_decode<certificate_id_t>(data);
    if (!token_id) {
      return fail(query_error_code::invalid_key, "invalid token id");
    }
    auto owner = registry.tokens.owner_of(*token_id);
    if (!owner) {
      return fail(query_error_code::not_found, "token not minted");
    }
    result.value = encoder_.encode(*owner);
    return result;
  }
  if (path == "/token/balance") {
    auto owner = encoder_.try_decode<account_id_t>(data);
    if (!owner) {
      return fail(query_error_code::invalid_key, "invalid account");
    }
    result.value = encoder_.encode(registry.tokens.balance_of(*owner));
    return result;
  }
  if (path == "/events/range") {
    auto range = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!range) {
      return fail(query_error_code::invalid_key, "invalid event range");
    }
    result.value = encoder_.encode(
        load_events(std::get<0>(*range), std::get<1>(*range)));
    return result;
  }
  return fail(query_error_code::unsupported_path, "unsupported query path");
}

std::vector<event_record_t> engine::events(uint64_t from_id,
                                           uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_events(from_id, to_id);
}

std::vector<event_record_t> engine::load_events(uint64_t from_id,
                                                uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  if (to_id < from_id) {
    return records;
  }
  to_id = std::min(to_id, max_event_range_end(from_id));
  for (auto id = from_id;; ++id) {
    auto event_key = key::make_event_key(encoder_, id);
    auto record = storage_.get<event_record_t>(
        encoder_, bytes_view_t{event_key.data(), event_key.size()});
    if (!record) {
      break;
    }
    records.push_back(std::move(*record));
    if (id == to_id) {
      break;
    }
  }
  return records;
}

void engine::set_event_listener(event_listener_t listener) {
  auto lock = std::scoped_lock{mutex_};
  event_listener_ = std::move(listener);
}

hash32_t engine::chain_id() const {
  auto lock = std::scoped_lock{mutex_};
  return chain_id_;
}

void engine::initialize_genesis(const genesis_config& genesis) {
  auto chain_id_key = key::make_chain_id_key(encoder_);
  auto stored_chain_id = storage_.get<hash32_t>(
      encoder_, bytes_view_t{chain_id_key.data(), chain_id_key.size()});
  if (stored_chain_id) {
    if (*stored_chain_id != genesis.chain_id) {
      spdlog::error("Database chain id {} does not match configured {}",
                    to_hex(*stored_chain_id), to_hex(genesis.chain_id));
      accredit::common::critical("chain id mismatch");
    }
    chain_id_ = *stored_chain_id;
    return;
  }

  if (!genesis.owner || is_zero(*genesis.owner)) {
    accredit::common::critical("genesis requires a non-zero owner");
  }
  auto genesis_state = accredit::storage::overlay{storage_};
  auto registry = accredit::registry::components{encoder_, genesis_state};
  registry.owner_gate.set_owner(*genesis.owner);
  genesis_state.put(encoder_,
                    bytes_view_t{chain_id_key.data(), chain_id_key.size()},
                    genesis.chain_id);
  storage_.commit_batch(genesis_state.entries(),
                        accredit::storage::committed_state{
                            .height = last_committed_height_,
                            .state_root = last_committed_state_root_});
  chain_id_ = genesis.chain_id;
  spdlog::info("Initialized genesis with owner {}", to_hex(*genesis.owner));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
    pending_state_root_ = committed->state_root;
  }
}

}  // namespace accredit::execution
