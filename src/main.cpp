#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <accredit/blake3/hash.hpp>
#include <accredit/execution/engine.hpp>
#include <accredit/schema/encoding/scale/encoder.hpp>
#include <accredit/storage/rocksdb/storage.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <tuple>

namespace po = boost::program_options;
using namespace accredit::schema;

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

// A 64 character hex chain id is used as is; any other label is hashed.
hash32_t parse_chain_id(const std::string& value) {
  if (auto chain_id = try_make_hash32(value)) {
    return *chain_id;
  }
  return accredit::blake3::hash(std::string_view{value});
}

std::optional<account_id_t> parse_account(const po::variables_map& vm,
                                          const std::string& option) {
  if (!vm.contains(option)) {
    spdlog::error("--{} is required", option);
    return std::nullopt;
  }
  auto account = try_make_hash32(vm[option].as<std::string>());
  if (!account) {
    spdlog::error("--{} must be 32 bytes of hex", option);
  }
  return account;
}

std::string describe_event(const event_record_t& record) {
  auto body = std::visit(
      overloaded{
          [](const certificate_issued_t& event) {
            return "id=" + std::to_string(event.certificate_id) +
                   " recipient=" + to_hex(event.recipient) + " course=\"" +
                   event.course + "\" issuer=" + to_hex(event.issuer);
          },
          [](const issuer_approved_t& event) {
            return "issuer=" + to_hex(event.issuer);
          },
          [](const issuer_revoked_t& event) {
            return "issuer=" + to_hex(event.issuer);
          },
          [](const ownership_transferred_t& event) {
            return "previous_owner=" + to_hex(event.previous_owner) +
                   " new_owner=" + to_hex(event.new_owner);
          }},
      record.event);
  return "#" + std::to_string(record.event_id) + " height=" +
         std::to_string(record.height) + " " +
         std::string{to_string(event_type(record.event))} + " " + body;
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

int submit(accredit::execution::engine& engine,
           encoder_t& encoder,
           const account_id_t& signer,
           transaction_payload_t payload) {
  auto tx = transaction_t{
      .chain_id = engine.chain_id(), .signer = signer, .payload = payload};
  auto raw_tx = encoder.encode(tx);

  auto admission =
      engine.check_transaction(bytes_view_t{raw_tx.data(), raw_tx.size()});
  if (admission.code != 0) {
    spdlog::error("Transaction rejected: {} ({})", admission.log,
                  admission.code);
    return 1;
  }

  auto height = static_cast<uint64_t>(engine.info().last_block_height) + 1;
  auto block = engine.finalize_block(height, now_milliseconds(), {raw_tx});
  auto committed = engine.commit();

  const auto& result = block.tx_results.front();
  if (result.code != 0) {
    std::cout << "failed: " << result.log << " (" << result.codespace << "/"
              << result.code << ")" << std::endl;
    return 1;
  }
  std::cout << result.info;
  if (!result.data.empty()) {
    std::cout << " id=" << encoder.decode<certificate_id_t>(result.data);
  }
  std::cout << " height=" << committed.committed_height
            << " state_root=" << to_hex(committed.state_root) << std::endl;
  return 0;
}

std::optional<bytes_t> run_query(accredit::execution::engine& engine,
                                 const std::string_view path,
                                 const bytes_t& data) {
  auto result = engine.query(path, bytes_view_t{data.data(), data.size()});
  if (result.code != 0) {
    std::cout << path << ": " << result.log << std::endl;
    return std::nullopt;
  }
  return result.value;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("accredit.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "accredit", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);

  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto config_path = std::string{};

  auto description = po::options_description{"Accredit"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file carrying any of the options below")(
      "db,d", po::value<std::string>(&db_path)->default_value("accredit.db"),
      "RocksDB directory")(
      "chain-id", po::value<std::string>(&chain_id)->default_value("accredit"),
      "Chain id as 64 hex characters, or a label to hash")(
      "owner", po::value<std::string>(),
      "Owning authority written at genesis (hex account)")(
      "signer,s", po::value<std::string>(),
      "Identity submitting the operation (hex account)")(
      "verbose,v", "Enable verbose output");

  auto operations = po::options_description{"Operations"};
  operations.add_options()("approve-issuer", po::value<std::string>(),
                           "Authorize an issuer")(
      "revoke-issuer", po::value<std::string>(), "Revoke an issuer")(
      "transfer-ownership", po::value<std::string>(),
      "Hand the registry to a new owner")(
      "issue", "Issue a certificate (needs --recipient and --course)")(
      "recipient", po::value<std::string>(), "Certificate recipient")(
      "course", po::value<std::string>(), "Course name")(
      "verify", po::value<certificate_id_t>(), "Look up a certificate by id")(
      "is-issuer", po::value<std::string>(), "Check issuer authorization")(
      "owner-of", po::value<certificate_id_t>(), "Token owner of a certificate")(
      "balance-of", po::value<std::string>(), "Certificates held by an account")(
      "events", po::value<uint64_t>(), "Replay notifications from an id")(
      "info", "Show the last committed height and state root");
  description.add(operations);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(
                    vm["config"].as<std::string>().c_str(), description),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    spdlog::error("Invalid options: {}", e.what());
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto genesis = accredit::execution::genesis_config{
      .chain_id = parse_chain_id(chain_id)};
  if (vm.contains("owner")) {
    genesis.owner = parse_account(vm, "owner");
    if (!genesis.owner) {
      spdlog::shutdown();
      return 1;
    }
  }

  auto encoder = encoder_t{};
  auto storage = accredit::storage::make_storage<
      accredit::storage::rocksdb_storage_tag>(db_path);
  auto engine = accredit::execution::engine{encoder, storage, genesis};
  engine.set_event_listener([](const event_record_t& record) {
    std::cout << "event " << describe_event(record) << std::endl;
  });

  auto status = 0;
  auto with_signer = [&](const auto& make_payload) {
    auto signer = parse_account(vm, "signer");
    if (!signer) {
      return 1;
    }
    auto payload = make_payload();
    if (!payload) {
      return 1;
    }
    return submit(engine, encoder, *signer, *payload);
  };
  auto account_payload = [&](const std::string& option, auto wrap) {
    return [&, option, wrap]() -> std::optional<transaction_payload_t> {
      auto account = parse_account(vm, option);
      if (!account) {
        return std::nullopt;
      }
      return transaction_payload_t{wrap(*account)};
    };
  };

  if (vm.contains("approve-issuer")) {
    status = with_signer(account_payload("approve-issuer", [](auto account) {
      return approve_issuer_t{.issuer = account};
    }));
  } else if (vm.contains("revoke-issuer")) {
    status = with_signer(account_payload("revoke-issuer", [](auto account) {
      return revoke_issuer_t{.issuer = account};
    }));
  } else if (vm.contains("transfer-ownership")) {
    status =
        with_signer(account_payload("transfer-ownership", [](auto account) {
          return transfer_ownership_t{.new_owner = account};
        }));
  } else if (vm.contains("issue")) {
    status = with_signer([&]() -> std::optional<transaction_payload_t> {
      auto recipient = parse_account(vm, "recipient");
      if (!recipient) {
        return std::nullopt;
      }
      auto course = vm.contains("course") ? vm["course"].as<std::string>()
                                          : std::string{};
      return transaction_payload_t{
          issue_certificate_t{.recipient = *recipient, .course = course}};
    });
  } else if (vm.contains("verify")) {
    auto value = run_query(engine, "/certificate",
                           encoder.encode(vm["verify"].as<certificate_id_t>()));
    if (value) {
      auto certificate = encoder.decode<certificate_t>(*value);
      std::cout << "recipient=" << to_hex(certificate.recipient)
                << " course=\"" << certificate.course
                << "\" issuer=" << to_hex(certificate.issuer)
                << " issue_date=" << certificate.issue_date << std::endl;
    } else {
      status = 1;
    }
  } else if (vm.contains("is-issuer")) {
    auto issuer = parse_account(vm, "is-issuer");
    auto value = issuer ? run_query(engine, "/issuer", encoder.encode(*issuer))
                        : std::nullopt;
    if (value) {
      std::cout << std::boolalpha << encoder.decode<bool>(*value) << std::endl;
    } else {
      status = 1;
    }
  } else if (vm.contains("owner-of")) {
    auto value =
        run_query(engine, "/token/owner",
                  encoder.encode(vm["owner-of"].as<certificate_id_t>()));
    if (value) {
      std::cout << to_hex(encoder.decode<account_id_t>(*value)) << std::endl;
    } else {
      status = 1;
    }
  } else if (vm.contains("balance-of")) {
    auto account = parse_account(vm, "balance-of");
    auto value = account ? run_query(engine, "/token/balance",
                                     encoder.encode(*account))
                         : std::nullopt;
    if (value) {
      std::cout << encoder.decode<uint64_t>(*value) << std::endl;
    } else {
      status = 1;
    }
  } else if (vm.contains("events")) {
    auto from_id = vm["events"].as<uint64_t>();
    auto records = engine.events(
        from_id, accredit::execution::max_event_range_end(from_id));
    for (const auto& record : records) {
      std::cout << describe_event(record) << std::endl;
    }
  } else {
    auto info = engine.info();
    std::cout << info.data << " " << info.app_version
              << " height=" << info.last_block_height
              << " state_root=" << to_hex(info.last_block_state_root)
              << " chain_id=" << to_hex(engine.chain_id()) << std::endl;
  }

  spdlog::shutdown();
  return status;
}
