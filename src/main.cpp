#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <boost/program_options.hpp>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <tally/archive/node.hpp>
#include <tally/execution/engine.hpp>
#include <tally/rpc/archive_client.hpp>
#include <tally/rpc/archive_service.hpp>
#include <tally/rpc/ledger_service.hpp>
#include <thread>
#include <vector>

namespace po = boost::program_options;

namespace {

constexpr auto kNanosecondsPerSecond = uint64_t{1'000'000'000};

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

void setup_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "tallyd", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<tally::schema::amount_t> read_amount(const po::variables_map& vm,
                                                   const std::string& name) {
  auto amount = tally::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    spdlog::error("--{} is not an unsigned decimal amount", name);
  }
  return amount;
}

std::optional<tally::schema::ledger_config_t> make_ledger_config(
    const po::variables_map& vm) {
  auto config = tally::schema::ledger_config_t{};

  if (!vm.contains("minting-account")) {
    spdlog::error("--minting-account is required for the ledger role");
    return std::nullopt;
  }
  auto minting = tally::schema::try_parse_account(
      vm["minting-account"].as<std::string>());
  if (!minting) {
    spdlog::error("--minting-account must be owner_hex[.subaccount_hex]");
    return std::nullopt;
  }
  config.minting_account = std::move(*minting);

  auto fee = read_amount(vm, "transfer-fee");
  auto min_burn = read_amount(vm, "min-burn-amount");
  if (!fee || !min_burn) {
    return std::nullopt;
  }
  config.transfer_fee = *fee;
  config.min_burn_amount = *min_burn;
  if (vm.contains("max-supply")) {
    auto max_supply = read_amount(vm, "max-supply");
    if (!max_supply) {
      return std::nullopt;
    }
    config.max_supply = *max_supply;
  }

  config.transaction_window =
      vm["transaction-window-seconds"].as<uint64_t>() * kNanosecondsPerSecond;
  config.permitted_drift =
      vm["permitted-drift-seconds"].as<uint64_t>() * kNanosecondsPerSecond;
  config.max_memo_size = vm["max-memo-size"].as<uint64_t>();

  if (vm.contains("genesis")) {
    for (const auto& entry : vm["genesis"].as<std::vector<std::string>>()) {
      auto balance = tally::schema::try_parse_genesis_balance(entry);
      if (!balance) {
        spdlog::error("--genesis '{}' must be account=amount", entry);
        return std::nullopt;
      }
      config.genesis_balances.push_back(std::move(*balance));
    }
  }

  config.archive.max_log_size = vm["max-log-size"].as<uint64_t>();
  config.archive.max_archive_query_length =
      vm["max-archive-query-length"].as<uint64_t>();
  config.archive.provisioning_cost = vm["provisioning-cost"].as<uint64_t>();
  config.archive.resource_budget = vm["resource-budget"].as<uint64_t>();
  config.archive.max_retry_backoff = vm["max-retry-backoff"].as<uint64_t>();
  config.archive.failure_alert_threshold =
      vm["failure-alert-threshold"].as<uint64_t>();
  return config;
}

tally::archive::node_options make_node_options(const po::variables_map& vm) {
  return tally::archive::node_options{
      .path = vm["archive-path"].as<std::string>(),
      .max_memory = vm["archive-max-memory"].as<uint64_t>(),
      .max_query_length = vm["max-archive-query-length"].as<uint64_t>()};
}

std::optional<std::string> read_file(const std::string& path) {
  auto file = std::ifstream{path, std::ios::binary};
  if (!file) {
    spdlog::error("Cannot read {}", path);
    return std::nullopt;
  }
  return std::string{std::istreambuf_iterator<char>{file},
                     std::istreambuf_iterator<char>{}};
}

/// Mutual TLS when `--tls-cert`, `--tls-key` and `--tls-client-ca` are set.
/// The ledger needs it: write calls take their caller from the verified
/// client certificate.
std::shared_ptr<grpc::ServerCredentials> make_server_credentials(
    const po::variables_map& vm,
    const bool required) {
  if (!vm.contains("tls-cert") || !vm.contains("tls-key") ||
      !vm.contains("tls-client-ca")) {
    if (required) {
      spdlog::error(
          "--tls-cert, --tls-key and --tls-client-ca are required for the "
          "ledger role");
      return nullptr;
    }
    spdlog::warn("Serving without TLS");
    return grpc::InsecureServerCredentials();
  }
  auto certificate = read_file(vm["tls-cert"].as<std::string>());
  auto private_key = read_file(vm["tls-key"].as<std::string>());
  auto client_ca = read_file(vm["tls-client-ca"].as<std::string>());
  if (!certificate || !private_key || !client_ca) {
    return nullptr;
  }
  auto options = grpc::SslServerCredentialsOptions{
      GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY};
  options.pem_root_certs = std::move(*client_ca);
  options.pem_key_cert_pairs.push_back(
      grpc::SslServerCredentialsOptions::PemKeyCertPair{
          .private_key = std::move(*private_key),
          .cert_chain = std::move(*certificate)});
  return grpc::SslServerCredentials(options);
}

std::shared_ptr<grpc::ChannelCredentials> make_archive_credentials(
    const po::variables_map& vm) {
  if (!vm.contains("archive-ca")) {
    return grpc::InsecureChannelCredentials();
  }
  auto root = read_file(vm["archive-ca"].as<std::string>());
  auto certificate = read_file(vm["tls-cert"].as<std::string>());
  auto private_key = read_file(vm["tls-key"].as<std::string>());
  if (!root || !certificate || !private_key) {
    return nullptr;
  }
  auto options = grpc::SslCredentialsOptions{};
  options.pem_root_certs = std::move(*root);
  options.pem_cert_chain = std::move(*certificate);
  options.pem_private_key = std::move(*private_key);
  return grpc::SslCredentials(options);
}

std::optional<tally::archive::provisioner_t> make_provisioner(
    const po::variables_map& vm) {
  auto deadline =
      std::chrono::milliseconds{vm["archive-deadline-ms"].as<uint64_t>()};
  if (vm.contains("archive-endpoint")) {
    auto credentials = make_archive_credentials(vm);
    if (!credentials) {
      return std::nullopt;
    }
    return tally::rpc::make_remote_provisioner(
        vm["archive-endpoint"].as<std::string>(), std::move(credentials),
        deadline);
  }
  return [options = make_node_options(vm)]()
             -> std::shared_ptr<tally::archive::endpoint> {
    return std::make_shared<tally::archive::node>(options);
  };
}

void serve(const std::string& listen,
           std::shared_ptr<grpc::ServerCredentials> credentials,
           grpc::Service& service) {
  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(listen, std::move(credentials));
  grpc_builder.RegisterService(&service);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", listen);
    return;
  }
  spdlog::info("gRPC service listening on {}", listen);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto defaults = tally::schema::ledger_config_t{};

  auto general = po::options_description{"General"};
  general.add_options()("help,h", "Show the help message")(
      "verbose,v", "Enable debug logging")(
      "config,c", po::value<std::string>(),
      "INI style file with any of the options below")(
      "role", po::value<std::string>()->default_value("ledger"),
      "ledger or archive")(
      "listen,l", po::value<std::string>()->default_value("0.0.0.0:50051"),
      "IP:Port for the gRPC server")(
      "log-file", po::value<std::string>()->default_value("tallyd.log"),
      "Log file path")(
      "tls-cert", po::value<std::string>(),
      "PEM certificate chain served to peers")(
      "tls-key", po::value<std::string>(), "PEM private key of --tls-cert")(
      "tls-client-ca", po::value<std::string>(),
      "PEM roots that client certificates must chain to");

  auto ledger = po::options_description{"Ledger"};
  ledger.add_options()("minting-account", po::value<std::string>(),
                       "owner_hex[.subaccount_hex] allowed to mint")(
      "transfer-fee", po::value<std::string>()->default_value("0"),
      "Fee charged and burned on every transfer")(
      "min-burn-amount", po::value<std::string>()->default_value("0"),
      "Smallest amount a burn may destroy")(
      "max-supply", po::value<std::string>(),
      "Supply cap; unbounded when omitted")(
      "genesis", po::value<std::vector<std::string>>()->composing(),
      "Initial balance as account=amount; repeatable")(
      "transaction-window-seconds",
      po::value<uint64_t>()->default_value(defaults.transaction_window /
                                           kNanosecondsPerSecond),
      "How long created_at_time stays valid")(
      "permitted-drift-seconds",
      po::value<uint64_t>()->default_value(defaults.permitted_drift /
                                           kNanosecondsPerSecond),
      "Tolerated clock skew for created_at_time")(
      "max-memo-size",
      po::value<uint64_t>()->default_value(defaults.max_memo_size),
      "Largest memo in bytes");

  auto archive = po::options_description{"Archive"};
  archive.add_options()(
      "max-log-size",
      po::value<uint64_t>()->default_value(defaults.archive.max_log_size),
      "Live log capacity that triggers migration")(
      "max-archive-query-length",
      po::value<uint64_t>()->default_value(
          defaults.archive.max_archive_query_length),
      "Entries per archive range request")(
      "provisioning-cost",
      po::value<uint64_t>()->default_value(defaults.archive.provisioning_cost),
      "Budget units spent creating an archive")(
      "resource-budget",
      po::value<uint64_t>()->default_value(defaults.archive.resource_budget),
      "Budget units available for provisioning")(
      "max-retry-backoff",
      po::value<uint64_t>()->default_value(defaults.archive.max_retry_backoff),
      "Cap, in commits, on the wait between failed migrations")(
      "failure-alert-threshold",
      po::value<uint64_t>()->default_value(
          defaults.archive.failure_alert_threshold),
      "Consecutive failures before logging at error level")(
      "archive-endpoint", po::value<std::string>(),
      "host:port of a remote archive node; in-process when omitted")(
      "archive-path", po::value<std::string>()->default_value("tally-archive"),
      "RocksDB directory of the archive node")(
      "archive-max-memory",
      po::value<uint64_t>()->default_value(tally::archive::kDefaultArchiveMaxMemory),
      "Archive capacity in bytes")(
      "archive-ca", po::value<std::string>(),
      "PEM roots of the remote archive node; plaintext when omitted. The "
      "ledger presents --tls-cert as its client certificate")(
      "archive-deadline-ms",
      po::value<uint64_t>()->default_value(static_cast<uint64_t>(
          tally::rpc::kDefaultArchiveDeadline.count())),
      "Deadline of each remote archive call");

  auto description = po::options_description{"tallyd"};
  description.add(general).add(ledger).add(archive);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        std::cerr << "Cannot open config file " << path << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << "\n" << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  setup_logging(vm["log-file"].as<std::string>(), vm.contains("verbose"));

  auto role = vm["role"].as<std::string>();
  auto listen = vm["listen"].as<std::string>();
  auto status = 0;

  if (role == "archive") {
    auto credentials = make_server_credentials(vm, false);
    if (credentials) {
      auto node = std::make_shared<tally::archive::node>(make_node_options(vm));
      auto service = tally::rpc::archive_service{node};
      serve(listen, std::move(credentials), service);
    } else {
      status = 1;
    }
  } else if (role == "ledger") {
    auto config = make_ledger_config(vm);
    auto credentials = make_server_credentials(vm, true);
    auto provisioner = make_provisioner(vm);
    if (config && credentials && provisioner) {
      auto engine =
          tally::execution::engine{std::move(*config), std::move(*provisioner)};
      auto service = tally::rpc::ledger_service{engine};
      serve(listen, std::move(credentials), service);
    } else {
      status = 1;
    }
  } else {
    spdlog::error("Unknown role '{}'; expected ledger or archive", role);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
