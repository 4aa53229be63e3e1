#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <provenance/common/critical.hpp>
#include <provenance/execution/record_service.hpp>
#include <provenance/storage/rocksdb/storage.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using service_t = provenance::execution::record_service<
    provenance::storage::rocksdb_storage_tag>;

void configure_logging(const std::string& log_file,
                       const std::string& log_level) {
  auto level = spdlog::level::from_str(log_level);
  if (level == spdlog::level::off && log_level != "off") {
    provenance::common::critical("unknown --log-level");
  }

  spdlog::init_thread_pool(8192, 1);
  // stdout carries command output, so console logging goes to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "provenance", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

std::string get_required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    provenance::common::critical(
        fmt::format("this command requires --{}", name));
  }
  return vm[name].as<std::string>();
}

std::string get_optional(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::string>();
}

// Stands in for the platform's transaction context: explicit values from the
// command line, otherwise a fresh id and the wall clock.
provenance::execution::transaction_context make_context(
    const po::variables_map& vm) {
  auto context = provenance::execution::transaction_context{};
  context.transaction_id = get_optional(vm, "tx-id");
  if (context.transaction_id.empty()) {
    context.transaction_id =
        boost::uuids::to_string(boost::uuids::random_generator()());
  }

  if (vm.contains("no-timestamp")) {
    return context;
  }
  if (vm.contains("tx-seconds")) {
    context.timestamp = provenance::execution::transaction_timestamp{
        .seconds = vm["tx-seconds"].as<int64_t>(),
        .nanos = vm["tx-nanos"].as<int64_t>()};
    return context;
  }

  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now);
  auto nanos =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now - seconds);
  context.timestamp = provenance::execution::transaction_timestamp{
      .seconds = seconds.count(), .nanos = nanos.count()};
  return context;
}

void print_record(const provenance::schema::product_record_t& record) {
  std::cout << fmt::format(
      "{}\n  name:        {}\n  status:      {}\n  owner:       {}\n"
      "  description: {}\n  category:    {}\n  created_at:  {}\n"
      "  updated_at:  {}\n",
      record.id, record.name, record.status, record.owner, record.description,
      record.category, record.created_at, record.updated_at);
}

template <typename Result>
int report_failure(const Result& result) {
  auto code = static_cast<provenance::schema::record_error_code>(result.code);
  std::cerr << fmt::format("{} ({}, {}): {}\n", result.log, result.codespace,
                           provenance::schema::to_string(code), result.info);
  return static_cast<int>(result.code);
}

int report(const provenance::schema::transaction_result_t& result) {
  if (result.code != 0) {
    return report_failure(result);
  }
  for (const auto& event : result.events) {
    std::cout << event.type;
    for (const auto& attribute : event.attributes) {
      std::cout << ' ' << attribute.key << '=' << attribute.value;
    }
    std::cout << '\n';
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  provenance seed\n"
            << "  provenance create --id ID --name NAME --owner OWNER "
               "[--description D] [--category C]\n"
            << "  provenance exists --id ID\n"
            << "  provenance query --id ID\n"
            << "  provenance update --id ID [--status S] [--owner O] "
               "[--description D] [--category C]\n"
            << "  provenance transfer --id ID --owner OWNER\n"
            << "  provenance list\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};

  auto options = po::options_description{"provenance options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "seed|create|exists|query|update|transfer|list")(
      "db-path", po::value<std::string>(&db_path)->default_value("provenance-db"),
      "world state RocksDB directory")(
      "tx-id", po::value<std::string>(), "transaction id (default: random)")(
      "tx-seconds", po::value<int64_t>(),
      "transaction timestamp seconds since epoch (default: now)")(
      "tx-nanos", po::value<int64_t>()->default_value(0),
      "transaction timestamp nanoseconds")(
      "no-timestamp", "invoke without a transaction timestamp")(
      "id", po::value<std::string>(), "product id")(
      "name", po::value<std::string>(), "product name")(
      "owner", po::value<std::string>(), "product owner")(
      "status", po::value<std::string>(), "product status")(
      "description", po::value<std::string>(), "product description")(
      "category", po::value<std::string>(), "product category")(
      "log-file", po::value<std::string>(&log_file)->default_value("provenance.log"),
      "log file path")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|err|critical|off")(
      "verbose,v", "shorthand for --log-level debug");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (vm.contains("verbose")) {
    log_level = "debug";
  }
  configure_logging(log_file, log_level);

  auto encoder = provenance::execution::scale_encoder_t{};
  auto storage =
      provenance::storage::make_storage<provenance::storage::rocksdb_storage_tag>(
          db_path);
  auto service = service_t{encoder, storage};
  auto exit_code = 0;

  if (command == "seed") {
    exit_code = report(service.seed_initial_records(make_context(vm)));
  } else if (command == "create") {
    exit_code = report(service.create(
        make_context(vm), get_required(vm, "id"), get_required(vm, "name"),
        get_required(vm, "owner"), get_optional(vm, "description"),
        get_optional(vm, "category")));
  } else if (command == "update") {
    exit_code = report(service.update(
        make_context(vm), get_required(vm, "id"), get_optional(vm, "status"),
        get_optional(vm, "owner"), get_optional(vm, "description"),
        get_optional(vm, "category")));
  } else if (command == "transfer") {
    exit_code = report(service.transfer_ownership(
        make_context(vm), get_required(vm, "id"), get_required(vm, "owner")));
  } else if (command == "exists") {
    auto result = service.exists(get_required(vm, "id"));
    if (result.code != 0) {
      exit_code = report_failure(result);
    } else {
      auto present = encoder.decode<bool>(
          provenance::schema::make_bytes_view(result.value));
      std::cout << (present ? "true" : "false") << '\n';
    }
  } else if (command == "query") {
    auto result = service.query(get_required(vm, "id"));
    if (result.code != 0) {
      exit_code = report_failure(result);
    } else {
      print_record(encoder.decode<provenance::schema::product_record_t>(
          provenance::schema::make_bytes_view(result.value)));
    }
  } else if (command == "list") {
    auto result = service.list_all();
    if (result.code != 0) {
      exit_code = report_failure(result);
    } else {
      auto records =
          encoder.decode<std::vector<provenance::schema::product_record_t>>(
              provenance::schema::make_bytes_view(result.value));
      for (const auto& record : records) {
        print_record(record);
      }
    }
  } else {
    provenance::common::critical(
        "command must be seed|create|exists|query|update|transfer|list");
  }

  spdlog::shutdown();
  return exit_code;
}
