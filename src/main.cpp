#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <insure/cli/payload_options.hpp>
#include <insure/registry/registry.hpp>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using registry_t =
    insure::registry::registry<insure::storage::rocksdb_storage_tag>;

std::string describe(const insure::schema::policy_record_t& record) {
  return fmt::format(
      "id={} holder={} name=\"{}\" coverage={} premium={} start={} end={} "
      "claimed={} created_at={} updated_at={}",
      record.id, record.policy_holder, record.policy_holder_name,
      record.coverage_amount, record.premium_amount, record.policy_start_date,
      record.policy_end_date, record.is_claimed, record.created_at,
      record.updated_at ? std::to_string(*record.updated_at) : "none");
}

template <typename T>
int report_failure(const insure::schema::operation_result<T>& result) {
  std::cerr << result.log << std::endl;
  return static_cast<int>(result.code);
}

int print(const insure::schema::policy_result_t& result) {
  if (!result.ok()) {
    return report_failure(result);
  }
  std::cout << describe(*result.value) << std::endl;
  return 0;
}

int print(const insure::schema::policy_list_result_t& result) {
  if (!result.ok()) {
    return report_failure(result);
  }
  for (const auto& record : *result.value) {
    std::cout << describe(record) << std::endl;
  }
  return 0;
}

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "insure", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::from_str(level));
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto principal = std::string{};
  auto command = std::string{};
  auto id = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};

  auto generic = po::options_description{"Insure"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI-style file with any of the options below");

  auto settings = po::options_description{"Settings"};
  settings.add_options()(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("./insure-db"),
      "Policy database directory")(
      "principal,p", po::value<std::string>(&principal),
      "Identity of the calling principal")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&log_file)->default_value("insure.log"),
      "Log file path");

  auto operation = po::options_description{"Operation"};
  operation.add_options()(
      "command", po::value<std::string>(&command),
      "create, get, list, update, delete or claim")(
      "id", po::value<std::string>(&id), "Policy id");
  operation.add(insure::cli::make_payload_options());

  auto description = po::options_description{};
  description.add(generic).add(settings).add(operation);

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_file.empty()) {
      auto stream = std::ifstream{config_file};
      if (!stream) {
        std::cerr << "Cannot open config file " << config_file << std::endl;
        return 1;
      }
      auto file_options = po::options_description{};
      file_options.add(settings).add(operation);
      po::store(po::parse_config_file(stream, file_options), vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << description << std::endl;
    return 0;
  }
  if (principal.empty()) {
    std::cerr << "--principal is required" << std::endl;
    return 1;
  }

  configure_logging(log_level, log_file);

  auto encoder = insure::schema::encoding::scale_encoder_t{};
  auto storage =
      insure::storage::make_storage<insure::storage::rocksdb_storage_tag>(
          db_path);
  auto registry = registry_t{
      encoder, storage,
      insure::registry::collaborators{
          .now = insure::registry::make_system_time_source(),
          .caller = insure::registry::make_fixed_identity(principal),
          .next_id = insure::registry::make_uuid_generator()}};

  auto status = 0;
  if (command == "create") {
    status =
        print(registry.create_insurance_policy(insure::cli::make_payload(vm)));
  } else if (command == "get") {
    status = print(registry.get_insurance_policy(id));
  } else if (command == "list") {
    status = print(registry.get_all_insurance_policies());
  } else if (command == "update") {
    status = print(
        registry.update_insurance_policy(id, insure::cli::make_payload(vm)));
  } else if (command == "delete") {
    status = print(registry.delete_insurance_policy(id));
  } else if (command == "claim") {
    status = print(registry.file_claim(id));
  } else {
    spdlog::error("Unknown command '{}'", command);
    status = 1;
  }

  spdlog::shutdown();
  return status;
}
