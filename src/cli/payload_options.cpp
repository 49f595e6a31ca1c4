#include <insure/cli/payload_options.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace po = boost::program_options;

namespace {

constexpr auto kStartDate = "start-date";
constexpr auto kEndDate = "end-date";

template <typename T>
std::optional<T> optional_value(const po::variables_map& vm,
                                const char* name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<T>();
}

std::optional<insure::schema::timestamp_nanoseconds_t> optional_timestamp(
    const po::variables_map& vm,
    const char* name) {
  auto value = optional_value<int64_t>(vm, name);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<insure::schema::timestamp_nanoseconds_t>(*value);
}

po::typed_value<int64_t>* timestamp_value(const char* name) {
  return po::value<int64_t>()->notifier([name](const int64_t value) {
    if (value < 0) {
      throw po::validation_error{po::validation_error::invalid_option_value,
                                 name, std::to_string(value)};
    }
  });
}

}  // namespace

namespace insure::cli {

po::options_description make_payload_options() {
  auto options = po::options_description{"Policy payload"};
  options.add_options()(
      "holder-name", po::value<std::string>(), "Policy holder name")(
      "coverage", po::value<double>(), "Coverage amount")(
      "premium", po::value<double>(), "Premium amount")(
      kStartDate, timestamp_value(kStartDate),
      "Policy start timestamp (nanoseconds, not negative)")(
      kEndDate, timestamp_value(kEndDate),
      "Policy end timestamp (nanoseconds, not negative)")(
      "claimed", po::value<bool>(), "Claim state carried by the payload");
  return options;
}

insure::schema::policy_payload_t make_payload(const po::variables_map& vm) {
  auto payload = insure::schema::policy_payload_t{};
  payload.policy_holder_name = optional_value<std::string>(vm, "holder-name");
  payload.coverage_amount = optional_value<double>(vm, "coverage");
  payload.premium_amount = optional_value<double>(vm, "premium");
  payload.policy_start_date = optional_timestamp(vm, kStartDate);
  payload.policy_end_date = optional_timestamp(vm, kEndDate);
  payload.is_claimed = optional_value<bool>(vm, "claimed");
  return payload;
}

}  // namespace insure::cli
