#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <insure/common/critical.hpp>
#include <insure/registry/registry.hpp>
#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

using namespace insure::schema;

namespace {

template <typename T>
operation_result<T> make_failure(const registry_error_code code,
                                 std::string log) {
  auto result = operation_result<T>{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.codespace = std::string{insure::registry::kRegistryCodespace};
  return result;
}

template <typename T>
operation_result<T> make_success(T value) {
  auto result = operation_result<T>{};
  result.codespace = std::string{insure::registry::kRegistryCodespace};
  result.value = std::move(value);
  return result;
}

policy_result_t invalid_id() {
  return make_failure<policy_record_t>(registry_error_code::validation,
                                       "Invalid ID format.");
}

policy_result_t missing_field(const std::string_view field) {
  return make_failure<policy_record_t>(
      registry_error_code::validation,
      fmt::format("Missing required field: {}.", field));
}

policy_result_t policy_not_found(const std::string_view id) {
  return make_failure<policy_record_t>(
      registry_error_code::not_found,
      fmt::format("Insurance Policy with ID={} not found.", id));
}

/// Copy the payload fields over record. Callers validate the payload first.
void apply_payload(policy_record_t& record, const policy_payload_t& payload) {
  record.policy_holder_name = *payload.policy_holder_name;
  record.coverage_amount = *payload.coverage_amount;
  record.premium_amount = *payload.premium_amount;
  record.policy_start_date = *payload.policy_start_date;
  record.policy_end_date = *payload.policy_end_date;
  record.is_claimed = record.is_claimed || *payload.is_claimed;
}

}  // namespace

namespace insure::registry {

template <typename Library>
registry<Library>::registry(insure::schema::encoding::scale_encoder_t& encoder,
                            insure::storage::storage<Library>& storage,
                            collaborators services)
    : store_{encoder, storage}, services_{std::move(services)} {
  if (!services_.now) {
    insure::common::critical("Policy registry needs a time source");
  }
  if (!services_.caller) {
    insure::common::critical("Policy registry needs an identity provider");
  }
  if (!services_.next_id) {
    insure::common::critical("Policy registry needs an id generator");
  }
  spdlog::debug("Policy registry ready");
}

template <typename Library>
policy_result_t registry<Library>::create_insurance_policy(
    const policy_payload_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  if (auto field = first_missing_field(payload)) {
    spdlog::warn("Rejected policy creation: missing field {}", *field);
    return missing_field(*field);
  }

  auto caller = services_.caller();
  if (payload.policy_holder && *payload.policy_holder != caller) {
    spdlog::debug("Ignoring payload policy holder '{}' in favour of caller '{}'",
                  *payload.policy_holder, caller);
  }

  auto record = policy_record_t{};
  record.id = services_.next_id();
  record.policy_holder = std::move(caller);
  record.created_at = services_.now();
  record.updated_at = std::nullopt;
  apply_payload(record, payload);

  store_.insert(record.id, record);
  spdlog::info("Created insurance policy {} for {}", record.id,
               record.policy_holder);
  return make_success(std::move(record));
}

template <typename Library>
policy_result_t registry<Library>::get_insurance_policy(std::string_view id) {
  auto lock = std::scoped_lock{mutex_};
  if (id.empty()) {
    return invalid_id();
  }
  auto policy = store_.get(id);
  if (!policy) {
    spdlog::debug("Insurance policy {} not found", id);
    return policy_not_found(id);
  }
  return make_success(std::move(*policy));
}

template <typename Library>
policy_list_result_t registry<Library>::get_all_insurance_policies() {
  auto lock = std::scoped_lock{mutex_};
  const auto caller = services_.caller();
  auto policies = store_.list_all();
  std::erase_if(policies, [&](const policy_record_t& policy) {
    return policy.policy_holder != caller;
  });
  spdlog::debug("Listed {} insurance policies for {}", policies.size(),
                caller);
  return make_success(std::move(policies));
}

template <typename Library>
policy_result_t registry<Library>::update_insurance_policy(
    std::string_view id,
    const policy_payload_t& payload) {
  auto lock = std::scoped_lock{mutex_};
  if (id.empty()) {
    return invalid_id();
  }
  if (auto field = first_missing_field(payload)) {
    spdlog::warn("Rejected update of policy {}: missing field {}", id, *field);
    return missing_field(*field);
  }

  auto existing = store_.get(id);
  if (!existing) {
    spdlog::warn("Rejected update of unknown policy {}", id);
    return policy_not_found(id);
  }
  if (existing->is_claimed && !*payload.is_claimed) {
    spdlog::debug("Keeping filed claim on policy {} despite update payload",
                  id);
  }

  auto updated = std::move(*existing);
  apply_payload(updated, payload);
  updated.updated_at = services_.now();

  store_.insert(updated.id, updated);
  spdlog::info("Updated insurance policy {}", updated.id);
  return make_success(std::move(updated));
}

template <typename Library>
policy_result_t registry<Library>::delete_insurance_policy(
    std::string_view id) {
  auto lock = std::scoped_lock{mutex_};
  if (id.empty()) {
    return invalid_id();
  }
  auto removed = store_.remove(id);
  if (!removed) {
    spdlog::warn("Rejected delete of unknown policy {}", id);
    return policy_not_found(id);
  }
  spdlog::info("Deleted insurance policy {}", removed->id);
  return make_success(std::move(*removed));
}

template <typename Library>
policy_result_t registry<Library>::file_claim(std::string_view id) {
  auto lock = std::scoped_lock{mutex_};
  if (id.empty()) {
    return invalid_id();
  }
  auto policy = store_.get(id);
  if (!policy) {
    spdlog::warn("Rejected claim on unknown policy {}", id);
    return policy_not_found(id);
  }
  if (policy->is_claimed) {
    spdlog::warn("Rejected duplicate claim on policy {}", id);
    return make_failure<policy_record_t>(
        registry_error_code::conflict,
        fmt::format("Claim for Insurance Policy with ID={} has already been "
                    "filed.",
                    id));
  }

  policy->is_claimed = true;
  policy->updated_at = services_.now();
  store_.insert(policy->id, *policy);
  spdlog::info("Filed claim on insurance policy {}", policy->id);
  return make_success(std::move(*policy));
}

template class registry<insure::storage::rocksdb_storage_tag>;
template class registry<insure::storage::memory_storage_tag>;

}  // namespace insure::registry
