#pragma once

#include <insure/registry/collaborators.hpp>
#include <insure/schema/encoding/scale/encoder.hpp>
#include <insure/schema/operation_result.hpp>
#include <insure/schema/policy_payload.hpp>
#include <insure/schema/policy_record.hpp>
#include <insure/storage/memory/storage.hpp>
#include <insure/storage/policy_store.hpp>
#include <insure/storage/rocksdb/storage.hpp>
#include <mutex>
#include <string_view>

namespace insure::registry {

inline constexpr auto kRegistryCodespace = std::string_view{"insure.registry"};

/// Life-insurance policy registry.
///
/// Validates payloads, enforces ownership and the one-way claim transition,
/// and drives every mutation of the policy store. Each operation runs under
/// the registry lock from lookup to write, so two operations never interleave
/// on the same key. Failures are reported in the result envelope and leave
/// the store untouched.
template <typename Library>
class registry final {
 public:
  /// Construct the registry over caller-owned encoder and storage.
  ///
  /// `services` supplies the clock, the caller identity and fresh policy ids.
  /// All three must be set; a missing one is fatal here rather than on the
  /// first operation that needs it.
  registry(insure::schema::encoding::scale_encoder_t& encoder,
           insure::storage::storage<Library>& storage,
           collaborators services);

  /// Create a policy owned by the caller.
  ///
  /// The id comes from the id generator and `policy_holder` from the caller
  /// identity; a payload-supplied holder is ignored.
  insure::schema::policy_result_t create_insurance_policy(
      const insure::schema::policy_payload_t& payload);

  insure::schema::policy_result_t get_insurance_policy(std::string_view id);

  /// Every policy whose holder is the caller. Never fails.
  insure::schema::policy_list_result_t get_all_insurance_policies();

  /// Overwrite the payload fields of an existing policy.
  ///
  /// `id`, `created_at` and `policy_holder` are kept; a filed claim is never
  /// reverted.
  insure::schema::policy_result_t update_insurance_policy(
      std::string_view id,
      const insure::schema::policy_payload_t& payload);

  /// Remove a policy and return it as it was stored.
  insure::schema::policy_result_t delete_insurance_policy(std::string_view id);

  /// Mark an unclaimed policy as claimed. A second claim is a conflict.
  insure::schema::policy_result_t file_claim(std::string_view id);

 private:
  mutable std::mutex mutex_;
  insure::storage::policy_store<Library> store_;
  collaborators services_;
};

extern template class registry<insure::storage::rocksdb_storage_tag>;
extern template class registry<insure::storage::memory_storage_tag>;

}  // namespace insure::registry
