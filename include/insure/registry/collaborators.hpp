#pragma once

#include <insure/schema/primitives.hpp>
#include <functional>
#include <string>

namespace insure::registry {

/// Current time in nanoseconds. Successive calls never go backwards.
using time_source_t = std::function<insure::schema::timestamp_nanoseconds_t()>;

/// Principal of the caller for the request being served.
using identity_provider_t = std::function<insure::schema::principal_t()>;

/// A fresh identifier per call, never repeated.
using id_generator_t = std::function<insure::schema::policy_id_t()>;

/// Host services the registry depends on. All three are synchronous and
/// cannot fail.
struct collaborators final {
  time_source_t now;
  identity_provider_t caller;
  id_generator_t next_id;
};

/// Wall-clock nanoseconds since the epoch, clamped so a backwards step of the
/// system clock repeats the last value instead of going back.
time_source_t make_system_time_source();

/// Random (version 4) UUIDs in canonical 36-character form.
id_generator_t make_uuid_generator();

identity_provider_t make_fixed_identity(insure::schema::principal_t principal);

}  // namespace insure::registry
