#include <insure/registry/collaborators.hpp>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <utility>

namespace insure::registry {

time_source_t make_system_time_source() {
  auto last = std::make_shared<std::atomic<uint64_t>>(0);
  return [last]() {
    const auto now = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
    auto previous = last->load();
    auto next = std::max(previous, now);
    while (!last->compare_exchange_weak(previous, next)) {
      next = std::max(previous, now);
    }
    return next;
  };
}

id_generator_t make_uuid_generator() {
  // random_generator is not thread safe.
  auto mutex = std::make_shared<std::mutex>();
  auto generator = std::make_shared<boost::uuids::random_generator>();
  return [mutex, generator]() {
    auto lock = std::scoped_lock{*mutex};
    return boost::uuids::to_string((*generator)());
  };
}

identity_provider_t make_fixed_identity(insure::schema::principal_t principal) {
  return [principal = std::move(principal)]() { return principal; };
}

}  // namespace insure::registry
