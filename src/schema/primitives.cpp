#include <insure/schema/primitives.hpp>

#include <iterator>

namespace insure::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

bytes_t make_key(const std::string_view& prefix,
                 const std::string_view& suffix) {
  auto key = bytes_t{};
  key.reserve(prefix.size() + suffix.size());
  key.insert(std::end(key), std::begin(prefix), std::end(prefix));
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

}  // namespace insure::schema
