#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

/// One atomic unit of work. Every put and delete lands, or none do.
struct write_batch_t final {
  std::vector<key_value_entry_t> puts;
  std::vector<warden::schema::bytes_t> deletes;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value);

  bool contains(const warden::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix, in key
  /// order.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;

  /// Apply the batch atomically.
  void commit(const write_batch_t& batch);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
