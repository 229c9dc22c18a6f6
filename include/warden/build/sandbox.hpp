#pragma once

#include <warden/schema/outcome.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

namespace warden::build {

class sandbox_pool;

/// Single-use build environment: a freshly created directory tree with a
/// `workspace/` and an `output/` directory. The tree is destroyed when the
/// lease is released or goes out of scope, whatever the attempt's outcome.
class sandbox_lease final {
 public:
  sandbox_lease(const sandbox_lease&) = delete;
  sandbox_lease& operator=(const sandbox_lease&) = delete;
  sandbox_lease(sandbox_lease&& other) noexcept;
  sandbox_lease& operator=(sandbox_lease&& other) noexcept;
  ~sandbox_lease();

  const warden::schema::hash32_t& id() const { return id_; }
  const std::string& builder_id() const { return builder_id_; }
  const std::filesystem::path& root() const { return root_; }
  std::filesystem::path workspace() const { return root_ / "workspace"; }
  std::filesystem::path output() const { return root_ / "output"; }
  bool active() const { return pool_ != nullptr; }

  /// Tear down now. Idempotent.
  void release() noexcept;

 private:
  friend class sandbox_pool;
  sandbox_lease(sandbox_pool* pool,
                warden::schema::hash32_t id,
                std::string builder_id,
                std::filesystem::path root);

  sandbox_pool* pool_{nullptr};
  warden::schema::hash32_t id_{};
  std::string builder_id_;
  std::filesystem::path root_;
};

/// Provisions sandboxes under a root directory. Never hands out the same
/// sandbox twice; the pool must outlive its leases.
class sandbox_pool final {
 public:
  explicit sandbox_pool(std::filesystem::path root);

  warden::schema::outcome<sandbox_lease> provision(
      const std::string& builder_id);

  /// Leases currently alive.
  std::size_t live() const;
  /// Leases handed out since construction.
  uint64_t provisioned() const;

 private:
  friend class sandbox_lease;
  void teardown(const std::filesystem::path& root) noexcept;

  std::filesystem::path root_;
  mutable std::mutex mutex_;
  std::size_t live_{};
  uint64_t provisioned_{};
};

}  // namespace warden::build
