#include <warden/build/sandbox.hpp>

#include <openssl/rand.h>
#include <spdlog/spdlog.h>

#include <system_error>
#include <utility>

using namespace warden::schema;

namespace warden::build {

sandbox_lease::sandbox_lease(sandbox_pool* pool,
                             hash32_t id,
                             std::string builder_id,
                             std::filesystem::path root)
    : pool_{pool},
      id_{id},
      builder_id_{std::move(builder_id)},
      root_{std::move(root)} {}

sandbox_lease::sandbox_lease(sandbox_lease&& other) noexcept
    : pool_{std::exchange(other.pool_, nullptr)},
      id_{other.id_},
      builder_id_{std::move(other.builder_id_)},
      root_{std::move(other.root_)} {}

sandbox_lease& sandbox_lease::operator=(sandbox_lease&& other) noexcept {
  if (this != &other) {
    release();
    pool_ = std::exchange(other.pool_, nullptr);
    id_ = other.id_;
    builder_id_ = std::move(other.builder_id_);
    root_ = std::move(other.root_);
  }
  return *this;
}

sandbox_lease::~sandbox_lease() {
  release();
}

void sandbox_lease::release() noexcept {
  if (pool_ == nullptr) {
    return;
  }
  std::exchange(pool_, nullptr)->teardown(root_);
}

sandbox_pool::sandbox_pool(std::filesystem::path root) : root_{std::move(root)} {
  auto ec = std::error_code{};
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    spdlog::error("Failed to create sandbox root '{}': {}", root_.string(),
                  ec.message());
  }
}

outcome<sandbox_lease> sandbox_pool::provision(const std::string& builder_id) {
  auto id = hash32_t{};
  if (RAND_bytes(id.data(), static_cast<int>(id.size())) != 1) {
    return make_error<sandbox_lease>(error_code_t::builder_failed,
                                     "sandbox id generation failed");
  }

  auto path = root_ / to_hex(id);
  auto ec = std::error_code{};
  // create_directory reports false when the path already exists; a fresh
  // sandbox must never land on leftovers.
  if (!std::filesystem::create_directory(path, ec) || ec) {
    return make_error<sandbox_lease>(
        error_code_t::builder_failed,
        "sandbox directory could not be created fresh: " + path.string());
  }
  std::filesystem::create_directory(path / "workspace", ec);
  if (!ec) {
    std::filesystem::create_directory(path / "output", ec);
  }
  if (ec) {
    std::filesystem::remove_all(path, ec);
    return make_error<sandbox_lease>(error_code_t::builder_failed,
                                     "sandbox layout could not be created");
  }

  {
    auto lock = std::scoped_lock{mutex_};
    ++live_;
    ++provisioned_;
  }
  spdlog::debug("Provisioned sandbox {} for builder '{}'", to_hex(id),
                builder_id);
  return make_ok(sandbox_lease{this, id, builder_id, std::move(path)});
}

void sandbox_pool::teardown(const std::filesystem::path& root) noexcept {
  auto ec = std::error_code{};
  std::filesystem::remove_all(root, ec);
  if (ec) {
    spdlog::error("Sandbox teardown failed for '{}': {}", root.string(),
                  ec.message());
  }
  auto lock = std::scoped_lock{mutex_};
  --live_;
}

std::size_t sandbox_pool::live() const {
  auto lock = std::scoped_lock{mutex_};
  return live_;
}

uint64_t sandbox_pool::provisioned() const {
  auto lock = std::scoped_lock{mutex_};
  return provisioned_;
}

}  // namespace warden::build
