#pragma once
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: source reference.
// Pinned source revision handed over by source ingress, optionally signed by
// the upstream maintainer.
namespace warden::schema {

template <uint16_t Version>
struct source_ref;

template <>
struct source_ref<1> final {
  uint16_t version{1};
  std::string locator;
  std::string commit;
  std::string tag;
  std::optional<signer_id_t> signer;
  std::optional<signature_t> signature;
};

using source_ref_t = source_ref<1>;

}  // namespace warden::schema
