#pragma once

#include <warden/schema/primitives.hpp>

namespace warden::crypto {

bool available();

bool verify_signature(const warden::schema::bytes_view_t& message,
                      const warden::schema::signer_id_t& signer,
                      const warden::schema::signature_t& signature);

}  // namespace warden::crypto
