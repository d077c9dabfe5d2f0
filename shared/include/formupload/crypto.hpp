/**
 * formupload - Identifier and integrity helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace formupload::crypto
{

    // Hex digest of crypto_generichash over data.
    std::string hash_bytes(std::span<const std::byte> data);

    // Lowercase hex string of byte_count random bytes.
    std::string random_hex(std::size_t byte_count);

    // RFC 4122 version 4 identifier, e.g. "3f0c9a4e-6d1b-4c7e-9a52-0b8e2f6d4c11".
    std::string random_uuid();

} // namespace formupload::crypto
