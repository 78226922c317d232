/**
 * coursesync - Content digests built on libsodium (BLAKE2b via crypto_generichash).
 */
#pragma once

#include <filesystem>
#include <string>

namespace coursesync::crypto
{

    // Lowercase hex BLAKE2b digest of a file's bytes. Throws std::runtime_error
    // when the file cannot be read or libsodium fails.
    std::string hash_file(const std::filesystem::path &path);

} // namespace coursesync::crypto
