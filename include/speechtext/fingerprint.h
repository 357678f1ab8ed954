#pragma once

#include "export.h"
#include "types.h"
#include <cstddef>
#include <string>

namespace speechtext {

/// Read size used when streaming a file through the hash
constexpr std::size_t FINGERPRINT_CHUNK_SIZE = 8192;

/**
 * @brief Compute filename, size and SHA-1 of a file
 *
 * Best effort: the size comes from filesystem metadata and the hash from a
 * chunked read. Whichever of the two fails is left at 0 / empty. Never throws
 * for I/O problems.
 *
 * @param path File to fingerprint
 * @return Fingerprint with lowercase hex SHA-1
 */
SPEECHTEXT_API FileFingerprint fingerprint_file(const std::string& path);

/**
 * @brief SHA-1 of a file as lowercase hex, streamed in FINGERPRINT_CHUNK_SIZE chunks
 * @return Empty string if the file cannot be read
 */
SPEECHTEXT_API std::string sha1_file_hex(const std::string& path);

} // namespace speechtext
