// checksum.hpp - SHA-256 file digests using OpenSSL
// Used to verify that a book copied to the SD card matches its source

#ifndef KOBOSHELF_CHECKSUM_HPP
#define KOBOSHELF_CHECKSUM_HPP

#include <string>
#include <cstddef>

namespace koboshelf {
namespace checksum {

// Lowercase hex SHA-256 of the file contents.
// Returns an empty string if the file cannot be read or hashing fails.
std::string sha256_file(const std::string& path);

// True when both files can be hashed and the digests are equal
bool files_match(const std::string& a, const std::string& b);

constexpr size_t DIGEST_HEX_LENGTH = 64;
constexpr size_t READ_CHUNK_SIZE = 64 * 1024;

} // namespace checksum
} // namespace koboshelf

#endif // KOBOSHELF_CHECKSUM_HPP
