#pragma once

#include <string>
#include <vector>
#include <optional>

namespace koboshelf {

/**
 * Mapping between library paths and the Kobo's content identifiers.
 *
 * Books copied by koboshelf live under <sdcard>/kobomanager/<relative path>/
 * and the reader records them as
 *   file:///mnt/sd/kobomanager/<relative path>/<name>.<extension>
 * where <relative path> is the book's directory relative to the library root
 * it was found in. Books sitting directly in a root have no relative segment:
 * the identifier is file:///mnt/sd/kobomanager/<name>.<extension>, never
 * .../kobomanager/./<name>.<extension>, since the former is the path the
 * reader indexes for a file at the top of the working directory.
 */
namespace content_id {

// Name of the working directory on the SD card
constexpr const char* WORKING_DIR_NAME = "kobomanager";

// Prefix the device uses for everything inside the working directory
constexpr const char* DEVICE_PREFIX = "file:///mnt/sd/kobomanager/";

// First root (in the given order) that contains `directory`.
// A root matches when directory == root or directory starts with root + "/".
// Trailing slashes on roots are ignored. Empty result if nothing matches.
std::optional<std::string> resolve_library_root(const std::vector<std::string>& library_roots,
                                                 const std::string& directory);

// `directory` relative to `root` ("" when they are equal).
// Caller guarantees that root contains directory.
std::string relative_directory(const std::string& root, const std::string& directory);

// Content identifier for a book; empty when no root contains `directory`.
std::optional<std::string> make(const std::vector<std::string>& library_roots,
                                const std::string& directory,
                                const std::string& name,
                                const std::string& extension);

// Same path rooted at the SD card working directory instead of the device URI:
// <working_root>/<relative path>
std::optional<std::string> destination_directory(const std::vector<std::string>& library_roots,
                                                 const std::string& directory,
                                                 const std::string& working_root);

} // namespace content_id
} // namespace koboshelf
