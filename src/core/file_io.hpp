#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Write content to <path>.tmp, sync it to disk, then rename it over path.
// Readers see either the previous file or the complete new one, never a
// truncated file, even after a crash or power loss.
// Creates the parent directory if needed.
Result<void> write_file_atomic(const fs::path& path, const std::string& content);

// Read a whole file. Empty optional if the file does not exist;
// any other failure is an Io error.
Result<std::optional<std::string>> read_file_if_exists(const fs::path& path);
