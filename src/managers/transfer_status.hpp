#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>
#include <core/directory_structure.hpp>

// "1.5 KiB", "3.0 GiB". Binary units from KiB up, saturating at EiB.
std::string size_to_string(int64_t bytes);

// " (42.0%)", or "" when either side is zero.
std::string calc_percentage(int64_t transferred, int64_t total);

// Report of the transfer running against paths.state_dir, read from the
// persisted files only. A current repository without a state file is a
// MissingStateFile error.
Result<std::string> render_transfer_status(const TransferPaths& paths);
