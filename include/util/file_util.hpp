#pragma once

#include <filesystem>
#include <string>

#include "apns_error.hpp"

namespace fs = std::filesystem;

namespace apnsclient {
namespace fileutil {

// Whole file contents; ReadFailure names the path and the OS reason.
ApnsResult<std::string> read_file(const fs::path& path);

}  // namespace fileutil
}  // namespace apnsclient
