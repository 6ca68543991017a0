#include "util/file_util.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <system_error>

namespace apnsclient {
namespace fileutil {

namespace {

// errno as left by the failed stream operation.
std::error_code last_os_error(std::errc fallback) {
  if (errno != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return std::make_error_code(fallback);
}

}  // namespace

ApnsResult<std::string> read_file(const fs::path& path) {
  std::error_code ec;
  const auto status = fs::status(path, ec);
  if (!ec && !fs::exists(status)) {
    ec = std::make_error_code(std::errc::no_such_file_or_directory);
  }
  if (ec) {
    return ApnsResult<std::string>::Err(
        from_io(fs::filesystem_error("cannot stat file", path, ec)));
  }
  if (fs::is_directory(status)) {
    return ApnsResult<std::string>::Err(from_io(fs::filesystem_error(
        "cannot read file", path,
        std::make_error_code(std::errc::is_a_directory))));
  }

  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return ApnsResult<std::string>::Err(from_io(fs::filesystem_error(
        "cannot open file", path, last_os_error(std::errc::io_error))));
  }
  errno = 0;
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad()) {
    return ApnsResult<std::string>::Err(from_io(fs::filesystem_error(
        "cannot read file", path, last_os_error(std::errc::io_error))));
  }
  return ApnsResult<std::string>::Ok(std::move(content));
}

}  // namespace fileutil
}  // namespace apnsclient
