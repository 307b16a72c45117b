#ifndef RAWIFACE_CORE_FS_UTILS_HPP_
#define RAWIFACE_CORE_FS_UTILS_HPP_

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace rawiface::core {

// Reads a whole regular file into `contents`.
//
// Failure messages distinguish "missing", "not a regular file" and the errno
// reported by open/read (typically "Permission denied") so configuration
// problems are actionable from the single ERROR line.
inline bool ReadRegularFile(const std::filesystem::path& path, std::string& contents,
                            std::string& error) {
  contents.clear();
  if (path.empty()) {
    error = "file path cannot be empty";
    return false;
  }

  std::error_code ec;
  const std::filesystem::file_status status = std::filesystem::status(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      error = "file not found: " + path.string();
    } else {
      error = "unable to stat '" + path.string() + "': " + ec.message();
    }
    return false;
  }
  if (!std::filesystem::is_regular_file(status)) {
    error = "not a regular file: " + path.string();
    return false;
  }

  errno = 0;
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    const int saved_errno = errno;
    error = "unable to open '" + path.string() + "'";
    if (saved_errno != 0) {
      error += ": ";
      error += std::strerror(saved_errno);
    }
    return false;
  }

  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading '" + path.string() + "'";
    contents.clear();
    return false;
  }
  return true;
}

} // namespace rawiface::core

#endif // RAWIFACE_CORE_FS_UTILS_HPP_
