#include "clawlink/common/fs.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace clawlink::common {

namespace {

bool is_name_start(const char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

bool is_name_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

void append_env(std::string &out, const std::string &name) {
  if (const char *value = std::getenv(name.c_str()); value != nullptr) {
    out += value;
  }
}

std::string errno_text() { return std::strerror(errno); }

} // namespace

std::string trim(const std::string &input) {
  const auto not_space = [](const unsigned char ch) { return std::isspace(ch) == 0; };
  const auto first = std::find_if(input.begin(), input.end(), not_space);
  const auto last = std::find_if(input.rbegin(), input.rend(), not_space).base();
  return first < last ? std::string(first, last) : std::string();
}

std::string to_lower(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  const char *home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return Result<std::filesystem::path>::failure("HOME is not set");
  }
  return Result<std::filesystem::path>::success(std::filesystem::path(home));
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory " + path.string() +
                                                  ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;

  if (!value.empty() && value.front() == '~' && (value.size() == 1 || value[1] == '/')) {
    if (const auto home = home_dir(); home.ok()) {
      out = home.value().string();
      i = 1;
    }
  }

  while (i < value.size()) {
    const char ch = value[i];
    if (ch != '$' || i + 1 >= value.size()) {
      out.push_back(ch);
      ++i;
      continue;
    }

    if (value[i + 1] == '{') {
      const auto close = value.find('}', i + 2);
      if (close == std::string::npos || close == i + 2 || !is_name_start(value[i + 2])) {
        out.push_back(ch);
        ++i;
        continue;
      }
      append_env(out, value.substr(i + 2, close - i - 2));
      i = close + 1;
      continue;
    }

    if (!is_name_start(value[i + 1])) {
      out.push_back(ch);
      ++i;
      continue;
    }
    std::size_t end = i + 1;
    while (end < value.size() && is_name_char(value[end])) {
      ++end;
    }
    append_env(out, value.substr(i + 1, end - i - 1));
    i = end;
  }
  return out;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("Unable to open " + path.string());
  }
  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return Result<std::string>::failure("Failed to read " + path.string());
  }
  return Result<std::string>::success(std::move(contents));
}

Status write_file_atomic(const std::filesystem::path &path, const std::string_view data,
                         const mode_t mode) {
  const std::filesystem::path tmp_path = path.string() + ".tmp";
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
  if (fd < 0) {
    return Status::error("Failed to create " + tmp_path.string() + ": " + errno_text());
  }
  // The umask may have narrowed the mode, and an existing temp file keeps its own.
  if (::fchmod(fd, mode) != 0) {
    const std::string reason = errno_text();
    ::close(fd);
    ::unlink(tmp_path.c_str());
    return Status::error("Failed to set permissions on " + tmp_path.string() + ": " + reason);
  }

  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      const std::string reason = errno_text();
      ::close(fd);
      ::unlink(tmp_path.c_str());
      return Status::error("Failed to write " + tmp_path.string() + ": " + reason);
    }
    written += static_cast<std::size_t>(n);
  }

  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    const std::string reason = errno_text();
    ::unlink(tmp_path.c_str());
    return Status::error("Failed to flush " + tmp_path.string() + ": " + reason);
  }

  if (::rename(tmp_path.c_str(), path.c_str()) != 0) {
    const std::string reason = errno_text();
    ::unlink(tmp_path.c_str());
    return Status::error("Failed to replace " + path.string() + ": " + reason);
  }
  return Status::success();
}

std::string host_name() {
  std::array<char, 256> buffer{};
  if (::gethostname(buffer.data(), buffer.size() - 1) == 0 && buffer[0] != '\0') {
    return std::string(buffer.data());
  }
  return "clawlink";
}

} // namespace clawlink::common
