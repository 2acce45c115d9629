#pragma once

#include "clawlink/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <sys/types.h>

namespace clawlink::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] std::string to_lower(std::string value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

/// Expands a leading `~` and `$NAME` / `${NAME}` references. Unset variables
/// expand to nothing; a `$` that does not start a name is kept.
[[nodiscard]] std::string expand_path(const std::string &value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Writes `data` to a sibling temp file created with `mode`, then renames it
/// over `path`. Readers see either the old or the new contents.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path, std::string_view data,
                                       mode_t mode);

/// Local host name, or "clawlink" when the platform does not report one.
[[nodiscard]] std::string host_name();

} // namespace clawlink::common
