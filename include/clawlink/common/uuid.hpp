#pragma once

#include <cstddef>
#include <string>

namespace clawlink::common {

/// Random RFC 4122 version 4 identifier in canonical lower-case form.
[[nodiscard]] std::string generate_uuid();

/// `bytes` random bytes rendered as lower-case hex.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace clawlink::common
