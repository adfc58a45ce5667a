#pragma once

#include <chrono>
#include <string>

namespace watchllm::common {

/// Random (version 4) UUID in canonical 8-4-4-4-12 lowercase form.
[[nodiscard]] std::string generate_uuid();

/// ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z.
[[nodiscard]] std::string iso8601_utc(std::chrono::system_clock::time_point when);
[[nodiscard]] std::string iso8601_now();

[[nodiscard]] std::string local_hostname();

} // namespace watchllm::common
