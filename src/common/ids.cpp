#include "watchllm/common/ids.hpp"

#include <openssl/rand.h>

#include <array>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <unistd.h>

namespace watchllm::common {

namespace {

void fill_random(std::array<unsigned char, 16> &bytes) {
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) == 1) {
    return;
  }
  // RAND_bytes only fails when the CSPRNG cannot be seeded; ids still need to be unique.
  static thread_local std::mt19937_64 rng(std::random_device{}());
  for (auto &byte : bytes) {
    byte = static_cast<unsigned char>(rng() & 0xFFULL);
  }
}

} // namespace

std::string generate_uuid() {
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return stream.str();
}

std::string iso8601_utc(const std::chrono::system_clock::time_point when) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() %
      1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream stream;
  stream << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << (millis < 0 ? millis + 1000 : millis) << 'Z';
  return stream.str();
}

std::string iso8601_now() { return iso8601_utc(std::chrono::system_clock::now()); }

std::string local_hostname() {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0 || buffer[0] == '\0') {
    return "unknown";
  }
  return std::string(buffer.data());
}

} // namespace watchllm::common
