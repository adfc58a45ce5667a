#include "watchllm/config/config.hpp"

#include "watchllm/common/strings.hpp"
#include "watchllm/common/toml.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace watchllm::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".watchllm";
constexpr const char *CONFIG_FILENAME = "config.toml";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

std::optional<bool> parse_bool(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_u64(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty() || value.front() == '-') {
    return std::nullopt;
  }
  char *end = nullptr;
  const unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
  if (end != value.c_str() + value.size()) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(parsed);
}

std::optional<double> parse_double(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (end != value.c_str() + value.size()) {
    return std::nullopt;
  }
  return parsed;
}

std::string expanded(const common::TomlDocument &doc, const std::string &key,
                     const std::string &fallback) {
  if (!doc.has(key)) {
    return fallback;
  }
  return common::expand_path(doc.get_string(key));
}

void apply_document(const common::TomlDocument &doc, Config &config) {
  config.api_key = expanded(doc, "api_key", config.api_key);
  config.project_id = expanded(doc, "project_id", config.project_id);
  config.base_url = normalize_base_url(expanded(doc, "base_url", config.base_url));
  config.environment = expanded(doc, "environment", config.environment);
  if (doc.has("release")) {
    config.release = expanded(doc, "release", "");
  }
  config.sample_rate = doc.get_double("sample_rate", config.sample_rate);
  config.redact_pii = doc.get_bool("redact_pii", config.redact_pii);

  auto &delivery = config.delivery;
  delivery.batch_size =
      static_cast<std::size_t>(doc.get_u64("delivery.batch_size", delivery.batch_size));
  delivery.flush_interval_ms =
      doc.get_u64("delivery.flush_interval_ms", delivery.flush_interval_ms);
  delivery.queue_capacity =
      static_cast<std::size_t>(doc.get_u64("delivery.queue_capacity", delivery.queue_capacity));
  delivery.max_batch_events = static_cast<std::size_t>(
      doc.get_u64("delivery.max_batch_events", delivery.max_batch_events));
  delivery.poll_interval_ms = doc.get_u64("delivery.poll_interval_ms", delivery.poll_interval_ms);
  delivery.request_timeout_ms =
      doc.get_u64("delivery.request_timeout_ms", delivery.request_timeout_ms);
  delivery.max_retries =
      static_cast<std::uint32_t>(doc.get_u64("delivery.max_retries", delivery.max_retries));
  delivery.retry_backoff_ms = doc.get_u64("delivery.retry_backoff_ms", delivery.retry_backoff_ms);
  delivery.max_retry_after_ms =
      doc.get_u64("delivery.max_retry_after_ms", delivery.max_retry_after_ms);
  delivery.shutdown_timeout_ms =
      doc.get_u64("delivery.shutdown_timeout_ms", delivery.shutdown_timeout_ms);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
}

} // namespace

common::Result<std::filesystem::path> config_path() {
  if (g_config_path_override.has_value()) {
    return common::Result<std::filesystem::path>::success(*g_config_path_override);
  }
  if (const auto env = env_value("WATCHLLM_CONFIG_PATH"); env.has_value()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(*env)));
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER /
                                                        CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::string normalize_base_url(std::string url) {
  url = common::trim(url);
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

void apply_env_overrides(Config &config) {
  if (const auto value = env_value("WATCHLLM_API_KEY"); value.has_value()) {
    config.api_key = *value;
  }
  if (const auto value = env_value("WATCHLLM_PROJECT_ID"); value.has_value()) {
    config.project_id = *value;
  }
  if (const auto value = env_value("WATCHLLM_BASE_URL"); value.has_value()) {
    config.base_url = normalize_base_url(*value);
  }
  if (const auto value = env_value("WATCHLLM_ENVIRONMENT"); value.has_value()) {
    config.environment = *value;
  }
  if (const auto value = env_value("WATCHLLM_RELEASE"); value.has_value()) {
    config.release = *value;
  }
  if (const auto value = env_value("WATCHLLM_SAMPLE_RATE"); value.has_value()) {
    if (const auto rate = parse_double(*value); rate.has_value()) {
      config.sample_rate = *rate;
    }
  }
  if (const auto value = env_value("WATCHLLM_REDACT_PII"); value.has_value()) {
    if (const auto flag = parse_bool(*value); flag.has_value()) {
      config.redact_pii = *flag;
    }
  }
  if (const auto value = env_value("WATCHLLM_BATCH_SIZE"); value.has_value()) {
    if (const auto size = parse_u64(*value); size.has_value()) {
      config.delivery.batch_size = static_cast<std::size_t>(*size);
    }
  }
  if (const auto value = env_value("WATCHLLM_FLUSH_INTERVAL_MS"); value.has_value()) {
    if (const auto interval = parse_u64(*value); interval.has_value()) {
      config.delivery.flush_interval_ms = *interval;
    }
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  Config config;
  apply_document(parsed.value(), config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }
  Config config = parsed.take();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> problems;
  std::vector<std::string> warnings;

  if (common::trim(config.api_key).empty()) {
    problems.emplace_back("api_key is required");
  }
  if (common::trim(config.project_id).empty()) {
    problems.emplace_back("project_id is required");
  }
  if (!common::starts_with(config.base_url, "http://") &&
      !common::starts_with(config.base_url, "https://")) {
    problems.push_back("base_url must be an http(s) URL: " + config.base_url);
  }
  if (!(config.sample_rate >= 0.0 && config.sample_rate <= 1.0)) {
    problems.emplace_back("sample_rate must be between 0.0 and 1.0");
  }
  if (config.delivery.batch_size < 1) {
    problems.emplace_back("delivery.batch_size must be >= 1");
  }
  if (config.delivery.queue_capacity < 1) {
    problems.emplace_back("delivery.queue_capacity must be >= 1");
  }
  if (config.delivery.max_batch_events < 1) {
    problems.emplace_back("delivery.max_batch_events must be >= 1");
  }
  if (config.delivery.poll_interval_ms == 0) {
    problems.emplace_back("delivery.poll_interval_ms must be > 0");
  }

  if (!problems.empty()) {
    return common::Result<std::vector<std::string>>::failure(common::join(problems, "; "));
  }

  if (config.sample_rate == 0.0) {
    warnings.emplace_back("sample_rate is 0; no events will be recorded");
  }
  if (config.delivery.batch_size > config.delivery.queue_capacity) {
    warnings.emplace_back("delivery.batch_size exceeds delivery.queue_capacity; "
                          "size-triggered flushes will never fire");
  }
  if (common::starts_with(config.base_url, "http://")) {
    warnings.emplace_back("base_url is not using TLS");
  }
  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace watchllm::config
