#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "watchllm/config/config.hpp"

#include <memory>

namespace {

const char *const kEnvVars[] = {
    "WATCHLLM_API_KEY",     "WATCHLLM_PROJECT_ID",  "WATCHLLM_BASE_URL",
    "WATCHLLM_ENVIRONMENT", "WATCHLLM_RELEASE",     "WATCHLLM_SAMPLE_RATE",
    "WATCHLLM_REDACT_PII",  "WATCHLLM_BATCH_SIZE",  "WATCHLLM_FLUSH_INTERVAL_MS",
    "WATCHLLM_CONFIG_PATH",
};

// Clears every WATCHLLM_* variable for the duration of a test.
struct CleanEnv {
  std::vector<std::unique_ptr<watchllm::testing::ScopedEnv>> guards;

  CleanEnv() {
    for (const char *name : kEnvVars) {
      guards.push_back(std::make_unique<watchllm::testing::ScopedEnv>(name, std::nullopt));
    }
  }
};

} // namespace

void register_config_tests(std::vector<watchllm::tests::TestCase> &tests) {
  using watchllm::tests::require;
  namespace cfg = watchllm::config;
  namespace wt = watchllm::testing;

  tests.push_back({"config_defaults", [] {
                     const cfg::Config config;
                     require(config.base_url == "https://proxy.watchllm.dev/v1", "base url");
                     require(config.environment == "development", "environment");
                     require(config.sample_rate == 1.0, "sample rate");
                     require(config.redact_pii, "redaction default");
                     require(config.delivery.batch_size == 10, "batch size");
                     require(config.delivery.flush_interval_ms == 5000, "flush interval");
                     require(config.delivery.queue_capacity == 1000, "capacity");
                     require(config.delivery.max_batch_events == 100, "max batch");
                     require(config.delivery.poll_interval_ms == 1000, "poll interval");
                     require(config.delivery.request_timeout_ms == 30'000, "timeout");
                     require(config.delivery.max_retries == 3, "retries");
                     require(config.observability.backend == "log", "observer backend");
                   }});

  tests.push_back({"config_parse_reads_sections", [] {
                     const auto parsed = cfg::parse_config(R"(
api_key = "key-1"
project_id = "proj-9"
base_url = "https://collector.example.com/v1///"
environment = "production"
release = "1.4.2"
sample_rate = 0.5
redact_pii = false

[delivery]
batch_size = 25
flush_interval_ms = 2500
queue_capacity = 50
max_retries = 5
shutdown_timeout_ms = 1500

[observability]
backend = "none"
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.api_key == "key-1", "api key");
                     require(config.project_id == "proj-9", "project");
                     require(config.base_url == "https://collector.example.com/v1",
                             "trailing slashes not stripped: " + config.base_url);
                     require(config.environment == "production", "environment");
                     require(config.release.value_or("") == "1.4.2", "release");
                     require(config.sample_rate == 0.5, "sample rate");
                     require(!config.redact_pii, "redact flag");
                     require(config.delivery.batch_size == 25, "batch size");
                     require(config.delivery.flush_interval_ms == 2500, "flush interval");
                     require(config.delivery.queue_capacity == 50, "capacity");
                     require(config.delivery.max_retries == 5, "retries");
                     require(config.delivery.shutdown_timeout_ms == 1500, "shutdown timeout");
                     require(config.delivery.poll_interval_ms == 1000, "unset key kept default");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_expands_env_references", [] {
                     wt::ScopedEnv secret("WATCHLLM_TEST_SECRET", std::string("s3cret"));
                     const auto parsed = cfg::parse_config("api_key = \"${WATCHLLM_TEST_SECRET}\"\n");
                     require(parsed.ok(), parsed.error());
                     require(parsed.value().api_key == "s3cret", parsed.value().api_key);
                   }});

  tests.push_back({"config_env_overrides_file_values", [] {
                     CleanEnv clean;
                     wt::ScopedEnv key("WATCHLLM_API_KEY", std::string("env-key"));
                     wt::ScopedEnv rate("WATCHLLM_SAMPLE_RATE", std::string("0.1"));
                     wt::ScopedEnv redact("WATCHLLM_REDACT_PII", std::string("off"));
                     wt::ScopedEnv batch("WATCHLLM_BATCH_SIZE", std::string("7"));
                     wt::ScopedEnv url("WATCHLLM_BASE_URL", std::string("http://localhost:8787/"));
                     cfg::Config config;
                     config.api_key = "file-key";
                     cfg::apply_env_overrides(config);
                     require(config.api_key == "env-key", "api key override");
                     require(config.sample_rate == 0.1, "sample rate override");
                     require(!config.redact_pii, "redact override");
                     require(config.delivery.batch_size == 7, "batch override");
                     require(config.base_url == "http://localhost:8787", config.base_url);
                   }});

  tests.push_back({"config_env_ignores_unparseable_numbers", [] {
                     CleanEnv clean;
                     wt::ScopedEnv rate("WATCHLLM_SAMPLE_RATE", std::string("lots"));
                     wt::ScopedEnv batch("WATCHLLM_BATCH_SIZE", std::string("-3"));
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.sample_rate == 1.0, "bad rate applied");
                     require(config.delivery.batch_size == 10, "bad batch applied");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     CleanEnv clean;
                     wt::TempWorkspace workspace;
                     cfg::set_config_path_override(workspace.path() / "absent.toml");
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().api_key.empty(), "unexpected api key");
                     require(loaded.value().delivery.batch_size == 10, "defaults not applied");
                   }});

  tests.push_back({"config_load_from_env_path", [] {
                     CleanEnv clean;
                     wt::TempWorkspace workspace;
                     const auto path = workspace.create_file(
                         "config.toml", "api_key = \"from-file\"\nproject_id = \"p\"\n");
                     wt::ScopedEnv config_path("WATCHLLM_CONFIG_PATH", path.string());
                     wt::ScopedEnv project("WATCHLLM_PROJECT_ID", std::string("p-env"));
                     const auto loaded = cfg::load_config();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().api_key == "from-file", "file value");
                     require(loaded.value().project_id == "p-env", "env beats file");
                   }});

  tests.push_back({"config_load_reports_parse_errors", [] {
                     CleanEnv clean;
                     wt::TempWorkspace workspace;
                     const auto path = workspace.create_file("bad.toml", "[unterminated\n");
                     cfg::set_config_path_override(path);
                     const auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(!loaded.ok(), "bad toml accepted");
                     require(loaded.error().find("bad.toml") != std::string::npos, loaded.error());
                   }});

  tests.push_back({"config_validate_accepts_test_config", [] {
                     const auto result = cfg::validate_config(wt::test_config());
                     require(result.ok(), result.error());
                     require(result.value().empty(), "unexpected warnings");
                   }});

  tests.push_back({"config_validate_lists_every_problem", [] {
                     cfg::Config config;
                     config.base_url = "ftp://nowhere";
                     config.sample_rate = 1.5;
                     config.delivery.batch_size = 0;
                     config.delivery.poll_interval_ms = 0;
                     const auto result = cfg::validate_config(config);
                     require(!result.ok(), "invalid config accepted");
                     for (const char *needle : {"api_key", "project_id", "base_url", "sample_rate",
                                                "batch_size", "poll_interval_ms"}) {
                       require(result.error().find(needle) != std::string::npos,
                               std::string("missing problem: ") + needle);
                     }
                   }});

  tests.push_back({"config_validate_warns_on_zero_sample_rate", [] {
                     auto config = wt::test_config();
                     config.sample_rate = 0.0;
                     const auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "expected one warning");
                   }});
}
