#pragma once

#include "watchllm/common/json.hpp"
#include "watchllm/events/types.hpp"

#include <string>

namespace watchllm::events {

/// Wire form of an event. Map fields left null are emitted as empty objects,
/// optional scalars as null, enums as their string tags.
[[nodiscard]] common::JsonValue to_json(const Event &event);
[[nodiscard]] common::JsonValue to_json(const ToolCallRecord &record);

[[nodiscard]] std::string serialize(const Event &event);

} // namespace watchllm::events
