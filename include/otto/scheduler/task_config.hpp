#pragma once

#include "otto/common/result.hpp"
#include "otto/persistence/job_store.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace otto::scheduler {

/// Options injected into a gateway prompt. Unset fields leave the gateway's defaults.
struct TaskExecutionConfig {
  std::optional<std::string> system_prompt;
  std::optional<std::string> agent;
  /// Tool allowlist.
  std::optional<std::vector<std::string>> tools;
};

struct TaskRuntimeBaseConfig {
  TaskExecutionConfig base;
  std::map<std::string, TaskExecutionConfig> lanes;
};

struct TaskProfile {
  std::string id;
  std::map<std::string, TaskExecutionConfig> lanes;
};

[[nodiscard]] std::filesystem::path task_config_directory(const std::filesystem::path &home);

/// Reads <home>/task-config/base.toml; a missing file is an empty config.
[[nodiscard]] common::Result<TaskRuntimeBaseConfig>
load_task_runtime_base_config(const std::filesystem::path &home);

/// Reads <home>/task-config/profiles/<id>.toml. The file must exist and declare the same id.
[[nodiscard]] common::Result<TaskProfile> load_task_profile(const std::filesystem::path &home,
                                                            const std::string &profile_id);

/// Layers base, then the base lane overlay, then the profile's lane overlay, key by key.
[[nodiscard]] TaskExecutionConfig
build_effective_task_execution_config(const TaskRuntimeBaseConfig &base, persistence::Lane lane,
                                      const std::optional<TaskProfile> &profile);

} // namespace otto::scheduler
