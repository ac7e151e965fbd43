#include "otto/scheduler/task_config.hpp"

#include "otto/common/toml.hpp"

#include <regex>

namespace otto::scheduler {

namespace {

constexpr const char *kTaskConfigFolder = "task-config";
constexpr const char *kBaseFilename = "base.toml";
constexpr const char *kProfilesFolder = "profiles";

TaskExecutionConfig read_section(const common::TomlDocument &doc, const std::string &prefix) {
  TaskExecutionConfig config;
  config.system_prompt = doc.find_string(prefix + "system_prompt");
  config.agent = doc.find_string(prefix + "agent");
  if (doc.has(prefix + "tools")) {
    config.tools = doc.get_string_array(prefix + "tools");
  }
  return config;
}

// Lane names are the middle segment of `lanes.<lane>.<key>`.
std::map<std::string, TaskExecutionConfig> read_lanes(const common::TomlDocument &doc) {
  static const std::string kLanesPrefix = "lanes.";
  std::map<std::string, TaskExecutionConfig> lanes;
  for (const auto &[key, _] : doc.values) {
    if (key.rfind(kLanesPrefix, 0) != 0) {
      continue;
    }
    const auto dot = key.find('.', kLanesPrefix.size());
    if (dot == std::string::npos) {
      continue;
    }
    const std::string lane = key.substr(kLanesPrefix.size(), dot - kLanesPrefix.size());
    if (lanes.find(lane) == lanes.end()) {
      lanes.emplace(lane, read_section(doc, kLanesPrefix + lane + "."));
    }
  }
  return lanes;
}

void overlay(TaskExecutionConfig &target, const TaskExecutionConfig &layer) {
  if (layer.system_prompt.has_value()) {
    target.system_prompt = layer.system_prompt;
  }
  if (layer.agent.has_value()) {
    target.agent = layer.agent;
  }
  if (layer.tools.has_value()) {
    target.tools = layer.tools;
  }
}

bool is_valid_profile_id(const std::string &id) {
  static const std::regex kProfileId("^[A-Za-z0-9][A-Za-z0-9_-]{0,63}$");
  return std::regex_match(id, kProfileId);
}

} // namespace

std::filesystem::path task_config_directory(const std::filesystem::path &home) {
  return home / kTaskConfigFolder;
}

common::Result<TaskRuntimeBaseConfig>
load_task_runtime_base_config(const std::filesystem::path &home) {
  const auto path = task_config_directory(home) / kBaseFilename;
  auto doc = common::load_toml_file(path);
  if (!doc.ok()) {
    return common::Result<TaskRuntimeBaseConfig>::failure("task config " + path.string() + ": " +
                                                          doc.error());
  }

  TaskRuntimeBaseConfig config;
  config.base = read_section(doc.value(), "base.");
  config.lanes = read_lanes(doc.value());
  return common::Result<TaskRuntimeBaseConfig>::success(std::move(config));
}

common::Result<TaskProfile> load_task_profile(const std::filesystem::path &home,
                                              const std::string &profile_id) {
  if (!is_valid_profile_id(profile_id)) {
    return common::Result<TaskProfile>::failure("invalid task profile id: " + profile_id);
  }

  const auto path = task_config_directory(home) / kProfilesFolder / (profile_id + ".toml");
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<TaskProfile>::failure("task profile not found: " + path.string());
  }
  auto doc = common::load_toml_file(path);
  if (!doc.ok()) {
    return common::Result<TaskProfile>::failure("task profile " + path.string() + ": " +
                                                doc.error());
  }

  const std::string declared_id = doc.value().get_string("id");
  if (declared_id != profile_id) {
    return common::Result<TaskProfile>::failure("task profile id mismatch: file " + profile_id +
                                                " declares '" + declared_id + "'");
  }

  TaskProfile profile;
  profile.id = declared_id;
  profile.lanes = read_lanes(doc.value());
  return common::Result<TaskProfile>::success(std::move(profile));
}

TaskExecutionConfig build_effective_task_execution_config(const TaskRuntimeBaseConfig &base,
                                                          const persistence::Lane lane,
                                                          const std::optional<TaskProfile> &profile) {
  const std::string lane_name(persistence::to_string(lane));
  TaskExecutionConfig effective = base.base;
  if (const auto it = base.lanes.find(lane_name); it != base.lanes.end()) {
    overlay(effective, it->second);
  }
  if (profile.has_value()) {
    if (const auto it = profile->lanes.find(lane_name); it != profile->lanes.end()) {
      overlay(effective, it->second);
    }
  }
  return effective;
}

} // namespace otto::scheduler
