#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "otto/scheduler/task_config.hpp"

void register_task_config_tests(std::vector<otto::tests::TestCase> &tests) {
  using otto::tests::require;
  using otto::testing::TempWorkspace;
  namespace sched = otto::scheduler;
  namespace ps = otto::persistence;

  tests.push_back({"missing_base_config_is_empty", [] {
                     TempWorkspace ws;
                     const auto base = sched::load_task_runtime_base_config(ws.path());
                     require(base.ok(), base.error());
                     require(!base.value().base.system_prompt.has_value(), "no prompt");
                     require(base.value().lanes.empty(), "no lanes");
                   }});

  tests.push_back({"layers_override_key_by_key", [] {
                     TempWorkspace ws;
                     ws.create_file("task-config/base.toml", R"(
[base]
system_prompt = "You are Otto."
agent = "build"
tools = ["read"]

[lanes.scheduled]
tools = ["read", "search"]

[lanes.interactive]
agent = "chat"
)");
                     ws.create_file("task-config/profiles/morning.toml", R"(
id = "morning"

[lanes.scheduled]
system_prompt = "Morning briefing mode."
)");
                     const auto base = sched::load_task_runtime_base_config(ws.path());
                     require(base.ok(), base.error());
                     const auto profile = sched::load_task_profile(ws.path(), "morning");
                     require(profile.ok(), profile.error());

                     const auto effective = sched::build_effective_task_execution_config(
                         base.value(), ps::Lane::Scheduled, profile.value());
                     require(effective.system_prompt.value_or("") == "Morning briefing mode.",
                             "profile lane prompt wins");
                     require(effective.agent.value_or("") == "build", "base agent kept");
                     require(effective.tools.has_value() && effective.tools->size() == 2,
                             "lane tools replace base tools");

                     const auto without_profile = sched::build_effective_task_execution_config(
                         base.value(), ps::Lane::Scheduled, std::nullopt);
                     require(without_profile.system_prompt.value_or("") == "You are Otto.",
                             "base prompt without profile");

                     const auto interactive = sched::build_effective_task_execution_config(
                         base.value(), ps::Lane::Interactive, profile.value());
                     require(interactive.agent.value_or("") == "chat", "interactive lane agent");
                     require(interactive.system_prompt.value_or("") == "You are Otto.",
                             "profile has no interactive overlay");
                   }});

  tests.push_back({"profile_must_exist_and_match_id", [] {
                     TempWorkspace ws;
                     require(!sched::load_task_profile(ws.path(), "absent").ok(),
                             "missing profile");
                     require(!sched::load_task_profile(ws.path(), "../escape").ok(),
                             "path-like ids rejected");
                     ws.create_file("task-config/profiles/evening.toml", "id = \"morning\"\n");
                     const auto mismatch = sched::load_task_profile(ws.path(), "evening");
                     require(!mismatch.ok(), "id mismatch rejected");
                     require(mismatch.error().find("mismatch") != std::string::npos,
                             "mismatch reported");
                   }});
}
