#include "test_framework.hpp"

#include "otto/common/json_util.hpp"
#include "otto/scheduler/result_parser.hpp"

void register_result_parser_tests(std::vector<otto::tests::TestCase> &tests) {
  using otto::tests::require;
  namespace sched = otto::scheduler;
  namespace ps = otto::persistence;

  tests.push_back({"direct_json_result_is_accepted", [] {
                     const auto outcome = sched::parse_structured_result(
                         R"(  {"status":"success","summary":"  Sent digest  ","errors":[]}  )");
                     const auto *direct = std::get_if<sched::DirectParse>(&outcome);
                     require(direct != nullptr, "direct parse expected");
                     require(direct->result.status == sched::TaskResultStatus::Success, "status");
                     require(direct->result.summary == "Sent digest", "summary trimmed");
                     require(!sched::outcome_raw_output(outcome).has_value(), "no raw output");
                   }});

  tests.push_back({"fenced_json_block_is_recovered", [] {
                     const auto outcome = sched::parse_structured_result(
                         "Here you go:\n```JSON\n{\"status\":\"skipped\",\"summary\":\"nothing "
                         "new\"}\n```\nbye");
                     const auto *fenced = std::get_if<sched::FencedParse>(&outcome);
                     require(fenced != nullptr, "fenced parse expected");
                     require(fenced->result.status == sched::TaskResultStatus::Skipped, "skipped");
                     require(fenced->result.errors.empty(), "errors default to empty");
                   }});

  tests.push_back({"large_fenced_reply_is_recovered", [] {
                     const std::string summary(200'000, 'x');
                     const auto outcome = sched::parse_structured_result(
                         "Here is the result:\n```json\n{\"status\":\"success\",\"summary\":\"" +
                         summary + "\",\"errors\":[]}\n```\n");
                     const auto *fenced = std::get_if<sched::FencedParse>(&outcome);
                     require(fenced != nullptr, "fenced parse expected");
                     require(fenced->result.summary.size() == summary.size(), "summary kept");
                   }});

  tests.push_back({"large_unclosed_fence_is_invalid_json", [] {
                     const std::string text = "```json\n" + std::string(200'000, 'y');
                     const auto outcome = sched::parse_structured_result(text);
                     const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                     require(failed != nullptr, "failure expected");
                     require(failed->code == "invalid_result_json", "code");
                     require(failed->raw_output.value_or("").size() == text.size(), "raw text kept");
                   }});

  tests.push_back({"empty_fence_is_invalid_json", [] {
                     const auto outcome = sched::parse_structured_result("```json\n   \n``` done");
                     const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                     require(failed != nullptr && failed->code == "invalid_result_json",
                             "empty fenced block is not a result");
                   }});

  tests.push_back({"prose_output_is_invalid_json_with_raw_text", [] {
                     const auto outcome = sched::parse_structured_result("  I did the thing.  ");
                     const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                     require(failed != nullptr, "failure expected");
                     require(failed->code == "invalid_result_json", "code");
                     require(failed->message == "Task execution output must be valid JSON",
                             "message");
                     require(failed->raw_output.value_or("") == "I did the thing.", "raw trimmed");

                     const auto result = sched::outcome_result(outcome);
                     require(result.status == sched::TaskResultStatus::Failed, "failed result");
                     require(result.errors.size() == 1 &&
                                 result.errors[0].code == "invalid_result_json",
                             "single error with the failure code");
                   }});

  tests.push_back({"empty_output_has_no_raw_text", [] {
                     const auto outcome = sched::parse_structured_result(" \n\t ");
                     const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                     require(failed != nullptr, "failure expected");
                     require(failed->code == "invalid_result_json", "code");
                     require(!failed->raw_output.has_value(), "no raw output");
                   }});

  tests.push_back({"schema_violations_are_reported", [] {
                     const auto check = [](const std::string &text) {
                       const auto outcome = sched::parse_structured_result(text);
                       const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                       return failed != nullptr && failed->code == "invalid_result_schema";
                     };
                     require(check(R"({"status":"done","summary":"x"})"), "unknown status");
                     require(check(R"({"summary":"x"})"), "missing status");
                     require(check(R"({"status":"success","summary":"   "})"), "blank summary");
                     require(check(R"({"status":"success"})"), "missing summary");
                     require(check(R"([1,2,3])"), "array is not an object");
                     require(check(R"({"status":"failed","summary":"x","errors":[""]})"),
                             "empty error message");
                   }});

  tests.push_back({"direct_schema_failure_does_not_fall_back_to_fence", [] {
                     // The whole text is valid JSON (a string), so the fence inside is ignored.
                     const auto outcome = sched::parse_structured_result(
                         R"("```json {\"status\":\"success\",\"summary\":\"x\"} ```")");
                     const auto *failed = std::get_if<sched::ParseFailed>(&outcome);
                     require(failed != nullptr && failed->code == "invalid_result_schema",
                             "schema failure expected");
                   }});

  tests.push_back({"loose_error_entries_are_normalized", [] {
                     const auto outcome = sched::parse_structured_result(
                         R"({"status":"failed","summary":"broke","errors":[" timeout ",null,{"code":"http_500","message":"server"},{"message":"no code"},42]})");
                     const auto *direct = std::get_if<sched::DirectParse>(&outcome);
                     require(direct != nullptr, "direct parse expected");
                     const auto &errors = direct->result.errors;
                     require(errors.size() == 4, "null entries dropped");
                     require(errors[0].code == "task_error" && errors[0].message == "timeout",
                             "string entry");
                     require(errors[1].code == "http_500" && errors[1].message == "server",
                             "complete object");
                     require(errors[2].code == "task_error" &&
                                 errors[2].message == R"({"message":"no code"})",
                             "incomplete object keeps raw json");
                     require(errors[3].message == "42", "number keeps raw text");
                   }});

  tests.push_back({"run_status_mapping_uses_first_error", [] {
                     sched::TaskExecutionResult failed{
                         .status = sched::TaskResultStatus::Failed,
                         .summary = "two problems",
                         .errors = {{"first", "one"}, {"second", "two"}},
                     };
                     const auto mapped = sched::map_run_status(failed);
                     require(mapped.status == ps::RunStatus::Failed, "failed");
                     require(mapped.error_code.value_or("") == "first", "first code");
                     require(mapped.error_message.value_or("") == "one", "first message");

                     failed.errors.clear();
                     const auto bare = sched::map_run_status(failed);
                     require(bare.error_code.value_or("") == "task_failed", "fallback code");
                     require(bare.error_message.value_or("") == "two problems", "summary message");

                     const auto ok = sched::map_run_status(sched::TaskExecutionResult{
                         .status = sched::TaskResultStatus::Skipped, .summary = "s", .errors = {}});
                     require(ok.status == ps::RunStatus::Skipped && !ok.error_code.has_value(),
                             "skipped carries no error");
                   }});

  tests.push_back({"serialized_result_carries_raw_output", [] {
                     const auto json = sched::serialize_result(
                         sched::to_failure_result("invalid_result_json", "bad"), "plain \"text\"");
                     require(otto::common::json_validate(json), "serialized result is JSON");
                     const auto members = otto::common::json_object_members(json);
                     require(members.has_value(), "object");
                     require(otto::common::json_as_string(members->at("rawOutput")).value_or("") ==
                                 "plain \"text\"",
                             "raw output kept");
                     require(otto::common::json_as_string(members->at("status")).value_or("") ==
                                 "failed",
                             "status");
                   }});
}
