#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/env_override.hpp"
#include "../common/temp_dir.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using scenevault::tests::common::AssertContains;
using scenevault::tests::common::AssertExitCode;
using scenevault::tests::common::AssertNotContains;
using scenevault::tests::common::DispatchArgs;
using scenevault::tests::common::WriteStringToFile;

struct CliResult {
  int exit_code = 0;
  std::string out;
  std::string err;
};

CliResult RunCli(const std::vector<std::string>& args) {
  std::ostringstream captured_stdout;
  std::ostringstream captured_stderr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_stdout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_stderr.rdbuf());
  CliResult result;
  result.exit_code = DispatchArgs(args);
  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);
  result.out = captured_stdout.str();
  result.err = captured_stderr.str();
  return result;
}

std::vector<std::string> WithStore(std::vector<std::string> args, const fs::path& store) {
  args.insert(args.begin(), "scenevault");
  args.push_back("--store");
  args.push_back(store.string());
  return args;
}

} // namespace

int main() {
  using scenevault::tests::common::ScopedEnvOverride;
  using scenevault::tests::common::ScopedTempDir;

  ScopedEnvOverride config_env("SCENEVAULT_CONFIG", nullptr);
  ScopedEnvOverride level_env("SCENEVAULT_LOG_LEVEL", nullptr);
  ScopedTempDir temp("scenevault-cli-flow");
  const fs::path store = temp.Path() / "store";

  CliResult result = RunCli({"scenevault", "version"});
  AssertExitCode(result.exit_code, 0, "version");
  AssertContains(result.out, "scenevault 0.1.0");

  result = RunCli({"scenevault"});
  AssertExitCode(result.exit_code, 2, "no subcommand");
  AssertContains(result.err, "usage:");

  result = RunCli({"scenevault", "frobnicate"});
  AssertExitCode(result.exit_code, 2, "unknown subcommand");

  result = RunCli(WithStore({"list"}, store));
  AssertExitCode(result.exit_code, 0, "list on empty store");
  AssertContains(result.out, "[]");

  result = RunCli(WithStore({"create"}, store));
  AssertExitCode(result.exit_code, 2, "create without title");

  result = RunCli(WithStore({"create", "--title", "Ocean", "--job-id", "job-7", "--id", "P1"},
                            store));
  AssertExitCode(result.exit_code, 0, "create");
  AssertContains(result.out, "\"project_id\":\"P1\"");
  AssertContains(result.out, "\"status\":\"created\"");

  result = RunCli(WithStore({"create", "--title", "Again", "--id", "P1"}, store));
  AssertExitCode(result.exit_code, 43, "duplicate create");
  AssertContains(result.err, "error: INVALID_ARGUMENT");

  const fs::path audio_two = temp.Path() / "audio_two.json";
  WriteStringToFile(audio_two, R"({"stage":"audio","completed_scenes":2,"total_scenes":3})");
  result = RunCli(WithStore({"checkpoint", "P1", audio_two.string()}, store));
  AssertExitCode(result.exit_code, 0, "checkpoint audio 2/3");
  AssertContains(result.out, "\"sequence\":1");
  AssertContains(result.out, "\"status\":\"in_progress\"");

  const fs::path audio_one = temp.Path() / "audio_one.json";
  WriteStringToFile(audio_one, R"({"stage":"audio","completed_scenes":1,"total_scenes":3})");
  result = RunCli(WithStore({"checkpoint", "P1", audio_one.string()}, store));
  AssertExitCode(result.exit_code, 42, "regressing checkpoint");
  AssertContains(result.err, "INVALID_CHECKPOINT_ORDER");

  const fs::path malformed = temp.Path() / "malformed.json";
  WriteStringToFile(malformed, R"({"stage":"audio"})");
  result = RunCli(WithStore({"checkpoint", "P1", malformed.string()}, store));
  AssertExitCode(result.exit_code, 43, "malformed checkpoint");

  result = RunCli(WithStore({"show", "P1"}, store));
  AssertExitCode(result.exit_code, 0, "show");
  AssertContains(result.out, "\"completed_scenes\":2");
  AssertContains(result.out, "\"current_stage\":\"audio\"");
  AssertContains(result.out, "\"can_recover\":true");

  result = RunCli(WithStore({"fail", "P1", "tts worker crashed"}, store));
  AssertExitCode(result.exit_code, 0, "fail");
  AssertContains(result.out, "\"error_message\":\"tts worker crashed\"");

  result = RunCli(WithStore({"list"}, store));
  AssertExitCode(result.exit_code, 0, "list");
  AssertContains(result.out, "\"project_id\":\"P1\"");

  result = RunCli(WithStore({"show", "nope"}, store));
  AssertExitCode(result.exit_code, 40, "show missing");
  AssertContains(result.err, "error: NOT_FOUND");

  result = RunCli(WithStore({"cancel", "P1"}, store));
  AssertExitCode(result.exit_code, 0, "cancel");
  AssertContains(result.out, "\"outcome\":\"cancelled\"");

  result = RunCli(WithStore({"cancel", "P1"}, store));
  AssertExitCode(result.exit_code, 0, "second cancel");
  AssertContains(result.out, "\"outcome\":\"already_terminal\"");

  const fs::path audio_three = temp.Path() / "audio_three.json";
  WriteStringToFile(audio_three, R"({"stage":"audio","completed_scenes":3,"total_scenes":3})");
  result = RunCli(WithStore({"checkpoint", "P1", audio_three.string()}, store));
  AssertExitCode(result.exit_code, 41, "checkpoint after cancel");
  AssertContains(result.err, "PROJECT_TERMINATED");

  result = RunCli(WithStore({"list"}, store));
  AssertExitCode(result.exit_code, 0, "list after cancel");
  AssertNotContains(result.out, "\"project_id\":\"P1\"");

  result = RunCli(WithStore({"purge", "--dry-run", "--older-than-days", "0"}, store));
  AssertExitCode(result.exit_code, 0, "purge dry run");
  AssertContains(result.out, "\"dry_run\":true");

  result = RunCli(WithStore({"discard", "P1"}, store));
  AssertExitCode(result.exit_code, 0, "discard");
  AssertContains(result.out, "\"discarded\":true");

  result = RunCli(WithStore({"discard", "P1"}, store));
  AssertExitCode(result.exit_code, 40, "second discard");

  result = RunCli(WithStore({"show", "P1", "--probe-timeout-ms", "abc"}, store));
  AssertExitCode(result.exit_code, 2, "bad flag value");

  std::cout << "cli_recovery_flow_smoke: ok\n";
  return 0;
}
