#include "common/assertions.hpp"
#include "common/temp_dir.hpp"
#include "core/json_dom.hpp"
#include "mediaprep/cli/router.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace json = mediaprep::core::json;

using mediaprep::tests::common::AssertContains;
using mediaprep::tests::common::CreateUniqueTempDir;
using mediaprep::tests::common::Fail;
using mediaprep::tests::common::ReadFileToString;
using mediaprep::tests::common::RemovePathBestEffort;
using mediaprep::tests::common::WriteFixtureFile;

namespace {

int DispatchWithCapturedOutput(std::vector<std::string> argv_storage, std::string& stdout_text,
                               std::string& stderr_text) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }

  std::ostringstream captured_cout;
  std::ostringstream captured_cerr;
  std::streambuf* original_cout = std::cout.rdbuf(captured_cout.rdbuf());
  std::streambuf* original_cerr = std::cerr.rdbuf(captured_cerr.rdbuf());
  const int exit_code = mediaprep::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
  std::cout.rdbuf(original_cout);
  std::cerr.rdbuf(original_cerr);

  stdout_text = captured_cout.str();
  stderr_text = captured_cerr.str();
  return exit_code;
}

} // namespace

int main() {
  std::string out;
  std::string err;

  if (DispatchWithCapturedOutput({"mediaprep", "version"}, out, err) != 0) {
    Fail("version returned non-zero exit code");
  }
  AssertContains(out, "mediaprep 0.1.0");

  if (DispatchWithCapturedOutput({"mediaprep", "help"}, out, err) != 0) {
    Fail("help returned non-zero exit code");
  }
  AssertContains(out, "mediaprep serve");
  AssertContains(out, "exit codes:");
  AssertContains(out, "20  socket could not be bound");

  if (DispatchWithCapturedOutput({"mediaprep", "transmogrify"}, out, err) != 2) {
    Fail("unknown subcommand should exit with the usage code");
  }
  AssertContains(err, "unknown subcommand: transmogrify");

  if (DispatchWithCapturedOutput({"mediaprep", "backends", "--workers", "0"}, out, err) != 2) {
    Fail("backends should reject options it does not take");
  }

  if (DispatchWithCapturedOutput({"mediaprep", "backends", "--no-accel"}, out, err) != 0) {
    Fail("backends --no-accel returned non-zero exit code");
  }
  AssertContains(out, "build cuda: ");
  AssertContains(out, "build raw decoder: ");
  AssertContains(out, "selected: reference");

  const fs::path root = CreateUniqueTempDir("mediaprep-cli-smoke");

  const fs::path card_path = root / "card.json";
  if (DispatchWithCapturedOutput(
          {"mediaprep", "capabilities", "--no-accel", "--out", card_path.string()}, out, err) !=
      0) {
    Fail("capabilities --out failed: " + err);
  }
  json::Value card;
  std::string error;
  if (!json::Parse(ReadFileToString(card_path), card, error)) {
    Fail("exported card is not JSON: " + error);
  }
  const json::Value* functions = card.Find("functions");
  if (functions == nullptr || functions->array_value.size() != 8U) {
    Fail("expected eight functions in the exported card");
  }

  const fs::path request_path = root / "health.json";
  WriteFixtureFile(request_path, R"({"op":"health","input":{}})");
  if (DispatchWithCapturedOutput({"mediaprep", "call", "--no-accel", request_path.string()}, out,
                                 err) != 0) {
    Fail("call health failed: " + out + err);
  }
  AssertContains(out, "\"ok\":true");
  AssertContains(out, "\"status\":\"ok\"");

  const fs::path bad_request = root / "bad.json";
  WriteFixtureFile(bad_request, R"({"op":42})");
  if (DispatchWithCapturedOutput({"mediaprep", "call", bad_request.string()}, out, err) != 1) {
    Fail("call with a malformed request should exit with 1");
  }
  AssertContains(out, "ValidationError");

  if (DispatchWithCapturedOutput({"mediaprep", "call", (root / "missing.json").string()}, out,
                                 err) != 1) {
    Fail("call with a missing request file should exit with 1");
  }

  RemovePathBestEffort(root);
  std::cout << "cli_smoke: ok\n";
  return 0;
}
