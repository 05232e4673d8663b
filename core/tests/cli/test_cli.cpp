// test_cli.cpp - CLI integration tests for the polyschema tool

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

namespace
{

constexpr const char * k_catalog = R"(
settings:
  log_level: debug
hierarchies:
  - name: Config
    discriminator: mode
    variants:
      - name: TextConfig
        value: text
        fields:
          text: string
      - name: NumberConfig
        value: number
        fields:
          number: float
          precision: { type: integer, default: 2 }
)";

std::string read_all(const fs::path & p)
{
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

std::string shell_quote(const std::string & s)
{
  // POSIX shell single-quote escaping.
  std::string out;
  out.reserve(s.size() + 2);
  out.push_back('\'');
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

struct CliRun
{
  int exit_code = 0;
  std::string output;  // stdout and stderr combined
};

/// Runs the tool with `args` from `cwd`
CliRun run_cli(const fs::path & cwd, const std::string & args)
{
  CliRun run;
#ifndef POLYSCHEMA_CLI_PATH
  (void)cwd;
  (void)args;
#else
  const fs::path log = cwd / "cli_output.txt";
  const std::string cmd = "cd " + shell_quote(cwd.string()) + " && " +
                          shell_quote(POLYSCHEMA_CLI_PATH) + " " + args + " > " +
                          shell_quote(log.string()) + " 2>&1";

  const int rc = std::system(cmd.c_str());

#if defined(__unix__) || defined(__APPLE__)
  if (rc == -1) {
    run.exit_code = 127;
  } else if (WIFEXITED(rc)) {
    run.exit_code = WEXITSTATUS(rc);
  } else {
    run.exit_code = 128;
  }
#else
  run.exit_code = rc;
#endif
  run.output = read_all(log);
#endif
  return run;
}

}  // namespace

#ifndef POLYSCHEMA_CLI_PATH
#define SKIP_WITHOUT_CLI() \
  GTEST_SKIP() << "POLYSCHEMA_CLI_PATH is not configured (polyschema_cli target missing?)"
#else
#define SKIP_WITHOUT_CLI() (void)0
#endif

TEST(CliCommandsTest, CheckSucceedsOnValidCatalog)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_check");
  write_all(dir / "polyschema.yaml", k_catalog);

  const CliRun run = run_cli(dir, "check polyschema.yaml");
  EXPECT_EQ(run.exit_code, 0) << run.output;
  EXPECT_NE(run.output.find("OK: 1 hierarchies, 2 variants"), std::string::npos) << run.output;
}

TEST(CliCommandsTest, CheckFindsCatalogInParentDirectory)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_upward");
  write_all(dir / "polyschema.yaml", k_catalog);
  const fs::path nested = dir / "a" / "b";
  fs::create_directories(nested);

  const CliRun run = run_cli(nested, "check");
  EXPECT_EQ(run.exit_code, 0) << run.output;
}

TEST(CliCommandsTest, CheckFailsWithoutCatalog)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_nocatalog");

  const CliRun run = run_cli(dir, "check " + shell_quote((dir / "missing.yaml").string()));
  EXPECT_EQ(run.exit_code, 1) << run.output;
}

TEST(CliCommandsTest, CheckFailsOnDuplicateValue)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_duplicate");
  write_all(
    dir / "polyschema.yaml",
    R"(
hierarchies:
  - name: Config
    discriminator: mode
    variants:
      - { name: a, value: text }
      - { name: b, value: text }
)");

  const CliRun run = run_cli(dir, "check");
  EXPECT_EQ(run.exit_code, 1) << run.output;
  EXPECT_NE(run.output.find("DuplicateDiscriminator"), std::string::npos) << run.output;
}

TEST(CliCommandsTest, ListPrintsVariantsAndRejectsUnknownHierarchy)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_list");
  write_all(dir / "polyschema.yaml", k_catalog);

  const CliRun run = run_cli(dir, "list -q");
  EXPECT_EQ(run.exit_code, 0) << run.output;
  EXPECT_NE(run.output.find("\"number\" -> NumberConfig"), std::string::npos) << run.output;
  EXPECT_NE(run.output.find("\"text\" -> TextConfig"), std::string::npos) << run.output;

  EXPECT_EQ(run_cli(dir, "list -q --hierarchy Nope").exit_code, 1);
}

TEST(CliCommandsTest, ValidateReportsEachPayload)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_validate");
  write_all(dir / "polyschema.yaml", k_catalog);
  write_all(dir / "number.json", R"({"mode": "number", "number": 3.14})");
  write_all(dir / "bytes.json", R"({"mode": "bytes", "content": "AA=="})");

  const CliRun ok = run_cli(dir, "validate -q -H Config number.json");
  EXPECT_EQ(ok.exit_code, 0) << ok.output;
  EXPECT_NE(ok.output.find("NumberConfig"), std::string::npos) << ok.output;
  EXPECT_NE(ok.output.find("\"precision\": 2"), std::string::npos) << ok.output;

  const CliRun bad = run_cli(dir, "validate -q -H Config number.json bytes.json");
  EXPECT_EQ(bad.exit_code, 1) << bad.output;
  EXPECT_NE(bad.output.find("bytes"), std::string::npos) << bad.output;
}

TEST(CliCommandsTest, UsageErrorsExitWithTwo)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_usage");
  write_all(dir / "polyschema.yaml", k_catalog);

  EXPECT_EQ(run_cli(dir, "frobnicate").exit_code, 2);
  EXPECT_EQ(run_cli(dir, "check --bogus").exit_code, 2);
  EXPECT_EQ(run_cli(dir, "validate").exit_code, 2);
  EXPECT_EQ(run_cli(dir, "--help").exit_code, 0);
}

TEST(CliCommandsTest, FlagsOverrideCatalogLogLevel)
{
  SKIP_WITHOUT_CLI();
  const fs::path dir = make_temp_dir("polyschema_cli_loglevel");
  write_all(dir / "polyschema.yaml", k_catalog);

  // The catalog asks for debug output.
  const CliRun from_catalog = run_cli(dir, "check");
  EXPECT_EQ(from_catalog.exit_code, 0) << from_catalog.output;
  EXPECT_NE(from_catalog.output.find("registered variant"), std::string::npos)
    << from_catalog.output;

  const CliRun quiet = run_cli(dir, "check -q");
  EXPECT_EQ(quiet.exit_code, 0) << quiet.output;
  EXPECT_EQ(quiet.output.find("registered variant"), std::string::npos) << quiet.output;

  // And the other way round: an "off" catalog still logs under -v.
  const fs::path silent = make_temp_dir("polyschema_cli_loglevel_off");
  std::string catalog = k_catalog;
  catalog.replace(catalog.find("log_level: debug"), 16, "log_level: off");
  write_all(silent / "polyschema.yaml", catalog);

  EXPECT_EQ(run_cli(silent, "check").output.find("registered variant"), std::string::npos);
  EXPECT_NE(run_cli(silent, "check -v").output.find("registered variant"), std::string::npos);
}
