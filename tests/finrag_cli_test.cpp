#include <finrag/errors.h>
#include <finrag/finrag_cli.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace finrag {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Not;

TEST(FinragCliTest, ParsesIngestArguments) {
  const auto options = ParseIngestArguments(
      {"--file", "report.txt", "--kind", "industry", "--title", "HBM outlook",
       "--keywords", "HBM, memory", "--keywords", "AI", "--published",
       "2025-04-01", "--data-dir", "/tmp/finrag", "--debug"});

  EXPECT_EQ(options.file, std::filesystem::path("report.txt"));
  EXPECT_EQ(options.kind, SourceKind::kIndustryReport);
  EXPECT_EQ(options.title, "HBM outlook");
  EXPECT_THAT(options.keywords, ElementsAre("HBM", "memory", "AI"));
  EXPECT_EQ(options.published_at, "2025-04-01");
  EXPECT_EQ(options.common.data_directory, std::filesystem::path("/tmp/finrag"));
  EXPECT_EQ(options.common.log_level, LogLevel::kDebug);
}

TEST(FinragCliTest, ParsesAnalyzeArguments) {
  const auto options = ParseAnalyzeArguments(
      {"--manifest", "m.yaml", "--company", "Samsung", "--query",
       "How is HBM going?", "--years", "2", "--task", "query_analysis"});

  EXPECT_EQ(options.manifest, std::filesystem::path("m.yaml"));
  EXPECT_EQ(options.company, "Samsung");
  EXPECT_EQ(options.query, "How is HBM going?");
  EXPECT_EQ(options.years, 2);
  EXPECT_EQ(options.task, "query_analysis");
  EXPECT_FALSE(options.exclude_opinions);
}

TEST(FinragCliTest, ParsesExcludeOpinionsFlag) {
  const auto options = ParseAnalyzeArguments(
      {"--company", "Samsung", "--query", "Margins?", "--exclude-opinions"});

  EXPECT_TRUE(options.exclude_opinions);
}

TEST(FinragCliTest, RejectsBadArguments) {
  try {
    ParseAskArguments({"--company", "005930", "--colour", "red"});
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_STREQ(error.what(), "Unknown ask argument: --colour");
  }
  EXPECT_THROW(ParseAskArguments({"--query"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--years", "0"}), std::invalid_argument);
  EXPECT_THROW(ParseAnalyzeArguments({"--years", "two"}),
               std::invalid_argument);
  EXPECT_THROW(ParseIngestArguments({"--kind", "memo"}), std::invalid_argument);
  EXPECT_THROW(ParseCommonArguments({"--log-level", "chatty"}),
               std::invalid_argument);
}

TEST(FinragCliTest, ParsesCacheSubcommand) {
  const auto options =
      ParseCacheArguments({"remove", "--id", "r1", "--data-dir", "cache"});

  EXPECT_EQ(options.action, "remove");
  EXPECT_EQ(options.document_id, "r1");
  EXPECT_TRUE(ParseCacheArguments({"--help"}).action.empty());
}

TEST(FinragCliTest, CommandLineOverridesConfigFile) {
  test::TemporaryDirectory directory;
  const auto config_file = directory.AddFile(
      "finrag.yaml", "data_dir: from_file\nlog_level: error\ntop_k: 7\n");
  CommonOptions options;
  options.config_file = config_file;
  options.data_directory = directory.root() / "from_flag";

  const auto config = ResolveEngineConfig(options);

  EXPECT_EQ(config.data_directory, directory.root() / "from_flag");
  EXPECT_EQ(config.logging.level, LogLevel::kError);
  EXPECT_EQ(config.retrieval.top_k, 7u);
}

TEST(FinragCliTest, MergeKeepsConfigValuesWithoutFlags) {
  EngineConfig config;
  config.data_directory = "configured";

  const auto merged = MergeOptions(config, CommonOptions{});

  EXPECT_EQ(merged.data_directory, std::filesystem::path("configured"));
  EXPECT_EQ(merged.logging.level, LogLevel::kWarn);
}

class FinragCliCommandTest : public ::testing::Test {
protected:
  std::vector<std::string> WithDataDir(std::vector<std::string> arguments) {
    arguments.push_back("--data-dir");
    arguments.push_back((directory_.root() / "data").string());
    arguments.push_back("--log-level");
    arguments.push_back("error");
    return arguments;
  }

  test::TemporaryDirectory directory_;
  std::ostringstream out_;
};

TEST_F(FinragCliCommandTest, IngestThenInspectCache) {
  const auto file =
      directory_.AddFile("filing.txt", "Revenue grew eleven percent.");

  ASSERT_EQ(RunIngest(WithDataDir({"--file", file.string(), "--kind", "filing",
                                   "--company", "005930", "--title",
                                   "Annual report", "--id", "20250311000001"}),
                      out_),
            0);
  EXPECT_EQ(out_.str(), "Stored 20250311000001 with 1 chunks\n");

  std::ostringstream stats;
  ASSERT_EQ(RunCacheCommand(WithDataDir({"stats"}), stats), 0);
  EXPECT_THAT(stats.str(), HasSubstr("documents: 1\n"));
  EXPECT_THAT(stats.str(), HasSubstr("chunks: 1\n"));
  EXPECT_THAT(stats.str(), HasSubstr("characters: 28\n"));
  EXPECT_THAT(stats.str(), HasSubstr("  005930\n"));

  std::ostringstream listing;
  ASSERT_EQ(RunCacheCommand(WithDataDir({"list", "--company", "005930"}),
                            listing),
            0);
  EXPECT_EQ(listing.str(), "20250311000001\tregulatory-filing\t005930\t\t1\t"
                           "Annual report\n");
}

TEST_F(FinragCliCommandTest, IngestRequiresCompanyForFilings) {
  const auto file = directory_.AddFile("filing.txt", "text");

  EXPECT_THROW(RunIngest(WithDataDir({"--file", file.string(), "--kind",
                                      "filing", "--title", "Annual report"}),
                         out_),
               std::invalid_argument);
}

TEST_F(FinragCliCommandTest, RemoveAndResetCache) {
  const auto file = directory_.AddFile("broker.txt", "Margins recover.");
  RunIngest(WithDataDir({"--file", file.string(), "--kind", "broker",
                         "--company", "005930", "--title", "Memory upcycle"}),
            out_);

  std::ostringstream removed;
  EXPECT_EQ(RunCacheCommand(WithDataDir({"remove", "--id",
                                         "broker:005930:memory upcycle"}),
                            removed),
            0);
  EXPECT_EQ(removed.str(), "Removed broker:005930:memory upcycle\n");

  std::ostringstream missing;
  EXPECT_EQ(RunCacheCommand(WithDataDir({"remove", "--id", "nope"}), missing),
            1);
  EXPECT_EQ(missing.str(), "Not cached: nope\n");

  std::ostringstream reset;
  EXPECT_EQ(RunCacheCommand(WithDataDir({"reset"}), reset), 0);
  EXPECT_EQ(reset.str(), "Cache reset\n");
}

TEST_F(FinragCliCommandTest, CacheWithoutSubcommandPrintsUsage) {
  EXPECT_EQ(RunCacheCommand({}, out_), 1);
  EXPECT_THAT(out_.str(), HasSubstr("Usage: finrag cache"));
}

TEST_F(FinragCliCommandTest, AnalyzeUnknownCompanyExitsWithTwo) {
  const auto manifest = directory_.AddFile(
      "manifest.yaml",
      "companies:\n  - identifier: \"005930\"\n    names: [Samsung]\n");

  const auto code = RunAnalyze(
      WithDataDir({"--manifest", manifest.string(), "--company", "Nokia",
                   "--query", "How is revenue?"}),
      out_);

  EXPECT_EQ(code, 2);
  EXPECT_THAT(out_.str(), HasSubstr("[resolving_company] failed"));
  EXPECT_THAT(out_.str(), HasSubstr("Failed [company_not_resolved]"));
  EXPECT_THAT(out_.str(), Not(HasSubstr("Passages:")));
}

TEST_F(FinragCliCommandTest, AnalyzeFetchesManifestDocuments) {
  directory_.AddFile("docs/filing.txt", "Revenue grew.");
  const auto manifest = directory_.AddFile("manifest.yaml", R"(companies:
  - identifier: "005930"
    names: [Samsung Electronics]
documents:
  - kind: filing
    id: "20250311000001"
    company: "005930"
    title: Annual report
    published_at: "2099-01-01"
    file: docs/filing.txt
)");

  const auto code = RunAnalyze(
      WithDataDir({"--manifest", manifest.string(), "--company", "Samsung",
                   "--query", "Why did margins move?", "--years", "1"}),
      out_);

  EXPECT_EQ(code, 0);
  EXPECT_THAT(out_.str(), HasSubstr("Company: Samsung (005930)"));
  EXPECT_THAT(out_.str(),
              HasSubstr("fetched regulatory-filing 20250311000001"));
  EXPECT_THAT(out_.str(), HasSubstr("Passages: 0"));
}

TEST_F(FinragCliCommandTest, ProvidersListsConfiguredBackends) {
  const auto config_file = directory_.AddFile("finrag.yaml", R"(providers:
  - name: local
    type: ollama
    endpoint: http://localhost:11434
    model: llama3
  - name: cloud
    type: openai
    endpoint: https://api.openai.com/v1
    model: gpt-4o
    default: true
    capabilities:
      context_window: 128000
      long_context: true
)");

  ASSERT_EQ(RunProviders({"--config", config_file.string()}, out_), 0);

  EXPECT_THAT(out_.str(), HasSubstr("local\tcontext_window=4096"));
  EXPECT_THAT(out_.str(),
              HasSubstr("cloud (default)\tcontext_window=128000"
                        "\tlong_context=yes"));
}

} // namespace
} // namespace finrag
