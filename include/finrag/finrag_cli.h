#pragma once

#include <finrag/config.h>
#include <finrag/http_client.h>
#include <finrag/knowledge_service.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

struct CommonOptions {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> data_directory;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

struct IngestOptions {
  CommonOptions common;
  std::optional<std::filesystem::path> file;
  std::optional<SourceKind> kind;
  std::optional<std::string> company;
  std::optional<std::string> title;
  std::optional<std::string> document_id;
  std::optional<std::string> published_at;
  std::vector<std::string> keywords;
};

struct AskOptions {
  CommonOptions common;
  std::optional<std::string> company;
  std::optional<std::string> query;
  std::optional<std::string> task;
};

struct AnalyzeOptions {
  CommonOptions common;
  std::optional<std::filesystem::path> manifest;
  std::optional<std::string> company;
  std::optional<std::string> query;
  std::optional<std::string> task;
  std::optional<int> years;
  std::vector<std::string> keywords;
  bool exclude_opinions = false;
};

struct CacheOptions {
  CommonOptions common;
  std::string action;
  std::optional<std::string> company;
  std::optional<std::string> document_id;
};

IngestOptions ParseIngestArguments(const std::vector<std::string> &arguments);
AskOptions ParseAskArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
CacheOptions ParseCacheArguments(const std::vector<std::string> &arguments);
CommonOptions ParseCommonArguments(const std::vector<std::string> &arguments);

// Command-line values win over the config file. Validation runs on the
// merged result.
EngineConfig MergeOptions(EngineConfig config, const CommonOptions &options);
EngineConfig ResolveEngineConfig(const CommonOptions &options);

// Registers one provider per config entry and applies routes and
// requirements.
std::shared_ptr<GenerationRouter>
BuildRouter(const EngineConfig &config,
            const std::shared_ptr<HttpTransport> &transport,
            const std::shared_ptr<Logger> &logger);
std::shared_ptr<KnowledgeService>
BuildKnowledgeService(const EngineConfig &config,
                      const std::shared_ptr<HttpTransport> &transport,
                      const std::shared_ptr<Logger> &logger);

void PrintAnalysisResult(const AnalysisResult &result, std::ostream &out);

int RunIngest(const std::vector<std::string> &arguments, std::ostream &out);
int RunAsk(const std::vector<std::string> &arguments, std::ostream &out);
// Returns 2 when the pipeline ends in Failed.
int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out);
int RunCacheCommand(const std::vector<std::string> &arguments,
                    std::ostream &out);
int RunProviders(const std::vector<std::string> &arguments, std::ostream &out);

} // namespace finrag
