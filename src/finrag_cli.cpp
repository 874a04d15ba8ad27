#include <finrag/finrag_cli.h>

#include <finrag/analysis_pipeline_builder.h>
#include <finrag/cache_keys.h>
#include <finrag/http_providers.h>
#include <finrag/manifest_source.h>
#include <finrag/prompt_catalog.h>

#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

using finrag::CommonOptions;

constexpr const char kCommonUsage[] =
    "Common options:\n"
    "  --config <file>       YAML engine config\n"
    "  --data-dir <path>     Cache directory (default: finrag_data)\n"
    "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
    "  --verbose             Shortcut for --log-level info\n"
    "  --debug               Shortcut for --log-level debug\n"
    "  --help                Show this message\n";

void PrintIngestUsage(std::ostream &out) {
  out << "Usage: finrag ingest --file <path> --kind <filing|broker|industry>\n"
      << "                     --company <id> --title <text> [options]\n"
      << "Options:\n"
      << "  --id <id>             Document id (required for filings)\n"
      << "  --keywords <list>     Comma-separated industry keywords\n"
      << "  --published <date>    Publication date (YYYY-MM-DD)\n"
      << kCommonUsage;
}

void PrintAskUsage(std::ostream &out) {
  out << "Usage: finrag ask --company <id> --query <text> [--task <type>]\n"
      << kCommonUsage;
}

void PrintAnalyzeUsage(std::ostream &out) {
  out << "Usage: finrag analyze --manifest <yaml> --company <name> "
         "--query <text>\n"
      << "Options:\n"
      << "  --task <type>         Generation task (default: "
         "long_context_analysis)\n"
      << "  --years <n>           Skip time range extraction\n"
      << "  --keywords <list>     Skip industry keyword extraction\n"
      << "  --exclude-opinions    Answer from facts only, ignoring broker "
         "opinions\n"
      << kCommonUsage;
}

void PrintCacheUsage(std::ostream &out) {
  out << "Usage: finrag cache <stats|list|reset|remove> [options]\n"
      << "  list [--company <id>]  List cached documents\n"
      << "  remove --id <id>       Remove one cached document\n"
      << kCommonUsage;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

std::vector<std::string> SplitList(const std::string &raw) {
  std::vector<std::string> values;
  std::stringstream stream(raw);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = finrag::Trim(std::move(item));
    if (!item.empty()) {
      values.push_back(std::move(item));
    }
  }
  return values;
}

int ParsePositiveInt(const std::string &value, const std::string &flag) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument(flag + " must be an integer, got '" + value +
                                "'");
  }
  if (consumed != value.size() || parsed < 1) {
    throw std::invalid_argument(flag + " must be a positive integer, got '" +
                                value + "'");
  }
  return parsed;
}

bool HandleCommonOption(const std::vector<std::string> &arguments,
                        std::size_t &index, CommonOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--data-dir") {
    options.data_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--log-level") {
    options.log_level =
        finrag::ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = finrag::LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = finrag::LogLevel::kDebug;
    return true;
  }
  return false;
}

[[noreturn]] void ThrowUnknownArgument(const std::string &command,
                                       const std::string &argument) {
  throw std::invalid_argument("Unknown " + command +
                              " argument: " + argument);
}

template <typename Value>
const Value &Require(const std::optional<Value> &value,
                     const std::string &flag, const std::string &command) {
  if (!value) {
    throw std::invalid_argument(flag + " is required for " + command);
  }
  return *value;
}

std::string ReadDocumentFile(const std::filesystem::path &path) {
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Unable to read document file: " + path.string());
  }
  return std::string((std::istreambuf_iterator<char>(stream)),
                     std::istreambuf_iterator<char>());
}

struct CommandContext {
  finrag::EngineConfig config;
  std::shared_ptr<finrag::Logger> logger;
  std::shared_ptr<finrag::KnowledgeService> service;
};

CommandContext OpenService(const CommonOptions &options) {
  CommandContext context;
  context.config = finrag::ResolveEngineConfig(options);
  context.logger = finrag::MakeLogger(context.config.logging, std::clog);
  context.service = finrag::BuildKnowledgeService(
      context.config, std::make_shared<finrag::CurlTransport>(),
      context.logger);
  context.service->EnsureReady();
  return context;
}

class StreamStageObserver : public finrag::StageObserver {
public:
  explicit StreamStageObserver(std::ostream &out) : out_(&out) {}

  void OnStageEvent(const finrag::StageEvent &event) override {
    if (event.status == finrag::StageStatus::kStarted) {
      return;
    }
    *out_ << "[" << finrag::PipelineStageName(event.stage) << "] "
          << (event.status == finrag::StageStatus::kCompleted ? "done"
                                                              : "failed");
    if (!event.detail.empty()) {
      *out_ << ": " << event.detail;
    }
    *out_ << "\n";
  }

private:
  std::ostream *out_;
};

void PrintEntry(const finrag::CacheEntry &entry, std::ostream &out) {
  out << entry.document_id << "\t" << finrag::SourceKindName(entry.source_kind)
      << "\t" << entry.company_identifier << "\t" << entry.published_at << "\t"
      << entry.chunk_ids.size() << "\t" << entry.title << "\n";
}

} // namespace

namespace finrag {

IngestOptions ParseIngestArguments(const std::vector<std::string> &arguments) {
  IngestOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (HandleCommonOption(arguments, i, options.common)) {
      continue;
    }
    if (argument == "--file") {
      options.file = RequireValue(arguments, i, argument);
    } else if (argument == "--kind") {
      options.kind = ParseSourceKind(RequireValue(arguments, i, argument));
    } else if (argument == "--company") {
      options.company = RequireValue(arguments, i, argument);
    } else if (argument == "--title") {
      options.title = RequireValue(arguments, i, argument);
    } else if (argument == "--id") {
      options.document_id = RequireValue(arguments, i, argument);
    } else if (argument == "--published") {
      options.published_at = RequireValue(arguments, i, argument);
    } else if (argument == "--keywords") {
      const auto values = SplitList(RequireValue(arguments, i, argument));
      options.keywords.insert(options.keywords.end(), values.begin(),
                              values.end());
    } else {
      ThrowUnknownArgument("ingest", argument);
    }
  }
  return options;
}

AskOptions ParseAskArguments(const std::vector<std::string> &arguments) {
  AskOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (HandleCommonOption(arguments, i, options.common)) {
      continue;
    }
    if (argument == "--company") {
      options.company = RequireValue(arguments, i, argument);
    } else if (argument == "--query") {
      options.query = RequireValue(arguments, i, argument);
    } else if (argument == "--task") {
      options.task = RequireValue(arguments, i, argument);
    } else {
      ThrowUnknownArgument("ask", argument);
    }
  }
  return options;
}

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (HandleCommonOption(arguments, i, options.common)) {
      continue;
    }
    if (argument == "--manifest") {
      options.manifest = RequireValue(arguments, i, argument);
    } else if (argument == "--company") {
      options.company = RequireValue(arguments, i, argument);
    } else if (argument == "--query") {
      options.query = RequireValue(arguments, i, argument);
    } else if (argument == "--task") {
      options.task = RequireValue(arguments, i, argument);
    } else if (argument == "--years") {
      options.years =
          ParsePositiveInt(RequireValue(arguments, i, argument), argument);
    } else if (argument == "--keywords") {
      const auto values = SplitList(RequireValue(arguments, i, argument));
      options.keywords.insert(options.keywords.end(), values.begin(),
                              values.end());
    } else if (argument == "--exclude-opinions") {
      options.exclude_opinions = true;
    } else {
      ThrowUnknownArgument("analyze", argument);
    }
  }
  return options;
}

CacheOptions ParseCacheArguments(const std::vector<std::string> &arguments) {
  CacheOptions options;
  std::size_t first = 0;
  if (!arguments.empty() && arguments.front().rfind('-', 0) != 0) {
    options.action = arguments.front();
    first = 1;
  }
  for (std::size_t i = first; i < arguments.size(); ++i) {
    const auto &argument = arguments[i];
    if (HandleCommonOption(arguments, i, options.common)) {
      continue;
    }
    if (argument == "--company") {
      options.company = RequireValue(arguments, i, argument);
    } else if (argument == "--id") {
      options.document_id = RequireValue(arguments, i, argument);
    } else {
      ThrowUnknownArgument("cache", argument);
    }
  }
  return options;
}

CommonOptions ParseCommonArguments(const std::vector<std::string> &arguments) {
  CommonOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!HandleCommonOption(arguments, i, options)) {
      ThrowUnknownArgument("command", arguments[i]);
    }
  }
  return options;
}

EngineConfig MergeOptions(EngineConfig config, const CommonOptions &options) {
  if (options.data_directory) {
    config.data_directory = *options.data_directory;
  }
  if (options.log_level) {
    config.logging.level = *options.log_level;
  }
  return config;
}

EngineConfig ResolveEngineConfig(const CommonOptions &options) {
  EngineConfig config;
  if (options.config_file) {
    config = LoadEngineConfig(*options.config_file);
  }
  auto merged = MergeOptions(std::move(config), options);
  ValidateEngineConfig(merged);
  return merged;
}

std::shared_ptr<GenerationRouter>
BuildRouter(const EngineConfig &config,
            const std::shared_ptr<HttpTransport> &transport,
            const std::shared_ptr<Logger> &logger) {
  auto router = std::make_shared<GenerationRouter>(logger);
  for (const auto &provider : config.providers) {
    router->Register(MakeProvider(provider, transport), provider.is_default);
  }
  for (const auto &requirement : config.task_requirements) {
    router->SetTaskRequirement(requirement.first, requirement.second);
  }
  for (const auto &route : config.task_routes) {
    router->SetTaskRoute(route.first, route.second);
  }
  return router;
}

std::shared_ptr<KnowledgeService>
BuildKnowledgeService(const EngineConfig &config,
                      const std::shared_ptr<HttpTransport> &transport,
                      const std::shared_ptr<Logger> &logger) {
  auto prompts = config.prompts_file ? PromptCatalog::LoadFile(*config.prompts_file)
                                     : PromptCatalog::Defaults();
  return std::make_shared<KnowledgeService>(
      config, MakeEmbedder(config.embedding, transport),
      BuildRouter(config, transport, logger), std::move(prompts), logger);
}

void PrintAnalysisResult(const AnalysisResult &result, std::ostream &out) {
  out << "Company: " << result.company_name;
  if (!result.company_identifier.empty()) {
    out << " (" << result.company_identifier << ")";
  }
  out << "\n";
  if (result.years > 0) {
    out << "Years: " << result.years << "\n";
  }
  if (!result.industry_keywords.empty()) {
    out << "Industry keywords:";
    for (const auto &keyword : result.industry_keywords) {
      out << " " << keyword;
    }
    out << "\n";
  }
  for (const auto &document : result.documents) {
    out << "  " << (document.cache_hit ? "cached " : "fetched") << " "
        << SourceKindName(document.source_kind) << " " << document.document_id
        << " (" << document.chunk_count << " chunks) " << document.title
        << "\n";
  }
  for (const auto &message : result.messages) {
    out << "Note: " << message << "\n";
  }
  if (!result.success) {
    out << "Failed";
    if (result.last_completed_stage) {
      out << " after " << PipelineStageName(*result.last_completed_stage);
    }
    out << " [" << result.failure_kind << "]: " << result.failure_reason
        << "\n";
    return;
  }
  out << "Passages: " << result.passages.size() << "\n";
  if (!result.provider_used.empty()) {
    out << "Provider: " << result.provider_used << "\n\n"
        << result.generated_text << "\n";
  }
}

int RunIngest(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseIngestArguments(arguments);
  if (options.common.show_help) {
    PrintIngestUsage(out);
    return 0;
  }

  Document document;
  document.raw_text = ReadDocumentFile(Require(options.file, "--file", "ingest"));
  document.source_kind = Require(options.kind, "--kind", "ingest");
  document.title = Require(options.title, "--title", "ingest");
  document.company_identifier = options.company.value_or("");
  document.document_id = options.document_id.value_or("");
  document.published_at = options.published_at.value_or("");
  document.keywords = options.keywords;
  document.locator = options.file->string();
  if (document.source_kind != SourceKind::kIndustryReport) {
    Require(options.company, "--company", "ingest");
  }

  auto context = OpenService(options.common);
  const auto entry = context.service->SubmitDocument(document);
  out << "Stored " << entry.document_id << " with " << entry.chunk_ids.size()
      << " chunks\n";
  return 0;
}

int RunAsk(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseAskArguments(arguments);
  if (options.common.show_help) {
    PrintAskUsage(out);
    return 0;
  }
  const auto &company = Require(options.company, "--company", "ask");
  const auto &query = Require(options.query, "--query", "ask");

  auto context = OpenService(options.common);
  const auto result = context.service->Ask(
      company, query, options.task.value_or(kLongContextAnalysisTask));
  out << "Passages: " << result.passages.size() << "\n";
  for (const auto &passage : result.passages) {
    out << "  " << std::fixed << std::setprecision(3) << passage.score << " "
        << passage.chunk_id << " " << passage.title << "\n";
  }
  if (!result.provider_used.empty()) {
    out << "Provider: " << result.provider_used << "\n\n"
        << result.generated_text << "\n";
  }
  return 0;
}

int RunAnalyze(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseAnalyzeArguments(arguments);
  if (options.common.show_help) {
    PrintAnalyzeUsage(out);
    return 0;
  }
  const auto &manifest = Require(options.manifest, "--manifest", "analyze");
  AnalysisRequest request;
  request.company_name = Require(options.company, "--company", "analyze");
  request.query = Require(options.query, "--query", "analyze");
  request.task_type = options.task.value_or(kLongContextAnalysisTask);
  request.years = options.years;
  request.industry_keywords = options.keywords;
  request.exclude_opinions = options.exclude_opinions;

  auto context = OpenService(options.common);
  auto catalog = std::make_shared<const ManifestCatalog>(
      ManifestCatalog::Load(manifest));

  AnalysisPipelineBuilder builder(context.service);
  builder.WithResolver(std::make_shared<ManifestCompanyResolver>(catalog))
      .WithObserver(std::make_shared<StreamStageObserver>(out))
      .WithLogger(context.logger);
  for (const auto kind : {SourceKind::kRegulatoryFiling,
                          SourceKind::kBrokerReport,
                          SourceKind::kIndustryReport}) {
    builder.WithSource(
        std::make_shared<ManifestDocumentSource>(catalog, kind, context.logger));
  }

  const auto result = builder.Build().Run(request);
  PrintAnalysisResult(result, out);
  return result.success ? 0 : 2;
}

int RunCacheCommand(const std::vector<std::string> &arguments,
                    std::ostream &out) {
  const auto options = ParseCacheArguments(arguments);
  if (options.common.show_help || options.action.empty()) {
    PrintCacheUsage(out);
    return options.common.show_help ? 0 : 1;
  }

  if (options.action == "stats") {
    auto context = OpenService(options.common);
    const auto stats = context.service->CacheStatistics();
    out << "documents: " << stats.total_documents << "\n"
        << "chunks: " << stats.total_chunks << "\n"
        << "characters: " << stats.total_characters << "\n"
        << "companies: " << stats.distinct_companies << "\n";
    for (const auto &company : stats.companies) {
      out << "  " << company << "\n";
    }
    return 0;
  }
  if (options.action == "list") {
    auto context = OpenService(options.common);
    const auto entries =
        options.company ? context.service->DocumentsForCompany(*options.company)
                        : context.service->Cache().Entries();
    for (const auto &entry : entries) {
      PrintEntry(entry, out);
    }
    return 0;
  }
  if (options.action == "reset") {
    auto context = OpenService(options.common);
    context.service->ResetCache();
    out << "Cache reset\n";
    return 0;
  }
  if (options.action == "remove") {
    const auto &document_id = Require(options.document_id, "--id", "cache remove");
    auto context = OpenService(options.common);
    if (context.service->RemoveDocument(document_id)) {
      out << "Removed " << document_id << "\n";
      return 0;
    }
    out << "Not cached: " << document_id << "\n";
    return 1;
  }
  out << "Unknown cache subcommand: " << options.action << "\n";
  return 1;
}

int RunProviders(const std::vector<std::string> &arguments, std::ostream &out) {
  const auto options = ParseCommonArguments(arguments);
  if (options.show_help) {
    out << "Usage: finrag providers\n" << kCommonUsage;
    return 0;
  }
  const auto config = ResolveEngineConfig(options);
  const auto router = BuildRouter(
      config, std::make_shared<CurlTransport>(),
      MakeLogger(config.logging, std::clog));
  if (router->Empty()) {
    out << "No generation providers configured\n";
    return 0;
  }
  for (const auto &provider : router->Providers()) {
    const auto &capabilities = provider.capabilities;
    out << provider.name << (provider.is_default ? " (default)" : "")
        << "\tcontext_window=" << capabilities.context_window
        << "\tlong_context=" << (capabilities.supports_long_context ? "yes" : "no")
        << "\tcost=" << CostTierName(capabilities.relative_cost)
        << "\tspeed=" << SpeedTierName(capabilities.relative_speed) << "\n";
  }
  return 0;
}

} // namespace finrag
