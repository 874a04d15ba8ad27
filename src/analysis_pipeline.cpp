#include <finrag/analysis_pipeline.h>

#include <finrag/cache_keys.h>
#include <finrag/errors.h>
#include <finrag/generation_router.h>
#include <finrag/prompt_catalog.h>

#include <algorithm>
#include <ctime>
#include <sstream>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

using Clock = std::chrono::steady_clock;

std::string BracedSlice(const std::string &text, char open, char close) {
  const auto begin = text.find(open);
  const auto end = text.rfind(close);
  if (begin == std::string::npos || end == std::string::npos || end < begin) {
    return {};
  }
  return text.substr(begin, end - begin + 1);
}

std::string MillisecondsSince(Clock::time_point start) {
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                            Clock::now() - start)
                            .count());
}

std::vector<std::string> SequenceValues(const YAML::Node &node) {
  std::vector<std::string> values;
  if (!node || !node.IsSequence()) {
    return values;
  }
  for (const auto &item : node) {
    if (item.IsScalar()) {
      values.push_back(item.as<std::string>());
    }
  }
  return values;
}

} // namespace

namespace finrag {

std::optional<int> ParseYearsAnswer(const std::string &answer, int max_years) {
  const auto braced = BracedSlice(answer, '{', '}');
  if (braced.empty()) {
    return std::nullopt;
  }
  try {
    const auto root = YAML::Load(braced);
    if (!root.IsMap() || !root["years"]) {
      return std::nullopt;
    }
    const auto years = root["years"].as<int>();
    return std::clamp(years, 1, std::max(1, max_years));
  } catch (const YAML::Exception &) {
    return std::nullopt;
  }
}

std::vector<std::string> ParseKeywordsAnswer(const std::string &answer) {
  const auto braced = BracedSlice(answer, '{', '}');
  const auto bracketed = BracedSlice(answer, '[', ']');
  try {
    if (!braced.empty()) {
      const auto root = YAML::Load(braced);
      if (root.IsMap()) {
        return NormalizeKeywords(SequenceValues(root["keywords"]));
      }
    }
    if (!bracketed.empty()) {
      return NormalizeKeywords(SequenceValues(YAML::Load(bracketed)));
    }
  } catch (const YAML::Exception &) {
    // Not structured; fall through to the plain list form.
  }

  std::vector<std::string> keywords;
  std::stringstream stream(answer);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item.erase(std::remove_if(item.begin(), item.end(),
                              [](char c) {
                                return c == '"' || c == '\'' || c == '[' ||
                                       c == ']' || c == '\n';
                              }),
               item.end());
    keywords.push_back(item);
  }
  return NormalizeKeywords(keywords);
}

std::string PublishedAfter(int years,
                           std::chrono::system_clock::time_point now) {
  const auto start = now - std::chrono::hours(24 * 365 * std::max(0, years));
  const auto seconds = std::chrono::system_clock::to_time_t(start);
  std::tm utc{};
#ifdef _WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &utc);
  return buffer;
}

AnalysisPipeline::AnalysisPipeline(std::shared_ptr<KnowledgeService> service,
                                   PipelineComponents components)
    : service_(std::move(service)), resolver_(std::move(components.resolver)),
      sources_(std::move(components.sources)),
      observer_(std::move(components.observer)),
      logger_(EnsureLogger(std::move(components.logger))) {}

void AnalysisPipeline::Notify(PipelineStage stage, StageStatus status,
                              const std::string &detail) const {
  if (observer_) {
    observer_->OnStageEvent(StageEvent{stage, status, detail});
  }
}

int AnalysisPipeline::DetermineYears(const AnalysisRequest &request,
                                     AnalysisResult &result) const {
  const auto &config = service_->Config();
  if (request.years) {
    return std::clamp(*request.years, 1, config.max_years);
  }
  try {
    const auto prompt = service_->Prompts().Render(
        kTimeRangePrompt, {{"user_query", request.query}});
    const auto outcome =
        service_->Router().Generate(kQueryAnalysisTask, prompt);
    if (const auto years = ParseYearsAnswer(outcome.text, config.max_years)) {
      return *years;
    }
    logger_->Log(LogLevel::kWarn, "pipeline.time_range.unparsed",
                 {{"answer", outcome.text}});
    result.messages.push_back("Time range answer was not understood; using " +
                              std::to_string(config.default_years) +
                              " years");
  } catch (const std::runtime_error &error) {
    logger_->Log(LogLevel::kWarn, "pipeline.time_range.failed",
                 {{"error", error.what()}});
    result.messages.push_back("Time range extraction failed; using " +
                              std::to_string(config.default_years) + " years");
  }
  return config.default_years;
}

std::vector<std::string>
AnalysisPipeline::DetermineKeywords(const AnalysisRequest &request,
                                    AnalysisResult &result) const {
  if (!request.industry_keywords.empty()) {
    return NormalizeKeywords(request.industry_keywords);
  }
  try {
    const auto prompt = service_->Prompts().Render(
        kIndustryKeywordsPrompt, {{"company_name", request.company_name},
                                  {"user_query", request.query}});
    const auto outcome =
        service_->Router().Generate(kKeywordExtractionTask, prompt);
    return ParseKeywordsAnswer(outcome.text);
  } catch (const std::runtime_error &error) {
    logger_->Log(LogLevel::kWarn, "pipeline.keywords.failed",
                 {{"error", error.what()}});
    result.messages.push_back("Industry keyword extraction failed");
  }
  return {};
}

std::vector<AnalysisPipeline::PendingFetch>
AnalysisPipeline::SearchSources(const AnalysisRequest &request,
                                AnalysisResult &result) const {
  const auto limit = service_->Config().max_documents_per_source;
  FetchFilters base;
  base.published_after =
      PublishedAfter(result.years, std::chrono::system_clock::now());
  base.max_documents = limit;

  std::vector<PendingFetch> pending;
  bool keywords_determined = false;
  for (const auto &source : sources_) {
    auto filters = base;
    if (source->Kind() == SourceKind::kIndustryReport) {
      if (!keywords_determined) {
        result.industry_keywords = DetermineKeywords(request, result);
        keywords_determined = true;
      }
      if (result.industry_keywords.empty()) {
        result.messages.push_back(
            "No industry keywords; industry reports skipped");
        continue;
      }
      // A cached report covering the same topics makes a new search moot.
      const auto cached =
          service_->Cache().FindAllMatching(result.industry_keywords);
      if (!cached.empty()) {
        const auto count = std::min(cached.size(), limit);
        for (std::size_t i = 0; i < count; ++i) {
          result.documents.push_back({cached[i].document_id,
                                      cached[i].source_kind, cached[i].title,
                                      true, cached[i].chunk_ids.size()});
        }
        result.messages.push_back("Reused " + std::to_string(count) +
                                  " cached industry report(s)");
        continue;
      }
      filters.keywords = result.industry_keywords;
    }

    auto references = source->Search(result.company_identifier, filters);
    if (references.size() > limit) {
      references.resize(limit);
    }
    logger_->Log(LogLevel::kDebug, "pipeline.search",
                 {{"kind", SourceKindName(source->Kind())},
                  {"found", std::to_string(references.size())}});
    for (auto &reference : references) {
      pending.push_back({source, std::move(reference)});
    }
  }
  return pending;
}

void AnalysisPipeline::FetchOrReuse(const std::vector<PendingFetch> &pending,
                                    AnalysisResult &result) const {
  for (const auto &item : pending) {
    const auto &reference = item.reference;
    CacheLookup lookup;
    lookup.source_kind = reference.source_kind;
    lookup.document_id = reference.document_id;
    lookup.company_identifier = reference.company_identifier.empty()
                                    ? result.company_identifier
                                    : reference.company_identifier;
    lookup.title = reference.title;
    lookup.keywords = reference.keywords;

    if (const auto cached = service_->CheckCached(lookup)) {
      result.documents.push_back({cached->document_id, cached->source_kind,
                                  cached->title, true,
                                  cached->chunk_ids.size()});
      continue;
    }

    auto document = item.source->Fetch(reference);
    if (document.company_identifier.empty()) {
      document.company_identifier = lookup.company_identifier;
    }
    const auto entry = service_->SubmitDocument(document);
    result.documents.push_back({entry.document_id, entry.source_kind,
                                entry.title, false, entry.chunk_ids.size()});
  }
}

AnalysisResult AnalysisPipeline::Run(const AnalysisRequest &request) const {
  AnalysisResult result;
  result.company_name = request.company_name;
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"company", request.company_name},
                {"task", request.task_type},
                {"sources", std::to_string(sources_.size())}});

  const auto pipeline_start = Clock::now();
  auto stage_start = pipeline_start;
  auto current = PipelineStage::kResolvingCompany;

  const auto enter = [&](PipelineStage stage, const std::string &detail) {
    current = stage;
    result.stage = stage;
    stage_start = Clock::now();
    Notify(stage, StageStatus::kStarted, detail);
  };
  const auto complete = [&](const std::string &detail) {
    result.last_completed_stage = current;
    logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
                 {{"stage", PipelineStageName(current)},
                  {"detail", detail},
                  {"duration_ms", MillisecondsSince(stage_start)}});
    Notify(current, StageStatus::kCompleted, detail);
  };
  const auto fail = [&](const std::string &kind, const std::exception &error) {
    result.success = false;
    result.failure_kind = kind;
    result.failure_reason = error.what();
    result.stage = PipelineStage::kFailed;
    logger_->Log(LogLevel::kError, "pipeline.failed",
                 {{"stage", PipelineStageName(current)},
                  {"kind", kind},
                  {"error", error.what()}});
    Notify(current, StageStatus::kFailed, error.what());
  };

  try {
    enter(PipelineStage::kResolvingCompany, request.company_name);
    const auto identifier = resolver_->Resolve(request.company_name);
    if (!identifier || identifier->empty()) {
      throw CompanyNotResolved(request.company_name);
    }
    result.company_identifier = *identifier;
    complete(*identifier);

    enter(PipelineStage::kSearchingDocuments, result.company_identifier);
    result.years = DetermineYears(request, result);
    const auto pending = SearchSources(request, result);
    complete(std::to_string(pending.size()) + " reference(s)");

    enter(PipelineStage::kFetchingOrCached,
          std::to_string(pending.size()) + " reference(s)");
    FetchOrReuse(pending, result);
    if (result.documents.empty()) {
      result.messages.push_back("No documents found for " +
                                result.company_identifier);
    }
    complete(std::to_string(result.documents.size()) + " document(s)");

    enter(PipelineStage::kRetrieving, request.query);
    result.passages =
        service_->Retrieve(request.query, result.company_identifier);
    complete(std::to_string(result.passages.size()) + " passage(s)");

    enter(PipelineStage::kGenerating, request.task_type);
    if (result.passages.empty()) {
      result.messages.push_back(
          "No relevant passages were retrieved; generation skipped");
      complete("skipped");
    } else {
      auto outcome =
          service_->GenerateAnswer(request.company_name, request.query,
                                   request.task_type, result.passages,
                                   request.exclude_opinions);
      result.generated_text = std::move(outcome.text);
      result.provider_used = std::move(outcome.provider_name);
      complete(result.provider_used);
    }

    result.stage = PipelineStage::kDone;
    result.success = true;
    Notify(PipelineStage::kDone, StageStatus::kCompleted,
           result.provider_used);
  } catch (const CompanyNotResolved &error) {
    fail("company_not_resolved", error);
  } catch (const NoProviderRegistered &error) {
    fail("no_provider_registered", error);
  } catch (const GenerationFailed &error) {
    fail("generation_failed", error);
  } catch (const CacheInconsistency &error) {
    fail("cache_inconsistency", error);
  } catch (const InvalidDocument &error) {
    fail("invalid_document", error);
  } catch (const InvalidConfig &error) {
    fail("invalid_config", error);
  } catch (const std::exception &error) {
    fail("source_failure", error);
  }

  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"success", result.success ? "true" : "false"},
                {"stage", PipelineStageName(result.stage)},
                {"documents", std::to_string(result.documents.size())},
                {"duration_ms", MillisecondsSince(pipeline_start)}});
  return result;
}

} // namespace finrag
