#pragma once

#include <finrag/interfaces.h>
#include <finrag/knowledge_service.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

struct PipelineComponents {
  std::shared_ptr<CompanyResolver> resolver;
  std::vector<std::shared_ptr<DocumentSource>> sources;
  std::shared_ptr<StageObserver> observer;
  std::shared_ptr<Logger> logger;
};

// Extracts {"years": N} from a model answer and clamps N to [1, max_years].
std::optional<int> ParseYearsAnswer(const std::string &answer, int max_years);
// Accepts {"keywords": [...]} or a comma-separated list.
std::vector<std::string> ParseKeywordsAnswer(const std::string &answer);
std::string PublishedAfter(int years, std::chrono::system_clock::time_point now);

// ResolvingCompany -> SearchingDocuments -> FetchingOrCached -> Retrieving ->
// Generating -> Done. Any failure ends in Failed with a partial result; the
// pipeline keeps no state between runs.
class AnalysisPipeline {
public:
  AnalysisPipeline(std::shared_ptr<KnowledgeService> service,
                   PipelineComponents components);

  AnalysisResult Run(const AnalysisRequest &request) const;

private:
  struct PendingFetch {
    std::shared_ptr<DocumentSource> source;
    DocumentReference reference;
  };

  int DetermineYears(const AnalysisRequest &request,
                     AnalysisResult &result) const;
  std::vector<std::string> DetermineKeywords(const AnalysisRequest &request,
                                             AnalysisResult &result) const;
  std::vector<PendingFetch> SearchSources(const AnalysisRequest &request,
                                          AnalysisResult &result) const;
  void FetchOrReuse(const std::vector<PendingFetch> &pending,
                    AnalysisResult &result) const;
  void Notify(PipelineStage stage, StageStatus status,
              const std::string &detail) const;

  std::shared_ptr<KnowledgeService> service_;
  std::shared_ptr<CompanyResolver> resolver_;
  std::vector<std::shared_ptr<DocumentSource>> sources_;
  std::shared_ptr<StageObserver> observer_;
  std::shared_ptr<Logger> logger_;
};

} // namespace finrag
