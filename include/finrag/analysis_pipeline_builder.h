#pragma once

#include <finrag/analysis_pipeline.h>
#include <finrag/interfaces.h>
#include <finrag/knowledge_service.h>
#include <finrag/logging.h>

#include <memory>

namespace finrag {

class AnalysisPipelineBuilder {
public:
  explicit AnalysisPipelineBuilder(std::shared_ptr<KnowledgeService> service);

  AnalysisPipelineBuilder &
  WithResolver(std::shared_ptr<CompanyResolver> resolver);
  AnalysisPipelineBuilder &WithSource(std::shared_ptr<DocumentSource> source);
  AnalysisPipelineBuilder &
  WithObserver(std::shared_ptr<StageObserver> observer);
  AnalysisPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);

  // Throws std::invalid_argument when no resolver or no source was given.
  AnalysisPipeline Build();

private:
  std::shared_ptr<KnowledgeService> service_;
  PipelineComponents components_;
};

} // namespace finrag
