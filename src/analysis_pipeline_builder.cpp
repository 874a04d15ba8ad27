#include <finrag/analysis_pipeline_builder.h>

#include <stdexcept>
#include <utility>

namespace finrag {

AnalysisPipelineBuilder::AnalysisPipelineBuilder(
    std::shared_ptr<KnowledgeService> service)
    : service_(std::move(service)) {}

AnalysisPipelineBuilder &AnalysisPipelineBuilder::WithResolver(
    std::shared_ptr<CompanyResolver> resolver) {
  components_.resolver = std::move(resolver);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithSource(std::shared_ptr<DocumentSource> source) {
  if (source) {
    components_.sources.push_back(std::move(source));
  }
  return *this;
}

AnalysisPipelineBuilder &AnalysisPipelineBuilder::WithObserver(
    std::shared_ptr<StageObserver> observer) {
  components_.observer = std::move(observer);
  return *this;
}

AnalysisPipelineBuilder &
AnalysisPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalysisPipeline AnalysisPipelineBuilder::Build() {
  if (!service_) {
    throw std::invalid_argument("Analysis pipeline requires a knowledge service");
  }
  if (!components_.resolver) {
    throw std::invalid_argument("Analysis pipeline requires a company resolver");
  }
  if (components_.sources.empty()) {
    throw std::invalid_argument(
        "Analysis pipeline requires at least one document source");
  }
  components_.logger = EnsureLogger(std::move(components_.logger));
  return AnalysisPipeline(service_, std::move(components_));
}

} // namespace finrag
