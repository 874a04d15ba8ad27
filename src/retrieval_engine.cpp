#include <finrag/retrieval_engine.h>

#include <finrag/cache_keys.h>
#include <finrag/errors.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

void ValidateThreshold(float score_threshold) {
  if (!(score_threshold >= -1.0F && score_threshold <= 1.0F)) {
    throw finrag::InvalidConfig("score_threshold must be within [-1, 1], got " +
                                std::to_string(score_threshold));
  }
}

} // namespace

namespace finrag {

void ValidateRetrievalOptions(const RetrievalOptions &options) {
  ValidateThreshold(options.score_threshold);
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<DocumentCache> cache,
                                 std::shared_ptr<Embedder> embedder,
                                 RetrievalOptions options,
                                 std::shared_ptr<Logger> logger)
    : cache_(std::move(cache)), embedder_(std::move(embedder)),
      options_(options), logger_(EnsureLogger(std::move(logger))) {
  if (!cache_ || !embedder_) {
    throw std::invalid_argument(
        "RetrievalEngine requires a cache and an embedder");
  }
  ValidateRetrievalOptions(options_);
}

std::vector<Passage>
RetrievalEngine::Retrieve(const std::string &query_text,
                          const std::optional<std::string> &company_filter,
                          std::optional<std::size_t> k,
                          std::optional<float> score_threshold) const {
  const auto limit = k.value_or(options_.top_k);
  const auto threshold = score_threshold.value_or(options_.score_threshold);
  ValidateThreshold(threshold);

  auto passages =
      cache_->SearchPassages(embedder_->Embed(query_text), limit, threshold);
  const auto unfiltered = passages.size();

  if (company_filter) {
    const auto company = NormalizeCompany(*company_filter);
    passages.erase(std::remove_if(passages.begin(), passages.end(),
                                  [&](const Passage &passage) {
                                    return NormalizeCompany(
                                               passage.company_identifier) !=
                                           company;
                                  }),
                   passages.end());
  }

  logger_->Log(LogLevel::kDebug, "retrieval.complete",
               {{"k", std::to_string(limit)},
                {"candidates", std::to_string(unfiltered)},
                {"returned", std::to_string(passages.size())},
                {"company", company_filter.value_or("")}});
  return passages;
}

} // namespace finrag
