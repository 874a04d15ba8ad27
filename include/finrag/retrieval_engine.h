#pragma once

#include <finrag/document_cache.h>
#include <finrag/interfaces.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

struct RetrievalOptions {
  std::size_t top_k = 20;
  float score_threshold = 0.7F;
};

void ValidateRetrievalOptions(const RetrievalOptions &options);

// Top-k is computed over the whole index first; the company filter then
// narrows that list, so a filtered query may return fewer than k passages.
class RetrievalEngine {
public:
  RetrievalEngine(std::shared_ptr<DocumentCache> cache,
                  std::shared_ptr<Embedder> embedder, RetrievalOptions options,
                  std::shared_ptr<Logger> logger);

  std::vector<Passage>
  Retrieve(const std::string &query_text,
           const std::optional<std::string> &company_filter = std::nullopt,
           std::optional<std::size_t> k = std::nullopt,
           std::optional<float> score_threshold = std::nullopt) const;

  const RetrievalOptions &Options() const { return options_; }

private:
  std::shared_ptr<DocumentCache> cache_;
  std::shared_ptr<Embedder> embedder_;
  RetrievalOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace finrag
