#pragma once

#include <finrag/config.h>
#include <finrag/document_cache.h>
#include <finrag/generation_router.h>
#include <finrag/interfaces.h>
#include <finrag/logging.h>
#include <finrag/models.h>
#include <finrag/prompt_catalog.h>
#include <finrag/retrieval_engine.h>
#include <finrag/text_chunker.h>
#include <finrag/vector_index.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

// Formats passages as numbered references for the analysis prompt.
std::string FormatPassageContext(const std::vector<Passage> &passages);

// Entry point for the outer application: owns the chunker, index, cache and
// retrieval engine built from one EngineConfig, and shares the router.
class KnowledgeService {
public:
  KnowledgeService(const EngineConfig &config,
                   std::shared_ptr<Embedder> embedder,
                   std::shared_ptr<GenerationRouter> router,
                   PromptCatalog prompts, std::shared_ptr<Logger> logger);

  void EnsureReady() const;

  CacheEntry SubmitDocument(const Document &document);
  std::optional<CacheEntry> CheckCached(const CacheLookup &lookup) const;
  bool IsCached(const CacheLookup &lookup) const;

  std::vector<Passage> Retrieve(const std::string &query_text,
                                const std::optional<std::string> &company) const;
  // Renders the analysis prompt and generates with the routed provider,
  // falling back at most once to another provider on GenerationFailed.
  GenerationOutcome GenerateAnswer(const std::string &company_name,
                                   const std::string &query_text,
                                   const std::string &task_type,
                                   const std::vector<Passage> &passages,
                                   bool exclude_opinions = false) const;
  AskResult Ask(const std::string &company_identifier,
                const std::string &query_text,
                const std::string &task_type) const;

  CacheStats CacheStatistics() const;
  void ResetCache();
  std::vector<CacheEntry> DocumentsForCompany(const std::string &company) const;
  std::optional<std::string> LoadDocumentText(const std::string &document_id) const;
  bool RemoveDocument(const std::string &document_id);

  const EngineConfig &Config() const { return config_; }
  DocumentCache &Cache() { return *cache_; }
  const DocumentCache &Cache() const { return *cache_; }
  GenerationRouter &Router() { return *router_; }
  const GenerationRouter &Router() const { return *router_; }
  const PromptCatalog &Prompts() const { return prompts_; }
  const TextChunker &Chunker() const { return chunker_; }

private:
  EngineConfig config_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<GenerationRouter> router_;
  PromptCatalog prompts_;
  TextChunker chunker_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<DocumentCache> cache_;
  RetrievalEngine retrieval_;
};

} // namespace finrag
