#include <finrag/knowledge_service.h>

#include <finrag/cache_keys.h>
#include <finrag/errors.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

const finrag::EngineConfig &Validated(const finrag::EngineConfig &config) {
  finrag::ValidateEngineConfig(config);
  return config;
}

std::shared_ptr<finrag::GenerationRouter>
EnsureRouter(std::shared_ptr<finrag::GenerationRouter> router,
             const std::shared_ptr<finrag::Logger> &logger) {
  if (!router) {
    return std::make_shared<finrag::GenerationRouter>(logger);
  }
  return router;
}

} // namespace

namespace finrag {

std::string FormatPassageContext(const std::vector<Passage> &passages) {
  std::ostringstream stream;
  for (std::size_t i = 0; i < passages.size(); ++i) {
    const auto &passage = passages[i];
    stream << "[Reference " << (i + 1) << "/" << passages.size() << "] "
           << passage.title;
    if (!passage.published_at.empty()) {
      stream << " (" << passage.published_at << ")";
    }
    stream << " - " << SourceKindName(passage.source_kind) << ", chunk "
           << (passage.ordinal + 1) << "/" << passage.total_chunks
           << ", score " << std::fixed << std::setprecision(3)
           << passage.score << "\n"
           << passage.text << "\n\n";
    stream.unsetf(std::ios::floatfield);
  }
  return stream.str();
}

KnowledgeService::KnowledgeService(const EngineConfig &config,
                                   std::shared_ptr<Embedder> embedder,
                                   std::shared_ptr<GenerationRouter> router,
                                   PromptCatalog prompts,
                                   std::shared_ptr<Logger> logger)
    : config_(Validated(config)), logger_(EnsureLogger(std::move(logger))),
      embedder_(std::move(embedder)),
      router_(EnsureRouter(std::move(router), logger_)),
      prompts_(std::move(prompts)), chunker_(config_.chunker),
      index_(std::make_shared<VectorIndex>(
          VectorIndexPath(config_.data_directory), embedder_, logger_)),
      cache_(std::make_shared<DocumentCache>(config_.data_directory, index_,
                                             logger_)),
      retrieval_(cache_, embedder_, config_.retrieval, logger_) {}

void KnowledgeService::EnsureReady() const { cache_->EnsureReady(); }

CacheEntry KnowledgeService::SubmitDocument(const Document &document) {
  const auto normalized = NormalizeDocument(document);
  auto chunks = chunker_.Split(normalized);
  logger_->Log(LogLevel::kDebug, "service.submit",
               {{"document_id", normalized.document_id},
                {"kind", SourceKindName(normalized.source_kind)},
                {"chunks", std::to_string(chunks.size())}});
  return cache_->Store(normalized, std::move(chunks));
}

std::optional<CacheEntry>
KnowledgeService::CheckCached(const CacheLookup &lookup) const {
  auto entry = cache_->Lookup(lookup);
  logger_->Log(LogLevel::kDebug, entry ? "cache.hit" : "cache.miss",
               {{"kind", SourceKindName(lookup.source_kind)},
                {"document_id", entry ? entry->document_id : ""}});
  return entry;
}

bool KnowledgeService::IsCached(const CacheLookup &lookup) const {
  return CheckCached(lookup).has_value();
}

std::vector<Passage>
KnowledgeService::Retrieve(const std::string &query_text,
                           const std::optional<std::string> &company) const {
  return retrieval_.Retrieve(query_text, company);
}

GenerationOutcome
KnowledgeService::GenerateAnswer(const std::string &company_name,
                                 const std::string &query_text,
                                 const std::string &task_type,
                                 const std::vector<Passage> &passages,
                                 bool exclude_opinions) const {
  const auto prompt = prompts_.Render(
      kRagAnalysisPrompt,
      {{"company_name", company_name},
       {"user_query", query_text},
       {"num_chunks", std::to_string(passages.size())},
       {"context", FormatPassageContext(passages)},
       {"exclude_opinions_instruction",
        ExcludeOpinionsInstruction(exclude_opinions)}});
  try {
    return router_->Generate(task_type, prompt);
  } catch (const GenerationFailed &failure) {
    const auto fallback =
        router_->SelectExcluding(task_type, failure.ProviderName());
    if (!fallback) {
      throw;
    }
    logger_->Log(LogLevel::kWarn, "service.generate.fallback",
                 {{"failed", failure.ProviderName()},
                  {"fallback", fallback->Name()},
                  {"task", task_type}});
    return router_->GenerateWith(fallback->Name(), prompt);
  }
}

AskResult KnowledgeService::Ask(const std::string &company_identifier,
                                const std::string &query_text,
                                const std::string &task_type) const {
  AskResult result;
  result.passages = Retrieve(query_text, company_identifier);
  if (result.passages.empty()) {
    logger_->Log(LogLevel::kInfo, "service.ask.no_passages",
                 {{"company", company_identifier}});
    return result;
  }
  auto outcome = GenerateAnswer(company_identifier, query_text, task_type,
                                result.passages);
  result.generated_text = std::move(outcome.text);
  result.provider_used = std::move(outcome.provider_name);
  return result;
}

CacheStats KnowledgeService::CacheStatistics() const {
  return cache_->Stats();
}

void KnowledgeService::ResetCache() { cache_->Reset(); }

std::vector<CacheEntry>
KnowledgeService::DocumentsForCompany(const std::string &company) const {
  return cache_->EntriesForCompany(company);
}

std::optional<std::string>
KnowledgeService::LoadDocumentText(const std::string &document_id) const {
  auto document = cache_->Load(document_id);
  if (!document) {
    return std::nullopt;
  }
  return ReassembleText(std::move(document->chunks));
}

bool KnowledgeService::RemoveDocument(const std::string &document_id) {
  return cache_->Remove(document_id);
}

} // namespace finrag
