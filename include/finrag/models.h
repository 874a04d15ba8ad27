#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

enum class SourceKind { kRegulatoryFiling, kBrokerReport, kIndustryReport };

std::string SourceKindName(SourceKind kind);
SourceKind ParseSourceKind(const std::string &value);

struct Document {
  std::string document_id;
  std::string company_identifier;
  std::string title;
  std::string published_at;
  std::string raw_text;
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::vector<std::string> keywords;
  std::string locator;
};

// A contiguous slice of a document. `start_offset` is a byte offset into the
// document's raw text.
struct Chunk {
  std::string chunk_id;
  std::string source_document_id;
  std::size_t ordinal = 0;
  std::size_t start_offset = 0;
  std::string text;
  std::vector<float> embedding;
};

std::string MakeChunkId(const std::string &document_id, std::size_t ordinal);

struct CacheEntry {
  std::string document_id;
  std::string company_identifier;
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::string title;
  std::string published_at;
  std::vector<std::string> keywords;
  std::vector<std::string> chunk_ids;
  std::size_t char_count = 0;
  std::string content_digest;
  std::string stored_at;
};

struct CachedDocument {
  CacheEntry entry;
  std::vector<Chunk> chunks;
};

struct CacheStats {
  std::size_t total_documents = 0;
  std::size_t total_chunks = 0;
  std::size_t total_characters = 0;
  std::size_t distinct_companies = 0;
  std::vector<std::string> companies;
};

// Identity of a document for the "do we already have it" check. Which fields
// are consulted depends on `source_kind`.
struct CacheLookup {
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::string document_id;
  std::string company_identifier;
  std::string title;
  std::vector<std::string> keywords;
};

struct ScoredChunk {
  Chunk chunk;
  float score = 0.0F;
};

struct Passage {
  std::string chunk_id;
  std::string document_id;
  std::string company_identifier;
  std::string title;
  std::string published_at;
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::size_t ordinal = 0;
  std::size_t total_chunks = 0;
  std::string text;
  float score = 0.0F;
};

enum class CostTier { kLow, kMedium, kHigh };
enum class SpeedTier { kSlow, kMedium, kFast, kVeryFast };

std::string CostTierName(CostTier tier);
CostTier ParseCostTier(const std::string &value);
std::string SpeedTierName(SpeedTier tier);
SpeedTier ParseSpeedTier(const std::string &value);

struct ProviderCapabilities {
  std::size_t context_window = 4096;
  bool supports_long_context = false;
  std::vector<std::string> languages;
  CostTier relative_cost = CostTier::kMedium;
  SpeedTier relative_speed = SpeedTier::kMedium;
};

struct ProviderDescription {
  std::string name;
  ProviderCapabilities capabilities;
  bool is_default = false;
};

struct GenerationOutcome {
  std::string text;
  std::string provider_name;
};

struct AskResult {
  std::vector<Passage> passages;
  std::string generated_text;
  std::string provider_used;
};

struct DocumentReference {
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::string document_id;
  std::string company_identifier;
  std::string title;
  std::string published_at;
  std::vector<std::string> keywords;
  std::string locator;
};

struct FetchFilters {
  std::string published_after;
  std::vector<std::string> keywords;
  std::size_t max_documents = 5;
};

enum class PipelineStage {
  kResolvingCompany,
  kSearchingDocuments,
  kFetchingOrCached,
  kRetrieving,
  kGenerating,
  kDone,
  kFailed
};

std::string PipelineStageName(PipelineStage stage);

enum class StageStatus { kStarted, kCompleted, kFailed };

struct StageEvent {
  PipelineStage stage = PipelineStage::kResolvingCompany;
  StageStatus status = StageStatus::kStarted;
  std::string detail;
};

struct AnalysisRequest {
  std::string company_name;
  std::string query;
  std::string task_type = "long_context_analysis";
  std::optional<int> years;
  std::vector<std::string> industry_keywords;
  // Restricts the answer to factual data, ignoring broker opinions.
  bool exclude_opinions = false;
};

struct DocumentOutcome {
  std::string document_id;
  SourceKind source_kind = SourceKind::kRegulatoryFiling;
  std::string title;
  bool cache_hit = false;
  std::size_t chunk_count = 0;
};

struct AnalysisResult {
  bool success = false;
  PipelineStage stage = PipelineStage::kResolvingCompany;
  std::optional<PipelineStage> last_completed_stage;
  std::string company_name;
  std::string company_identifier;
  int years = 0;
  std::vector<std::string> industry_keywords;
  std::vector<DocumentOutcome> documents;
  std::vector<Passage> passages;
  std::string generated_text;
  std::string provider_used;
  std::vector<std::string> messages;
  std::string failure_kind;
  std::string failure_reason;
};

} // namespace finrag
