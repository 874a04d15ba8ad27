#include <finrag/document_cache.h>

#include <finrag/cache_keys.h>
#include <finrag/content_digest.h>
#include <finrag/errors.h>
#include <finrag/record_format.h>
#include <finrag/text_chunker.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace {

constexpr const char kEntriesHeader[] = "# finrag-cache-entries v1";
constexpr std::size_t kEntryFieldCount = 10;

std::size_t SharedKeywordCount(const std::vector<std::string> &stored,
                               const std::vector<std::string> &query) {
  std::size_t shared = 0;
  for (const auto &keyword : query) {
    if (std::binary_search(stored.begin(), stored.end(), keyword)) {
      ++shared;
    }
  }
  return shared;
}

bool NewestFirst(const finrag::CacheEntry &left,
                 const finrag::CacheEntry &right) {
  if (left.published_at != right.published_at) {
    return left.published_at > right.published_at;
  }
  return left.document_id < right.document_id;
}

} // namespace

namespace finrag {

std::filesystem::path CacheEntriesPath(const std::filesystem::path &directory) {
  return directory / "cache_entries.tsv";
}

std::filesystem::path VectorIndexPath(const std::filesystem::path &directory) {
  return directory / "vector_index.tsv";
}

DocumentCache::DocumentCache(std::filesystem::path directory,
                             std::shared_ptr<VectorIndex> index,
                             std::shared_ptr<Logger> logger)
    : directory_(std::move(directory)), index_(std::move(index)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!index_) {
    throw std::invalid_argument("DocumentCache requires a vector index");
  }
}

void DocumentCache::EnsureReady() const {
  std::call_once(loaded_, [this]() {
    index_->EnsureReady();
    LoadEntries();
    std::shared_lock lock(mutex_);
    CheckConsistencyLocked();
  });
}

void DocumentCache::LoadEntries() const {
  std::unique_lock lock(mutex_);
  entries_.clear();
  const auto path = CacheEntriesPath(directory_);
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream stream(path);
  if (!stream) {
    throw CacheInconsistency("Failed to open cache metadata: " +
                             path.string());
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (line.empty() || line[0] == '#') {
      continue;
    }
    const auto location = path.string() + ":" + std::to_string(line_number);
    const auto fields = SplitEscaped(line);
    if (fields.size() != kEntryFieldCount) {
      throw CacheInconsistency("Malformed cache entry at " + location);
    }
    CacheEntry entry;
    entry.document_id = fields[0];
    entry.company_identifier = fields[1];
    try {
      entry.source_kind = ParseSourceKind(fields[2]);
    } catch (const std::invalid_argument &error) {
      throw CacheInconsistency("Malformed cache entry at " + location + ": " +
                               error.what());
    }
    entry.title = fields[3];
    entry.published_at = fields[4];
    entry.keywords = DecodeList(fields[5]);
    entry.chunk_ids = DecodeList(fields[6]);
    entry.char_count = ParseCount(fields[7], location);
    entry.content_digest = fields[8];
    entry.stored_at = fields[9];
    const auto id = entry.document_id;
    if (!entries_.emplace(id, std::move(entry)).second) {
      throw CacheInconsistency("Duplicate cache entry for '" + id + "' in " +
                               path.string());
    }
  }
  logger_->Log(LogLevel::kInfo, "cache.load",
               {{"path", path.string()},
                {"documents", std::to_string(entries_.size())}});
}

void DocumentCache::SaveEntriesLocked() const {
  std::ostringstream content;
  content << kEntriesHeader << '\n';
  for (const auto &[id, entry] : entries_) {
    content << JoinEscaped({entry.document_id, entry.company_identifier,
                            SourceKindName(entry.source_kind), entry.title,
                            entry.published_at, EncodeList(entry.keywords),
                            EncodeList(entry.chunk_ids),
                            std::to_string(entry.char_count),
                            entry.content_digest, entry.stored_at})
            << '\n';
  }
  WriteFileAtomically(CacheEntriesPath(directory_), content.str());
}

void DocumentCache::CheckConsistency() const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  CheckConsistencyLocked();
}

void DocumentCache::CheckConsistencyLocked() const {
  std::unordered_map<std::string, std::string> owners;
  for (const auto &chunk : index_->Export()) {
    owners.emplace(chunk.chunk_id, chunk.source_document_id);
  }

  std::size_t referenced = 0;
  for (const auto &[id, entry] : entries_) {
    for (const auto &chunk_id : entry.chunk_ids) {
      const auto owner = owners.find(chunk_id);
      if (owner == owners.end()) {
        throw CacheInconsistency("Chunk '" + chunk_id + "' of document '" +
                                 id + "' is missing from the index");
      }
      if (owner->second != id) {
        throw CacheInconsistency("Chunk '" + chunk_id + "' is indexed under '" +
                                 owner->second + "' but referenced by '" + id +
                                 "'");
      }
      ++referenced;
    }
  }
  if (referenced != owners.size()) {
    for (const auto &[chunk_id, owner] : owners) {
      const auto entry = entries_.find(owner);
      if (entry == entries_.end() ||
          std::find(entry->second.chunk_ids.begin(),
                    entry->second.chunk_ids.end(),
                    chunk_id) == entry->second.chunk_ids.end()) {
        throw CacheInconsistency("Indexed chunk '" + chunk_id +
                                 "' belongs to no cache entry");
      }
    }
    throw CacheInconsistency("Cache entries reference " +
                             std::to_string(referenced) +
                             " chunks but the index holds " +
                             std::to_string(owners.size()));
  }
}

std::optional<CacheEntry>
DocumentCache::EntryLocked(const std::string &document_id) const {
  const auto found = entries_.find(document_id);
  if (found == entries_.end()) {
    return std::nullopt;
  }
  return found->second;
}

bool DocumentCache::Exists(const std::string &document_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  return entries_.count(document_id) != 0;
}

std::optional<CacheEntry>
DocumentCache::Entry(const std::string &document_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  return EntryLocked(document_id);
}

std::optional<CacheEntry>
DocumentCache::Lookup(const CacheLookup &lookup) const {
  switch (lookup.source_kind) {
  case SourceKind::kRegulatoryFiling:
    return Entry(Trim(lookup.document_id));
  case SourceKind::kBrokerReport:
    return Entry(BrokerReportKey(lookup.company_identifier, lookup.title));
  case SourceKind::kIndustryReport:
    if (!Trim(lookup.document_id).empty()) {
      return Entry(Trim(lookup.document_id));
    }
    return FindMatching(lookup.keywords);
  }
  return std::nullopt;
}

std::vector<CacheEntry> DocumentCache::FindAllMatchingLocked(
    const std::vector<std::string> &keywords) const {
  const auto query = NormalizeKeywords(keywords);
  std::vector<std::pair<std::size_t, CacheEntry>> ranked;
  if (query.empty()) {
    return {};
  }
  for (const auto &[id, entry] : entries_) {
    if (entry.source_kind != SourceKind::kIndustryReport) {
      continue;
    }
    const auto shared = SharedKeywordCount(entry.keywords, query);
    if (shared > 0) {
      ranked.emplace_back(shared, entry);
    }
  }
  std::sort(ranked.begin(), ranked.end(),
            [](const auto &left, const auto &right) {
              if (left.first != right.first) {
                return left.first > right.first;
              }
              return NewestFirst(left.second, right.second);
            });
  std::vector<CacheEntry> matches;
  matches.reserve(ranked.size());
  for (auto &item : ranked) {
    matches.push_back(std::move(item.second));
  }
  return matches;
}

std::vector<CacheEntry>
DocumentCache::FindAllMatching(const std::vector<std::string> &keywords) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  return FindAllMatchingLocked(keywords);
}

std::optional<CacheEntry>
DocumentCache::FindMatching(const std::vector<std::string> &keywords) const {
  auto matches = FindAllMatching(keywords);
  if (matches.empty()) {
    return std::nullopt;
  }
  return std::move(matches.front());
}

void DocumentCache::RestoreDocumentLocked(
    const std::string &document_id, const std::optional<CacheEntry> &entry,
    std::vector<Chunk> chunks) {
  try {
    if (entry) {
      index_->ReplaceDocument(document_id, std::move(chunks));
      entries_[document_id] = *entry;
    } else {
      index_->RemoveDocument(document_id);
      entries_.erase(document_id);
    }
  } catch (const std::exception &error) {
    throw CacheInconsistency("Failed to roll back document '" + document_id +
                             "': " + error.what());
  }
}

bool DocumentCache::SameContentLocked(const CacheEntry &entry,
                                      const std::vector<Chunk> &chunks) const {
  const auto found = entries_.find(entry.document_id);
  if (found == entries_.end() ||
      found->second.content_digest != entry.content_digest ||
      found->second.chunk_ids != entry.chunk_ids) {
    return false;
  }
  for (const auto &chunk : chunks) {
    const auto indexed = index_->Get(chunk.chunk_id);
    if (!indexed || indexed->start_offset != chunk.start_offset ||
        indexed->text != chunk.text) {
      return false;
    }
  }
  return true;
}

CacheEntry DocumentCache::RefreshEntryLocked(CacheEntry entry) {
  const auto &document_id = entry.document_id;
  const auto previous = EntryLocked(document_id);
  entries_[document_id] = entry;
  try {
    SaveEntriesLocked();
  } catch (const std::exception &) {
    if (previous) {
      entries_[document_id] = *previous;
    } else {
      entries_.erase(document_id);
    }
    throw;
  }
  logger_->Log(LogLevel::kDebug, "cache.store.unchanged",
               {{"document_id", document_id}});
  return entry;
}

CacheEntry DocumentCache::Store(const Document &document,
                                std::vector<Chunk> chunks) {
  EnsureReady();
  const auto normalized = NormalizeDocument(document);
  const auto &document_id = normalized.document_id;
  for (const auto &chunk : chunks) {
    if (chunk.source_document_id != document_id) {
      throw InvalidDocument("Chunk '" + chunk.chunk_id +
                            "' does not belong to document '" + document_id +
                            "'");
    }
  }

  CacheEntry entry;
  entry.document_id = document_id;
  entry.company_identifier = normalized.company_identifier;
  entry.source_kind = normalized.source_kind;
  entry.title = normalized.title;
  entry.published_at = normalized.published_at;
  entry.keywords = normalized.keywords;
  entry.char_count = CountCodePoints(normalized.raw_text);
  entry.content_digest = ContentDigest(normalized.raw_text);
  entry.stored_at = UtcTimestamp();
  for (const auto &chunk : chunks) {
    entry.chunk_ids.push_back(chunk.chunk_id);
  }

  {
    std::unique_lock lock(mutex_);
    if (SameContentLocked(entry, chunks)) {
      return RefreshEntryLocked(std::move(entry));
    }
  }

  index_->EmbedChunks(chunks);

  std::unique_lock lock(mutex_);
  // Another writer may have stored the same content while we embedded.
  if (SameContentLocked(entry, chunks)) {
    return RefreshEntryLocked(std::move(entry));
  }
  const auto previous = EntryLocked(document_id);
  std::vector<Chunk> previous_chunks;
  if (previous) {
    for (const auto &chunk_id : previous->chunk_ids) {
      if (auto chunk = index_->Get(chunk_id)) {
        previous_chunks.push_back(std::move(*chunk));
      }
    }
  }

  index_->ReplaceDocument(document_id, std::move(chunks));
  entries_[document_id] = entry;
  try {
    SaveEntriesLocked();
  } catch (const std::exception &) {
    RestoreDocumentLocked(document_id, previous, std::move(previous_chunks));
    throw;
  }

  logger_->Log(LogLevel::kInfo, "cache.store",
               {{"document_id", document_id},
                {"kind", SourceKindName(entry.source_kind)},
                {"chunks", std::to_string(entry.chunk_ids.size())},
                {"replaced", previous ? "true" : "false"}});
  return entry;
}

std::optional<CachedDocument>
DocumentCache::Load(const std::string &document_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  auto entry = EntryLocked(document_id);
  if (!entry) {
    return std::nullopt;
  }
  CachedDocument document;
  for (const auto &chunk_id : entry->chunk_ids) {
    auto chunk = index_->Get(chunk_id);
    if (!chunk) {
      throw CacheInconsistency("Chunk '" + chunk_id + "' of document '" +
                               document_id + "' is missing from the index");
    }
    document.chunks.push_back(std::move(*chunk));
  }
  document.entry = std::move(*entry);
  return document;
}

bool DocumentCache::Remove(const std::string &document_id) {
  EnsureReady();
  std::unique_lock lock(mutex_);
  const auto previous = EntryLocked(document_id);
  if (!previous) {
    return false;
  }
  std::vector<Chunk> previous_chunks;
  for (const auto &chunk_id : previous->chunk_ids) {
    if (auto chunk = index_->Get(chunk_id)) {
      previous_chunks.push_back(std::move(*chunk));
    }
  }

  index_->RemoveDocument(document_id);
  entries_.erase(document_id);
  try {
    SaveEntriesLocked();
  } catch (const std::exception &) {
    RestoreDocumentLocked(document_id, previous, std::move(previous_chunks));
    throw;
  }
  logger_->Log(LogLevel::kInfo, "cache.remove",
               {{"document_id", document_id}});
  return true;
}

void DocumentCache::Reset() {
  EnsureReady();
  std::unique_lock lock(mutex_);
  auto previous_entries = entries_;
  auto previous_chunks = index_->Export();

  try {
    index_->RemoveAll();
  } catch (const std::exception &error) {
    throw CacheInconsistency(std::string("Cache reset failed, nothing was "
                                         "cleared: ") +
                             error.what());
  }

  entries_.clear();
  try {
    SaveEntriesLocked();
  } catch (const std::exception &error) {
    entries_ = std::move(previous_entries);
    try {
      index_->Restore(std::move(previous_chunks));
    } catch (const std::exception &restore_error) {
      throw CacheInconsistency(
          std::string("Cache reset failed and the index could not be "
                      "restored: ") +
          restore_error.what());
    }
    throw CacheInconsistency(
        std::string("Cache reset failed, previous state restored: ") +
        error.what());
  }
  logger_->Log(LogLevel::kInfo, "cache.reset",
               {{"directory", directory_.string()},
                {"documents", std::to_string(previous_entries.size())}});
}

std::vector<CacheEntry> DocumentCache::Entries() const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  std::vector<CacheEntry> entries;
  entries.reserve(entries_.size());
  for (const auto &[id, entry] : entries_) {
    entries.push_back(entry);
  }
  return entries;
}

std::vector<CacheEntry>
DocumentCache::EntriesForCompany(const std::string &company_identifier) const {
  const auto company = NormalizeCompany(company_identifier);
  auto entries = Entries();
  entries.erase(std::remove_if(entries.begin(), entries.end(),
                               [&](const CacheEntry &entry) {
                                 return NormalizeCompany(
                                            entry.company_identifier) !=
                                        company;
                               }),
                entries.end());
  std::sort(entries.begin(), entries.end(), NewestFirst);
  return entries;
}

CacheStats DocumentCache::Stats() const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  CacheStats stats;
  std::set<std::string> companies;
  for (const auto &[id, entry] : entries_) {
    ++stats.total_documents;
    stats.total_chunks += entry.chunk_ids.size();
    stats.total_characters += entry.char_count;
    companies.insert(NormalizeCompany(entry.company_identifier));
  }
  stats.distinct_companies = companies.size();
  stats.companies.assign(companies.begin(), companies.end());
  return stats;
}

std::vector<Passage>
DocumentCache::SearchPassages(std::vector<float> query_vector, std::size_t k,
                              float score_threshold) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  const auto hits =
      index_->SearchByVector(std::move(query_vector), k, score_threshold);
  std::vector<Passage> passages;
  passages.reserve(hits.size());
  for (const auto &hit : hits) {
    const auto entry = entries_.find(hit.chunk.source_document_id);
    if (entry == entries_.end()) {
      throw CacheInconsistency("Indexed chunk '" + hit.chunk.chunk_id +
                               "' belongs to no cache entry");
    }
    Passage passage;
    passage.chunk_id = hit.chunk.chunk_id;
    passage.document_id = entry->second.document_id;
    passage.company_identifier = entry->second.company_identifier;
    passage.title = entry->second.title;
    passage.published_at = entry->second.published_at;
    passage.source_kind = entry->second.source_kind;
    passage.ordinal = hit.chunk.ordinal;
    passage.total_chunks = entry->second.chunk_ids.size();
    passage.text = hit.chunk.text;
    passage.score = hit.score;
    passages.push_back(std::move(passage));
  }
  return passages;
}

} // namespace finrag
