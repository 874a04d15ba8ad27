#pragma once

#include <finrag/logging.h>
#include <finrag/models.h>
#include <finrag/vector_index.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace finrag {

std::filesystem::path CacheEntriesPath(const std::filesystem::path &directory);
std::filesystem::path VectorIndexPath(const std::filesystem::path &directory);

// Maps document identities to their chunks (held by the VectorIndex) and
// metadata. Every chunk id referenced by an entry exists in the index, and
// every indexed chunk belongs to exactly one entry. Store, Remove and Reset
// serialize on one write lock; readers share it, so they never observe a
// document whose chunks are only partly indexed.
class DocumentCache {
public:
  DocumentCache(std::filesystem::path directory,
                std::shared_ptr<VectorIndex> index,
                std::shared_ptr<Logger> logger);

  void EnsureReady() const;

  bool Exists(const std::string &document_id) const;
  std::optional<CacheEntry> Entry(const std::string &document_id) const;
  std::optional<CacheEntry> Lookup(const CacheLookup &lookup) const;
  std::optional<CacheEntry>
  FindMatching(const std::vector<std::string> &keywords) const;
  std::vector<CacheEntry>
  FindAllMatching(const std::vector<std::string> &keywords) const;

  CacheEntry Store(const Document &document, std::vector<Chunk> chunks);
  std::optional<CachedDocument> Load(const std::string &document_id) const;
  bool Remove(const std::string &document_id);
  void Reset();

  std::vector<CacheEntry> Entries() const;
  std::vector<CacheEntry>
  EntriesForCompany(const std::string &company_identifier) const;
  CacheStats Stats() const;

  std::vector<Passage> SearchPassages(std::vector<float> query_vector,
                                      std::size_t k,
                                      float score_threshold) const;

  void CheckConsistency() const;

  const std::filesystem::path &Directory() const { return directory_; }
  VectorIndex &Index() { return *index_; }
  const VectorIndex &Index() const { return *index_; }

private:
  void LoadEntries() const;
  void SaveEntriesLocked() const;
  void CheckConsistencyLocked() const;
  std::optional<CacheEntry> EntryLocked(const std::string &document_id) const;
  std::vector<CacheEntry>
  FindAllMatchingLocked(const std::vector<std::string> &keywords) const;
  // True when the stored entry has the same digest and the index holds the
  // same chunk boundaries, so the chunks need no re-embedding.
  bool SameContentLocked(const CacheEntry &entry,
                         const std::vector<Chunk> &chunks) const;
  CacheEntry RefreshEntryLocked(CacheEntry entry);
  void RestoreDocumentLocked(const std::string &document_id,
                             const std::optional<CacheEntry> &entry,
                             std::vector<Chunk> chunks);

  std::filesystem::path directory_;
  std::shared_ptr<VectorIndex> index_;
  std::shared_ptr<Logger> logger_;

  mutable std::once_flag loaded_;
  mutable std::shared_mutex mutex_;
  mutable std::map<std::string, CacheEntry> entries_;
};

} // namespace finrag
