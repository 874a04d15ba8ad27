#pragma once

#include <finrag/interfaces.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace finrag {

// In-memory exact nearest-neighbor index over L2-normalized chunk vectors,
// written through to a single snapshot file on every mutation. The snapshot
// is loaded lazily by the first call that needs it.
class VectorIndex {
public:
  VectorIndex(std::filesystem::path storage_path,
              std::shared_ptr<Embedder> embedder,
              std::shared_ptr<Logger> logger);

  void EnsureReady() const;

  // Fills in missing vectors and normalizes all of them. Holds no lock, so
  // slow embedders do not block readers.
  void EmbedChunks(std::vector<Chunk> &chunks) const;

  void Add(Chunk chunk);
  void ReplaceDocument(const std::string &document_id,
                       std::vector<Chunk> chunks);
  std::size_t RemoveDocument(const std::string &document_id);
  void RemoveAll();
  // Replaces the whole contents, e.g. to roll back a failed reset.
  void Restore(std::vector<Chunk> chunks);

  std::vector<ScoredChunk> Search(const std::string &query_text,
                                  std::size_t k, float score_threshold) const;
  std::vector<ScoredChunk> SearchByVector(std::vector<float> query,
                                          std::size_t k,
                                          float score_threshold) const;

  bool Contains(const std::string &chunk_id) const;
  std::optional<Chunk> Get(const std::string &chunk_id) const;
  std::vector<std::string>
  ChunkIdsForDocument(const std::string &document_id) const;
  std::vector<Chunk> Export() const;
  std::size_t Size() const;

  std::size_t Dimension() const { return embedder_->Dimension(); }
  const std::filesystem::path &StoragePath() const { return storage_path_; }
  const std::shared_ptr<Embedder> &GetEmbedder() const { return embedder_; }

private:
  struct Record {
    Chunk chunk;
    std::uint64_t sequence = 0;
  };

  void LoadSnapshot() const;
  void PersistLocked() const;
  void RebuildPositionsLocked() const;
  void AppendLocked(Chunk chunk) const;
  void ValidateVector(const Chunk &chunk) const;

  std::filesystem::path storage_path_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Logger> logger_;

  mutable std::once_flag loaded_;
  mutable std::shared_mutex mutex_;
  mutable std::vector<Record> records_;
  mutable std::unordered_map<std::string, std::size_t> positions_;
  mutable std::uint64_t next_sequence_ = 0;
};

} // namespace finrag
