#include <finrag/vector_index.h>

#include <finrag/errors.h>
#include <finrag/hashing_embedder.h>
#include <finrag/record_format.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kSnapshotMagic[] = "# finrag-vector-index v1";
constexpr std::size_t kRecordFieldCount = 6;

float Dot(const std::vector<float> &left, const std::vector<float> &right) {
  float sum = 0.0F;
  const auto size = std::min(left.size(), right.size());
  for (std::size_t i = 0; i < size; ++i) {
    sum += left[i] * right[i];
  }
  return sum;
}

} // namespace

namespace finrag {

VectorIndex::VectorIndex(std::filesystem::path storage_path,
                         std::shared_ptr<Embedder> embedder,
                         std::shared_ptr<Logger> logger)
    : storage_path_(std::move(storage_path)), embedder_(std::move(embedder)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!embedder_) {
    throw std::invalid_argument("VectorIndex requires an embedder");
  }
}

void VectorIndex::EnsureReady() const {
  std::call_once(loaded_, [this]() { LoadSnapshot(); });
}

void VectorIndex::LoadSnapshot() const {
  std::unique_lock lock(mutex_);
  records_.clear();
  next_sequence_ = 0;
  if (!std::filesystem::exists(storage_path_)) {
    RebuildPositionsLocked();
    logger_->Log(LogLevel::kDebug, "index.load.empty",
                 {{"path", storage_path_.string()}});
    return;
  }

  std::ifstream stream(storage_path_);
  if (!stream) {
    throw CacheInconsistency("Failed to open vector index: " +
                             storage_path_.string());
  }

  std::string line;
  std::size_t line_number = 0;
  while (std::getline(stream, line)) {
    ++line_number;
    if (line.empty()) {
      continue;
    }
    const auto location = storage_path_.string() + ":" +
                          std::to_string(line_number);
    if (line[0] == '#') {
      const auto header = SplitEscaped(line);
      if (header.size() >= 2 && header[0] == kSnapshotMagic &&
          ParseCount(header[1], location) != embedder_->Dimension()) {
        throw CacheInconsistency(
            "Vector index " + storage_path_.string() + " has dimension " +
            header[1] + " but the embedder produces " +
            std::to_string(embedder_->Dimension()));
      }
      continue;
    }
    const auto fields = SplitEscaped(line);
    if (fields.size() != kRecordFieldCount) {
      throw CacheInconsistency("Malformed vector index record at " + location);
    }
    Record record;
    record.chunk.chunk_id = fields[0];
    record.chunk.source_document_id = fields[1];
    record.chunk.ordinal = ParseCount(fields[2], location);
    record.chunk.start_offset = ParseCount(fields[3], location);
    record.chunk.text = fields[4];
    try {
      record.chunk.embedding = DecodeVector(fields[5]);
    } catch (const std::runtime_error &error) {
      throw CacheInconsistency("Malformed vector index record at " + location +
                               ": " + error.what());
    }
    ValidateVector(record.chunk);
    record.sequence = next_sequence_++;
    records_.push_back(std::move(record));
  }
  RebuildPositionsLocked();
  logger_->Log(LogLevel::kInfo, "index.load",
               {{"path", storage_path_.string()},
                {"chunks", std::to_string(records_.size())}});
}

void VectorIndex::PersistLocked() const {
  std::ostringstream content;
  content << kSnapshotMagic << '\t' << embedder_->Dimension() << '\t'
          << Escape(embedder_->Name()) << '\n';
  for (const auto &record : records_) {
    const auto &chunk = record.chunk;
    content << JoinEscaped({chunk.chunk_id, chunk.source_document_id,
                            std::to_string(chunk.ordinal),
                            std::to_string(chunk.start_offset), chunk.text,
                            EncodeVector(chunk.embedding)})
            << '\n';
  }
  WriteFileAtomically(storage_path_, content.str());
}

void VectorIndex::RebuildPositionsLocked() const {
  positions_.clear();
  for (std::size_t i = 0; i < records_.size(); ++i) {
    positions_[records_[i].chunk.chunk_id] = i;
  }
}

void VectorIndex::ValidateVector(const Chunk &chunk) const {
  if (chunk.embedding.size() != embedder_->Dimension()) {
    throw CacheInconsistency(
        "Chunk '" + chunk.chunk_id + "' has a vector of dimension " +
        std::to_string(chunk.embedding.size()) + ", expected " +
        std::to_string(embedder_->Dimension()));
  }
}

void VectorIndex::AppendLocked(Chunk chunk) const {
  const auto existing = positions_.find(chunk.chunk_id);
  if (existing != positions_.end()) {
    records_.erase(records_.begin() +
                   static_cast<std::ptrdiff_t>(existing->second));
    RebuildPositionsLocked();
  }
  positions_[chunk.chunk_id] = records_.size();
  records_.push_back(Record{std::move(chunk), next_sequence_++});
}

void VectorIndex::EmbedChunks(std::vector<Chunk> &chunks) const {
  for (auto &chunk : chunks) {
    if (chunk.embedding.empty()) {
      chunk.embedding = embedder_->Embed(chunk.text);
    }
    NormalizeInPlace(chunk.embedding);
    ValidateVector(chunk);
  }
}

void VectorIndex::Add(Chunk chunk) {
  std::vector<Chunk> batch{std::move(chunk)};
  EmbedChunks(batch);
  EnsureReady();

  std::unique_lock lock(mutex_);
  const auto previous = records_;
  const auto previous_sequence = next_sequence_;
  AppendLocked(std::move(batch.front()));
  try {
    PersistLocked();
  } catch (const std::exception &) {
    records_ = previous;
    next_sequence_ = previous_sequence;
    RebuildPositionsLocked();
    throw;
  }
}

void VectorIndex::ReplaceDocument(const std::string &document_id,
                                  std::vector<Chunk> chunks) {
  for (const auto &chunk : chunks) {
    if (chunk.source_document_id != document_id) {
      throw std::invalid_argument("Chunk '" + chunk.chunk_id +
                                  "' does not belong to document '" +
                                  document_id + "'");
    }
  }
  EmbedChunks(chunks);
  EnsureReady();

  std::unique_lock lock(mutex_);
  const auto previous = records_;
  const auto previous_sequence = next_sequence_;
  records_.erase(std::remove_if(records_.begin(), records_.end(),
                                [&](const Record &record) {
                                  return record.chunk.source_document_id ==
                                         document_id;
                                }),
                 records_.end());
  RebuildPositionsLocked();
  const auto added = chunks.size();
  for (auto &chunk : chunks) {
    AppendLocked(std::move(chunk));
  }
  try {
    PersistLocked();
  } catch (const std::exception &) {
    records_ = previous;
    next_sequence_ = previous_sequence;
    RebuildPositionsLocked();
    throw;
  }
  logger_->Log(LogLevel::kDebug, "index.replace",
               {{"document_id", document_id},
                {"chunks", std::to_string(added)},
                {"total", std::to_string(records_.size())}});
}

std::size_t VectorIndex::RemoveDocument(const std::string &document_id) {
  EnsureReady();
  std::unique_lock lock(mutex_);
  const auto previous = records_;
  records_.erase(std::remove_if(records_.begin(), records_.end(),
                                [&](const Record &record) {
                                  return record.chunk.source_document_id ==
                                         document_id;
                                }),
                 records_.end());
  const auto removed = previous.size() - records_.size();
  if (removed == 0) {
    return 0;
  }
  RebuildPositionsLocked();
  try {
    PersistLocked();
  } catch (const std::exception &) {
    records_ = previous;
    RebuildPositionsLocked();
    throw;
  }
  return removed;
}

void VectorIndex::RemoveAll() {
  EnsureReady();
  std::unique_lock lock(mutex_);
  auto previous = std::move(records_);
  records_.clear();
  try {
    PersistLocked();
  } catch (const std::exception &) {
    records_ = std::move(previous);
    RebuildPositionsLocked();
    throw;
  }
  positions_.clear();
  next_sequence_ = 0;
  logger_->Log(LogLevel::kInfo, "index.clear",
               {{"path", storage_path_.string()}});
}

void VectorIndex::Restore(std::vector<Chunk> chunks) {
  EmbedChunks(chunks);
  EnsureReady();
  std::unique_lock lock(mutex_);
  records_.clear();
  positions_.clear();
  next_sequence_ = 0;
  for (auto &chunk : chunks) {
    AppendLocked(std::move(chunk));
  }
  PersistLocked();
}

std::vector<ScoredChunk> VectorIndex::Search(const std::string &query_text,
                                             std::size_t k,
                                             float score_threshold) const {
  if (k == 0) {
    return {};
  }
  return SearchByVector(embedder_->Embed(query_text), k, score_threshold);
}

std::vector<ScoredChunk>
VectorIndex::SearchByVector(std::vector<float> query, std::size_t k,
                            float score_threshold) const {
  if (k == 0) {
    return {};
  }
  if (query.size() != embedder_->Dimension()) {
    throw std::invalid_argument("Query vector has dimension " +
                                std::to_string(query.size()) + ", expected " +
                                std::to_string(embedder_->Dimension()));
  }
  NormalizeInPlace(query);
  EnsureReady();

  std::shared_lock lock(mutex_);
  struct Candidate {
    float score;
    std::uint64_t sequence;
    std::size_t position;
  };
  std::vector<Candidate> candidates;
  candidates.reserve(records_.size());
  for (std::size_t i = 0; i < records_.size(); ++i) {
    candidates.push_back(
        {Dot(query, records_[i].chunk.embedding), records_[i].sequence, i});
  }

  const auto limit = std::min(k, candidates.size());
  std::partial_sort(candidates.begin(),
                    candidates.begin() + static_cast<std::ptrdiff_t>(limit),
                    candidates.end(),
                    [](const Candidate &left, const Candidate &right) {
                      if (left.score != right.score) {
                        return left.score > right.score;
                      }
                      return left.sequence < right.sequence;
                    });

  std::vector<ScoredChunk> results;
  for (std::size_t i = 0; i < limit; ++i) {
    if (candidates[i].score < score_threshold) {
      continue;
    }
    results.push_back(
        {records_[candidates[i].position].chunk, candidates[i].score});
  }
  return results;
}

bool VectorIndex::Contains(const std::string &chunk_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  return positions_.count(chunk_id) != 0;
}

std::optional<Chunk> VectorIndex::Get(const std::string &chunk_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  const auto found = positions_.find(chunk_id);
  if (found == positions_.end()) {
    return std::nullopt;
  }
  return records_[found->second].chunk;
}

std::vector<std::string>
VectorIndex::ChunkIdsForDocument(const std::string &document_id) const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  std::vector<std::string> ids;
  for (const auto &record : records_) {
    if (record.chunk.source_document_id == document_id) {
      ids.push_back(record.chunk.chunk_id);
    }
  }
  return ids;
}

std::vector<Chunk> VectorIndex::Export() const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  std::vector<Chunk> chunks;
  chunks.reserve(records_.size());
  for (const auto &record : records_) {
    chunks.push_back(record.chunk);
  }
  return chunks;
}

std::size_t VectorIndex::Size() const {
  EnsureReady();
  std::shared_lock lock(mutex_);
  return records_.size();
}

} // namespace finrag
