#pragma once

#include <finrag/models.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace finrag {

std::vector<std::string> DefaultSeparators();

struct ChunkerOptions {
  std::size_t chunk_size = 1000;
  std::size_t chunk_overlap = 200;
  std::vector<std::string> separators = DefaultSeparators();
};

// Half-open byte range of the source text. `length` is in code points.
struct TextSpan {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t length = 0;
};

std::size_t CountCodePoints(std::string_view text);

// Recursive separator splitter. Pieces are split on the highest-priority
// separator present, then packed greedily into chunks of at most
// `chunk_size` code points, each starting with at most `chunk_overlap` code
// points carried over from its predecessor.
class TextChunker {
public:
  explicit TextChunker(ChunkerOptions options = {});

  std::vector<TextSpan> SplitText(std::string_view text) const;
  std::vector<Chunk> Split(const Document &document) const;

  const ChunkerOptions &Options() const { return options_; }

private:
  void CollectPieces(std::string_view text, std::size_t begin,
                     std::size_t end, std::size_t separator_index,
                     std::vector<TextSpan> &pieces) const;
  std::vector<TextSpan> MergePieces(const std::vector<TextSpan> &pieces) const;

  ChunkerOptions options_;
};

// Inverse of Split: concatenates chunks in ordinal order, dropping the
// overlapping prefix of each.
std::string ReassembleText(std::vector<Chunk> chunks);

} // namespace finrag
