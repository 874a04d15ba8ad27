#include <finrag/text_chunker.h>

#include <finrag/errors.h>

#include <algorithm>
#include <cctype>
#include <deque>
#include <stdexcept>
#include <utility>

namespace {

bool IsContinuationByte(char character) {
  return (static_cast<unsigned char>(character) & 0xC0U) == 0x80U;
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) {
    return std::isspace(ch) != 0;
  });
}

} // namespace

namespace finrag {

std::vector<std::string> DefaultSeparators() {
  return {"\n\n", "\n", "\xE3\x80\x82", ". ", "? ", "! ", " ", ""};
}

std::size_t CountCodePoints(std::string_view text) {
  return static_cast<std::size_t>(
      std::count_if(text.begin(), text.end(),
                    [](char ch) { return !IsContinuationByte(ch); }));
}

TextChunker::TextChunker(ChunkerOptions options) : options_(std::move(options)) {
  if (options_.chunk_size == 0) {
    throw InvalidConfig("chunk_size must be greater than zero");
  }
  if (options_.chunk_overlap >= options_.chunk_size) {
    throw InvalidConfig("chunk_overlap (" +
                        std::to_string(options_.chunk_overlap) +
                        ") must be smaller than chunk_size (" +
                        std::to_string(options_.chunk_size) + ")");
  }
  if (options_.separators.empty() || !options_.separators.back().empty()) {
    options_.separators.emplace_back();
  }
}

void TextChunker::CollectPieces(std::string_view text, std::size_t begin,
                                std::size_t end,
                                std::size_t separator_index,
                                std::vector<TextSpan> &pieces) const {
  const auto span_text = text.substr(begin, end - begin);
  const auto length = CountCodePoints(span_text);
  if (length <= options_.chunk_size) {
    pieces.push_back({begin, end, length});
    return;
  }

  while (separator_index < options_.separators.size()) {
    const auto &separator = options_.separators[separator_index];
    if (separator.empty() || span_text.find(separator) != std::string::npos) {
      break;
    }
    ++separator_index;
  }

  const auto &separator = options_.separators[separator_index];
  if (separator.empty()) {
    std::size_t position = begin;
    while (position < end) {
      std::size_t next = position + 1;
      while (next < end && IsContinuationByte(text[next])) {
        ++next;
      }
      pieces.push_back({position, next, 1});
      position = next;
    }
    return;
  }

  std::size_t piece_begin = begin;
  while (piece_begin < end) {
    const auto found = span_text.find(separator, piece_begin - begin);
    const auto piece_end = found == std::string::npos
                               ? end
                               : begin + found + separator.size();
    CollectPieces(text, piece_begin, piece_end, separator_index + 1, pieces);
    piece_begin = piece_end;
  }
}

std::vector<TextSpan>
TextChunker::MergePieces(const std::vector<TextSpan> &pieces) const {
  std::vector<TextSpan> chunks;
  std::deque<TextSpan> window;
  std::size_t total = 0;

  const auto emit = [&]() {
    chunks.push_back({window.front().begin, window.back().end, total});
  };

  for (const auto &piece : pieces) {
    if (!window.empty() && total + piece.length > options_.chunk_size) {
      emit();
      while (!window.empty() &&
             (total > options_.chunk_overlap ||
              total + piece.length > options_.chunk_size)) {
        total -= window.front().length;
        window.pop_front();
      }
    }
    window.push_back(piece);
    total += piece.length;
  }
  if (!window.empty()) {
    emit();
  }
  return chunks;
}

std::vector<TextSpan> TextChunker::SplitText(std::string_view text) const {
  if (IsBlank(text)) {
    return {};
  }
  std::vector<TextSpan> pieces;
  CollectPieces(text, 0, text.size(), 0, pieces);
  return MergePieces(pieces);
}

std::vector<Chunk> TextChunker::Split(const Document &document) const {
  if (document.document_id.empty()) {
    throw InvalidDocument("Cannot chunk a document without a document_id");
  }
  const auto spans = SplitText(document.raw_text);
  std::vector<Chunk> chunks;
  chunks.reserve(spans.size());
  for (std::size_t ordinal = 0; ordinal < spans.size(); ++ordinal) {
    const auto &span = spans[ordinal];
    Chunk chunk;
    chunk.chunk_id = MakeChunkId(document.document_id, ordinal);
    chunk.source_document_id = document.document_id;
    chunk.ordinal = ordinal;
    chunk.start_offset = span.begin;
    chunk.text = document.raw_text.substr(span.begin, span.end - span.begin);
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

std::string ReassembleText(std::vector<Chunk> chunks) {
  std::sort(chunks.begin(), chunks.end(),
            [](const Chunk &left, const Chunk &right) {
              return left.ordinal < right.ordinal;
            });
  std::string text;
  std::size_t covered = 0;
  for (const auto &chunk : chunks) {
    if (chunk.start_offset > covered) {
      throw std::runtime_error("Chunk '" + chunk.chunk_id +
                               "' leaves a gap at offset " +
                               std::to_string(covered));
    }
    const auto chunk_end = chunk.start_offset + chunk.text.size();
    if (chunk_end > covered) {
      text.append(chunk.text, covered - chunk.start_offset,
                  std::string::npos);
      covered = chunk_end;
    }
  }
  return text;
}

} // namespace finrag
