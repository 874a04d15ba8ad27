#pragma once

#include <finrag/interfaces.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace finrag {

std::uint64_t Fnv1a(std::string_view text);

// Lowercases ASCII letters and splits on ASCII whitespace and punctuation.
// Bytes >= 0x80 stay inside tokens, so multi-byte scripts survive intact.
std::vector<std::string> Tokenize(std::string_view text);

// Offline embedder: signed feature hashing of unigrams and bigrams into a
// fixed number of buckets, then L2-normalized. Text without tokens maps to
// the zero vector.
class HashingEmbedder : public Embedder {
public:
  explicit HashingEmbedder(std::size_t dimension = 256);

  std::vector<float> Embed(const std::string &text) override;
  std::size_t Dimension() const override { return dimension_; }
  std::string Name() const override { return "hashing"; }

private:
  std::size_t dimension_;
};

void NormalizeInPlace(std::vector<float> &vector);

} // namespace finrag
