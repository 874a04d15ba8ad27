#include <finrag/hashing_embedder.h>

#include <finrag/errors.h>

#include <cmath>
#include <utility>

namespace {

constexpr std::uint64_t kFnvOffsetBasis = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr float kBigramWeight = 0.5F;

bool IsTokenByte(unsigned char byte) {
  if (byte >= 0x80U) {
    return true;
  }
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
         (byte >= '0' && byte <= '9');
}

} // namespace

namespace finrag {

std::uint64_t Fnv1a(std::string_view text) {
  std::uint64_t hash = kFnvOffsetBasis;
  for (const auto character : text) {
    hash ^= static_cast<unsigned char>(character);
    hash *= kFnvPrime;
  }
  return hash;
}

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const auto character : text) {
    const auto byte = static_cast<unsigned char>(character);
    if (IsTokenByte(byte)) {
      if (byte >= 'A' && byte <= 'Z') {
        current.push_back(static_cast<char>(byte - 'A' + 'a'));
      } else {
        current.push_back(character);
      }
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void NormalizeInPlace(std::vector<float> &vector) {
  double norm = 0.0;
  for (const auto value : vector) {
    norm += static_cast<double>(value) * static_cast<double>(value);
  }
  if (norm <= 0.0) {
    return;
  }
  const auto inverse = static_cast<float>(1.0 / std::sqrt(norm));
  for (auto &value : vector) {
    value *= inverse;
  }
}

HashingEmbedder::HashingEmbedder(std::size_t dimension)
    : dimension_(dimension) {
  if (dimension_ == 0) {
    throw InvalidConfig("Embedding dimension must be greater than zero");
  }
}

std::vector<float> HashingEmbedder::Embed(const std::string &text) {
  std::vector<float> vector(dimension_, 0.0F);
  const auto tokens = Tokenize(text);

  const auto accumulate = [&](std::string_view feature, float weight) {
    const auto hash = Fnv1a(feature);
    const auto bucket = static_cast<std::size_t>(hash % dimension_);
    const float sign = ((hash >> 63U) & 1U) != 0U ? -1.0F : 1.0F;
    vector[bucket] += sign * weight;
  };

  for (std::size_t i = 0; i < tokens.size(); ++i) {
    accumulate(tokens[i], 1.0F);
    if (i + 1 < tokens.size()) {
      accumulate(tokens[i] + " " + tokens[i + 1], kBigramWeight);
    }
  }
  NormalizeInPlace(vector);
  return vector;
}

} // namespace finrag
