#ifndef FINRAG_TEST_SUPPORT_FAKES_H
#define FINRAG_TEST_SUPPORT_FAKES_H

#include <finrag/hashing_embedder.h>
#include <finrag/interfaces.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <gmock/gmock.h>

namespace finrag {
namespace test {

// One axis per vocabulary word, so cosine scores are easy to predict: a text
// scores 1.0 against a query made of exactly the same vocabulary words.
class VocabularyEmbedder : public Embedder {
public:
  explicit VocabularyEmbedder(std::vector<std::string> vocabulary)
      : vocabulary_(std::move(vocabulary)) {}

  std::vector<float> Embed(const std::string &text) override {
    ++calls_;
    std::vector<float> vector(vocabulary_.size(), 0.0F);
    for (const auto &token : Tokenize(text)) {
      for (std::size_t i = 0; i < vocabulary_.size(); ++i) {
        if (token == vocabulary_[i]) {
          vector[i] += 1.0F;
        }
      }
    }
    NormalizeInPlace(vector);
    return vector;
  }

  std::size_t Dimension() const override { return vocabulary_.size(); }
  std::string Name() const override { return "vocabulary"; }

  int Calls() const { return calls_.load(); }

private:
  std::vector<std::string> vocabulary_;
  std::atomic<int> calls_{0};
};

inline std::vector<std::string> FinanceVocabulary() {
  return {"revenue", "margin", "debt", "semiconductor", "battery", "retail"};
}

// Answers every prompt through `responder`; a throwing responder simulates a
// backend outage.
class StubProvider : public GenerationProvider {
public:
  using Responder = std::function<std::string(const std::string &)>;

  StubProvider(std::string name, ProviderCapabilities capabilities,
               Responder responder)
      : name_(std::move(name)), capabilities_(std::move(capabilities)),
        responder_(std::move(responder)) {}

  StubProvider(std::string name, std::string answer)
      : StubProvider(std::move(name), ProviderCapabilities{},
                     [answer](const std::string &) { return answer; }) {}

  std::string ProduceText(const std::string &prompt) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      prompts_.push_back(prompt);
    }
    return responder_(prompt);
  }

  ProviderCapabilities DeclareCapabilities() const override {
    return capabilities_;
  }
  std::string Name() const override { return name_; }

  std::vector<std::string> Prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return prompts_;
  }

private:
  std::string name_;
  ProviderCapabilities capabilities_;
  Responder responder_;
  mutable std::mutex mutex_;
  std::vector<std::string> prompts_;
};

inline ProviderCapabilities LongContext(std::size_t window = 128000) {
  ProviderCapabilities capabilities;
  capabilities.context_window = window;
  capabilities.supports_long_context = true;
  return capabilities;
}

class MockCompanyResolver : public CompanyResolver {
public:
  MOCK_METHOD(std::optional<std::string>, Resolve,
              (const std::string &company_name), (override));
};

class MockDocumentSource : public DocumentSource {
public:
  MOCK_METHOD(SourceKind, Kind, (), (const, override));
  MOCK_METHOD(std::vector<DocumentReference>, Search,
              (const std::string &company_identifier,
               const FetchFilters &filters),
              (override));
  MOCK_METHOD(Document, Fetch, (const DocumentReference &reference),
              (override));
};

class RecordingObserver : public StageObserver {
public:
  void OnStageEvent(const StageEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<StageEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

private:
  mutable std::mutex mutex_;
  std::vector<StageEvent> events_;
};

} // namespace test
} // namespace finrag

#endif // FINRAG_TEST_SUPPORT_FAKES_H
