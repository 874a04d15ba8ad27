#pragma once

#include <finrag/config.h>
#include <finrag/http_client.h>
#include <finrag/interfaces.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace finrag {

// Ollama /api/chat with streaming disabled.
class OllamaChatProvider : public GenerationProvider {
public:
  OllamaChatProvider(ProviderConfig config,
                     std::shared_ptr<HttpTransport> transport);

  std::string ProduceText(const std::string &prompt) override;
  ProviderCapabilities DeclareCapabilities() const override {
    return config_.capabilities;
  }
  std::string Name() const override { return config_.name; }

private:
  ProviderConfig config_;
  std::shared_ptr<HttpTransport> transport_;
};

// Any OpenAI-style /chat/completions endpoint. The API key is read from the
// environment variable named by `api_key_env` on every call.
class OpenAiCompatibleProvider : public GenerationProvider {
public:
  OpenAiCompatibleProvider(ProviderConfig config,
                           std::shared_ptr<HttpTransport> transport);

  std::string ProduceText(const std::string &prompt) override;
  ProviderCapabilities DeclareCapabilities() const override {
    return config_.capabilities;
  }
  std::string Name() const override { return config_.name; }

private:
  ProviderConfig config_;
  std::shared_ptr<HttpTransport> transport_;
};

// Ollama /api/embeddings. Responses whose length differs from the configured
// dimension are rejected.
class OllamaEmbedder : public Embedder {
public:
  OllamaEmbedder(EmbeddingConfig config,
                 std::shared_ptr<HttpTransport> transport);

  std::vector<float> Embed(const std::string &text) override;
  std::size_t Dimension() const override { return config_.dimension; }
  std::string Name() const override { return "ollama:" + config_.model; }

private:
  EmbeddingConfig config_;
  std::shared_ptr<HttpTransport> transport_;
};

std::shared_ptr<GenerationProvider>
MakeProvider(const ProviderConfig &config,
             std::shared_ptr<HttpTransport> transport);
std::shared_ptr<Embedder> MakeEmbedder(const EmbeddingConfig &config,
                                       std::shared_ptr<HttpTransport> transport);

} // namespace finrag
