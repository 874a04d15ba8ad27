#include <finrag/http_providers.h>

#include <finrag/errors.h>
#include <finrag/hashing_embedder.h>

#include <cstdlib>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace {

using json = nlohmann::json;

constexpr const char kDefaultOllamaEndpoint[] = "http://localhost:11434";
constexpr const char kDefaultOpenAiEndpoint[] = "https://api.openai.com/v1";

std::string TrimTrailingSlash(std::string endpoint) {
  while (!endpoint.empty() && endpoint.back() == '/') {
    endpoint.pop_back();
  }
  return endpoint;
}

json PostAndParse(finrag::HttpTransport &transport,
                  finrag::HttpRequest request, const std::string &what) {
  const auto response = transport.PostJson(request);
  if (response.status < 200 || response.status >= 300) {
    throw std::runtime_error(what + " failed: status " +
                             std::to_string(response.status));
  }
  try {
    return json::parse(response.body);
  } catch (const json::exception &error) {
    throw std::runtime_error(what + " returned malformed JSON: " +
                             error.what());
  }
}

} // namespace

namespace finrag {

OllamaChatProvider::OllamaChatProvider(ProviderConfig config,
                                       std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (config_.endpoint.empty()) {
    config_.endpoint = kDefaultOllamaEndpoint;
  }
}

std::string OllamaChatProvider::ProduceText(const std::string &prompt) {
  const json body = {
      {"model", config_.model},
      {"stream", false},
      {"messages", json::array({json{{"role", "user"}, {"content", prompt}}})}};
  const auto data = PostAndParse(
      *transport_,
      {TrimTrailingSlash(config_.endpoint) + "/api/chat", {}, body.dump(),
       config_.timeout_ms},
      "Ollama chat");
  if (!data.contains("message") || !data["message"].contains("content") ||
      !data["message"]["content"].is_string()) {
    throw std::runtime_error("Ollama chat response has no message content");
  }
  return data["message"]["content"].get<std::string>();
}

OpenAiCompatibleProvider::OpenAiCompatibleProvider(
    ProviderConfig config, std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (config_.endpoint.empty()) {
    config_.endpoint = kDefaultOpenAiEndpoint;
  }
}

std::string OpenAiCompatibleProvider::ProduceText(const std::string &prompt) {
  std::vector<std::string> headers;
  if (!config_.api_key_env.empty()) {
    const char *key = std::getenv(config_.api_key_env.c_str());
    if (key == nullptr || *key == '\0') {
      throw std::runtime_error("Environment variable " + config_.api_key_env +
                               " is not set");
    }
    headers.push_back(std::string("Authorization: Bearer ") + key);
  }
  const json body = {
      {"model", config_.model},
      {"messages", json::array({json{{"role", "user"}, {"content", prompt}}})}};
  const auto data = PostAndParse(
      *transport_,
      {TrimTrailingSlash(config_.endpoint) + "/chat/completions",
       std::move(headers), body.dump(), config_.timeout_ms},
      "Chat completion");
  const auto choices = data.find("choices");
  if (choices == data.end() || !choices->is_array() || choices->empty()) {
    throw std::runtime_error("Chat completion response has no choices");
  }
  const auto &message = (*choices)[0].value("message", json::object());
  if (!message.contains("content") || !message["content"].is_string()) {
    throw std::runtime_error("Chat completion response has no content");
  }
  return message["content"].get<std::string>();
}

OllamaEmbedder::OllamaEmbedder(EmbeddingConfig config,
                               std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (config_.model.empty()) {
    throw InvalidConfig("Embedding type 'ollama' requires a model");
  }
}

std::vector<float> OllamaEmbedder::Embed(const std::string &text) {
  const json body = {{"model", config_.model}, {"prompt", text}};
  const auto data = PostAndParse(
      *transport_,
      {TrimTrailingSlash(config_.endpoint) + "/api/embeddings", {},
       body.dump(), config_.timeout_ms},
      "Ollama embedding");
  const auto embedding = data.find("embedding");
  if (embedding == data.end() || !embedding->is_array()) {
    throw std::runtime_error("Ollama embedding response has no embedding");
  }
  std::vector<float> vector;
  vector.reserve(embedding->size());
  for (const auto &value : *embedding) {
    vector.push_back(value.get<float>());
  }
  if (vector.size() != config_.dimension) {
    throw std::runtime_error("Ollama embedding has dimension " +
                             std::to_string(vector.size()) + ", expected " +
                             std::to_string(config_.dimension));
  }
  return vector;
}

std::shared_ptr<GenerationProvider>
MakeProvider(const ProviderConfig &config,
             std::shared_ptr<HttpTransport> transport) {
  if (config.type == "ollama") {
    return std::make_shared<OllamaChatProvider>(config, std::move(transport));
  }
  if (config.type == "openai") {
    return std::make_shared<OpenAiCompatibleProvider>(config,
                                                      std::move(transport));
  }
  throw InvalidConfig("Unknown provider type '" + config.type +
                      "' for provider '" + config.name + "'");
}

std::shared_ptr<Embedder> MakeEmbedder(const EmbeddingConfig &config,
                                       std::shared_ptr<HttpTransport> transport) {
  if (config.type == "hashing") {
    return std::make_shared<HashingEmbedder>(config.dimension);
  }
  if (config.type == "ollama") {
    return std::make_shared<OllamaEmbedder>(config, std::move(transport));
  }
  throw InvalidConfig("Unknown embedding type '" + config.type + "'");
}

} // namespace finrag
