#pragma once

#include <finrag/generation_router.h>
#include <finrag/logging.h>
#include <finrag/models.h>
#include <finrag/retrieval_engine.h>
#include <finrag/text_chunker.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

struct EmbeddingConfig {
  std::string type = "hashing";
  std::size_t dimension = 256;
  std::string endpoint = "http://localhost:11434";
  std::string model;
  long timeout_ms = 60000;
};

struct ProviderConfig {
  std::string name;
  std::string type = "ollama";
  std::string endpoint;
  std::string model;
  std::string api_key_env;
  long timeout_ms = 120000;
  bool is_default = false;
  ProviderCapabilities capabilities;
};

struct EngineConfig {
  std::filesystem::path data_directory = "finrag_data";
  ChunkerOptions chunker;
  RetrievalOptions retrieval;
  EmbeddingConfig embedding;
  std::vector<ProviderConfig> providers;
  std::map<std::string, std::string> task_routes;
  std::map<std::string, TaskRequirement> task_requirements;
  std::optional<std::filesystem::path> prompts_file;
  LoggingConfig logging;
  int default_years = 3;
  int max_years = 10;
  std::size_t max_documents_per_source = 5;
};

const std::vector<std::string> &SupportedConfigKeys();

// Parses a YAML config file. Relative paths inside it resolve against the
// file's directory. Throws InvalidConfig on unknown keys or bad values.
EngineConfig LoadEngineConfig(const std::filesystem::path &path);
EngineConfig ParseEngineConfig(const std::string &yaml_text,
                               const std::filesystem::path &base_directory);

void ValidateEngineConfig(const EngineConfig &config);

} // namespace finrag
