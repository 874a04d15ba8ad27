#include <finrag/config.h>

#include <finrag/cache_keys.h>
#include <finrag/errors.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>
#include <unordered_map>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

using finrag::InvalidConfig;

std::string NormalizeConfigKey(std::string key) {
  key = finrag::ToLowerAscii(finrag::Trim(std::move(key)));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"data_directory", "data_dir"},
      {"prompts_file", "prompts"},
      {"routes", "task_routes"},
      {"requirements", "task_requirements"},
      {"threshold", "score_threshold"}};
  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key,
                                  const std::vector<std::string> &supported,
                                  const std::string &section) {
  std::string message = "Unknown " + section + " key: " + key +
                        ". Supported keys: ";
  for (std::size_t i = 0; i < supported.size(); ++i) {
    message += supported[i];
    if (i + 1 < supported.size()) {
      message += ", ";
    }
  }
  throw InvalidConfig(message);
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw InvalidConfig("Config key '" + key_name + "' must be a string");
  }
  return node.as<std::string>();
}

bool ExtractBool(const YAML::Node &node, const std::string &key_name) {
  const auto normalized =
      finrag::ToLowerAscii(finrag::Trim(ExtractStringScalar(node, key_name)));
  if (normalized == "true" || normalized == "1" || normalized == "yes" ||
      normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" ||
      normalized == "off") {
    return false;
  }
  throw InvalidConfig("Config key '" + key_name + "' must be a boolean");
}

long long ExtractInteger(const YAML::Node &node, const std::string &key_name) {
  const auto text = finrag::Trim(ExtractStringScalar(node, key_name));
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception &) {
    throw InvalidConfig("Config key '" + key_name +
                        "' must be an integer, got '" + text + "'");
  }
  if (consumed != text.size()) {
    throw InvalidConfig("Config key '" + key_name +
                        "' must be an integer, got '" + text + "'");
  }
  return value;
}

std::size_t ExtractCount(const YAML::Node &node, const std::string &key_name) {
  const auto value = ExtractInteger(node, key_name);
  if (value < 0) {
    throw InvalidConfig("Config key '" + key_name +
                        "' must not be negative");
  }
  return static_cast<std::size_t>(value);
}

float ExtractFloat(const YAML::Node &node, const std::string &key_name) {
  const auto text = finrag::Trim(ExtractStringScalar(node, key_name));
  std::size_t consumed = 0;
  float value = 0.0F;
  try {
    value = std::stof(text, &consumed);
  } catch (const std::exception &) {
    throw InvalidConfig("Config key '" + key_name +
                        "' must be a number, got '" + text + "'");
  }
  if (consumed != text.size()) {
    throw InvalidConfig("Config key '" + key_name +
                        "' must be a number, got '" + text + "'");
  }
  return value;
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      values.push_back(ExtractStringScalar(child, key_name));
    }
    return values;
  }
  if (node.IsScalar()) {
    std::stringstream stream(node.as<std::string>());
    std::string item;
    while (std::getline(stream, item, ',')) {
      item = finrag::Trim(item);
      if (!item.empty()) {
        values.push_back(item);
      }
    }
    return values;
  }
  throw InvalidConfig("Config key '" + key_name +
                      "' must be a string or list of strings");
}

void RequireMap(const YAML::Node &node, const std::string &key_name) {
  if (!node.IsMap()) {
    throw InvalidConfig("Config key '" + key_name + "' must be a mapping");
  }
}

std::filesystem::path ResolvePath(const std::string &value,
                                  const std::filesystem::path &base) {
  std::filesystem::path path(value);
  if (path.is_relative() && !base.empty()) {
    return base / path;
  }
  return path;
}

finrag::ProviderCapabilities ParseCapabilities(const YAML::Node &node,
                                               const std::string &prefix) {
  static const std::vector<std::string> keys = {
      "context_window", "long_context", "languages", "cost", "speed"};
  RequireMap(node, prefix);
  finrag::ProviderCapabilities capabilities;
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto name = prefix + "." + key;
    if (key == "context_window") {
      capabilities.context_window = ExtractCount(entry.second, name);
    } else if (key == "long_context" || key == "supports_long_context") {
      capabilities.supports_long_context = ExtractBool(entry.second, name);
    } else if (key == "languages") {
      capabilities.languages = ExtractList(entry.second, name);
    } else if (key == "cost") {
      capabilities.relative_cost =
          finrag::ParseCostTier(ExtractStringScalar(entry.second, name));
    } else if (key == "speed") {
      capabilities.relative_speed =
          finrag::ParseSpeedTier(ExtractStringScalar(entry.second, name));
    } else {
      ThrowUnknownKey(key, keys, "capability");
    }
  }
  return capabilities;
}

finrag::ProviderConfig ParseProvider(const YAML::Node &node,
                                     std::size_t position) {
  static const std::vector<std::string> keys = {
      "name",        "type",       "endpoint", "model",
      "api_key_env", "timeout_ms", "default",  "capabilities"};
  const auto prefix = "providers[" + std::to_string(position) + "]";
  RequireMap(node, prefix);
  finrag::ProviderConfig provider;
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto name = prefix + "." + key;
    if (key == "name") {
      provider.name = ExtractStringScalar(entry.second, name);
    } else if (key == "type") {
      provider.type =
          finrag::ToLowerAscii(ExtractStringScalar(entry.second, name));
    } else if (key == "endpoint") {
      provider.endpoint = ExtractStringScalar(entry.second, name);
    } else if (key == "model") {
      provider.model = ExtractStringScalar(entry.second, name);
    } else if (key == "api_key_env") {
      provider.api_key_env = ExtractStringScalar(entry.second, name);
    } else if (key == "timeout_ms") {
      provider.timeout_ms = static_cast<long>(ExtractCount(entry.second, name));
    } else if (key == "default") {
      provider.is_default = ExtractBool(entry.second, name);
    } else if (key == "capabilities") {
      provider.capabilities = ParseCapabilities(entry.second, name);
    } else {
      ThrowUnknownKey(key, keys, "provider");
    }
  }
  return provider;
}

finrag::EmbeddingConfig ParseEmbedding(const YAML::Node &node) {
  static const std::vector<std::string> keys = {"type", "dimension",
                                                "endpoint", "model",
                                                "timeout_ms"};
  RequireMap(node, "embedding");
  finrag::EmbeddingConfig embedding;
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto name = "embedding." + key;
    if (key == "type") {
      embedding.type =
          finrag::ToLowerAscii(ExtractStringScalar(entry.second, name));
    } else if (key == "dimension") {
      embedding.dimension = ExtractCount(entry.second, name);
    } else if (key == "endpoint") {
      embedding.endpoint = ExtractStringScalar(entry.second, name);
    } else if (key == "model") {
      embedding.model = ExtractStringScalar(entry.second, name);
    } else if (key == "timeout_ms") {
      embedding.timeout_ms =
          static_cast<long>(ExtractCount(entry.second, name));
    } else {
      ThrowUnknownKey(key, keys, "embedding");
    }
  }
  return embedding;
}

finrag::TaskRequirement ParseRequirement(const YAML::Node &node,
                                         const std::string &prefix) {
  static const std::vector<std::string> keys = {"long_context",
                                                "min_context_window"};
  RequireMap(node, prefix);
  finrag::TaskRequirement requirement;
  for (const auto &entry : node) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    const auto name = prefix + "." + key;
    if (key == "long_context" || key == "requires_long_context") {
      requirement.requires_long_context = ExtractBool(entry.second, name);
    } else if (key == "min_context_window") {
      requirement.min_context_window = ExtractCount(entry.second, name);
    } else {
      ThrowUnknownKey(key, keys, "task requirement");
    }
  }
  return requirement;
}

void ApplyEntry(const std::string &key, const YAML::Node &node,
                const std::filesystem::path &base,
                finrag::EngineConfig &config) {
  if (key == "data_dir") {
    config.data_directory = ResolvePath(ExtractStringScalar(node, key), base);
  } else if (key == "log_level") {
    try {
      config.logging.level =
          finrag::ParseLogLevel(ExtractStringScalar(node, key));
    } catch (const std::invalid_argument &error) {
      throw InvalidConfig(error.what());
    }
  } else if (key == "chunk_size") {
    config.chunker.chunk_size = ExtractCount(node, key);
  } else if (key == "chunk_overlap") {
    config.chunker.chunk_overlap = ExtractCount(node, key);
  } else if (key == "top_k") {
    config.retrieval.top_k = ExtractCount(node, key);
  } else if (key == "score_threshold") {
    config.retrieval.score_threshold = ExtractFloat(node, key);
  } else if (key == "default_years") {
    config.default_years = static_cast<int>(ExtractInteger(node, key));
  } else if (key == "max_years") {
    config.max_years = static_cast<int>(ExtractInteger(node, key));
  } else if (key == "max_documents_per_source") {
    config.max_documents_per_source = ExtractCount(node, key);
  } else if (key == "embedding") {
    config.embedding = ParseEmbedding(node);
  } else if (key == "providers") {
    if (!node.IsSequence()) {
      throw InvalidConfig("Config key 'providers' must be a list");
    }
    config.providers.clear();
    std::size_t position = 0;
    for (const auto &child : node) {
      config.providers.push_back(ParseProvider(child, position++));
    }
  } else if (key == "task_routes") {
    RequireMap(node, key);
    for (const auto &entry : node) {
      const auto task = entry.first.as<std::string>();
      config.task_routes[task] =
          ExtractStringScalar(entry.second, key + "." + task);
    }
  } else if (key == "task_requirements") {
    RequireMap(node, key);
    for (const auto &entry : node) {
      const auto task = entry.first.as<std::string>();
      config.task_requirements[task] =
          ParseRequirement(entry.second, key + "." + task);
    }
  } else if (key == "prompts") {
    config.prompts_file = ResolvePath(ExtractStringScalar(node, key), base);
  } else {
    ThrowUnknownKey(key, finrag::SupportedConfigKeys(), "config");
  }
}

} // namespace

namespace finrag {

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {"data_dir",
                                                "log_level",
                                                "chunk_size",
                                                "chunk_overlap",
                                                "top_k",
                                                "score_threshold",
                                                "default_years",
                                                "max_years",
                                                "max_documents_per_source",
                                                "embedding",
                                                "providers",
                                                "task_routes",
                                                "task_requirements",
                                                "prompts"};
  return keys;
}

EngineConfig ParseEngineConfig(const std::string &yaml_text,
                               const std::filesystem::path &base_directory) {
  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception &error) {
    throw InvalidConfig(std::string("Invalid YAML config: ") + error.what());
  }
  EngineConfig config;
  if (root.IsNull()) {
    return config;
  }
  if (!root.IsMap()) {
    throw InvalidConfig("Config file must contain a mapping at the root");
  }
  for (const auto &entry : root) {
    const auto key = NormalizeConfigKey(entry.first.as<std::string>());
    try {
      ApplyEntry(key, entry.second, base_directory, config);
    } catch (const YAML::Exception &error) {
      throw InvalidConfig("Config key '" + key + "': " + error.what());
    } catch (const InvalidConfig &) {
      throw;
    } catch (const std::invalid_argument &error) {
      throw InvalidConfig("Config key '" + key + "': " + error.what());
    }
  }
  return config;
}

EngineConfig LoadEngineConfig(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw InvalidConfig("Config file not found: " + path.string());
  }
  const auto extension = ToLowerAscii(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw InvalidConfig("Unsupported config format: " + extension);
  }
  std::ifstream stream(path);
  if (!stream) {
    throw InvalidConfig("Failed to open config file: " + path.string());
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  return ParseEngineConfig(content, path.parent_path());
}

void ValidateEngineConfig(const EngineConfig &config) {
  if (config.chunker.chunk_size == 0) {
    throw InvalidConfig("chunk_size must be greater than zero");
  }
  if (config.chunker.chunk_overlap >= config.chunker.chunk_size) {
    throw InvalidConfig("chunk_overlap must be smaller than chunk_size");
  }
  if (config.retrieval.top_k == 0) {
    throw InvalidConfig("top_k must be greater than zero");
  }
  ValidateRetrievalOptions(config.retrieval);
  if (config.max_years < 1) {
    throw InvalidConfig("max_years must be at least 1");
  }
  if (config.default_years < 1 || config.default_years > config.max_years) {
    throw InvalidConfig("default_years must be within [1, max_years]");
  }
  if (config.max_documents_per_source == 0) {
    throw InvalidConfig("max_documents_per_source must be greater than zero");
  }
  if (config.embedding.type != "hashing" && config.embedding.type != "ollama") {
    throw InvalidConfig("Unsupported embedding type: " +
                        config.embedding.type);
  }
  if (config.embedding.dimension == 0) {
    throw InvalidConfig("embedding.dimension must be greater than zero");
  }
  if (config.embedding.type == "ollama" && config.embedding.model.empty()) {
    throw InvalidConfig("embedding.model is required for ollama embeddings");
  }

  std::set<std::string> names;
  for (const auto &provider : config.providers) {
    if (provider.name.empty()) {
      throw InvalidConfig("Every provider needs a name");
    }
    if (!names.insert(provider.name).second) {
      throw InvalidConfig("Duplicate provider name: " + provider.name);
    }
    if (provider.type != "ollama" && provider.type != "openai") {
      throw InvalidConfig("Provider '" + provider.name +
                          "' has unsupported type: " + provider.type);
    }
    if (provider.endpoint.empty() || provider.model.empty()) {
      throw InvalidConfig("Provider '" + provider.name +
                          "' needs an endpoint and a model");
    }
  }
  for (const auto &[task, provider] : config.task_routes) {
    if (names.count(provider) == 0) {
      throw InvalidConfig("Task route '" + task +
                          "' refers to unknown provider '" + provider + "'");
    }
  }
}

} // namespace finrag
