#include <finrag/prompt_catalog.h>

#include <finrag/errors.h>

#include <cctype>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

constexpr const char kTimeRangeTemplate[] =
    R"(Decide how many years of company filings are needed to answer the question below.

Question: {user_query}

Rules:
- Explicit periods ("last 5 years", "since 2020") decide the answer.
- Questions about recent results or the current quarter need 1 year.
- Trend or long-term questions need 5 years.
- Otherwise answer 3.

Respond with JSON only, for example:
{{"years": 3, "reason": "no explicit period"}})";

constexpr const char kIndustryKeywordsTemplate[] =
    R"(List the industry topics that matter for the question about {company_name}.

Question: {user_query}

Respond with JSON only, listing at most five short keywords, for example:
{{"keywords": ["semiconductor", "memory"]}})";

constexpr const char kRagAnalysisTemplate[] =
    R"(You are a financial analyst. Answer the question about {company_name} using only the reference material below.

Question: {user_query}

Reference material ({num_chunks} passages):
{context}

Cite the reference numbers you rely on. If the material does not answer the question, say so.{exclude_opinions_instruction})";

constexpr const char kExcludeOpinionsText[] =
    "\n\nUse only factual data from the reference material. Leave out the "
    "opinions of report authors, including investment ratings and target "
    "prices, and state explicitly where you excluded them.";

bool IsIdentifierCharacter(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) != 0 ||
         character == '_';
}

std::string RequireScalar(const YAML::Node &node, const std::string &key) {
  if (!node || !node.IsScalar()) {
    throw finrag::InvalidConfig("Prompt key '" + key + "' must be a string");
  }
  return node.as<std::string>();
}

} // namespace

namespace finrag {

std::string RenderTemplate(const std::string &text,
                           const PromptValues &values) {
  std::string rendered;
  rendered.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto character = text[i];
    if (character == '{' && i + 1 < text.size() && text[i + 1] == '{') {
      rendered.push_back('{');
      ++i;
      continue;
    }
    if (character == '}' && i + 1 < text.size() && text[i + 1] == '}') {
      rendered.push_back('}');
      ++i;
      continue;
    }
    if (character == '{') {
      auto end = i + 1;
      while (end < text.size() && IsIdentifierCharacter(text[end])) {
        ++end;
      }
      if (end < text.size() && text[end] == '}' && end > i + 1) {
        const auto name = text.substr(i + 1, end - i - 1);
        const auto value = values.find(name);
        if (value == values.end()) {
          throw std::invalid_argument("No value for template variable '" +
                                      name + "'");
        }
        rendered.append(value->second);
        i = end;
        continue;
      }
    }
    rendered.push_back(character);
  }
  return rendered;
}

std::string ExcludeOpinionsInstruction(bool exclude_opinions) {
  return exclude_opinions ? kExcludeOpinionsText : "";
}

PromptCatalog PromptCatalog::Defaults() {
  PromptCatalog catalog;
  catalog.Add({kTimeRangePrompt,
               "Infer how many years of filings a question needs",
               kTimeRangeTemplate,
               {"user_query"}});
  catalog.Add({kIndustryKeywordsPrompt,
               "Extract industry keywords relevant to a question",
               kIndustryKeywordsTemplate,
               {"company_name", "user_query"}});
  catalog.Add({kRagAnalysisPrompt,
               "Answer a question from retrieved passages",
               kRagAnalysisTemplate,
               {"company_name", "user_query", "num_chunks", "context",
                "exclude_opinions_instruction"}});
  return catalog;
}

PromptCatalog PromptCatalog::LoadFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw InvalidConfig("Prompt file not found: " + path.string());
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::Exception &error) {
    throw InvalidConfig("Invalid prompt file " + path.string() + ": " +
                        error.what());
  }
  if (!root.IsMap()) {
    throw InvalidConfig("Prompt file must contain a mapping at the root: " +
                        path.string());
  }

  auto catalog = Defaults();
  for (const auto &entry : root) {
    const auto name = entry.first.as<std::string>();
    const auto &node = entry.second;
    if (!node.IsMap()) {
      throw InvalidConfig("Prompt '" + name + "' must be a mapping");
    }
    PromptTemplate prompt;
    prompt.name = name;
    prompt.text = RequireScalar(node["template"], name + ".template");
    if (node["description"]) {
      prompt.description =
          RequireScalar(node["description"], name + ".description");
    }
    if (const auto variables = node["variables"]) {
      if (!variables.IsSequence()) {
        throw InvalidConfig("Prompt key '" + name +
                            ".variables' must be a list of strings");
      }
      for (const auto &variable : variables) {
        prompt.variables.push_back(
            RequireScalar(variable, name + ".variables"));
      }
    }
    catalog.Add(std::move(prompt));
  }
  return catalog;
}

void PromptCatalog::Add(PromptTemplate prompt) {
  if (prompt.name.empty()) {
    throw std::invalid_argument("Prompt name cannot be empty");
  }
  auto name = prompt.name;
  prompts_[name] = std::move(prompt);
}

bool PromptCatalog::Contains(const std::string &name) const {
  return prompts_.count(name) != 0;
}

const PromptTemplate &PromptCatalog::Get(const std::string &name) const {
  const auto found = prompts_.find(name);
  if (found == prompts_.end()) {
    throw std::invalid_argument("Unknown prompt '" + name + "'");
  }
  return found->second;
}

std::vector<std::string> PromptCatalog::Names() const {
  std::vector<std::string> names;
  names.reserve(prompts_.size());
  for (const auto &entry : prompts_) {
    names.push_back(entry.first);
  }
  return names;
}

std::string PromptCatalog::Render(const std::string &name,
                                  const PromptValues &values) const {
  const auto &prompt = Get(name);
  std::string missing;
  for (const auto &variable : prompt.variables) {
    if (values.count(variable) == 0) {
      missing += missing.empty() ? variable : ", " + variable;
    }
  }
  if (!missing.empty()) {
    throw std::invalid_argument("Prompt '" + name +
                                "' is missing required variables: " + missing);
  }
  return RenderTemplate(prompt.text, values);
}

} // namespace finrag
