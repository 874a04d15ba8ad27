#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace finrag {

constexpr const char kTimeRangePrompt[] = "time_range_extraction";
constexpr const char kIndustryKeywordsPrompt[] = "industry_keywords";
constexpr const char kRagAnalysisPrompt[] = "rag_analysis";

struct PromptTemplate {
  std::string name;
  std::string description;
  std::string text;
  std::vector<std::string> variables;
};

using PromptValues = std::map<std::string, std::string>;

// Named templates with `{variable}` placeholders; `{{` and `}}` produce
// literal braces.
class PromptCatalog {
public:
  static PromptCatalog Defaults();
  // Defaults overridden by the templates in a YAML mapping of
  // name -> {description, variables, template}.
  static PromptCatalog LoadFile(const std::filesystem::path &path);

  void Add(PromptTemplate prompt);
  bool Contains(const std::string &name) const;
  const PromptTemplate &Get(const std::string &name) const;
  std::vector<std::string> Names() const;

  std::string Render(const std::string &name,
                     const PromptValues &values) const;

private:
  std::map<std::string, PromptTemplate> prompts_;
};

std::string RenderTemplate(const std::string &text, const PromptValues &values);

// Value of the analysis prompt's `exclude_opinions_instruction` variable;
// empty unless `exclude_opinions` is set.
std::string ExcludeOpinionsInstruction(bool exclude_opinions);

} // namespace finrag
