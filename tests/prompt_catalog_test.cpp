#include <finrag/errors.h>
#include <finrag/prompt_catalog.h>

#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace finrag {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

TEST(RenderTemplateTest, SubstitutesVariables) {
  EXPECT_EQ(RenderTemplate("{company} in {year}",
                           {{"company", "Samsung"}, {"year", "2024"}}),
            "Samsung in 2024");
}

TEST(RenderTemplateTest, DoubledBracesAreLiteral) {
  EXPECT_EQ(RenderTemplate("{{\"years\": {n}}}", {{"n", "3"}}),
            "{\"years\": 3}");
}

TEST(RenderTemplateTest, LeavesNonPlaceholderBracesAlone) {
  EXPECT_EQ(RenderTemplate("a { b } {not-a-name}", {}), "a { b } {not-a-name}");
}

TEST(RenderTemplateTest, RejectsUnknownVariable) {
  EXPECT_THROW(RenderTemplate("{missing}", {}), std::invalid_argument);
}

TEST(PromptCatalogTest, DefaultsCoverPipelinePrompts) {
  const auto catalog = PromptCatalog::Defaults();

  EXPECT_TRUE(catalog.Contains(kTimeRangePrompt));
  EXPECT_TRUE(catalog.Contains(kIndustryKeywordsPrompt));
  EXPECT_TRUE(catalog.Contains(kRagAnalysisPrompt));
}

TEST(PromptCatalogTest, RendersAnalysisPrompt) {
  const auto prompt = PromptCatalog::Defaults().Render(
      kRagAnalysisPrompt, {{"company_name", "Samsung Electronics"},
                           {"user_query", "How did margins move?"},
                           {"num_chunks", "2"},
                           {"context", "[Reference 1/2] ..."},
                           {"exclude_opinions_instruction",
                            ExcludeOpinionsInstruction(false)}});

  EXPECT_THAT(prompt, HasSubstr("Samsung Electronics"));
  EXPECT_THAT(prompt, HasSubstr("How did margins move?"));
  EXPECT_THAT(prompt, HasSubstr("(2 passages)"));
  EXPECT_THAT(prompt, Not(HasSubstr("target prices")));
}

TEST(PromptCatalogTest, AnalysisPromptCanExcludeOpinions) {
  const auto prompt = PromptCatalog::Defaults().Render(
      kRagAnalysisPrompt, {{"company_name", "Samsung Electronics"},
                           {"user_query", "How did margins move?"},
                           {"num_chunks", "1"},
                           {"context", "[Reference 1/1] ..."},
                           {"exclude_opinions_instruction",
                            ExcludeOpinionsInstruction(true)}});

  EXPECT_THAT(prompt, HasSubstr("Use only factual data"));
  EXPECT_THAT(prompt, HasSubstr("target prices"));
}

TEST(PromptCatalogTest, KeywordPromptKeepsJsonExample) {
  const auto prompt = PromptCatalog::Defaults().Render(
      kIndustryKeywordsPrompt,
      {{"company_name", "SK hynix"}, {"user_query", "HBM demand?"}});

  EXPECT_THAT(prompt, HasSubstr("{\"keywords\": [\"semiconductor\""));
}

TEST(PromptCatalogTest, ReportsEveryMissingVariable) {
  try {
    PromptCatalog::Defaults().Render(kRagAnalysisPrompt,
                                     {{"company_name", "Samsung"}});
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument &error) {
    EXPECT_THAT(error.what(), HasSubstr("user_query, num_chunks, context"));
  }
}

TEST(PromptCatalogTest, UnknownPromptThrows) {
  EXPECT_THROW(PromptCatalog::Defaults().Get("nope"), std::invalid_argument);
}

TEST(PromptCatalogTest, FileOverridesDefaults) {
  test::TemporaryDirectory directory;
  const auto path = directory.AddFile("prompts.yaml", R"(rag_analysis:
  description: Short answers
  variables: [company_name, user_query]
  template: "Answer briefly about {company_name}: {user_query}"
custom:
  template: "Hello"
)");

  const auto catalog = PromptCatalog::LoadFile(path);

  EXPECT_EQ(catalog.Render(kRagAnalysisPrompt, {{"company_name", "LG"},
                                                {"user_query", "Why?"}}),
            "Answer briefly about LG: Why?");
  EXPECT_EQ(catalog.Get(kRagAnalysisPrompt).description, "Short answers");
  EXPECT_TRUE(catalog.Contains(kTimeRangePrompt));
  EXPECT_EQ(catalog.Render("custom", {}), "Hello");
}

TEST(PromptCatalogTest, RejectsMalformedPromptFile) {
  test::TemporaryDirectory directory;
  const auto list = directory.AddFile("list.yaml", "- a\n- b\n");
  const auto no_template =
      directory.AddFile("no_template.yaml", "rag_analysis:\n  variables: []\n");

  EXPECT_THROW(PromptCatalog::LoadFile(list), InvalidConfig);
  EXPECT_THROW(PromptCatalog::LoadFile(no_template), InvalidConfig);
  EXPECT_THROW(PromptCatalog::LoadFile(directory.root() / "absent.yaml"),
               InvalidConfig);
}

} // namespace
} // namespace finrag
