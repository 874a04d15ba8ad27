#include <finrag/errors.h>
#include <finrag/manifest_source.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_directory.h"

namespace finrag {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

constexpr const char kManifest[] = R"(companies:
  - identifier: "005930"
    names: [Samsung Electronics, Samsung]
  - identifier: "000660"
    names: [SK hynix]
documents:
  - kind: regulatory-filing
    id: "20250311000001"
    company: "005930"
    title: Annual report 2024
    published_at: "2025-03-11"
    file: filings/samsung_2024.txt
  - kind: regulatory-filing
    id: "20220308000002"
    company: "005930"
    title: Annual report 2021
    published_at: "2022-03-08"
    file: filings/samsung_2021.txt
  - kind: broker
    company: "005930"
    title: Memory upcycle
    published_at: "2025-05-02"
    file: reports/memory.txt
  - kind: industry
    title: HBM outlook
    published_at: "2025-04-01"
    keywords: [HBM, Semiconductor]
    file: industry/hbm.txt
)";

class ManifestSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    directory_.AddFile("filings/samsung_2024.txt", "Revenue rose.");
    directory_.AddFile("filings/samsung_2021.txt", "Revenue fell.");
    directory_.AddFile("reports/memory.txt", "Prices recover.");
    catalog_ = std::make_shared<const ManifestCatalog>(
        ManifestCatalog::Parse(kManifest, directory_.root()));
  }

  ManifestDocumentSource Source(SourceKind kind) const {
    return ManifestDocumentSource(catalog_, kind);
  }

  test::TemporaryDirectory directory_;
  std::shared_ptr<const ManifestCatalog> catalog_;
};

TEST_F(ManifestSourceTest, ParsesCompaniesAndDocuments) {
  ASSERT_EQ(catalog_->Companies().size(), 2u);
  ASSERT_EQ(catalog_->Documents().size(), 4u);
  const auto &broker = catalog_->Documents()[2];
  EXPECT_EQ(broker.reference.source_kind, SourceKind::kBrokerReport);
  EXPECT_EQ(broker.file, directory_.root() / "reports/memory.txt");
  EXPECT_EQ(broker.reference.locator, broker.file.string());
}

TEST_F(ManifestSourceTest, ResolvesNamesAndIdentifiers) {
  ManifestCompanyResolver resolver(catalog_);

  EXPECT_EQ(resolver.Resolve("samsung electronics"), "005930");
  EXPECT_EQ(resolver.Resolve("005930"), "005930");
  EXPECT_EQ(resolver.Resolve("hynix"), "000660");
  EXPECT_EQ(resolver.Resolve("Hyundai Motor"), std::nullopt);
  EXPECT_EQ(resolver.Resolve("  "), std::nullopt);
}

TEST_F(ManifestSourceTest, SearchFiltersByKindCompanyAndDate) {
  auto filings = Source(SourceKind::kRegulatoryFiling);
  FetchFilters filters;

  const auto all = filings.Search("005930", filters);
  filters.published_after = "2023-01-01";
  const auto recent = filings.Search("005930", filters);

  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].document_id, "20250311000001");
  EXPECT_EQ(all[1].document_id, "20220308000002");
  ASSERT_EQ(recent.size(), 1u);
  EXPECT_EQ(recent[0].title, "Annual report 2024");
  EXPECT_THAT(filings.Search("000660", FetchFilters{}), IsEmpty());
}

TEST_F(ManifestSourceTest, SearchHonorsDocumentLimit) {
  FetchFilters filters;
  filters.max_documents = 1;

  const auto results =
      Source(SourceKind::kRegulatoryFiling).Search("005930", filters);

  ASSERT_EQ(results.size(), 1u);
  EXPECT_EQ(results[0].published_at, "2025-03-11");
}

TEST_F(ManifestSourceTest, IndustrySearchMatchesKeywords) {
  auto industry = Source(SourceKind::kIndustryReport);
  FetchFilters matching;
  matching.keywords = {"semiconductor", "AI"};
  FetchFilters unrelated;
  unrelated.keywords = {"retail"};

  const auto found = industry.Search("005930", matching);

  ASSERT_EQ(found.size(), 1u);
  EXPECT_THAT(found[0].keywords, ElementsAre("HBM", "Semiconductor"));
  EXPECT_THAT(industry.Search("005930", unrelated), IsEmpty());
}

TEST_F(ManifestSourceTest, FetchReadsDocumentFile) {
  auto brokers = Source(SourceKind::kBrokerReport);
  const auto references = brokers.Search("005930", FetchFilters{});
  ASSERT_EQ(references.size(), 1u);

  const auto document = brokers.Fetch(references[0]);

  EXPECT_EQ(document.raw_text, "Prices recover.");
  EXPECT_EQ(document.title, "Memory upcycle");
  EXPECT_EQ(document.company_identifier, "005930");
  EXPECT_EQ(document.source_kind, SourceKind::kBrokerReport);
}

TEST_F(ManifestSourceTest, FetchFailsForMissingFile) {
  auto industry = Source(SourceKind::kIndustryReport);
  const auto reference = catalog_->Documents()[3].reference;

  EXPECT_THROW(industry.Fetch(reference), std::runtime_error);

  DocumentReference unknown;
  unknown.title = "Not listed";
  EXPECT_THROW(industry.Fetch(unknown), std::runtime_error);
}

TEST(ManifestCatalogTest, RejectsMalformedManifests) {
  EXPECT_THROW(ManifestCatalog::Parse("- a\n", ""), InvalidConfig);
  EXPECT_THROW(ManifestCatalog::Parse("documents: one\n", ""), InvalidConfig);
  EXPECT_THROW(ManifestCatalog::Parse(
                   "documents:\n  - kind: memo\n    file: a.txt\n", ""),
               InvalidConfig);
  EXPECT_THROW(ManifestCatalog::Parse(
                   "documents:\n  - kind: broker\n    title: x\n", ""),
               InvalidConfig);
  EXPECT_THROW(ManifestCatalog::Parse("companies:\n  - names: [x]\n", ""),
               InvalidConfig);
  EXPECT_THROW(ManifestCatalog::Load("/nonexistent/finrag/manifest.yaml"),
               InvalidConfig);
}

} // namespace
} // namespace finrag
