#include <finrag/cache_keys.h>
#include <finrag/errors.h>

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace finrag {
namespace {

Document MakeDocument(SourceKind kind, std::string id, std::string company,
                      std::string title) {
  Document document;
  document.source_kind = kind;
  document.document_id = std::move(id);
  document.company_identifier = std::move(company);
  document.title = std::move(title);
  return document;
}

TEST(CacheKeysTest, NormalizesCompanyAndTitle) {
  EXPECT_EQ(NormalizeCompany("  aapl "), "AAPL");
  EXPECT_EQ(NormalizeTitle("  Q3   Memory\tOutlook "), "q3 memory outlook");
}

TEST(CacheKeysTest, NormalizesKeywordSets) {
  EXPECT_THAT(NormalizeKeywords({"AI", " semiconductor", "ai", "", "  "}),
              ::testing::ElementsAre("ai", "semiconductor"));
}

TEST(CacheKeysTest, FilingsKeepTheirReceiptNumber) {
  const auto document = MakeDocument(SourceKind::kRegulatoryFiling,
                                     " 20250324000901 ", "005930", "Annual");

  EXPECT_EQ(DeriveDocumentId(document), "20250324000901");
}

TEST(CacheKeysTest, FilingWithoutReceiptIsRejected) {
  const auto document =
      MakeDocument(SourceKind::kRegulatoryFiling, "", "005930", "Annual");

  EXPECT_THROW(DeriveDocumentId(document), InvalidDocument);
}

TEST(CacheKeysTest, BrokerReportsAreKeyedByCompanyAndTitle) {
  const auto first = MakeDocument(SourceKind::kBrokerReport, "ignored", "aapl",
                                  "iPhone  Cycle Update");
  const auto second = MakeDocument(SourceKind::kBrokerReport, "", " AAPL",
                                   "iphone cycle update");

  EXPECT_EQ(DeriveDocumentId(first), "broker:AAPL:iphone cycle update");
  EXPECT_EQ(DeriveDocumentId(first), DeriveDocumentId(second));
  EXPECT_THROW(DeriveDocumentId(MakeDocument(SourceKind::kBrokerReport, "",
                                             "", "Untethered")),
               InvalidDocument);
}

TEST(CacheKeysTest, IndustryReportsFallBackToTitleKey) {
  auto document =
      MakeDocument(SourceKind::kIndustryReport, "", "", "Memory Outlook 2025");
  document.keywords = {"Semiconductor", "memory"};

  const auto normalized = NormalizeDocument(document);

  EXPECT_EQ(normalized.document_id, "industry:memory outlook 2025");
  EXPECT_THAT(normalized.keywords,
              ::testing::ElementsAre("memory", "semiconductor"));
}

TEST(CacheKeysTest, IndustryReportWithoutKeywordsIsRejected) {
  const auto document =
      MakeDocument(SourceKind::kIndustryReport, "ind-1", "", "Outlook");

  EXPECT_THROW(NormalizeDocument(document), InvalidDocument);
}

} // namespace
} // namespace finrag
