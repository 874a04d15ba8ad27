#include <finrag/cache_keys.h>
#include <finrag/document_cache.h>
#include <finrag/errors.h>
#include <finrag/models.h>
#include <finrag/text_chunker.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fakes.h"
#include "test_support/temporary_directory.h"

namespace finrag {
namespace {

class DocumentCacheTest : public ::testing::Test {
protected:
  std::shared_ptr<test::VocabularyEmbedder> embedder_ =
      std::make_shared<test::VocabularyEmbedder>(test::FinanceVocabulary());
  test::TemporaryDirectory directory_;
  TextChunker chunker_{ChunkerOptions{40, 10, DefaultSeparators()}};

  std::shared_ptr<DocumentCache> OpenCache() const {
    auto index = std::make_shared<VectorIndex>(
        VectorIndexPath(directory_.root()), embedder_, nullptr);
    return std::make_shared<DocumentCache>(directory_.root(), index, nullptr);
  }

  CacheEntry StoreDocument(DocumentCache &cache, const Document &document) {
    const auto normalized = NormalizeDocument(document);
    return cache.Store(normalized, chunker_.Split(normalized));
  }
};

Document Filing(std::string id, std::string company, std::string text,
                std::string published_at = "2025-03-24") {
  Document document;
  document.source_kind = SourceKind::kRegulatoryFiling;
  document.document_id = std::move(id);
  document.company_identifier = std::move(company);
  document.title = "Business report";
  document.published_at = std::move(published_at);
  document.raw_text = std::move(text);
  return document;
}

Document Industry(std::string title, std::vector<std::string> keywords,
                  std::string published_at) {
  Document document;
  document.source_kind = SourceKind::kIndustryReport;
  document.title = std::move(title);
  document.keywords = std::move(keywords);
  document.published_at = std::move(published_at);
  document.raw_text = "semiconductor demand and battery supply";
  return document;
}

TEST_F(DocumentCacheTest, StoreThenExists) {
  auto cache = OpenCache();

  const auto entry = StoreDocument(
      *cache, Filing("20250324000901", "005930", "revenue grew. margin held."));

  EXPECT_TRUE(cache->Exists("20250324000901"));
  EXPECT_EQ(entry.company_identifier, "005930");
  EXPECT_EQ(entry.char_count, 26u);
  EXPECT_EQ(entry.content_digest.size(), 64u);
  EXPECT_FALSE(entry.chunk_ids.empty());
}

TEST_F(DocumentCacheTest, RepeatedStoreNeverDoublesChunks) {
  auto cache = OpenCache();
  const auto filing = Filing("r1", "005930",
                             "revenue rose sharply this year. margin improved "
                             "too. debt was repaid early.");

  const auto first = StoreDocument(*cache, filing);
  const auto calls_after_first = embedder_->Calls();
  const auto second = StoreDocument(*cache, filing);

  EXPECT_EQ(first.chunk_ids, second.chunk_ids);
  EXPECT_EQ(cache->Stats().total_chunks, first.chunk_ids.size());
  EXPECT_EQ(embedder_->Calls(), calls_after_first);
}

TEST_F(DocumentCacheTest, ChangedContentReplacesChunks) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "005930",
                               "revenue rose sharply this year. margin "
                               "improved too. debt was repaid early."));

  const auto updated = StoreDocument(*cache, Filing("r1", "005930", "retail"));

  ASSERT_EQ(updated.chunk_ids.size(), 1u);
  EXPECT_EQ(cache->Stats().total_chunks, 1u);
  const auto loaded = cache->Load("r1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(ReassembleText(loaded->chunks), "retail");
}

TEST_F(DocumentCacheTest, LooksUpByKindSpecificIdentity) {
  auto cache = OpenCache();
  Document broker;
  broker.source_kind = SourceKind::kBrokerReport;
  broker.company_identifier = "aapl";
  broker.title = "Services  Momentum";
  broker.raw_text = "revenue from services";
  StoreDocument(*cache, broker);
  StoreDocument(*cache, Filing("r1", "AAPL", "debt"));

  CacheLookup broker_lookup;
  broker_lookup.source_kind = SourceKind::kBrokerReport;
  broker_lookup.company_identifier = "AAPL";
  broker_lookup.title = "services momentum";
  CacheLookup filing_lookup;
  filing_lookup.document_id = "r1";
  CacheLookup missing_lookup;
  missing_lookup.document_id = "r2";

  const auto found = cache->Lookup(broker_lookup);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->document_id, "broker:AAPL:services momentum");
  EXPECT_TRUE(cache->Lookup(filing_lookup).has_value());
  EXPECT_FALSE(cache->Lookup(missing_lookup).has_value());
}

TEST_F(DocumentCacheTest, IndustryKeywordsMatchOnIntersection) {
  auto cache = OpenCache();
  StoreDocument(*cache, Industry("Chips", {"AI", "semiconductor"}, "2025-01-01"));

  EXPECT_TRUE(cache->FindMatching({"AI", "batteries"}).has_value());
  EXPECT_FALSE(cache->FindMatching({"retail", "logistics"}).has_value());
  EXPECT_FALSE(cache->FindMatching({}).has_value());
}

TEST_F(DocumentCacheTest, RanksIndustryMatchesBySharedKeywordsThenRecency) {
  auto cache = OpenCache();
  StoreDocument(*cache, Industry("Old broad", {"ai", "semiconductor", "memory"},
                                 "2023-01-01"));
  StoreDocument(*cache, Industry("New narrow", {"ai"}, "2025-06-01"));
  StoreDocument(*cache, Industry("Newer narrow", {"ai"}, "2025-09-01"));

  const auto matches = cache->FindAllMatching({"AI", "Semiconductor"});

  ASSERT_EQ(matches.size(), 3u);
  EXPECT_EQ(matches[0].title, "Old broad");
  EXPECT_EQ(matches[1].title, "Newer narrow");
  EXPECT_EQ(matches[2].title, "New narrow");
}

TEST_F(DocumentCacheTest, ResetThenStatsYieldsZeros) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "005930", "revenue"));
  StoreDocument(*cache, Filing("r2", "000660", "margin"));

  cache->Reset();

  const auto stats = cache->Stats();
  EXPECT_EQ(stats.total_documents, 0u);
  EXPECT_EQ(stats.total_chunks, 0u);
  EXPECT_EQ(stats.total_characters, 0u);
  EXPECT_EQ(stats.distinct_companies, 0u);
  EXPECT_EQ(OpenCache()->Stats().total_documents, 0u);
}

TEST_F(DocumentCacheTest, StatsCountCompaniesCaseInsensitively) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "aapl", "revenue"));
  StoreDocument(*cache, Filing("r2", "AAPL", "margin"));
  StoreDocument(*cache, Filing("r3", "msft", "debt"));

  const auto stats = cache->Stats();

  EXPECT_EQ(stats.total_documents, 3u);
  EXPECT_EQ(stats.distinct_companies, 2u);
  EXPECT_THAT(stats.companies, ::testing::ElementsAre("AAPL", "MSFT"));
}

TEST_F(DocumentCacheTest, PersistsAcrossInstances) {
  {
    auto cache = OpenCache();
    StoreDocument(*cache, Filing("r1", "005930", "revenue\tand margin"));
  }

  auto reopened = OpenCache();

  const auto entry = reopened->Entry("r1");
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->title, "Business report");
  EXPECT_EQ(reopened->Load("r1")->chunks.front().text, "revenue\tand margin");
}

TEST_F(DocumentCacheTest, KeepsDocumentWhoseIdStartsWithHash) {
  auto report = Industry("Chip outlook", {"semiconductor"}, "2025-02-01");
  report.document_id = "#42 semiconductor outlook";
  {
    auto cache = OpenCache();
    StoreDocument(*cache, report);
    EXPECT_EQ(cache->Stats().total_documents, 1u);
  }

  auto reopened = OpenCache();

  EXPECT_EQ(reopened->Stats().total_documents, 1u);
  EXPECT_TRUE(reopened->Exists("#42 semiconductor outlook"));
  const auto loaded = reopened->Load("#42 semiconductor outlook");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(ReassembleText(loaded->chunks), report.raw_text);
  EXPECT_NO_THROW(reopened->CheckConsistency());
}

TEST_F(DocumentCacheTest, RejectsCorruptCharacterCount) {
  directory_.AddFile("cache_entries.tsv",
                     "# finrag-cache-entries v1\n"
                     "r1\t005930\tregulatory-filing\tBusiness report\t"
                     "2025-03-24\t\t\tmany\tabc\t2025-03-24T00:00:00Z\n");

  try {
    OpenCache()->EnsureReady();
    FAIL() << "Expected CacheInconsistency";
  } catch (const CacheInconsistency &error) {
    EXPECT_THAT(error.what(), ::testing::HasSubstr("cache_entries.tsv:2"));
  }
}

TEST_F(DocumentCacheTest, RejectsUnknownStoredKind) {
  directory_.AddFile("cache_entries.tsv",
                     "# finrag-cache-entries v1\n"
                     "r1\t005930\tpress-release\tBusiness report\t"
                     "2025-03-24\t\t\t7\tabc\t2025-03-24T00:00:00Z\n");

  EXPECT_THROW(OpenCache()->EnsureReady(), CacheInconsistency);
}

TEST_F(DocumentCacheTest, NewChunkBoundariesReplaceStoredChunks) {
  auto cache = OpenCache();
  const auto filing =
      NormalizeDocument(Filing("r1", "005930", "revenue margin debt"));
  const auto chunk = [&](std::size_t ordinal, std::size_t offset,
                         std::string text) {
    Chunk result;
    result.chunk_id = MakeChunkId("r1", ordinal);
    result.source_document_id = "r1";
    result.ordinal = ordinal;
    result.start_offset = offset;
    result.text = std::move(text);
    return result;
  };
  cache->Store(filing, {chunk(0, 0, "revenue "), chunk(1, 8, "margin debt")});
  const auto calls_after_first = embedder_->Calls();

  cache->Store(filing,
               {chunk(0, 0, "revenue margin "), chunk(1, 15, "debt")});

  EXPECT_GT(embedder_->Calls(), calls_after_first);
  const auto loaded = cache->Load("r1");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->chunks.size(), 2u);
  EXPECT_EQ(loaded->chunks[1].start_offset, 15u);
  EXPECT_EQ(loaded->chunks[1].text, "debt");
  EXPECT_EQ(cache->Stats().total_chunks, 2u);
}

TEST_F(DocumentCacheTest, DetectsIndexMissingChunks) {
  {
    auto cache = OpenCache();
    StoreDocument(*cache, Filing("r1", "005930", "revenue"));
  }
  const auto index_file = directory_.ReadFile("vector_index.tsv");
  directory_.AddFile("vector_index.tsv",
                     index_file.substr(0, index_file.find('\n') + 1));

  EXPECT_THROW(OpenCache()->EnsureReady(), CacheInconsistency);
}

TEST_F(DocumentCacheTest, RemoveDropsEntryAndChunks) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "005930", "revenue"));

  EXPECT_TRUE(cache->Remove("r1"));
  EXPECT_FALSE(cache->Remove("r1"));
  EXPECT_FALSE(cache->Exists("r1"));
  EXPECT_EQ(cache->Stats().total_chunks, 0u);
  EXPECT_NO_THROW(cache->CheckConsistency());
}

TEST_F(DocumentCacheTest, FailedWriteLeavesPreviousState) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "005930", "revenue"));
  const auto entries_path = CacheEntriesPath(directory_.root());
  std::filesystem::remove(entries_path);
  std::filesystem::create_directories(entries_path / "blocked");

  EXPECT_ANY_THROW(StoreDocument(*cache, Filing("r2", "005930", "margin")));

  EXPECT_FALSE(cache->Exists("r2"));
  EXPECT_TRUE(cache->Exists("r1"));
  EXPECT_NO_THROW(cache->CheckConsistency());
}

TEST_F(DocumentCacheTest, ReturnsCompanyDocumentsNewestFirst) {
  auto cache = OpenCache();
  StoreDocument(*cache, Filing("r1", "005930", "revenue", "2023-03-01"));
  StoreDocument(*cache, Filing("r2", "005930", "margin", "2025-03-01"));
  StoreDocument(*cache, Filing("r3", "000660", "debt", "2024-03-01"));

  const auto entries = cache->EntriesForCompany("005930");

  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].document_id, "r2");
  EXPECT_EQ(entries[1].document_id, "r1");
}

} // namespace
} // namespace finrag
