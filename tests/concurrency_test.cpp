#include <finrag/content_digest.h>
#include <finrag/knowledge_service.h>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "test_support/fakes.h"
#include "test_support/temporary_directory.h"

namespace finrag {
namespace {

constexpr int kWriters = 4;
constexpr int kDocumentsPerWriter = 10;
constexpr int kReaders = 4;

Document Filing(int writer, int index) {
  Document document;
  document.document_id =
      "w" + std::to_string(writer) + "-" + std::to_string(index);
  document.company_identifier = "005930";
  document.title = "Filing " + document.document_id;
  document.raw_text = "revenue grew strongly.\n\nrevenue held steady.\n\n"
                      "revenue fell slightly.";
  return document;
}

TEST(ConcurrencyTest, ReadersNeverObservePartialDocuments) {
  test::TemporaryDirectory directory;
  EngineConfig config;
  config.data_directory = directory.root();
  config.chunker.chunk_size = 24;
  config.chunker.chunk_overlap = 0;
  config.retrieval.top_k = 1000;
  KnowledgeService service(
      config,
      std::make_shared<test::VocabularyEmbedder>(test::FinanceVocabulary()),
      nullptr, PromptCatalog::Defaults(), nullptr);
  service.EnsureReady();

  std::atomic<bool> writing{true};
  std::atomic<int> violations{0};
  std::atomic<int> reads{0};

  std::vector<std::thread> readers;
  for (int reader = 0; reader < kReaders; ++reader) {
    readers.emplace_back([&]() {
      while (writing.load()) {
        for (const auto &passage : service.Retrieve("revenue", "005930")) {
          const auto stored = service.Cache().Load(passage.document_id);
          if (!stored || stored->chunks.size() != passage.total_chunks ||
              passage.total_chunks != 3) {
            ++violations;
          }
        }
        ++reads;
      }
    });
  }

  std::vector<std::thread> writers;
  for (int writer = 0; writer < kWriters; ++writer) {
    writers.emplace_back([&service, writer]() {
      for (int index = 0; index < kDocumentsPerWriter; ++index) {
        service.SubmitDocument(Filing(writer, index));
      }
    });
  }
  for (auto &thread : writers) {
    thread.join();
  }
  writing = false;
  for (auto &thread : readers) {
    thread.join();
  }

  EXPECT_EQ(violations.load(), 0);
  EXPECT_GT(reads.load(), 0);
  const auto stats = service.CacheStatistics();
  EXPECT_EQ(stats.total_documents,
            static_cast<std::size_t>(kWriters * kDocumentsPerWriter));
  EXPECT_EQ(stats.total_chunks,
            static_cast<std::size_t>(3 * kWriters * kDocumentsPerWriter));
  EXPECT_NO_THROW(service.Cache().CheckConsistency());
  EXPECT_EQ(service.Retrieve("revenue", std::string("005930")).size(),
            static_cast<std::size_t>(3 * kWriters * kDocumentsPerWriter));
}

TEST(ConcurrencyTest, ConcurrentStoresOfSameDocumentKeepOneCopy) {
  test::TemporaryDirectory directory;
  EngineConfig config;
  config.data_directory = directory.root();
  config.chunker.chunk_size = 24;
  config.chunker.chunk_overlap = 0;
  KnowledgeService service(
      config,
      std::make_shared<test::VocabularyEmbedder>(test::FinanceVocabulary()),
      nullptr, PromptCatalog::Defaults(), nullptr);

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&service]() {
      service.SubmitDocument(Filing(0, 0));
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(service.CacheStatistics().total_documents, 1u);
  EXPECT_EQ(service.CacheStatistics().total_chunks, 3u);
  EXPECT_NO_THROW(service.Cache().CheckConsistency());
}

TEST(ConcurrencyTest, RacingRevisionsLeaveEntryMatchingIndexedText) {
  test::TemporaryDirectory directory;
  EngineConfig config;
  config.data_directory = directory.root();
  config.chunker.chunk_size = 24;
  config.chunker.chunk_overlap = 0;
  KnowledgeService service(
      config,
      std::make_shared<test::VocabularyEmbedder>(test::FinanceVocabulary()),
      nullptr, PromptCatalog::Defaults(), nullptr);

  auto revenue = Filing(0, 0);
  auto margin = Filing(0, 0);
  margin.raw_text = "margin grew strongly.\n\nmargin held steady.\n\n"
                    "margin fell slightly.";

  std::vector<std::thread> threads;
  for (int i = 0; i < 6; ++i) {
    threads.emplace_back([&service, &revenue, &margin, i]() {
      for (int round = 0; round < 20; ++round) {
        service.SubmitDocument((i + round) % 2 == 0 ? revenue : margin);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  const auto entry = service.Cache().Entry(revenue.document_id);
  const auto text = service.LoadDocumentText(revenue.document_id);
  ASSERT_TRUE(entry.has_value());
  ASSERT_TRUE(text.has_value());
  EXPECT_EQ(entry->content_digest, ContentDigest(*text));
  EXPECT_EQ(service.CacheStatistics().total_chunks, 3u);

  service.SubmitDocument(revenue);
  EXPECT_EQ(service.LoadDocumentText(revenue.document_id).value_or(""),
            revenue.raw_text);
  service.SubmitDocument(margin);
  EXPECT_EQ(service.LoadDocumentText(revenue.document_id).value_or(""),
            margin.raw_text);
}

} // namespace
} // namespace finrag
