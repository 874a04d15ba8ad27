#pragma once

#include <finrag/models.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

// Maps text to a fixed-length vector. Implementations must be safe to call
// from several threads at once.
class Embedder {
public:
  virtual ~Embedder() = default;
  virtual std::vector<float> Embed(const std::string &text) = 0;
  virtual std::size_t Dimension() const = 0;
  virtual std::string Name() const = 0;
};

class GenerationProvider {
public:
  virtual ~GenerationProvider() = default;
  virtual std::string ProduceText(const std::string &prompt) = 0;
  virtual ProviderCapabilities DeclareCapabilities() const = 0;
  virtual std::string Name() const = 0;
};

class CompanyResolver {
public:
  virtual ~CompanyResolver() = default;
  virtual std::optional<std::string>
  Resolve(const std::string &company_name) = 0;
};

// Listing and retrieval are separate so the cache can be consulted before a
// document body is downloaded.
class DocumentSource {
public:
  virtual ~DocumentSource() = default;
  virtual SourceKind Kind() const = 0;
  virtual std::vector<DocumentReference>
  Search(const std::string &company_identifier,
         const FetchFilters &filters) = 0;
  virtual Document Fetch(const DocumentReference &reference) = 0;
};

class StageObserver {
public:
  virtual ~StageObserver() = default;
  virtual void OnStageEvent(const StageEvent &event) = 0;
};

} // namespace finrag
