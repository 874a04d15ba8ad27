#pragma once

#include <finrag/interfaces.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace finrag {

struct ManifestCompany {
  std::string identifier;
  std::vector<std::string> names;
};

struct ManifestDocument {
  DocumentReference reference;
  std::filesystem::path file;
};

// A local YAML listing of companies and document files, standing in for the
// remote disclosure and research services.
class ManifestCatalog {
public:
  static ManifestCatalog Load(const std::filesystem::path &path);
  // Relative `file` entries resolve against `base_directory`.
  static ManifestCatalog Parse(const std::string &text,
                               const std::filesystem::path &base_directory);

  const std::vector<ManifestCompany> &Companies() const { return companies_; }
  const std::vector<ManifestDocument> &Documents() const { return documents_; }

private:
  std::vector<ManifestCompany> companies_;
  std::vector<ManifestDocument> documents_;
};

class ManifestCompanyResolver : public CompanyResolver {
public:
  explicit ManifestCompanyResolver(
      std::shared_ptr<const ManifestCatalog> catalog);

  std::optional<std::string> Resolve(const std::string &company_name) override;

private:
  std::shared_ptr<const ManifestCatalog> catalog_;
};

class ManifestDocumentSource : public DocumentSource {
public:
  ManifestDocumentSource(std::shared_ptr<const ManifestCatalog> catalog,
                         SourceKind kind,
                         std::shared_ptr<Logger> logger = nullptr);

  SourceKind Kind() const override { return kind_; }
  std::vector<DocumentReference>
  Search(const std::string &company_identifier,
         const FetchFilters &filters) override;
  Document Fetch(const DocumentReference &reference) override;

private:
  const ManifestDocument *Find(const DocumentReference &reference) const;

  std::shared_ptr<const ManifestCatalog> catalog_;
  SourceKind kind_;
  std::shared_ptr<Logger> logger_;
};

} // namespace finrag
