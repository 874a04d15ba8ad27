#include <finrag/manifest_source.h>

#include <finrag/cache_keys.h>
#include <finrag/errors.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

std::string ScalarOrEmpty(const YAML::Node &node, const std::string &key,
                          const std::string &context) {
  const auto value = node[key];
  if (!value) {
    return {};
  }
  if (!value.IsScalar()) {
    throw finrag::InvalidConfig("Manifest key '" + context + "." + key +
                                "' must be a string");
  }
  return value.as<std::string>();
}

std::vector<std::string> StringList(const YAML::Node &node,
                                    const std::string &key,
                                    const std::string &context) {
  std::vector<std::string> values;
  const auto list = node[key];
  if (!list) {
    return values;
  }
  if (!list.IsSequence()) {
    throw finrag::InvalidConfig("Manifest key '" + context + "." + key +
                                "' must be a list of strings");
  }
  for (const auto &item : list) {
    values.push_back(item.as<std::string>());
  }
  return values;
}

bool SharesKeyword(const std::vector<std::string> &left,
                   const std::vector<std::string> &right) {
  const auto a = finrag::NormalizeKeywords(left);
  const auto b = finrag::NormalizeKeywords(right);
  std::vector<std::string> common;
  std::set_intersection(a.begin(), a.end(), b.begin(), b.end(),
                        std::back_inserter(common));
  return !common.empty();
}

} // namespace

namespace finrag {

ManifestCatalog ManifestCatalog::Load(const std::filesystem::path &path) {
  std::ifstream stream(path);
  if (!stream) {
    throw InvalidConfig("Unable to open manifest: " + path.string());
  }
  std::stringstream buffer;
  buffer << stream.rdbuf();
  return Parse(buffer.str(), path.parent_path());
}

ManifestCatalog
ManifestCatalog::Parse(const std::string &text,
                       const std::filesystem::path &base_directory) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception &error) {
    throw InvalidConfig(std::string("Malformed manifest: ") + error.what());
  }
  if (!root.IsMap()) {
    throw InvalidConfig("Manifest must contain a mapping at the root");
  }

  ManifestCatalog catalog;
  if (const auto companies = root["companies"]) {
    if (!companies.IsSequence()) {
      throw InvalidConfig("Manifest key 'companies' must be a list");
    }
    for (const auto &node : companies) {
      ManifestCompany company;
      company.identifier = Trim(ScalarOrEmpty(node, "identifier", "companies"));
      if (company.identifier.empty()) {
        throw InvalidConfig("Manifest company requires an identifier");
      }
      company.names = StringList(node, "names", "companies");
      catalog.companies_.push_back(std::move(company));
    }
  }

  if (const auto documents = root["documents"]) {
    if (!documents.IsSequence()) {
      throw InvalidConfig("Manifest key 'documents' must be a list");
    }
    for (const auto &node : documents) {
      ManifestDocument document;
      auto &reference = document.reference;
      try {
        reference.source_kind =
            ParseSourceKind(ScalarOrEmpty(node, "kind", "documents"));
      } catch (const std::invalid_argument &error) {
        throw InvalidConfig(std::string("Manifest document: ") + error.what());
      }
      reference.document_id = ScalarOrEmpty(node, "id", "documents");
      reference.company_identifier =
          ScalarOrEmpty(node, "company", "documents");
      reference.title = ScalarOrEmpty(node, "title", "documents");
      reference.published_at = ScalarOrEmpty(node, "published_at", "documents");
      reference.keywords = StringList(node, "keywords", "documents");
      reference.locator = ScalarOrEmpty(node, "locator", "documents");

      const auto file = ScalarOrEmpty(node, "file", "documents");
      if (file.empty()) {
        throw InvalidConfig("Manifest document '" + reference.title +
                            "' requires a file");
      }
      document.file = std::filesystem::path(file);
      if (document.file.is_relative()) {
        document.file = base_directory / document.file;
      }
      if (reference.locator.empty()) {
        reference.locator = document.file.string();
      }
      catalog.documents_.push_back(std::move(document));
    }
  }
  return catalog;
}

ManifestCompanyResolver::ManifestCompanyResolver(
    std::shared_ptr<const ManifestCatalog> catalog)
    : catalog_(std::move(catalog)) {}

std::optional<std::string>
ManifestCompanyResolver::Resolve(const std::string &company_name) {
  const auto wanted = ToLowerAscii(Trim(company_name));
  if (wanted.empty()) {
    return std::nullopt;
  }
  for (const auto &company : catalog_->Companies()) {
    if (ToLowerAscii(company.identifier) == wanted) {
      return company.identifier;
    }
    for (const auto &name : company.names) {
      if (ToLowerAscii(Trim(name)) == wanted) {
        return company.identifier;
      }
    }
  }
  for (const auto &company : catalog_->Companies()) {
    for (const auto &name : company.names) {
      if (ToLowerAscii(name).find(wanted) != std::string::npos) {
        return company.identifier;
      }
    }
  }
  return std::nullopt;
}

ManifestDocumentSource::ManifestDocumentSource(
    std::shared_ptr<const ManifestCatalog> catalog, SourceKind kind,
    std::shared_ptr<Logger> logger)
    : catalog_(std::move(catalog)), kind_(kind),
      logger_(EnsureLogger(std::move(logger))) {}

std::vector<DocumentReference>
ManifestDocumentSource::Search(const std::string &company_identifier,
                               const FetchFilters &filters) {
  const auto company = NormalizeCompany(company_identifier);
  std::vector<DocumentReference> matches;
  for (const auto &document : catalog_->Documents()) {
    const auto &reference = document.reference;
    if (reference.source_kind != kind_) {
      continue;
    }
    if (kind_ == SourceKind::kIndustryReport) {
      if (!filters.keywords.empty() &&
          !SharesKeyword(reference.keywords, filters.keywords)) {
        continue;
      }
    } else if (NormalizeCompany(reference.company_identifier) != company) {
      continue;
    }
    if (!filters.published_after.empty() && !reference.published_at.empty() &&
        reference.published_at < filters.published_after) {
      continue;
    }
    matches.push_back(reference);
  }

  std::stable_sort(matches.begin(), matches.end(),
                   [](const DocumentReference &left,
                      const DocumentReference &right) {
                     return left.published_at > right.published_at;
                   });
  if (matches.size() > filters.max_documents) {
    matches.resize(filters.max_documents);
  }
  logger_->Log(LogLevel::kDebug, "manifest.search",
               {{"kind", SourceKindName(kind_)},
                {"company", company},
                {"matches", std::to_string(matches.size())}});
  return matches;
}

const ManifestDocument *
ManifestDocumentSource::Find(const DocumentReference &reference) const {
  for (const auto &document : catalog_->Documents()) {
    const auto &candidate = document.reference;
    if (candidate.source_kind == reference.source_kind &&
        candidate.locator == reference.locator &&
        candidate.document_id == reference.document_id &&
        candidate.title == reference.title) {
      return &document;
    }
  }
  return nullptr;
}

Document ManifestDocumentSource::Fetch(const DocumentReference &reference) {
  const auto *document = Find(reference);
  if (document == nullptr) {
    throw std::runtime_error("Manifest has no document '" + reference.title +
                             "'");
  }
  std::ifstream stream(document->file, std::ios::binary);
  if (!stream) {
    throw std::runtime_error("Unable to read document file: " +
                             document->file.string());
  }
  std::string text((std::istreambuf_iterator<char>(stream)),
                   std::istreambuf_iterator<char>());
  logger_->Log(LogLevel::kDebug, "manifest.fetch",
               {{"file", document->file.string()},
                {"bytes", std::to_string(text.size())}});

  Document fetched;
  fetched.document_id = reference.document_id;
  fetched.company_identifier = reference.company_identifier;
  fetched.title = reference.title;
  fetched.published_at = reference.published_at;
  fetched.raw_text = std::move(text);
  fetched.source_kind = reference.source_kind;
  fetched.keywords = reference.keywords;
  fetched.locator = reference.locator;
  return fetched;
}

} // namespace finrag
