#include <finrag/cache_keys.h>

#include <finrag/errors.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace finrag {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLowerAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return c < 0x80U ? static_cast<char>(std::tolower(c))
                                    : static_cast<char>(c);
                 });
  return value;
}

std::string ToUpperAscii(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) {
                   return c < 0x80U ? static_cast<char>(std::toupper(c))
                                    : static_cast<char>(c);
                 });
  return value;
}

std::string NormalizeCompany(const std::string &company_identifier) {
  return ToUpperAscii(Trim(company_identifier));
}

std::string NormalizeTitle(const std::string &title) {
  std::string collapsed;
  bool pending_space = false;
  for (const auto character : Trim(title)) {
    if (std::isspace(static_cast<unsigned char>(character)) != 0) {
      pending_space = true;
      continue;
    }
    if (pending_space) {
      collapsed.push_back(' ');
      pending_space = false;
    }
    collapsed.push_back(character);
  }
  return ToLowerAscii(std::move(collapsed));
}

std::vector<std::string>
NormalizeKeywords(const std::vector<std::string> &keywords) {
  std::vector<std::string> normalized;
  for (const auto &keyword : keywords) {
    auto value = ToLowerAscii(Trim(keyword));
    if (!value.empty()) {
      normalized.push_back(std::move(value));
    }
  }
  std::sort(normalized.begin(), normalized.end());
  normalized.erase(std::unique(normalized.begin(), normalized.end()),
                   normalized.end());
  return normalized;
}

std::string BrokerReportKey(const std::string &company_identifier,
                            const std::string &title) {
  return "broker:" + NormalizeCompany(company_identifier) + ":" +
         NormalizeTitle(title);
}

std::string IndustryReportKey(const std::string &title) {
  return "industry:" + NormalizeTitle(title);
}

std::string DeriveDocumentId(const Document &document) {
  switch (document.source_kind) {
  case SourceKind::kRegulatoryFiling: {
    auto receipt = Trim(document.document_id);
    if (receipt.empty()) {
      throw InvalidDocument("Regulatory filing '" + document.title +
                            "' has no receipt number");
    }
    return receipt;
  }
  case SourceKind::kBrokerReport:
    if (Trim(document.company_identifier).empty() ||
        Trim(document.title).empty()) {
      throw InvalidDocument(
          "Broker report requires both company_identifier and title");
    }
    return BrokerReportKey(document.company_identifier, document.title);
  case SourceKind::kIndustryReport: {
    auto id = Trim(document.document_id);
    if (!id.empty()) {
      return id;
    }
    if (Trim(document.title).empty()) {
      throw InvalidDocument("Industry report requires a document_id or title");
    }
    return IndustryReportKey(document.title);
  }
  }
  throw InvalidDocument("Unsupported source kind");
}

Document NormalizeDocument(Document document) {
  document.document_id = DeriveDocumentId(document);
  document.keywords = NormalizeKeywords(document.keywords);
  if (document.source_kind == SourceKind::kIndustryReport &&
      document.keywords.empty()) {
    throw InvalidDocument("Industry report '" + document.document_id +
                          "' has no keywords");
  }
  return document;
}

} // namespace finrag
