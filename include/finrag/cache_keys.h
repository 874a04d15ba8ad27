#pragma once

#include <finrag/models.h>

#include <string>
#include <vector>

namespace finrag {

std::string Trim(std::string value);
std::string ToLowerAscii(std::string value);
std::string ToUpperAscii(std::string value);

// Case-normalized company identifier used for filtering and grouping.
std::string NormalizeCompany(const std::string &company_identifier);
// Trimmed, whitespace-collapsed, ASCII-lowercased title.
std::string NormalizeTitle(const std::string &title);
// Trimmed, lowercased, deduplicated and sorted; blanks dropped.
std::vector<std::string>
NormalizeKeywords(const std::vector<std::string> &keywords);

std::string BrokerReportKey(const std::string &company_identifier,
                            const std::string &title);
std::string IndustryReportKey(const std::string &title);

// Cache key of a document. Broker reports always use the (company, title)
// key; filings and industry reports keep a caller-supplied id. Throws
// InvalidDocument when the kind-specific identity is missing.
std::string DeriveDocumentId(const Document &document);

// Returns a copy with document_id derived and keywords normalized.
Document NormalizeDocument(Document document);

} // namespace finrag
