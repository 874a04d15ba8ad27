#include <finrag/models.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {

std::string Normalize(std::string value) {
  value.erase(std::remove_if(value.begin(), value.end(),
                             [](unsigned char ch) { return std::isspace(ch); }),
              value.end());
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  std::replace(value.begin(), value.end(), '_', '-');
  return value;
}

} // namespace

namespace finrag {

std::string SourceKindName(SourceKind kind) {
  switch (kind) {
  case SourceKind::kRegulatoryFiling:
    return "regulatory-filing";
  case SourceKind::kBrokerReport:
    return "broker-report";
  case SourceKind::kIndustryReport:
    return "industry-report";
  }
  return "unknown";
}

SourceKind ParseSourceKind(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "regulatory-filing" || normalized == "filing") {
    return SourceKind::kRegulatoryFiling;
  }
  if (normalized == "broker-report" || normalized == "broker") {
    return SourceKind::kBrokerReport;
  }
  if (normalized == "industry-report" || normalized == "industry") {
    return SourceKind::kIndustryReport;
  }
  throw std::invalid_argument("Unknown source kind: " + value);
}

std::string MakeChunkId(const std::string &document_id, std::size_t ordinal) {
  return document_id + "#" + std::to_string(ordinal);
}

std::string CostTierName(CostTier tier) {
  switch (tier) {
  case CostTier::kLow:
    return "low";
  case CostTier::kMedium:
    return "medium";
  case CostTier::kHigh:
    return "high";
  }
  return "unknown";
}

CostTier ParseCostTier(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "low") {
    return CostTier::kLow;
  }
  if (normalized == "medium") {
    return CostTier::kMedium;
  }
  if (normalized == "high") {
    return CostTier::kHigh;
  }
  throw std::invalid_argument("Unknown cost tier: " + value);
}

std::string SpeedTierName(SpeedTier tier) {
  switch (tier) {
  case SpeedTier::kSlow:
    return "slow";
  case SpeedTier::kMedium:
    return "medium";
  case SpeedTier::kFast:
    return "fast";
  case SpeedTier::kVeryFast:
    return "very-fast";
  }
  return "unknown";
}

SpeedTier ParseSpeedTier(const std::string &value) {
  const auto normalized = Normalize(value);
  if (normalized == "slow") {
    return SpeedTier::kSlow;
  }
  if (normalized == "medium") {
    return SpeedTier::kMedium;
  }
  if (normalized == "fast") {
    return SpeedTier::kFast;
  }
  if (normalized == "very-fast") {
    return SpeedTier::kVeryFast;
  }
  throw std::invalid_argument("Unknown speed tier: " + value);
}

std::string PipelineStageName(PipelineStage stage) {
  switch (stage) {
  case PipelineStage::kResolvingCompany:
    return "resolving_company";
  case PipelineStage::kSearchingDocuments:
    return "searching_documents";
  case PipelineStage::kFetchingOrCached:
    return "fetching_or_cached";
  case PipelineStage::kRetrieving:
    return "retrieving";
  case PipelineStage::kGenerating:
    return "generating";
  case PipelineStage::kDone:
    return "done";
  case PipelineStage::kFailed:
    return "failed";
  }
  return "unknown";
}

} // namespace finrag
