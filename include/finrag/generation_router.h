#pragma once

#include <finrag/interfaces.h>
#include <finrag/logging.h>
#include <finrag/models.h>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace finrag {

constexpr const char kLongContextAnalysisTask[] = "long_context_analysis";
constexpr const char kQueryAnalysisTask[] = "query_analysis";
constexpr const char kKeywordExtractionTask[] = "keyword_extraction";

struct TaskRequirement {
  bool requires_long_context = false;
  std::size_t min_context_window = 0;
};

bool Satisfies(const ProviderCapabilities &capabilities,
               const TaskRequirement &requirement);

// Registry of generation backends. Selection per task type:
//   1. an explicit task route,
//   2. the first provider, in registration order, meeting the task's
//      capability requirement,
//   3. the default provider (the first registered unless another was
//      registered with make_default).
// Provider failures are wrapped, never retried.
class GenerationRouter {
public:
  explicit GenerationRouter(std::shared_ptr<Logger> logger = nullptr);

  void Register(std::shared_ptr<GenerationProvider> provider,
                bool make_default = false);
  void SetTaskRoute(const std::string &task_type,
                    const std::string &provider_name);
  void SetTaskRequirement(const std::string &task_type,
                          TaskRequirement requirement);

  std::shared_ptr<GenerationProvider>
  Select(const std::optional<std::string> &task_type = std::nullopt) const;
  // Same selection over every provider except `excluded_name`; null when no
  // other provider is registered.
  std::shared_ptr<GenerationProvider>
  SelectExcluding(const std::optional<std::string> &task_type,
                  const std::string &excluded_name) const;

  GenerationOutcome Generate(const std::string &task_type,
                             const std::string &prompt) const;
  GenerationOutcome GenerateWith(const std::string &provider_name,
                                 const std::string &prompt) const;

  std::vector<ProviderDescription> Providers() const;
  std::vector<std::string> ProviderNames() const;
  std::string DefaultProviderName() const;
  bool Empty() const;

private:
  struct Registration {
    std::string name;
    std::shared_ptr<GenerationProvider> provider;
  };

  std::shared_ptr<GenerationProvider>
  SelectLocked(const std::optional<std::string> &task_type,
               const std::string &excluded_name) const;
  const Registration *FindLocked(const std::string &name) const;
  std::string JoinNamesLocked() const;

  std::shared_ptr<Logger> logger_;
  mutable std::shared_mutex mutex_;
  std::vector<Registration> providers_;
  std::string default_name_;
  std::map<std::string, std::string> routes_;
  std::map<std::string, TaskRequirement> requirements_;
};

} // namespace finrag
