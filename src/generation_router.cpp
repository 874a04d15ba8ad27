#include <finrag/generation_router.h>

#include <finrag/errors.h>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace {

finrag::GenerationOutcome Invoke(finrag::GenerationProvider &provider,
                                 const std::string &name,
                                 const std::string &prompt,
                                 finrag::Logger &logger) {
  const auto start = std::chrono::steady_clock::now();
  try {
    auto text = provider.ProduceText(prompt);
    const auto duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count();
    logger.Log(finrag::LogLevel::kInfo, "router.generate.complete",
               {{"provider", name},
                {"duration_ms", std::to_string(duration_ms)},
                {"chars", std::to_string(text.size())}});
    return finrag::GenerationOutcome{std::move(text), name};
  } catch (const std::exception &error) {
    logger.Log(finrag::LogLevel::kWarn, "router.generate.failed",
               {{"provider", name}, {"cause", error.what()}});
    throw finrag::GenerationFailed(name, error.what());
  }
}

} // namespace

namespace finrag {

bool Satisfies(const ProviderCapabilities &capabilities,
               const TaskRequirement &requirement) {
  if (requirement.requires_long_context &&
      !capabilities.supports_long_context) {
    return false;
  }
  return capabilities.context_window >= requirement.min_context_window;
}

GenerationRouter::GenerationRouter(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {
  requirements_[kLongContextAnalysisTask] = TaskRequirement{true, 0};
}

void GenerationRouter::Register(std::shared_ptr<GenerationProvider> provider,
                                bool make_default) {
  if (!provider) {
    throw std::invalid_argument("Generation provider cannot be null");
  }
  auto name = provider->Name();
  if (name.empty()) {
    throw std::invalid_argument("Generation provider name cannot be empty");
  }

  std::unique_lock lock(mutex_);
  if (FindLocked(name) != nullptr) {
    throw std::invalid_argument("Generation provider with name '" + name +
                                "' already registered");
  }
  providers_.push_back(Registration{name, std::move(provider)});
  if (make_default || default_name_.empty()) {
    default_name_ = name;
  }
  logger_->Log(LogLevel::kInfo, "router.register",
               {{"provider", name},
                {"default", default_name_ == name ? "true" : "false"}});
}

void GenerationRouter::SetTaskRoute(const std::string &task_type,
                                    const std::string &provider_name) {
  std::unique_lock lock(mutex_);
  if (FindLocked(provider_name) == nullptr) {
    throw std::invalid_argument("Cannot route task '" + task_type +
                                "' to unknown provider '" + provider_name +
                                "'. Registered: " + JoinNamesLocked());
  }
  routes_[task_type] = provider_name;
}

void GenerationRouter::SetTaskRequirement(const std::string &task_type,
                                          TaskRequirement requirement) {
  std::unique_lock lock(mutex_);
  requirements_[task_type] = requirement;
}

const GenerationRouter::Registration *
GenerationRouter::FindLocked(const std::string &name) const {
  for (const auto &registration : providers_) {
    if (registration.name == name) {
      return &registration;
    }
  }
  return nullptr;
}

std::string GenerationRouter::JoinNamesLocked() const {
  std::string message;
  for (std::size_t i = 0; i < providers_.size(); ++i) {
    message += providers_[i].name;
    if (i + 1 < providers_.size()) {
      message += ", ";
    }
  }
  return message;
}

std::shared_ptr<GenerationProvider>
GenerationRouter::SelectLocked(const std::optional<std::string> &task_type,
                               const std::string &excluded_name) const {
  const auto eligible = [&](const std::string &name) {
    return excluded_name.empty() || name != excluded_name;
  };

  if (task_type) {
    if (const auto route = routes_.find(*task_type); route != routes_.end()) {
      const auto *registration = FindLocked(route->second);
      if (registration != nullptr && eligible(registration->name)) {
        return registration->provider;
      }
    }

    if (const auto requirement = requirements_.find(*task_type);
        requirement != requirements_.end()) {
      for (const auto &registration : providers_) {
        if (eligible(registration.name) &&
            Satisfies(registration.provider->DeclareCapabilities(),
                      requirement->second)) {
          return registration.provider;
        }
      }
    }
  }

  if (const auto *registration = FindLocked(default_name_);
      registration != nullptr && eligible(registration->name)) {
    return registration->provider;
  }
  for (const auto &registration : providers_) {
    if (eligible(registration.name)) {
      return registration.provider;
    }
  }
  return nullptr;
}

std::shared_ptr<GenerationProvider>
GenerationRouter::Select(const std::optional<std::string> &task_type) const {
  std::shared_lock lock(mutex_);
  if (providers_.empty()) {
    throw NoProviderRegistered();
  }
  auto provider = SelectLocked(task_type, "");
  logger_->Log(LogLevel::kDebug, "router.select",
               {{"task", task_type.value_or("")},
                {"provider", provider->Name()}});
  return provider;
}

std::shared_ptr<GenerationProvider>
GenerationRouter::SelectExcluding(const std::optional<std::string> &task_type,
                                  const std::string &excluded_name) const {
  std::shared_lock lock(mutex_);
  if (providers_.empty()) {
    throw NoProviderRegistered();
  }
  return SelectLocked(task_type, excluded_name);
}

GenerationOutcome GenerationRouter::Generate(const std::string &task_type,
                                             const std::string &prompt) const {
  const auto provider = Select(task_type);
  return Invoke(*provider, provider->Name(), prompt, *logger_);
}

GenerationOutcome
GenerationRouter::GenerateWith(const std::string &provider_name,
                               const std::string &prompt) const {
  std::shared_ptr<GenerationProvider> provider;
  {
    std::shared_lock lock(mutex_);
    const auto *registration = FindLocked(provider_name);
    if (registration == nullptr) {
      throw std::invalid_argument("Unknown generation provider '" +
                                  provider_name +
                                  "'. Registered: " + JoinNamesLocked());
    }
    provider = registration->provider;
  }
  return Invoke(*provider, provider_name, prompt, *logger_);
}

std::vector<ProviderDescription> GenerationRouter::Providers() const {
  std::shared_lock lock(mutex_);
  std::vector<ProviderDescription> descriptions;
  descriptions.reserve(providers_.size());
  for (const auto &registration : providers_) {
    descriptions.push_back(
        ProviderDescription{registration.name,
                            registration.provider->DeclareCapabilities(),
                            registration.name == default_name_});
  }
  return descriptions;
}

std::vector<std::string> GenerationRouter::ProviderNames() const {
  std::shared_lock lock(mutex_);
  std::vector<std::string> names;
  names.reserve(providers_.size());
  for (const auto &registration : providers_) {
    names.push_back(registration.name);
  }
  return names;
}

std::string GenerationRouter::DefaultProviderName() const {
  std::shared_lock lock(mutex_);
  return default_name_;
}

bool GenerationRouter::Empty() const {
  std::shared_lock lock(mutex_);
  return providers_.empty();
}

} // namespace finrag
