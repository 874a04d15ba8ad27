#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace finrag {

class InvalidConfig : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

class InvalidDocument : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Index and cache metadata disagree, or a persisted snapshot could not be
// written completely. Never repaired automatically.
class CacheInconsistency : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NoProviderRegistered : public std::runtime_error {
public:
  NoProviderRegistered()
      : std::runtime_error("No generation provider registered") {}
};

class GenerationFailed : public std::runtime_error {
public:
  GenerationFailed(std::string provider_name, std::string cause)
      : std::runtime_error("Generation provider '" + provider_name +
                           "' failed: " + cause),
        provider_name_(std::move(provider_name)), cause_(std::move(cause)) {}

  const std::string &ProviderName() const { return provider_name_; }
  const std::string &Cause() const { return cause_; }

private:
  std::string provider_name_;
  std::string cause_;
};

class CompanyNotResolved : public std::runtime_error {
public:
  explicit CompanyNotResolved(std::string company_name)
      : std::runtime_error("Company could not be resolved: " + company_name),
        company_name_(std::move(company_name)) {}

  const std::string &CompanyName() const { return company_name_; }

private:
  std::string company_name_;
};

} // namespace finrag
