#include "transfer/transfer_config.hpp"
#include <algorithm>
#include <cmath>

namespace dagsync::transfer {

namespace {

void check_password(const std::optional<std::string>& password) {
  if (password && password->empty()) {
    throw dag::ConfigError("malformed password: must not be empty");
  }
}

} // namespace

std::chrono::milliseconds RetryPolicy::backoff_for(std::size_t retry) const {
  if (retry == 0) {
    return std::chrono::milliseconds(0);
  }
  double delay = static_cast<double>(initial_backoff.count())
               * std::pow(multiplier, static_cast<double>(retry - 1));
  delay = std::min(delay, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds(static_cast<std::int64_t>(delay));
}

void TransferConfig::validate() const {
  if (!store) {
    throw dag::ConfigError("no remote store configured");
  }
  if (concurrency == 0) {
    throw dag::ConfigError("concurrency must be at least 1");
  }
  if (retry.max_attempts == 0) {
    throw dag::ConfigError("retry attempts must be at least 1");
  }
  if (retry.multiplier < 1.0) {
    throw dag::ConfigError("retry backoff multiplier must be at least 1");
  }
  if (kdf_iterations == 0) {
    throw dag::ConfigError("key derivation iterations must be at least 1");
  }
  builder.validate();
}

void UploadOptions::validate() const {
  check_password(password);
}

void DownloadOptions::validate() const {
  check_password(password);
}

} // namespace dagsync::transfer
