#ifndef DAGSYNC_TRANSFER_CONFIG_HPP
#define DAGSYNC_TRANSFER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "dag/dag_builder.hpp"
#include "store/remote_store.hpp"

namespace dagsync::transfer {

struct RetryPolicy {
    std::size_t max_attempts = 3;
    std::chrono::milliseconds initial_backoff{100};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{2000};

    // Delay before the given retry (1 = first retry)
    std::chrono::milliseconds backoff_for(std::size_t retry) const;
};

// Everything a pipeline needs, passed explicitly to its constructor
struct TransferConfig {
    std::shared_ptr<store::RemoteStore> store;
    dag::BuilderConfig builder;
    // Store operations in flight at once, per pipeline
    std::size_t concurrency = 4;
    RetryPolicy retry;
    std::uint32_t kdf_iterations = 100000;
    std::size_t pipeline_buffer_size = 1024 * 1024;

    // Throws dag::ConfigError
    void validate() const;
};

struct UploadOptions {
    // Enables encryption when set; must not be empty
    std::optional<std::string> password;
    bool compression = false;

    void validate() const;
};

struct DownloadOptions {
    // Required for encrypted DAGs
    std::optional<std::string> password;

    void validate() const;
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_CONFIG_HPP
