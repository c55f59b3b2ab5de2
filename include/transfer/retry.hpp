#ifndef DAGSYNC_TRANSFER_RETRY_HPP
#define DAGSYNC_TRANSFER_RETRY_HPP

#include <functional>
#include <string>
#include <thread>
#include <boost/log/trivial.hpp>
#include "transfer/transfer_config.hpp"
#include "transfer/transfer_error.hpp"

namespace dagsync::transfer {

// Runs op until it succeeds, retrying only TransferError with exponential backoff.
// Every other exception propagates on the first attempt. Throws CancelledError
// when cancelled() reports true before an attempt.
template <typename Op>
auto with_retry(const RetryPolicy& policy, const std::string& what, Op&& op,
                const std::function<bool()>& cancelled = {}) -> decltype(op()) {
  for (std::size_t attempt = 1;; ++attempt) {
    if (cancelled && cancelled()) {
      throw CancelledError(what);
    }

    try {
      return op();
    } catch (const TransferError& e) {
      if (attempt >= policy.max_attempts) {
        BOOST_LOG_TRIVIAL(error) << "Retry: " << what << " failed after " << attempt << " attempts: " << e.what();
        throw;
      }
      auto delay = policy.backoff_for(attempt);
      BOOST_LOG_TRIVIAL(warning) << "Retry: " << what << " attempt " << attempt << " failed (" << e.what()
                                 << "), retrying in " << delay.count() << " ms";
      std::this_thread::sleep_for(delay);
    }
  }
}

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_RETRY_HPP
