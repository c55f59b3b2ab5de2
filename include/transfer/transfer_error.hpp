#ifndef DAGSYNC_TRANSFER_ERROR_HPP
#define DAGSYNC_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dagsync::transfer {

class PipelineError : public std::runtime_error {
public:
    explicit PipelineError(const std::string& message)
        : std::runtime_error(message) {}
};

// I/O failure or timeout talking to the store; the only retryable error
class TransferError : public PipelineError {
public:
    explicit TransferError(const std::string& message)
        : PipelineError("Transfer error: " + message) {}
};

// The store holds nothing under the requested CID
class NotFoundError : public PipelineError {
public:
    explicit NotFoundError(const std::string& message)
        : PipelineError("Not found: " + message) {}
};

// Fetched bytes do not hash to the requested CID, or decode to the wrong variant
class IntegrityError : public PipelineError {
public:
    explicit IntegrityError(const std::string& message)
        : PipelineError("Integrity error: " + message) {}
};

class CancelledError : public PipelineError {
public:
    explicit CancelledError(const std::string& message = "transfer cancelled")
        : PipelineError("Cancelled: " + message) {}
};

} // namespace dagsync::transfer

#endif // DAGSYNC_TRANSFER_ERROR_HPP
