#ifndef DAGSYNC_DAG_ERROR_HPP
#define DAGSYNC_DAG_ERROR_HPP

#include <stdexcept>
#include <string>

namespace dagsync::dag {

class DagError : public std::runtime_error {
public:
    explicit DagError(const std::string& message)
        : std::runtime_error(message) {}
};

// Invalid builder or pipeline configuration (chunk size, fan-out, password)
class ConfigError : public DagError {
public:
    explicit ConfigError(const std::string& message)
        : DagError("Config error: " + message) {}
};

// Caller-supplied node input that violates a node invariant
class ValidationError : public DagError {
public:
    explicit ValidationError(const std::string& message)
        : DagError("Validation error: " + message) {}
};

class EncodeError : public DagError {
public:
    explicit EncodeError(const std::string& message)
        : DagError("Encode error: " + message) {}
};

class DecodeError : public DagError {
public:
    enum class Kind {
        Truncated,
        UnknownVariant,
        SchemaInvalid
    };

    DecodeError(Kind kind, const std::string& message)
        : DagError("Decode error (" + std::string(kind_name(kind)) + "): " + message)
        , kind_(kind) {}

    Kind kind() const { return kind_; }

    static const char* kind_name(Kind kind) {
        switch (kind) {
            case Kind::Truncated: return "truncated";
            case Kind::UnknownVariant: return "unknown variant";
            case Kind::SchemaInvalid: return "schema invalid";
            default: return "unknown";
        }
    }

private:
    Kind kind_;
};

class CidParseError : public DagError {
public:
    explicit CidParseError(const std::string& message)
        : DagError("Invalid CID: " + message) {}
};

using InvalidCidError = CidParseError;

} // namespace dagsync::dag

#endif // DAGSYNC_DAG_ERROR_HPP
