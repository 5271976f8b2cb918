#pragma once
#include <stdexcept>
#include <string>

namespace codesync {

// Root of everything the pipeline throws on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Per-file: source the grammar could not handle. Caught by the chunker.
class ParseError : public Error {
public:
    using Error::Error;
};

// Per-file: unreadable or undecodable file. Caught by the chunker.
class IOError : public Error {
public:
    using Error::Error;
};

// Missing or invalid credentials/settings. Fatal, raised before any request.
class ConfigError : public Error {
public:
    using Error::Error;
};

// Per-batch embedding failure (transport, HTTP status, malformed body).
class EmbeddingError : public Error {
public:
    using Error::Error;
};

// Per-batch vector store failure.
class StoreError : public Error {
public:
    explicit StoreError(const std::string& what, long status_code = 0)
        : Error(what), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

class NamespaceNotFoundError : public StoreError {
public:
    using StoreError::StoreError;
};

} // namespace codesync
