#pragma once

#include "sqlxfer/types.h"

#include <stdexcept>
#include <string>

namespace sqlxfer {

// Base exception for all sqlxfer errors
class XferError : public std::runtime_error {
public:
    XferError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class ConfigError : public XferError {
public:
    explicit ConfigError(const std::string& msg)
        : XferError(ErrorKind::Config, "Configuration error: " + msg) {}
};

// Server unreachable or login rejected
class ConnectionError : public XferError {
public:
    explicit ConnectionError(const std::string& msg)
        : XferError(ErrorKind::Connection, "Connection error: " + msg) {}
};

// Source table missing or source query invalid
class SourceError : public XferError {
public:
    explicit SourceError(const std::string& msg)
        : XferError(ErrorKind::Source, "Source error: " + msg) {}
};

// Unmapped source type or failed destination DDL
class SchemaError : public XferError {
public:
    explicit SchemaError(const std::string& msg)
        : XferError(ErrorKind::Schema, "Schema error: " + msg) {}
};

// Batch load, commit or mid-transfer connectivity failure
class TransferError : public XferError {
public:
    explicit TransferError(const std::string& msg)
        : XferError(ErrorKind::Transfer, "Transfer error: " + msg) {}
};

class CancellationError : public XferError {
public:
    explicit CancellationError(const std::string& msg)
        : XferError(ErrorKind::Cancelled, "Transfer cancelled: " + msg) {}
};

}  // namespace sqlxfer
