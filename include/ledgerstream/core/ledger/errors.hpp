#pragma once
#include <stdexcept>
#include <string>

namespace LedgerStream {

/// Base class for every ledger failure
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

/// Transition not declared in the state graph (caller bug, never retried)
class InvalidStateTransition : public LedgerError {
public:
    explicit InvalidStateTransition(const std::string& what) : LedgerError(what) {}
};

/// Log or snapshot content that cannot be replayed unambiguously
class LedgerCorruption : public LedgerError {
public:
    explicit LedgerCorruption(const std::string& what) : LedgerError(what) {}
};

/// open/write/fsync/rename failure on the log or snapshot files
class LedgerIoError : public LedgerError {
public:
    explicit LedgerIoError(const std::string& what) : LedgerError(what) {}
};

/// A state value outside the LedgerState enumeration reached the strict entry point
class LedgerTypeError : public std::invalid_argument {
public:
    explicit LedgerTypeError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace LedgerStream
