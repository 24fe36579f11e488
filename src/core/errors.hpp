#pragma once

#include <stdexcept>
#include <string>

namespace core {

// Root of every failure the ledger reports by exception. Expected caller
// conditions (over-pick, cancel after pick, short allocation) are return values.
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// qty <= 0 on an input; raised before any lock is taken.
class InvalidQuantityError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class InsufficientAvailableQuantityError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class NonEmptyQuantError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// Candidate selection always filters by owner, so this only fires on a broken
// internal invariant. Callers must treat it as fatal.
class CrossOwnerAllocationError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

// The whole operation rolled back and may be retried.
class LockTimeoutError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class NotFoundError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class DocumentStateError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class InvalidTransferError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class IntegrityError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class StorageError : public LedgerError {
public:
    StorageError(const std::string& what, int error_code)
        : LedgerError(what), error_code_(error_code) {}

    int error_code() const noexcept { return error_code_; }

private:
    int error_code_{0};
};

} // namespace core
