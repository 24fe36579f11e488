#pragma once

#include <span>

#include "core/types.hpp"

namespace core {

class Transaction;

inline constexpr bool is_terminal_status(DocStatus s) noexcept {
    return s == DocStatus::Completed || s == DocStatus::Canceled;
}

// Lines may be added until the first pick.
inline constexpr bool accepts_new_lines(DocStatus s) noexcept {
    switch (s) {
    case DocStatus::Draft:
    case DocStatus::Pending:
    case DocStatus::PartiallyAllocated:
    case DocStatus::FullyAllocated:
        return true;
    default:
        return false;
    }
}

// Validate whether a document may move from `current` to `next`.
inline bool is_valid_transition(DocStatus current, DocStatus next) noexcept {
    using DS = DocStatus;

    if (current == next) {
        return true;
    }
    if (is_terminal_status(current)) {
        return false;
    }
    if (next == DS::Canceled) {
        return true;
    }

    switch (current) {
    case DS::Draft:
        return next == DS::Pending;
    case DS::Pending:
        return next == DS::PartiallyAllocated || next == DS::FullyAllocated;
    case DS::PartiallyAllocated:
    case DS::FullyAllocated:
        // Unreserve can drop a document back to PENDING; a new line can turn a
        // fully allocated document into a partial one.
        return next == DS::Pending || next == DS::PartiallyAllocated || next == DS::FullyAllocated ||
               next == DS::PartiallyPicked || next == DS::Completed;
    case DS::PartiallyPicked:
        return next == DS::Completed;
    default:
        return false;
    }
}

// Pure status derivation from line aggregates. CANCELED and COMPLETED are
// sticky; everything else is recomputed from scratch.
DocStatus derive_document_status(DocStatus current, std::span<const DocumentLine> lines) noexcept;

// Recomputes the status of `doc` from its lines inside `txn` and writes it back
// when it changed. The document lock must be held. Throws IntegrityError when
// the derived status is not reachable from the stored one.
DocStatus refresh_document_status(Transaction& txn, DocumentId doc);

} // namespace core
