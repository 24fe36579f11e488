#include "core/document_status.hpp"

#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/ledger_store.hpp"
#include "util/log.hpp"

namespace core {

DocStatus derive_document_status(DocStatus current, std::span<const DocumentLine> lines) noexcept {
    if (is_terminal_status(current)) {
        return current;
    }
    if (lines.empty()) {
        return DocStatus::Draft;
    }

    bool all_picked = true;
    bool any_picked = false;
    bool all_allocated = true;
    bool any_allocated = false;
    for (const auto& line : lines) {
        all_picked = all_picked && line.qty_picked == line.qty_requested;
        any_picked = any_picked || line.qty_picked > 0;
        all_allocated = all_allocated && line.qty_allocated == line.qty_requested;
        any_allocated = any_allocated || line.qty_allocated > 0;
    }

    if (all_picked) {
        return DocStatus::Completed;
    }
    if (any_picked) {
        return DocStatus::PartiallyPicked;
    }
    if (all_allocated) {
        return DocStatus::FullyAllocated;
    }
    if (any_allocated) {
        return DocStatus::PartiallyAllocated;
    }
    return DocStatus::Pending;
}

DocStatus refresh_document_status(Transaction& txn, DocumentId doc_id) {
    auto doc = txn.read_document(doc_id);
    if (!doc) {
        throw NotFoundError("document " + std::to_string(doc_id) + " does not exist");
    }

    std::vector<DocumentLine> lines;
    lines.reserve(doc->lines.size());
    for (const auto line_id : doc->lines) {
        auto line = txn.read_line(line_id);
        if (!line) {
            throw IntegrityError("document " + doc->number + " lists missing line " + std::to_string(line_id));
        }
        lines.push_back(*line);
    }

    const DocStatus next = derive_document_status(doc->status, lines);
    if (next == doc->status) {
        return next;
    }
    if (!is_valid_transition(doc->status, next)) {
        throw IntegrityError(std::string("document ") + doc->number + ": illegal status change " +
                             doc_status_name(doc->status) + " -> " + doc_status_name(next));
    }
    QL_LOG_DEBUG("documents", "document %s status %s -> %s", doc->number.c_str(), doc_status_name(doc->status),
                 doc_status_name(next));
    doc->status = next;
    txn.update_document(*doc);
    return next;
}

} // namespace core
