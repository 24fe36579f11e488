#include "core/document_service.hpp"

#include <map>
#include <set>
#include <utility>

#include "core/document_status.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

namespace core {

namespace {

constexpr const char* kLogCat = "documents";

Document read_locked(Transaction& txn, DocumentId id) {
    txn.lock_document(id);
    auto doc = txn.read_document(id);
    if (!doc) {
        throw NotFoundError("document " + std::to_string(id) + " does not exist");
    }
    return *doc;
}

std::vector<DocumentLine> read_lines(Transaction& txn, const Document& doc) {
    std::vector<DocumentLine> lines;
    lines.reserve(doc.lines.size());
    for (const auto line_id : doc.lines) {
        auto line = txn.read_line(line_id);
        if (!line) {
            throw IntegrityError("document " + doc.number + " lists missing line " + std::to_string(line_id));
        }
        lines.push_back(*line);
    }
    return lines;
}

} // namespace

DocumentView DocumentService::create_document(const std::string& number, DocType type, WarehouseId warehouse,
                                              OwnerId owner, const std::string& actor) {
    Document doc;
    doc.number = number;
    doc.type = type;
    doc.warehouse = warehouse;
    doc.owner = owner;
    doc.status = DocStatus::Draft;

    auto txn = store_.begin();
    const Document created = txn.insert_document(std::move(doc));
    txn.commit();
    QL_LOG_INFO(kLogCat, "document %s created by %s (owner %llu warehouse %llu)", number.c_str(), actor.c_str(),
                static_cast<unsigned long long>(owner), static_cast<unsigned long long>(warehouse));
    return view(created.id);
}

LineView DocumentService::add_line(DocumentId doc_id, ItemId item, Qty qty_requested) {
    if (qty_requested <= 0) {
        throw InvalidQuantityError("requested quantity must be positive, got " + std::to_string(qty_requested));
    }
    auto txn = store_.begin();
    Document doc = read_locked(txn, doc_id);
    if (!accepts_new_lines(doc.status)) {
        throw DocumentStateError("cannot add lines to document " + doc.number + " in status " +
                                 doc_status_name(doc.status));
    }

    DocumentLine line;
    line.document = doc_id;
    line.item = item;
    line.qty_requested = qty_requested;
    line = txn.insert_line(line);

    doc.lines.push_back(line.id);
    txn.update_document(doc);
    refresh_document_status(txn, doc_id);
    txn.commit();
    return LineView{line.id, line.item, line.qty_requested, 0, 0, line.qty_requested};
}

ReserveReport DocumentService::reserve_document(DocumentId doc_id, AllocationStrategy strategy,
                                                const std::string& actor) {
    auto txn = store_.begin();
    const Document doc = read_locked(txn, doc_id);
    if (is_terminal_status(doc.status)) {
        throw DocumentStateError("cannot reserve for document " + doc.number + " in status " +
                                 doc_status_name(doc.status));
    }

    auto lines = read_lines(txn, doc);
    std::vector<CandidateFilter> filters;
    for (const auto& line : lines) {
        if (line.qty_allocated < line.qty_requested) {
            filters.push_back(engine_.filter_for(doc, line));
        }
    }

    ReserveReport report;
    if (!filters.empty()) {
        // One lock pass over the union keeps every row in canonical order even
        // when several lines draw from the same quants.
        auto candidates = quants_.locked_candidates(txn, filters, strategy);
        for (auto& line : lines) {
            report.allocated_this_call += engine_.allocate_line(txn, doc, line, candidates, actor);
        }
    }
    report.status = refresh_document_status(txn, doc_id);
    txn.commit();

    for (const auto& line : lines) {
        if (line.qty_allocated == line.qty_requested) {
            report.fully_allocated.push_back(line.id);
        } else if (line.qty_allocated > 0) {
            report.partially_allocated.push_back(PartialLine{line.id, line.qty_allocated, line.qty_requested});
        } else {
            report.unallocated.push_back(line.id);
        }
    }
    QL_LOG_DEBUG(kLogCat, "reserve %s strategy=%s allocated=%lld full=%zu partial=%zu none=%zu status=%s",
                 doc.number.c_str(), strategy_name(strategy), static_cast<long long>(report.allocated_this_call),
                 report.fully_allocated.size(), report.partially_allocated.size(), report.unallocated.size(),
                 doc_status_name(report.status));
    return report;
}

ReserveReport DocumentService::reserve_document(DocumentId doc_id, const std::string& actor) {
    return reserve_document(doc_id, store_.config().default_strategy, actor);
}

Qty DocumentService::reserve_line(LineId line, AllocationStrategy strategy, const std::string& actor) {
    return engine_.reserve(line, strategy, actor);
}

bool DocumentService::pick(ReservationId reservation, Qty qty, const std::string& actor) {
    return engine_.pick(reservation, qty, actor);
}

bool DocumentService::pick(ReservationId reservation, const std::string& actor) {
    return engine_.pick(reservation, actor);
}

Qty DocumentService::unreserve(ReservationId reservation, const std::string& actor) {
    return engine_.unreserve(reservation, actor);
}

bool DocumentService::cancel_document(DocumentId doc_id, const std::string& actor) {
    auto txn = store_.begin();
    Document doc = read_locked(txn, doc_id);
    if (is_terminal_status(doc.status)) {
        QL_LOG_DEBUG(kLogCat, "cancel %s ignored: already %s", doc.number.c_str(), doc_status_name(doc.status));
        txn.rollback();
        return false;
    }

    const auto lines = read_lines(txn, doc);
    for (const auto& line : lines) {
        if (line.qty_picked > 0) {
            QL_LOG_INFO(kLogCat, "cancel %s rejected: line %llu already picked %lld", doc.number.c_str(),
                        static_cast<unsigned long long>(line.id), static_cast<long long>(line.qty_picked));
            txn.rollback();
            return false;
        }
    }

    std::vector<ReservationId> open;
    std::vector<QuantId> quants;
    for (const auto& line : lines) {
        for (const auto& r : txn.reservations_for_line(line.id)) {
            if (r.is_open()) {
                open.push_back(r.id);
                quants.push_back(r.quant);
            }
        }
    }
    txn.lock_quants(quants);

    Qty released = 0;
    for (const auto rid : open) {
        released += engine_.release_reservation(txn, doc, rid, actor);
    }

    doc = *txn.read_document(doc_id);
    doc.status = DocStatus::Canceled;
    txn.update_document(doc);
    txn.commit();
    QL_LOG_INFO(kLogCat, "document %s canceled by %s, released %lld", doc.number.c_str(), actor.c_str(),
                static_cast<long long>(released));
    return true;
}

std::vector<PickingBin> DocumentService::picking_list(DocumentId doc_id) const {
    if (!store_.document(doc_id)) {
        throw NotFoundError("document " + std::to_string(doc_id) + " does not exist");
    }

    std::map<std::pair<std::string, BinId>, PickingBin> bins;
    for (const auto& r : store_.reservations_for_document(doc_id)) {
        if (!r.is_open()) {
            continue;
        }
        const auto q = store_.quant(r.quant);
        if (!q) {
            continue;
        }
        const auto bin = store_.find_bin(q->key.bin);
        const std::string code = bin ? bin->location_code : std::string();
        auto& group = bins[{code, q->key.bin}];
        group.bin = q->key.bin;
        group.location_code = code;
        group.entries.push_back(PickingEntry{r.id, r.quant, q->key.item, q->key.lot, r.qty, r.qty_picked, r.remaining()});
    }

    std::vector<PickingBin> out;
    out.reserve(bins.size());
    for (auto& [key, group] : bins) {
        out.push_back(std::move(group));
    }
    return out;
}

DocumentView DocumentService::view(DocumentId doc_id) const {
    auto v = store_.document_view(doc_id);
    if (!v) {
        throw NotFoundError("document " + std::to_string(doc_id) + " does not exist");
    }
    return *v;
}

} // namespace core
