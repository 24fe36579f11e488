#include "core/allocation_engine.hpp"

#include <algorithm>
#include <map>

#include "core/document_status.hpp"
#include "core/errors.hpp"
#include "util/log.hpp"

namespace core {

namespace {

constexpr const char* kLogCat = "alloc";

std::string ref(const char* verb, const Document& doc) {
    return std::string(verb) + ":" + doc.number;
}

} // namespace

Document AllocationEngine::locked_document_for_line(Transaction& txn, LineId line_id) const {
    const auto line = store_.line(line_id);
    if (!line) {
        throw NotFoundError("document line " + std::to_string(line_id) + " does not exist");
    }
    txn.lock_document(line->document);
    auto doc = txn.read_document(line->document);
    if (!doc) {
        throw IntegrityError("line " + std::to_string(line_id) + " belongs to missing document");
    }
    return *doc;
}

DocumentLine AllocationEngine::locked_line(Transaction& txn, LineId line_id) const {
    auto line = txn.read_line(line_id);
    if (!line) {
        throw NotFoundError("document line " + std::to_string(line_id) + " does not exist");
    }
    return *line;
}

CandidateFilter AllocationEngine::filter_for(const Document& doc, const DocumentLine& line) const {
    CandidateFilter f;
    f.item = line.item;
    f.warehouse = doc.warehouse;
    f.category_mask = store_.config().effective_allocatable_mask();
    f.owner = doc.owner;
    return f;
}

Qty AllocationEngine::allocate_line(Transaction& txn, const Document& doc, DocumentLine& line,
                                    std::vector<CandidateQuant>& candidates, const std::string& actor) {
    Qty remaining = line.qty_requested - line.qty_allocated;
    if (remaining <= 0) {
        return 0;
    }

    std::map<QuantId, Reservation> existing;
    for (const auto& r : txn.reservations_for_line(line.id)) {
        existing.emplace(r.quant, r);
    }

    Qty total = 0;
    for (auto& cand : candidates) {
        if (remaining == 0) {
            break;
        }
        Quant& q = cand.quant;
        if (q.key.item != line.item) {
            continue;
        }
        if (q.key.owner != doc.owner) {
            QL_LOG_FATAL(kLogCat, "document %s owner %llu offered quant %llu of owner %llu", doc.number.c_str(),
                         static_cast<unsigned long long>(doc.owner), static_cast<unsigned long long>(q.id),
                         static_cast<unsigned long long>(q.key.owner));
            throw CrossOwnerAllocationError("quant " + std::to_string(q.id) + " is not owned by the owner of document " +
                                            doc.number);
        }
        const Qty take = std::min(remaining, q.available());
        if (take <= 0) {
            continue;
        }

        q.qty_reserved += take;
        txn.update_quant(q);

        if (auto it = existing.find(q.id); it != existing.end()) {
            it->second.qty += take;
            txn.update_reservation(it->second);
        } else {
            existing.emplace(q.id, txn.insert_reservation(line.id, q.id, take));
        }

        Movement m;
        m.type = MovementType::Reserved;
        m.item = line.item;
        m.from_quant = q.id;
        m.qty = take;
        m.warehouse = quants_.warehouse_of(q.key.bin);
        m.reference = ref("reserve", doc);
        m.actor = actor;
        txn.append_movement(std::move(m));

        remaining -= take;
        total += take;
    }

    if (total > 0) {
        line.qty_allocated += total;
        txn.update_line(line);
    }
    return total;
}

Qty AllocationEngine::release_reservation(Transaction& txn, const Document& doc, ReservationId reservation_id,
                                          const std::string& actor) {
    auto r = txn.read_reservation(reservation_id);
    if (!r) {
        throw NotFoundError("reservation " + std::to_string(reservation_id) + " does not exist");
    }
    const Qty released = r->remaining();
    if (released == 0) {
        return 0;
    }

    auto q = txn.read_quant(r->quant);
    if (!q) {
        throw IntegrityError("reservation " + std::to_string(r->id) + " references missing quant");
    }
    q->qty_reserved -= released;
    txn.update_quant(*q);

    if (r->qty_picked == 0) {
        txn.erase_reservation(r->id);
    } else {
        r->qty = r->qty_picked;
        txn.update_reservation(*r);
    }

    auto line = locked_line(txn, r->line);
    line.qty_allocated -= released;
    txn.update_line(line);

    Movement m;
    m.type = MovementType::Unreserved;
    m.item = line.item;
    m.from_quant = q->id;
    m.qty = released;
    m.warehouse = quants_.warehouse_of(q->key.bin);
    m.reference = ref("unreserve", doc);
    m.actor = actor;
    txn.append_movement(std::move(m));
    return released;
}

Qty AllocationEngine::reserve(LineId line_id, AllocationStrategy strategy, const std::string& actor) {
    auto txn = store_.begin();
    const Document doc = locked_document_for_line(txn, line_id);
    if (is_terminal_status(doc.status)) {
        throw DocumentStateError("cannot reserve for document " + doc.number + " in status " +
                                 doc_status_name(doc.status));
    }
    auto line = locked_line(txn, line_id);
    if (line.qty_requested - line.qty_allocated <= 0) {
        txn.rollback();
        return 0;
    }

    auto candidates = quants_.locked_candidates(txn, filter_for(doc, line), strategy);
    const Qty allocated = allocate_line(txn, doc, line, candidates, actor);
    refresh_document_status(txn, doc.id);
    txn.commit();

    QL_LOG_DEBUG(kLogCat, "reserve %s line %llu strategy=%s allocated=%lld remaining=%lld", doc.number.c_str(),
                 static_cast<unsigned long long>(line_id), strategy_name(strategy), static_cast<long long>(allocated),
                 static_cast<long long>(line.qty_requested - line.qty_allocated));
    return allocated;
}

Qty AllocationEngine::reserve(LineId line_id, const std::string& actor) {
    return reserve(line_id, store_.config().default_strategy, actor);
}

bool AllocationEngine::pick(ReservationId reservation_id, Qty qty, const std::string& actor) {
    if (qty <= 0) {
        throw InvalidQuantityError("pick quantity must be positive, got " + std::to_string(qty));
    }
    return pick_locked(reservation_id, qty, actor);
}

bool AllocationEngine::pick(ReservationId reservation_id, const std::string& actor) {
    return pick_locked(reservation_id, std::nullopt, actor);
}

bool AllocationEngine::pick_locked(ReservationId reservation_id, std::optional<Qty> requested,
                                   const std::string& actor) {
    const auto peek = store_.reservation(reservation_id);
    if (!peek) {
        QL_LOG_DEBUG(kLogCat, "pick: reservation %llu no longer exists", static_cast<unsigned long long>(reservation_id));
        return false;
    }

    auto txn = store_.begin();
    const Document doc = locked_document_for_line(txn, peek->line);
    auto r = txn.read_reservation(reservation_id);
    if (!r) {
        txn.rollback();
        return false;
    }
    if (!txn.lock_quant(r->quant)) {
        throw IntegrityError("reservation " + std::to_string(r->id) + " references missing quant");
    }
    r = txn.read_reservation(reservation_id);
    const Qty qty = requested.value_or(r ? r->remaining() : 0);
    if (!r || qty <= 0 || qty > r->remaining()) {
        QL_LOG_DEBUG(kLogCat, "pick %lld from reservation %llu rejected (remaining %lld)", static_cast<long long>(qty),
                     static_cast<unsigned long long>(reservation_id), static_cast<long long>(r ? r->remaining() : 0));
        txn.rollback();
        return false;
    }

    auto q = txn.read_quant(r->quant);
    if (!q || q->qty < qty || q->qty_reserved < qty) {
        throw IntegrityError("quant backing reservation " + std::to_string(r->id) + " holds less than reserved");
    }

    r->qty_picked += qty;
    q->qty -= qty;
    q->qty_reserved -= qty;

    auto line = locked_line(txn, r->line);
    line.qty_picked += qty;
    txn.update_line(line);

    Movement m;
    m.type = MovementType::Outbound;
    m.item = line.item;
    m.from_quant = q->id;
    m.qty = qty;
    m.warehouse = quants_.warehouse_of(q->key.bin);
    m.reference = ref("pick", doc);
    m.actor = actor;
    txn.append_movement(std::move(m));

    // Reservation goes first so the quant is never removed while referenced.
    if (r->qty_picked == r->qty) {
        txn.erase_reservation(r->id);
    } else {
        txn.update_reservation(*r);
    }
    txn.update_quant(*q);
    if (q->qty == 0) {
        quants_.remove(txn, q->id);
    }

    const DocStatus status = refresh_document_status(txn, doc.id);
    txn.commit();
    QL_LOG_DEBUG(kLogCat, "picked %lld from reservation %llu for %s", static_cast<long long>(qty),
                 static_cast<unsigned long long>(reservation_id), doc.number.c_str());

    if (status == DocStatus::Completed) {
        try {
            purge_closed_reservations(doc.id);
        } catch (const LedgerError& e) {
            // The pick stands; leftover closed rows go when their quant empties.
            QL_LOG_WARN(kLogCat, "closed reservations of %s kept: %s", doc.number.c_str(), e.what());
        }
    }
    return true;
}

// Closed reservations (qty == qty_picked, left by an unreserve after a partial
// pick) carry no stock. Once the document is completed nothing can grow them
// again, so they are dropped.
void AllocationEngine::purge_closed_reservations(DocumentId doc_id) {
    auto txn = store_.begin();
    txn.lock_document(doc_id);
    const auto doc = txn.read_document(doc_id);
    if (!doc) {
        txn.rollback();
        return;
    }

    std::vector<QuantId> quants;
    for (const auto line_id : doc->lines) {
        for (const auto& r : txn.reservations_for_line(line_id)) {
            if (r.remaining() == 0) {
                quants.push_back(r.quant);
            }
        }
    }
    if (quants.empty()) {
        txn.rollback();
        return;
    }

    const auto locked = txn.lock_quants(quants);
    std::size_t purged = 0;
    for (const auto line_id : doc->lines) {
        for (const auto& r : txn.reservations_for_line(line_id)) {
            if (r.remaining() == 0 && std::find(locked.begin(), locked.end(), r.quant) != locked.end()) {
                txn.erase_reservation(r.id);
                ++purged;
            }
        }
    }
    txn.commit();
    QL_LOG_DEBUG(kLogCat, "purged %zu closed reservations of %s", purged, doc->number.c_str());
}

Qty AllocationEngine::unreserve(ReservationId reservation_id, const std::string& actor) {
    const auto peek = store_.reservation(reservation_id);
    if (!peek) {
        throw NotFoundError("reservation " + std::to_string(reservation_id) + " does not exist");
    }

    auto txn = store_.begin();
    const Document doc = locked_document_for_line(txn, peek->line);
    const auto r = txn.read_reservation(reservation_id);
    if (!r) {
        throw NotFoundError("reservation " + std::to_string(reservation_id) + " does not exist");
    }
    if (!txn.lock_quant(r->quant)) {
        throw IntegrityError("reservation " + std::to_string(r->id) + " references missing quant");
    }
    const Qty released = release_reservation(txn, doc, reservation_id, actor);
    refresh_document_status(txn, doc.id);
    txn.commit();

    QL_LOG_DEBUG(kLogCat, "unreserved %lld from reservation %llu for %s", static_cast<long long>(released),
                 static_cast<unsigned long long>(reservation_id), doc.number.c_str());
    return released;
}

QuantView AllocationEngine::transfer(QuantId from, const TransferSpec& to, Qty qty, const std::string& actor) {
    if (qty <= 0) {
        throw InvalidQuantityError("transfer quantity must be positive, got " + std::to_string(qty));
    }
    const auto source = store_.quant(from);
    if (!source) {
        throw NotFoundError("quant " + std::to_string(from) + " does not exist");
    }
    if (!store_.find_bin(to.bin)) {
        throw InvalidTransferError("destination bin " + std::to_string(to.bin) + " is not registered");
    }
    QuantKey dest_key = source->key;
    dest_key.bin = to.bin;
    dest_key.category = to.category.value_or(source->key.category);
    if (dest_key == source->key) {
        throw InvalidTransferError("transfer destination equals the source quant");
    }

    auto txn = store_.begin();
    txn.lock_identities({source->key, dest_key});
    const auto dest_id = txn.find_quant_id(dest_key);
    std::vector<QuantId> rows{from};
    if (dest_id) {
        rows.push_back(*dest_id);
    }
    const auto locked = txn.lock_quants(rows);
    if (std::find(locked.begin(), locked.end(), from) == locked.end()) {
        throw NotFoundError("quant " + std::to_string(from) + " was removed concurrently");
    }

    auto src = txn.read_quant(from);
    if (qty > src->available()) {
        throw InsufficientAvailableQuantityError("cannot transfer " + std::to_string(qty) + " from quant " +
                                                 std::to_string(from) + " with " +
                                                 std::to_string(src->available()) + " available");
    }
    src->qty -= qty;

    Quant dest;
    if (dest_id && std::find(locked.begin(), locked.end(), *dest_id) != locked.end()) {
        dest = *txn.read_quant(*dest_id);
        if (qty_add_overflows(dest.qty, qty)) {
            throw InvalidQuantityError("transfer of " + std::to_string(qty) + " overflows quant " +
                                       std::to_string(dest.id));
        }
        dest.qty += qty;
        txn.update_quant(dest);
    } else {
        // FIFO age follows the stock to its new bin.
        dest = txn.insert_quant(dest_key, qty, src->received_at_ns);
    }

    txn.update_quant(*src);
    if (src->qty == 0) {
        quants_.remove(txn, src->id);
    }

    Movement m;
    m.type = MovementType::Transfer;
    m.item = src->key.item;
    m.from_quant = src->id;
    m.to_quant = dest.id;
    m.qty = qty;
    m.warehouse = quants_.warehouse_of(src->key.bin);
    m.reference = "transfer";
    m.actor = actor;
    txn.append_movement(std::move(m));
    txn.commit();

    QL_LOG_DEBUG(kLogCat, "transferred %lld from quant %llu to quant %llu", static_cast<long long>(qty),
                 static_cast<unsigned long long>(from), static_cast<unsigned long long>(dest.id));
    return to_view(dest);
}

} // namespace core
