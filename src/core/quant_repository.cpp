#include "core/quant_repository.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace core {

namespace {

constexpr const char* kLogCat = "quants";

bool in_mask(std::uint8_t mask, StockCategory c) noexcept {
    return (mask & category_bit(c)) != 0;
}

} // namespace

WarehouseId QuantRepository::warehouse_of(BinId bin) const {
    const auto b = store_.find_bin(bin);
    if (!b) {
        throw NotFoundError("bin " + std::to_string(bin) + " is not registered");
    }
    return b->warehouse;
}

QuantView QuantRepository::receive(const ReceiveRequest& req) {
    if (req.qty <= 0) {
        throw InvalidQuantityError("receive quantity must be positive, got " + std::to_string(req.qty));
    }
    const WarehouseId warehouse = warehouse_of(req.bin);
    if (req.lot != no_lot) {
        const auto lot = store_.find_lot(req.lot);
        if (!lot) {
            throw NotFoundError("lot " + std::to_string(req.lot) + " is not registered");
        }
        if (lot->item != req.item) {
            throw IntegrityError("lot " + lot->lot_code + " belongs to item " + std::to_string(lot->item));
        }
    }

    const QuantKey key{req.item, req.bin, req.lot, req.category, req.owner};
    auto txn = store_.begin();
    txn.lock_identities({key});

    std::optional<Quant> q;
    if (const auto existing = txn.find_quant_id(key); existing && txn.lock_quant(*existing)) {
        q = txn.read_quant(*existing);
    }
    if (q) {
        if (qty_add_overflows(q->qty, req.qty)) {
            throw InvalidQuantityError("receiving " + std::to_string(req.qty) + " into quant " +
                                       std::to_string(q->id) + " overflows its quantity");
        }
        q->qty += req.qty;
        txn.update_quant(*q);
    } else {
        q = txn.insert_quant(key, req.qty, txn.now_ns());
    }

    Movement m;
    m.type = MovementType::Inbound;
    m.item = req.item;
    m.to_quant = q->id;
    m.qty = req.qty;
    m.warehouse = warehouse;
    m.reference = req.reference;
    m.actor = req.actor;
    txn.append_movement(std::move(m));
    txn.commit();

    QL_LOG_DEBUG(kLogCat, "received %lld of item %llu into quant %llu (qty=%lld)", static_cast<long long>(req.qty),
                 static_cast<unsigned long long>(req.item), static_cast<unsigned long long>(q->id),
                 static_cast<long long>(q->qty));
    return to_view(*q);
}

std::vector<CandidateQuant> QuantRepository::locked_candidates(Transaction& txn,
                                                               std::span<const CandidateFilter> filters,
                                                               AllocationStrategy strategy) const {
    std::set<QuantId> ids;
    for (const auto& f : filters) {
        const auto matches = store_.select_quants(f.item, [&f](const Quant& q) {
            return q.key.owner == f.owner && in_mask(f.category_mask, q.key.category) &&
                   (!f.bin || q.key.bin == *f.bin);
        });
        for (const auto& q : matches) {
            if (f.bin) {
                ids.insert(q.id);
                continue;
            }
            const auto bin = store_.find_bin(q.key.bin);
            if (bin && bin->warehouse == f.warehouse) {
                ids.insert(q.id);
            }
        }
    }

    const auto locked = txn.lock_quants(std::vector<QuantId>(ids.begin(), ids.end()));

    std::vector<CandidateQuant> out;
    out.reserve(locked.size());
    for (const auto id : locked) {
        auto q = txn.read_quant(id);
        if (!q) {
            continue;
        }
        CandidateQuant c;
        c.quant = *q;
        if (q->key.lot != no_lot) {
            if (const auto lot = store_.find_lot(q->key.lot)) {
                c.expiry = lot->expiry;
            }
        }
        out.push_back(std::move(c));
    }
    std::sort(out.begin(), out.end(), comparator_for(strategy));
    return out;
}

std::vector<CandidateQuant> QuantRepository::locked_candidates(Transaction& txn, const CandidateFilter& filter,
                                                               AllocationStrategy strategy) const {
    return locked_candidates(txn, std::span<const CandidateFilter>(&filter, 1), strategy);
}

void QuantRepository::remove(Transaction& txn, QuantId id) {
    const auto q = txn.read_quant(id);
    if (!q) {
        throw NotFoundError("quant " + std::to_string(id) + " does not exist");
    }
    if (q->qty != 0) {
        throw NonEmptyQuantError("quant " + std::to_string(id) + " still holds " + std::to_string(q->qty));
    }
    for (const auto& r : txn.reservations_for_quant(id)) {
        if (r.is_open()) {
            throw IntegrityError("quant " + std::to_string(id) + " is empty but reservation " +
                                 std::to_string(r.id) + " is still open");
        }
        txn.erase_reservation(r.id);
    }
    txn.erase_quant(id);
    QL_LOG_DEBUG(kLogCat, "removed exhausted quant %llu", static_cast<unsigned long long>(id));
}

void QuantRepository::remove(QuantId id) {
    auto txn = store_.begin();
    if (!txn.lock_quant(id)) {
        throw NotFoundError("quant " + std::to_string(id) + " does not exist");
    }
    remove(txn, id);
    txn.commit();
}

std::optional<QuantView> QuantRepository::adjust(QuantId id, Qty delta, const std::string& actor,
                                                 const std::string& reason) {
    if (delta == 0 || delta == std::numeric_limits<Qty>::min()) {
        throw InvalidQuantityError("adjustment delta must be non-zero and negatable, got " + std::to_string(delta));
    }
    auto txn = store_.begin();
    if (!txn.lock_quant(id)) {
        throw NotFoundError("quant " + std::to_string(id) + " does not exist");
    }
    auto q = txn.read_quant(id);
    if (delta < 0 && -delta > q->available()) {
        throw InsufficientAvailableQuantityError("cannot remove " + std::to_string(-delta) + " from quant " +
                                                 std::to_string(id) + " with " + std::to_string(q->available()) +
                                                 " available");
    }

    if (delta > 0 && qty_add_overflows(q->qty, delta)) {
        throw InvalidQuantityError("adjusting quant " + std::to_string(id) + " by " + std::to_string(delta) +
                                   " overflows its quantity");
    }
    q->qty += delta;
    txn.update_quant(*q);

    Movement m;
    m.type = MovementType::Adjustment;
    m.item = q->key.item;
    if (delta < 0) {
        m.from_quant = id;
    } else {
        m.to_quant = id;
    }
    m.qty = delta < 0 ? -delta : delta;
    m.warehouse = warehouse_of(q->key.bin);
    m.reference = reason;
    m.actor = actor;
    txn.append_movement(std::move(m));

    std::optional<QuantView> result;
    if (q->qty == 0) {
        remove(txn, id);
    } else {
        result = to_view(*q);
    }
    txn.commit();
    QL_LOG_INFO(kLogCat, "adjusted quant %llu by %lld (%s) by %s", static_cast<unsigned long long>(id),
                static_cast<long long>(delta), reason.c_str(), actor.c_str());
    return result;
}

} // namespace core
