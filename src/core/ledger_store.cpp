#include "core/ledger_store.hpp"

#include <algorithm>
#include <string>

#include "core/errors.hpp"
#include "util/log.hpp"

namespace core {

namespace {

constexpr const char* kLogCat = "ledger";

std::string id_str(std::uint64_t id) {
    return std::to_string(id);
}

} // namespace

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

Transaction::Transaction(LedgerStore& store, TxnId id) : store_(store), id_(id) {}

Transaction::~Transaction() {
    if (state_ == State::Active) {
        if (!movements_.empty() || !quant_writes_.empty() || !reservation_writes_.empty()) {
            QL_LOG_WARN(kLogCat, "txn %llu abandoned with %zu pending movements; rolling back",
                        static_cast<unsigned long long>(id_), movements_.size());
        }
        rollback();
    }
}

std::uint64_t Transaction::now_ns() const noexcept {
    return store_.clock_->now_ns();
}

void Transaction::require_active() const {
    if (state_ != State::Active) {
        throw IntegrityError("transaction " + id_str(id_) + " is no longer active");
    }
}

std::chrono::steady_clock::time_point Transaction::lock_deadline() const {
    return std::chrono::steady_clock::now() + std::min(store_.cfg_.lock_timeout, max_lock_timeout);
}

bool Transaction::holds_document(DocumentId doc) const noexcept {
    return held_docs_.count(doc) != 0 || own_docs_.count(doc) != 0;
}

bool Transaction::holds_identity(const QuantKey& key) const noexcept {
    return held_identities_.count(key) != 0;
}

bool Transaction::holds_quant(QuantId id) const noexcept {
    return held_rows_.count(id) != 0 || own_quants_.count(id) != 0;
}

void Transaction::require_quant_lock(QuantId id, const char* op) const {
    if (!holds_quant(id)) {
        throw IntegrityError(std::string(op) + ": quant " + id_str(id) + " is not locked by txn " + id_str(id_));
    }
}

void Transaction::require_document_lock(DocumentId id, const char* op) const {
    if (!holds_document(id)) {
        throw IntegrityError(std::string(op) + ": document " + id_str(id) + " is not locked by txn " + id_str(id_));
    }
}

void Transaction::lock_document(DocumentId doc) {
    require_active();
    if (holds_document(doc)) {
        return;
    }
    if (tier_ > Tier::Document) {
        throw IntegrityError("document " + id_str(doc) + " locked after quant locks");
    }
    if (!held_docs_.empty() && doc < *held_docs_.rbegin()) {
        throw IntegrityError("document " + id_str(doc) + " locked out of order");
    }
    if (!store_.document_locks_.acquire(id_, doc, lock_deadline())) {
        QL_LOG_WARN(kLogCat, "txn %llu timed out waiting for document %llu",
                    static_cast<unsigned long long>(id_), static_cast<unsigned long long>(doc));
        throw LockTimeoutError("timed out waiting for lock on document " + id_str(doc));
    }
    held_docs_.insert(doc);
    tier_ = Tier::Document;
}

void Transaction::lock_identities(std::vector<QuantKey> keys) {
    require_active();
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());
    for (const auto& key : keys) {
        if (holds_identity(key)) {
            continue;
        }
        if (tier_ > Tier::Identity) {
            throw IntegrityError("quant identity locked after quant row locks");
        }
        if (!held_identities_.empty() && key < *held_identities_.rbegin()) {
            throw IntegrityError("quant identities locked out of order");
        }
        if (!store_.identity_locks_.acquire(id_, key, lock_deadline())) {
            QL_LOG_WARN(kLogCat, "txn %llu timed out waiting for quant identity item=%llu bin=%llu",
                        static_cast<unsigned long long>(id_), static_cast<unsigned long long>(key.item),
                        static_cast<unsigned long long>(key.bin));
            throw LockTimeoutError("timed out waiting for quant identity lock on item " + id_str(key.item));
        }
        held_identities_.insert(key);
        tier_ = Tier::Identity;
    }
}

std::vector<QuantId> Transaction::lock_quants(std::vector<QuantId> ids) {
    require_active();
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    std::vector<std::pair<RowRank, QuantId>> ranked;
    std::vector<QuantId> own;
    ranked.reserve(ids.size());
    for (const QuantId id : ids) {
        if (own_quants_.count(id) != 0) {
            own.push_back(id);
            continue;
        }
        const auto q = store_.committed_quant(id);
        if (!q) {
            continue;
        }
        ranked.emplace_back(RowRank{q->received_at_ns, id}, id);
    }
    std::sort(ranked.begin(), ranked.end());

    std::vector<QuantId> locked;
    locked.reserve(ranked.size() + own.size());
    for (const auto& [rank, id] : ranked) {
        if (held_rows_.count(id) == 0) {
            if (top_row_rank_ && rank <= *top_row_rank_) {
                throw IntegrityError("quant " + id_str(id) + " locked out of canonical row order");
            }
            if (!store_.row_locks_.acquire(id_, id, lock_deadline())) {
                QL_LOG_WARN(kLogCat, "txn %llu timed out waiting for quant %llu",
                            static_cast<unsigned long long>(id_), static_cast<unsigned long long>(id));
                throw LockTimeoutError("timed out waiting for row lock on quant " + id_str(id));
            }
            held_rows_.insert(id);
            top_row_rank_ = rank;
            tier_ = Tier::Row;
            // The previous holder may have removed the row before releasing it.
            if (!store_.committed_quant(id)) {
                store_.row_locks_.release(id_, id);
                held_rows_.erase(id);
                continue;
            }
        }
        auto w = quant_writes_.find(id);
        if (w != quant_writes_.end() && !w->second) {
            continue;
        }
        locked.push_back(id);
    }
    for (const QuantId id : own) {
        auto w = quant_writes_.find(id);
        if (w != quant_writes_.end() && w->second) {
            locked.push_back(id);
        }
    }
    return locked;
}

bool Transaction::lock_quant(QuantId id) {
    return !lock_quants({id}).empty();
}

std::optional<Quant> Transaction::read_quant(QuantId id) const {
    require_active();
    require_quant_lock(id, "read_quant");
    if (auto w = quant_writes_.find(id); w != quant_writes_.end()) {
        return w->second;
    }
    return store_.committed_quant(id);
}

std::optional<QuantId> Transaction::find_quant_id(const QuantKey& key) const {
    require_active();
    if (!holds_identity(key)) {
        throw IntegrityError("find_quant_id: quant identity is not locked by txn " + id_str(id_));
    }
    if (auto n = new_keys_.find(key); n != new_keys_.end()) {
        return n->second;
    }
    const auto id = store_.committed_quant_id(key);
    if (!id) {
        return std::nullopt;
    }
    if (auto w = quant_writes_.find(*id); w != quant_writes_.end() && !w->second) {
        return std::nullopt;
    }
    return id;
}

Quant Transaction::insert_quant(const QuantKey& key, Qty qty, std::uint64_t received_at_ns) {
    require_active();
    if (find_quant_id(key)) {
        throw IntegrityError("quant tuple already exists for item " + id_str(key.item) + " bin " + id_str(key.bin));
    }
    Quant q;
    q.id = store_.next_quant_id_.fetch_add(1, std::memory_order_relaxed);
    q.key = key;
    q.qty = qty;
    q.qty_reserved = 0;
    q.received_at_ns = received_at_ns;
    quant_writes_[q.id] = q;
    new_keys_[key] = q.id;
    own_quants_.insert(q.id);
    return q;
}

void Transaction::update_quant(const Quant& q) {
    const auto cur = read_quant(q.id);
    if (!cur) {
        throw NotFoundError("quant " + id_str(q.id) + " does not exist");
    }
    if (cur->key != q.key || cur->received_at_ns != q.received_at_ns) {
        throw IntegrityError("quant " + id_str(q.id) + ": identity and received_at are immutable");
    }
    quant_writes_[q.id] = q;
}

void Transaction::erase_quant(QuantId id) {
    const auto cur = read_quant(id);
    if (!cur) {
        throw NotFoundError("quant " + id_str(id) + " does not exist");
    }
    if (!reservations_for_quant(id).empty()) {
        throw IntegrityError("quant " + id_str(id) + " is still referenced by a reservation");
    }
    quant_writes_[id] = std::nullopt;
    if (auto n = new_keys_.find(cur->key); n != new_keys_.end() && n->second == id) {
        new_keys_.erase(n);
    }
}

std::optional<Reservation> Transaction::read_reservation(ReservationId id) const {
    require_active();
    if (auto w = reservation_writes_.find(id); w != reservation_writes_.end()) {
        return w->second;
    }
    return store_.committed_reservation(id);
}

std::vector<Reservation> Transaction::reservations_for_line(LineId line) const {
    require_active();
    std::set<ReservationId> ids;
    for (const auto rid : store_.committed_reservation_ids_for_line(line)) {
        ids.insert(rid);
    }
    for (const auto& [rid, r] : reservation_writes_) {
        if (r && r->line == line) {
            ids.insert(rid);
        }
    }
    std::vector<Reservation> out;
    for (const auto rid : ids) {
        if (auto r = read_reservation(rid)) {
            out.push_back(*r);
        }
    }
    return out;
}

std::vector<Reservation> Transaction::reservations_for_quant(QuantId quant) const {
    require_active();
    std::set<ReservationId> ids;
    for (const auto rid : store_.committed_reservation_ids_for_quant(quant)) {
        ids.insert(rid);
    }
    for (const auto& [rid, r] : reservation_writes_) {
        if (r && r->quant == quant) {
            ids.insert(rid);
        }
    }
    std::vector<Reservation> out;
    for (const auto rid : ids) {
        if (auto r = read_reservation(rid)) {
            out.push_back(*r);
        }
    }
    return out;
}

Reservation Transaction::insert_reservation(LineId line, QuantId quant, Qty qty) {
    require_active();
    require_quant_lock(quant, "insert_reservation");
    Reservation r;
    r.id = store_.next_reservation_id_.fetch_add(1, std::memory_order_relaxed);
    r.line = line;
    r.quant = quant;
    r.qty = qty;
    r.qty_picked = 0;
    reservation_writes_[r.id] = r;
    return r;
}

void Transaction::update_reservation(const Reservation& r) {
    const auto cur = read_reservation(r.id);
    if (!cur) {
        throw NotFoundError("reservation " + id_str(r.id) + " does not exist");
    }
    require_quant_lock(cur->quant, "update_reservation");
    if (cur->line != r.line || cur->quant != r.quant) {
        throw IntegrityError("reservation " + id_str(r.id) + ": line and quant are immutable");
    }
    reservation_writes_[r.id] = r;
}

void Transaction::erase_reservation(ReservationId id) {
    const auto cur = read_reservation(id);
    if (!cur) {
        throw NotFoundError("reservation " + id_str(id) + " does not exist");
    }
    require_quant_lock(cur->quant, "erase_reservation");
    reservation_writes_[id] = std::nullopt;
}

std::optional<Document> Transaction::read_document(DocumentId id) const {
    require_active();
    if (auto w = document_writes_.find(id); w != document_writes_.end()) {
        return w->second;
    }
    return store_.committed_document(id);
}

std::optional<DocumentLine> Transaction::read_line(LineId id) const {
    require_active();
    if (auto w = line_writes_.find(id); w != line_writes_.end()) {
        return w->second;
    }
    return store_.committed_line(id);
}

Document Transaction::insert_document(Document doc) {
    require_active();
    if (doc.number.empty()) {
        throw DocumentStateError("document number must not be empty");
    }
    bool taken = store_.committed_number_taken(doc.number);
    for (const auto& [id, d] : document_writes_) {
        taken = taken || d.number == doc.number;
    }
    if (taken) {
        throw DocumentStateError("document number '" + doc.number + "' already exists");
    }
    doc.id = store_.next_document_id_.fetch_add(1, std::memory_order_relaxed);
    own_docs_.insert(doc.id);
    document_writes_[doc.id] = doc;
    return doc;
}

void Transaction::update_document(const Document& doc) {
    require_active();
    require_document_lock(doc.id, "update_document");
    const auto cur = read_document(doc.id);
    if (!cur) {
        throw NotFoundError("document " + id_str(doc.id) + " does not exist");
    }
    if (cur->number != doc.number || cur->owner != doc.owner) {
        throw IntegrityError("document " + id_str(doc.id) + ": number and owner are immutable");
    }
    document_writes_[doc.id] = doc;
}

DocumentLine Transaction::insert_line(DocumentLine line) {
    require_active();
    require_document_lock(line.document, "insert_line");
    line.id = store_.next_line_id_.fetch_add(1, std::memory_order_relaxed);
    line_writes_[line.id] = line;
    return line;
}

void Transaction::update_line(const DocumentLine& line) {
    require_active();
    require_document_lock(line.document, "update_line");
    const auto cur = read_line(line.id);
    if (!cur) {
        throw NotFoundError("document line " + id_str(line.id) + " does not exist");
    }
    if (cur->document != line.document || cur->item != line.item) {
        throw IntegrityError("document line " + id_str(line.id) + ": document and item are immutable");
    }
    line_writes_[line.id] = line;
}

void Transaction::append_movement(Movement m) {
    require_active();
    if (m.created_at_ns == 0) {
        m.created_at_ns = now_ns();
    }
    m.id = no_id;
    movements_.push_back(std::move(m));
}

void Transaction::validate_for_commit() const {
    for (const auto doc_id : own_docs_) {
        const auto& doc = document_writes_.at(doc_id);
        if (store_.committed_number_taken(doc.number)) {
            throw DocumentStateError("document number '" + doc.number + "' already exists");
        }
    }

    for (const auto& [id, q] : quant_writes_) {
        if (!q) {
            continue;
        }
        if (q->qty < 0 || q->qty_reserved < 0 || q->qty_reserved > q->qty) {
            throw IntegrityError("quant " + id_str(id) + " violates 0 <= reserved <= qty");
        }
        if (q->qty == 0) {
            throw IntegrityError("quant " + id_str(id) + " is empty but was not removed");
        }
        if (own_quants_.count(id) != 0) {
            if (const auto existing = store_.committed_quant_id(q->key)) {
                const auto w = quant_writes_.find(*existing);
                if (w == quant_writes_.end() || w->second) {
                    throw IntegrityError("quant tuple for item " + id_str(q->key.item) + " was created concurrently");
                }
            }
        }
        Qty open = 0;
        for (const auto& r : reservations_for_quant(id)) {
            open += r.remaining();
        }
        if (open > q->qty_reserved) {
            throw IntegrityError("quant " + id_str(id) + " has more open reservations than reserved quantity");
        }
    }

    for (const auto& [id, r] : reservation_writes_) {
        if (!r) {
            continue;
        }
        if (r->qty <= 0 || r->qty_picked < 0 || r->qty_picked > r->qty) {
            throw IntegrityError("reservation " + id_str(id) + " violates 0 <= picked <= qty");
        }
        const auto w = quant_writes_.find(r->quant);
        const bool quant_exists = w != quant_writes_.end() ? w->second.has_value()
                                                           : store_.committed_quant(r->quant).has_value();
        if (!quant_exists) {
            throw IntegrityError("reservation " + id_str(id) + " references removed quant " + id_str(r->quant));
        }
    }

    for (const auto& [id, line] : line_writes_) {
        if (line.qty_requested <= 0 || line.qty_allocated < 0 || line.qty_allocated > line.qty_requested ||
            line.qty_picked < 0 || line.qty_picked > line.qty_allocated) {
            throw IntegrityError("document line " + id_str(id) + " violates picked <= allocated <= requested");
        }
    }
}

void Transaction::commit() {
    require_active();
    std::unique_lock<std::mutex> commit_lock(store_.commit_mu_);
    try {
        validate_for_commit();
    } catch (const LedgerError&) {
        commit_lock.unlock();
        rollback();
        throw;
    }

    const MovementId first_id = store_.next_movement_id_;
    for (auto& m : movements_) {
        m.id = store_.next_movement_id_++;
    }
    if (store_.journal_ && !movements_.empty()) {
        const auto res = store_.journal_->append(movements_);
        if (!res.ok) {
            store_.next_movement_id_ = first_id;
            commit_lock.unlock();
            rollback();
            throw StorageError("movement journal append failed", res.error_code);
        }
    }

    store_.publish(*this);
    commit_lock.unlock();

    state_ = State::Committed;
    release_locks();
    store_.commits_.fetch_add(1, std::memory_order_relaxed);
}

void Transaction::rollback() noexcept {
    if (state_ != State::Active) {
        return;
    }
    quant_writes_.clear();
    new_keys_.clear();
    reservation_writes_.clear();
    document_writes_.clear();
    line_writes_.clear();
    movements_.clear();
    own_quants_.clear();
    own_docs_.clear();
    state_ = State::RolledBack;
    release_locks();
    store_.rollbacks_.fetch_add(1, std::memory_order_relaxed);
}

void Transaction::release_locks() noexcept {
    for (const auto id : held_rows_) {
        store_.row_locks_.release(id_, id);
    }
    for (const auto& key : held_identities_) {
        store_.identity_locks_.release(id_, key);
    }
    for (const auto doc : held_docs_) {
        store_.document_locks_.release(id_, doc);
    }
    held_rows_.clear();
    held_identities_.clear();
    held_docs_.clear();
    top_row_rank_.reset();
    tier_ = Tier::None;
}

// ---------------------------------------------------------------------------
// LedgerStore
// ---------------------------------------------------------------------------

LedgerStore::LedgerStore(LedgerConfig cfg, std::unique_ptr<util::SystemClock> clock,
                         std::unique_ptr<persist::IFileSink> journal_sink)
    : cfg_(std::move(cfg)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = std::make_unique<util::SystemClock>();
    }
    if (cfg_.journal.enabled) {
        journal_ = std::make_unique<persist::MovementJournal>(cfg_.journal, std::move(journal_sink));
    }
    QL_LOG_INFO(kLogCat, "ledger store open journal=%s lock_timeout_ms=%lld strategy=%s",
                cfg_.journal.enabled ? cfg_.journal.output_dir.string().c_str() : "off",
                static_cast<long long>(cfg_.lock_timeout.count()), strategy_name(cfg_.default_strategy));
}

LedgerStore::~LedgerStore() {
    if (journal_) {
        journal_->close();
    }
    QL_LOG_INFO(kLogCat, "ledger store closed commits=%llu rollbacks=%llu",
                static_cast<unsigned long long>(commits_.load()), static_cast<unsigned long long>(rollbacks_.load()));
}

Transaction LedgerStore::begin() {
    return Transaction(*this, next_txn_id_.fetch_add(1, std::memory_order_relaxed));
}

void LedgerStore::register_bin(BinId bin, WarehouseId warehouse, std::string location_code) {
    if (bin == no_id || warehouse == no_id) {
        throw IntegrityError("bin and warehouse ids must be non-zero");
    }
    std::lock_guard<std::mutex> commit_lock(commit_mu_);
    std::unique_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = bins_.find(bin); it != bins_.end()) {
        if (it->second.warehouse == warehouse && it->second.location_code == location_code) {
            return;
        }
        throw IntegrityError("bin " + id_str(bin) + " is already registered differently");
    }
    bins_.emplace(bin, Bin{bin, warehouse, std::move(location_code)});
}

void LedgerStore::register_lot(LotId lot, ItemId item, std::string lot_code,
                               std::optional<std::chrono::sys_days> expiry) {
    if (lot == no_lot) {
        throw IntegrityError("lot id must be non-zero");
    }
    std::lock_guard<std::mutex> commit_lock(commit_mu_);
    std::unique_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = lots_.find(lot); it != lots_.end()) {
        if (it->second.item == item && it->second.lot_code == lot_code && it->second.expiry == expiry) {
            return;
        }
        throw IntegrityError("lot " + id_str(lot) + " is already registered differently");
    }
    lots_.emplace(lot, Lot{lot, item, std::move(lot_code), expiry});
}

std::optional<Bin> LedgerStore::find_bin(BinId bin) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = bins_.find(bin); it != bins_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Lot> LedgerStore::find_lot(LotId lot) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = lots_.find(lot); it != lots_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Quant> LedgerStore::committed_quant(QuantId id) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = quants_.find(id); it != quants_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<QuantId> LedgerStore::committed_quant_id(const QuantKey& key) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = quant_index_.find(key); it != quant_index_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<Reservation> LedgerStore::committed_reservation(ReservationId id) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = reservations_.find(id); it != reservations_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<ReservationId> LedgerStore::committed_reservation_ids_for_line(LineId line) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    auto it = reservations_by_line_.find(line);
    if (it == reservations_by_line_.end()) {
        return {};
    }
    return std::vector<ReservationId>(it->second.begin(), it->second.end());
}

std::vector<ReservationId> LedgerStore::committed_reservation_ids_for_quant(QuantId quant) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    auto it = reservations_by_quant_.find(quant);
    if (it == reservations_by_quant_.end()) {
        return {};
    }
    return std::vector<ReservationId>(it->second.begin(), it->second.end());
}

std::optional<Document> LedgerStore::committed_document(DocumentId id) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = documents_.find(id); it != documents_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<DocumentLine> LedgerStore::committed_line(LineId id) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = lines_.find(id); it != lines_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool LedgerStore::committed_number_taken(const std::string& number) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    return document_numbers_.count(number) != 0;
}

void LedgerStore::publish(Transaction& txn) {
    std::unique_lock<std::shared_mutex> lock(data_mu_);

    // Reservations first so an exhausted quant never outlives its index entry.
    for (auto& [id, r] : txn.reservation_writes_) {
        auto it = reservations_.find(id);
        if (r) {
            if (it == reservations_.end()) {
                reservations_by_line_[r->line].insert(id);
                reservations_by_quant_[r->quant].insert(id);
                reservations_.emplace(id, *r);
            } else {
                it->second = *r;
            }
            continue;
        }
        if (it == reservations_.end()) {
            continue;
        }
        if (auto bl = reservations_by_line_.find(it->second.line); bl != reservations_by_line_.end()) {
            bl->second.erase(id);
            if (bl->second.empty()) {
                reservations_by_line_.erase(bl);
            }
        }
        if (auto bq = reservations_by_quant_.find(it->second.quant); bq != reservations_by_quant_.end()) {
            bq->second.erase(id);
            if (bq->second.empty()) {
                reservations_by_quant_.erase(bq);
            }
        }
        reservations_.erase(it);
    }

    for (auto& [id, q] : txn.quant_writes_) {
        auto it = quants_.find(id);
        if (q) {
            if (it == quants_.end()) {
                quant_index_[q->key] = id;
                quants_.emplace(id, *q);
            } else {
                it->second = *q;
            }
            continue;
        }
        if (it != quants_.end()) {
            quant_index_.erase(it->second.key);
            quants_.erase(it);
        }
    }

    for (auto& [id, doc] : txn.document_writes_) {
        if (documents_.find(id) == documents_.end()) {
            document_numbers_.emplace(doc.number, id);
        }
        documents_[id] = doc;
    }
    for (auto& [id, line] : txn.line_writes_) {
        lines_[id] = line;
    }
    for (auto& m : txn.movements_) {
        movements_.push_back(std::move(m));
    }
}

std::optional<QuantView> LedgerStore::quant(QuantId id) const {
    if (auto q = committed_quant(id)) {
        return to_view(*q);
    }
    return std::nullopt;
}

std::optional<QuantView> LedgerStore::quant_by_key(const QuantKey& key) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    auto it = quant_index_.find(key);
    if (it == quant_index_.end()) {
        return std::nullopt;
    }
    return to_view(quants_.at(it->second));
}

std::vector<Quant> LedgerStore::select_quants(ItemId item, const std::function<bool(const Quant&)>& pred) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    QuantKey lo{};
    lo.item = item;
    std::vector<Quant> out;
    for (auto it = quant_index_.lower_bound(lo); it != quant_index_.end() && it->first.item == item; ++it) {
        const Quant& q = quants_.at(it->second);
        if (!pred || pred(q)) {
            out.push_back(q);
        }
    }
    return out;
}

std::vector<Quant> LedgerStore::quants_in_bin(BinId bin) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    std::vector<Quant> out;
    for (const auto& [key, id] : quant_index_) {
        if (key.bin == bin) {
            out.push_back(quants_.at(id));
        }
    }
    return out;
}

std::optional<Reservation> LedgerStore::reservation(ReservationId id) const {
    return committed_reservation(id);
}

std::vector<Reservation> LedgerStore::reservations_for_line(LineId line) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    std::vector<Reservation> out;
    if (auto it = reservations_by_line_.find(line); it != reservations_by_line_.end()) {
        for (const auto rid : it->second) {
            out.push_back(reservations_.at(rid));
        }
    }
    return out;
}

std::vector<Reservation> LedgerStore::reservations_for_document(DocumentId doc) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    std::vector<Reservation> out;
    auto d = documents_.find(doc);
    if (d == documents_.end()) {
        return out;
    }
    for (const auto line : d->second.lines) {
        if (auto it = reservations_by_line_.find(line); it != reservations_by_line_.end()) {
            for (const auto rid : it->second) {
                out.push_back(reservations_.at(rid));
            }
        }
    }
    return out;
}

std::optional<Document> LedgerStore::document(DocumentId id) const {
    return committed_document(id);
}

std::optional<DocumentId> LedgerStore::document_by_number(const std::string& number) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    if (auto it = document_numbers_.find(number); it != document_numbers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<DocumentLine> LedgerStore::line(LineId id) const {
    return committed_line(id);
}

DocumentView LedgerStore::make_view(const Document& doc) const {
    DocumentView view;
    view.id = doc.id;
    view.number = doc.number;
    view.type = doc.type;
    view.warehouse = doc.warehouse;
    view.owner = doc.owner;
    view.status = doc.status;
    for (const auto line_id : doc.lines) {
        const DocumentLine& line = lines_.at(line_id);
        view.lines.push_back(LineView{line.id, line.item, line.qty_requested, line.qty_allocated, line.qty_picked,
                                      line.qty_requested - line.qty_allocated});
        view.total_requested += line.qty_requested;
        view.total_allocated += line.qty_allocated;
        view.total_picked += line.qty_picked;
    }
    return view;
}

std::optional<DocumentView> LedgerStore::document_view(DocumentId id) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    auto it = documents_.find(id);
    if (it == documents_.end()) {
        return std::nullopt;
    }
    return make_view(it->second);
}

std::vector<Movement> LedgerStore::movements(const MovementFilter& filter) const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    std::vector<Movement> out;
    for (auto it = movements_.rbegin(); it != movements_.rend(); ++it) {
        if (filter.item && it->item != *filter.item) continue;
        if (filter.warehouse && it->warehouse != *filter.warehouse) continue;
        if (filter.type && it->type != *filter.type) continue;
        out.push_back(*it);
        if (filter.limit != 0 && out.size() >= filter.limit) {
            break;
        }
    }
    return out;
}

std::vector<std::string> LedgerStore::check_invariants() const {
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    std::vector<std::string> problems;

    for (const auto& [id, q] : quants_) {
        if (q.qty <= 0 || q.qty_reserved < 0 || q.qty_reserved > q.qty) {
            problems.push_back("quant " + id_str(id) + ": qty=" + std::to_string(q.qty) +
                               " reserved=" + std::to_string(q.qty_reserved));
        }
        Qty open = 0;
        if (auto it = reservations_by_quant_.find(id); it != reservations_by_quant_.end()) {
            for (const auto rid : it->second) {
                open += reservations_.at(rid).remaining();
            }
        }
        if (open != q.qty_reserved) {
            problems.push_back("quant " + id_str(id) + ": reserved=" + std::to_string(q.qty_reserved) +
                               " but open reservations hold " + std::to_string(open));
        }
    }

    for (const auto& [id, r] : reservations_) {
        auto q = quants_.find(r.quant);
        if (q == quants_.end()) {
            problems.push_back("reservation " + id_str(id) + " references missing quant " + id_str(r.quant));
            continue;
        }
        auto l = lines_.find(r.line);
        if (l == lines_.end()) {
            problems.push_back("reservation " + id_str(id) + " references missing line " + id_str(r.line));
            continue;
        }
        const auto& doc = documents_.at(l->second.document);
        if (doc.owner != q->second.key.owner) {
            problems.push_back("reservation " + id_str(id) + " crosses owners: document " + id_str(doc.id) +
                               " owner " + id_str(doc.owner) + ", quant owner " + id_str(q->second.key.owner));
        }
    }

    for (const auto& [id, line] : lines_) {
        if (line.qty_allocated > line.qty_requested || line.qty_picked > line.qty_allocated) {
            problems.push_back("line " + id_str(id) + ": requested=" + std::to_string(line.qty_requested) +
                               " allocated=" + std::to_string(line.qty_allocated) +
                               " picked=" + std::to_string(line.qty_picked));
        }
    }
    return problems;
}

LedgerStats LedgerStore::stats() const {
    LedgerStats s;
    s.commits = commits_.load(std::memory_order_relaxed);
    s.rollbacks = rollbacks_.load(std::memory_order_relaxed);
    s.lock_waits = document_locks_.wait_count() + identity_locks_.wait_count() + row_locks_.wait_count();
    s.lock_timeouts = document_locks_.timeout_count() + identity_locks_.timeout_count() + row_locks_.timeout_count();
    std::shared_lock<std::shared_mutex> lock(data_mu_);
    s.movements = movements_.size();
    s.quants = quants_.size();
    s.reservations = reservations_.size();
    s.documents = documents_.size();
    return s;
}

} // namespace core
