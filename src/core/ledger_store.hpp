#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/ledger_config.hpp"
#include "core/lock_table.hpp"
#include "core/types.hpp"
#include "persist/file_sink.hpp"
#include "persist/movement_journal.hpp"
#include "util/clock.hpp"

namespace core {

class LedgerStore;

struct MovementFilter {
    std::optional<ItemId> item{};
    std::optional<WarehouseId> warehouse{};
    std::optional<MovementType> type{};
    std::size_t limit{0}; // 0 = unlimited
};

struct LedgerStats {
    std::uint64_t commits{0};
    std::uint64_t rollbacks{0};
    std::uint64_t lock_waits{0};
    std::uint64_t lock_timeouts{0};
    std::uint64_t movements{0};
    std::size_t quants{0};
    std::size_t reservations{0};
    std::size_t documents{0};
};

// One atomic unit of work against the ledger. Writes go to a private overlay
// and become visible to other transactions only when commit() publishes them.
// Destroying an uncommitted transaction rolls it back.
//
// Lock discipline, enforced here rather than trusted to callers:
//   document (ascending id) -> quant identity (ascending tuple) -> quant row
//   (ascending received_at, then id).
// Asking for a lock that sorts before one already held in the same or a later
// tier is an IntegrityError. Quant rows, reservation mutations and line/document
// mutations all require the matching lock.
class Transaction {
public:
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;
    Transaction(Transaction&&) = delete;
    Transaction& operator=(Transaction&&) = delete;

    TxnId id() const noexcept { return id_; }
    bool active() const noexcept { return state_ == State::Active; }
    LedgerStore& store() noexcept { return store_; }
    const LedgerStore& store() const noexcept { return store_; }
    std::uint64_t now_ns() const noexcept;

    // Locking. Each throws LockTimeoutError when a wait exceeds the configured
    // lock timeout; the caller's transaction must then be abandoned.
    void lock_document(DocumentId doc);
    void lock_identities(std::vector<QuantKey> keys);
    // Locks the given rows in canonical order. Rows that no longer exist are
    // skipped; the returned ids are the rows now held, in lock order.
    std::vector<QuantId> lock_quants(std::vector<QuantId> ids);
    bool lock_quant(QuantId id);

    bool holds_document(DocumentId doc) const noexcept;
    bool holds_identity(const QuantKey& key) const noexcept;
    bool holds_quant(QuantId id) const noexcept;

    // Quants
    std::optional<Quant> read_quant(QuantId id) const;
    std::optional<QuantId> find_quant_id(const QuantKey& key) const;
    Quant insert_quant(const QuantKey& key, Qty qty, std::uint64_t received_at_ns);
    void update_quant(const Quant& q);
    void erase_quant(QuantId id);

    // Reservations. Reads need no lock but must be repeated after locking the
    // reservation's quant before acting on them.
    std::optional<Reservation> read_reservation(ReservationId id) const;
    std::vector<Reservation> reservations_for_line(LineId line) const;
    std::vector<Reservation> reservations_for_quant(QuantId quant) const;
    Reservation insert_reservation(LineId line, QuantId quant, Qty qty);
    void update_reservation(const Reservation& r);
    void erase_reservation(ReservationId id);

    // Documents and lines
    std::optional<Document> read_document(DocumentId id) const;
    std::optional<DocumentLine> read_line(LineId id) const;
    Document insert_document(Document doc);
    void update_document(const Document& doc);
    DocumentLine insert_line(DocumentLine line);
    void update_line(const DocumentLine& line);

    // Movement ids are assigned at commit; created_at is stamped now.
    void append_movement(Movement m);
    const std::vector<Movement>& pending_movements() const noexcept { return movements_; }

    // Appends the movements to the journal, publishes every write and releases
    // all locks. Throws IntegrityError/DocumentStateError on a violated store
    // constraint and StorageError on a journal failure; in each case the
    // transaction is rolled back first.
    void commit();
    void rollback() noexcept;

private:
    friend class LedgerStore;

    enum class State { Active, Committed, RolledBack };
    enum class Tier { None = 0, Document = 1, Identity = 2, Row = 3 };
    using RowRank = std::pair<std::uint64_t, QuantId>;

    Transaction(LedgerStore& store, TxnId id);

    void require_active() const;
    void require_quant_lock(QuantId id, const char* op) const;
    void require_document_lock(DocumentId id, const char* op) const;
    std::chrono::steady_clock::time_point lock_deadline() const;
    void validate_for_commit() const;
    void release_locks() noexcept;

    LedgerStore& store_;
    TxnId id_;
    State state_{State::Active};
    Tier tier_{Tier::None};

    std::set<DocumentId> held_docs_;
    std::set<QuantKey> held_identities_;
    std::set<QuantId> held_rows_;
    std::optional<RowRank> top_row_rank_;

    // Rows created by this transaction; invisible to others until commit.
    std::set<QuantId> own_quants_;
    std::set<DocumentId> own_docs_;

    std::map<QuantId, std::optional<Quant>> quant_writes_;
    std::map<QuantKey, QuantId> new_keys_;
    std::map<ReservationId, std::optional<Reservation>> reservation_writes_;
    std::map<DocumentId, Document> document_writes_;
    std::map<LineId, DocumentLine> line_writes_;
    std::vector<Movement> movements_;
};

// In-process ledger: committed tables, their secondary indexes, the three lock
// tables and the optional movement journal. Snapshot accessors return copies of
// committed state and never block on row locks.
class LedgerStore {
public:
    explicit LedgerStore(LedgerConfig cfg = default_ledger_config(),
                         std::unique_ptr<util::SystemClock> clock = nullptr,
                         std::unique_ptr<persist::IFileSink> journal_sink = nullptr);
    ~LedgerStore();

    LedgerStore(const LedgerStore&) = delete;
    LedgerStore& operator=(const LedgerStore&) = delete;

    Transaction begin();

    const LedgerConfig& config() const noexcept { return cfg_; }
    const util::SystemClock& clock() const noexcept { return *clock_; }

    // Master data. Registration is idempotent only for identical rows; a
    // conflicting re-registration is an IntegrityError.
    void register_bin(BinId bin, WarehouseId warehouse, std::string location_code);
    void register_lot(LotId lot, ItemId item, std::string lot_code,
                      std::optional<std::chrono::sys_days> expiry = std::nullopt);
    std::optional<Bin> find_bin(BinId bin) const;
    std::optional<Lot> find_lot(LotId lot) const;

    // Snapshots of committed state.
    std::optional<QuantView> quant(QuantId id) const;
    std::optional<QuantView> quant_by_key(const QuantKey& key) const;
    std::vector<Quant> select_quants(ItemId item, const std::function<bool(const Quant&)>& pred) const;
    std::vector<Quant> quants_in_bin(BinId bin) const;
    std::optional<Reservation> reservation(ReservationId id) const;
    std::vector<Reservation> reservations_for_line(LineId line) const;
    std::vector<Reservation> reservations_for_document(DocumentId doc) const;
    std::optional<Document> document(DocumentId id) const;
    std::optional<DocumentId> document_by_number(const std::string& number) const;
    std::optional<DocumentLine> line(LineId id) const;
    std::optional<DocumentView> document_view(DocumentId id) const;
    std::vector<Movement> movements(const MovementFilter& filter = {}) const;

    // Cross-table consistency check over committed state; one message per
    // violation, empty when the ledger is consistent.
    std::vector<std::string> check_invariants() const;

    LedgerStats stats() const;
    const persist::MovementJournal* journal() const noexcept { return journal_.get(); }

private:
    friend class Transaction;

    using Clock = std::chrono::steady_clock;

    std::optional<Quant> committed_quant(QuantId id) const;
    std::optional<Reservation> committed_reservation(ReservationId id) const;
    std::vector<ReservationId> committed_reservation_ids_for_line(LineId line) const;
    std::vector<ReservationId> committed_reservation_ids_for_quant(QuantId quant) const;
    std::optional<Document> committed_document(DocumentId id) const;
    std::optional<DocumentLine> committed_line(LineId id) const;
    std::optional<QuantId> committed_quant_id(const QuantKey& key) const;
    bool committed_number_taken(const std::string& number) const;

    void publish(Transaction& txn);
    DocumentView make_view(const Document& doc) const;

    LedgerConfig cfg_;
    std::unique_ptr<util::SystemClock> clock_;
    std::unique_ptr<persist::MovementJournal> journal_;

    LockTable<DocumentId> document_locks_;
    LockTable<QuantKey> identity_locks_;
    LockTable<QuantId> row_locks_;

    // Serialises journal append + publish so movement ids follow commit order.
    std::mutex commit_mu_;
    // Readers take it shared; publish takes it exclusive.
    mutable std::shared_mutex data_mu_;

    std::unordered_map<BinId, Bin> bins_;
    std::unordered_map<LotId, Lot> lots_;
    std::unordered_map<QuantId, Quant> quants_;
    std::map<QuantKey, QuantId> quant_index_;
    std::unordered_map<ReservationId, Reservation> reservations_;
    std::unordered_map<LineId, std::set<ReservationId>> reservations_by_line_;
    std::unordered_map<QuantId, std::set<ReservationId>> reservations_by_quant_;
    std::unordered_map<DocumentId, Document> documents_;
    std::unordered_map<std::string, DocumentId> document_numbers_;
    std::unordered_map<LineId, DocumentLine> lines_;
    std::vector<Movement> movements_;

    std::atomic<TxnId> next_txn_id_{1};
    std::atomic<QuantId> next_quant_id_{1};
    std::atomic<ReservationId> next_reservation_id_{1};
    std::atomic<DocumentId> next_document_id_{1};
    std::atomic<LineId> next_line_id_{1};
    MovementId next_movement_id_{1};

    std::atomic<std::uint64_t> commits_{0};
    std::atomic<std::uint64_t> rollbacks_{0};
};

} // namespace core
