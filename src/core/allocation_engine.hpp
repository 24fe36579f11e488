#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/allocation_strategy.hpp"
#include "core/ledger_store.hpp"
#include "core/quant_repository.hpp"
#include "core/types.hpp"

namespace core {

// Destination of a transfer. Item, lot and owner always follow the source.
struct TransferSpec {
    BinId bin{no_id};
    std::optional<StockCategory> category{};
};

// Reserve, pick, unreserve and transfer. Each public operation runs in exactly
// one transaction that also refreshes the owning document's status.
class AllocationEngine {
public:
    AllocationEngine(LedgerStore& store, QuantRepository& quants) : store_(store), quants_(quants) {}

    // Returns the quantity allocated by this call; a short or zero result is a
    // normal outcome, not an error.
    Qty reserve(LineId line, AllocationStrategy strategy, const std::string& actor);
    Qty reserve(LineId line, const std::string& actor);

    // Returns false, with no mutation, when qty exceeds the reservation's
    // unpicked remainder or the reservation no longer exists.
    bool pick(ReservationId reservation, Qty qty, const std::string& actor);
    // Picks whatever is still unpicked on the reservation at the time it is
    // locked. Returns false when nothing is left to pick.
    bool pick(ReservationId reservation, const std::string& actor);

    // Returns the quantity released back to availability.
    Qty unreserve(ReservationId reservation, const std::string& actor);

    QuantView transfer(QuantId from, const TransferSpec& to, Qty qty, const std::string& actor);

    // Building blocks for callers that compose several lines into one
    // transaction. All require the document lock and the candidate row locks.
    CandidateFilter filter_for(const Document& doc, const DocumentLine& line) const;
    Qty allocate_line(Transaction& txn, const Document& doc, DocumentLine& line,
                      std::vector<CandidateQuant>& candidates, const std::string& actor);
    Qty release_reservation(Transaction& txn, const Document& doc, ReservationId reservation,
                            const std::string& actor);

private:
    bool pick_locked(ReservationId reservation, std::optional<Qty> qty, const std::string& actor);
    void purge_closed_reservations(DocumentId doc);
    DocumentLine locked_line(Transaction& txn, LineId line) const;
    Document locked_document_for_line(Transaction& txn, LineId line) const;

    LedgerStore& store_;
    QuantRepository& quants_;
};

} // namespace core
