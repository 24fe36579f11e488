#pragma once

#include <string>
#include <vector>

#include "core/allocation_engine.hpp"
#include "core/allocation_strategy.hpp"
#include "core/ledger_store.hpp"
#include "core/quant_repository.hpp"
#include "core/types.hpp"

namespace core {

struct PartialLine {
    LineId line{no_id};
    Qty allocated{0};
    Qty requested{0};
};

// Outcome of reserving a whole document. Lines are classified by their totals
// after the call.
struct ReserveReport {
    std::vector<LineId> fully_allocated;
    std::vector<PartialLine> partially_allocated;
    std::vector<LineId> unallocated;
    Qty allocated_this_call{0};
    DocStatus status{DocStatus::Draft};
};

struct PickingEntry {
    ReservationId reservation{no_id};
    QuantId quant{no_id};
    ItemId item{0};
    LotId lot{no_lot};
    Qty qty{0};
    Qty picked{0};
    Qty remaining{0};
};

struct PickingBin {
    BinId bin{no_id};
    std::string location_code;
    std::vector<PickingEntry> entries;
};

// Document / line lifecycle on top of the allocation engine.
class DocumentService {
public:
    DocumentService(LedgerStore& store, QuantRepository& quants, AllocationEngine& engine)
        : store_(store), quants_(quants), engine_(engine) {}

    // Throws DocumentStateError on a duplicate or empty number.
    DocumentView create_document(const std::string& number, DocType type, WarehouseId warehouse, OwnerId owner,
                                 const std::string& actor);

    // Allowed until the first pick; moves a DRAFT document to PENDING.
    LineView add_line(DocumentId doc, ItemId item, Qty qty_requested);

    // Reserves every line in one transaction.
    ReserveReport reserve_document(DocumentId doc, AllocationStrategy strategy, const std::string& actor);
    ReserveReport reserve_document(DocumentId doc, const std::string& actor);
    Qty reserve_line(LineId line, AllocationStrategy strategy, const std::string& actor);

    bool pick(ReservationId reservation, Qty qty, const std::string& actor);
    bool pick(ReservationId reservation, const std::string& actor);
    Qty unreserve(ReservationId reservation, const std::string& actor);

    // Releases every open reservation and marks the document CANCELED. Returns
    // false, leaving everything untouched, when the document is already terminal
    // or any of its lines has been picked.
    bool cancel_document(DocumentId doc, const std::string& actor);

    // Open reservations grouped by bin location code, ascending.
    std::vector<PickingBin> picking_list(DocumentId doc) const;

    DocumentView view(DocumentId doc) const;

private:
    LedgerStore& store_;
    QuantRepository& quants_;
    AllocationEngine& engine_;
};

} // namespace core
