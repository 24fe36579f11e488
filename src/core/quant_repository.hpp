#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "core/allocation_strategy.hpp"
#include "core/ledger_store.hpp"
#include "core/types.hpp"

namespace core {

struct ReceiveRequest {
    ItemId item{0};
    BinId bin{no_id};
    LotId lot{no_lot};
    StockCategory category{StockCategory::Unrestricted};
    OwnerId owner{0};
    Qty qty{0};
    std::string actor;
    std::string reference;
};

// Which quants a caller may draw from. `bin` narrows the scope to one bin;
// otherwise every bin of `warehouse` qualifies.
struct CandidateFilter {
    ItemId item{0};
    WarehouseId warehouse{no_id};
    std::optional<BinId> bin{};
    std::uint8_t category_mask{allocatable_default_mask};
    OwnerId owner{0};
};

// Typed access to quant rows on top of the ledger store.
class QuantRepository {
public:
    explicit QuantRepository(LedgerStore& store) : store_(store) {}

    // Find-or-create by unique tuple and increment, in its own transaction.
    // Throws InvalidQuantityError for qty <= 0 and NotFoundError for an
    // unknown bin or lot.
    QuantView receive(const ReceiveRequest& req);

    // Locks every quant matching any of `filters` in canonical row order, then
    // reads them and returns them sorted by `strategy`.
    std::vector<CandidateQuant> locked_candidates(Transaction& txn, std::span<const CandidateFilter> filters,
                                                  AllocationStrategy strategy) const;
    std::vector<CandidateQuant> locked_candidates(Transaction& txn, const CandidateFilter& filter,
                                                  AllocationStrategy strategy) const;

    // Deletes an exhausted quant, first purging the closed reservations that
    // still point at it. The row lock must be held. Throws NonEmptyQuantError
    // when qty != 0.
    void remove(Transaction& txn, QuantId id);
    void remove(QuantId id);

    // Compensating stock correction. Returns the quant after the change, or
    // nothing when it was removed.
    std::optional<QuantView> adjust(QuantId id, Qty delta, const std::string& actor, const std::string& reason);

    WarehouseId warehouse_of(BinId bin) const;

private:
    LedgerStore& store_;
};

} // namespace core
