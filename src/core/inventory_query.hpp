#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/ledger_store.hpp"
#include "core/types.hpp"

namespace core {

struct InventoryRow {
    QuantId quant{no_id};
    BinId bin{no_id};
    std::string location_code;
    WarehouseId warehouse{no_id};
    LotId lot{no_lot};
    std::string lot_code;
    StockCategory category{StockCategory::Unrestricted};
    OwnerId owner{0};
    Qty qty{0};
    Qty reserved{0};
    Qty available{0};
};

struct ItemInventory {
    ItemId item{0};
    Qty total_qty{0};
    Qty total_reserved{0};
    Qty total_available{0};
    std::vector<InventoryRow> rows;
};

struct BinInventory {
    BinId bin{no_id};
    std::string location_code;
    std::size_t slot_count{0};
    std::vector<InventoryRow> rows;
};

// Read-only stock views over committed state.
class InventoryQuery {
public:
    explicit InventoryQuery(const LedgerStore& store) : store_(store) {}

    ItemInventory by_item(ItemId item, std::optional<WarehouseId> warehouse = std::nullopt,
                          std::optional<OwnerId> owner = std::nullopt) const;

    // Throws NotFoundError for an unregistered bin.
    BinInventory by_bin(BinId bin) const;

private:
    InventoryRow make_row(const Quant& q) const;

    const LedgerStore& store_;
};

} // namespace core
