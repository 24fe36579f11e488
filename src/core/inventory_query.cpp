#include "core/inventory_query.hpp"

#include <algorithm>

#include "core/errors.hpp"

namespace core {

InventoryRow InventoryQuery::make_row(const Quant& q) const {
    InventoryRow row;
    row.quant = q.id;
    row.bin = q.key.bin;
    if (const auto bin = store_.find_bin(q.key.bin)) {
        row.location_code = bin->location_code;
        row.warehouse = bin->warehouse;
    }
    row.lot = q.key.lot;
    if (q.key.lot != no_lot) {
        if (const auto lot = store_.find_lot(q.key.lot)) {
            row.lot_code = lot->lot_code;
        }
    }
    row.category = q.key.category;
    row.owner = q.key.owner;
    row.qty = q.qty;
    row.reserved = q.qty_reserved;
    row.available = q.available();
    return row;
}

ItemInventory InventoryQuery::by_item(ItemId item, std::optional<WarehouseId> warehouse,
                                      std::optional<OwnerId> owner) const {
    ItemInventory inv;
    inv.item = item;
    const auto quants = store_.select_quants(item, [&owner](const Quant& q) {
        return !owner || q.key.owner == *owner;
    });
    for (const auto& q : quants) {
        auto row = make_row(q);
        if (warehouse && row.warehouse != *warehouse) {
            continue;
        }
        inv.total_qty += row.qty;
        inv.total_reserved += row.reserved;
        inv.total_available += row.available;
        inv.rows.push_back(std::move(row));
    }
    return inv;
}

BinInventory InventoryQuery::by_bin(BinId bin_id) const {
    const auto bin = store_.find_bin(bin_id);
    if (!bin) {
        throw NotFoundError("bin " + std::to_string(bin_id) + " is not registered");
    }
    BinInventory inv;
    inv.bin = bin_id;
    inv.location_code = bin->location_code;
    for (const auto& q : store_.quants_in_bin(bin_id)) {
        inv.rows.push_back(make_row(q));
    }
    std::sort(inv.rows.begin(), inv.rows.end(), [](const InventoryRow& a, const InventoryRow& b) {
        return a.quant < b.quant;
    });
    inv.slot_count = inv.rows.size();
    return inv;
}

} // namespace core
