#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "core/inventory_query.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

class InventoryQueryTest : public LedgerFixture {};

TEST_F(InventoryQueryTest, ItemTotalsAcrossBinsAndFilters) {
    store_->register_lot(5, kItem, "LOT-5");
    receive(kBin1, 40);
    receive(kBin2, 10, kOwnerA, kItem, 5);
    receive(kRemoteBin, 7);
    receive(kBin1, 3, kOwnerB);
    receive(kBin3, 99, kOwnerA, kOtherItem);
    const auto lines = make_order("SO-INV", {{kItem, 15}}).second;
    ASSERT_EQ(engine_->reserve(lines[0], "alloc"), 15);

    core::InventoryQuery query(*store_);
    const auto all = query.by_item(kItem);
    EXPECT_EQ(all.rows.size(), 4u);
    EXPECT_EQ(all.total_qty, 60);
    EXPECT_EQ(all.total_reserved, 15);
    EXPECT_EQ(all.total_available, 45);

    const auto local = query.by_item(kItem, kWarehouse, kOwnerA);
    ASSERT_EQ(local.rows.size(), 2u);
    EXPECT_EQ(local.total_qty, 50);
    EXPECT_EQ(local.total_available, 35);
    for (const auto& row : local.rows) {
        EXPECT_EQ(row.warehouse, kWarehouse);
        EXPECT_EQ(row.owner, kOwnerA);
        if (row.lot == 5) {
            EXPECT_EQ(row.lot_code, "LOT-5");
            EXPECT_EQ(row.location_code, "A-02");
        }
    }

    EXPECT_TRUE(query.by_item(12345).rows.empty());
}

TEST_F(InventoryQueryTest, BinContentsSortedByQuant) {
    const auto a = receive(kBin1, 5);
    const auto b = receive(kBin1, 6, kOwnerB);
    const auto c = receive(kBin1, 7, kOwnerA, kOtherItem, core::no_lot, core::StockCategory::Blocked);
    receive(kBin2, 8);

    core::InventoryQuery query(*store_);
    const auto inv = query.by_bin(kBin1);
    EXPECT_EQ(inv.location_code, "A-01");
    EXPECT_EQ(inv.slot_count, 3u);
    ASSERT_EQ(inv.rows.size(), 3u);
    EXPECT_EQ(inv.rows[0].quant, a.id);
    EXPECT_EQ(inv.rows[1].quant, b.id);
    EXPECT_EQ(inv.rows[2].quant, c.id);
    EXPECT_EQ(inv.rows[2].category, core::StockCategory::Blocked);

    EXPECT_EQ(query.by_bin(kRemoteBin).slot_count, 0u);
    EXPECT_THROW(query.by_bin(404), core::NotFoundError);
}

} // namespace
