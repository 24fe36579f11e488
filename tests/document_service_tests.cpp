#include <gtest/gtest.h>

#include "core/document_service.hpp"
#include "core/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace testing_support;

class DocumentServiceTest : public LedgerFixture {};

TEST_F(DocumentServiceTest, CreateAndAddLines) {
    const auto doc = docs_->create_document("SO-100", core::DocType::Outbound, kWarehouse, kOwnerA, "clerk");
    EXPECT_EQ(doc.status, core::DocStatus::Draft);
    EXPECT_TRUE(doc.lines.empty());

    const auto line = docs_->add_line(doc.id, kItem, 12);
    EXPECT_EQ(line.qty_requested, 12);
    EXPECT_EQ(line.qty_remaining, 12);

    const auto view = docs_->view(doc.id);
    EXPECT_EQ(view.status, core::DocStatus::Pending);
    ASSERT_EQ(view.lines.size(), 1u);
    EXPECT_EQ(view.total_requested, 12);

    EXPECT_THROW(docs_->add_line(doc.id, kItem, 0), core::InvalidQuantityError);
    EXPECT_THROW(docs_->add_line(4040, kItem, 1), core::NotFoundError);
    EXPECT_THROW(docs_->view(4040), core::NotFoundError);
}

TEST_F(DocumentServiceTest, ReserveDocumentClassifiesLines) {
    receive(kBin1, 30);
    receive(kBin2, 8, kOwnerA, kOtherItem);
    const auto [doc, lines] = make_order("SO-MULTI", {{kItem, 20}, {kOtherItem, 10}, {777, 5}});

    const auto report = docs_->reserve_document(doc, "alloc");
    EXPECT_EQ(report.allocated_this_call, 28);
    ASSERT_EQ(report.fully_allocated.size(), 1u);
    EXPECT_EQ(report.fully_allocated[0], lines[0]);
    ASSERT_EQ(report.partially_allocated.size(), 1u);
    EXPECT_EQ(report.partially_allocated[0].line, lines[1]);
    EXPECT_EQ(report.partially_allocated[0].allocated, 8);
    EXPECT_EQ(report.partially_allocated[0].requested, 10);
    ASSERT_EQ(report.unallocated.size(), 1u);
    EXPECT_EQ(report.unallocated[0], lines[2]);
    EXPECT_EQ(report.status, core::DocStatus::PartiallyAllocated);
    EXPECT_EQ(docs_->view(doc).status, core::DocStatus::PartiallyAllocated);
}

TEST_F(DocumentServiceTest, TwoLinesOfSameItemShareCandidates) {
    const auto q = receive(kBin1, 25);
    const auto [doc, lines] = make_order("SO-SAME", {{kItem, 15}, {kItem, 15}});

    const auto report = docs_->reserve_document(doc, "alloc");
    EXPECT_EQ(report.allocated_this_call, 25);
    EXPECT_EQ(store_->quant(q.id)->qty_reserved, 25);
    EXPECT_EQ(store_->line(lines[0])->qty_allocated, 15);
    EXPECT_EQ(store_->line(lines[1])->qty_allocated, 10);
    EXPECT_TRUE(store_->check_invariants().empty());
}

TEST_F(DocumentServiceTest, AddLineAfterFullAllocationReopensDocument) {
    receive(kBin1, 10);
    const auto [doc, lines] = make_order("SO-REOPEN", {{kItem, 10}});
    ASSERT_EQ(docs_->reserve_document(doc, "alloc").status, core::DocStatus::FullyAllocated);

    docs_->add_line(doc, kItem, 5);
    EXPECT_EQ(docs_->view(doc).status, core::DocStatus::PartiallyAllocated);
}

TEST_F(DocumentServiceTest, NoLinesAfterFirstPick) {
    receive(kBin1, 10);
    const auto [doc, lines] = make_order("SO-LOCKED", {{kItem, 10}});
    docs_->reserve_document(doc, "alloc");
    const auto r = store_->reservations_for_line(lines[0]).front();
    ASSERT_TRUE(docs_->pick(r.id, 4, "picker"));

    EXPECT_THROW(docs_->add_line(doc, kItem, 1), core::DocumentStateError);
}

TEST_F(DocumentServiceTest, CancelReleasesEveryReservation) {
    const auto q1 = receive(kBin1, 20);
    const auto q2 = receive(kBin2, 20);
    const auto [doc, lines] = make_order("SO-CANCEL", {{kItem, 30}, {kItem, 5}});
    ASSERT_EQ(docs_->reserve_document(doc, "alloc").allocated_this_call, 35);

    EXPECT_TRUE(docs_->cancel_document(doc, "clerk"));
    EXPECT_EQ(docs_->view(doc).status, core::DocStatus::Canceled);
    EXPECT_EQ(store_->quant(q1.id)->qty_reserved, 0);
    EXPECT_EQ(store_->quant(q2.id)->qty_reserved, 0);
    EXPECT_TRUE(store_->reservations_for_document(doc).empty());
    for (const auto id : lines) {
        EXPECT_EQ(store_->line(id)->qty_allocated, 0);
    }
    const auto released = store_->movements({std::nullopt, std::nullopt, core::MovementType::Unreserved, 0});
    EXPECT_EQ(released.size(), 3u);

    // Terminal: a second cancel and any further reservation are refused.
    EXPECT_FALSE(docs_->cancel_document(doc, "clerk"));
    EXPECT_THROW(docs_->reserve_document(doc, "alloc"), core::DocumentStateError);
    EXPECT_THROW(docs_->add_line(doc, kItem, 1), core::DocumentStateError);
    EXPECT_TRUE(store_->check_invariants().empty());
}

TEST_F(DocumentServiceTest, CancelAfterPickIsRefused) {
    const auto q = receive(kBin1, 20);
    const auto [doc, lines] = make_order("SO-NOCANCEL", {{kItem, 20}});
    docs_->reserve_document(doc, "alloc");
    const auto r = store_->reservations_for_line(lines[0]).front();
    ASSERT_TRUE(docs_->pick(r.id, 5, "picker"));

    EXPECT_FALSE(docs_->cancel_document(doc, "clerk"));
    EXPECT_EQ(docs_->view(doc).status, core::DocStatus::PartiallyPicked);
    EXPECT_EQ(store_->quant(q.id)->qty_reserved, 15);
    EXPECT_EQ(store_->reservation(r.id)->remaining(), 15);
}

TEST_F(DocumentServiceTest, PickingListGroupsByLocation) {
    receive(kBin3, 10); // B-01
    receive(kBin1, 10); // A-01
    receive(kBin2, 10, kOwnerA, kOtherItem); // A-02
    const auto [doc, lines] = make_order("SO-LIST", {{kItem, 15}, {kOtherItem, 4}});
    docs_->reserve_document(doc, "alloc");

    const auto list = docs_->picking_list(doc);
    ASSERT_EQ(list.size(), 3u);
    EXPECT_EQ(list[0].location_code, "A-01");
    EXPECT_EQ(list[1].location_code, "A-02");
    EXPECT_EQ(list[2].location_code, "B-01");

    // FIFO took the older B-01 stock in full before A-01.
    ASSERT_EQ(list[2].entries.size(), 1u);
    EXPECT_EQ(list[2].entries[0].qty, 10);
    ASSERT_EQ(list[0].entries.size(), 1u);
    EXPECT_EQ(list[0].entries[0].remaining, 5);
    EXPECT_EQ(list[1].entries[0].item, kOtherItem);

    EXPECT_THROW(docs_->picking_list(4040), core::NotFoundError);
}

TEST_F(DocumentServiceTest, PickingListSkipsClosedReservations) {
    receive(kBin1, 10);
    const auto [doc, lines] = make_order("SO-DONE", {{kItem, 10}});
    docs_->reserve_document(doc, "alloc");
    const auto r = store_->reservations_for_line(lines[0]).front();
    ASSERT_TRUE(docs_->pick(r.id, 10, "picker"));

    EXPECT_TRUE(docs_->picking_list(doc).empty());
    EXPECT_EQ(docs_->view(doc).status, core::DocStatus::Completed);
}

TEST_F(DocumentServiceTest, ReserveLineUsesExplicitStrategy) {
    using std::chrono::days;
    const std::chrono::sys_days base{days(20000)};
    store_->register_lot(3, kItem, "EARLY", base + days(1));
    receive(kBin1, 10);
    const auto lot_quant = receive(kBin2, 10, kOwnerA, kItem, 3);
    const auto lines = make_order("SO-LINE", {{kItem, 5}}).second;

    EXPECT_EQ(docs_->reserve_line(lines[0], core::AllocationStrategy::Fefo, "alloc"), 5);
    EXPECT_EQ(store_->quant(lot_quant.id)->qty_reserved, 5);
    EXPECT_EQ(docs_->unreserve(store_->reservations_for_line(lines[0]).front().id, "alloc"), 5);
}

} // namespace
