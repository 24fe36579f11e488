#include <gtest/gtest.h>

#include <vector>

#include "core/document_status.hpp"

namespace {

using core::DocStatus;

core::DocumentLine line(core::Qty requested, core::Qty allocated, core::Qty picked) {
    core::DocumentLine l;
    l.qty_requested = requested;
    l.qty_allocated = allocated;
    l.qty_picked = picked;
    return l;
}

DocStatus derive(DocStatus current, const std::vector<core::DocumentLine>& lines) {
    return core::derive_document_status(current, lines);
}

TEST(DocumentStatusTest, DerivesFromLineAggregates) {
    EXPECT_EQ(derive(DocStatus::Draft, {}), DocStatus::Draft);
    EXPECT_EQ(derive(DocStatus::Draft, {line(10, 0, 0)}), DocStatus::Pending);
    EXPECT_EQ(derive(DocStatus::Pending, {line(10, 4, 0)}), DocStatus::PartiallyAllocated);
    EXPECT_EQ(derive(DocStatus::Pending, {line(10, 10, 0), line(5, 0, 0)}), DocStatus::PartiallyAllocated);
    EXPECT_EQ(derive(DocStatus::Pending, {line(10, 10, 0), line(5, 5, 0)}), DocStatus::FullyAllocated);
    EXPECT_EQ(derive(DocStatus::FullyAllocated, {line(10, 10, 3), line(5, 5, 0)}), DocStatus::PartiallyPicked);
    EXPECT_EQ(derive(DocStatus::PartiallyPicked, {line(10, 10, 10), line(5, 5, 5)}), DocStatus::Completed);
}

TEST(DocumentStatusTest, TerminalStatusesAreSticky) {
    EXPECT_EQ(derive(DocStatus::Canceled, {line(10, 10, 0)}), DocStatus::Canceled);
    EXPECT_EQ(derive(DocStatus::Completed, {line(10, 0, 0)}), DocStatus::Completed);
    EXPECT_TRUE(core::is_terminal_status(DocStatus::Completed));
    EXPECT_TRUE(core::is_terminal_status(DocStatus::Canceled));
    EXPECT_FALSE(core::is_terminal_status(DocStatus::PartiallyPicked));
}

TEST(DocumentStatusTest, ValidTransitions) {
    EXPECT_TRUE(core::is_valid_transition(DocStatus::Draft, DocStatus::Pending));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::Pending, DocStatus::FullyAllocated));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::FullyAllocated, DocStatus::Pending));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::FullyAllocated, DocStatus::PartiallyAllocated));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::PartiallyAllocated, DocStatus::Completed));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::PartiallyPicked, DocStatus::Completed));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::Pending, DocStatus::Canceled));
    EXPECT_TRUE(core::is_valid_transition(DocStatus::Draft, DocStatus::Canceled));
}

TEST(DocumentStatusTest, InvalidTransitionsRejected) {
    EXPECT_FALSE(core::is_valid_transition(DocStatus::Completed, DocStatus::Pending));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::Canceled, DocStatus::Pending));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::Completed, DocStatus::Canceled));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::Draft, DocStatus::FullyAllocated));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::Pending, DocStatus::PartiallyPicked));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::PartiallyPicked, DocStatus::Pending));
    EXPECT_FALSE(core::is_valid_transition(DocStatus::PartiallyPicked, DocStatus::FullyAllocated));
}

TEST(DocumentStatusTest, LinesAcceptedUntilFirstPick) {
    EXPECT_TRUE(core::accepts_new_lines(DocStatus::Draft));
    EXPECT_TRUE(core::accepts_new_lines(DocStatus::FullyAllocated));
    EXPECT_FALSE(core::accepts_new_lines(DocStatus::PartiallyPicked));
    EXPECT_FALSE(core::accepts_new_lines(DocStatus::Completed));
    EXPECT_FALSE(core::accepts_new_lines(DocStatus::Canceled));
}

} // namespace
