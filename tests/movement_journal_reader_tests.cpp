#include <gtest/gtest.h>

#include <fstream>
#include <vector>

#include "persist/movement_journal_reader.hpp"
#include "test_support.hpp"

namespace {

core::Movement movement(core::MovementId id, core::MovementType type = core::MovementType::Reserved) {
    core::Movement m;
    m.id = id;
    m.type = type;
    m.item = 500;
    m.from_quant = 3;
    m.qty = static_cast<core::Qty>(id * 10);
    m.warehouse = 1;
    m.created_at_ns = id;
    m.reference = "reserve:SO-9";
    m.actor = "alloc";
    return m;
}

void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

TEST(MovementJournalReader, ReadsFilesInNameOrder) {
    const auto dir = testing_support::fresh_temp_dir("reader_order");
    std::vector<std::byte> second;
    persist::encode_movement_record(movement(3), second);
    std::vector<std::byte> first;
    persist::encode_movement_record(movement(1), first);
    persist::encode_movement_record(movement(2), first);
    write_file(dir / "movements_20240101_000001_seq001.bin", second);
    write_file(dir / "movements_20240101_000000_seq000.bin", first);
    write_file(dir / "unrelated.bin", first);

    persist::JournalReaderStats stats;
    const auto all = persist::read_all_movements(dir, &stats);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 1u);
    EXPECT_EQ(all[1].id, 2u);
    EXPECT_EQ(all[2].id, 3u);
    EXPECT_EQ(all[2].qty, 30);
    EXPECT_EQ(stats.files_opened, 2u);
    EXPECT_EQ(stats.records_ok, 3u);
    EXPECT_EQ(stats.bytes_read, first.size() + second.size());
}

TEST(MovementJournalReader, SkipsCorruptRecordAndContinues) {
    const auto dir = testing_support::fresh_temp_dir("reader_corrupt");
    std::vector<std::byte> bytes;
    persist::encode_movement_record(movement(1), bytes);
    const std::size_t second_at = bytes.size();
    persist::encode_movement_record(movement(2), bytes);
    persist::encode_movement_record(movement(3), bytes);
    bytes[second_at + persist::record_header_size + 4] ^= std::byte{0x5A};
    write_file(dir / "movements_20240101_000000_seq000.bin", bytes);

    persist::JournalReaderOptions opts;
    opts.directory = dir;
    persist::MovementJournalReader reader(opts);
    ASSERT_TRUE(reader.open());

    core::Movement m;
    ASSERT_EQ(reader.next(m), persist::JournalReadStatus::Ok);
    EXPECT_EQ(m.id, 1u);
    EXPECT_EQ(reader.next(m), persist::JournalReadStatus::Corrupt);
    ASSERT_EQ(reader.next(m), persist::JournalReadStatus::Ok);
    EXPECT_EQ(m.id, 3u);
    EXPECT_EQ(reader.next(m), persist::JournalReadStatus::EndOfStream);

    EXPECT_EQ(reader.stats().checksum_failures, 1u);
    EXPECT_EQ(reader.stats().records_corrupt, 1u);
    EXPECT_EQ(reader.stats().records_ok, 2u);
}

TEST(MovementJournalReader, TruncatedTailEndsFileButNotStream) {
    const auto dir = testing_support::fresh_temp_dir("reader_truncated");
    std::vector<std::byte> torn;
    persist::encode_movement_record(movement(1), torn);
    persist::encode_movement_record(movement(2), torn);
    torn.resize(torn.size() - 5);
    std::vector<std::byte> next;
    persist::encode_movement_record(movement(3), next);
    write_file(dir / "movements_20240101_000000_seq000.bin", torn);
    write_file(dir / "movements_20240101_000000_seq001.bin", next);

    persist::JournalReaderStats stats;
    const auto all = persist::read_all_movements(dir, &stats);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].id, 1u);
    EXPECT_EQ(all[1].id, 3u);
    EXPECT_EQ(stats.truncated_tail, 1u);
}

TEST(MovementJournalReader, UnusableLengthSkipsRestOfFile) {
    const auto dir = testing_support::fresh_temp_dir("reader_badlen");
    std::vector<std::byte> bytes;
    persist::encode_movement_record(movement(1), bytes);
    const std::size_t second_at = bytes.size();
    persist::encode_movement_record(movement(2), bytes);
    persist::encode_movement_record(movement(3), bytes);
    persist::store_le(static_cast<std::uint32_t>(persist::max_payload_size + 1), bytes.data() + second_at + 4);
    write_file(dir / "movements_20240101_000000_seq000.bin", bytes);

    persist::JournalReaderStats stats;
    const auto all = persist::read_all_movements(dir, &stats);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(stats.bad_length, 1u);
}

TEST(MovementJournalReader, EmptyDirectoryHasNothingToOpen) {
    persist::JournalReaderOptions opts;
    opts.directory = testing_support::fresh_temp_dir("reader_empty");
    persist::MovementJournalReader reader(opts);
    EXPECT_FALSE(reader.open());
    core::Movement m;
    EXPECT_EQ(reader.next(m), persist::JournalReadStatus::EndOfStream);
}

} // namespace
