#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "persist/movement_log_format.hpp"

namespace {

core::Movement sample(core::MovementId id) {
    core::Movement m;
    m.id = id;
    m.type = core::MovementType::Outbound;
    m.item = 500;
    m.from_quant = 11;
    m.to_quant = 0;
    m.qty = 25;
    m.warehouse = 3;
    m.created_at_ns = 1'700'000'000'123'456'789ull;
    m.reference = "pick:SO-1";
    m.actor = "picker-7";
    return m;
}

TEST(MovementLogFormat, EncodeDecodePreservesFields) {
    std::vector<std::byte> buf;
    const auto m = sample(42);
    persist::encode_movement_record(m, buf);
    ASSERT_EQ(buf.size(), persist::framed_size(persist::movement_payload_size(m)));

    persist::DecodedRecord rec;
    ASSERT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::Ok);
    EXPECT_EQ(rec.consumed, buf.size());
    EXPECT_EQ(rec.schema_version, persist::journal_schema_version_v1);
    EXPECT_EQ(rec.movement.id, 42u);
    EXPECT_EQ(rec.movement.type, core::MovementType::Outbound);
    EXPECT_EQ(rec.movement.item, 500u);
    EXPECT_EQ(rec.movement.from_quant, 11u);
    EXPECT_EQ(rec.movement.to_quant, 0u);
    EXPECT_EQ(rec.movement.qty, 25);
    EXPECT_EQ(rec.movement.warehouse, 3u);
    EXPECT_EQ(rec.movement.created_at_ns, m.created_at_ns);
    EXPECT_EQ(rec.movement.reference, "pick:SO-1");
    EXPECT_EQ(rec.movement.actor, "picker-7");
}

TEST(MovementLogFormat, HeaderIsLittleEndian) {
    std::vector<std::byte> buf;
    persist::encode_movement_record(sample(1), buf);
    EXPECT_EQ(std::to_integer<int>(buf[0]), 1); // record type Movement
    EXPECT_EQ(std::to_integer<int>(buf[1]), 0);
    const auto len = persist::load_le<std::uint32_t>(buf.data() + 4);
    EXPECT_EQ(len, persist::movement_payload_size(sample(1)));
}

TEST(MovementLogFormat, ConsecutiveRecordsDecodeInOrder) {
    std::vector<std::byte> buf;
    persist::encode_movement_record(sample(1), buf);
    persist::encode_movement_record(sample(2), buf);

    std::span<const std::byte> rest(buf);
    persist::DecodedRecord rec;
    ASSERT_EQ(persist::decode_record(rest, rec), persist::DecodeStatus::Ok);
    EXPECT_EQ(rec.movement.id, 1u);
    rest = rest.subspan(rec.consumed);
    ASSERT_EQ(persist::decode_record(rest, rec), persist::DecodeStatus::Ok);
    EXPECT_EQ(rec.movement.id, 2u);
    EXPECT_EQ(rec.consumed, rest.size());
}

TEST(MovementLogFormat, FlippedPayloadByteFailsCrc) {
    std::vector<std::byte> buf;
    persist::encode_movement_record(sample(1), buf);
    buf[persist::record_header_size + 10] ^= std::byte{0xFF};

    persist::DecodedRecord rec;
    EXPECT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::InvalidCrc);
    EXPECT_EQ(rec.consumed, buf.size());
}

TEST(MovementLogFormat, ShortBufferIsTruncated) {
    std::vector<std::byte> buf;
    persist::encode_movement_record(sample(1), buf);
    buf.resize(buf.size() - 1);

    persist::DecodedRecord rec;
    EXPECT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::Truncated);
    EXPECT_EQ(rec.consumed, 0u);

    const std::vector<std::byte> tiny(3);
    EXPECT_EQ(persist::decode_record(tiny, rec), persist::DecodeStatus::Truncated);
}

TEST(MovementLogFormat, OversizedLengthIsRejected) {
    std::vector<std::byte> buf(64);
    persist::store_le(static_cast<std::uint32_t>(persist::JournalRecordType::Movement), buf.data());
    persist::store_le(static_cast<std::uint32_t>(persist::max_payload_size + 1), buf.data() + 4);

    persist::DecodedRecord rec;
    EXPECT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::InvalidLength);
    EXPECT_EQ(rec.consumed, 0u);
}

TEST(MovementLogFormat, UnknownSchemaVersionIsReported) {
    std::vector<std::byte> buf;
    persist::encode_movement_record(sample(1), buf);
    const std::size_t payload_len = persist::movement_payload_size(sample(1));
    std::byte* payload = buf.data() + persist::record_header_size;
    persist::store_le(static_cast<std::uint16_t>(99), payload);
    persist::store_le(persist::record_crc(buf.data(), payload, payload_len), payload + payload_len);

    persist::DecodedRecord rec;
    EXPECT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::VersionMismatch);
    EXPECT_EQ(rec.consumed, buf.size());
}

TEST(MovementLogFormat, LongTextIsClamped) {
    auto m = sample(1);
    m.reference.assign(persist::max_text_len + 100, 'r');
    std::vector<std::byte> buf;
    persist::encode_movement_record(m, buf);

    persist::DecodedRecord rec;
    ASSERT_EQ(persist::decode_record(buf, rec), persist::DecodeStatus::Ok);
    EXPECT_EQ(rec.movement.reference.size(), persist::max_text_len);
}

} // namespace
