#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "core/types.hpp"
#include "persist/byte_codec.hpp"
#include "util/crc32c.hpp"

namespace persist {

// On-disk record:
//   [u32 record_type][u32 payload_len][payload][u32 crc32c]
// CRC covers header and payload. All integers little-endian.
//
// Movement payload v1:
//   u16 schema | u8 movement_type | u8 reserved | u64 id | u64 item |
//   u64 from_quant | u64 to_quant | i64 qty | u64 warehouse | u64 created_at_ns |
//   u16 reference_len | reference | u16 actor_len | actor
enum class JournalRecordType : std::uint32_t {
    Reserved = 0,
    Movement = 1,
};

inline constexpr std::uint16_t journal_schema_version_v1 = 1;

inline constexpr std::size_t record_header_size = sizeof(std::uint32_t) * 2;
inline constexpr std::size_t record_trailer_size = sizeof(std::uint32_t);
inline constexpr std::size_t movement_fixed_payload_size = 2 + 1 + 1 + 8 * 7;
inline constexpr std::size_t movement_min_payload_size = movement_fixed_payload_size + 2 + 2;
inline constexpr std::size_t max_text_len = 0xFFFF;
inline constexpr std::size_t max_payload_size = movement_min_payload_size + 2 * max_text_len;

inline constexpr std::size_t framed_size(std::size_t payload_len) noexcept {
    return record_header_size + payload_len + record_trailer_size;
}

enum class DecodeStatus {
    Ok = 0,
    Truncated,
    InvalidType,
    InvalidLength,
    VersionMismatch,
    InvalidCrc,
};

inline const char* decode_status_name(DecodeStatus s) noexcept {
    switch (s) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::Truncated: return "truncated";
    case DecodeStatus::InvalidType: return "invalid_type";
    case DecodeStatus::InvalidLength: return "invalid_length";
    case DecodeStatus::VersionMismatch: return "version_mismatch";
    case DecodeStatus::InvalidCrc: return "invalid_crc";
    }
    return "unknown";
}

inline std::size_t clamp_text(std::string_view s) noexcept {
    return std::min(s.size(), max_text_len);
}

inline std::size_t movement_payload_size(const core::Movement& m) noexcept {
    return movement_min_payload_size + clamp_text(m.reference) + clamp_text(m.actor);
}

inline std::uint32_t record_crc(const std::byte* header, const std::byte* payload, std::size_t payload_len) noexcept {
    std::uint32_t crc = util::Crc32c::initial;
    crc = util::Crc32c::update(crc, header, record_header_size);
    crc = util::Crc32c::update(crc, payload, payload_len);
    return util::Crc32c::finalize(crc);
}

// Appends one framed movement record to out. Text longer than max_text_len is truncated.
inline void encode_movement_record(const core::Movement& m, std::vector<std::byte>& out) {
    const std::size_t payload_len = movement_payload_size(m);
    const std::size_t base_off = out.size();
    out.resize(base_off + framed_size(payload_len));

    std::byte* base = out.data() + base_off;
    store_le(static_cast<std::uint32_t>(JournalRecordType::Movement), base);
    store_le(static_cast<std::uint32_t>(payload_len), base + 4);

    std::byte* p = base + record_header_size;
    store_le(journal_schema_version_v1, p); p += 2;
    p[0] = static_cast<std::byte>(m.type);
    p[1] = std::byte{0};
    p += 2;
    store_le(m.id, p); p += 8;
    store_le(m.item, p); p += 8;
    store_le(m.from_quant, p); p += 8;
    store_le(m.to_quant, p); p += 8;
    store_le(m.qty, p); p += 8;
    store_le(m.warehouse, p); p += 8;
    store_le(m.created_at_ns, p); p += 8;

    for (const std::string_view text : {std::string_view(m.reference), std::string_view(m.actor)}) {
        const auto len = static_cast<std::uint16_t>(clamp_text(text));
        store_le(len, p); p += 2;
        std::transform(text.begin(), text.begin() + len, p, [](char c) { return static_cast<std::byte>(c); });
        p += len;
    }

    const std::uint32_t crc = record_crc(base, base + record_header_size, payload_len);
    store_le(crc, p);
}

inline bool decode_movement_payload(std::span<const std::byte> payload, core::Movement& out) noexcept {
    if (payload.size() < movement_min_payload_size) {
        return false;
    }
    const std::byte* p = payload.data();
    const std::byte* end = p + payload.size();
    out = {};
    p += 2; // schema, checked by the caller
    const auto raw_type = std::to_integer<std::uint8_t>(p[0]);
    if (!core::is_valid_movement_type(raw_type)) {
        return false;
    }
    out.type = static_cast<core::MovementType>(raw_type);
    p += 2;
    out.id = load_le<std::uint64_t>(p); p += 8;
    out.item = load_le<std::uint64_t>(p); p += 8;
    out.from_quant = load_le<std::uint64_t>(p); p += 8;
    out.to_quant = load_le<std::uint64_t>(p); p += 8;
    out.qty = load_le<std::int64_t>(p); p += 8;
    out.warehouse = load_le<std::uint64_t>(p); p += 8;
    out.created_at_ns = load_le<std::uint64_t>(p); p += 8;

    for (std::string* text : {&out.reference, &out.actor}) {
        if (end - p < 2) {
            return false;
        }
        const auto len = load_le<std::uint16_t>(p);
        p += 2;
        if (end - p < static_cast<std::ptrdiff_t>(len)) {
            return false;
        }
        text->assign(reinterpret_cast<const char*>(p), len);
        p += len;
    }
    return p == end;
}

struct DecodedRecord {
    JournalRecordType type{JournalRecordType::Reserved};
    std::uint16_t schema_version{0};
    std::uint32_t payload_len{0};
    std::size_t consumed{0};
    core::Movement movement{};
};

// Decodes the record at the front of data. consumed is set whenever the frame
// length could be read, so callers can skip a corrupt record and continue.
inline DecodeStatus decode_record(std::span<const std::byte> data, DecodedRecord& out) {
    out = {};
    if (data.size() < record_header_size) {
        return DecodeStatus::Truncated;
    }
    const std::byte* header = data.data();
    const auto type_raw = load_le<std::uint32_t>(header);
    const auto payload_len = load_le<std::uint32_t>(header + 4);
    if (payload_len > max_payload_size) {
        return DecodeStatus::InvalidLength;
    }
    const std::size_t total = framed_size(payload_len);
    if (data.size() < total) {
        return DecodeStatus::Truncated;
    }
    out.consumed = total;
    out.payload_len = payload_len;

    const std::byte* payload = header + record_header_size;
    const auto crc_expected = load_le<std::uint32_t>(payload + payload_len);
    if (crc_expected != record_crc(header, payload, payload_len)) {
        return DecodeStatus::InvalidCrc;
    }
    if (type_raw != static_cast<std::uint32_t>(JournalRecordType::Movement)) {
        return DecodeStatus::InvalidType;
    }
    out.type = JournalRecordType::Movement;
    if (payload_len < movement_min_payload_size) {
        return DecodeStatus::InvalidLength;
    }
    out.schema_version = load_le<std::uint16_t>(payload);
    if (out.schema_version != journal_schema_version_v1) {
        return DecodeStatus::VersionMismatch;
    }
    if (!decode_movement_payload(std::span<const std::byte>(payload, payload_len), out.movement)) {
        return DecodeStatus::InvalidLength;
    }
    return DecodeStatus::Ok;
}

inline std::string_view journal_filename_prefix() noexcept { return "movements_"; }

} // namespace persist
