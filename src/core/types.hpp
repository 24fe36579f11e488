#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace core {

using ItemId = std::uint64_t;
using BinId = std::uint64_t;
using LotId = std::uint64_t;
using OwnerId = std::uint64_t;
using WarehouseId = std::uint64_t;
using QuantId = std::uint64_t;
using ReservationId = std::uint64_t;
using DocumentId = std::uint64_t;
using LineId = std::uint64_t;
using MovementId = std::uint64_t;
using TxnId = std::uint64_t;
using Qty = std::int64_t;

// True when adding `add` (> 0) to `held` would leave the Qty range.
constexpr bool qty_add_overflows(Qty held, Qty add) noexcept {
    return held > std::numeric_limits<Qty>::max() - add;
}

// Zero is never handed out as a row id; it doubles as "none" in optional references.
inline constexpr std::uint64_t no_id = 0;
inline constexpr LotId no_lot = 0;

enum class StockCategory : std::uint8_t {
    Unrestricted = 0,
    Blocked = 1,
    QualityCheck = 2,
    Consignment = 3,
};

inline constexpr std::uint8_t category_bit(StockCategory c) noexcept {
    return static_cast<std::uint8_t>(1u << static_cast<std::uint8_t>(c));
}

inline constexpr std::uint8_t all_categories_mask = 0x0F;
inline constexpr std::uint8_t allocatable_default_mask =
    all_categories_mask & static_cast<std::uint8_t>(~category_bit(StockCategory::Blocked));

inline const char* category_name(StockCategory c) noexcept {
    switch (c) {
    case StockCategory::Unrestricted: return "UNRESTRICTED";
    case StockCategory::Blocked: return "BLOCKED";
    case StockCategory::QualityCheck: return "QUALITY_CHECK";
    case StockCategory::Consignment: return "CONSIGNMENT";
    }
    return "UNKNOWN";
}

inline std::optional<StockCategory> category_from_string(std::string_view s) noexcept {
    if (s == "UNRESTRICTED") return StockCategory::Unrestricted;
    if (s == "BLOCKED") return StockCategory::Blocked;
    if (s == "QUALITY_CHECK") return StockCategory::QualityCheck;
    if (s == "CONSIGNMENT") return StockCategory::Consignment;
    return std::nullopt;
}

enum class MovementType : std::uint8_t {
    Inbound = 1,
    Reserved = 2,
    Outbound = 3,
    Transfer = 4,
    Adjustment = 5,
    Unreserved = 6,
};

inline const char* movement_type_name(MovementType t) noexcept {
    switch (t) {
    case MovementType::Inbound: return "INBOUND";
    case MovementType::Reserved: return "RESERVED";
    case MovementType::Outbound: return "OUTBOUND";
    case MovementType::Transfer: return "TRANSFER";
    case MovementType::Adjustment: return "ADJUSTMENT";
    case MovementType::Unreserved: return "UNRESERVED";
    }
    return "UNKNOWN";
}

inline constexpr bool is_valid_movement_type(std::uint8_t raw) noexcept {
    return raw >= static_cast<std::uint8_t>(MovementType::Inbound) &&
           raw <= static_cast<std::uint8_t>(MovementType::Unreserved);
}

enum class DocType : std::uint8_t {
    Outbound = 100,
    Transfer = 110,
    Inbound = 120,
    Adjustment = 130,
};

enum class DocStatus : std::uint8_t {
    Draft = 10,
    Pending = 20,
    PartiallyAllocated = 30,
    FullyAllocated = 40,
    PartiallyPicked = 50,
    Completed = 70,
    Canceled = 80,
};

inline const char* doc_status_name(DocStatus s) noexcept {
    switch (s) {
    case DocStatus::Draft: return "DRAFT";
    case DocStatus::Pending: return "PENDING";
    case DocStatus::PartiallyAllocated: return "PARTIALLY_ALLOCATED";
    case DocStatus::FullyAllocated: return "FULLY_ALLOCATED";
    case DocStatus::PartiallyPicked: return "PARTIALLY_PICKED";
    case DocStatus::Completed: return "COMPLETED";
    case DocStatus::Canceled: return "CANCELED";
    }
    return "UNKNOWN";
}

// Unique identity of a Quant. Ordering is lexicographic over the fields and is the
// canonical order for identity locks.
struct QuantKey {
    ItemId item{0};
    BinId bin{0};
    LotId lot{no_lot};
    StockCategory category{StockCategory::Unrestricted};
    OwnerId owner{0};

    friend auto operator<=>(const QuantKey&, const QuantKey&) = default;
};

struct Quant {
    QuantId id{no_id};
    QuantKey key{};
    Qty qty{0};
    Qty qty_reserved{0};
    std::uint64_t received_at_ns{0};

    Qty available() const noexcept { return qty - qty_reserved; }
};

struct Bin {
    BinId id{no_id};
    WarehouseId warehouse{no_id};
    std::string location_code;
};

struct Lot {
    LotId id{no_lot};
    ItemId item{0};
    std::string lot_code;
    std::optional<std::chrono::sys_days> expiry;
};

struct Reservation {
    ReservationId id{no_id};
    LineId line{no_id};
    QuantId quant{no_id};
    Qty qty{0};
    Qty qty_picked{0};

    Qty remaining() const noexcept { return qty - qty_picked; }
    bool is_open() const noexcept { return qty_picked < qty; }
};

struct DocumentLine {
    LineId id{no_id};
    DocumentId document{no_id};
    ItemId item{0};
    Qty qty_requested{0};
    // Maintained by the allocation engine in the same transaction as the
    // reservation change; never written from outside the ledger.
    Qty qty_allocated{0};
    Qty qty_picked{0};
};

struct Document {
    DocumentId id{no_id};
    std::string number;
    DocType type{DocType::Outbound};
    WarehouseId warehouse{no_id};
    OwnerId owner{0};
    DocStatus status{DocStatus::Draft};
    std::vector<LineId> lines;
};

struct Movement {
    MovementId id{no_id};
    MovementType type{MovementType::Inbound};
    ItemId item{0};
    QuantId from_quant{no_id};
    QuantId to_quant{no_id};
    Qty qty{0};
    WarehouseId warehouse{no_id};
    std::uint64_t created_at_ns{0};
    std::string reference;
    std::string actor;
};

// Read-side snapshots handed to callers; availability is derived, never stored.
struct QuantView {
    QuantId id{no_id};
    QuantKey key{};
    Qty qty{0};
    Qty qty_reserved{0};
    Qty qty_available{0};
    std::uint64_t received_at_ns{0};
};

inline QuantView to_view(const Quant& q) noexcept {
    return QuantView{q.id, q.key, q.qty, q.qty_reserved, q.available(), q.received_at_ns};
}

struct LineView {
    LineId id{no_id};
    ItemId item{0};
    Qty qty_requested{0};
    Qty qty_allocated{0};
    Qty qty_picked{0};
    Qty qty_remaining{0};
};

struct DocumentView {
    DocumentId id{no_id};
    std::string number;
    DocType type{DocType::Outbound};
    WarehouseId warehouse{no_id};
    OwnerId owner{0};
    DocStatus status{DocStatus::Draft};
    Qty total_requested{0};
    Qty total_allocated{0};
    Qty total_picked{0};
    std::vector<LineView> lines;
};

} // namespace core
