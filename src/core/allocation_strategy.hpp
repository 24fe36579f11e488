#pragma once

#include <chrono>
#include <optional>
#include <string_view>

#include "core/types.hpp"

namespace core {

enum class AllocationStrategy : std::uint8_t {
    Fifo = 0,
    Fefo = 1,
};

inline const char* strategy_name(AllocationStrategy s) noexcept {
    switch (s) {
    case AllocationStrategy::Fifo: return "FIFO";
    case AllocationStrategy::Fefo: return "FEFO";
    }
    return "UNKNOWN";
}

inline std::optional<AllocationStrategy> strategy_from_string(std::string_view s) noexcept {
    if (s == "FIFO" || s == "fifo") return AllocationStrategy::Fifo;
    if (s == "FEFO" || s == "fefo") return AllocationStrategy::Fefo;
    return std::nullopt;
}

// A locked quant plus the lot expiry FEFO needs. expiry is empty for quants
// without a lot or with a lot that has no expiry date.
struct CandidateQuant {
    Quant quant;
    std::optional<std::chrono::sys_days> expiry;
};

// Canonical row-lock order. Every path that locks more than one quant row
// acquires them in this order.
inline bool row_lock_order(const Quant& a, const Quant& b) noexcept {
    if (a.received_at_ns != b.received_at_ns) {
        return a.received_at_ns < b.received_at_ns;
    }
    return a.id < b.id;
}

inline bool fifo_before(const CandidateQuant& a, const CandidateQuant& b) noexcept {
    return row_lock_order(a.quant, b.quant);
}

// Earliest expiry first; quants without an expiry go last.
inline bool fefo_before(const CandidateQuant& a, const CandidateQuant& b) noexcept {
    if (a.expiry.has_value() != b.expiry.has_value()) {
        return a.expiry.has_value();
    }
    if (a.expiry && *a.expiry != *b.expiry) {
        return *a.expiry < *b.expiry;
    }
    return row_lock_order(a.quant, b.quant);
}

using CandidateComparator = bool (*)(const CandidateQuant&, const CandidateQuant&) noexcept;

inline CandidateComparator comparator_for(AllocationStrategy s) noexcept {
    return s == AllocationStrategy::Fefo ? &fefo_before : &fifo_before;
}

} // namespace core
