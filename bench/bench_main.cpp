#include <chrono>
#include <iostream>
#include <string>

#include "core/allocation_engine.hpp"
#include "core/document_service.hpp"
#include "core/ledger_store.hpp"
#include "core/quant_repository.hpp"
#include "util/log.hpp"

int main() {
    util::set_log_level(util::LogLevel::Warn);

    core::LedgerStore store;
    core::QuantRepository quants(store);
    core::AllocationEngine engine(store, quants);
    core::DocumentService docs(store, quants, engine);

    store.register_bin(1, 1, "BENCH-01");
    store.register_bin(2, 1, "BENCH-02");
    constexpr core::ItemId item = 1;
    for (core::BinId bin = 1; bin <= 2; ++bin) {
        quants.receive(core::ReceiveRequest{item, bin, core::no_lot, core::StockCategory::Unrestricted, 1,
                                            1'000'000'000, "bench", "seed"});
    }

    const auto doc = docs.create_document("BENCH-1", core::DocType::Outbound, 1, 1, "bench");
    const auto line = docs.add_line(doc.id, item, 1'000'000);

    constexpr std::size_t iterations = 20000;
    auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        engine.reserve(line.id, core::AllocationStrategy::Fifo, "bench");
        for (const auto& r : store.reservations_for_line(line.id)) {
            engine.unreserve(r.id, "bench");
        }
    }
    auto end = std::chrono::steady_clock::now();
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Reserve/unreserve loop " << iterations << " iterations took " << ns << " ns ("
              << (ns / static_cast<long long>(iterations)) << " ns/iter)\n";

    // Pick one unit per iteration against a fresh small order.
    start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        const auto d = docs.create_document("BENCH-P" + std::to_string(i), core::DocType::Outbound, 1, 1, "bench");
        const auto l = docs.add_line(d.id, item, 1);
        engine.reserve(l.id, core::AllocationStrategy::Fifo, "bench");
        for (const auto& r : store.reservations_for_line(l.id)) {
            engine.pick(r.id, r.remaining(), "bench");
        }
    }
    end = std::chrono::steady_clock::now();
    ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    std::cout << "Order/reserve/pick loop " << iterations << " iterations took " << ns << " ns ("
              << (ns / static_cast<long long>(iterations)) << " ns/iter)\n";

    const auto problems = store.check_invariants();
    return problems.empty() ? 0 : 2;
}
