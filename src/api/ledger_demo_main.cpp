#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "core/allocation_engine.hpp"
#include "core/document_service.hpp"
#include "core/errors.hpp"
#include "core/inventory_query.hpp"
#include "core/ledger_config.hpp"
#include "core/ledger_store.hpp"
#include "core/quant_repository.hpp"
#include "util/log.hpp"

namespace {

constexpr const char* kLogCat = "demo";

constexpr core::WarehouseId kWarehouse = 1;
constexpr core::OwnerId kOwner = 7;
constexpr core::ItemId kItem = 1001;
constexpr core::Qty kReceiptQty = 400;

struct WorkerStats {
    std::size_t orders{0};
    core::Qty allocated{0};
    core::Qty picked{0};
    std::size_t canceled{0};
    std::size_t lock_timeouts{0};
};

// Each worker places small orders against the shared quants, picks half of them
// and cancels the rest, racing every other worker for the same rows.
void order_worker(int worker, int orders, core::DocumentService& docs, WorkerStats& stats) {
    const std::string actor = "worker-" + std::to_string(worker);
    for (int i = 0; i < orders; ++i) {
        const std::string number = "SO-" + std::to_string(worker) + "-" + std::to_string(i);
        try {
            const auto doc = docs.create_document(number, core::DocType::Outbound, kWarehouse, kOwner, actor);
            docs.add_line(doc.id, kItem, 5 + (i % 4) * 5);
            const auto report = docs.reserve_document(doc.id, actor);
            ++stats.orders;
            stats.allocated += report.allocated_this_call;

            if (i % 2 == 0) {
                for (const auto& bin : docs.picking_list(doc.id)) {
                    for (const auto& entry : bin.entries) {
                        if (docs.pick(entry.reservation, entry.remaining, actor)) {
                            stats.picked += entry.remaining;
                        }
                    }
                }
            } else if (docs.cancel_document(doc.id, actor)) {
                ++stats.canceled;
            }
        } catch (const core::LockTimeoutError& e) {
            ++stats.lock_timeouts;
            QL_LOG_WARN(kLogCat, "%s: %s", number.c_str(), e.what());
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    core::LedgerConfig cfg = core::default_ledger_config();
    std::string err;
    if (!core::apply_env_overrides(cfg, err)) {
        std::cerr << "Invalid configuration: " << err << std::endl;
        return 1;
    }
    util::set_log_level(cfg.log_level);

    const int workers = argc > 1 ? std::atoi(argv[1]) : 4;
    const int orders = argc > 2 ? std::atoi(argv[2]) : 25;
    if (workers <= 0 || orders <= 0) {
        std::cerr << "Usage: " << argv[0] << " [workers] [orders_per_worker]" << std::endl;
        return 1;
    }

    core::LedgerStore store(cfg);
    core::QuantRepository quants(store);
    core::AllocationEngine engine(store, quants);
    core::DocumentService docs(store, quants, engine);
    core::InventoryQuery inventory(store);

    store.register_bin(1, kWarehouse, "A-01-01");
    store.register_bin(2, kWarehouse, "A-01-02");
    store.register_bin(3, kWarehouse, "B-02-01");
    for (core::BinId bin = 1; bin <= 3; ++bin) {
        quants.receive(core::ReceiveRequest{kItem, bin, core::no_lot, core::StockCategory::Unrestricted, kOwner,
                                            kReceiptQty, "receiving", "ASN-" + std::to_string(bin)});
    }
    // Blocked stock must never be allocated.
    quants.receive(core::ReceiveRequest{kItem, 3, core::no_lot, core::StockCategory::Blocked, kOwner, 50,
                                        "receiving", "ASN-QC"});

    QL_LOG_INFO(kLogCat, "running %d workers x %d orders", workers, orders);
    std::vector<WorkerStats> stats(static_cast<std::size_t>(workers));
    std::vector<std::thread> threads;
    const auto start = std::chrono::steady_clock::now();
    for (int w = 0; w < workers; ++w) {
        threads.emplace_back([&, w] { order_worker(w, orders, docs, stats[static_cast<std::size_t>(w)]); });
    }
    for (auto& t : threads) {
        t.join();
    }
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();

    WorkerStats total;
    for (const auto& s : stats) {
        total.orders += s.orders;
        total.allocated += s.allocated;
        total.picked += s.picked;
        total.canceled += s.canceled;
        total.lock_timeouts += s.lock_timeouts;
    }

    const auto inv = inventory.by_item(kItem, kWarehouse, kOwner);
    const auto ledger = store.stats();
    std::cout << "orders=" << total.orders << " allocated=" << total.allocated << " picked=" << total.picked
              << " canceled=" << total.canceled << " lock_timeouts=" << total.lock_timeouts << " elapsed_ms="
              << elapsed_ms << "\n";
    std::cout << "on_hand=" << inv.total_qty << " reserved=" << inv.total_reserved
              << " available=" << inv.total_available << " quants=" << inv.rows.size() << "\n";
    std::cout << "commits=" << ledger.commits << " rollbacks=" << ledger.rollbacks
              << " lock_waits=" << ledger.lock_waits << " movements=" << ledger.movements << "\n";

    const core::Qty expected_on_hand = 3 * kReceiptQty + 50 - total.picked;
    const auto problems = store.check_invariants();
    for (const auto& p : problems) {
        std::cerr << "INVARIANT VIOLATION: " << p << "\n";
    }
    if (inv.total_qty != expected_on_hand) {
        std::cerr << "INVARIANT VIOLATION: on hand " << inv.total_qty << " expected " << expected_on_hand << "\n";
        return 2;
    }
    return problems.empty() ? 0 : 2;
}
