#include "cluster.hpp"
#include "loopback_transport.hpp"
#include "payment.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <cassert>
#include <cmath>

using namespace spora;
using namespace std::chrono_literals;

namespace {

const std::vector<std::string> kRegions{"eu", "us", "ap", "sa", "af"};

void run(boost::asio::io_context& io_context) {
    io_context.restart();
    io_context.run();
}

template <typename Predicate>
bool run_until(boost::asio::io_context& io_context, Predicate done, std::chrono::milliseconds limit = 5000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    io_context.restart();
    while (!done()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        if (io_context.stopped()) {
            io_context.restart();
        }
        io_context.run_one_for(10ms);
    }
    return true;
}

// Puts the chunk in the reference store and on the given nodes, and records it.
void place(StorageCluster& cluster, LoopbackTransport& transport, const std::string& chunk_id,
           const Bytes& blob, const std::vector<std::string>& nodes, std::uint32_t required) {
    assert(cluster.reference_store().put(chunk_id, blob));
    for (const auto& id : nodes) {
        assert(transport.store_for(id)->put(chunk_id, blob));
    }
    cluster.ledger().record_placement(chunk_id, nodes, required);
}

std::vector<std::string> slice(const std::vector<std::string>& ids, std::size_t from, std::size_t to) {
    return std::vector<std::string>(ids.begin() + from, ids.begin() + to);
}

} // namespace

int main() {
    log::set_level(log::Level::off);

    boost::asio::io_context io_context;
    const auto key = crypto::random_key();

    Config config;
    config.backoff_base = 20ms;
    config.max_retries = 3;
    config.recovery_timeout = 2s;
    config.base_cost_per_chunk = 1000.0;

    // --- Repairs, coalescing and node failures over 20 nodes ---
    {
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, config, transport, budget, key);
        RecoveryCoordinator& recovery = cluster.recovery();
        const auto ids = test::add_nodes(cluster.registry(), transport, 20, kRegions);

        // 10 of 15: repaired to 15, and concurrent requests share one operation.
        const std::string chunk = "file_r.0";
        const Bytes blob = test::pattern_bytes(4096, 3);
        place(cluster, transport, chunk, blob, slice(ids, 0, 10), 15);

        std::vector<RecoveryOperation> finished;
        auto record = [&](const RecoveryOperation& op) { finished.push_back(op); };
        const std::string first = recovery.start_recovery(RecoveryType::chunk, chunk, record);
        const std::string second = recovery.start_recovery(RecoveryType::chunk, chunk, record);
        assert(first == second);
        assert(first.rfind("rec_", 0) == 0);
        assert(recovery.operations().size() == 1);
        run(io_context);

        assert(finished.size() == 2);
        assert(finished[0].id == first && finished[1].id == first);
        const auto op = *recovery.operation(first);
        assert(op.status == RecoveryStatus::completed);
        assert(op.attempts == 1);
        assert(op.backoff_history.empty());
        assert(op.finished_at.has_value());

        const auto replicas = cluster.ledger().current_replicas(chunk);
        assert(replicas.size() == 15);
        for (const auto& id : replicas) {
            assert(transport.store_for(id)->contains(chunk));
        }
        assert(std::fabs(budget.total_charged(PaymentPurpose::maintenance) - 1000.0) < 1e-9);

        // Running it again finds nothing to do.
        finished.clear();
        const std::string third = recovery.start_recovery(RecoveryType::chunk, chunk, record);
        assert(third != first);
        run(io_context);
        assert(finished.size() == 1 && finished[0].status == RecoveryStatus::completed);
        assert(cluster.ledger().current_replicas(chunk).size() == 15);
        assert(std::fabs(budget.total_charged(PaymentPurpose::maintenance) - 1000.0) < 1e-9);

        // A chunk nobody tracks completes without work.
        finished.clear();
        recovery.start_recovery(RecoveryType::chunk, "file_gone.0", record);
        run(io_context);
        assert(finished.size() == 1);
        assert(finished[0].status == RecoveryStatus::completed);

        // An unreachable node is given up on, marked offline and evacuated.
        const std::string held = "file_r.2";
        place(cluster, transport, held, test::pattern_bytes(2048, 5), slice(ids, 0, 15), 15);
        transport.faults(ids[0]).unreachable = true;

        std::vector<RecoveryExhausted> alerts;
        recovery.set_alert_handler([&](const RecoveryExhausted& alert) { alerts.push_back(alert); });
        finished.clear();
        recovery.start_recovery(RecoveryType::node, ids[0], record);
        run(io_context);

        assert(finished.size() == 1);
        assert(finished[0].status == RecoveryStatus::failed);
        assert(finished[0].attempts == 3);
        assert(alerts.size() == 1);
        assert(alerts[0].type == "node" && alerts[0].target == ids[0] && alerts[0].attempts == 3);
        assert(cluster.registry().get(ids[0])->status == NodeStatus::offline);
        assert(cluster.ledger().chunks_on_node(ids[0]).empty());
        assert(cluster.ledger().current_replicas(held).size() == 14);

        // A reachable node with a failed proof loses that replica, and the chunk is repaired elsewhere.
        transport.faults(ids[1]).corrupt_proofs = true;
        bool proved = true;
        cluster.verifier().verify(held, ids[1], [&](bool ok) { proved = ok; });
        run(io_context);
        assert(!proved);

        finished.clear();
        recovery.start_recovery(RecoveryType::node, ids[1], record);
        run(io_context);
        assert(finished.size() == 1 && finished[0].status == RecoveryStatus::completed);

        const auto repaired = cluster.ledger().current_replicas(held);
        assert(repaired.size() == 15);
        assert(!repaired.count(ids[1]));
        assert(!repaired.count(ids[0]));
        // file_r.0 also lost ids[0] and shares ids[1]; it is repaired in the same pass.
        assert(cluster.ledger().current_replicas(chunk).size() == 15);

        // Events drive recovery once the coordinator is started.
        recovery.start();
        const std::string fresh = "file_r.3";
        place(cluster, transport, fresh, test::pattern_bytes(1024, 8), slice(ids, 2, 14), 15);
        assert(run_until(io_context, [&] { return cluster.ledger().current_replicas(fresh).size() == 15; }));
        recovery.stop();
        run(io_context);
    }

    // --- Backoff and permanent failures over 5 nodes ---
    {
        Config tight = config;
        tight.recovery_timeout = 100ms;
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, tight, transport, budget, key);
        RecoveryCoordinator& recovery = cluster.recovery();
        const auto ids = test::add_nodes(cluster.registry(), transport, 5, kRegions);

        // Wants 15 but only 5 nodes exist: every attempt falls short.
        const std::string chunk = "file_b.0";
        place(cluster, transport, chunk, test::pattern_bytes(512, 1), ids, 15);

        std::vector<RecoveryExhausted> alerts;
        recovery.set_alert_handler([&](const RecoveryExhausted& alert) { alerts.push_back(alert); });
        std::vector<RecoveryOperation> finished;
        auto record = [&](const RecoveryOperation& op) { finished.push_back(op); };

        test::drain(cluster.events());
        const auto started = std::chrono::steady_clock::now();
        recovery.start_recovery(RecoveryType::chunk, chunk, record);
        run(io_context);
        assert(std::chrono::steady_clock::now() - started >= 60ms);

        assert(finished.size() == 1);
        const auto& op = finished[0];
        assert(op.status == RecoveryStatus::failed);
        assert(op.attempts == 3);
        assert(op.backoff_history.size() == 2);
        assert(op.backoff_history[0] == 20ms);
        assert(op.backoff_history[1] == 40ms);
        assert(!op.error.empty());
        assert(alerts.size() == 1 && alerts[0].type == "chunk" && alerts[0].operation_id == op.id);
        assert(test::count_of<RecoveryExhausted>(test::drain(cluster.events())) == 1);
        assert(recovery.running() == 0 && recovery.queued() == 0);

        // Not found is permanent: one attempt, no backoff.
        finished.clear();
        recovery.start_recovery(RecoveryType::node, "node_missing", record);
        run(io_context);
        assert(finished.size() == 1);
        assert(finished[0].status == RecoveryStatus::failed);
        assert(finished[0].attempts == 1);
        assert(finished[0].backoff_history.empty());

        // A system sweep schedules every chunk with a deficit.
        finished.clear();
        recovery.start_recovery(RecoveryType::system, {}, record);
        run(io_context);
        assert(finished.size() == 1 && finished[0].status == RecoveryStatus::completed);
        std::size_t chunk_ops = 0;
        for (const auto& each : recovery.operations()) {
            if (each.type == RecoveryType::chunk && each.target == chunk) {
                ++chunk_ops;
            }
        }
        assert(chunk_ops == 2);

        // Each attempt is bounded by the recovery timeout; late answers are ignored.
        transport.faults(ids[0]).latency = 300ms;
        finished.clear();
        recovery.start_recovery(RecoveryType::node, ids[0], record);
        run(io_context);
        assert(finished.size() == 1);
        assert(finished[0].status == RecoveryStatus::failed);
        assert(finished[0].attempts == 3);
        assert(finished[0].error.find("timed out") != std::string::npos);
        assert(cluster.ledger().chunks_on_node(ids[0]).empty());
    }

    // --- Evicted replicas give their space back and are deleted ---
    {
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, config, transport, budget, key);
        const auto ids = test::add_nodes(cluster.registry(), transport, 20, kRegions);

        std::string file_id;
        cluster.service().store(test::pattern_bytes(1000, 9), StoreOptions{},
            [&](std::exception_ptr error, StoreResult result) {
                assert(!error);
                file_id = result.file_id;
            });
        run(io_context);
        assert(!file_id.empty());

        const std::string chunk = file_id + ".0";
        const std::uint64_t blob_size = cluster.metadata().chunk(chunk)->blob_size;
        const std::string holder = *cluster.ledger().current_replicas(chunk).begin();
        const auto stored = *cluster.registry().get(holder);
        assert(stored.available_bytes == stored.capacity_bytes - blob_size);
        assert(transport.store_for(holder)->contains(chunk));

        // The holder answers pings but not challenges, and refuses any new copy.
        transport.faults(holder).corrupt_proofs = true;
        transport.faults(holder).fail_next_stores = 1000;
        bool proved = true;
        cluster.verifier().verify(chunk, holder, [&](bool ok) { proved = ok; });
        run(io_context);
        assert(!proved);

        const std::size_t deletes = transport.stats().deletes;
        cluster.recovery().start_recovery(RecoveryType::node, holder);
        run(io_context);

        assert(!cluster.ledger().current_replicas(chunk).count(holder));
        assert(!transport.store_for(holder)->contains(chunk));
        assert(transport.stats().deletes == deletes + 1);
        assert(cluster.registry().get(holder)->available_bytes == stored.capacity_bytes);

        // Removing the file afterwards leaves every node with its full capacity.
        bool removed = false;
        cluster.service().remove(file_id, [&](std::exception_ptr error) {
            assert(!error);
            removed = true;
        });
        run(io_context);
        assert(removed);
        for (const auto& node : cluster.registry().all()) {
            assert(node.available_bytes == node.capacity_bytes);
        }
    }

    // --- Evacuating a dead node releases its space without contacting it ---
    {
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, config, transport, budget, key);
        test::add_nodes(cluster.registry(), transport, 20, kRegions);

        std::string file_id;
        cluster.service().store(test::pattern_bytes(3000, 4), StoreOptions{},
            [&](std::exception_ptr error, StoreResult result) {
                assert(!error);
                file_id = result.file_id;
            });
        run(io_context);

        const std::string chunk = file_id + ".0";
        const std::string holder = *cluster.ledger().current_replicas(chunk).begin();
        transport.faults(holder).unreachable = true;

        const std::size_t deletes = transport.stats().deletes;
        cluster.recovery().start_recovery(RecoveryType::node, holder);
        run(io_context);

        assert(cluster.registry().get(holder)->status == NodeStatus::offline);
        assert(cluster.ledger().chunks_on_node(holder).empty());
        const auto node = *cluster.registry().get(holder);
        assert(node.available_bytes == node.capacity_bytes);
        assert(transport.stats().deletes == deletes);
    }

    // --- Finished operations are kept up to the history limit ---
    {
        Config bounded = config;
        bounded.recovery_history_limit = 3;
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, bounded, transport, budget, key);
        RecoveryCoordinator& recovery = cluster.recovery();

        std::vector<std::string> started;
        for (int i = 0; i < 10; ++i) {
            started.push_back(recovery.start_recovery(RecoveryType::chunk, "file_none." + std::to_string(i)));
            run(io_context);
            assert(recovery.operations().size() <= 3);
        }
        assert(recovery.operations().size() == 3);
        assert(!recovery.operation(started[0]).has_value());
        assert(!recovery.operation(started[6]).has_value());
        for (std::size_t i = 7; i < started.size(); ++i) {
            assert(recovery.operation(started[i])->status == RecoveryStatus::completed);
        }

        // An operation still in flight is never pruned.
        NodeRegistration registration;
        registration.capacity_bytes = 1 << 20;
        registration.region = "eu";
        registration.address = "loopback:slow";
        const std::string slow = cluster.registry().register_node(registration);
        transport.attach(slow, 1 << 20);
        transport.faults(slow).latency = 50ms;
        const std::string pending = recovery.start_recovery(RecoveryType::node, slow);
        for (int i = 0; i < 5; ++i) {
            recovery.start_recovery(RecoveryType::chunk, "file_more." + std::to_string(i));
        }
        assert(recovery.operation(pending)->status == RecoveryStatus::in_progress);
        run(io_context);
        assert(recovery.operation(pending)->status == RecoveryStatus::completed);
        assert(recovery.operations().size() == 3);
    }

    // --- Dropped events trigger a full sweep ---
    {
        Config small = config;
        small.event_channel_capacity = 4;
        LoopbackTransport transport(io_context);
        BudgetOracle budget(1e9);
        StorageCluster cluster(io_context, small, transport, budget, key);
        for (int i = 0; i < 6; ++i) {
            cluster.events().push(NodeOffline{"node_" + std::to_string(i)});
        }
        assert(cluster.events().dropped() == 2);

        cluster.recovery().start();
        auto swept = [&] {
            for (const auto& op : cluster.recovery().operations()) {
                if (op.type == RecoveryType::system) {
                    return true;
                }
            }
            return false;
        };
        assert(run_until(io_context, swept));
        cluster.recovery().stop();
        run(io_context);
    }

    return 0;
}
