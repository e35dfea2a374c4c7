#include "cluster.hpp"
#include "loopback_transport.hpp"
#include "payment.hpp"
#include "spora/crypto.hpp"
#include "spora/errors.hpp"
#include "spora/hex.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace spora;
namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kRegions{"eu", "us", "ap", "sa", "af"};

void run(boost::asio::io_context& io_context) {
    io_context.restart();
    io_context.run();
}

bool load_fails(StorageCluster& cluster, const std::string& path) {
    try {
        cluster.load_snapshot(path);
    } catch (const Error&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    log::set_level(log::Level::error);

    boost::asio::io_context io_context;
    const auto key = crypto::random_key();
    const fs::path dir = fs::temp_directory_path() / ("spora_snapshot_" + hex::encode(crypto::random_bytes(6)));
    fs::create_directories(dir);
    const std::string path = (dir / "metadata.snap").string();

    Config config;
    config.chunk_size = 4096;
    config.reference_dir = (dir / "reference").string();
    LoopbackTransport transport(io_context);
    BudgetOracle budget(1e9);

    StorageCluster cluster(io_context, config, transport, budget, key);
    test::add_nodes(cluster.registry(), transport, 20, kRegions);

    const Bytes data = test::pattern_bytes(10000, 17);
    StoreOptions options;
    options.name = "notes.txt";
    options.preference.preferred_regions = {"ap"};
    std::string file_id;
    cluster.service().store(data, options, [&](std::exception_ptr error, StoreResult result) {
        assert(!error);
        file_id = result.file_id;
    });
    run(io_context);
    assert(!file_id.empty());

    StoreOptions custom;
    custom.preference.level = RedundancyLevel::custom;
    custom.preference.custom_copies = 7;
    std::string custom_id;
    cluster.service().store(test::pattern_bytes(100, 2), custom, [&](std::exception_ptr error, StoreResult result) {
        assert(!error);
        custom_id = result.file_id;
    });
    run(io_context);
    assert(!custom_id.empty());

    const std::string failing = cluster.registry().all()[3].id;
    cluster.registry().record_failure(failing);
    cluster.save_snapshot(path);
    assert(cluster.reference_store().size() == 4);

    // A fresh coordinator with the same key picks up where the first left off.
    {
        StorageCluster restored(io_context, config, transport, budget, key);
        restored.load_snapshot(path);

        assert(restored.metadata().file_count() == 2);
        assert(restored.metadata().chunk_count() == cluster.metadata().chunk_count());

        const auto before = *cluster.metadata().file(file_id);
        const auto after = *restored.metadata().file(file_id);
        assert(after.name == "notes.txt");
        assert(after.size == before.size);
        assert(after.chunk_ids == before.chunk_ids);
        assert(to_unix_ms(after.created) == to_unix_ms(before.created));
        assert(after.redundancy.tier.copies == 15);
        assert(after.redundancy.preference.level == RedundancyLevel::standard);
        assert(after.redundancy.preference.preferred_regions == std::vector<std::string>{"ap"});

        const auto seven = *restored.metadata().file(custom_id);
        assert(seven.redundancy.preference.level == RedundancyLevel::custom);
        assert(seven.redundancy.preference.custom_copies == 7u);
        assert(seven.redundancy.tier.copies == 7);
        assert(seven.redundancy.tier.regions == 2);

        for (const auto& chunk_id : before.chunk_ids) {
            const auto a = *cluster.metadata().chunk(chunk_id);
            const auto b = *restored.metadata().chunk(chunk_id);
            assert(a.hash == b.hash);
            assert(a.size == b.size && a.blob_size == b.blob_size && a.index == b.index);
            assert(restored.ledger().current_replicas(chunk_id) == cluster.ledger().current_replicas(chunk_id));
            assert(restored.ledger().required_copies(chunk_id) == 15);
        }

        const auto original_nodes = cluster.registry().all();
        assert(restored.registry().size() == original_nodes.size());
        for (const auto& node : original_nodes) {
            const auto copy = *restored.registry().get(node.id);
            assert(copy.region == node.region);
            assert(copy.address == node.address);
            assert(copy.available_bytes == node.available_bytes);
            assert(copy.reliability == node.reliability);
            assert(copy.status == node.status);
            assert(to_unix_ms(copy.last_seen) == to_unix_ms(node.last_seen));
        }

        // Reference copies come back from disk, so proofs can still be checked.
        assert(restored.reference_store().size() == cluster.reference_store().size());
        for (const auto& chunk_id : before.chunk_ids) {
            assert(*restored.reference_store().get(chunk_id) == *cluster.reference_store().get(chunk_id));
        }
        const std::string chunk_id = before.chunk_ids.front();
        std::string holder;
        for (const auto& id : restored.ledger().current_replicas(chunk_id)) {
            if (id != failing) {
                holder = id;
                break;
            }
        }
        bool proved = false;
        restored.verifier().verify(chunk_id, holder, [&](bool ok) { proved = ok; });
        run(io_context);
        assert(proved);
        assert(restored.verifier().last_status(chunk_id, holder) == ProofStatus::complete);
    }

    // Without a reference directory nothing can be verified, but reads still work.
    {
        Config memory_only = config;
        memory_only.reference_dir.clear();
        StorageCluster restored(io_context, memory_only, transport, budget, key);
        restored.load_snapshot(path);
        assert(restored.reference_store().size() == 0);

        const std::string chunk_id = cluster.metadata().file(file_id)->chunk_ids.front();
        const std::string holder = *restored.ledger().current_replicas(chunk_id).begin();
        bool proved = true;
        restored.verifier().verify(chunk_id, holder, [&](bool ok) { proved = ok; });
        run(io_context);
        assert(!proved);

        bool read = false;
        restored.service().retrieve(file_id, [&](std::exception_ptr error, Bytes bytes) {
            assert(!error);
            assert(bytes == data);
            read = true;
        });
        run(io_context);
        assert(read);
    }

    // JSON description of one file.
    {
        std::stringstream out;
        cluster.metadata().write_file_json(out, file_id, cluster.ledger(), cluster.registry());
        boost::property_tree::ptree root;
        boost::property_tree::read_json(out, root);
        assert(root.get<std::string>("file.id") == file_id);
        assert(root.get<std::uint64_t>("file.size") == data.size());
        assert(root.get_child("file.chunks").size() == 3);

        const auto& chunks = root.get_child("chunks");
        assert(chunks.size() == 3);
        const auto& first = chunks.begin()->second;
        assert(first.get<std::string>("id") == file_id + ".0");
        assert(first.get<std::string>("hash").size() == 64);
        assert(first.get_child("locations").size() == 15);
        assert(root.get_child("nodes").size() >= 15);

        bool threw = false;
        try {
            cluster.metadata().write_file_json(out, "file_unknown", cluster.ledger(), cluster.registry());
        } catch (const NotFoundError&) {
            threw = true;
        }
        assert(threw);
    }

    // Unreadable snapshots are rejected.
    {
        StorageCluster other(io_context, config, transport, budget, key);
        assert(load_fails(other, (dir / "missing.snap").string()));

        const std::string garbage = (dir / "garbage.snap").string();
        {
            std::ofstream out(garbage, std::ios::binary);
            out << "not a snapshot";
        }
        assert(load_fails(other, garbage));
    }

    std::error_code ec;
    fs::remove_all(dir, ec);
    return 0;
}
