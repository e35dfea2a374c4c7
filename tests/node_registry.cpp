#include "node_registry.hpp"
#include "spora/errors.hpp"
#include "spora/log.hpp"
#include "test_support.hpp"

#include <boost/asio/io_context.hpp>
#include <cassert>

using namespace spora;
using namespace std::chrono_literals;

namespace {

std::string add(NodeRegistry& registry, const std::string& region, std::uint64_t capacity = 1000) {
    NodeRegistration registration;
    registration.capacity_bytes = capacity;
    registration.region = region;
    return registry.register_node(registration);
}

} // namespace

int main() {
    log::set_level(log::Level::error);

    boost::asio::io_context io_context;
    Config config;
    EventChannel events(io_context, 64);
    test::ManualClock clock;
    NodeRegistry registry(config, events, clock.function());

    // Registration validates its input.
    {
        NodeRegistration bad;
        bad.region = "eu";
        bool threw = false;
        try {
            registry.register_node(bad);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);

        bad.capacity_bytes = 10;
        bad.region.clear();
        threw = false;
        try {
            registry.register_node(bad);
        } catch (const InvalidInputError&) {
            threw = true;
        }
        assert(threw);
        assert(registry.size() == 0);
    }

    // Pinned identities produce stable ids.
    {
        NodeRegistration pinned;
        pinned.capacity_bytes = 100;
        pinned.region = "ap";
        pinned.pubkey = "ab12";
        const std::string id = registry.register_node(pinned);
        assert(id == node_id_for_pubkey("ab12"));
        assert(registry.get(id)->pubkey == "ab12");
        assert(registry.remove(id));
        assert(!registry.remove(id));
    }

    const std::string a = add(registry, "eu");
    const std::string b = add(registry, "us");
    const std::string c = add(registry, "eu", 50);
    assert(registry.size() == 3);
    assert(registry.get(a)->status == NodeStatus::active);
    assert(registry.get(a)->available_bytes == 1000);

    // Ordering: reliability desc, then id.
    registry.record_success(b);
    registry.record_failure(c);
    auto found = registry.find_nodes();
    assert(found.size() == 3);
    assert(found[0].id == b);
    assert(found[1].id == a);
    assert(found[2].id == c);

    // Reliability stays within [0, 1].
    for (int i = 0; i < 200; ++i) {
        registry.record_success(b);
        registry.record_failure(c);
    }
    assert(registry.get(b)->reliability == 1.0);
    assert(registry.get(c)->reliability == 0.0);

    // Criteria.
    {
        NodeCriteria criteria;
        criteria.region = std::string("eu");
        assert(registry.find_nodes(criteria).size() == 2);
        criteria.min_available_bytes = 100;
        assert(registry.find_nodes(criteria).size() == 1);
        criteria.region.reset();
        criteria.exclude.insert(a);
        const auto rest = registry.find_nodes(criteria);
        assert(rest.size() == 1 && rest[0].id == b);
    }

    // Byte accounting.
    assert(registry.reserve(a, 400));
    assert(registry.get(a)->available_bytes == 600);
    assert(!registry.reserve(a, 601));
    registry.release(a, 1000);
    assert(registry.get(a)->available_bytes == 1000);

    // A full node is not eligible.
    assert(registry.reserve(c, 50));
    assert(!registry.is_eligible(c));
    registry.release(c, 50);
    assert(registry.is_eligible(c));

    // Re-announcing keeps what the registry learned.
    {
        registry.reserve(a, 100);
        const double reliability = registry.get(a)->reliability;
        StorageNode update = *registry.get(a);
        update.capacity_bytes = 2000;
        update.reliability = 0.99;
        update.address = "10.0.0.1:7420";
        registry.announce(update);
        const auto node = *registry.get(a);
        assert(node.reliability == reliability);
        assert(node.available_bytes == 1900);
        assert(node.address == "10.0.0.1:7420");
        registry.release(a, 100);
    }

    // Freshness: a node that has not been heard from is not offered.
    clock.advance(config.freshness_window + 1s);
    assert(registry.find_nodes().empty());
    assert(registry.mark_seen(a));
    assert(registry.find_nodes().size() == 1);
    assert(!registry.mark_seen("node_missing"));

    // Liveness: silent for two heartbeats -> offline, past the dead timeout -> dead.
    test::drain(events);
    // b and c have been silent for longer than the dead timeout.
    assert(registry.sweep() == 2);
    auto seen = test::drain(events);
    assert(test::count_of<NodeDead>(seen) == 2);
    assert(test::count_of<NodeOffline>(seen) == 0);
    assert(registry.get(b)->status == NodeStatus::dead);
    assert(registry.get(a)->status == NodeStatus::active);

    {
        boost::asio::io_context io2;
        EventChannel events2(io2, 64);
        test::ManualClock clock2;
        NodeRegistry fresh(config, events2, clock2.function());
        const std::string x = add(fresh, "eu");
        const std::string y = add(fresh, "us");

        clock2.advance(config.heartbeat_interval * 2 - 1s);
        assert(fresh.sweep() == 0);

        clock2.advance(2s);
        fresh.mark_seen(y);
        assert(fresh.sweep() == 1);
        assert(fresh.get(x)->status == NodeStatus::offline);
        assert(fresh.get(y)->status == NodeStatus::active);
        assert(!fresh.is_eligible(x));
        auto events_seen = test::drain(events2);
        assert(events_seen.size() == 1);
        assert(std::get<NodeOffline>(events_seen[0]).node_id == x);

        // Already offline: no repeated event.
        assert(fresh.sweep() == 0);

        clock2.advance(config.dead_node_timeout);
        fresh.mark_seen(y);
        assert(fresh.sweep() == 1);
        assert(fresh.get(x)->status == NodeStatus::dead);
        events_seen = test::drain(events2);
        assert(events_seen.size() == 1);
        assert(std::get<NodeDead>(events_seen[0]).node_id == x);

        // A heartbeat brings it back.
        assert(fresh.mark_seen(x));
        assert(fresh.get(x)->status == NodeStatus::active);
        assert(fresh.is_eligible(x));

        // Explicit offline signals once.
        assert(fresh.mark_offline(x));
        assert(fresh.mark_offline(x));
        events_seen = test::drain(events2);
        assert(test::count_of<NodeOffline>(events_seen) == 1);
        assert(!fresh.mark_offline("node_missing"));
    }

    return 0;
}
