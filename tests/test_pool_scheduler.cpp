#include <gtest/gtest.h>
#include <managers/assignment.hpp>
#include <managers/pool_scheduler.hpp>
#include <algorithm>
#include <filesystem>
#include "fake_connector.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class PoolSchedulerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    FakeConnector connector;
    std::unique_ptr<EntityStore> store;
    std::unique_ptr<TunnelManager> tunnels;
    std::unique_ptr<PoolScheduler> scheduler;
    Config config;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sockspool_scheduler_test";
        fs::remove_all(test_dir);
        build("");
    }

    void TearDown() override {
        scheduler.reset();
        tunnels.reset();
        store.reset();
        fs::remove_all(test_dir);
    }

    void build(const std::string& extra_yaml) {
        scheduler.reset();
        tunnels.reset();

        auto parsed = Config::parse(
            "ssh:\n  tasks_count: 1\n  ports: \"22\"\n"
            "port:\n  tasks_count: 1\n  numbers: \"6000-6001\"\n  reset_interval: 3600\n"
            "scheduler:\n  idle_sleep_ms: 10\n  flush_interval: 1\n"
            "store:\n  path: " + (test_dir / "store.yaml").string() + "\n" + extra_yaml);
        ASSERT_TRUE(parsed.is_ok()) << parsed.error;
        config = parsed.value;

        if (!store) store = std::make_unique<EntityStore>(config.store_path());
        TunnelOptions opts;
        opts.candidate_ports = config.ssh_ports_or_default();
        tunnels = std::make_unique<TunnelManager>(connector, opts);
        scheduler = std::make_unique<PoolScheduler>(*store, *tunnels, config);
    }

    Port port_numbered(int number) {
        for (const auto& p : store->ports()) {
            if (p.port_number == number) return p;
        }
        ADD_FAILURE() << "no port " << number;
        return Port{};
    }
};

// ── Credential step ─────────────────────────────────────────

TEST_F(PoolSchedulerTest, CredentialStepRecordsLiveness) {
    auto up = store->add_credential(make_credential("10.0.0.1", false));
    auto down = store->add_credential(make_credential("10.0.0.2", true));
    connector.dead_hosts = {"10.0.0.2"};

    EXPECT_TRUE(scheduler->run_credential_step());
    EXPECT_TRUE(scheduler->run_credential_step());

    auto a = store->find_credential(up);
    auto b = store->find_credential(down);
    EXPECT_TRUE(a->is_live);
    EXPECT_FALSE(b->is_live);
    EXPECT_FALSE(a->check.is_checking);
    EXPECT_TRUE(b->check.last_checked.has_value());
    EXPECT_TRUE(tunnels->active_ports().empty());
}

TEST_F(PoolSchedulerTest, CredentialStepIdleWhenNothingEligible) {
    EXPECT_FALSE(scheduler->run_credential_step());
}

TEST_F(PoolSchedulerTest, DeadCredentialReleasesItsPort) {
    store->sync_ports({6000});
    auto cred = store->add_credential(make_credential("10.0.0.1"));
    ASSERT_TRUE(scheduler->run_port_step());
    auto port = port_numbered(6000);
    ASSERT_EQ(port.credential, cred);
    ASSERT_TRUE(tunnels->is_alive(6000));

    connector.dead_hosts = {"10.0.0.1"};
    ASSERT_TRUE(scheduler->run_credential_step());

    port = port_numbered(6000);
    EXPECT_FALSE(port.credential.has_value());
    EXPECT_FALSE(in_history(port, cred));
    EXPECT_FALSE(tunnels->is_alive(6000));
    EXPECT_FALSE(store->find_credential(cred)->is_live);
}

TEST_F(PoolSchedulerTest, UnexpectedCheckFailureStillCompletes) {
    auto a = store->add_credential(make_credential("10.0.0.1"));
    auto b = store->add_credential(make_credential("10.0.0.2"));
    set_last_checked(*store, a, minutes_ago(10));
    set_last_checked(*store, b, minutes_ago(5));
    connector.unservable_hosts = {"10.0.0.1"};

    EXPECT_NO_THROW(scheduler->run_credential_step());
    auto first = store->find_credential(a);
    EXPECT_FALSE(first->check.is_checking);
    EXPECT_FALSE(first->is_live);
    EXPECT_GT(*first->check.last_checked, minutes_ago(1));
    EXPECT_TRUE(connector.links().front()->closed);

    // The rest of the pool keeps rotating through checks
    EXPECT_TRUE(scheduler->run_credential_step());
    auto second = store->find_credential(b);
    EXPECT_FALSE(second->check.is_checking);
    EXPECT_TRUE(second->is_live);
    EXPECT_GT(*second->check.last_checked, minutes_ago(1));
}

TEST_F(PoolSchedulerTest, DeadCredentialLeavesReassignedPortAlone) {
    store->sync_ports({6000});
    auto old_cred = store->add_credential(make_credential("10.0.0.1"));
    ASSERT_TRUE(scheduler->run_port_step());
    auto port = port_numbered(6000);
    ASSERT_EQ(port.credential, old_cred);

    // The port's own worker moved on to another credential meanwhile
    unassign(*store, port.id, false);
    tunnels->teardown_by_port(6000);
    auto new_cred = store->add_credential(make_credential("10.0.0.2"));
    tunnels->establish("10.0.0.2", "root", "secret", 6000);
    ASSERT_TRUE(assign(*store, port.id, new_cred));

    EXPECT_FALSE(unassign(*store, port.id, true, old_cred).has_value());
    EXPECT_FALSE(tunnels->teardown_if(6000, "10.0.0.1", "root"));

    port = port_numbered(6000);
    EXPECT_EQ(port.credential, new_cred);
    EXPECT_TRUE(in_history(port, new_cred));
    EXPECT_TRUE(tunnels->is_alive(6000));
}

// ── Port step ───────────────────────────────────────────────

TEST_F(PoolSchedulerTest, PortStepAssignsAndRecordsIp) {
    store->sync_ports({6000});
    auto cred = store->add_credential(make_credential("10.0.0.1"));

    ASSERT_TRUE(scheduler->run_port_step());

    auto port = port_numbered(6000);
    EXPECT_EQ(port.credential, cred);
    EXPECT_EQ(port.external_ip, "203.0.113.7");
    EXPECT_FALSE(port.check.is_checking);
    EXPECT_TRUE(port.check.last_checked.has_value());
    EXPECT_EQ(store->find_credential(cred)->port, port.id);

    auto links = connector.links();
    ASSERT_EQ(links.size(), 1u);
    EXPECT_EQ(links[0]->local_port, 6000);
    EXPECT_EQ(tunnels->active_ports(), std::vector<int>{6000});
}

TEST_F(PoolSchedulerTest, PortStepWithoutCredentialsStaysEmpty) {
    store->sync_ports({6000});
    store->add_credential(make_credential("10.0.0.1", false));

    ASSERT_TRUE(scheduler->run_port_step());

    auto port = port_numbered(6000);
    EXPECT_TRUE(needs_credential(port));
    EXPECT_TRUE(port.external_ip.empty());
    EXPECT_TRUE(port.check.last_checked.has_value());
    EXPECT_TRUE(connector.attempts().empty());
}

TEST_F(PoolSchedulerTest, FailedTunnelLeavesPortForNextPass) {
    store->sync_ports({6000});
    store->add_credential(make_credential("10.0.0.1"));
    connector.dead_hosts = {"10.0.0.1"};

    ASSERT_TRUE(scheduler->run_port_step());
    EXPECT_TRUE(needs_credential(port_numbered(6000)));
    EXPECT_TRUE(tunnels->active_ports().empty());

    connector.dead_hosts.clear();
    ASSERT_TRUE(scheduler->run_port_step());
    EXPECT_FALSE(needs_credential(port_numbered(6000)));
}

TEST_F(PoolSchedulerTest, LostTunnelIsReplaced) {
    store->sync_ports({6000});
    auto first = store->add_credential(make_credential("10.0.0.1"));
    auto second = store->add_credential(make_credential("10.0.0.2"));
    ASSERT_TRUE(scheduler->run_port_step());
    ASSERT_EQ(port_numbered(6000).credential, first);

    connector.links()[0]->alive = false;
    ASSERT_TRUE(scheduler->run_port_step());

    // first was purged from history, so it is eligible again and wins on id
    auto port = port_numbered(6000);
    EXPECT_EQ(port.credential, first);
    EXPECT_TRUE(is_usable(*store->find_credential(second)));
    EXPECT_TRUE(tunnels->is_alive(6000));
    auto links = connector.links();
    ASSERT_EQ(links.size(), 2u);
    EXPECT_TRUE(links[0]->closed);
    EXPECT_FALSE(links[1]->closed);
}

TEST_F(PoolSchedulerTest, RotationPicksFreshCredential) {
    store->sync_ports({6000});
    auto first = store->add_credential(make_credential("10.0.0.1"));
    auto second = store->add_credential(make_credential("10.0.0.2"));
    ASSERT_TRUE(scheduler->run_port_step());
    auto port = port_numbered(6000);
    ASSERT_EQ(port.credential, first);

    store->transact([&](Transaction& tx) { tx.port(port.id).time_connected = Clock::now() - 2h; });
    ASSERT_TRUE(scheduler->run_port_step());

    port = port_numbered(6000);
    EXPECT_EQ(port.credential, second);
    EXPECT_EQ(port.used_credentials, (std::vector<EntityId>{first, second}));
    EXPECT_TRUE(is_usable(*store->find_credential(first)));
    EXPECT_TRUE(connector.links()[0]->closed);
}

TEST_F(PoolSchedulerTest, RotationDisabledKeepsAssignment) {
    store->sync_ports({6000});
    auto first = store->add_credential(make_credential("10.0.0.1"));
    store->add_credential(make_credential("10.0.0.2"));

    auto parsed = Config::parse("port:\n  auto_reset_ports: false\n");
    ASSERT_TRUE(parsed.is_ok());
    config = parsed.value;
    scheduler = std::make_unique<PoolScheduler>(*store, *tunnels, config);

    ASSERT_TRUE(scheduler->run_port_step());
    auto port = port_numbered(6000);
    store->transact([&](Transaction& tx) { tx.port(port.id).time_connected = Clock::now() - 2h; });
    ASSERT_TRUE(scheduler->run_port_step());

    EXPECT_EQ(port_numbered(6000).credential, first);
}

// ── Lifecycle ───────────────────────────────────────────────

TEST_F(PoolSchedulerTest, StartFillsPortsAndStopSaves) {
    auto cred_a = store->add_credential(make_credential("10.0.0.1"));
    auto cred_b = store->add_credential(make_credential("10.0.0.2"));

    scheduler->start();
    EXPECT_TRUE(scheduler->is_running());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto ports = store->ports();
        bool filled = ports.size() == 2 &&
                      std::all_of(ports.begin(), ports.end(),
                                  [](const Port& p) { return p.credential.has_value(); });
        if (filled) break;
        std::this_thread::sleep_for(20ms);
    }

    scheduler->stop();
    EXPECT_FALSE(scheduler->is_running());
    EXPECT_TRUE(tunnels->active_ports().empty());
    ASSERT_TRUE(fs::exists(config.store_path()));

    EntityStore reloaded(config.store_path());
    reloaded.load();
    auto ports = reloaded.ports();
    ASSERT_EQ(ports.size(), 2u);
    std::vector<EntityId> owners;
    for (const auto& p : ports) {
        ASSERT_TRUE(p.credential.has_value());
        owners.push_back(*p.credential);
    }
    std::sort(owners.begin(), owners.end());
    EXPECT_EQ(owners, (std::vector<EntityId>{cred_a, cred_b}));
}

TEST_F(PoolSchedulerTest, StartResetsLeftoverState) {
    store->sync_ports({6000});
    auto cred = store->add_credential(make_credential("10.0.0.1", false));
    auto port = port_numbered(6000);
    store->transact([&](Transaction& tx) {
        tx.port(port.id).credential = cred;
        tx.port(port.id).check.is_checking = true;
        tx.credential(cred).port = port.id;
    });
    connector.dead_hosts = {"10.0.0.1"};

    scheduler->start();
    scheduler->stop();

    EXPECT_FALSE(port_numbered(6000).credential.has_value());
    EXPECT_FALSE(store->find_credential(cred)->port.has_value());
}
