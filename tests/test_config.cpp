#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

// ── parse_port_list ─────────────────────────────────────────

TEST(Config, PortListTakesEveryDigitRun) {
    auto r = parse_port_list("2222, 22");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<int>{2222, 22}));

    r = parse_port_list("2222 22;8022");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<int>{2222, 22, 8022}));
}

TEST(Config, PortListEmpty) {
    auto r = parse_port_list("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

TEST(Config, PortListRejectsOutOfRange) {
    EXPECT_TRUE(parse_port_list("70000").is_err());
    EXPECT_TRUE(parse_port_list("0").is_err());
    EXPECT_TRUE(parse_port_list("22, 1234567").is_err());
}

// ── parse_port_numbers ──────────────────────────────────────

TEST(Config, PortNumbersRangesAndSingles) {
    auto r = parse_port_numbers("10000-10002, 10010");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<int>{10000, 10001, 10002, 10010}));
}

TEST(Config, PortNumbersDropDuplicates) {
    auto r = parse_port_numbers("10001,10000-10002");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (std::vector<int>{10001, 10000, 10002}));
}

TEST(Config, PortNumbersRejectGarbage) {
    EXPECT_TRUE(parse_port_numbers("abc").is_err());
    EXPECT_TRUE(parse_port_numbers("10005-10000").is_err());
    EXPECT_TRUE(parse_port_numbers("1-").is_err());
}

// ── Config::parse ───────────────────────────────────────────

TEST(Config, EmptyDocumentGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.ssh().tasks_count, 20);
    EXPECT_EQ(c.ssh().connection_timeout, 20);
    EXPECT_EQ(c.ssh().login_timeout, 15);
    EXPECT_EQ(c.ssh().candidate_ports, std::vector<int>{22});
    EXPECT_EQ(c.port().tasks_count, 20);
    EXPECT_TRUE(c.port().use_unique_ssh);
    EXPECT_TRUE(c.port().auto_reset_ports);
    EXPECT_EQ(c.port().reset_interval, 60);
    EXPECT_EQ(c.port().numbers.size(), 10u);
    EXPECT_EQ(c.port().numbers.front(), 10000);
    EXPECT_EQ(c.port().bind_address, "0.0.0.0");
    EXPECT_EQ(c.ip_check().host, "api.ipify.org");
    EXPECT_EQ(c.ip_check().port, 80);
    EXPECT_EQ(c.scheduler().idle_sleep_ms, 1000);
    EXPECT_EQ(c.store_path().filename(), fs::path("store.yaml"));
}

TEST(Config, OverridesEverySection) {
    auto r = Config::parse(
        "ssh:\n"
        "  tasks_count: 3\n"
        "  connection_timeout: 5\n"
        "  login_timeout: 4\n"
        "  ports: \"2222, 22\"\n"
        "port:\n"
        "  tasks_count: 2\n"
        "  use_unique_ssh: false\n"
        "  auto_reset_ports: false\n"
        "  reset_interval: 3600\n"
        "  numbers: \"9000-9001\"\n"
        "  bind_address: 127.0.0.1\n"
        "ip_check:\n"
        "  host: ifconfig.me\n"
        "  path: /ip\n"
        "  timeout: 3\n"
        "scheduler:\n"
        "  idle_sleep_ms: 50\n"
        "  flush_interval: 1\n"
        "store:\n"
        "  path: /var/lib/sockspool/store.yaml\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Config& c = r.value;
    EXPECT_EQ(c.ssh().tasks_count, 3);
    EXPECT_EQ(c.ssh().connection_timeout, 5);
    EXPECT_EQ(c.ssh().login_timeout, 4);
    EXPECT_EQ(c.ssh().candidate_ports, (std::vector<int>{2222, 22}));
    EXPECT_EQ(c.port().tasks_count, 2);
    EXPECT_FALSE(c.port().use_unique_ssh);
    EXPECT_FALSE(c.port().auto_reset_ports);
    EXPECT_EQ(c.port().reset_interval, 3600);
    EXPECT_EQ(c.port().numbers, (std::vector<int>{9000, 9001}));
    EXPECT_EQ(c.port().bind_address, "127.0.0.1");
    EXPECT_EQ(c.ip_check().host, "ifconfig.me");
    EXPECT_EQ(c.ip_check().path, "/ip");
    EXPECT_EQ(c.ip_check().timeout, 3);
    EXPECT_EQ(c.scheduler().idle_sleep_ms, 50);
    EXPECT_EQ(c.store_path(), fs::path("/var/lib/sockspool/store.yaml"));
}

TEST(Config, PortsAsYamlNumberOrSequence) {
    auto r = Config::parse("ssh:\n  ports: 2222\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().candidate_ports, std::vector<int>{2222});

    r = Config::parse("ssh:\n  ports: [2222, 22]\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().candidate_ports, (std::vector<int>{2222, 22}));
}

TEST(Config, EmptyPortListFallsBackTo22) {
    auto r = Config::parse("ssh:\n  ports: \"\"\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.ssh().candidate_ports.empty());
    EXPECT_EQ(r.value.ssh_ports_or_default(), std::vector<int>{22});
}

TEST(Config, InvalidValuesAreErrors) {
    EXPECT_TRUE(Config::parse("ssh:\n  ports: \"99999\"\n").is_err());
    EXPECT_TRUE(Config::parse("port:\n  reset_interval: 0\n").is_err());
    EXPECT_TRUE(Config::parse("port:\n  numbers: \"x-y\"\n").is_err());
    EXPECT_TRUE(Config::parse("ssh: [unclosed\n").is_err());
}

// ── Files ───────────────────────────────────────────────────

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "sockspool_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, MissingFileGivesDefaults) {
    auto r = Config::load(test_dir / "absent.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.port().reset_interval, 60);
}

TEST_F(ConfigFileTest, DefaultFileParsesToDefaults) {
    auto path = test_dir / "sub" / "config.yaml";
    ASSERT_TRUE(create_default_config(path).is_ok());
    ASSERT_TRUE(fs::exists(path));

    auto r = Config::load(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.ssh().tasks_count, 20);
    EXPECT_EQ(r.value.port().numbers.size(), 10u);
}

TEST_F(ConfigFileTest, InitNeverOverwrites) {
    auto path = test_dir / "config.yaml";
    std::ofstream(path) << "port:\n  reset_interval: 5\n";

    ASSERT_TRUE(create_default_config(path).is_ok());
    auto r = Config::load(path);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.port().reset_interval, 5);
}
