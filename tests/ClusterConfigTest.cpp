#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "Cluster/ClusterConfig.hpp"

TEST(ClusterConfigTest, DefaultsAreValid) {
    ClusterConfig cfg;
    EXPECT_TRUE(cfg.validate().isOk());
    EXPECT_EQ(cfg.clusterDomain(), "ocp4.local");
    EXPECT_EQ(cfg.masters, 3);
    EXPECT_EQ(cfg.workers, 2);
    EXPECT_EQ(cfg.loadBalancerImage(), "/var/lib/libvirt/images/ocp4-lb.qcow2");
    EXPECT_EQ(cfg.installPath().string(), "/var/lib/libvirt/images/rhcos-install");
}

TEST(ClusterConfigTest, JsonOverridesOnlyTheKeysItNames) {
    auto cfg = ClusterConfig::fromJson(R"({
        "cluster_name": "lab",
        "base_domain": "example.com",
        "network_octet": 120,
        "masters": 1,
        "workers": 0,
        "worker_memory_mib": 12000,
        "install_dir": "/srv/rhcos",
        "lb_install": ["haproxy"],
        "max_poll_attempts": 40
    })");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->clusterName, "lab");
    EXPECT_EQ(cfg->clusterDomain(), "lab.example.com");
    ASSERT_TRUE(cfg->networkOctet.has_value());
    EXPECT_EQ(*cfg->networkOctet, "120");
    EXPECT_EQ(cfg->masters, 1);
    EXPECT_EQ(cfg->workers, 0);
    EXPECT_EQ(cfg->worker.memoryMiB, 12000);
    EXPECT_EQ(cfg->worker.cpus, 2);
    EXPECT_EQ(cfg->installPath().string(), "/srv/rhcos");
    EXPECT_EQ(cfg->lbCustomization.install, (std::vector<std::string>{"haproxy"}));
    EXPECT_EQ(cfg->lbCustomization.uninstall, (std::vector<std::string>{"cloud-init"}));
    EXPECT_EQ(cfg->maxPollAttempts.value_or(0), 40u);
    EXPECT_EQ(cfg->loadBalancerImage(), "/var/lib/libvirt/images/lab-lb.qcow2");
    EXPECT_TRUE(cfg->validate().isOk());
}

TEST(ClusterConfigTest, UnknownKeysAreRejected) {
    auto cfg = ClusterConfig::fromJson(R"({"cluster_nmae": "typo"})");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("cluster_nmae"), std::string::npos);
}

TEST(ClusterConfigTest, MistypedValuesAndBrokenJsonAreRejected) {
    auto wrongType = ClusterConfig::fromJson(R"({"masters": "three"})");
    ASSERT_FALSE(wrongType.has_value());
    EXPECT_NE(wrongType.error().find("masters"), std::string::npos);

    EXPECT_FALSE(ClusterConfig::fromJson("{ not json").has_value());
    EXPECT_FALSE(ClusterConfig::fromJson("[1, 2]").has_value());
}

TEST(ClusterConfigTest, MergeAppliesOnTopOfExistingValues) {
    ClusterConfig cfg;
    cfg.workers = 5;
    auto merged = cfg.merge(nlohmann::json{{"masters", 1}, {"network_name", "default"}});
    ASSERT_TRUE(merged.has_value());
    EXPECT_EQ(cfg.masters, 1);
    EXPECT_EQ(cfg.workers, 5);
    EXPECT_EQ(cfg.networkName.value_or(""), "default");
}

TEST(ClusterConfigTest, ValidateRejectsImpossibleClusters) {
    ClusterConfig noMasters;
    noMasters.masters = 0;
    auto res = noMasters.validate();
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.error().rfind("[Config]", 0), 0u);

    ClusterConfig negativeWorkers;
    negativeWorkers.workers = -1;
    EXPECT_TRUE(negativeWorkers.validate().isErr());

    ClusterConfig noMemory;
    noMemory.master.memoryMiB = 0;
    EXPECT_TRUE(noMemory.validate().isErr());

    ClusterConfig noDisk;
    noDisk.diskSizeGiB = 0;
    EXPECT_TRUE(noDisk.validate().isErr());

    ClusterConfig badPort;
    badPort.webServerPort = 70000;
    EXPECT_TRUE(badPort.validate().isErr());

    ClusterConfig unnamed;
    unnamed.clusterName.clear();
    EXPECT_TRUE(unnamed.validate().isErr());
}

TEST(ClusterConfigTest, UnknownLogLevelIsRejected) {
    ClusterConfig cfg;
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        cfg.logLevel = level;
        EXPECT_TRUE(cfg.validate().isOk()) << level;
    }

    cfg.logLevel = "verbose";
    auto res = cfg.validate();
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.error().rfind("[Config]", 0), 0u);
    EXPECT_NE(res.error().find("verbose"), std::string::npos);
}

TEST(ClusterConfigTest, PollingValuesAreBounded) {
    auto negative = ClusterConfig::fromJson(R"({"max_poll_attempts": -1})");
    ASSERT_FALSE(negative.has_value());
    EXPECT_NE(negative.error().find("max_poll_attempts"), std::string::npos);

    auto unbounded = ClusterConfig::fromJson(R"({"max_poll_attempts": 0})");
    ASSERT_TRUE(unbounded.has_value()) << unbounded.error();
    EXPECT_FALSE(unbounded->maxPollAttempts.has_value());

    auto huge = ClusterConfig::fromJson(R"({"poll_interval_seconds": 10000000000000000})");
    ASSERT_FALSE(huge.has_value());
    EXPECT_NE(huge.error().find("poll_interval_seconds"), std::string::npos);
    EXPECT_FALSE(ClusterConfig::fromJson(R"({"settle_delay_seconds": -5})").has_value());

    ClusterConfig slow;
    slow.pollInterval = std::chrono::hours(48);
    EXPECT_TRUE(slow.validate().isErr());

    ClusterConfig zeroAttempts;
    zeroAttempts.maxPollAttempts = 0;
    EXPECT_TRUE(zeroAttempts.validate().isErr());
}

TEST(ClusterConfigTest, NetworkOctetAndNameAreExclusive) {
    ClusterConfig both;
    both.networkOctet = "100";
    both.networkName = "default";
    EXPECT_TRUE(both.validate().isErr());

    ClusterConfig badOctet;
    badOctet.networkOctet = "300";
    EXPECT_TRUE(badOctet.validate().isErr());

    ClusterConfig octetOnly;
    octetOnly.networkOctet = "100";
    EXPECT_TRUE(octetOnly.validate().isOk());
}

TEST(ClusterConfigTest, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "ocpkvm-config-test.json";
    {
        std::ofstream out(path);
        out << R"({"cluster_name": "filecluster", "lb_image": "/images/lb.qcow2"})";
    }
    auto cfg = ClusterConfig::fromFile(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->clusterName, "filecluster");
    EXPECT_EQ(cfg->loadBalancerImage(), "/images/lb.qcow2");

    auto missing = ClusterConfig::fromFile("/nonexistent/ocpkvm.json");
    ASSERT_FALSE(missing.has_value());
    EXPECT_NE(missing.error().find("/nonexistent/ocpkvm.json"), std::string::npos);
}
