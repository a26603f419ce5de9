#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include "Core/concurrency/ReadinessPoller.hpp"
#include "fakes/FakeDomainBackend.hpp"
#include "fakes/FakeHostTools.hpp"

using namespace std::chrono_literals;
using CONCURRENCY::ReadinessPoller;
using CONCURRENCY::RetryPolicy;

namespace {

class ReadinessPollerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDomainBackend> domains = std::make_shared<FakeDomainBackend>();
    std::shared_ptr<FakeSshProber> ssh = std::make_shared<FakeSshProber>();
    std::shared_ptr<RecordingSleeper> sleeper = std::make_shared<RecordingSleeper>();

    ReadinessPoller poller(RetryPolicy policy = {5s, std::nullopt}) {
        return ReadinessPoller(domains, ssh, sleeper, policy);
    }

    void queueEmptyAnswers(const std::string& vm, int count) {
        for (int i = 0; i < count; ++i) domains->leaseScript[vm].push_back(std::vector<InterfaceAddresses>{});
    }
};

} // namespace

TEST_F(ReadinessPollerTest, LeaseAfterThreeEmptyAnswersCostsThreeIntervals) {
    queueEmptyAnswers("ocp4-lb", 3);
    domains->leaseScript["ocp4-lb"].push_back(
        std::vector<InterfaceAddresses>{FakeDomainBackend::iface("52:54:00:aa:bb:cc", "192.168.100.10")});

    auto p = poller();
    auto lease = p.waitForLease("ocp4-lb");
    ASSERT_TRUE(lease.isOk()) << lease.error();
    EXPECT_EQ(lease.value().vmName, "ocp4-lb");
    EXPECT_EQ(lease.value().mac, "52:54:00:aa:bb:cc");
    EXPECT_EQ(lease.value().ip, "192.168.100.10");

    EXPECT_EQ(domains->callsWithPrefix("lease:").size(), 4u);
    ASSERT_EQ(sleeper->sleeps.size(), 3u);
    EXPECT_EQ(sleeper->total(), 15s);
}

TEST_F(ReadinessPollerTest, ImmediateLeaseDoesNotSleep) {
    auto p = poller();
    auto lease = p.waitForLease("ocp4-bootstrap");
    ASSERT_TRUE(lease.isOk());
    EXPECT_TRUE(sleeper->sleeps.empty());
}

TEST_F(ReadinessPollerTest, Ipv6OnlyAndMaclessInterfacesAreNotALease) {
    InterfaceAddresses ipv6{"vnet0", "52:54:00:aa:bb:cc", {InterfaceIp{InterfaceIp::Family::IPv6, "fe80::1", 64}}};
    InterfaceAddresses macless{"lo", "", {InterfaceIp{InterfaceIp::Family::IPv4, "127.0.0.1", 8}}};
    domains->leaseScript["ocp4-lb"].push_back(std::vector<InterfaceAddresses>{ipv6, macless});
    domains->leaseScript["ocp4-lb"].push_back(
        std::vector<InterfaceAddresses>{ipv6, FakeDomainBackend::iface("52:54:00:aa:bb:cc", "192.168.100.11")});

    auto p = poller();
    auto lease = p.waitForLease("ocp4-lb");
    ASSERT_TRUE(lease.isOk());
    EXPECT_EQ(lease.value().ip, "192.168.100.11");
    EXPECT_EQ(sleeper->sleeps.size(), 1u);
}

TEST_F(ReadinessPollerTest, HardQueryErrorEndsTheWaitAtOnce) {
    domains->leaseScript["ocp4-lb"].push_back(libvirtError("domain not found"));

    auto p = poller();
    auto lease = p.waitForLease("ocp4-lb");
    ASSERT_TRUE(lease.isErr());
    EXPECT_NE(lease.error().find("domain not found"), std::string::npos);
    EXPECT_TRUE(sleeper->sleeps.empty());
}

TEST_F(ReadinessPollerTest, AttemptLimitTurnsIntoTimeout) {
    domains->autoLease = false;

    auto p = poller({2s, 4});
    auto lease = p.waitForLease("ocp4-worker-1");
    ASSERT_TRUE(lease.isErr());
    EXPECT_EQ(lease.error().rfind("[Timeout]", 0), 0u);
    EXPECT_EQ(domains->callsWithPrefix("lease:").size(), 4u);
    EXPECT_EQ(sleeper->sleeps.size(), 3u);
    EXPECT_EQ(sleeper->total(), 6s);
}

TEST_F(ReadinessPollerTest, SshPurgesAddressThenHostnameAndRetries) {
    ssh->failuresBeforeSuccess = 2;

    auto p = poller();
    auto res = p.waitForSsh("192.168.100.10", "lb.ocp4.local", "sshkey", "root");
    ASSERT_TRUE(res.isOk()) << res.error();

    EXPECT_EQ(ssh->purged, (std::vector<std::string>{"192.168.100.10", "lb.ocp4.local"}));
    EXPECT_EQ(ssh->probes.size(), 3u);
    EXPECT_EQ(ssh->probes.front(), "root@192.168.100.10 sshkey");
    EXPECT_EQ(sleeper->sleeps.size(), 2u);
}

TEST_F(ReadinessPollerTest, FailedHostKeyPurgeAbortsBeforeProbing) {
    ssh->failPurge = true;

    auto p = poller();
    auto res = p.waitForSsh("192.168.100.10", "lb.ocp4.local", "sshkey", "root");
    ASSERT_TRUE(res.isErr());
    EXPECT_TRUE(ssh->probes.empty());
}

TEST_F(ReadinessPollerTest, SshAttemptLimitReportsLastError) {
    ssh->failuresBeforeSuccess = 10;

    auto p = poller({1s, 2});
    auto res = p.waitForSsh("192.168.100.12", "bootstrap.ocp4.local", "sshkey", "core");
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.error().rfind("[Timeout]", 0), 0u);
    EXPECT_NE(res.error().find("Connection refused"), std::string::npos);
    EXPECT_EQ(ssh->probes.size(), 2u);
}

TEST_F(ReadinessPollerTest, PowerOffWaitSleepsWhileTheDomainRuns) {
    domains->defined.insert("ocp4-master-1");
    domains->running.insert("ocp4-master-1");
    domains->installing["ocp4-master-1"] = 2;

    auto p = poller();
    auto res = p.waitForPowerOff("ocp4-master-1");
    ASSERT_TRUE(res.isOk()) << res.error();
    EXPECT_EQ(domains->callsWithPrefix("isActive:").size(), 3u);
    EXPECT_EQ(sleeper->total(), 10s);
    EXPECT_FALSE(domains->running.contains("ocp4-master-1"));
}

TEST_F(ReadinessPollerTest, PowerOffWaitStopsOnQueryError) {
    auto p = poller();
    auto res = p.waitForPowerOff("ocp4-master-9");
    ASSERT_TRUE(res.isErr());
    EXPECT_NE(res.error().find("[Libvirt]"), std::string::npos);
    EXPECT_TRUE(sleeper->sleeps.empty());
}

TEST_F(ReadinessPollerTest, PowerOffWaitHonoursTheAttemptLimit) {
    domains->defined.insert("ocp4-worker-1");
    domains->running.insert("ocp4-worker-1");

    auto p = poller({1s, 3});
    auto res = p.waitForPowerOff("ocp4-worker-1");
    ASSERT_TRUE(res.isErr());
    EXPECT_EQ(res.error().rfind("[Timeout]", 0), 0u);
    EXPECT_EQ(domains->callsWithPrefix("isActive:").size(), 3u);
    EXPECT_EQ(sleeper->total(), 2s);
}
