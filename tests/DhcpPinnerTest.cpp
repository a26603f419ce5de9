#include <gtest/gtest.h>
#include <memory>
#include "fakes/FakeNetworkBackend.hpp"
#include "Virtualization/network/DhcpPinner.hpp"

namespace {

const char* kNetworkXml =
    "<network><name>ocp-100</name>"
    "<ip address='192.168.100.1' netmask='255.255.255.0'>"
    "<dhcp><range start='192.168.100.2' end='192.168.100.254'/></dhcp></ip></network>";

class DhcpPinnerTest : public ::testing::Test {
protected:
    void SetUp() override { backend->addNetwork("ocp-100", true, kNetworkXml); }

    std::shared_ptr<FakeNetworkBackend> backend = std::make_shared<FakeNetworkBackend>();
    DhcpPinner pinner{backend};
};

} // namespace

TEST_F(DhcpPinnerTest, ReserveAppendsNamedHostEntry) {
    auto res = pinner.reserve("ocp-100", LeaseRecord{"ocp4-lb", "52:54:00:aa:bb:cc", "192.168.100.10"});
    ASSERT_TRUE(res.isOk()) << res.error();

    ASSERT_EQ(backend->updates.size(), 1u);
    const auto& [network, command, xml] = backend->updates.front();
    EXPECT_EQ(network, "ocp-100");
    EXPECT_EQ(command, DhcpHostUpdate::AddLast);
    EXPECT_EQ(xml, "<host mac=\"52:54:00:aa:bb:cc\" ip=\"192.168.100.10\" name=\"ocp4-lb\"/>");

    auto current = pinner.reservations("ocp-100");
    ASSERT_TRUE(current.isOk());
    ASSERT_EQ(current.value().size(), 1u);
    EXPECT_EQ(current.value()[0].vmName, "ocp4-lb");
    EXPECT_EQ(current.value()[0].ip, "192.168.100.10");
}

TEST_F(DhcpPinnerTest, RejectedUpdateIsReportedWithContext) {
    backend->failUpdate = true;
    auto res = pinner.reserve("ocp-100", LeaseRecord{"ocp4-lb", "52:54:00:aa:bb:cc", "192.168.100.10"});
    ASSERT_TRUE(res.isErr());
    EXPECT_NE(res.error().find("192.168.100.10"), std::string::npos);
    EXPECT_NE(res.error().find("virNetworkUpdate refused"), std::string::npos);
}

TEST_F(DhcpPinnerTest, ReleaseDropsOnlyTheNamedVms) {
    ASSERT_TRUE(pinner.reserve("ocp-100", {"ocp4-lb", "52:54:00:00:00:0a", "192.168.100.10"}).isOk());
    ASSERT_TRUE(pinner.reserve("ocp-100", {"ocp4-bootstrap", "52:54:00:00:00:0b", "192.168.100.11"}).isOk());
    ASSERT_TRUE(pinner.reserve("ocp-100", {"other-vm", "52:54:00:00:00:0c", "192.168.100.12"}).isOk());

    auto removed = pinner.release("ocp-100", {"ocp4-lb", "ocp4-bootstrap", "ocp4-master-1"});
    ASSERT_TRUE(removed.isOk()) << removed.error();
    EXPECT_EQ(removed.value(), 2u);

    auto left = pinner.reservations("ocp-100");
    ASSERT_TRUE(left.isOk());
    ASSERT_EQ(left.value().size(), 1u);
    EXPECT_EQ(left.value()[0].vmName, "other-vm");
}

TEST_F(DhcpPinnerTest, ReservationsOfUnknownNetworkFail) {
    auto res = pinner.reservations("missing");
    ASSERT_TRUE(res.isErr());
    EXPECT_NE(res.error().find("missing"), std::string::npos);
}

TEST(DhcpReservationParseTest, ReadsHostsFromEveryIpBlock) {
    auto hosts = DhcpPinner::parseReservations(
        "<network><ip address='192.168.100.1'><dhcp>"
        "<host mac='52:54:00:00:00:01' ip='192.168.100.5' name='a'/>"
        "<host mac='52:54:00:00:00:02' ip='192.168.100.6'/>"
        "</dhcp></ip></network>");
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0].mac, "52:54:00:00:00:01");
    EXPECT_EQ(hosts[1].vmName, "");
    EXPECT_TRUE(DhcpPinner::parseReservations("").empty());
}
