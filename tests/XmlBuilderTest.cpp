#include <gtest/gtest.h>
#include <string>
#include <pugixml.hpp>
#include "Virtualization/builder/DhcpHostBuilder.hpp"
#include "Virtualization/builder/VirtualMachineBuilder.hpp"
#include "Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include "Virtualization/builder/VirtualNetworkBuilder.hpp"
#include "Virtualization/builder/VolumeDefinitionBuilder.hpp"

namespace {

void parse(pugi::xml_document& doc, const std::string& xml) {
    ASSERT_TRUE(doc.load_string(xml.c_str())) << xml;
}

} // namespace

TEST(XmlBuilderTest, DomainCarriesCpuDiskNicAndGraphics) {
    VirtualMachineBuilder builder;
    builder.setName("ocp4-master-1")
        .setMemoryMiB(16000)
        .setCpuCount(4)
        .setDisk(VirtualMachineDisk{"/var/lib/libvirt/images/ocp4-master-1.qcow2", "qcow2", 50, "vda"})
        .setNetwork("ocp-100");

    pugi::xml_document doc;
    parse(doc, builder.build());
    auto domain = doc.child("domain");

    EXPECT_STREQ(domain.attribute("type").value(), "kvm");
    EXPECT_STREQ(domain.child_value("name"), "ocp4-master-1");
    EXPECT_EQ(std::string(domain.child_value("uuid")).size(), 36u);
    EXPECT_STREQ(domain.child("memory").attribute("unit").value(), "MiB");
    EXPECT_STREQ(domain.child_value("memory"), "16000");
    EXPECT_STREQ(domain.child_value("vcpu"), "4");
    EXPECT_STREQ(domain.child("cpu").attribute("mode").value(), "host-passthrough");
    EXPECT_TRUE(domain.child("features").child("acpi"));
    EXPECT_TRUE(domain.child("features").child("apic"));
    EXPECT_STREQ(domain.child("os").child("type").attribute("machine").value(), "q35");
    EXPECT_STREQ(domain.child("os").child("boot").attribute("dev").value(), "hd");
    EXPECT_FALSE(domain.child("os").child("kernel"));
    EXPECT_STREQ(domain.child_value("on_reboot"), "restart");

    auto devices = domain.child("devices");
    auto disk = devices.child("disk");
    EXPECT_STREQ(disk.child("driver").attribute("type").value(), "qcow2");
    EXPECT_STREQ(disk.child("source").attribute("file").value(), "/var/lib/libvirt/images/ocp4-master-1.qcow2");
    EXPECT_STREQ(disk.child("target").attribute("dev").value(), "vda");
    EXPECT_STREQ(disk.child("target").attribute("bus").value(), "virtio");

    auto nic = devices.child("interface");
    EXPECT_STREQ(nic.attribute("type").value(), "network");
    EXPECT_STREQ(nic.child("source").attribute("network").value(), "ocp-100");
    EXPECT_STREQ(nic.child("model").attribute("type").value(), "virtio");

    EXPECT_STREQ(devices.child("graphics").attribute("type").value(), "vnc");
    EXPECT_STREQ(devices.child("graphics").attribute("autoport").value(), "yes");
}

TEST(XmlBuilderTest, DomainUuidIsStableAcrossBuildsOfOneBuilder) {
    VirtualMachineBuilder builder;
    builder.setName("ocp4-lb").setMemoryMiB(1536).setCpuCount(4);
    pugi::xml_document first, second, third;
    parse(first, builder.build());
    parse(second, builder.build());
    EXPECT_STREQ(first.child("domain").child_value("uuid"), second.child("domain").child_value("uuid"));

    VirtualMachineBuilder other;
    other.setName("ocp4-lb");
    parse(third, other.build());
    EXPECT_STRNE(first.child("domain").child_value("uuid"), third.child("domain").child_value("uuid"));
}

TEST(XmlBuilderTest, InstallRolesBootTheInstallerKernel) {
    VirtualMachineBuilder builder;
    builder.setName("ocp4-bootstrap")
        .setMemoryMiB(16000)
        .setCpuCount(4)
        .setDirectKernelBoot("/images/rhcos-install/vmlinuz", "/images/rhcos-install/initramfs.img",
                             "nomodeset rd.neednet=1 coreos.inst=yes")
        .setOnReboot("destroy");

    pugi::xml_document doc;
    parse(doc, builder.build());
    EXPECT_STREQ(doc.child("domain").child_value("on_reboot"), "destroy");
    auto os = doc.child("domain").child("os");
    EXPECT_STREQ(os.child_value("kernel"), "/images/rhcos-install/vmlinuz");
    EXPECT_STREQ(os.child_value("initrd"), "/images/rhcos-install/initramfs.img");
    EXPECT_STREQ(os.child_value("cmdline"), "nomodeset rd.neednet=1 coreos.inst=yes");
}

TEST(XmlBuilderTest, NetworkIsNatWithSlash24AndFullDhcpPool) {
    VirtualNetworkBuilder builder;
    builder.setName("ocp-100").setPrivateSubnet(100);

    pugi::xml_document doc;
    parse(doc, builder.build());
    auto net = doc.child("network");
    EXPECT_STREQ(net.child_value("name"), "ocp-100");
    EXPECT_STREQ(net.child("bridge").attribute("name").value(), "ocp-100");
    EXPECT_STREQ(net.child("forward").attribute("mode").value(), "nat");

    auto ip = net.child("ip");
    EXPECT_STREQ(ip.attribute("address").value(), "192.168.100.1");
    EXPECT_STREQ(ip.attribute("netmask").value(), "255.255.255.0");
    EXPECT_STREQ(ip.child("dhcp").child("range").attribute("start").value(), "192.168.100.2");
    EXPECT_STREQ(ip.child("dhcp").child("range").attribute("end").value(), "192.168.100.254");
}

TEST(XmlBuilderTest, DhcpHostIsASingleElement) {
    DhcpHostBuilder builder;
    builder.setMac("52:54:00:aa:bb:cc").setIp("192.168.100.10").setName("ocp4-lb");
    EXPECT_EQ(builder.build(), "<host mac=\"52:54:00:aa:bb:cc\" ip=\"192.168.100.10\" name=\"ocp4-lb\"/>");
}

TEST(XmlBuilderTest, VolumeIsSizedInGiB) {
    VolumeDefinitionBuilder builder;
    builder.setName("ocp4-worker-1.qcow2").setCapacityGiB(50);

    pugi::xml_document doc;
    parse(doc, builder.build());
    auto volume = doc.child("volume");
    EXPECT_STREQ(volume.child_value("name"), "ocp4-worker-1.qcow2");
    EXPECT_STREQ(volume.child("capacity").attribute("unit").value(), "GiB");
    EXPECT_STREQ(volume.child_value("capacity"), "50");
    EXPECT_STREQ(volume.child("target").child("format").attribute("type").value(), "qcow2");
}

TEST(XmlBuilderTest, ExplicitIdentityAndPlatformOverrideDefaults) {
    VirtualMachineBuilder builder;
    builder.setName("ocp4-worker-1")
        .setUuid("6f1c9d5e-4b1a-4d8e-9a3c-2f7e8b6d1c0a")
        .setMacAddress("52:54:00:12:34:56")
        .setMachine("pc-q35-8.2")
        .setArchitecture("aarch64")
        .setOsVariant("http://fedoraproject.org/coreos/stable");
    EXPECT_EQ(builder.getUuid(), "6f1c9d5e-4b1a-4d8e-9a3c-2f7e8b6d1c0a");

    pugi::xml_document doc;
    parse(doc, builder.build());
    auto domain = doc.child("domain");
    EXPECT_STREQ(domain.child_value("uuid"), "6f1c9d5e-4b1a-4d8e-9a3c-2f7e8b6d1c0a");
    EXPECT_STREQ(domain.child("os").child("type").attribute("machine").value(), "pc-q35-8.2");
    EXPECT_STREQ(domain.child("os").child("type").attribute("arch").value(), "aarch64");
    EXPECT_STREQ(domain.child("devices").child("interface").child("mac").attribute("address").value(),
                 "52:54:00:12:34:56");
    EXPECT_STREQ(domain.child("metadata").first_child().first_child().attribute("id").value(),
                 "http://fedoraproject.org/coreos/stable");
}

TEST(XmlBuilderTest, NicDefaultsToVirtioWithoutMac) {
    VirtualMachineNicBuilder nic;
    nic.setNetworkName("ocp-100");

    pugi::xml_document doc;
    parse(doc, nic.build());
    auto iface = doc.child("interface");
    EXPECT_FALSE(iface.child("mac"));
    EXPECT_STREQ(iface.child("model").attribute("type").value(), "virtio");

    nic.setModel("e1000");
    parse(doc, nic.build());
    EXPECT_STREQ(doc.child("interface").child("model").attribute("type").value(), "e1000");
}

TEST(XmlBuilderTest, NetworkForwardModeCanBeRouted) {
    VirtualNetworkBuilder builder;
    builder.setName("lab").setGateway("10.10.0.1").setDhcpRange("10.10.0.100", "10.10.0.200").setForwardMode("route");

    pugi::xml_document doc;
    parse(doc, builder.build());
    auto net = doc.child("network");
    EXPECT_STREQ(net.child("forward").attribute("mode").value(), "route");
    EXPECT_STREQ(net.child("ip").attribute("address").value(), "10.10.0.1");
    EXPECT_STREQ(net.child("ip").child("dhcp").child("range").attribute("start").value(), "10.10.0.100");
}
