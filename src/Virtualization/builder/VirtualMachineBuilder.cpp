#include "Virtualization/builder/VirtualMachineBuilder.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <pugixml.hpp>

namespace {
constexpr const char* kLibosinfoNs = "http://libosinfo.org/xmlns/libvirt/domain/1.0";
}

void VirtualMachineBuilder::buildDocument() {
  auto root = doc.append_child("domain");
  root.append_attribute("type") = "kvm";
  if (!name.empty()) {
    root.append_child("name").text() = name.c_str();
  }

  if (uuid.empty()) {
    uuid = boost::uuids::to_string(boost::uuids::random_generator()());
  }
  root.append_child("uuid").text() = uuid.c_str();

  // Build all sections
  buildMetadataSection(root);
  buildMemorySection(root);
  buildCpuSection(root);
  buildOsSection(root);

  auto features = root.append_child("features");
  features.append_child("acpi");
  features.append_child("apic");

  root.append_child("on_poweroff").text() = "destroy";
  root.append_child("on_reboot").text() = onReboot.c_str();
  root.append_child("on_crash").text() = "destroy";

  buildDevicesSection(root);
}

void VirtualMachineBuilder::buildMetadataSection(pugi::xml_node domain) {
  auto info = domain.append_child("metadata").append_child("libosinfo:libosinfo");
  info.append_attribute("xmlns:libosinfo") = kLibosinfoNs;
  info.append_child("libosinfo:os").append_attribute("id") = osVariant.c_str();
}

void VirtualMachineBuilder::buildOsSection(pugi::xml_node domain) {
  auto os = domain.append_child("os");
  auto type = os.append_child("type");
  type.append_attribute("arch") = architecture.c_str();
  type.append_attribute("machine") = machine.c_str();
  type.text() = osType.c_str();

  if (kernelBoot) {
    os.append_child("kernel").text() = kernelBoot->kernel.c_str();
    os.append_child("initrd").text() = kernelBoot->initrd.c_str();
    os.append_child("cmdline").text() = kernelBoot->cmdline.c_str();
  }
  os.append_child("boot").append_attribute("dev") = "hd";
}

void VirtualMachineBuilder::buildMemorySection(pugi::xml_node domain) {
  auto memory = domain.append_child("memory");
  memory.append_attribute("unit") = "MiB";
  memory.text() = memoryMiB;
}

void VirtualMachineBuilder::buildCpuSection(pugi::xml_node domain) {
  auto vcpu = domain.append_child("vcpu");
  vcpu.append_attribute("placement") = "static";
  vcpu.text() = vcpuCount;

  auto cpu = domain.append_child("cpu");
  cpu.append_attribute("mode") = "host-passthrough";
  cpu.append_child("model").append_attribute("fallback") = "allow";
}

void VirtualMachineBuilder::buildDevicesSection(pugi::xml_node domain) {
  auto devices = domain.append_child("devices");

  // Disk device
  if (!disk.path.empty()) {
    auto diskNode = devices.append_child("disk");
    diskNode.append_attribute("type") = "file";
    diskNode.append_attribute("device") = "disk";

    auto driver = diskNode.append_child("driver");
    driver.append_attribute("name") = "qemu";
    driver.append_attribute("type") = disk.format.c_str();

    diskNode.append_child("source").append_attribute("file") = disk.path.c_str();

    auto target = diskNode.append_child("target");
    target.append_attribute("dev") = disk.target.c_str();
    target.append_attribute("bus") = "virtio";
  }

  nic.appendTo(devices);
  buildGraphicsSection(devices);
}

void VirtualMachineBuilder::buildGraphicsSection(pugi::xml_node devices) {
  auto graphics = devices.append_child("graphics");
  graphics.append_attribute("type") = "vnc";
  graphics.append_attribute("autoport") = "yes";
}

// Fluent interface implementations
VirtualMachineBuilder& VirtualMachineBuilder::setName(std::string_view name) {
  this->name = name;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setUuid(std::string_view uuid) {
  this->uuid = uuid;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setMemoryMiB(unsigned long memory) {
  this->memoryMiB = memory;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setCpuCount(unsigned int vcpus) {
  this->vcpuCount = vcpus;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setDisk(const VirtualMachineDisk& disk) {
  this->disk = disk;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setNetwork(std::string_view network) {
  nic.setNetworkName(network);
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setMacAddress(std::string_view mac) {
  nic.setMacAddress(mac);
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setMachine(std::string_view machine) {
  this->machine = machine;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setOsVariant(std::string_view osId) {
  this->osVariant = osId;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setArchitecture(std::string_view arch) {
  this->architecture = arch;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setOnReboot(std::string_view action) {
  this->onReboot = action;
  return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setDirectKernelBoot(std::string_view kernel,
                                                                  std::string_view initrd,
                                                                  std::string_view cmdline) {
  kernelBoot = KernelBoot{std::string(kernel), std::string(initrd), std::string(cmdline)};
  return *this;
}
