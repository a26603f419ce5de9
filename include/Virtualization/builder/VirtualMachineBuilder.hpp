#pragma once

#include "Core/interfaces/IXmlDefinitionBuilderBase.hpp"
#include "Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include "Virtualization/vm/VirtualMachineDisk.hpp"
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Concrete builder for domain definition XML documents
 *
 * Implements the IXmlBuilderBase interface to construct libvirt domain XML
 * for cluster nodes: KVM, host-passthrough CPU, one virtio disk, one virtio
 * NIC and VNC graphics.
 */
class VirtualMachineBuilder : public IXmlBuilderBase {
private:
  struct KernelBoot {
    std::string kernel;
    std::string initrd;
    std::string cmdline;
  };

  // Domain properties
  std::string name;
  std::string uuid;
  unsigned long memoryMiB{ 0 };
  unsigned int vcpuCount{ 0 };
  VirtualMachineDisk disk;
  VirtualMachineNicBuilder nic;
  std::string osType{ "hvm" };
  std::string architecture{ "x86_64" };
  std::string machine{ "q35" };
  std::string osVariant{ "http://redhat.com/rhel/9.0" };
  std::optional<KernelBoot> kernelBoot;
  std::string onReboot{ "restart" };

  /**
   * @brief Builds the domain definition XML structure
   *
   * Implements the pure virtual function from IXmlBuilderBase
   * to construct the specific domain XML structure.
   */
  void buildDocument() override;

  // Helper methods for building specific sections
  void buildMetadataSection(pugi::xml_node domain);
  void buildOsSection(pugi::xml_node domain);
  void buildMemorySection(pugi::xml_node domain);
  void buildCpuSection(pugi::xml_node domain);
  void buildDevicesSection(pugi::xml_node domain);
  void buildGraphicsSection(pugi::xml_node devices);

public:
  VirtualMachineBuilder() = default;
  ~VirtualMachineBuilder() override = default;

  // Builder methods with fluent interface
  VirtualMachineBuilder& setName(std::string_view name);
  // a random UUID is generated when none is set
  VirtualMachineBuilder& setUuid(std::string_view uuid);
  VirtualMachineBuilder& setMemoryMiB(unsigned long memory);
  VirtualMachineBuilder& setCpuCount(unsigned int vcpus);
  VirtualMachineBuilder& setDisk(const VirtualMachineDisk& disk);
  VirtualMachineBuilder& setNetwork(std::string_view network);
  VirtualMachineBuilder& setMacAddress(std::string_view mac);
  VirtualMachineBuilder& setMachine(std::string_view machine);
  VirtualMachineBuilder& setOsVariant(std::string_view osId);
  VirtualMachineBuilder& setArchitecture(std::string_view arch = "x86_64");
  // "restart" or "destroy"
  VirtualMachineBuilder& setOnReboot(std::string_view action);

  /**
   * @brief Boots the installer kernel directly instead of the disk
   *
   * @param cmdline Kernel command line handed to the installer
   */
  VirtualMachineBuilder& setDirectKernelBoot(std::string_view kernel,
                                             std::string_view initrd,
                                             std::string_view cmdline);

  [[nodiscard]] const std::string& getUuid() const noexcept { return uuid; }
};
