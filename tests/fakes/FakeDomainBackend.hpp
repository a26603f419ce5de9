#pragma once
#include <deque>
#include <format>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <pugixml.hpp>
#include "Core/interfaces/IDomainBackend.hpp"
#include "Utils/Exception.hpp"

// In-memory hypervisor. Every call is appended to `calls` as "<op>:<arg>".
class FakeDomainBackend : public IDomainBackend {
public:
    using LeaseAnswer = Result<std::vector<InterfaceAddresses>>;

    std::vector<std::string> calls;
    std::set<std::string> defined;
    std::set<std::string> running;
    std::set<std::string> volumes;
    std::map<std::string, std::string> xmlByName;          // persistent definitions
    std::map<std::string, std::string> installXmlByName;   // one-shot installer definitions
    std::map<std::string, unsigned> installing;            // remaining "still running" answers per installer
    unsigned installPolls{0};                              // installer runs for this many isActive queries

    std::set<std::string> failDefine;     // domain names whose define fails
    std::map<std::string, std::deque<LeaseAnswer>> leaseScript;
    bool autoLease{true};                 // unscripted domains get a lease straight away

    static InterfaceAddresses iface(std::string mac, std::string ip) {
        return InterfaceAddresses{"vnet0", std::move(mac), {InterfaceIp{InterfaceIp::Family::IPv4, std::move(ip), 24}}};
    }

    std::vector<std::string> callsWithPrefix(std::string_view prefix) const {
        std::vector<std::string> out;
        for (const auto& c : calls) {
            if (c.starts_with(prefix)) out.push_back(c.substr(prefix.size()));
        }
        return out;
    }

    Result<bool> exists(std::string_view name) override {
        calls.push_back(std::format("exists:{}", name));
        return defined.contains(std::string(name));
    }

    Result<bool> isActive(std::string_view name) override {
        calls.push_back(std::format("isActive:{}", name));
        const std::string key(name);
        if (!defined.contains(key)) return libvirtError(std::format("no domain {}", name));
        if (auto it = installing.find(key); it != installing.end()) {
            if (it->second > 0) {
                --it->second;
                return true;
            }
            // installer finished and powered the guest off
            installing.erase(it);
            running.erase(key);
        }
        return running.contains(key);
    }

    Result<void> createVolume(const VirtualMachineDisk& disk) override {
        calls.push_back("createVolume:" + disk.path);
        if (!volumes.insert(disk.path).second) return libvirtError("volume already exists: " + disk.path);
        return {};
    }

    Result<void> deleteVolume(std::string_view path) override {
        calls.push_back(std::format("deleteVolume:{}", path));
        volumes.erase(std::string(path));
        return {};
    }

    static std::string domainName(std::string_view xml) {
        pugi::xml_document doc;
        doc.load_buffer(xml.data(), xml.size());
        return doc.child("domain").child_value("name");
    }

    Result<void> defineAndStart(std::string_view xml) override {
        const std::string name = domainName(xml);
        calls.push_back("define:" + name);
        if (failDefine.contains(name)) return libvirtError("virDomainDefineXML failed for " + name);
        defined.insert(name);
        running.insert(name);
        xmlByName[name] = std::string(xml);
        return {};
    }

    Result<void> defineAndInstall(std::string_view xml, std::string_view installXml) override {
        const std::string name = domainName(xml);
        calls.push_back("define:" + name);
        if (failDefine.contains(name)) return libvirtError("virDomainDefineXML failed for " + name);
        if (domainName(installXml) != name) return libvirtError("install definition names another domain");
        defined.insert(name);
        running.insert(name);
        xmlByName[name] = std::string(xml);
        installXmlByName[name] = std::string(installXml);
        installing[name] = installPolls;
        return {};
    }

    Result<void> start(std::string_view name) override {
        calls.push_back(std::format("start:{}", name));
        if (!defined.contains(std::string(name))) return libvirtError(std::format("no domain {}", name));
        running.insert(std::string(name));
        return {};
    }

    Result<void> stop(std::string_view name) override {
        calls.push_back(std::format("stop:{}", name));
        if (!running.contains(std::string(name))) return libvirtError(std::format("domain {} is not running", name));
        running.erase(std::string(name));
        installing.erase(std::string(name));
        return {};
    }

    Result<void> undefine(std::string_view name) override {
        calls.push_back(std::format("undefine:{}", name));
        defined.erase(std::string(name));
        return {};
    }

    Result<std::vector<InterfaceAddresses>> interfaceAddresses(std::string_view name) override {
        const std::string key(name);
        calls.push_back("lease:" + key);

        auto it = leaseScript.find(key);
        if (it != leaseScript.end() && !it->second.empty()) {
            auto answer = it->second.front();
            it->second.pop_front();
            return answer;
        }
        if (!autoLease) return std::vector<InterfaceAddresses>{};

        if (!leaseIndex.contains(key)) leaseIndex[key] = static_cast<unsigned>(leaseIndex.size()) + 10;
        const unsigned n = leaseIndex[key];
        return std::vector<InterfaceAddresses>{
            iface(std::format("52:54:00:00:00:{:02x}", n), std::format("192.168.100.{}", n))};
    }

private:
    std::map<std::string, unsigned> leaseIndex;
};
