/**
 * @file domain_descriptor.cpp
 * @brief Descriptor XML codec.
 * @author Dimitris Kafetzis
 */

#include "hypervisor/domain_descriptor.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>

namespace vm_sandbox {

namespace {

std::string xml_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '\'': out += "&apos;"; break;
            case '"':  out += "&quot;"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string xml_unescape(std::string_view text) {
    static const std::pair<std::string_view, char> kEntities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&apos;", '\''}, {"&quot;", '"'},
    };
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool matched = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : kEntities) {
                if (text.substr(i, entity.size()) == entity) {
                    out += ch;
                    i += entity.size();
                    matched = true;
                    break;
                }
            }
        }
        if (!matched) out += text[i++];
    }
    return out;
}

uint32_t to_mib(uint64_t amount, std::string unit) {
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (unit.empty() || unit == "kib" || unit == "k") return static_cast<uint32_t>(amount / 1024);
    if (unit == "mib" || unit == "m") return static_cast<uint32_t>(amount);
    if (unit == "gib" || unit == "g") return static_cast<uint32_t>(amount * 1024);
    if (unit == "b" || unit == "bytes") return static_cast<uint32_t>(amount / (1024 * 1024));
    if (unit == "kb") return static_cast<uint32_t>(amount * 1000 / (1024 * 1024));
    if (unit == "mb") return static_cast<uint32_t>(amount * 1000 * 1000 / (1024 * 1024));
    return static_cast<uint32_t>(amount / 1024);
}

uint64_t parse_number(const std::string& digits) {
    uint64_t value = 0;
    std::from_chars(digits.data(), digits.data() + digits.size(), value);
    return value;
}

}  // namespace

std::string render_domain_xml(const DomainSpec& spec) {
    const auto disk = xml_escape(spec.disk_path);

    std::ostringstream xml;
    xml << "<domain type='kvm'>\n"
        << "  <name>" << xml_escape(spec.name) << "</name>\n"
        << "  <uuid>" << spec.uuid << "</uuid>\n"
        << "  <metadata>\n"
        << "    <app:sandbox xmlns:app='" << kMetadataNamespace << "'>\n"
        << "      <app:type>" << to_string(spec.kind) << "</app:type>\n"
        << "      <app:disk_path>" << disk << "</app:disk_path>\n"
        << "    </app:sandbox>\n"
        << "  </metadata>\n"
        << "  <memory unit='MiB'>" << spec.memory_mb << "</memory>\n"
        << "  <currentMemory unit='MiB'>" << spec.memory_mb << "</currentMemory>\n"
        << "  <vcpu placement='static'>" << spec.vcpus << "</vcpu>\n"
        << "  <os>\n"
        << "    <type arch='x86_64' machine='q35'>hvm</type>\n"
        << "    <boot dev='hd'/>\n"
        << "  </os>\n"
        << "  <features><acpi/><apic/><vmport state='off'/></features>\n"
        << "  <cpu mode='host-model'><model fallback='allow'/></cpu>\n"
        << "  <clock offset='utc'>\n"
        << "    <timer name='rtc' tickpolicy='catchup'/>\n"
        << "    <timer name='pit' tickpolicy='delay'/>\n"
        << "    <timer name='hpet' present='no'/>\n"
        << "  </clock>\n"
        << "  <on_poweroff>destroy</on_poweroff>\n"
        << "  <on_reboot>restart</on_reboot>\n"
        << "  <on_crash>destroy</on_crash>\n"
        << "  <pm><suspend-to-mem enabled='no'/><suspend-to-disk enabled='no'/></pm>\n"
        << "  <devices>\n"
        << "    <emulator>" << xml_escape(spec.emulator) << "</emulator>\n"
        << "    <disk type='file' device='disk'>\n"
        << "      <driver name='qemu' type='qcow2'/>\n"
        << "      <source file='" << disk << "'/>\n"
        << "      <target dev='vda' bus='virtio'/>\n"
        << "    </disk>\n"
        << "    <controller type='pci' index='0' model='pcie-root'/>\n";

    if (spec.with_network) {
        xml << "    <interface type='network'>\n"
            << "      <mac address='" << spec.mac << "'/>\n"
            << "      <source network='" << xml_escape(spec.network) << "'/>\n"
            << "      <model type='virtio'/>\n"
            << "    </interface>\n";
    }

    xml << "    <serial type='pty'><target port='0'/></serial>\n"
        << "    <console type='pty'><target type='serial' port='0'/></console>\n"
        << "    <channel type='unix'>\n"
        << "      <target type='virtio' name='org.qemu.guest_agent.0'/>\n"
        << "    </channel>\n"
        << "    <memballoon model='virtio'/>\n"
        << "    <rng model='virtio'><backend model='random'>/dev/urandom</backend></rng>\n"
        << "  </devices>\n"
        << "</domain>\n";
    return xml.str();
}

Result<DomainDescriptor> parse_domain_xml(std::string_view xml_view) {
    const std::string xml{xml_view};
    static const std::regex kRoot(R"(<domain[\s>])");
    if (!std::regex_search(xml, kRoot)) {
        return Error{ErrorCode::HypervisorError, "Descriptor has no <domain> element"};
    }

    DomainDescriptor desc;
    std::smatch m;

    static const std::regex kName(R"(<name>([^<]+)</name>)");
    if (std::regex_search(xml, m, kName)) desc.name = xml_unescape(m[1].str());
    static const std::regex kUuid(R"(<uuid>\s*([0-9A-Fa-f-]{36})\s*</uuid>)");
    if (std::regex_search(xml, m, kUuid)) desc.uuid = m[1].str();

    // Metadata: libvirt re-emits our elements with the prefix we defined them under.
    static const std::regex kType(R"(<app:type>\s*([A-Za-z_]+)\s*</app:type>)");
    if (std::regex_search(xml, m, kType)) {
        desc.kind = parse_domain_kind(m[1].str());
    }
    static const std::regex kDisk(R"(<app:disk_path>([^<]*)</app:disk_path>)");
    if (std::regex_search(xml, m, kDisk)) {
        auto path = xml_unescape(m[1].str());
        if (!path.empty()) desc.disk_path = std::move(path);
    }

    static const std::regex kMemory(
        R"(<memory(?:\s+unit\s*=\s*['"]([A-Za-z]+)['"])?\s*>\s*(\d+)\s*</memory>)");
    if (std::regex_search(xml, m, kMemory)) {
        desc.memory_mb = to_mib(parse_number(m[2].str()), m[1].matched ? m[1].str() : "KiB");
    }

    static const std::regex kVcpu(R"(<vcpu[^>]*>\s*(\d+)\s*</vcpu>)");
    if (std::regex_search(xml, m, kVcpu)) {
        desc.vcpus = static_cast<uint32_t>(parse_number(m[1].str()));
    }

    static const std::regex kMac(
        R"(<interface[\s\S]*?<mac\s+address\s*=\s*['"]([0-9A-Fa-f:]{17})['"])");
    if (std::regex_search(xml, m, kMac)) {
        auto mac = m[1].str();
        std::transform(mac.begin(), mac.end(), mac.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        desc.mac = std::move(mac);
    }

    return desc;
}

}  // namespace vm_sandbox
