#include "lib/answer_config.hpp"
#include "lib/command_runner.hpp"
#include "lib/errors.hpp"
#include "lib/fs_supports.hpp"
#include "lib/toml.hpp"
#include "misc/defaults.hpp"
#include <sstream>

namespace Answer {
    
    namespace {
        const std::string HEREDOC_MARKER = "PVESTRAP_UNIT";
        
        void appendList(std::ostringstream& out, const std::string& key,
                        const std::vector<std::string>& values) {
            if (values.empty()) return;
            out << key << "=";
            for (size_t i = 0; i < values.size(); ++i) {
                out << (i ? " " : "") << values[i];
            }
            out << "\n";
        }
        
        std::string diskName(const std::string& disk) {
            return disk.substr(disk.find_last_of('/') + 1);
        }
    }
    
    std::string Identity::fqdn() const {
        return domain.empty() ? hostname : hostname + "." + domain;
    }
    
    std::string ServiceUnit::render() const {
        std::ostringstream out;
        
        out << "[Unit]\n";
        out << "Description=" << description << "\n";
        appendList(out, "After", after);
        appendList(out, "Wants", wants);
        if (!conditionPathExists.empty()) {
            out << "ConditionPathExists=" << conditionPathExists << "\n";
        }
        
        out << "\n[Service]\n";
        out << "Type=" << type << "\n";
        out << "ExecStart=" << execStart << "\n";
        for (const auto& post : execStartPost) {
            out << "ExecStartPost=" << post << "\n";
        }
        if (remainAfterExit) {
            out << "RemainAfterExit=yes\n";
        }
        if (!standardOutput.empty()) {
            out << "StandardOutput=" << standardOutput << "\n";
        }
        
        out << "\n[Install]\n";
        out << "WantedBy=" << wantedBy << "\n";
        
        return out.str();
    }
    
    PostInstallCommand PostInstallCommand::shell(const std::string& command) {
        PostInstallCommand cmd;
        cmd.kind = Kind::Shell;
        cmd.text = command;
        return cmd;
    }
    
    PostInstallCommand PostInstallCommand::embedded(const std::string& path, const ServiceUnit& unit) {
        PostInstallCommand cmd;
        cmd.kind = Kind::EmbeddedFile;
        cmd.filePath = path;
        cmd.unit = unit;
        return cmd;
    }
    
    std::string PostInstallCommand::render() const {
        if (kind == Kind::Shell) {
            return text;
        }
        return "cat > " + filePath + " << '" + HEREDOC_MARKER + "'\n" +
               unit.render() + HEREDOC_MARKER;
    }
    
    PostInstallPlan::PostInstallPlan()
        : binaryPath(Defaults::FIRSTBOOT_BINARY),
          unitName(Defaults::FIRSTBOOT_UNIT),
          markerPath(Defaults::FIRSTBOOT_MARKER) {}
    
    ServiceUnit firstBootUnit(const PostInstallPlan& plan) {
        ServiceUnit unit;
        unit.description = "pvestrap first boot provisioning";
        unit.after = {"network-online.target"};
        unit.wants = {"network-online.target"};
        unit.conditionPathExists = "!" + plan.markerPath;
        unit.type = "oneshot";
        unit.execStart = plan.binaryPath + " --auto";
        unit.execStartPost = {
            "/usr/bin/touch " + plan.markerPath,
            "/bin/systemctl disable " + plan.unitName
        };
        unit.remainAfterExit = true;
        unit.standardOutput = "journal+console";
        unit.wantedBy = "multi-user.target";
        return unit;
    }
    
    std::vector<std::string> cleanupCommands(const PostInstallPlan& plan) {
        std::vector<std::string> commands;
        
        for (const auto& name : plan.stalePools) {
            std::string pool = CommandRunner::quote(name);
            // Pools already imported belong to the freshly installed system.
            commands.push_back("if ! zpool list -H " + pool + " >/dev/null 2>&1; then zpool import -N -f " +
                               pool + " 2>/dev/null && zpool destroy -f " + pool + "; fi; true");
        }
        
        for (const auto& disk : plan.wipeDisks) {
            std::string path = CommandRunner::quote("/dev/" + diskName(disk));
            commands.push_back("wipefs -a " + path + " || true");
            commands.push_back("zpool labelclear -f " + path + " 2>/dev/null || true");
        }
        
        commands.push_back("systemctl stop pve-cluster corosync 2>/dev/null || true");
        commands.push_back("rm -rf /etc/corosync/* /var/lib/corosync/* /etc/pve/corosync.conf");
        commands.push_back("systemctl start pve-cluster 2>/dev/null || true");
        
        return commands;
    }
    
    AnswerConfig buildAnswer(const Identity& identity, const NetworkConfig& network,
                             const StorageDirective& storage, const PostInstallPlan& plan,
                             bool cleanupRequested) {
        if (!isSupportedFilesystem(storage.filesystem)) {
            throw ValidationError("Unsupported filesystem '" + storage.filesystem + "'");
        }
        if (storage.filesystem == "zfs" && !storage.disks.empty() &&
            storage.disks.size() < StoragePool::minimumDisks(storage.topology)) {
            throw ValidationError(StoragePool::topologyKeyword(storage.topology) + " requires at least " +
                                  std::to_string(StoragePool::minimumDisks(storage.topology)) + " disks");
        }
        if (network.source == NetworkSource::Static &&
            (network.cidr.empty() || network.gateway.empty() || network.dns.empty())) {
            throw ValidationError("Static network needs an address, a gateway and a DNS server");
        }
        for (const auto& disk : plan.wipeDisks) {
            for (const auto& target : storage.disks) {
                if (diskName(disk) == diskName(target)) {
                    throw ValidationError("Refusing to wipe install target " + diskName(disk) + " after installation");
                }
            }
        }
        if (plan.firstbootUrl.empty()) {
            throw ValidationError("No download URL for the first boot binary");
        }
        
        AnswerConfig config;
        config.identity = identity;
        config.network = network;
        config.storage = storage;
        
        // Same split the installer applies to fqdn, so parse() gives these fields back.
        std::string fqdn = identity.fqdn();
        size_t dot = fqdn.find('.');
        config.identity.hostname = fqdn.substr(0, dot);
        config.identity.domain = dot == std::string::npos ? "" : fqdn.substr(dot + 1);
        
        config.storage.disks.clear();
        for (const auto& disk : storage.disks) {
            config.storage.disks.push_back(diskName(disk));
        }
        
        if (cleanupRequested) {
            for (const auto& command : cleanupCommands(plan)) {
                config.commands.push_back(PostInstallCommand::shell(command));
            }
        }
        
        std::string unitPath = "/etc/systemd/system/" + plan.unitName;
        
        std::string binary = CommandRunner::quote(plan.binaryPath);
        
        config.commands.push_back(PostInstallCommand::shell(
            "curl -fsSL " + CommandRunner::quote(plan.firstbootUrl) + " -o " + binary));
        config.commands.push_back(PostInstallCommand::shell("chmod 0755 " + binary));
        config.commands.push_back(PostInstallCommand::embedded(unitPath, firstBootUnit(plan)));
        config.commands.push_back(PostInstallCommand::shell("systemctl daemon-reload"));
        config.commands.push_back(PostInstallCommand::shell("systemctl enable " + CommandRunner::quote(plan.unitName)));
        
        return config;
    }
    
    std::string AnswerConfig::render() const {
        std::ostringstream out;
        
        out << "[global]\n";
        out << "keyboard = " << Toml::quote(identity.keyboard) << "\n";
        out << "country = " << Toml::quote(identity.country) << "\n";
        out << "fqdn = " << Toml::quote(identity.fqdn()) << "\n";
        out << "mailto = " << Toml::quote(identity.email) << "\n";
        out << "timezone = " << Toml::quote(identity.timezone) << "\n";
        out << "root_password = " << Toml::quote(identity.rootPassword) << "\n";
        
        out << "\n[network]\n";
        if (network.source == NetworkSource::Static) {
            out << "source = \"from-answer\"\n";
            out << "cidr = " << Toml::quote(network.cidr) << "\n";
            out << "gateway = " << Toml::quote(network.gateway) << "\n";
            out << "dns = " << Toml::quote(network.dns) << "\n";
        } else {
            out << "source = \"from-dhcp\"\n";
        }
        
        out << "\n[disk-setup]\n";
        out << "filesystem = " << Toml::quote(storage.filesystem) << "\n";
        if (storage.filesystem == "zfs") {
            out << "zfs.raid = " << Toml::quote(StoragePool::installerRaidLevel(storage.topology)) << "\n";
        }
        if (!storage.disks.empty()) {
            out << "disk_list = " << Toml::array(storage.disks) << "\n";
        }
        
        std::vector<std::string> rendered;
        for (const auto& command : commands) {
            rendered.push_back(command.render());
        }
        
        out << "\n[post-installation]\n";
        out << "commands = " << Toml::array(rendered, true) << "\n";
        
        return out.str();
    }
    
    AnswerConfig AnswerConfig::parse(const std::string& text) {
        Toml::Document doc = Toml::Document::parse(text);
        AnswerConfig config;
        
        if (!doc.has("global", "fqdn")) {
            throw ValidationError("Answer file has no [global] fqdn");
        }
        
        std::string fqdn = doc.getString("global", "fqdn");
        size_t dot = fqdn.find('.');
        config.identity.hostname = fqdn.substr(0, dot);
        config.identity.domain = dot == std::string::npos ? "" : fqdn.substr(dot + 1);
        config.identity.keyboard = doc.getString("global", "keyboard");
        config.identity.country = doc.getString("global", "country");
        config.identity.email = doc.getString("global", "mailto");
        config.identity.timezone = doc.getString("global", "timezone");
        config.identity.rootPassword = doc.getString("global", "root_password");
        
        std::string source = doc.getString("network", "source", "from-dhcp");
        if (source == "from-answer") {
            config.network.source = NetworkSource::Static;
            config.network.cidr = doc.getString("network", "cidr");
            config.network.gateway = doc.getString("network", "gateway");
            config.network.dns = doc.getString("network", "dns");
        }
        
        config.storage.filesystem = doc.getString("disk-setup", "filesystem", "ext4");
        if (doc.has("disk-setup", "zfs.raid")) {
            config.storage.topology = StoragePool::fromInstallerRaidLevel(doc.getString("disk-setup", "zfs.raid"));
        }
        config.storage.disks = doc.getArray("disk-setup", "disk_list");
        
        for (const auto& command : doc.getArray("post-installation", "commands")) {
            config.commands.push_back(PostInstallCommand::shell(command));
        }
        
        return config;
    }
    
    bool isSupportedFilesystem(const std::string& filesystem) {
        return FilesystemSupport::isInstallTarget(FilesystemSupport::parseFSType(filesystem));
    }
}
