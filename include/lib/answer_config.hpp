#ifndef ANSWER_CONFIG_HPP
#define ANSWER_CONFIG_HPP

#include "lib/zfs_pool.hpp"
#include <string>
#include <vector>

namespace Answer {
    
    struct Identity {
        std::string hostname = "pve";
        std::string domain = "local";
        std::string rootPassword;
        std::string email = "root@localhost";
        std::string timezone = "UTC";
        std::string keyboard = "en-us";
        std::string country = "us";
        
        std::string fqdn() const;
    };
    
    enum class NetworkSource {
        Dhcp,
        Static
    };
    
    struct NetworkConfig {
        NetworkSource source = NetworkSource::Dhcp;
        std::string cidr;
        std::string gateway;
        std::string dns;
    };
    
    struct StorageDirective {
        std::string filesystem = "ext4";
        StoragePool::Topology topology = StoragePool::Topology::Single;
        std::vector<std::string> disks;
    };
    
    // Systemd unit written by the post-install commands.
    struct ServiceUnit {
        std::string description;
        std::vector<std::string> after;
        std::vector<std::string> wants;
        std::string conditionPathExists;
        std::string type = "oneshot";
        std::string execStart;
        std::vector<std::string> execStartPost;
        bool remainAfterExit = true;
        std::string standardOutput;
        std::string wantedBy;
        
        std::string render() const;
    };
    
    struct PostInstallCommand {
        enum class Kind {
            Shell,
            EmbeddedFile
        };
        
        Kind kind = Kind::Shell;
        std::string text;
        std::string filePath;
        ServiceUnit unit;
        
        static PostInstallCommand shell(const std::string& command);
        static PostInstallCommand embedded(const std::string& path, const ServiceUnit& unit);
        
        std::string render() const;
    };
    
    // Where the installed system fetches the first-boot binary from, and
    // what to clean up from an earlier installation.
    struct PostInstallPlan {
        std::string firstbootUrl;
        std::string binaryPath;
        std::string unitName;
        std::string markerPath;
        std::vector<std::string> stalePools;
        std::vector<std::string> wipeDisks;
        
        PostInstallPlan();
    };
    
    struct AnswerConfig {
        Identity identity;
        NetworkConfig network;
        StorageDirective storage;
        std::vector<PostInstallCommand> commands;
        
        std::string render() const;
        
        // Reads [global] and [disk-setup] back. Throws ValidationError.
        static AnswerConfig parse(const std::string& text);
    };
    
    ServiceUnit firstBootUnit(const PostInstallPlan& plan);
    std::vector<std::string> cleanupCommands(const PostInstallPlan& plan);
    
    // Pure: identical input renders byte-identical output. Disks are reduced
    // to kernel names ("/dev/sda" -> "sda") and hostname/domain are re-split at
    // the first dot of the fqdn, so parse(render()) returns the stored fields.
    AnswerConfig buildAnswer(const Identity& identity, const NetworkConfig& network,
                             const StorageDirective& storage, const PostInstallPlan& plan,
                             bool cleanupRequested);
    
    bool isSupportedFilesystem(const std::string& filesystem);
}

#endif // ANSWER_CONFIG_HPP
