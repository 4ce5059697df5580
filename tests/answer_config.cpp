#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "lib/answer_config.hpp"
#include "lib/errors.hpp"

using namespace testing;
using namespace Answer;

/***********************************************************************************************************************
 * Suite
 **********************************************************************************************************************/

class AnswerConfigTest : public Test {
protected:
    void SetUp() override {
        mIdentity.hostname = "pve01";
        mIdentity.domain = "lab.example.org";
        mIdentity.rootPassword = "s3cr\"et";
        mIdentity.email = "ops@example.org";
        mIdentity.timezone = "Europe/Berlin";
        mIdentity.keyboard = "de";
        mIdentity.country = "de";

        mStorage.filesystem = "zfs";
        mStorage.topology = StoragePool::Topology::Mirror;
        mStorage.disks = {"sda", "sdb"};

        mPlan.firstbootUrl = "https://example.org/pvestrap-firstboot";
        mPlan.stalePools = {"rpool"};
        mPlan.wipeDisks = {"sdc"};
    }

    std::vector<std::string> renderedCommands(const AnswerConfig& config) {
        std::vector<std::string> rendered;
        for (const auto& command : config.commands) {
            rendered.push_back(command.render());
        }
        return rendered;
    }

    long indexOf(const std::vector<std::string>& commands, const std::string& needle) {
        for (size_t i = 0; i < commands.size(); ++i) {
            if (commands[i].find(needle) != std::string::npos) {
                return static_cast<long>(i);
            }
        }
        return -1;
    }

    Identity mIdentity;
    NetworkConfig mNetwork;
    StorageDirective mStorage;
    PostInstallPlan mPlan;
};

/***********************************************************************************************************************
 * Tests
 **********************************************************************************************************************/

TEST_F(AnswerConfigTest, IdenticalInputsRenderIdentically) {
    std::string first = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, true).render();
    std::string second = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, true).render();

    EXPECT_EQ(first, second);
}

TEST_F(AnswerConfigTest, GlobalAndDiskSetupRoundTrip) {
    AnswerConfig parsed = AnswerConfig::parse(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false).render());

    EXPECT_EQ(parsed.identity.hostname, mIdentity.hostname);
    EXPECT_EQ(parsed.identity.domain, mIdentity.domain);
    EXPECT_EQ(parsed.identity.rootPassword, mIdentity.rootPassword);
    EXPECT_EQ(parsed.identity.email, mIdentity.email);
    EXPECT_EQ(parsed.identity.timezone, mIdentity.timezone);
    EXPECT_EQ(parsed.identity.keyboard, mIdentity.keyboard);
    EXPECT_EQ(parsed.identity.country, mIdentity.country);

    EXPECT_EQ(parsed.storage.filesystem, "zfs");
    EXPECT_EQ(parsed.storage.topology, StoragePool::Topology::Mirror);
    EXPECT_EQ(parsed.storage.disks, mStorage.disks);
}

TEST_F(AnswerConfigTest, PostInstallCommandsSurviveParsing) {
    AnswerConfig config = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, true);
    AnswerConfig parsed = AnswerConfig::parse(config.render());

    EXPECT_EQ(renderedCommands(parsed), renderedCommands(config));
}

TEST_F(AnswerConfigTest, CleanupPrecedesFirstBootDownload) {
    std::vector<std::string> commands = renderedCommands(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, true));

    long download = indexOf(commands, "curl -fsSL 'https://example.org/pvestrap-firstboot'");
    long destroy = indexOf(commands, "zpool destroy");
    long wipe = indexOf(commands, "wipefs -a '/dev/sdc'");

    ASSERT_GE(download, 0);
    ASSERT_GE(destroy, 0);
    ASSERT_GE(wipe, 0);
    EXPECT_LT(destroy, download);
    EXPECT_LT(wipe, download);
    EXPECT_LT(indexOf(commands, "corosync"), download);
}

TEST_F(AnswerConfigTest, DownloadUrlIsOneShellWord) {
    mPlan.firstbootUrl = "https://dl.example.org/pvestrap-firstboot?sig=abc&expires=99";

    std::vector<std::string> commands = renderedCommands(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false));

    EXPECT_EQ(commands[0], "curl -fsSL 'https://dl.example.org/pvestrap-firstboot?sig=abc&expires=99' "
                           "-o '/usr/local/sbin/pvestrap-firstboot'");
}

TEST_F(AnswerConfigTest, CleanupArgumentsAreQuoted) {
    mPlan.stalePools = {"old pool"};
    mPlan.wipeDisks = {"/dev/sdc"};

    std::vector<std::string> commands = renderedCommands(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, true));

    EXPECT_EQ(commands[0], "if ! zpool list -H 'old pool' >/dev/null 2>&1; then zpool import -N -f 'old pool' "
                           "2>/dev/null && zpool destroy -f 'old pool'; fi; true");
    EXPECT_EQ(commands[1], "wipefs -a '/dev/sdc' || true");
    EXPECT_EQ(commands[2], "zpool labelclear -f '/dev/sdc' 2>/dev/null || true");
}

TEST_F(AnswerConfigTest, StoredFieldsMatchWhatParsingReturns) {
    mIdentity.hostname = "pve01.lab";
    mIdentity.domain = "";
    mStorage.disks = {"/dev/sda", "nvme0n1"};

    AnswerConfig config = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false);
    EXPECT_EQ(config.identity.hostname, "pve01");
    EXPECT_EQ(config.identity.domain, "lab");
    EXPECT_EQ(config.storage.disks, (std::vector<std::string> {"sda", "nvme0n1"}));

    AnswerConfig parsed = AnswerConfig::parse(config.render());
    EXPECT_EQ(parsed.identity.hostname, config.identity.hostname);
    EXPECT_EQ(parsed.identity.domain, config.identity.domain);
    EXPECT_EQ(parsed.storage.disks, config.storage.disks);
}

TEST_F(AnswerConfigTest, NoCleanupWhenNotRequested) {
    std::string rendered = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false).render();

    EXPECT_EQ(rendered.find("zpool destroy"), std::string::npos);
    EXPECT_EQ(rendered.find("wipefs"), std::string::npos);
    EXPECT_EQ(rendered.find("labelclear"), std::string::npos);
    EXPECT_EQ(rendered.find("corosync"), std::string::npos);
}

TEST_F(AnswerConfigTest, FirstBootCommandOrder) {
    std::vector<std::string> commands = renderedCommands(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false));

    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[0], "curl -fsSL 'https://example.org/pvestrap-firstboot' -o '/usr/local/sbin/pvestrap-firstboot'");
    EXPECT_EQ(commands[1], "chmod 0755 '/usr/local/sbin/pvestrap-firstboot'");
    EXPECT_THAT(commands[2], StartsWith("cat > /etc/systemd/system/pve-first-boot.service << 'PVESTRAP_UNIT'\n"));
    EXPECT_THAT(commands[2], EndsWith("\nPVESTRAP_UNIT"));
    EXPECT_EQ(commands[3], "systemctl daemon-reload");
    EXPECT_EQ(commands[4], "systemctl enable 'pve-first-boot.service'");
}

TEST_F(AnswerConfigTest, EmbeddedUnitIsOneShotGuardedByMarker) {
    AnswerConfig config = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false);

    const PostInstallCommand& embedded = config.commands[2];
    ASSERT_EQ(embedded.kind, PostInstallCommand::Kind::EmbeddedFile);

    const ServiceUnit& unit = embedded.unit;
    EXPECT_EQ(unit.type, "oneshot");
    EXPECT_EQ(unit.conditionPathExists, "!/var/lib/pve-first-boot.done");
    EXPECT_EQ(unit.execStart, "/usr/local/sbin/pvestrap-firstboot --auto");

    std::string text = unit.render();
    EXPECT_THAT(text, HasSubstr("After=network-online.target\n"));
    EXPECT_THAT(text, HasSubstr("Wants=network-online.target\n"));
    EXPECT_THAT(text, HasSubstr("ConditionPathExists=!/var/lib/pve-first-boot.done\n"));
    EXPECT_THAT(text, HasSubstr("ExecStartPost=/usr/bin/touch /var/lib/pve-first-boot.done\n"));
    EXPECT_THAT(text, HasSubstr("ExecStartPost=/bin/systemctl disable pve-first-boot.service\n"));
    EXPECT_THAT(text, HasSubstr("[Install]\nWantedBy=multi-user.target\n"));
}

TEST_F(AnswerConfigTest, NetworkSections) {
    std::string dhcp = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false).render();
    EXPECT_THAT(dhcp, HasSubstr("[network]\nsource = \"from-dhcp\"\n"));

    mNetwork.source = NetworkSource::Static;
    mNetwork.cidr = "192.168.1.10/24";
    mNetwork.gateway = "192.168.1.1";
    mNetwork.dns = "1.1.1.1";

    AnswerConfig parsed = AnswerConfig::parse(buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false).render());
    EXPECT_EQ(parsed.network.source, NetworkSource::Static);
    EXPECT_EQ(parsed.network.cidr, "192.168.1.10/24");
    EXPECT_EQ(parsed.network.gateway, "192.168.1.1");
    EXPECT_EQ(parsed.network.dns, "1.1.1.1");
}

TEST_F(AnswerConfigTest, NonZfsHasNoRaidKey) {
    mStorage.filesystem = "ext4";
    mStorage.disks = {"/dev/nvme0n1"};

    std::string rendered = buildAnswer(mIdentity, mNetwork, mStorage, mPlan, false).render();

    EXPECT_EQ(rendered.find("zfs.raid"), std::string::npos);
    EXPECT_THAT(rendered, HasSubstr("disk_list = [\"nvme0n1\"]"));
}

TEST_F(AnswerConfigTest, InvalidInputsAreRejected) {
    NetworkConfig partial;
    partial.source = NetworkSource::Static;
    partial.cidr = "10.0.0.5/24";
    EXPECT_THROW(buildAnswer(mIdentity, partial, mStorage, mPlan, false), ValidationError);

    StorageDirective tooFew = mStorage;
    tooFew.topology = StoragePool::Topology::RaidZ1;
    EXPECT_THROW(buildAnswer(mIdentity, mNetwork, tooFew, mPlan, false), ValidationError);

    StorageDirective unknown = mStorage;
    unknown.filesystem = "ntfs";
    EXPECT_THROW(buildAnswer(mIdentity, mNetwork, unknown, mPlan, false), ValidationError);

    PostInstallPlan overlapping = mPlan;
    overlapping.wipeDisks = {"/dev/sdb"};
    EXPECT_THROW(buildAnswer(mIdentity, mNetwork, mStorage, overlapping, true), ValidationError);

    PostInstallPlan noUrl = mPlan;
    noUrl.firstbootUrl.clear();
    EXPECT_THROW(buildAnswer(mIdentity, mNetwork, mStorage, noUrl, false), ValidationError);
}

TEST_F(AnswerConfigTest, ParseRequiresFqdn) {
    EXPECT_THROW(AnswerConfig::parse("[global]\nkeyboard = \"en-us\"\n"), ValidationError);
}
