#include "lib/answer_config.hpp"
#include "lib/answer_partition.hpp"
#include "lib/command_runner.hpp"
#include "lib/confirm.hpp"
#include "lib/dev_handler.hpp"
#include "lib/device_selector.hpp"
#include "lib/device_state.hpp"
#include "lib/errors.hpp"
#include "lib/fs_supports.hpp"
#include "lib/image_writer.hpp"
#include "lib/transfer.hpp"
#include "lib/zfs_pool.hpp"
#include "misc/defaults.hpp"
#include "misc/version.hpp"
#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include "utils/progress_bar.hpp"
#include "utils/strings.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <getopt.h>
#include <sys/stat.h>
#include <unistd.h>

struct Options {
    std::string drive;
    std::string pveVersion = Defaults::PVE_VERSION;
    std::string imagePath = Defaults::IMAGE_PATH;
    std::string isoUrl;
    std::string assistantUrl;
    bool skipDownload = false;
    
    Answer::Identity identity;
    Answer::NetworkConfig network;
    Answer::StorageDirective storage;
    Answer::PostInstallPlan plan;
    bool cleanup = false;
    
    std::string answerOut = Defaults::ANSWER_SIDE_CHANNEL;
    bool dryRun = false;
    bool forceOperation = false;
};

void printUsage() {
    std::cout << Colors::bold("Usage:") << " pvestrap [OPTIONS] --firstboot-url <url>\n\n";
    std::cout << Colors::cyan("Media:") << "\n";
    std::cout << "  -d, --drive <dev>        Target USB drive (e.g. sdb or /dev/sdb); prompts when omitted\n";
    std::cout << "  -V, --pve-version <ver>  Proxmox VE installer version (default " << Defaults::PVE_VERSION << ")\n";
    std::cout << "  -i, --image <path>       Where the installer image is stored (default " << Defaults::IMAGE_PATH << ")\n";
    std::cout << "  --skip-download          Reuse the image already at --image\n";
    std::cout << "  --iso-url <url>          Download from this URL instead of the official mirror\n";
    std::cout << "  --assistant-url <url>    Helper tool used to validate the answer file\n\n";
    std::cout << Colors::cyan("Installed system:") << "\n";
    std::cout << "  -H, --hostname <name>    Hostname (default pve)\n";
    std::cout << "  --domain <domain>        DNS domain (default local)\n";
    std::cout << "  -p, --root-password <pw> Root password (required)\n";
    std::cout << "  --email <addr>           Notification address\n";
    std::cout << "  --timezone <tz>          Timezone (default UTC)\n";
    std::cout << "  --keyboard <layout>      Keyboard layout (default en-us)\n";
    std::cout << "  --country <code>         Country code (default us)\n";
    std::cout << "  -f, --filesystem <fs>    ext4, xfs, zfs or btrfs (default ext4)\n";
    std::cout << "  --zfs-raid <type>        single, mirror, raidz1 or raidz2\n";
    std::cout << "  --disks <a,b>            Install target disks\n";
    std::cout << "  --static-ip <cidr>       Static address; needs --gateway and --dns\n";
    std::cout << "  --gateway <ip>\n";
    std::cout << "  --dns <ip>\n";
    std::cout << "  --firstboot-url <url>    Where the installed system downloads pvestrap-firstboot\n";
    std::cout << "  --cleanup                Remove pools, signatures and cluster state of a previous install\n";
    std::cout << "  --cleanup-disks <a,b>    Extra data disks to wipe during --cleanup\n\n";
    std::cout << Colors::cyan("General:") << "\n";
    std::cout << "  --answer-out <path>      Fallback location for the answer file (default "
              << Defaults::ANSWER_SIDE_CHANNEL << ")\n";
    std::cout << "  --dry-run                Show what would happen without touching the drive\n";
    std::cout << "  --force                  Skip the confirmation prompt for --drive\n";
    std::cout << "  -D, --debug              Verbose output\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -h, --help               Show this help message\n\n";
    
    std::cout << Colors::bold("Examples:") << "\n";
    std::cout << "  pvestrap -d sdb -p secret --firstboot-url https://example.org/pvestrap-firstboot\n";
    std::cout << "  pvestrap -f zfs --zfs-raid mirror --disks sda,sdb -p secret --firstboot-url <url> --dry-run\n\n";
    
    std::cout << Colors::yellow("Note: ") << "This tool requires root privileges (use sudo)\n";
}

enum LongOnly {
    OPT_SKIP_DOWNLOAD = 1000,
    OPT_ISO_URL,
    OPT_ASSISTANT_URL,
    OPT_DOMAIN,
    OPT_EMAIL,
    OPT_TIMEZONE,
    OPT_KEYBOARD,
    OPT_COUNTRY,
    OPT_ZFS_RAID,
    OPT_DISKS,
    OPT_STATIC_IP,
    OPT_GATEWAY,
    OPT_DNS,
    OPT_FIRSTBOOT_URL,
    OPT_CLEANUP,
    OPT_CLEANUP_DISKS,
    OPT_ANSWER_OUT,
    OPT_DRY_RUN,
    OPT_FORCE
};

bool parseArguments(int argc, char* argv[], Options& opts) {
    int opt;
    
    static struct option long_options[] = {
        {"drive", required_argument, 0, 'd'},
        {"pve-version", required_argument, 0, 'V'},
        {"image", required_argument, 0, 'i'},
        {"skip-download", no_argument, 0, OPT_SKIP_DOWNLOAD},
        {"iso-url", required_argument, 0, OPT_ISO_URL},
        {"assistant-url", required_argument, 0, OPT_ASSISTANT_URL},
        {"hostname", required_argument, 0, 'H'},
        {"domain", required_argument, 0, OPT_DOMAIN},
        {"root-password", required_argument, 0, 'p'},
        {"email", required_argument, 0, OPT_EMAIL},
        {"timezone", required_argument, 0, OPT_TIMEZONE},
        {"keyboard", required_argument, 0, OPT_KEYBOARD},
        {"country", required_argument, 0, OPT_COUNTRY},
        {"filesystem", required_argument, 0, 'f'},
        {"zfs-raid", required_argument, 0, OPT_ZFS_RAID},
        {"disks", required_argument, 0, OPT_DISKS},
        {"static-ip", required_argument, 0, OPT_STATIC_IP},
        {"gateway", required_argument, 0, OPT_GATEWAY},
        {"dns", required_argument, 0, OPT_DNS},
        {"firstboot-url", required_argument, 0, OPT_FIRSTBOOT_URL},
        {"cleanup", no_argument, 0, OPT_CLEANUP},
        {"cleanup-disks", required_argument, 0, OPT_CLEANUP_DISKS},
        {"answer-out", required_argument, 0, OPT_ANSWER_OUT},
        {"dry-run", no_argument, 0, OPT_DRY_RUN},
        {"force", no_argument, 0, OPT_FORCE},
        {"debug", no_argument, 0, 'D'},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };
    
    int option_index = 0;
    
    while ((opt = getopt_long(argc, argv, "d:V:i:H:p:f:Dvh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'd':
                opts.drive = DeviceHandler::devicePath(optarg);
                break;
            case 'V':
                opts.pveVersion = optarg;
                break;
            case 'i':
                opts.imagePath = optarg;
                break;
            case OPT_SKIP_DOWNLOAD:
                opts.skipDownload = true;
                break;
            case OPT_ISO_URL:
                opts.isoUrl = optarg;
                break;
            case OPT_ASSISTANT_URL:
                opts.assistantUrl = optarg;
                break;
            case 'H':
                opts.identity.hostname = optarg;
                break;
            case OPT_DOMAIN:
                opts.identity.domain = optarg;
                break;
            case 'p':
                opts.identity.rootPassword = optarg;
                break;
            case OPT_EMAIL:
                opts.identity.email = optarg;
                break;
            case OPT_TIMEZONE:
                opts.identity.timezone = optarg;
                break;
            case OPT_KEYBOARD:
                opts.identity.keyboard = optarg;
                break;
            case OPT_COUNTRY:
                opts.identity.country = optarg;
                break;
            case 'f':
                opts.storage.filesystem = Strings::toLower(optarg);
                if (!Answer::isSupportedFilesystem(opts.storage.filesystem)) {
                    Logs::error("Unsupported filesystem: " + std::string(optarg));
                    std::cout << "Supported filesystems: ";
                    for (const auto& fs : FilesystemSupport::getInstallFilesystems()) {
                        std::cout << fs << " ";
                    }
                    std::cout << std::endl;
                    return false;
                }
                break;
            case OPT_ZFS_RAID:
                opts.storage.topology = StoragePool::parseTopology(optarg);
                break;
            case OPT_DISKS:
                opts.storage.disks = Strings::splitList(optarg);
                break;
            case OPT_STATIC_IP:
                opts.network.source = Answer::NetworkSource::Static;
                opts.network.cidr = optarg;
                break;
            case OPT_GATEWAY:
                opts.network.gateway = optarg;
                break;
            case OPT_DNS:
                opts.network.dns = optarg;
                break;
            case OPT_FIRSTBOOT_URL:
                opts.plan.firstbootUrl = optarg;
                break;
            case OPT_CLEANUP:
                opts.cleanup = true;
                break;
            case OPT_CLEANUP_DISKS:
                opts.plan.wipeDisks = Strings::splitList(optarg);
                break;
            case OPT_ANSWER_OUT:
                opts.answerOut = optarg;
                break;
            case OPT_DRY_RUN:
                opts.dryRun = true;
                break;
            case OPT_FORCE:
                opts.forceOperation = true;
                break;
            case 'D':
                Logs::setDebug(true);
                break;
            case 'v':
                Version::printVersion("pvestrap");
                exit(0);
            case 'h':
                printUsage();
                exit(0);
            default:
                printUsage();
                return false;
        }
    }
    
    if (opts.plan.firstbootUrl.empty()) {
        Logs::error("--firstboot-url is required");
        return false;
    }
    
    if (opts.identity.rootPassword.empty()) {
        Logs::error("-p (root password) is required");
        return false;
    }
    
    if (opts.cleanup) {
        opts.plan.stalePools = {Defaults::POOL_NAME};
    }
    
    return true;
}

void showDryRunInfo(const Options& opts, const BlockDevice& device, const std::string& imageUrl,
                    const Answer::AnswerConfig& answer) {
    std::cout << "\n" << Colors::bold(Colors::cyan("=== DRY RUN MODE - NO CHANGES WILL BE MADE ===")) << "\n\n";
    
    std::cout << Colors::bold("Input Information:") << "\n";
    std::cout << "  Installer: Proxmox VE " << opts.pveVersion << "\n";
    std::cout << "  Image: " << opts.imagePath << (opts.skipDownload ? " (reused)" : "") << "\n";
    if (!opts.skipDownload) {
        std::cout << "  Source: " << imageUrl << "\n";
    }
    std::cout << "  Target Device: " << DeviceSelector::describeDevice(device) << "\n\n";
    
    std::cout << Colors::bold("Planned Operations:") << "\n";
    int n = 1;
    if (!opts.skipDownload) {
        std::cout << "  " << n++ << ". Download installer image\n";
    }
    if (!opts.assistantUrl.empty()) {
        std::cout << "  " << n++ << ". Download helper tool and validate the answer file\n";
    }
    std::cout << "  " << n++ << ". Unmount and wipe " << device.path << "\n";
    std::cout << "  " << n++ << ". Write image to " << device.path << "\n";
    std::cout << "  " << n++ << ". Append a FAT32 partition labelled " << Defaults::ANSWER_LABEL
              << " holding " << Defaults::ANSWER_FILE_NAME << "\n";
    std::cout << "     (falls back to " << opts.answerOut << " if there is no room)\n";
    
    std::cout << "\n" << Colors::bold("Answer file:") << "\n";
    std::cout << answer.render() << "\n";
    
    std::cout << Colors::yellow("Remove --dry-run flag to perform the actual operation.") << "\n\n";
}

BlockDevice resolveTarget(CommandRunner& runner, const Options& opts, bool& cancelled) {
    cancelled = false;
    
    if (!opts.drive.empty()) {
        if (!DeviceHandler::validateDevice(opts.drive)) {
            throw DeviceError(opts.drive, "Invalid block device");
        }
        
        BlockDevice device;
        device.name = DeviceHandler::deviceName(opts.drive);
        device.path = opts.drive;
        device.capacity = DeviceHandler::getDeviceSize(opts.drive);
        std::vector<std::string> points = DeviceHandler::mountPoints(opts.drive);
        if (!points.empty()) {
            device.mountpoint = points.front();
        }
        
        if (!opts.dryRun && !opts.forceOperation) {
            std::cout << Colors::yellow("\nWARNING: All data on " + DeviceSelector::describeDevice(device) +
                                        " will be destroyed!") << std::endl;
            if (!Confirm::requireToken(std::cin, std::cout, "Continue?", Defaults::CONFIRM_TOKEN)) {
                cancelled = true;
            }
        }
        return device;
    }
    
    DeviceSelector::Enumerator enumerator(runner);
    std::vector<BlockDevice> devices = enumerator.listRemovableDevices();
    if (devices.empty()) {
        throw DeviceError("USB", "No removable drives found; plug one in or pass --drive");
    }
    
    std::optional<BlockDevice> chosen = DeviceSelector::selectDevice(devices, std::cin, std::cout);
    if (!chosen) {
        cancelled = true;
        return BlockDevice();
    }
    return *chosen;
}

std::string fetchHelper(CommandRunner& runner, const Options& opts) {
    Transfer::TransferJob job;
    job.uri = opts.assistantUrl;
    job.destination = "pvestrap-assistant";
    job.minimumBytes = Defaults::HELPER_MIN_BYTES;
    
    try {
        std::string path = Transfer::Engine::withDefaultLadder(runner).fetch(job);
        chmod(path.c_str(), 0755);
        return path;
    } catch (const TransferError& e) {
        Logs::warning("Helper tool unavailable: " + std::string(e.what()));
        return "";
    }
}

void validateWithHelper(CommandRunner& runner, const std::string& helper, const Answer::AnswerConfig& answer) {
    char checkTemplate[] = "/tmp/pvestrap-answer-XXXXXX";
    int fd = mkstemp(checkTemplate);
    if (fd < 0) {
        Logs::warning("Cannot create a scratch file for answer validation");
        return;
    }
    close(fd);
    
    try {
        AnswerPartition::writeSideChannel(checkTemplate, answer.render());
        CommandResult result = runner.run(CommandRunner::quote("./" + helper) + " validate-answer " +
                                          CommandRunner::quote(checkTemplate));
        if (result.ok()) {
            Logs::success("Answer file validated");
        } else {
            Logs::warning("Answer file validation failed: " + result.output);
        }
    } catch (const FileError& e) {
        Logs::warning(e.what());
    }
    
    std::remove(checkTemplate);
}

int main(int argc, char* argv[]) {
    Options opts;
    std::string target;
    
    try {
        Version::printBanner("Proxmox VE unattended install media");
        
        if (!parseArguments(argc, argv, opts)) {
            return 1;
        }
        
        if (!opts.dryRun) {
            ErrorHandler::checkPrivileges();
        }
        
        Answer::AnswerConfig answer = Answer::buildAnswer(opts.identity, opts.network, opts.storage,
                                                          opts.plan, opts.cleanup);
        
        SystemCommandRunner runner;
        
        bool cancelled = false;
        BlockDevice device = resolveTarget(runner, opts, cancelled);
        if (cancelled) {
            Logs::info("Operation cancelled by user");
            return 0;
        }
        target = device.path;
        
        std::string imageUrl = opts.isoUrl.empty() ? Defaults::isoUrlFor(opts.pveVersion) : opts.isoUrl;
        
        if (opts.dryRun) {
            showDryRunInfo(opts, device, imageUrl, answer);
            return 0;
        }
        
        Logs::step("Installer image");
        Transfer::TransferJob job;
        job.uri = imageUrl;
        job.destination = opts.imagePath;
        job.minimumBytes = Defaults::IMAGE_MIN_BYTES;
        job.reuseExisting = opts.skipDownload;
        
        std::string image = Transfer::Engine::withDefaultLadder(runner).fetch(job);
        Logs::info("Image type: " + ImageWriter::detectImageType(image));
        
        if (!opts.assistantUrl.empty()) {
            Logs::step("Helper tool");
            std::string helper = fetchHelper(runner, opts);
            if (!helper.empty()) {
                validateWithHelper(runner, helper, answer);
            }
        }
        
        uint64_t capacity = DeviceHandler::getDeviceSize(device.path);
        uint64_t imageSize = ImageWriter::getImageSize(image);
        if (imageSize > capacity) {
            throw ValidationError("Image (" + ProgressBar::formatSize(imageSize) + ") does not fit on " +
                                  device.path + " (" + ProgressBar::formatSize(capacity) + ")");
        }
        
        Logs::step("Writing " + device.path);
        DeviceStateMachine state(runner, device.path);
        ImagingOperation op;
        op.imagePath = image;
        op.devicePath = device.path;
        ImageWriter::writeImage(op, state);
        
        Logs::step("Answer file");
        AnswerPartition::Settings settings;
        settings.sideChannelPath = opts.answerOut;
        AnswerPartition::Provisioner provisioner(runner, settings);
        AnswerPartition::PartitionResult placed = provisioner.createAnswerPartition(device.path, answer);
        
        DeviceHandler::syncDevice(runner, device.path);
        
        std::cout << "\n" << Colors::green(Colors::bold("SUCCESS!")) << std::endl;
        Logs::success("Installation media created on " + device.path);
        if (placed.degraded) {
            Logs::warning("The answer file is at " + placed.path + ", not on the drive");
        }
        Logs::info("You can now safely remove " + device.path);
        
        return 0;
    
    } catch (const PermissionError& e) {
        return 1;
    } catch (const DeviceError& e) {
        ErrorHandler::handleFatalError(target.empty() ? "unknown" : target, e.what());
        return 1;
    } catch (const TransferError& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const PvestrapException& e) {
        Logs::fatal(e.what());
        return 1;
    } catch (const std::exception& e) {
        Logs::fatal("Unexpected error: " + std::string(e.what()));
        return 1;
    }
}
