#ifndef TEMPDIR_HPP
#define TEMPDIR_HPP

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

// Scratch directory removed with everything in it when the test ends.
class TempDir {
private:
    std::filesystem::path root;
    
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "pvestrap-test-XXXXXX").string();
        char* created = mkdtemp(&pattern[0]);
        root = created ? created : pattern;
    }
    
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }
    
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    
    std::string path() const { return root.string(); }
    std::string path(const std::string& relative) const { return (root / relative).string(); }
    
    std::string write(const std::string& relative, const std::string& contents) const {
        std::filesystem::path file = root / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << contents;
        return file.string();
    }
    
    std::string read(const std::string& relative) const {
        std::ifstream in(root / relative, std::ios::binary);
        std::ostringstream contents;
        contents << in.rdbuf();
        return contents.str();
    }
    
    std::string mkdir(const std::string& relative) const {
        std::filesystem::create_directories(root / relative);
        return (root / relative).string();
    }
    
    // Minimal /sys/class/block tree: disk size and optional partitions, in bytes.
    void addBlockDevice(const std::string& name, uint64_t bytes) const {
        write("class/block/" + name + "/size", std::to_string(bytes / 512) + "\n");
    }
    
    void addPartition(const std::string& disk, const std::string& name, int number, uint64_t bytes) const {
        write("class/block/" + disk + "/" + name + "/partition", std::to_string(number) + "\n");
        write("class/block/" + disk + "/" + name + "/size", std::to_string(bytes / 512) + "\n");
    }
};

#endif // TEMPDIR_HPP
