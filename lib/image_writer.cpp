#include "lib/image_writer.hpp"
#include "lib/errors.hpp"
#include "utils/logs.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace ImageWriter {
    
    uint64_t getImageSize(const std::string& imagePath) {
        struct stat st;
        if (stat(imagePath.c_str(), &st) != 0) {
            throw FileError(imagePath, "Cannot get file size");
        }
        return static_cast<uint64_t>(st.st_size);
    }
    
    std::string detectImageType(const std::string& imagePath) {
        std::ifstream file(imagePath, std::ios::binary);
        if (!file.is_open()) {
            return "Unknown";
        }
        
        char buffer[2048] = {};
        
        // ISO 9660 primary volume descriptor lives in sector 16
        file.seekg(32768, std::ios::beg);
        file.read(buffer, sizeof(buffer));
        bool hasISO9660 = file.gcount() > 0 &&
                          std::string(buffer, static_cast<size_t>(file.gcount())).find("CD001") != std::string::npos;
        
        file.clear();
        file.seekg(0, std::ios::beg);
        file.read(buffer, 512);
        bool hasMBR = file.gcount() == 512 &&
                      static_cast<uint8_t>(buffer[510]) == 0x55 &&
                      static_cast<uint8_t>(buffer[511]) == 0xAA;
        
        if (hasMBR && hasISO9660) {
            return "Hybrid ISO (MBR + ISO 9660)";
        } else if (hasISO9660) {
            return "Pure ISO 9660";
        } else if (hasMBR) {
            return "Raw disk image (MBR)";
        }
        return "Unknown/Non-standard image";
    }
    
    void copyStream(int inputFd, int outputFd, ImagingOperation& op, ProgressBar& bar) {
        std::vector<char> buffer(op.chunkSize);
        
        while (true) {
            ssize_t bytesRead = read(inputFd, buffer.data(), buffer.size());
            if (bytesRead == 0) {
                break;
            }
            if (bytesRead < 0) {
                if (errno == EINTR) continue;
                throw FileError(op.imagePath, std::string("Read failed: ") + strerror(errno));
            }
            
            size_t totalWritten = 0;
            while (totalWritten < static_cast<size_t>(bytesRead)) {
                ssize_t written = write(outputFd, buffer.data() + totalWritten,
                                        static_cast<size_t>(bytesRead) - totalWritten);
                if (written < 0) {
                    if (errno == EINTR) continue;
                    throw DeviceError(op.devicePath, std::string("Write operation failed: ") + strerror(errno));
                }
                totalWritten += static_cast<size_t>(written);
            }
            
            op.progress.add(static_cast<uint64_t>(bytesRead));
            bar.update(op.progress);
        }
    }
    
    void writeImage(ImagingOperation& op, DeviceStateMachine& device) {
        uint64_t imageSize = getImageSize(op.imagePath);
        
        device.releaseLocks();
        device.prepare();
        device.takeOffline();
        
        int inputFd = open(op.imagePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (inputFd < 0) {
            device.bringOnline();
            throw FileError(op.imagePath, "Cannot open image file");
        }
        
        Logs::info("Writing " + op.imagePath + " to " + op.devicePath);
        
        op.progress = ProgressState();
        op.progress.setTotal(imageSize);
        ProgressBar bar("Writing image");
        
        try {
            copyStream(inputFd, device.writeHandle(), op, bar);
            
            if (fsync(device.writeHandle()) != 0) {
                throw DeviceError(op.devicePath, std::string("Flush failed: ") + strerror(errno));
            }
        } catch (const std::exception&) {
            std::cout << std::endl;
            close(inputFd);
            device.bringOnline();
            throw;
        }
        
        bar.finish(op.progress);
        close(inputFd);
        
        if (op.progress.done != imageSize) {
            device.bringOnline();
            throw DeviceError(op.devicePath, "Image changed size while writing");
        }
        
        device.bringOnline();
        Logs::success("Image written: " + ProgressBar::formatSize(op.progress.done));
    }
}
