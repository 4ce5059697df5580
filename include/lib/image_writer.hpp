#ifndef IMAGE_WRITER_HPP
#define IMAGE_WRITER_HPP

#include "lib/device_state.hpp"
#include "utils/progress_bar.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// One write pass. Progress only moves forward; a failed pass invalidates the
// destination and the whole operation must start again from prepare().
struct ImagingOperation {
    std::string imagePath;
    std::string devicePath;
    size_t chunkSize = 4 * 1024 * 1024;
    ProgressState progress;
};

namespace ImageWriter {
    uint64_t getImageSize(const std::string& imagePath);
    std::string detectImageType(const std::string& imagePath);
    
    // Full sequence: release locks, prepare, offline, copy, flush, online.
    void writeImage(ImagingOperation& op, DeviceStateMachine& device);
    
    // Sequential chunked copy between open descriptors; updates op.progress after every chunk.
    void copyStream(int inputFd, int outputFd, ImagingOperation& op, ProgressBar& bar);
}

#endif // IMAGE_WRITER_HPP
