#ifndef PROGRESS_BAR_HPP
#define PROGRESS_BAR_HPP

#include <chrono>
#include <cstdint>
#include <string>

// Progress of one data-movement pass. Owned by the operation that moves the
// bytes; renderers only read it.
struct ProgressState {
    // Transfer backends report this (or 0) when the size is not known.
    static constexpr uint64_t UNKNOWN_TOTAL = UINT64_MAX;
    
    uint64_t total = 0;
    uint64_t done = 0;
    std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();
    
    static bool isKnownTotal(uint64_t value);
    
    bool hasTotal() const;
    void setTotal(uint64_t value);
    // done never decreases
    void advanceTo(uint64_t value);
    void add(uint64_t bytes);
    
    double elapsedSeconds() const;
    double bytesPerSecond() const;
    double fraction() const;
    // Negative when no estimate is possible.
    double etaSeconds() const;
};

class ProgressBar {
private:
    int barWidth;
    std::string label;
    std::chrono::milliseconds minInterval;
    std::chrono::steady_clock::time_point lastRender;
    bool rendered;
    
public:
    explicit ProgressBar(const std::string& taskLabel = "Progress",
                         std::chrono::milliseconds interval = std::chrono::milliseconds(250));
    
    // Draws at most once per interval, so callers may invoke it after every chunk.
    void update(const ProgressState& state);
    void finish(const ProgressState& state);
    
    static std::string formatTime(double seconds);
    static std::string formatSize(uint64_t bytes);
    
private:
    void draw(const ProgressState& state);
};

#endif // PROGRESS_BAR_HPP
