#include "utils/progress_bar.hpp"
#include "utils/colors.hpp"
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

constexpr uint64_t ProgressState::UNKNOWN_TOTAL;

bool ProgressState::isKnownTotal(uint64_t value) {
    return value != 0 && value != UNKNOWN_TOTAL;
}

bool ProgressState::hasTotal() const {
    return isKnownTotal(total);
}

void ProgressState::setTotal(uint64_t value) {
    total = isKnownTotal(value) ? value : 0;
}

void ProgressState::advanceTo(uint64_t value) {
    if (value > done) {
        done = value;
    }
}

void ProgressState::add(uint64_t bytes) {
    done += bytes;
}

double ProgressState::elapsedSeconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
}

double ProgressState::bytesPerSecond() const {
    double elapsed = elapsedSeconds();
    return elapsed > 0 ? static_cast<double>(done) / elapsed : 0.0;
}

double ProgressState::fraction() const {
    if (!hasTotal()) {
        return 0.0;
    }
    double value = static_cast<double>(done) / static_cast<double>(total);
    return value > 1.0 ? 1.0 : value;
}

double ProgressState::etaSeconds() const {
    double speed = bytesPerSecond();
    if (!hasTotal() || speed <= 0 || done > total) {
        return -1.0;
    }
    return static_cast<double>(total - done) / speed;
}

ProgressBar::ProgressBar(const std::string& taskLabel, std::chrono::milliseconds interval)
    : barWidth(40), label(taskLabel), minInterval(interval), rendered(false) {}

void ProgressBar::update(const ProgressState& state) {
    auto now = std::chrono::steady_clock::now();
    if (rendered && now - lastRender < minInterval) {
        return;
    }
    lastRender = now;
    rendered = true;
    draw(state);
}

void ProgressBar::finish(const ProgressState& state) {
    draw(state);
    std::cout << std::endl;
    std::cout << Colors::green("Completed in " + formatTime(state.elapsedSeconds())) << std::endl;
}

void ProgressBar::draw(const ProgressState& state) {
    std::ostringstream line;
    line << "\r" << Colors::cyan(label) << ": ";
    
    if (state.hasTotal()) {
        int pos = static_cast<int>(barWidth * state.fraction());
        
        line << "[";
        for (int i = 0; i < barWidth; ++i) {
            if (i < pos) line << Colors::green("=");
            else if (i == pos) line << Colors::green(">");
            else line << " ";
        }
        line << "] " << std::fixed << std::setprecision(1) << (state.fraction() * 100.0) << "% ";
        line << formatSize(state.done) << "/" << formatSize(state.total) << " ";
        line << Colors::yellow("ETA: " + formatTime(state.etaSeconds())) << " ";
    } else {
        line << formatSize(state.done) << " so far ";
    }
    
    line << Colors::blue("(" + formatSize(static_cast<uint64_t>(state.bytesPerSecond())) + "/s)");
    
    std::cout << line.str();
    std::cout.flush();
}

std::string ProgressBar::formatTime(double seconds) {
    if (std::isnan(seconds) || std::isinf(seconds) || seconds < 0) {
        return "--:--";
    }
    
    int mins = static_cast<int>(seconds) / 60;
    int secs = static_cast<int>(seconds) % 60;
    
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << mins << ":" 
        << std::setfill('0') << std::setw(2) << secs;
    return oss.str();
}

std::string ProgressBar::formatSize(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}
