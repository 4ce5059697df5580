#include "utils/logs.hpp"
#include "utils/colors.hpp"
#include <ctime>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Logs {
    
    namespace {
        std::string currentTag;
        bool debugEnabled = false;
        std::ofstream logFile;
        
        std::string timestamp() {
            std::time_t now = std::time(nullptr);
            std::tm local {};
            localtime_r(&now, &local);
            
            char buffer[32];
            std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
            return buffer;
        }
        
        void emit(std::ostream& out, const std::string& level, const std::string& message) {
            std::string tag = currentTag.empty() ? "" : "[" + currentTag + "] ";
            out << level << tag << message << std::endl;
            
            if (logFile.is_open()) {
                logFile << timestamp() << " " << Colors::stripEscapes(level) << tag
                        << Colors::stripEscapes(message) << std::endl;
            }
        }
    }
    
    void setTag(const std::string& tag) {
        currentTag = tag;
    }
    
    void setDebug(bool enabled) {
        debugEnabled = enabled;
    }
    
    bool openLogFile(const std::string& path) {
        closeLogFile();
        logFile.open(path, std::ios::out | std::ios::app);
        return logFile.is_open();
    }
    
    void closeLogFile() {
        if (logFile.is_open()) {
            logFile.close();
        }
    }
    
    void info(const std::string& message) {
        emit(std::cout, Colors::cyan("[INFO] "), message);
    }
    
    void success(const std::string& message) {
        emit(std::cout, Colors::green("[SUCCESS] "), message);
    }
    
    void warning(const std::string& message) {
        emit(std::cout, Colors::yellow("[WARNING] "), message);
    }
    
    void error(const std::string& message) {
        emit(std::cerr, Colors::red("[ERROR] "), message);
    }
    
    void fatal(const std::string& message) {
        emit(std::cerr, Colors::bold(Colors::red("[FATAL] ")), message);
    }
    
    void debug(const std::string& message) {
        if (!debugEnabled) {
            return;
        }
        emit(std::cout, Colors::blue("[DEBUG] "), message);
    }
    
    void step(const std::string& title) {
        std::cout << std::endl;
        emit(std::cout, Colors::blue("━━━ "), Colors::blue(title + " ━━━"));
    }
    
    void plain(std::ostream& out, const std::string& text) {
        out << text << std::endl;
        
        if (logFile.is_open()) {
            std::istringstream lines(Colors::stripEscapes(text));
            std::string line;
            while (std::getline(lines, line)) {
                logFile << timestamp() << " " << line << std::endl;
            }
        }
    }
}
