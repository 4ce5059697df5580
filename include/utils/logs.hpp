#ifndef LOGS_HPP
#define LOGS_HPP

#include <iosfwd>
#include <string>

namespace Logs {
    // Tool tag printed after the level, e.g. "[INFO] [ZFS] message". Empty disables it.
    void setTag(const std::string& tag);
    void setDebug(bool enabled);
    
    // Mirrors every subsequent message to an append-only file with a timestamp.
    // Returns false when the file cannot be opened; console output is unaffected.
    bool openLogFile(const std::string& path);
    void closeLogFile();
    
    void info(const std::string& message);
    void success(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void debug(const std::string& message);
    void step(const std::string& title);
    // Unprefixed report text (status tables, access details). Written to out
    // as is and mirrored line by line to the log file.
    void plain(std::ostream& out, const std::string& text);
}

#endif // LOGS_HPP
