#ifndef VERSION_HPP
#define VERSION_HPP

#include <string>

namespace Version {
    extern const std::string VERSION;
    extern const std::string LICENSE;
    
    void printVersion(const std::string& tool);
    void printBanner(const std::string& subtitle);
}

#endif // VERSION_HPP
