#include "misc/version.hpp"
#include "utils/colors.hpp"
#include <iostream>

namespace Version {
    const std::string VERSION = "0.3.1";
    const std::string LICENSE = "Open Source Project";
    
    void printVersion(const std::string& tool) {
        std::cout << Colors::bold(tool) << " v" << VERSION << std::endl;
        std::cout << "License: " << LICENSE << std::endl;
    }
    
    void printBanner(const std::string& subtitle) {
        std::cout << Colors::cyan(R"(
                     _                 
 _ ____   _____  ___| |_ _ __ __ _ _ __  
| '_ \ \ / / _ \/ __| __| '__/ _` | '_ \ 
| |_) \ V /  __/\__ \ |_| | | (_| | |_) |
| .__/ \_/ \___||___/\__|_|  \__,_| .__/ 
|_|                               |_|    
)") << std::endl;
        std::cout << Colors::bold("pvestrap") << " v" << VERSION << " - " << subtitle << std::endl;
        std::cout << std::endl;
    }
}
