#include "utils/strings.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Strings {
    
    std::string trim(const std::string& text) {
        size_t start = 0;
        size_t end = text.size();
        while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
        while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
        return text.substr(start, end - start);
    }
    
    std::vector<std::string> splitList(const std::string& text, char separator) {
        std::vector<std::string> items;
        std::istringstream stream(text);
        std::string item;
        
        while (std::getline(stream, item, separator)) {
            item = trim(item);
            if (!item.empty()) {
                items.push_back(item);
            }
        }
        
        return items;
    }
    
    std::string toLower(std::string text) {
        std::transform(text.begin(), text.end(), text.begin(), ::tolower);
        return text;
    }
}
