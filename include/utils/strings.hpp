#ifndef STRINGS_HPP
#define STRINGS_HPP

#include <string>
#include <vector>

namespace Strings {
    std::string trim(const std::string& text);
    // "a, b,,c" -> {"a", "b", "c"}
    std::vector<std::string> splitList(const std::string& text, char separator = ',');
    std::string toLower(std::string text);
}

#endif // STRINGS_HPP
