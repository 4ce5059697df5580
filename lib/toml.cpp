#include "lib/toml.hpp"
#include "lib/errors.hpp"
#include "utils/strings.hpp"
#include <cctype>
#include <sstream>

namespace Toml {
    
    namespace {
        // Reads a basic string starting at text[pos] == '"'; leaves pos after the closing quote.
        std::string readString(const std::string& text, size_t& pos) {
            std::string value;
            ++pos;
            
            while (pos < text.size()) {
                char c = text[pos++];
                if (c == '"') {
                    return value;
                }
                if (c != '\\') {
                    value += c;
                    continue;
                }
                if (pos >= text.size()) {
                    break;
                }
                
                char escaped = text[pos++];
                switch (escaped) {
                    case 'n': value += '\n'; break;
                    case 't': value += '\t'; break;
                    case 'r': value += '\r'; break;
                    case '"': value += '"'; break;
                    case '\\': value += '\\'; break;
                    default:
                        throw ValidationError(std::string("Unsupported escape \\") + escaped + " in TOML string");
                }
            }
            
            throw ValidationError("Unterminated TOML string");
        }
        
        // Bracket depth outside strings; used to join multi-line arrays.
        int bracketBalance(const std::string& text) {
            int depth = 0;
            bool inString = false;
            for (size_t i = 0; i < text.size(); ++i) {
                char c = text[i];
                if (inString) {
                    if (c == '\\') ++i;
                    else if (c == '"') inString = false;
                } else if (c == '"') {
                    inString = true;
                } else if (c == '#') {
                    break;
                } else if (c == '[') {
                    ++depth;
                } else if (c == ']') {
                    --depth;
                }
            }
            return depth;
        }
    }
    
    std::string quote(const std::string& value) {
        std::string quoted = "\"";
        for (char c : value) {
            switch (c) {
                case '"': quoted += "\\\""; break;
                case '\\': quoted += "\\\\"; break;
                case '\n': quoted += "\\n"; break;
                case '\t': quoted += "\\t"; break;
                case '\r': quoted += "\\r"; break;
                default: quoted += c;
            }
        }
        quoted += "\"";
        return quoted;
    }
    
    std::string array(const std::vector<std::string>& values, bool multiline) {
        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (multiline) {
                out += "\n    ";
            } else if (i > 0) {
                out += " ";
            }
            out += quote(values[i]);
            if (i + 1 < values.size() || multiline) {
                out += ",";
            }
        }
        if (multiline && !values.empty()) {
            out += "\n";
        }
        out += "]";
        return out;
    }
    
    Document Document::parse(const std::string& text) {
        Document doc;
        std::istringstream lines(text);
        std::string current;
        std::string raw;
        int lineNumber = 0;
        
        while (std::getline(lines, raw)) {
            ++lineNumber;
            std::string line = Strings::trim(raw);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            
            if (line[0] == '[') {
                size_t close = line.find(']');
                if (close == std::string::npos) {
                    throw ValidationError("Malformed section header on line " + std::to_string(lineNumber));
                }
                current = Strings::trim(line.substr(1, close - 1));
                doc.ensureSection(current);
                continue;
            }
            
            size_t eq = line.find('=');
            if (eq == std::string::npos) {
                throw ValidationError("Expected key = value on line " + std::to_string(lineNumber));
            }
            
            std::string key = Strings::trim(line.substr(0, eq));
            std::string rest = Strings::trim(line.substr(eq + 1));
            
            while (bracketBalance(rest) > 0 && std::getline(lines, raw)) {
                ++lineNumber;
                rest += " " + Strings::trim(raw);
            }
            
            Value value;
            size_t pos = 0;
            
            if (!rest.empty() && rest[0] == '"') {
                value.scalar = readString(rest, pos);
            } else if (!rest.empty() && rest[0] == '[') {
                value.isArray = true;
                pos = 1;
                while (pos < rest.size()) {
                    char c = rest[pos];
                    if (c == ']') break;
                    if (c == '"') {
                        value.items.push_back(readString(rest, pos));
                    } else if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
                        ++pos;
                    } else {
                        throw ValidationError("Only string arrays are supported (line " +
                                              std::to_string(lineNumber) + ")");
                    }
                }
                if (pos >= rest.size()) {
                    throw ValidationError("Unterminated array on line " + std::to_string(lineNumber));
                }
            } else {
                size_t hash = rest.find('#');
                value.scalar = Strings::trim(rest.substr(0, hash));
            }
            
            doc.ensureSection(current).entries.emplace_back(key, value);
        }
        
        return doc;
    }
    
    bool Document::has(const std::string& section, const std::string& key) const {
        return find(section, key) != nullptr;
    }
    
    std::string Document::getString(const std::string& section, const std::string& key,
                                     const std::string& def) const {
        const Value* value = find(section, key);
        return (value && !value->isArray) ? value->scalar : def;
    }
    
    std::vector<std::string> Document::getArray(const std::string& section, const std::string& key) const {
        const Value* value = find(section, key);
        return (value && value->isArray) ? value->items : std::vector<std::string>();
    }
    
    const Document::Value* Document::find(const std::string& section, const std::string& key) const {
        for (const auto& s : sections) {
            if (s.first != section) continue;
            for (const auto& entry : s.second.entries) {
                if (entry.first == key) {
                    return &entry.second;
                }
            }
        }
        return nullptr;
    }
    
    Document::Section& Document::ensureSection(const std::string& name) {
        for (auto& s : sections) {
            if (s.first == name) return s.second;
        }
        sections.emplace_back(name, Section {});
        return sections.back().second;
    }
}
