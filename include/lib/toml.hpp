#ifndef TOML_HPP
#define TOML_HPP

#include <string>
#include <utility>
#include <vector>

// Just enough TOML for installer answer files: sections, dotted keys taken
// literally, basic strings, booleans, integers and arrays of strings.
namespace Toml {
    
    std::string quote(const std::string& value);
    std::string array(const std::vector<std::string>& values, bool multiline = false);
    
    class Document {
    private:
        struct Value {
            bool isArray = false;
            std::string scalar;
            std::vector<std::string> items;
        };
        
        struct Section {
            std::vector<std::pair<std::string, Value>> entries;
        };
        
        std::vector<std::pair<std::string, Section>> sections;
    
    public:
        // Throws ValidationError on malformed input.
        static Document parse(const std::string& text);
        
        bool has(const std::string& section, const std::string& key) const;
        std::string getString(const std::string& section, const std::string& key,
                              const std::string& def = "") const;
        std::vector<std::string> getArray(const std::string& section, const std::string& key) const;
    
    private:
        const Value* find(const std::string& section, const std::string& key) const;
        Section& ensureSection(const std::string& name);
    };
}

#endif // TOML_HPP
