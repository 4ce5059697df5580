#include "lib/confirm.hpp"
#include "utils/colors.hpp"
#include <istream>
#include <ostream>

namespace Confirm {
    
    bool requireToken(std::istream& in, std::ostream& out,
                      const std::string& prompt, const std::string& token) {
        out << Colors::bold(prompt) << " (type '" << token << "' to continue): ";
        out.flush();
        
        std::string answer;
        if (!std::getline(in, answer)) {
            out << std::endl;
            return false;
        }
        
        if (!answer.empty() && answer.back() == '\r') {
            answer.pop_back();
        }
        
        return answer == token;
    }
}
