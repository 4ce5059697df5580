#ifndef CONFIRM_HPP
#define CONFIRM_HPP

#include <iosfwd>
#include <string>

namespace Confirm {
    // Prints the prompt and reads one line. Only an exact match of the token
    // proceeds; anything else, including empty input or EOF, declines.
    bool requireToken(std::istream& in, std::ostream& out,
                      const std::string& prompt, const std::string& token);
}

#endif // CONFIRM_HPP
