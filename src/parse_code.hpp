#ifndef PARSE_CODE_HPP
#define PARSE_CODE_HPP

#include "code.hpp"
#include "value.hpp"
#include <stdexcept>
#include <string>

namespace funcobj {

class CodeParseError : public std::runtime_error {
public:
    explicit CodeParseError(const std::string& msg) : std::runtime_error(msg) {}
};

// Builds Code objects from their JSON form:
//   {"name": "add", "consts": ["adds two numbers", 1], "freevars": ["x"]}
// consts and freevars are optional.
class ParseCode {
public:
    explicit ParseCode(const std::string& idname);

    CodeRef parse(const std::string& json_str);

private:
    std::string idname_;
};

// Convert a JSON text to a value: null, booleans, numbers, strings, arrays
// (as tuples) and objects (as dicts).
Ref parse_value(const std::string& json_str);

} // namespace funcobj

#endif // PARSE_CODE_HPP
