#ifndef CODE_HPP
#define CODE_HPP

#include "value.hpp"
#include <memory>
#include <string>
#include <vector>

namespace funcobj {

// Code is the compiled, immutable body of a function definition. One Code can
// back any number of Function objects.
class Code : public Object {
private:
    const std::string name_;
    const std::vector<Ref> consts_;
    const std::vector<std::string> freevars_;

public:
    Code(std::string name, std::vector<Ref> consts, std::vector<std::string> freevars);

    const std::string& name() const { return name_; }

    // Constants of the body. A textual first constant is taken as the docstring.
    const std::vector<Ref>& consts() const { return consts_; }

    // Names captured from enclosing scopes; a closure must supply one cell for each.
    const std::vector<std::string>& freevars() const { return freevars_; }
    size_t nfree() const { return freevars_.size(); }

    TypeRef type() const override;
    std::string repr() const override;
};

using CodeRef = std::shared_ptr<Code>;

const TypeRef& code_type();

inline CodeRef make_code(const std::string& name, std::vector<Ref> consts = {},
                         std::vector<std::string> freevars = {}) {
    return std::make_shared<Code>(name, std::move(consts), std::move(freevars));
}

} // namespace funcobj

#endif // CODE_HPP
