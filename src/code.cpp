#include "code.hpp"
#include <fmt/core.h>

namespace funcobj {

Code::Code(std::string name, std::vector<Ref> consts, std::vector<std::string> freevars)
    : name_(std::move(name)), consts_(std::move(consts)), freevars_(std::move(freevars)) {
}

const TypeRef& code_type() {
    static const TypeRef type = std::make_shared<Type>("code");
    return type;
}

TypeRef Code::type() const {
    return code_type();
}

std::string Code::repr() const {
    return fmt::format("<code object {} at {}>", name_, address_of(this));
}

} // namespace funcobj
