#include "cell.hpp"
#include <fmt/core.h>

namespace funcobj {

const TypeRef& cell_type() {
    static const TypeRef type = std::make_shared<Type>("cell");
    return type;
}

TypeRef Cell::type() const {
    return cell_type();
}

std::string Cell::repr() const {
    if (empty()) {
        return fmt::format("<cell at {}: empty>", address_of(this));
    }
    return fmt::format("<cell at {}: {} object at {}>",
                       address_of(this), type_name(contents_), address_of(contents_.get()));
}

} // namespace funcobj
