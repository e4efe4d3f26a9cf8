#include "property.hpp"
#include "errors.hpp"
#include <fmt/core.h>

namespace funcobj {

Property::Property(std::string name, Getter fget, Setter fset, Deleter fdel)
    : name_(std::move(name)), fget_(std::move(fget)), fset_(std::move(fset)), fdel_(std::move(fdel)) {
}

Ref Property::get(Object& self) const {
    return fget_(self);
}

void Property::set(Object& self, const Ref& value) const {
    if (!fset_) {
        throw AttributeError(fmt::format("readonly attribute '{}'", name_));
    }
    fset_(self, value);
}

void Property::del(Object& self) const {
    if (!fdel_) {
        throw AttributeError(fmt::format("can't delete attribute '{}'", name_));
    }
    fdel_(self);
}

const TypeRef& property_type() {
    static const TypeRef type = std::make_shared<Type>("property");
    return type;
}

TypeRef Property::type() const {
    return property_type();
}

std::string Property::repr() const {
    return fmt::format("<property '{}'>", name_);
}

} // namespace funcobj
