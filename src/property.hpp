#ifndef PROPERTY_HPP
#define PROPERTY_HPP

#include "value.hpp"
#include <functional>
#include <string>

namespace funcobj {

// Property is an attribute descriptor stored in a type dictionary. The getter
// is always present; without a setter the attribute is read-only and without a
// deleter it cannot be deleted.
class Property : public Object {
public:
    using Getter = std::function<Ref(Object& self)>;
    using Setter = std::function<void(Object& self, const Ref& value)>;
    using Deleter = std::function<void(Object& self)>;

private:
    std::string name_;
    Getter fget_;
    Setter fset_;
    Deleter fdel_;

public:
    Property(std::string name, Getter fget, Setter fset = nullptr, Deleter fdel = nullptr);

    const std::string& name() const { return name_; }

    Ref get(Object& self) const;

    // Throws AttributeError if the property is read-only.
    void set(Object& self, const Ref& value) const;

    // Throws AttributeError if the property cannot be deleted.
    void del(Object& self) const;

    TypeRef type() const override;
    std::string repr() const override;
};

using PropertyRef = std::shared_ptr<Property>;

const TypeRef& property_type();

} // namespace funcobj

#endif // PROPERTY_HPP
