#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include "value.hpp"
#include <string>

namespace funcobj {

// Read an attribute. Lookup order:
//   1. a Property in the type dictionary;
//   2. the instance dictionary;
//   3. any other type-dictionary entry, bound to obj if it is Bindable.
// Reading from a type object searches its own dictionary and binds with no instance.
// Throws AttributeError if nothing is found.
Ref get_attribute(const Ref& obj, const std::string& name);

// Assign an attribute through its Property, or store it in the instance
// dictionary (created on first use). Property setters may throw TypeError or
// ValueError; read-only properties and objects without an instance
// dictionary throw AttributeError.
void set_attribute(const Ref& obj, const std::string& name, const Ref& value);

// Delete an attribute through its Property, or remove it from the instance
// dictionary. Throws AttributeError if it cannot be deleted or is missing.
void delete_attribute(const Ref& obj, const std::string& name);

// Call any callable object. Throws TypeError if callable is not callable.
Ref call(const Ref& callable, const Tuple& args, const Dict& kwargs);

} // namespace funcobj

#endif // PROTOCOL_HPP
