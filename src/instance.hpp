#ifndef INSTANCE_HPP
#define INSTANCE_HPP

#include "value.hpp"
#include <memory>

namespace funcobj {

// Instance of a user-defined type. Methods live in the type dictionary;
// per-instance attributes live in the instance dictionary.
class Instance : public Object {
private:
    TypeRef class_;
    DictRef dict_;

public:
    explicit Instance(TypeRef cls);

    TypeRef type() const override { return class_; }
    DictRef* dict_slot() override { return &dict_; }
};

using InstanceRef = std::shared_ptr<Instance>;

// Define a new user type with an empty type dictionary.
TypeRef make_type(const std::string& name);

InstanceRef make_instance(const TypeRef& cls);

} // namespace funcobj

#endif // INSTANCE_HPP
