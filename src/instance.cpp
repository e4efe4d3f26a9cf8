#include "instance.hpp"
#include <stdexcept>

namespace funcobj {

Instance::Instance(TypeRef cls)
    : class_(std::move(cls)), dict_(make_dict()) {
    if (!class_) {
        throw std::logic_error("Instance requires a type");
    }
}

TypeRef make_type(const std::string& name) {
    return std::make_shared<Type>(name);
}

InstanceRef make_instance(const TypeRef& cls) {
    return std::make_shared<Instance>(cls);
}

} // namespace funcobj
