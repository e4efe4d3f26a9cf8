#include "bound_method.hpp"
#include "errors.hpp"
#include "function_object.hpp"
#include "property.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace funcobj {

BoundMethod::BoundMethod(Ref instance, std::shared_ptr<FunctionObject> function)
    : instance_(std::move(instance)), function_(std::move(function)) {
    if (!instance_ || !function_) {
        throw std::logic_error("BoundMethod requires an instance and a function");
    }
}

Ref BoundMethod::call(const Tuple& args, const Dict& kwargs) {
    std::vector<Ref> items;
    items.reserve(args.size() + 1);
    items.push_back(instance_);
    items.insert(items.end(), args.items().begin(), args.items().end());
    return function_->call(Tuple(std::move(items)), kwargs);
}

static BoundMethod& as_method(Object& self, const char* attribute) {
    auto* method = dynamic_cast<BoundMethod*>(&self);
    if (method == nullptr) {
        throw TypeError(fmt::format("descriptor '{}' for 'method' objects doesn't apply to a '{}' object",
                                    attribute, self.type()->name()));
    }
    return *method;
}

static TypeRef make_method_type() {
    auto type = std::make_shared<Type>("method");
    type->dict().set("__self__", std::make_shared<Property>("__self__",
        [](Object& self) -> Ref { return as_method(self, "__self__").instance(); }));
    type->dict().set("__func__", std::make_shared<Property>("__func__",
        [](Object& self) -> Ref { return as_method(self, "__func__").function(); }));
    return type;
}

const TypeRef& method_type() {
    static const TypeRef type = make_method_type();
    return type;
}

TypeRef BoundMethod::type() const {
    return method_type();
}

std::string BoundMethod::repr() const {
    return fmt::format("<bound method {} of {}>", function_->qualname(), to_string(instance_));
}

} // namespace funcobj
