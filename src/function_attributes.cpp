#include "function_object.hpp"
#include "errors.hpp"
#include "property.hpp"
#include <fmt/core.h>
#include <vector>

namespace funcobj {

// Accessor for one attribute of function objects. Missing setter: read-only.
// Missing deleter: cannot be deleted.
struct FunctionAccessor {
    const char* name;
    Property::Getter fget;
    Property::Setter fset;
    Property::Deleter fdel;
};

static FunctionObject& as_function(Object& self, const char* attribute) {
    auto* function = dynamic_cast<FunctionObject*>(&self);
    if (function == nullptr) {
        throw TypeError(fmt::format("descriptor '{}' for 'function' objects doesn't apply to a '{}' object",
                                    attribute, self.type()->name()));
    }
    return *function;
}

[[noreturn]] static void wrong_type(const char* attribute, const char* expected, const Ref& value) {
    throw TypeError(fmt::format("{} must be set to a {} object, not '{}'", attribute, expected, type_name(value)));
}

static Ref or_none(const Ref& value) {
    return value ? value : none();
}

static TupleRef must_be_tuple(const char* attribute, const Ref& value) {
    auto tuple = std::dynamic_pointer_cast<Tuple>(value);
    if (!tuple) {
        wrong_type(attribute, "tuple", value);
    }
    return tuple;
}

static DictRef must_be_dict(const char* attribute, const Ref& value) {
    auto dict = std::dynamic_pointer_cast<Dict>(value);
    if (!dict) {
        wrong_type(attribute, "dict", value);
    }
    return dict;
}

static const std::string& must_be_string(const char* attribute, const Ref& value) {
    auto* string = dynamic_cast<String*>(value.get());
    if (string == nullptr) {
        wrong_type(attribute, "string", value);
    }
    return string->value();
}

static const std::vector<FunctionAccessor> function_accessors = {
    {
        "__code__",
        [](Object& self) -> Ref { return as_function(self, "__code__").code(); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__code__");
            auto code = std::dynamic_pointer_cast<Code>(value);
            if (!code) {
                throw TypeError(fmt::format("__code__ must be set to a code object, not '{}'", type_name(value)));
            }
            f.set_code(code);
        },
        nullptr
    },
    {
        "__defaults__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__defaults__").defaults()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__defaults__");
            f.set_defaults(must_be_tuple("__defaults__", value));
        },
        [](Object& self) { as_function(self, "__defaults__").set_defaults(nullptr); }
    },
    {
        "__kwdefaults__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__kwdefaults__").kwdefaults()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__kwdefaults__");
            f.set_kwdefaults(must_be_dict("__kwdefaults__", value));
        },
        [](Object& self) { as_function(self, "__kwdefaults__").set_kwdefaults(nullptr); }
    },
    {
        "__annotations__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__annotations__").annotations()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__annotations__");
            f.set_annotations(must_be_dict("__annotations__", value));
        },
        [](Object& self) { as_function(self, "__annotations__").set_annotations(nullptr); }
    },
    {
        "__dict__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__dict__").dict()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__dict__");
            f.set_dict(must_be_dict("__dict__", value));
        },
        [](Object& self) { as_function(self, "__dict__").set_dict(nullptr); }
    },
    {
        "__name__",
        [](Object& self) -> Ref { return make_string(as_function(self, "__name__").name()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__name__");
            f.set_name(must_be_string("__name__", value));
        },
        nullptr
    },
    {
        "__qualname__",
        [](Object& self) -> Ref { return make_string(as_function(self, "__qualname__").qualname()); },
        [](Object& self, const Ref& value) {
            FunctionObject& f = as_function(self, "__qualname__");
            f.set_qualname(must_be_string("__qualname__", value));
        },
        nullptr
    },
    {
        "__doc__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__doc__").doc()); },
        [](Object& self, const Ref& value) { as_function(self, "__doc__").set_doc(value); },
        [](Object& self) { as_function(self, "__doc__").set_doc(none()); }
    },
    {
        "__module__",
        [](Object& self) -> Ref { return or_none(as_function(self, "__module__").module()); },
        [](Object& self, const Ref& value) { as_function(self, "__module__").set_module(value); },
        [](Object& self) { as_function(self, "__module__").set_module(none()); }
    },
    {
        "__globals__",
        [](Object& self) -> Ref { return as_function(self, "__globals__").globals(); },
        nullptr,
        nullptr
    },
    {
        "__closure__",
        [](Object& self) -> Ref {
            const TupleRef& closure = as_function(self, "__closure__").closure();
            if (closure->empty()) {
                return none();
            }
            return closure;
        },
        nullptr,
        nullptr
    },
};

static TypeRef make_function_type() {
    auto type = std::make_shared<Type>("function");
    for (const auto& accessor : function_accessors) {
        type->dict().set(accessor.name,
                         std::make_shared<Property>(accessor.name, accessor.fget, accessor.fset, accessor.fdel));
    }
    return type;
}

const TypeRef& function_type() {
    static const TypeRef type = make_function_type();
    return type;
}

} // namespace funcobj
