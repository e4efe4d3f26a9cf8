#include "protocol.hpp"
#include "errors.hpp"
#include "property.hpp"
#include "trace.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace funcobj {

static void must_be_object(const Ref& obj, const char* operation) {
    if (!obj) {
        throw std::logic_error(fmt::format("{}: NULL object", operation));
    }
}

static Property* as_property(const Ref& descr) {
    return dynamic_cast<Property*>(descr.get());
}

Ref get_attribute(const Ref& obj, const std::string& name) {
    must_be_object(obj, "get_attribute");
    if constexpr (TRACE_ATTRIBUTES) {
        fmt::print("GET {}.{}\n", type_name(obj), name);
    }

    // Attributes read off a type come from its own dictionary, with no instance to bind.
    if (auto cls = std::dynamic_pointer_cast<Type>(obj)) {
        Ref found = cls->dict().get(name);
        if (!found) {
            throw AttributeError(fmt::format("type object '{}' has no attribute '{}'", cls->name(), name));
        }
        if (auto* bindable = dynamic_cast<Bindable*>(found.get())) {
            return bindable->get(none(), obj);
        }
        return found;
    }

    TypeRef cls = obj->type();
    Ref descr = cls->dict().get(name);
    if (Property* property = as_property(descr)) {
        return property->get(*obj);
    }

    if (DictRef* slot = obj->dict_slot(); slot != nullptr && *slot) {
        if (Ref value = (*slot)->get(name)) {
            return value;
        }
    }

    if (descr) {
        if (auto* bindable = dynamic_cast<Bindable*>(descr.get())) {
            if constexpr (TRACE_ATTRIBUTES_DETAIL) {
                fmt::print("  binding {} to {}\n", to_string(descr), to_string(obj));
            }
            return bindable->get(obj, cls);
        }
        return descr;
    }

    throw AttributeError(fmt::format("'{}' object has no attribute '{}'", cls->name(), name));
}

void set_attribute(const Ref& obj, const std::string& name, const Ref& value) {
    must_be_object(obj, "set_attribute");
    if constexpr (TRACE_ATTRIBUTES) {
        fmt::print("SET {}.{} = {}\n", type_name(obj), name, to_string(value));
    }

    if (Property* property = as_property(obj->type()->dict().get(name))) {
        property->set(*obj, value);
        return;
    }

    DictRef* slot = obj->dict_slot();
    if (slot == nullptr) {
        throw AttributeError(fmt::format("'{}' object has no attribute '{}'", type_name(obj), name));
    }
    if (!*slot) {
        *slot = make_dict();
    }
    (*slot)->set(name, value);
}

void delete_attribute(const Ref& obj, const std::string& name) {
    must_be_object(obj, "delete_attribute");
    if constexpr (TRACE_ATTRIBUTES) {
        fmt::print("DELETE {}.{}\n", type_name(obj), name);
    }

    if (Property* property = as_property(obj->type()->dict().get(name))) {
        property->del(*obj);
        return;
    }

    DictRef* slot = obj->dict_slot();
    if (slot == nullptr || !*slot || !(*slot)->erase(name)) {
        throw AttributeError(fmt::format("'{}' object has no attribute '{}'", type_name(obj), name));
    }
}

Ref call(const Ref& callable, const Tuple& args, const Dict& kwargs) {
    must_be_object(callable, "call");
    auto* target = dynamic_cast<Callable*>(callable.get());
    if (target == nullptr) {
        throw TypeError(fmt::format("'{}' object is not callable", type_name(callable)));
    }
    return target->call(args, kwargs);
}

} // namespace funcobj
