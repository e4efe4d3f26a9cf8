#include "value.hpp"
#include <fmt/core.h>

namespace funcobj {

std::string Object::repr() const {
    return fmt::format("<{} object at {}>", type()->name(), address_of(this));
}

TypeRef NoneType::type() const {
    return none_type();
}

TypeRef Bool::type() const {
    return bool_type();
}

TypeRef Int::type() const {
    return int_type();
}

std::string Int::repr() const {
    return fmt::format("{}", value_);
}

TypeRef Float::type() const {
    return float_type();
}

std::string Float::repr() const {
    return fmt::format("{}", value_);
}

TypeRef String::type() const {
    return string_type();
}

std::string String::repr() const {
    std::string out = "'";
    for (char c : value_) {
        switch (c) {
            case '\'': out += "\\'"; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default: out += c; break;
        }
    }
    out += "'";
    return out;
}

TypeRef Tuple::type() const {
    return tuple_type();
}

std::string Tuple::repr() const {
    std::string out = "(";
    for (size_t i = 0; i < items_.size(); i++) {
        if (i > 0) {
            out += ", ";
        }
        out += to_string(items_[i]);
    }
    // A one-element tuple keeps its trailing comma.
    if (items_.size() == 1) {
        out += ",";
    }
    out += ")";
    return out;
}

Ref Dict::get(const std::string& key) const {
    auto it = items_.find(key);
    if (it == items_.end()) {
        return nullptr;
    }
    return it->second;
}

void Dict::set(const std::string& key, Ref value) {
    items_[key] = std::move(value);
}

bool Dict::erase(const std::string& key) {
    return items_.erase(key) != 0;
}

TypeRef Dict::type() const {
    return dict_type();
}

std::string Dict::repr() const {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : items_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += fmt::format("'{}': {}", key, to_string(value));
    }
    out += "}";
    return out;
}

Type::Type(std::string name)
    : name_(std::move(name)), dict_(make_dict()) {
}

TypeRef Type::type() const {
    return type_type();
}

std::string Type::repr() const {
    return fmt::format("<class '{}'>", name_);
}

const TypeRef& type_type() {
    static const TypeRef type = std::make_shared<Type>("type");
    return type;
}

const TypeRef& none_type() {
    static const TypeRef type = std::make_shared<Type>("NoneType");
    return type;
}

const TypeRef& bool_type() {
    static const TypeRef type = std::make_shared<Type>("bool");
    return type;
}

const TypeRef& int_type() {
    static const TypeRef type = std::make_shared<Type>("int");
    return type;
}

const TypeRef& float_type() {
    static const TypeRef type = std::make_shared<Type>("float");
    return type;
}

const TypeRef& string_type() {
    static const TypeRef type = std::make_shared<Type>("str");
    return type;
}

const TypeRef& tuple_type() {
    static const TypeRef type = std::make_shared<Type>("tuple");
    return type;
}

const TypeRef& dict_type() {
    static const TypeRef type = std::make_shared<Type>("dict");
    return type;
}

const Ref& none() {
    static const Ref value = std::make_shared<NoneType>();
    return value;
}

std::string type_name(const Ref& value) {
    if (!value) {
        return "NULL";
    }
    return value->type()->name();
}

std::string to_string(const Ref& value) {
    if (!value) {
        return "NULL";
    }
    return value->repr();
}

std::string address_of(const Object* object) {
    return fmt::format("0x{:x}", reinterpret_cast<uintptr_t>(object));
}

} // namespace funcobj
