#ifndef VALUE_HPP
#define VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace funcobj {

class Object;
class Type;
class Tuple;
class Dict;

// Every interpreter value is shared by reference. Lifetime is that of the longest holder.
using Ref = std::shared_ptr<Object>;
using TypeRef = std::shared_ptr<Type>;
using TupleRef = std::shared_ptr<Tuple>;
using DictRef = std::shared_ptr<Dict>;

// Base of all heap objects seen by interpreted code.
class Object : public std::enable_shared_from_this<Object> {
public:
    virtual ~Object() = default;

    virtual TypeRef type() const = 0;

    // Readable rendering, e.g. for error messages and the inspector.
    virtual std::string repr() const;

    // Pointer to the slot holding the instance dictionary, or nullptr for objects that
    // cannot carry arbitrary attributes. The slot itself may hold nullptr (no attributes yet).
    virtual DictRef* dict_slot() { return nullptr; }

    Ref self() { return shared_from_this(); }
};

// Objects that can be invoked with positional and keyword arguments.
class Callable {
public:
    virtual ~Callable() = default;
    virtual Ref call(const Tuple& args, const Dict& kwargs) = 0;
};

// Objects that transform themselves when read out of a type dictionary.
// instance is None when the attribute is read from the type itself.
class Bindable {
public:
    virtual ~Bindable() = default;
    virtual Ref get(const Ref& instance, const Ref& owner) = 0;
};

class NoneType : public Object {
public:
    TypeRef type() const override;
    std::string repr() const override { return "None"; }
};

class Bool : public Object {
private:
    bool value_;

public:
    explicit Bool(bool value) : value_(value) {}
    bool value() const { return value_; }
    TypeRef type() const override;
    std::string repr() const override { return value_ ? "True" : "False"; }
};

class Int : public Object {
private:
    int64_t value_;

public:
    explicit Int(int64_t value) : value_(value) {}
    int64_t value() const { return value_; }
    TypeRef type() const override;
    std::string repr() const override;
};

class Float : public Object {
private:
    double value_;

public:
    explicit Float(double value) : value_(value) {}
    double value() const { return value_; }
    TypeRef type() const override;
    std::string repr() const override;
};

class String : public Object {
private:
    std::string value_;

public:
    explicit String(std::string value) : value_(std::move(value)) {}
    const std::string& value() const { return value_; }
    TypeRef type() const override;
    std::string repr() const override;
};

// Immutable ordered sequence.
class Tuple : public Object {
private:
    std::vector<Ref> items_;

public:
    Tuple() = default;
    explicit Tuple(std::vector<Ref> items) : items_(std::move(items)) {}

    const std::vector<Ref>& items() const { return items_; }
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const Ref& operator[](size_t index) const { return items_[index]; }

    TypeRef type() const override;
    std::string repr() const override;
};

// Mutable string-keyed mapping. Shared by reference: all holders see mutations.
class Dict : public Object {
private:
    std::unordered_map<std::string, Ref> items_;

public:
    Dict() = default;

    // Returns nullptr if key is not present.
    Ref get(const std::string& key) const;
    void set(const std::string& key, Ref value);
    // Returns false if key was not present.
    bool erase(const std::string& key);
    bool contains(const std::string& key) const { return items_.count(key) != 0; }

    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }
    const std::unordered_map<std::string, Ref>& items() const { return items_; }

    TypeRef type() const override;
    std::string repr() const override;
};

// Type objects carry a name and the type dictionary searched by the attribute protocol.
class Type : public Object {
private:
    std::string name_;
    DictRef dict_;

public:
    explicit Type(std::string name);

    const std::string& name() const { return name_; }
    Dict& dict() { return *dict_; }
    const Dict& dict() const { return *dict_; }

    TypeRef type() const override;
    std::string repr() const override;
    DictRef* dict_slot() override { return &dict_; }
};

// Built-in types.
const TypeRef& type_type();
const TypeRef& none_type();
const TypeRef& bool_type();
const TypeRef& int_type();
const TypeRef& float_type();
const TypeRef& string_type();
const TypeRef& tuple_type();
const TypeRef& dict_type();

// The None singleton, also used as the "no instance" sentinel of the binding protocol.
const Ref& none();

inline bool is_none(const Ref& value) {
    return value == none();
}

inline Ref make_bool(bool value) {
    return std::make_shared<Bool>(value);
}

inline Ref make_int(int64_t value) {
    return std::make_shared<Int>(value);
}

inline Ref make_float(double value) {
    return std::make_shared<Float>(value);
}

inline Ref make_string(const std::string& value) {
    return std::make_shared<String>(value);
}

inline TupleRef make_tuple(std::vector<Ref> items = {}) {
    return std::make_shared<Tuple>(std::move(items));
}

inline DictRef make_dict() {
    return std::make_shared<Dict>();
}

// Name of the value's type, or "NULL" for a missing reference.
std::string type_name(const Ref& value);

// Render a value; a missing reference renders as "NULL".
std::string to_string(const Ref& value);

// Address of an object, formatted the way reprs show it.
std::string address_of(const Object* object);

} // namespace funcobj

#endif // VALUE_HPP
