#ifndef BOUND_METHOD_HPP
#define BOUND_METHOD_HPP

#include "value.hpp"
#include <memory>

namespace funcobj {

class FunctionObject;

// A function read off an instance. Calling it calls the function with the
// instance in front of the positional arguments.
class BoundMethod : public Object, public Callable {
private:
    Ref instance_;
    std::shared_ptr<FunctionObject> function_;

public:
    BoundMethod(Ref instance, std::shared_ptr<FunctionObject> function);

    const Ref& instance() const { return instance_; }
    const std::shared_ptr<FunctionObject>& function() const { return function_; }

    Ref call(const Tuple& args, const Dict& kwargs) override;

    TypeRef type() const override;
    std::string repr() const override;
};

using BoundMethodRef = std::shared_ptr<BoundMethod>;

const TypeRef& method_type();

} // namespace funcobj

#endif // BOUND_METHOD_HPP
