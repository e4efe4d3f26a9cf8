#ifndef FUNCTION_OBJECT_HPP
#define FUNCTION_OBJECT_HPP

#include "code.hpp"
#include "value.hpp"
#include <memory>
#include <string>
#include <vector>

namespace funcobj {

// FunctionObject is created each time a function definition is executed. It
// pairs a shared, immutable Code with the globals of the defining module and
// holds the metadata interpreted code may read and replace at runtime.
//
// Invariant: whenever the closure holds cells, their count equals the number
// of free variables of the code.
class FunctionObject : public Object, public Callable, public Bindable {
private:
    CodeRef code_;
    DictRef globals_;          // Shared with the module, never written here.
    TupleRef defaults_;        // nullptr when absent.
    DictRef kwdefaults_;       // nullptr when absent.
    TupleRef closure_;         // Tuple of Cell, empty when there are no free variables.
    Ref doc_;
    std::string name_;
    std::string qualname_;
    Ref module_;
    DictRef dict_;             // nullptr until an attribute is stored.
    DictRef annotations_;      // nullptr when absent.
    std::vector<std::weak_ptr<Object>> weakrefs_;

public:
    // Use make(); public only for std::make_shared.
    FunctionObject(CodeRef code, DictRef globals, const std::string& qualname);

    // Build a function from a code object and the globals it runs against.
    // docstring, name and __module__ are derived from code and globals; an
    // empty qualname means "same as the name".
    static std::shared_ptr<FunctionObject> make(CodeRef code, DictRef globals, const std::string& qualname = "");

    // Run the body through the installed evaluator with a fresh local scope.
    Ref call(const Tuple& args, const Dict& kwargs) override;

    // Descriptor get: the function itself when read off its type, otherwise a
    // method bound to instance.
    Ref get(const Ref& instance, const Ref& owner) override;

    TypeRef type() const override;
    std::string repr() const override;
    DictRef* dict_slot() override { return &dict_; }

    const CodeRef& code() const { return code_; }
    const DictRef& globals() const { return globals_; }
    const TupleRef& defaults() const { return defaults_; }
    const DictRef& kwdefaults() const { return kwdefaults_; }
    const TupleRef& closure() const { return closure_; }
    const Ref& doc() const { return doc_; }
    const std::string& name() const { return name_; }
    const std::string& qualname() const { return qualname_; }
    const Ref& module() const { return module_; }
    const DictRef& dict() const { return dict_; }
    const DictRef& annotations() const { return annotations_; }

    // Replace the code. Throws ValueError if its free-variable count differs
    // from the closure length; the function is left unchanged.
    void set_code(const CodeRef& code);

    // Install the cells for the code's free variables, done by the interpreter
    // straight after construction. Passing the wrong number of cells, or
    // anything that is not a Cell, is a caller bug: std::logic_error.
    void set_closure(const TupleRef& closure);

    void set_defaults(TupleRef defaults) { defaults_ = std::move(defaults); }
    void set_kwdefaults(DictRef kwdefaults) { kwdefaults_ = std::move(kwdefaults); }
    void set_annotations(DictRef annotations) { annotations_ = std::move(annotations); }
    void set_dict(DictRef dict) { dict_ = std::move(dict); }
    void set_name(const std::string& name) { name_ = name; }
    void set_qualname(const std::string& qualname) { qualname_ = qualname; }
    void set_doc(Ref doc) { doc_ = doc ? std::move(doc) : none(); }
    void set_module(Ref module) { module_ = module ? std::move(module) : none(); }

    // Weak references held by observers of this function.
    void add_weak_reference(const Ref& observer);
    // Observers still alive; expired entries are dropped.
    std::vector<Ref> weak_references();
};

using FunctionRef = std::shared_ptr<FunctionObject>;

// The function type, with the attribute descriptors installed.
const TypeRef& function_type();

} // namespace funcobj

#endif // FUNCTION_OBJECT_HPP
