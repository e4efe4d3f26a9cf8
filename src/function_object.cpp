#include "function_object.hpp"
#include "bound_method.hpp"
#include "cell.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "trace.hpp"
#include <fmt/core.h>
#include <stdexcept>

namespace funcobj {

FunctionObject::FunctionObject(CodeRef code, DictRef globals, const std::string& qualname)
    : code_(std::move(code)), globals_(std::move(globals)) {
    if (!code_) {
        throw std::logic_error("FunctionObject requires a code object");
    }
    if (!globals_) {
        throw std::logic_error("FunctionObject requires a globals dictionary");
    }

    // The docstring is the first constant, if it is a string.
    doc_ = none();
    const auto& consts = code_->consts();
    if (!consts.empty() && std::dynamic_pointer_cast<String>(consts[0])) {
        doc_ = consts[0];
    }

    module_ = none();
    if (Ref module = globals_->get("__name__")) {
        module_ = module;
    }

    name_ = code_->name();
    qualname_ = qualname.empty() ? name_ : qualname;
    closure_ = make_tuple();
}

std::shared_ptr<FunctionObject> FunctionObject::make(CodeRef code, DictRef globals, const std::string& qualname) {
    return std::make_shared<FunctionObject>(std::move(code), std::move(globals), qualname);
}

Ref FunctionObject::call(const Tuple& args, const Dict& kwargs) {
    if constexpr (TRACE_CALLS) {
        fmt::print("CALL {} with {} positional, {} keyword\n", qualname_, args.size(), kwargs.size());
    }
    Evaluator& evaluator = current_evaluator();
    // The running frame owns its slots; the body may reassign the attributes or drop the function.
    Ref keep = self();
    CodeRef code = code_;
    DictRef globals = globals_;
    TupleRef defaults = defaults_;
    DictRef kwdefaults = kwdefaults_;
    TupleRef closure = closure_;
    return evaluator.evaluate(code, globals, make_dict(), args, kwargs, defaults, kwdefaults, closure);
}

Ref FunctionObject::get(const Ref& instance, const Ref& owner) {
    if (!instance || is_none(instance)) {
        return self();
    }
    return std::make_shared<BoundMethod>(instance, std::static_pointer_cast<FunctionObject>(self()));
}

TypeRef FunctionObject::type() const {
    return function_type();
}

std::string FunctionObject::repr() const {
    return fmt::format("<function {} at {}>", qualname_, address_of(this));
}

void FunctionObject::set_code(const CodeRef& code) {
    if (!code) {
        throw std::logic_error("set_code requires a code object");
    }
    size_t nfree = code->nfree();
    size_t nclosure = closure_->size();
    if (nfree != nclosure) {
        throw ValueError(fmt::format("{}() requires a code object with {} free vars, not {}",
                                     name_, nclosure, nfree));
    }
    code_ = code;
}

void FunctionObject::set_closure(const TupleRef& closure) {
    TupleRef cells = closure ? closure : make_tuple();
    if (cells->size() != code_->nfree()) {
        throw std::logic_error(fmt::format("{}() has {} free vars but was given a closure of {} cells",
                                           name_, code_->nfree(), cells->size()));
    }
    for (const auto& item : cells->items()) {
        if (!std::dynamic_pointer_cast<Cell>(item)) {
            throw std::logic_error(fmt::format("{}() closure contains a '{}', not a cell",
                                               name_, type_name(item)));
        }
    }
    closure_ = cells;
}

void FunctionObject::add_weak_reference(const Ref& observer) {
    weakrefs_.emplace_back(observer);
}

std::vector<Ref> FunctionObject::weak_references() {
    std::vector<Ref> alive;
    std::vector<std::weak_ptr<Object>> kept;
    for (const auto& weak : weakrefs_) {
        if (Ref observer = weak.lock()) {
            alive.push_back(observer);
            kept.push_back(weak);
        }
    }
    weakrefs_ = std::move(kept);
    return alive;
}

} // namespace funcobj
