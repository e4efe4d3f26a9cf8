#ifndef EVALUATOR_HPP
#define EVALUATOR_HPP

#include "code.hpp"
#include "value.hpp"

namespace funcobj {

// The bytecode evaluator that runs a code object. Argument binding, arity and
// type checks all belong to the evaluator; anything it throws reaches the
// caller of Function::call unchanged.
class Evaluator {
public:
    virtual ~Evaluator() = default;

    // defaults, kwdefaults may be nullptr (absent). closure is never nullptr.
    virtual Ref evaluate(
        const CodeRef& code,
        const DictRef& globals,
        const DictRef& locals,
        const Tuple& args,
        const Dict& kwargs,
        const TupleRef& defaults,
        const DictRef& kwdefaults,
        const TupleRef& closure) = 0;
};

// Install the process-wide evaluator (not owned). Returns the previous one.
Evaluator* install_evaluator(Evaluator* evaluator);

// The installed evaluator. Throws std::logic_error if none is installed.
Evaluator& current_evaluator();

// Installs an evaluator for the lifetime of the scope and restores the previous one.
class EvaluatorScope {
private:
    Evaluator* previous_;

public:
    explicit EvaluatorScope(Evaluator& evaluator)
        : previous_(install_evaluator(&evaluator)) {}
    ~EvaluatorScope() { install_evaluator(previous_); }

    EvaluatorScope(const EvaluatorScope&) = delete;
    EvaluatorScope& operator=(const EvaluatorScope&) = delete;
};

} // namespace funcobj

#endif // EVALUATOR_HPP
