#include "evaluator.hpp"
#include <stdexcept>

namespace funcobj {

static Evaluator* the_evaluator = nullptr;

Evaluator* install_evaluator(Evaluator* evaluator) {
    Evaluator* previous = the_evaluator;
    the_evaluator = evaluator;
    return previous;
}

Evaluator& current_evaluator() {
    if (the_evaluator == nullptr) {
        throw std::logic_error("No evaluator installed");
    }
    return *the_evaluator;
}

} // namespace funcobj
