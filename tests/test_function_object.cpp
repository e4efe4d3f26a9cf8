#include <catch2/catch_test_macros.hpp>
#include "../src/cell.hpp"
#include "../src/errors.hpp"
#include "../src/function_object.hpp"
#include "../src/protocol.hpp"
#include "recording_evaluator.hpp"
#include <stdexcept>

using namespace funcobj;

static DictRef module_globals(const std::string& module_name) {
    DictRef globals = make_dict();
    globals->set("__name__", make_string(module_name));
    return globals;
}

static CodeRef add_code() {
    return make_code("add", {make_string("adds two numbers"), make_int(1)});
}

TEST_CASE("FunctionObject takes its metadata from the code and globals", "[function]") {
    CodeRef code = add_code();
    DictRef globals = module_globals("mathmod");

    FunctionRef f = FunctionObject::make(code, globals, "");

    REQUIRE(f->code() == code);
    REQUIRE(f->globals() == globals);
    REQUIRE(f->name() == "add");
    REQUIRE(f->qualname() == "add");
    REQUIRE(std::static_pointer_cast<String>(f->doc())->value() == "adds two numbers");
    REQUIRE(std::static_pointer_cast<String>(f->module())->value() == "mathmod");
    REQUIRE(f->closure()->empty());
    REQUIRE(f->defaults() == nullptr);
    REQUIRE(f->kwdefaults() == nullptr);
    REQUIRE(f->annotations() == nullptr);
    REQUIRE(f->dict() == nullptr);
}

TEST_CASE("FunctionObject keeps an explicit qualified name", "[function]") {
    FunctionRef f = FunctionObject::make(add_code(), module_globals("mathmod"), "Calculator.add");

    REQUIRE(f->name() == "add");
    REQUIRE(f->qualname() == "Calculator.add");
}

TEST_CASE("FunctionObject has no docstring unless the first constant is a string", "[function]") {
    FunctionRef no_consts = FunctionObject::make(make_code("f"), make_dict());
    REQUIRE(is_none(no_consts->doc()));

    FunctionRef int_first = FunctionObject::make(make_code("g", {make_int(7), make_string("later")}), make_dict());
    REQUIRE(is_none(int_first->doc()));

    // Any textual first constant counts, docstring or not.
    FunctionRef string_first = FunctionObject::make(make_code("h", {make_string("x")}), make_dict());
    REQUIRE(std::static_pointer_cast<String>(string_first->doc())->value() == "x");
}

TEST_CASE("FunctionObject module is None without __name__ in globals", "[function]") {
    FunctionRef f = FunctionObject::make(add_code(), make_dict());
    REQUIRE(is_none(f->module()));
}

TEST_CASE("FunctionObject sees later changes to the shared globals", "[function]") {
    DictRef globals = module_globals("mathmod");
    FunctionRef f = FunctionObject::make(add_code(), globals);

    globals->set("answer", make_int(42));

    REQUIRE(f->globals()->contains("answer"));
    // The module name was resolved at construction time only.
    globals->set("__name__", make_string("renamed"));
    REQUIRE(std::static_pointer_cast<String>(f->module())->value() == "mathmod");
}

TEST_CASE("FunctionObject call forwards everything to the evaluator", "[function][call]") {
    RecordingEvaluator evaluator;
    EvaluatorScope scope(evaluator);
    evaluator.result = make_int(5);

    CodeRef code = add_code();
    DictRef globals = module_globals("mathmod");
    FunctionRef f = FunctionObject::make(code, globals, "");

    Tuple args({make_int(2), make_int(3)});
    Dict kwargs;
    Ref result = f->call(args, kwargs);

    REQUIRE(result == evaluator.result);
    REQUIRE(evaluator.invocations.size() == 1);
    const auto& call = evaluator.last();
    REQUIRE(call.code == code);
    REQUIRE(call.globals == globals);
    REQUIRE(call.locals != nullptr);
    REQUIRE(call.locals->empty());
    REQUIRE(call.args.size() == 2);
    REQUIRE(std::static_pointer_cast<Int>(call.args[0])->value() == 2);
    REQUIRE(std::static_pointer_cast<Int>(call.args[1])->value() == 3);
    REQUIRE(call.kwargs.empty());
    REQUIRE(call.defaults == nullptr);
    REQUIRE(call.kwdefaults == nullptr);
    REQUIRE(call.closure != nullptr);
    REQUIRE(call.closure->empty());
}

TEST_CASE("FunctionObject call passes the current defaults and closure by reference", "[function][call]") {
    RecordingEvaluator evaluator;
    EvaluatorScope scope(evaluator);

    FunctionRef f = FunctionObject::make(make_code("inner", {}, {"x"}), make_dict());
    CellRef cell = make_cell(make_int(1));
    TupleRef closure = make_tuple({cell});
    f->set_closure(closure);
    TupleRef defaults = make_tuple({make_int(10)});
    f->set_defaults(defaults);
    DictRef kwdefaults = make_dict();
    kwdefaults->set("step", make_int(2));
    f->set_kwdefaults(kwdefaults);

    Dict kwargs;
    kwargs.set("step", make_int(3));
    f->call(Tuple(), kwargs);

    const auto& call = evaluator.last();
    REQUIRE(call.defaults == defaults);
    REQUIRE(call.kwdefaults == kwdefaults);
    REQUIRE(call.closure == closure);
    REQUIRE(call.kwargs.count("step") == 1);

    // The closure shares its cells with whoever created them.
    cell->set(make_int(99));
    REQUIRE(std::static_pointer_cast<Int>(std::static_pointer_cast<Cell>((*call.closure)[0])->get())->value() == 99);
}

TEST_CASE("FunctionObject call uses a fresh local scope each time", "[function][call]") {
    RecordingEvaluator evaluator;
    EvaluatorScope scope(evaluator);
    evaluator.body = [](const RecordingEvaluator::Invocation& call) -> Ref {
        call.locals->set("tmp", make_int(1));
        return none();
    };

    FunctionRef f = FunctionObject::make(add_code(), make_dict());
    f->call(Tuple(), Dict());
    f->call(Tuple(), Dict());

    REQUIRE(evaluator.invocations.size() == 2);
    REQUIRE(evaluator.invocations[0].locals != evaluator.invocations[1].locals);
    REQUIRE(evaluator.invocations[1].locals->size() == 1);
    REQUIRE(f->globals()->empty());
}

TEST_CASE("FunctionObject call lets evaluator exceptions through unchanged", "[function][call]") {
    RecordingEvaluator evaluator;
    EvaluatorScope scope(evaluator);
    evaluator.body = [](const RecordingEvaluator::Invocation&) -> Ref {
        throw TypeError("add() missing 1 required positional argument: 'b'");
    };

    FunctionRef f = FunctionObject::make(add_code(), make_dict());

    try {
        f->call(Tuple({make_int(2)}), Dict());
        FAIL("expected TypeError");
    } catch (const TypeError& e) {
        REQUIRE(std::string(e.what()) == "add() missing 1 required positional argument: 'b'");
    }
}

TEST_CASE("FunctionObject call can recurse through the evaluator", "[function][call]") {
    RecordingEvaluator evaluator;
    EvaluatorScope scope(evaluator);

    FunctionRef countdown = FunctionObject::make(make_code("countdown"), make_dict());
    evaluator.body = [&countdown](const RecordingEvaluator::Invocation& call) -> Ref {
        int64_t n = std::static_pointer_cast<Int>(call.args[0])->value();
        if (n == 0) {
            return make_int(0);
        }
        return countdown->call(Tuple({make_int(n - 1)}), Dict());
    };

    countdown->call(Tuple({make_int(5)}), Dict());

    REQUIRE(evaluator.invocations.size() == 6);
}

// Removes the installed evaluator for the lifetime of the scope.
class NoEvaluatorScope {
private:
    Evaluator* previous_;

public:
    NoEvaluatorScope() : previous_(install_evaluator(nullptr)) {}
    ~NoEvaluatorScope() { install_evaluator(previous_); }

    NoEvaluatorScope(const NoEvaluatorScope&) = delete;
    NoEvaluatorScope& operator=(const NoEvaluatorScope&) = delete;
};

TEST_CASE("FunctionObject call without an evaluator is a logic error", "[function][call]") {
    NoEvaluatorScope scope;
    FunctionRef f = FunctionObject::make(add_code(), make_dict());

    REQUIRE_THROWS_AS(f->call(Tuple(), Dict()), std::logic_error);
}

// Evaluator whose body reassigns __code__ and __defaults__ on the running function.
class ReassigningEvaluator : public Evaluator {
public:
    FunctionRef target;
    bool frame_unchanged = false;

    Ref evaluate(
        const CodeRef& code,
        const DictRef& globals,
        const DictRef& locals,
        const Tuple& args,
        const Dict& kwargs,
        const TupleRef& defaults,
        const DictRef& kwdefaults,
        const TupleRef& closure) override {
        const std::string& name = code->name();
        const Code* code_before = code.get();
        const Tuple* defaults_before = defaults.get();

        set_attribute(target, "__code__", make_code("other"));
        set_attribute(target, "__defaults__", make_tuple({make_int(9)}));

        frame_unchanged = code.get() == code_before && defaults.get() == defaults_before && name == "step";
        return none();
    }
};

TEST_CASE("FunctionObject call keeps its code and defaults while the body reassigns them", "[function][call]") {
    ReassigningEvaluator evaluator;
    EvaluatorScope scope(evaluator);

    FunctionRef f = FunctionObject::make(make_code("step"), make_dict());
    TupleRef first_defaults = make_tuple({make_int(1)});
    f->set_defaults(first_defaults);
    std::weak_ptr<Code> first_code = f->code();
    evaluator.target = f;

    f->call(Tuple(), Dict());

    REQUIRE(evaluator.frame_unchanged);
    REQUIRE(f->code()->name() == "other");
    REQUIRE(f->defaults() != first_defaults);
    REQUIRE(first_code.expired());
}

TEST_CASE("FunctionObject closure must match the free variables", "[function][closure]") {
    FunctionRef f = FunctionObject::make(make_code("inner", {}, {"x", "y"}), make_dict());

    REQUIRE_THROWS_AS(f->set_closure(make_tuple({make_cell()})), std::logic_error);
    REQUIRE_THROWS_AS(f->set_closure(make_tuple({make_cell(), make_int(3)})), std::logic_error);
    REQUIRE(f->closure()->empty());

    f->set_closure(make_tuple({make_cell(), make_cell()}));
    REQUIRE(f->closure()->size() == 2);
}

TEST_CASE("FunctionObject reports only live weak references", "[function]") {
    FunctionRef f = FunctionObject::make(add_code(), make_dict());
    Ref kept = make_string("observer");
    {
        Ref dropped = make_string("short-lived");
        f->add_weak_reference(kept);
        f->add_weak_reference(dropped);
        REQUIRE(f->weak_references().size() == 2);
    }

    auto alive = f->weak_references();
    REQUIRE(alive.size() == 1);
    REQUIRE(alive[0] == kept);
}

TEST_CASE("FunctionObject repr shows the qualified name", "[function]") {
    FunctionRef f = FunctionObject::make(add_code(), make_dict(), "Calculator.add");
    REQUIRE(f->repr().rfind("<function Calculator.add at 0x", 0) == 0);
    REQUIRE(type_name(f) == "function");
}
