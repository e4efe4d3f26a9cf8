#include <catch2/catch_test_macros.hpp>
#include "../src/bundle_reader.hpp"
#include "../src/cell.hpp"
#include "../src/parse_code.hpp"
#include "../src/protocol.hpp"
#include <filesystem>
#include <fmt/core.h>
#include <stdexcept>

using namespace funcobj;

// Writes a bundle file for the duration of a test and removes it afterwards.
class TempBundle {
private:
    std::string path_;

public:
    explicit TempBundle(const std::string& sql) {
        static int counter = 0;
        path_ = (std::filesystem::temp_directory_path() /
                 fmt::format("funcobj-test-{}-{}.bundle", reinterpret_cast<uintptr_t>(this), counter++)).string();
        std::filesystem::remove(path_);

        sqlite3* db = nullptr;
        if (sqlite3_open(path_.c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            throw std::runtime_error("cannot create test bundle");
        }
        char* error = nullptr;
        int result = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &error);
        std::string message = error ? error : "";
        sqlite3_free(error);
        sqlite3_close(db);
        if (result != SQLITE_OK) {
            throw std::runtime_error("cannot populate test bundle: " + message);
        }
    }

    ~TempBundle() {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
    }

    const std::string& path() const { return path_; }
};

static const char* const schema = R"(
    CREATE TABLE functions (id_name TEXT PRIMARY KEY, qualname TEXT, code TEXT);
    CREATE TABLE globals (name TEXT PRIMARY KEY, value TEXT);
    CREATE TABLE entry_points (id_name TEXT);
)";

static std::string math_bundle() {
    return std::string(schema) + R"(
        INSERT INTO functions VALUES ('add', '', '{"name": "add", "consts": ["adds two numbers"]}');
        INSERT INTO functions VALUES ('inner', 'outer.<locals>.inner', '{"name": "inner", "freevars": ["x", "y"]}');
        INSERT INTO globals VALUES ('__name__', '"mathmod"');
        INSERT INTO globals VALUES ('limit', '10');
        INSERT INTO entry_points VALUES ('add');
    )";
}

TEST_CASE("BundleReader lists entry points", "[bundle_reader]") {
    TempBundle bundle(math_bundle());
    BundleReader reader(bundle.path());

    REQUIRE(reader.get_entry_points() == std::vector<std::string>{"add"});
}

TEST_CASE("BundleReader reads function rows", "[bundle_reader]") {
    TempBundle bundle(math_bundle());
    BundleReader reader(bundle.path());

    FunctionEntry entry = reader.get_function("inner");

    REQUIRE(entry.idname == "inner");
    REQUIRE(entry.qualname == "outer.<locals>.inner");
    REQUIRE(ParseCode(entry.idname).parse(entry.code)->nfree() == 2);
    REQUIRE_THROWS_AS(reader.get_function("missing"), BundleReaderError);
}

TEST_CASE("BundleReader builds the module globals", "[bundle_reader]") {
    TempBundle bundle(math_bundle());
    BundleReader reader(bundle.path());

    DictRef globals = reader.load_globals();

    REQUIRE(globals->size() == 2);
    REQUIRE(std::static_pointer_cast<String>(globals->get("__name__"))->value() == "mathmod");
    REQUIRE(std::static_pointer_cast<Int>(globals->get("limit"))->value() == 10);
}

TEST_CASE("BundleReader loads functions against shared globals", "[bundle_reader]") {
    TempBundle bundle(math_bundle());
    BundleReader reader(bundle.path());
    DictRef globals = reader.load_globals();

    FunctionRef add = reader.load_function("add", globals);
    FunctionRef inner = reader.load_function("inner", globals);

    REQUIRE(add->name() == "add");
    REQUIRE(add->qualname() == "add");
    REQUIRE(std::static_pointer_cast<String>(add->doc())->value() == "adds two numbers");
    REQUIRE(std::static_pointer_cast<String>(add->module())->value() == "mathmod");
    REQUIRE(add->globals() == inner->globals());

    REQUIRE(inner->qualname() == "outer.<locals>.inner");
    REQUIRE(inner->closure()->size() == 2);
    REQUIRE(std::static_pointer_cast<Cell>((*inner->closure())[0])->empty());

    // The closure fixes the arity __code__ has to respect.
    REQUIRE_THROWS_AS(set_attribute(inner, "__code__", add->code()), ValueError);
}

TEST_CASE("BundleReader reports bad code JSON", "[bundle_reader]") {
    TempBundle bundle(std::string(schema) + R"(
        INSERT INTO functions VALUES ('broken', '', '{"consts": []}');
    )");
    BundleReader reader(bundle.path());

    REQUIRE_THROWS_AS(reader.load_function("broken", make_dict()), CodeParseError);
}

TEST_CASE("BundleReader fails on a missing bundle file", "[bundle_reader]") {
    std::string path = (std::filesystem::temp_directory_path() / "funcobj-no-such.bundle").string();
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(BundleReader{path}, BundleReaderError);
}

TEST_CASE("BundleReader fails on a bundle without the expected tables", "[bundle_reader]") {
    TempBundle bundle("CREATE TABLE unrelated (x INTEGER);");
    BundleReader reader(bundle.path());

    REQUIRE_THROWS_AS(reader.get_entry_points(), BundleReaderError);
    REQUIRE_THROWS_AS(reader.load_globals(), BundleReaderError);
}
