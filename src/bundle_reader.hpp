#ifndef BUNDLE_READER_HPP
#define BUNDLE_READER_HPP

#include "function_object.hpp"
#include "value.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>
#include <stdexcept>
#include <unordered_map>

namespace funcobj {

class BundleReaderError : public std::runtime_error {
public:
    explicit BundleReaderError(const std::string& msg) : std::runtime_error(msg) {}
};

// Represents a row of the functions table.
struct FunctionEntry {
    std::string idname;
    std::string qualname;   // Empty means "use the code's name".
    std::string code;       // JSON-encoded Code.
};

// Reads function definitions from a bundle: an SQLite file with tables
//   functions(id_name, qualname, code)
//   globals(name, value)          -- value is JSON
//   entry_points(id_name)
class BundleReader {
private:
    sqlite3* db_;
    std::string bundle_path_;

    // Helper to execute queries and handle errors.
    void check_sqlite_result(int result, const std::string& operation, sqlite3_stmt* stmt = nullptr);

public:
    explicit BundleReader(const std::string& bundle_path);
    ~BundleReader();

    BundleReader(const BundleReader&) = delete;
    BundleReader& operator=(const BundleReader&) = delete;

    // Get all entry points.
    std::vector<std::string> get_entry_points();

    // Get function entry by IdName.
    FunctionEntry get_function(const std::string& idname);

    // Get the raw JSON text of every module global.
    std::unordered_map<std::string, std::string> get_globals();

    // Build the module namespace shared by every function of the bundle.
    DictRef load_globals();

    // Construct a function object for idname against globals. Free variables
    // are given fresh, empty cells since the enclosing scope is not part of
    // the bundle.
    FunctionRef load_function(const std::string& idname, const DictRef& globals);
};

} // namespace funcobj

#endif // BUNDLE_READER_HPP
