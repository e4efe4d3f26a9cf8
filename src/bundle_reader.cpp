#include "bundle_reader.hpp"
#include "cell.hpp"
#include "parse_code.hpp"
#include "trace.hpp"
#include <fmt/core.h>

namespace funcobj {

BundleReader::BundleReader(const std::string& bundle_path)
    : db_(nullptr), bundle_path_(bundle_path) {
    int result = sqlite3_open_v2(bundle_path.c_str(), &db_, SQLITE_OPEN_READONLY, nullptr);
    if (result != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(result);
        sqlite3_close(db_);
        db_ = nullptr;
        throw BundleReaderError(fmt::format("Failed to open bundle file '{}': {}", bundle_path, error));
    }
}

BundleReader::~BundleReader() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void BundleReader::check_sqlite_result(int result, const std::string& operation, sqlite3_stmt* stmt) {
    if (result != SQLITE_OK && result != SQLITE_ROW && result != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        throw BundleReaderError(fmt::format("{}: {}", operation, error));
    }
}

std::vector<std::string> BundleReader::get_entry_points() {
    std::vector<std::string> entry_points;
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT id_name FROM entry_points ORDER BY id_name";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare entry_points query", stmt);

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* idname = sqlite3_column_text(stmt, 0);
        if (idname) {
            entry_points.emplace_back(reinterpret_cast<const char*>(idname));
        }
    }

    check_sqlite_result(result, "Failed to execute entry_points query", stmt);
    sqlite3_finalize(stmt);

    return entry_points;
}

FunctionEntry BundleReader::get_function(const std::string& idname) {
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT id_name, qualname, code FROM functions WHERE id_name = ?";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare functions query", stmt);

    result = sqlite3_bind_text(stmt, 1, idname.c_str(), -1, SQLITE_TRANSIENT);
    check_sqlite_result(result, "Failed to bind parameter", stmt);

    result = sqlite3_step(stmt);
    if (result != SQLITE_ROW) {
        check_sqlite_result(result, "Failed to execute functions query", stmt);
        sqlite3_finalize(stmt);
        throw BundleReaderError(fmt::format("Function not found: {}", idname));
    }

    FunctionEntry entry;
    const unsigned char* text;

    text = sqlite3_column_text(stmt, 0);
    entry.idname = text ? reinterpret_cast<const char*>(text) : "";

    text = sqlite3_column_text(stmt, 1);
    entry.qualname = text ? reinterpret_cast<const char*>(text) : "";

    text = sqlite3_column_text(stmt, 2);
    entry.code = text ? reinterpret_cast<const char*>(text) : "";

    sqlite3_finalize(stmt);
    return entry;
}

std::unordered_map<std::string, std::string> BundleReader::get_globals() {
    std::unordered_map<std::string, std::string> globals;
    sqlite3_stmt* stmt = nullptr;

    const char* sql = "SELECT name, value FROM globals";
    int result = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    check_sqlite_result(result, "Failed to prepare globals query", stmt);

    while ((result = sqlite3_step(stmt)) == SQLITE_ROW) {
        const unsigned char* name = sqlite3_column_text(stmt, 0);
        const unsigned char* value = sqlite3_column_text(stmt, 1);
        if (name && value) {
            globals[reinterpret_cast<const char*>(name)] = reinterpret_cast<const char*>(value);
        }
    }

    check_sqlite_result(result, "Failed to execute globals query", stmt);
    sqlite3_finalize(stmt);

    return globals;
}

DictRef BundleReader::load_globals() {
    DictRef globals = make_dict();
    for (const auto& [name, json] : get_globals()) {
        globals->set(name, parse_value(json));
        if constexpr (TRACE_BUNDLE_READER) {
            fmt::print("Global {} = {}\n", name, json);
        }
    }
    return globals;
}

FunctionRef BundleReader::load_function(const std::string& idname, const DictRef& globals) {
    FunctionEntry entry = get_function(idname);
    CodeRef code = ParseCode(idname).parse(entry.code);
    FunctionRef function = FunctionObject::make(code, globals, entry.qualname);

    if (code->nfree() > 0) {
        std::vector<Ref> cells;
        for (size_t i = 0; i < code->nfree(); i++) {
            cells.push_back(make_cell());
        }
        function->set_closure(make_tuple(std::move(cells)));
    }

    if constexpr (TRACE_BUNDLE_READER) {
        fmt::print("Loaded {} from {}\n", function->repr(), bundle_path_);
    }
    return function;
}

} // namespace funcobj
