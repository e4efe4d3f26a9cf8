#include <fmt/core.h>
#include <string>
#include <vector>
#include <optional>
#include <cstdlib>
#include "bundle_reader.hpp"
#include "errors.hpp"
#include "function_object.hpp"
#include "parse_code.hpp"
#include "protocol.hpp"
#include "trace.hpp"

// Attribute operations requested on the command line, applied in order.
struct AttributeOp {
    enum class Kind { Set, Delete };
    Kind kind;
    std::string name;
    std::string json;  // Only for Set.
};

struct CommandLineArgs {
    std::optional<std::string> entry_point;
    std::string bundle_file;
    std::vector<AttributeOp> ops;
};

// Accessors printed after the operations have run.
static const char* const reported_attributes[] = {
    "__name__",
    "__qualname__",
    "__module__",
    "__doc__",
    "__defaults__",
    "__kwdefaults__",
    "__annotations__",
    "__dict__",
    "__closure__",
    "__code__",
};

static void print_usage() {
    fmt::print(stderr, "Usage: funcobj-inspect [OPTIONS] BUNDLE_FILE\n");
    fmt::print(stderr, "Options:\n");
    fmt::print(stderr, "  -e NAME, -e=NAME, --entry-point NAME, --entry-point=NAME\n");
    fmt::print(stderr, "                          Specify the function to inspect\n");
    fmt::print(stderr, "  --set ATTR=JSON         Assign a JSON value to an attribute\n");
    fmt::print(stderr, "  --delete ATTR           Delete an attribute\n");
}

static AttributeOp parse_set(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        fmt::print(stderr, "Error: --set expects ATTR=JSON, got '{}'\n", text);
        std::exit(1);
    }
    return AttributeOp{AttributeOp::Kind::Set, text.substr(0, eq), text.substr(eq + 1)};
}

// Parse command-line arguments according to: funcobj-inspect [OPTIONS] BUNDLE_FILE.
CommandLineArgs parse_args(int argc, char* argv[]) {
    CommandLineArgs args;
    int i = 1;

    // Parse options.
    while (i < argc) {
        std::string arg = argv[i];

        // Check for --entry-point=NAME (optional form).
        if (arg.rfind("--entry-point=", 0) == 0) {
            args.entry_point = arg.substr(14);  // Length of "--entry-point=".
            i++;
        }
        // Check for --entry-point NAME or -e NAME.
        else if (arg == "--entry-point" || arg == "-e") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: {} option requires an argument\n", arg);
                std::exit(1);
            }
            args.entry_point = argv[i + 1];
            i += 2;
        }
        // Check for -e=NAME.
        else if (arg.rfind("-e=", 0) == 0) {
            args.entry_point = arg.substr(3);  // Length of "-e=".
            i++;
        }
        else if (arg.rfind("--set=", 0) == 0) {
            args.ops.push_back(parse_set(arg.substr(6)));  // Length of "--set=".
            i++;
        }
        else if (arg == "--set") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --set option requires an argument\n");
                std::exit(1);
            }
            args.ops.push_back(parse_set(argv[i + 1]));
            i += 2;
        }
        else if (arg.rfind("--delete=", 0) == 0) {
            args.ops.push_back(AttributeOp{AttributeOp::Kind::Delete, arg.substr(9), ""});  // Length of "--delete=".
            i++;
        }
        else if (arg == "--delete") {
            if (i + 1 >= argc) {
                fmt::print(stderr, "Error: --delete option requires an argument\n");
                std::exit(1);
            }
            args.ops.push_back(AttributeOp{AttributeOp::Kind::Delete, argv[i + 1], ""});
            i += 2;
        }
        // Stop at first non-option argument (the bundle file).
        else if (arg.empty() || arg[0] != '-') {
            break;
        }
        else {
            fmt::print(stderr, "Error: Unknown option '{}'\n", arg);
            print_usage();
            std::exit(1);
        }
    }

    // Next argument is the bundle file (required).
    if (i >= argc) {
        fmt::print(stderr, "Error: Missing BUNDLE_FILE argument\n");
        print_usage();
        std::exit(1);
    }
    args.bundle_file = argv[i++];

    if (i < argc) {
        fmt::print(stderr, "Error: Unexpected argument '{}'\n", argv[i]);
        print_usage();
        std::exit(1);
    }

    return args;
}

int main(int argc, char* argv[]) {
    try {
        CommandLineArgs args = parse_args(argc, argv);

        // Open the bundle file.
        funcobj::BundleReader reader(args.bundle_file);

        // Determine which function to inspect.
        std::string entry_point_name;
        if (args.entry_point) {
            entry_point_name = *args.entry_point;
        } else {
            auto entry_points = reader.get_entry_points();
            if (entry_points.empty()) {
                fmt::print(stderr, "Error: No entry points found in bundle\n");
                return 1;
            }
            if (entry_points.size() > 1) {
                fmt::print(stderr, "Error: Multiple entry points found, please specify one with --entry-point:\n");
                for (const auto& ep : entry_points) {
                    fmt::print(stderr, "  {}\n", ep);
                }
                return 1;
            }
            entry_point_name = entry_points[0];
        }

        funcobj::DictRef globals = reader.load_globals();
        funcobj::FunctionRef function = reader.load_function(entry_point_name, globals);
        if constexpr (funcobj::TRACE_MAIN) {
            fmt::print("Loaded {}\n", function->repr());
        }

        for (const auto& op : args.ops) {
            if (op.kind == AttributeOp::Kind::Set) {
                if constexpr (funcobj::TRACE_MAIN) {
                    fmt::print("Setting {} = {}\n", op.name, op.json);
                }
                funcobj::set_attribute(function, op.name, funcobj::parse_value(op.json));
            } else {
                if constexpr (funcobj::TRACE_MAIN) {
                    fmt::print("Deleting {}\n", op.name);
                }
                funcobj::delete_attribute(function, op.name);
            }
        }

        for (const char* name : reported_attributes) {
            fmt::print("{}: {}\n", name, funcobj::to_string(funcobj::get_attribute(function, name)));
        }

        return 0;

    } catch (const funcobj::Exception& e) {
        fmt::print(stderr, "Error: {}: {}\n", e.kind(), e.what());
        return 1;
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
