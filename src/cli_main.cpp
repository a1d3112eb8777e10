#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "multiconf/Coerce.hpp"
#include "multiconf/CommandLineSource.hpp"
#include "multiconf/Declarations.hpp"
#include "multiconf/DocumentSource.hpp"
#include "multiconf/Errors.hpp"
#include "multiconf/Log.hpp"
#include "multiconf/Resolver.hpp"

using namespace multiconf;

namespace {

// Every occurrence of a repeatable string option, in command-line order.
std::vector<std::string> occurrences(const cxxopts::ParseResult& result, const std::string& key) {
    std::vector<std::string> out;
    for (const auto& kv : result.arguments()) {
        if (kv.key() == key) out.push_back(kv.value());
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    // Everything after "--" belongs to the declared items
    std::vector<const char*> tool_args;
    std::vector<std::string> item_args;
    bool after_separator = false;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (!after_separator && i > 0 && arg == "--") {
            after_separator = true;
            continue;
        }
        if (after_separator) item_args.push_back(arg);
        else tool_args.push_back(argv[i]);
    }

    try {
        cxxopts::Options options("multiconf", "Resolve declared config items from JSON/TOML files, KEY=VALUE pairs and flags");
        options.custom_help("-i ITEMS [OPTIONS] [-- ITEM FLAGS...]");

        options.add_options()
            ("i,items", "Path to JSON/TOML item declarations", cxxopts::value<std::string>())
            ("json", "JSON config file (repeatable, applied in order)", cxxopts::value<std::string>())
            ("toml", "TOML config file (repeatable, applied in order)", cxxopts::value<std::string>())
            ("set", "KEY=VALUE override (repeatable)", cxxopts::value<std::string>())
            ("partial", "Do not fail on missing required items")
            ("format", "Output format: json|toml", cxxopts::value<std::string>()->default_value("json"))
            ("log-level", "trace|debug|info|warn|error|off", cxxopts::value<std::string>()->default_value("warn"))
            ("h,help", "Show help");

        auto result = options.parse(static_cast<int>(tool_args.size()), tool_args.data());
        if (result.count("help") || !result.count("items")) {
            std::cout << options.help() << "\n";
            std::cout << "Sources are applied in order: --json files, --toml files, --set pairs, item flags.\n";
            std::cout << "Run with -i ITEMS -- --help to list the item flags.\n";
            return result.count("help") ? 0 : 1;
        }
        if (!result.unmatched().empty()) {
            std::cerr << "Error: unexpected argument '" << result.unmatched().front() << "'\n";
            return 1;
        }

        set_log_level(result["log-level"].as<std::string>());

        const std::string format = result["format"].as<std::string>();
        if (format != "json" && format != "toml") {
            std::cerr << "Error: unsupported format '" << format << "'\n";
            return 1;
        }

        Resolver resolver = load_declarations_file(result["items"].as<std::string>());

        for (const auto& path : occurrences(result, "json")) {
            resolver.register_source<JsonSource>(JsonSourceOptions{path});
        }
        for (const auto& path : occurrences(result, "toml")) {
            resolver.register_source<TomlSource>(TomlSourceOptions{path});
        }

        auto pairs = occurrences(result, "set");
        if (!pairs.empty()) {
            Value mapping = Value::object();
            for (const auto& pair : pairs) {
                auto pos = pair.find('=');
                if (pos == std::string::npos || pos == 0) {
                    std::cerr << "Error: --set expects KEY=VALUE, got '" << pair << "'\n";
                    return 1;
                }
                mapping[pair.substr(0, pos)] = parse_value(pair.substr(pos + 1));
            }
            resolver.register_source<MappingSource>(mapping);
        }

        CommandLineSourceOptions cli;
        cli.program = "multiconf";
        cli.description = "Item flags";
        cli.arguments = item_args;
        auto& flags = resolver.register_source<SimpleCommandLineSource>(cli);
        flags.parse();
        if (flags.help_requested()) {
            std::cout << flags.help() << "\n";
            return 0;
        }

        Namespace values = result.count("partial") ? resolver.resolve_partial()
                                                   : resolver.resolve();

        if (format == "toml") std::cout << values.to_toml_string() << "\n";
        else std::cout << values.to_json_string(2) << "\n";
        return 0;

    } catch (const RequiredValueMissing& missing) {
        std::cerr << "Error: " << missing.what() << "\n";
        return 2;
    } catch (const cxxopts::exceptions::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
