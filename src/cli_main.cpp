#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include "datamerge/Errors.hpp"
#include "datamerge/Loader.hpp"
#include "datamerge/Log.hpp"
#include "datamerge/Merger.hpp"
#include "datamerge/Options.hpp"
#include "datamerge/Presets.hpp"
#include "datamerge/Validation.hpp"

using namespace datamerge;

namespace {

int write_output(const Value& doc, const std::string& out, int indent) {
    const std::string text = doc.dump(indent, ' ', false, Value::error_handler_t::replace);
    if (out.empty()) {
        std::cout << text << "\n";
        return 0;
    }
    std::ofstream ofs(out);
    if (!ofs) {
        std::cerr << "Error: cannot write to " << out << "\n";
        return 1;
    }
    ofs << text << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("datamerge", "Merge JSON/TOML documents or preview a merge");
        options.positional_help("COMMAND FILE...");

        options.add_options()
            ("o,options", "JSON/TOML file with merge options", cxxopts::value<std::string>())
            ("schema", "JSON/TOML file mapping paths to validation rules", cxxopts::value<std::string>())
            ("preset", "Preconfigured engine: config | table", cxxopts::value<std::string>())
            ("s,strategy", "Merge strategy (deep, array, ...)", cxxopts::value<std::string>())
            ("c,conflict", "Conflict resolution (override, preserve, error, sum, ...)", cxxopts::value<std::string>())
            ("a,array-merge", "Array merge (concat, union, intersection, override, combine, zip)", cxxopts::value<std::string>())
            ("m,map", "Key mapping FROM:TO applied to later sources (repeatable)", cxxopts::value<std::vector<std::string>>())
            ("keep-null", "Keep null sources")
            ("ignore-empty", "Drop empty sources")
            ("keep-duplicates", "Do not deduplicate merged arrays")
            ("no-preserve-order", "Do not restore source order after a union")
            ("report", "Print the full result envelope instead of the merged value")
            ("out", "Write output to FILE instead of stdout", cxxopts::value<std::string>())
            ("indent", "JSON indentation", cxxopts::value<int>()->default_value("2"))
            ("v,verbose", "Log debug diagnostics to stderr")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand and files", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: merge FILE... | plan FILE...\n";
            return 0;
        }

        if (result.count("verbose")) {
            log::set_level(log::DEBUG);
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const std::vector<std::string> files(cmdv.begin() + 1, cmdv.end());

        // Engine: preset first, then options file, then flags
        DataMerger merger;
        if (result.count("preset")) {
            const std::string preset = result["preset"].as<std::string>();
            if (preset == "config") {
                merger = create_config_merger();
            } else if (preset == "table") {
                merger = create_table_merger();
            } else {
                std::cerr << "Error: unknown preset '" << preset << "' (expected config or table)\n";
                return 1;
            }
        }

        MergeOptions& opts = merger.options();
        if (result.count("options")) {
            opts = load_options_file(result["options"].as<std::string>(), opts);
        }
        if (result.count("strategy")) opts.strategy = parse_strategy(result["strategy"].as<std::string>());
        if (result.count("conflict")) opts.conflict_resolution = parse_conflict_resolution(result["conflict"].as<std::string>());
        if (result.count("array-merge")) opts.array_merge = parse_array_merge(result["array-merge"].as<std::string>());
        if (result.count("keep-null")) opts.ignore_null = false;
        if (result.count("ignore-empty")) opts.ignore_empty = true;
        if (result.count("keep-duplicates")) opts.remove_duplicates = false;
        if (result.count("no-preserve-order")) opts.preserve_order = false;
        if (result.count("map")) {
            for (const auto& pair : result["map"].as<std::vector<std::string>>()) {
                auto pos = pair.find(':');
                if (pos == std::string::npos || pos == 0 || pos + 1 == pair.size()) {
                    std::cerr << "Error: --map expects FROM:TO, got '" << pair << "'\n";
                    return 1;
                }
                merger.register_key_mapping(pair.substr(0, pos), pair.substr(pos + 1));
            }
        }

        Schema schema;
        if (result.count("schema")) {
            schema = compile_schema(load_source_file(result["schema"].as<std::string>()));
        }

        const std::string out = result.count("out") ? result["out"].as<std::string>() : "";
        const int indent = result["indent"].as<int>();

        // MERGE
        if (cmd == "merge") {
            if (files.empty()) {
                std::cerr << "Error: merge needs at least one FILE\n";
                return 1;
            }
            const auto sources = load_source_files(files);
            const MergeResult merged = merger.merge_with_validation(sources, schema);

            const int rc = write_output(result.count("report") ? merged.to_value() : merged.result,
                                        out, indent);
            if (rc != 0) return rc;

            for (const auto& err : merged.metadata.validation_errors) {
                std::cerr << err << "\n";
            }
            return merged.success ? 0 : 2;
        }

        // PLAN
        if (cmd == "plan") {
            if (files.empty()) {
                std::cerr << "Error: plan needs at least one FILE\n";
                return 1;
            }
            const auto sources = load_source_files(files);
            return write_output(merger.create_merge_plan(sources).to_value(), out, indent);
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
