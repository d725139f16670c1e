// main.cpp
// docdiff - compare two JSON documents under a configurable equivalence policy
//
// Usage: docdiff [options] <file1.json> <file2.json>
//
// Exit status: 0 identical, 1 different, 2 usage or input error

#include <docdiff/comparator.h>
#include <docdiff/equivalence.h>
#include <docdiff/policy.h>
#include <docdiff/report.h>
#include <docdiff/serialization.h>
#include <docdiff/value.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>
#include <utility>

using namespace docdiff;

namespace {

constexpr int kExitIdentical = 0;
constexpr int kExitDifferent = 1;
constexpr int kExitError     = 2;

// ============================================================
// Command line
// ============================================================

struct Options
{
    bool concise = false;
    bool quiet = false;
    bool show_lines = false;
    bool verbose = false;
    bool help = false;
    std::string output_json;
    std::string config_file;

    // Policy switches given on the command line. They are merged on top of
    // the --config file, so only the ones actually passed are set.
    bool keys_only = false;
    bool ignore_case = false;
    bool ignore_case_values = false;
    bool ignore_numeric_type = false;
    bool ignore_boolean_type = false;
    bool ignore_null = false;
    std::vector<std::string> regex_rules;
    std::vector<std::string> levenshtein_keys;
    std::optional<int> levenshtein_threshold;

    std::vector<std::string> files;
};

void print_usage(std::ostream& os)
{
    os << "Usage: docdiff [options] <file1.json> <file2.json>\n"
       << "Options:\n"
       << "  --concise                    Show concise output\n"
       << "  --quiet                      Only set the exit status, print nothing\n"
       << "  --output-json <file>         Write differences to a JSON file\n"
       << "  --keys-only                  Only compare keys, ignore values\n"
       << "  --ignore-case                Ignore case when comparing keys\n"
       << "  --ignore-case-values         Ignore case when comparing string values\n"
       << "  --ignore-numeric-type        Ignore numeric types (1 == \"1\" == \"1.0\" == 1.0)\n"
       << "  --ignore-boolean-type        Ignore boolean types (true == \"true\")\n"
       << "  --ignore-null                Treat null as equal to anything\n"
       << "  --regex-match <key:pattern>  Regex matching on a path, repeatable\n"
       << "  --levenshtein-key <key>      Edit-distance matching on a path, repeatable\n"
       << "  --levenshtein-threshold <n>  Maximum edit distance considered equal (default: 3)\n"
       << "  --config <policy.json>       Load a policy file; flags override it\n"
       << "  --show-lines                 Also compare the pretty-printed documents line by line\n"
       << "  --verbose                    Print the effective policy\n"
       << "  --help                       Show this help\n";
}

int parse_threshold(std::string_view text)
{
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value < 0) {
        throw std::invalid_argument("invalid --levenshtein-threshold '" + std::string{text} +
                                    "', expected a non-negative integer");
    }
    return value;
}

// Accepts both "--flag value" and "--flag=value" for options taking a value.
Options parse_args(int argc, char* argv[])
{
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        std::string_view inline_value;
        bool has_inline_value = false;

        if (arg.starts_with("--")) {
            if (auto eq = arg.find('='); eq != std::string_view::npos) {
                inline_value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline_value = true;
            }
        }

        auto next_value = [&]() -> std::string {
            if (has_inline_value) {
                return std::string{inline_value};
            }
            if (i + 1 >= argc) {
                throw std::invalid_argument("missing value for " + std::string{arg});
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--concise") {
            opts.concise = true;
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "--show-lines") {
            opts.show_lines = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--output-json") {
            opts.output_json = next_value();
        } else if (arg == "--config") {
            opts.config_file = next_value();
        } else if (arg == "--keys-only") {
            opts.keys_only = true;
        } else if (arg == "--ignore-case") {
            opts.ignore_case = true;
        } else if (arg == "--ignore-case-values") {
            opts.ignore_case_values = true;
        } else if (arg == "--ignore-numeric-type") {
            opts.ignore_numeric_type = true;
        } else if (arg == "--ignore-boolean-type") {
            opts.ignore_boolean_type = true;
        } else if (arg == "--ignore-null") {
            opts.ignore_null = true;
        } else if (arg == "--regex-match") {
            opts.regex_rules.push_back(next_value());
        } else if (arg == "--levenshtein-key") {
            opts.levenshtein_keys.push_back(next_value());
        } else if (arg == "--levenshtein-threshold") {
            opts.levenshtein_threshold = parse_threshold(next_value());
        } else if (arg.starts_with("-") && arg.size() > 1) {
            throw std::invalid_argument("unknown option " + std::string{arg});
        } else {
            opts.files.emplace_back(arg);
        }
    }
    return opts;
}

// ============================================================
// Policy assembly
// ============================================================

EquivalencePolicy build_policy(const Options& opts)
{
    EquivalencePolicy policy;
    if (!opts.config_file.empty()) {
        policy = load_policy_file(opts.config_file);
    }

    policy.structure_only      |= opts.keys_only;
    policy.ignore_key_case     |= opts.ignore_case;
    policy.ignore_value_case   |= opts.ignore_case_values;
    policy.ignore_numeric_type |= opts.ignore_numeric_type;
    policy.ignore_boolean_type |= opts.ignore_boolean_type;
    policy.ignore_null         |= opts.ignore_null;

    std::set<Path> seen;
    for (const auto& rule : opts.regex_rules) {
        auto [path, pattern] = parse_regex_rule(rule);
        if (!seen.insert(path).second) {
            std::cerr << "Warning: duplicate regex match key '" << path
                      << "', only the last pattern will be used\n";
        }
        policy.regex_by_path[path] = std::move(pattern);
    }

    for (const auto& key : opts.levenshtein_keys) {
        policy.fuzzy_paths.insert(key);
    }
    if (opts.levenshtein_threshold) {
        policy.fuzzy_threshold = *opts.levenshtein_threshold;
    }

    for (const auto& path : validate(policy)) {
        std::cerr << "Warning: regex for '" << path << "' does not compile, rule ignored\n";
    }
    return policy;
}

Value load_document(const std::string& file_path, const Options& opts, const EquivalencePolicy& policy)
{
    Value doc = read_json_file(file_path, policy.max_depth);
    if (!opts.concise && !opts.quiet) {
        std::cout << "Validated JSON from " << file_path << "\n";
    }
    return doc;
}

void print_verbose(const EquivalencePolicy& policy)
{
    std::cerr << "Effective policy:\n" << to_json(policy_to_value(policy)) << "\n";
    std::cerr << "Rule order:";
    for (auto rule : kRulePrecedence) {
        std::cerr << " " << rule_name(rule);
    }
    std::cerr << "\n";
}

int run(const Options& opts)
{
    const EquivalencePolicy policy = build_policy(opts);
    if (opts.verbose) {
        print_verbose(policy);
    }

    Value first;
    try {
        first = load_document(opts.files[0], opts, policy);
    } catch (const std::exception& e) {
        std::cerr << "Error with first file: " << e.what() << "\n";
        return kExitError;
    }

    Value second;
    try {
        second = load_document(opts.files[1], opts, policy);
    } catch (const std::exception& e) {
        std::cerr << "Error with second file: " << e.what() << "\n";
        return kExitError;
    }

    const std::vector<Diff> diffs = compare(first, second, policy);

    if (!opts.output_json.empty()) {
        write_text_file(opts.output_json, diffs_to_json(diffs));
        if (!opts.quiet) {
            std::cout << "Differences written to " << opts.output_json << "\n";
        }
    }

    if (diffs.empty()) {
        if (!opts.quiet) {
            std::cout << "The JSON files are identical.\n";
        }
        return kExitIdentical;
    }

    if (!opts.quiet) {
        std::cout << "The JSON files are different.\n";
        std::cout << "\nDifferences found:\n" << format_report(diffs);

        if (opts.show_lines) {
            auto lines = diff_lines(to_json(first), to_json(second));
            std::cout << "\nLine differences:\n" << format_line_diffs(lines);
        }
    }
    return kExitDifferent;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(std::cerr);
        return kExitError;
    }

    if (opts.help) {
        print_usage(std::cout);
        return kExitIdentical;
    }
    if (opts.files.size() != 2) {
        print_usage(std::cerr);
        return kExitError;
    }

    try {
        return run(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }
}
