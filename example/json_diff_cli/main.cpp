// main.cpp - json_diff_cli: compare two JSON files
//
// Usage: json_diff_cli [options] <lhs.json> <rhs.json>
//
//   --strict         both sides must match exactly (default)
//   --inclusive      rhs is the expected subset of lhs
//   --ignore-order   compare arrays as multisets
//   --assume-float   compare all numbers as doubles
//   --epsilon <e>    tolerate |a - b| <= e between doubles
//
// Exit status: 0 equal, 1 differences found, 2 usage or input error.

#include <json_diff/config.h>
#include <json_diff/serialization.h>
#include <json_diff/value_diff.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace json_diff;

namespace {

constexpr int exit_equal = 0;
constexpr int exit_different = 1;
constexpr int exit_error = 2;

void print_usage(std::string_view program)
{
    std::cerr << "Usage: " << program << " [options] <lhs.json> <rhs.json>\n"
              << "\n"
              << "Options:\n"
              << "  --strict         both sides must match exactly (default)\n"
              << "  --inclusive      rhs is the expected subset of lhs\n"
              << "  --ignore-order   compare arrays as multisets\n"
              << "  --assume-float   compare all numbers as doubles\n"
              << "  --epsilon <e>    tolerate |a - b| <= e between doubles\n";
}

std::optional<double> parse_epsilon(std::string_view text)
{
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    const std::string_view program = argc > 0 ? argv[0] : "json_diff_cli";

    CompareMode compare_mode = CompareMode::Strict;
    ArraySortingMode sorting_mode = ArraySortingMode::Exact;
    NumericMode numeric_mode = NumericMode::Strict;
    FloatCompareMode float_mode = FloatCompareMode::exact();
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--strict") {
            compare_mode = CompareMode::Strict;
        } else if (arg == "--inclusive") {
            compare_mode = CompareMode::Inclusive;
        } else if (arg == "--ignore-order") {
            sorting_mode = ArraySortingMode::Ignore;
        } else if (arg == "--assume-float") {
            numeric_mode = NumericMode::AssumeFloat;
        } else if (arg == "--epsilon") {
            if (i + 1 >= argc) {
                std::cerr << "--epsilon requires a value\n";
                print_usage(program);
                return exit_error;
            }
            auto eps = parse_epsilon(argv[++i]);
            if (!eps) {
                std::cerr << "invalid epsilon: " << argv[i] << "\n";
                return exit_error;
            }
            float_mode = FloatCompareMode::epsilon(*eps);
        } else if (arg == "-h" || arg == "--help") {
            print_usage(program);
            return exit_equal;
        } else if (arg.starts_with("--")) {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(program);
            return exit_error;
        } else {
            files.emplace_back(arg);
        }
    }

    if (files.size() != 2) {
        print_usage(program);
        return exit_error;
    }

    const auto config = Config{compare_mode}
                            .array_sorting_mode(sorting_mode)
                            .numeric_mode(numeric_mode)
                            .float_compare_mode(float_mode);

    Value lhs;
    Value rhs;
    try {
        lhs = from_json_file(files[0]);
        rhs = from_json_file(files[1]);
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return exit_error;
    }

    const auto diffs = compare(lhs, rhs, config);
    if (diffs.empty()) {
        return exit_equal;
    }

    for (std::size_t i = 0; i < diffs.size(); ++i) {
        if (i > 0) {
            std::cout << "\n";
        }
        std::cout << diffs[i] << "\n";
    }
    return exit_different;
}
