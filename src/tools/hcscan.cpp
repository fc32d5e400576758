#include "hc/clean/cleaner.hpp"
#include "hc/config/config_io.hpp"
#include "hc/report/report_serializer.hpp"
#include "hc/scan/aggregator.hpp"
#include "hc/scan/scanner.hpp"
#include "hc/unicode/classifier.hpp"
#include <fstream>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

constexpr size_t kListLimit = 500;

enum class Mode { List, Summary, Html, Json };
enum class Rewrite { None, Clean, Strip };

struct Arguments {
    Mode mode = Mode::List;
    Rewrite rewrite = Rewrite::None;
    std::string input_path;
    std::string output_path;
    std::string config_path;
    std::string report_path;
    std::string jump;
    bool debug = false;
};

void print_usage(std::ostream& os) {
    os << "Usage: hcscan [options] [FILE]\n"
       << "Report hidden and invisible Unicode characters in FILE (or stdin).\n\n"
       << "  --list              positioned occurrences (default, first " << kListLimit << ")\n"
       << "  --summary           frequency table\n"
       << "  --html              annotated markup\n"
       << "  --json              full report as JSON\n"
       << "  --clean             write cleaned text (default name FILE-clean.txt)\n"
       << "  --strip             write text with every non-printable character removed\n"
       << "  -o, --output OUT    file for --clean or --strip\n"
       << "  --config FILE       clean options JSON\n"
       << "  --jump LINE:COL     print the byte offset of a position\n"
       << "  --save-report FILE  save the report as a binary archive\n"
       << "  --debug             trace cleaning rules\n"
       << "  --help              show this message\n";
}

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto require_value = [&](const std::string& name) -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + name);
            }
            return argv[++i];
        };

        if (arg == "--list") {
            args.mode = Mode::List;
        } else if (arg == "--summary") {
            args.mode = Mode::Summary;
        } else if (arg == "--html") {
            args.mode = Mode::Html;
        } else if (arg == "--json") {
            args.mode = Mode::Json;
        } else if (arg == "--clean" || arg == "--strip") {
            args.rewrite = arg == "--clean" ? Rewrite::Clean : Rewrite::Strip;
        } else if (arg == "--output" || arg == "-o") {
            args.output_path = require_value(arg);
        } else if (arg == "--config") {
            args.config_path = require_value(arg);
        } else if (arg == "--jump") {
            args.jump = require_value(arg);
        } else if (arg == "--save-report") {
            args.report_path = require_value(arg);
        } else if (arg == "--debug") {
            args.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(std::cout);
            std::exit(0);
        } else if (arg.compare(0, 2, "--") == 0) {
            throw std::runtime_error("Unknown option: " + arg);
        } else if (args.input_path.empty()) {
            args.input_path = arg;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
    }
    return args;
}

std::string read_input(const std::string& path) {
    if (path.empty() || path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open input file: " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void write_output(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << text;
}

void print_list(const hc::Report& report) {
    if (report.occurrences.empty()) {
        std::cout << "No hidden characters." << std::endl;
        return;
    }

    size_t shown = 0;
    for (const auto& occurrence : report.occurrences) {
        if (shown++ == kListLimit) {
            std::cout << "Showing first " << kListLimit << " occurrences..." << std::endl;
            break;
        }
        std::ostringstream where;
        where << occurrence.line << ":" << occurrence.column;
        std::cout << std::left << std::setw(12) << where.str()
                  << std::setw(28) << occurrence.name
                  << std::setw(10) << hc::to_hex(occurrence.code_point)
                  << occurrence.category << std::endl;
    }
    std::cout << "Found " << report.occurrences.size() << " hidden characters." << std::endl;
}

void print_summary(const hc::Report& report) {
    if (report.frequencies.empty()) {
        std::cout << "No hidden characters." << std::endl;
        return;
    }
    for (const auto& entry : report.frequencies) {
        std::cout << std::left << std::setw(28) << entry.name
                  << std::setw(10) << hc::to_hex(entry.code_point)
                  << "x " << entry.count << std::endl;
    }
}

void print_jump(const std::string& text, const std::string& position) {
    const size_t colon = position.find(':');
    if (colon == std::string::npos) {
        throw std::runtime_error("Expected LINE:COL for --jump, got: " + position);
    }
    size_t line = 0;
    size_t column = 0;
    try {
        line = std::stoul(position.substr(0, colon));
        column = std::stoul(position.substr(colon + 1));
    } catch (const std::exception&) {
        throw std::runtime_error("Expected LINE:COL for --jump, got: " + position);
    }
    std::cout << "Offset: " << hc::position_to_offset(text, line, column) << std::endl;
}

int run(const Arguments& args) {
    hc::CleanOptions options = args.config_path.empty()
        ? hc::default_options()
        : hc::config::load_options_strict(args.config_path);
    if (args.debug) {
        options.print();
    }

    const std::string text = read_input(args.input_path);
    const hc::Report report = hc::analyze(text);

    switch (args.mode) {
        case Mode::List: print_list(report); break;
        case Mode::Summary: print_summary(report); break;
        case Mode::Html: std::cout << report.visualization.markup << std::endl; break;
        case Mode::Json:
            hc::save_report(report, std::cout, hc::ReportFormat::Json);
            std::cout << std::endl;
            break;
    }

    if (!args.jump.empty()) {
        print_jump(text, args.jump);
    }

    if (!args.report_path.empty()) {
        hc::save_report(report, args.report_path, hc::ReportFormat::Binary);
        std::cout << "Report saved to " << args.report_path << std::endl;
    }

    if (args.rewrite != Rewrite::None) {
        std::string output;
        if (args.rewrite == Rewrite::Clean) {
            hc::Cleaner cleaner(options);
            cleaner.enable_debug_logging(args.debug);
            output = cleaner.clean(text);
        } else {
            output = hc::strip_non_printable(text);
        }

        const std::string path = args.output_path.empty()
            ? hc::cleaned_file_name(args.input_path == "-" ? std::string() : args.input_path)
            : args.output_path;
        write_output(path, output);
        std::cout << "Cleaned text written to " << path << std::endl;
    }

    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        return run(parse_arguments(argc, argv));
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
