//! # sidl-traits
//!
//! Loads a document of `apply` statements and prints the trait applications
//! it contains, one JSON object per statement.
//!
//! ## Usage
//!
//! ```bash
//! sidl-traits model/weather.sidl
//! sidl-traits --pretty --max-depth=16 model/weather.sidl
//! sidl-traits -vv --log-file=sidl.log model/weather.sidl
//! ```
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                    |
//! |------|--------------------------------------------|
//! | 0    | Every statement parsed                     |
//! | 1    | Usage, I/O, lexer or parse error           |

#include "driver.hpp"

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/apply_parser.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>

namespace {

using namespace sidl;

struct CliOptions {
    std::string path;
    bool pretty = false;
    ParserOptions parser;
};

void print_usage() {
    std::cout << "sidl-traits " << VERSION << "\n\n"
              << "Usage: sidl-traits [options] <file>\n\n"
              << "Options:\n"
              << "  --pretty            Indent the JSON output\n"
              << "  --max-depth=N       Maximum nesting depth of values (default 64)\n"
              << "  --log-level=LEVEL   trace, debug, info, warn, error, off\n"
              << "  --log-filter=SPEC   Per-module levels, e.g. parser=debug,*=warn\n"
              << "  --log-file=PATH     Also write log messages to PATH\n"
              << "  -v, -vv, -vvv       More logging; -q for errors only\n"
              << "  -h, --help          Show this help\n";
}

/// Parses tool options; logging options are read separately.
auto parse_cli_options(int argc, char* argv[]) -> Result<CliOptions, std::string> {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--pretty") {
            options.pretty = true;
        } else if (arg.starts_with("--max-depth=")) {
            auto digits = arg.substr(12);
            size_t depth = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), depth);
            if (ec != std::errc() || ptr != digits.data() + digits.size() || depth == 0) {
                return "invalid value for --max-depth: " + std::string(digits);
            }
            options.parser.max_nesting_depth = depth;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            return "unknown option: " + std::string(arg);
        } else if (options.path.empty()) {
            options.path = std::string(arg);
        } else {
            return "unexpected argument: " + std::string(arg);
        }
    }

    if (options.path.empty()) {
        return std::string("no input file");
    }
    return options;
}

/// Prints `file:line:column: severity: message` followed by the source line
/// and a caret under the column.
void print_diagnostic(const lexer::Source& source, const SourceLocation& location,
                      std::string_view severity, const std::string& message) {
    std::cerr << location.to_string() << ": " << severity << ": " << message << "\n";

    auto text = source.line(location.line);
    if (text.empty()) {
        return;
    }
    std::cerr << "    " << text << "\n    ";
    for (uint32_t i = 1; i < location.column && i <= text.size(); ++i) {
        std::cerr << (text[i - 1] == '\t' ? '\t' : ' ');
    }
    std::cerr << "^\n";
}

auto report_lexer_errors(const lexer::Source& source, const lexer::Lexer& lex) -> bool {
    for (const auto& error : lex.errors()) {
        print_diagnostic(source, error.span.start, "error", error.message);
    }
    return lex.has_errors();
}

auto run(const CliOptions& options) -> int {
    SIDL_LOG_INFO("cli", "Loading " << options.path);

    auto loaded = lexer::Source::from_file(options.path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }
    const lexer::Source& source = unwrap(loaded);

    lexer::Lexer lex(source);
    auto tokens = lex.tokenize();
    if (report_lexer_errors(source, lex)) {
        return 1;
    }

    parser::TokenCursor cursor(std::move(tokens), options.parser);
    parser::ForwardReferenceResolver resolver;

    auto parsed = parser::parse_apply_statements(cursor, resolver);
    if (is_err(parsed)) {
        const auto& error = unwrap_err(parsed);
        SIDL_LOG_ERROR("cli", "Failed to parse " << options.path);
        print_diagnostic(source, error.location, "error", error.message);
        return 1;
    }

    for (const auto& warning : cursor.warnings()) {
        print_diagnostic(source, warning.location, "warning", warning.message);
    }

    for (const auto& statement : unwrap(parsed)) {
        auto rendered = parser::to_node(statement);
        std::cout << (options.pretty ? rendered.to_string_pretty() : rendered.to_string()) << "\n";
    }

    SIDL_LOG_INFO("cli", "Parsed " << unwrap(parsed).size() << " apply statement(s), "
                                   << resolver.references().size() << " deferred reference(s)");
    return 0;
}

} // namespace

int sidl_main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        }
    }

    sidl::log::Logger::init(sidl::log::parse_log_options(argc, argv));

    auto options = parse_cli_options(argc, argv);
    if (sidl::is_err(options)) {
        std::cerr << "error: " << sidl::unwrap_err(options) << "\n\n";
        print_usage();
        return 1;
    }

    int code = run(sidl::unwrap(options));
    sidl::log::Logger::instance().flush();
    return code;
}
