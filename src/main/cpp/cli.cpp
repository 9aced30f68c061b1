#ifdef __unix__
#include "stdio.h" // NOLINT for fileno
#include <unistd.h>
#endif

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "cslc/util/ansi.hpp"
#include "cslc/util/result.hpp"
#include "cslc/util/severity.hpp"
#include "cslc/util/strings.hpp"

#include "cslc/bib_formatting.hpp"
#include "cslc/compile_context.hpp"
#include "cslc/diagnostic.hpp"
#include "cslc/locale.hpp"
#include "cslc/print.hpp"
#include "cslc/services.hpp"
#include "cslc/style.hpp"
#include "cslc/style_error.hpp"

namespace cslc {
namespace {

[[nodiscard]]
bool is_stderr_tty() noexcept
{
#ifdef __unix__
    return isatty(fileno(stderr));
#else
    return false;
#endif
}

[[nodiscard]]
std::u8string_view severity_highlight(Severity severity)
{
    return severity <= Severity::trace        ? ansi::black
        : severity <= Severity::debug        ? ansi::h_black
        : severity <= Severity::info         ? ansi::blue
        : severity <= Severity::soft_warning ? ansi::green
        : severity <= Severity::warning      ? ansi::h_yellow
        : severity <= Severity::error        ? ansi::h_red
        : severity <= Severity::fatal        ? ansi::red
                                             : ansi::magenta;
}

struct Stderr_Logger final : Logger {
    std::pmr::u8string out;
    bool colors;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(Severity min_severity, bool colors, std::pmr::memory_resource* memory)
        : Logger { min_severity }
        , out { memory }
        , colors { colors }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        append_colored(severity_highlight(diagnostic.severity), severity_tag(diagnostic.severity));
        out += u8": ";
        out += diagnostic.message;
        out += u8' ';
        out += colors ? ansi::h_black : std::u8string_view {};
        out += u8'[';
        out += diagnostic.id;
        out += u8']';
        out += colors ? ansi::reset : std::u8string_view {};
        out += u8'\n';

        std::cerr << as_string_view(out);
        out.clear();
    }

private:
    void append_colored(std::u8string_view color, std::u8string_view text)
    {
        if (colors) {
            out += color;
        }
        out += text;
        if (colors) {
            out += ansi::reset;
        }
    }
};

void append_number(std::pmr::u8string& out, double x)
{
    char buffer[64];
    const std::to_chars_result r = std::to_chars(buffer, std::end(buffer), x);
    if (r.ec == std::errc {}) {
        out.append(buffer, r.ptr);
    }
}

void dump_bib_formatting(std::pmr::u8string& out, const Bib_Formatting_Parameters& parameters)
{
    out += u8"bibliography formatting:\n  hanging-indent = ";
    out += parameters.hanging_indent.value_or(false) ? u8"true" : u8"false";
    out += u8"\n  line-spacing = ";
    append_number(out, parameters.line_spacing.value_or(1));
    out += u8"\n  entry-spacing = ";
    append_number(out, parameters.entry_spacing.value_or(1));
    out += u8"\n  second-field-align = ";
    out += second_field_align_name(parameters.second_field_align);
    out += u8'\n';
}

int main(int argc, const char* const* const argv)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "min", Severity::min },
        { "trace", Severity::trace },
        { "debug", Severity::debug },
        { "info", Severity::info },
        { "soft_warning", Severity::soft_warning },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "fatal", Severity::fatal },
        { "none", Severity::none },
    };

    args::ArgumentParser parser {
        "Compiles a CSL style and prints the compiled rendering program."
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::Positional<std::string> style_arg {
        parser,
        "style",
        "CSL style file, or inline style XML",
        args::Options::Required,
    };
    args::ValueFlag<std::string> locale_arg {
        parser,
        "locale",
        "Requested locale, like en-US or de",
        { 'L', "locale" },
    };
    args::ValueFlag<std::string> locales_dir_arg {
        parser,
        "directory",
        "Directory containing locales-xx-XX.xml files",
        { 'd', "locales-dir" },
    };
    args::Flag force_locale_arg {
        parser,
        "force-locale",
        "Use the requested locale even if the style has a default locale",
        { 'f', "force-locale" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    if (argc <= 1) {
        parser.Help(std::cout);
        return EXIT_FAILURE;
    }
    if (!parser.ParseCLI(argc, argv) || parser.GetError() != args::Error::None) {
        std::cerr << parser.GetErrorMsg() << '\n';
        return EXIT_FAILURE;
    }
    if (help_arg.Matched()) {
        parser.Help(std::cout);
        return EXIT_SUCCESS;
    }

    const std::string style = style_arg.Get();
    const std::string locale = locale_arg ? locale_arg.Get() : std::string {};

    std::pmr::unsynchronized_pool_resource memory;
    Stderr_Logger logger { severity_arg.Get(), is_stderr_tty(), &memory };
    Compile_Context context { &memory, logger };

    No_Locale_Getter no_locale_getter;
    std::optional<Directory_Locale_Getter> directory_locale_getter;
    if (locales_dir_arg) {
        directory_locale_getter.emplace(std::filesystem::path { locales_dir_arg.Get() });
    }
    Locale_Getter& locale_getter = directory_locale_getter
        ? static_cast<Locale_Getter&>(*directory_locale_getter)
        : no_locale_getter;

    const Style_Options options {
        .locale = as_u8string_view(locale),
        .force_locale = force_locale_arg.Matched(),
    };
    const Result<Compiled_Style, Style_Error> compiled
        = create_style(as_u8string_view(style), locale_getter, options, context);
    if (!compiled) {
        const std::u8string_view error_name = style_error_name(compiled.error());
        std::cerr << "Failed to compile style (" << as_string_view(error_name) << ").\n";
        return EXIT_FAILURE;
    }

    const Result<Bib_Formatting_Parameters, Style_Error> bib_formatting
        = bib_formatting_parameters(compiled->bib_options, context);
    if (!bib_formatting) {
        return EXIT_FAILURE;
    }

    std::pmr::u8string out { &memory };
    dump(out, *compiled);
    dump_bib_formatting(out, *bib_formatting);
    std::cout << as_string_view(out);

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace cslc

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return cslc::main(argc, argv);
}
