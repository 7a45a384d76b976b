#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "lamp/util/io.hpp"
#include "lamp/util/result.hpp"
#include "lamp/util/severity.hpp"
#include "lamp/util/strings.hpp"
#include "lamp/util/tty.hpp"

#include "lamp/builtin_directive_set.hpp"
#include "lamp/diagnostic.hpp"
#include "lamp/document.hpp"
#include "lamp/fwd.hpp"
#include "lamp/markup_parser.hpp"
#include "lamp/parse_input.hpp"
#include "lamp/print.hpp"
#include "lamp/rewrite.hpp"
#include "lamp/services.hpp"
#include "lamp/settings.hpp"

namespace lamp {
namespace {

struct Loaded_File {
    std::u8string_view name;
    std::pmr::vector<char8_t> text;

    [[nodiscard]]
    std::u8string_view source() const
    {
        return as_u8string_view(text);
    }
};

struct Stderr_Logger final : Logger {
    const std::pmr::vector<Loaded_File>& files;
    std::pmr::u8string out;
    bool any_errors = false;

    [[nodiscard]]
    Stderr_Logger(
        Severity min_severity,
        const std::pmr::vector<Loaded_File>& files,
        std::pmr::memory_resource* memory
    )
        : Logger { min_severity }
        , files { files }
        , out { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        any_errors |= diagnostic.severity >= Severity::error;

        std::u8string_view source;
        for (const Loaded_File& file : files) {
            if (file.name == diagnostic.file) {
                source = file.source();
                break;
            }
        }
        print_diagnostic(out, diagnostic, source, is_stderr_tty);
        std::cerr << std::u8string_view { out };
        out.clear();
    }
};

/// @brief Adds the `key=value` pairs in `entries` to `config`.
/// @returns The first entry which is not in the form `key=value`, if any.
[[nodiscard]]
Result<void, std::u8string_view>
add_config_entries(Config& config, const std::vector<std::string>& entries)
{
    for (const std::string& entry : entries) {
        const std::u8string_view entry_u8 = as_u8string_view(entry);
        const std::size_t equals = entry_u8.find(u8'=');
        if (equals == std::u8string_view::npos || equals == 0) {
            return entry_u8;
        }
        config.insert_or_assign(
            std::pmr::u8string { entry_u8.substr(0, equals), config.get_allocator() },
            std::pmr::u8string { entry_u8.substr(equals + 1), config.get_allocator() }
        );
    }
    return {};
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
        "Parses LAMP markup documents, resolves their directives, and prints the resulting tree."
    };
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;
    args::PositionalList<std::string> input_arg {
        parser,
        "input",
        "Input markup files",
        args::Options::Required,
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for log messages",
        { 'l', "severity" },
        severity_arg_map,
        Severity::info,
    };
    args::ValueFlagList<std::string> config_arg {
        parser,
        "key=value",
        "Configuration value shared by all documents",
        { 'c', "config" },
    };
    args::ValueFlag<std::size_t> depth_arg {
        parser,
        "depth",
        "Maximum nesting depth of directive bodies",
        { 'd', "max-depth" },
        default_max_nesting_depth,
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

    std::pmr::unsynchronized_pool_resource memory;

    const std::vector<std::string> input_paths = input_arg.Get();
    std::pmr::vector<Loaded_File> files { &memory };
    files.reserve(input_paths.size());
    for (const std::string& path : input_paths) {
        const std::u8string_view path_u8 = as_u8string_view(path);
        Result<std::pmr::vector<char8_t>, IO_Error_Code> text = load_utf8_file(path_u8, &memory);
        if (!text) {
            std::pmr::u8string error { &memory };
            print_io_error(error, path_u8, text.error(), is_stderr_tty);
            std::cerr << std::u8string_view { error };
            return EXIT_FAILURE;
        }
        files.push_back(Loaded_File { .name = path_u8, .text = std::move(*text) });
    }

    Document_Tree tree { .config = Config { &memory },
                         .documents = std::pmr::vector<Document> { &memory } };
    if (const Result<void, std::u8string_view> added
        = add_config_entries(tree.config, config_arg.Get());
        !added) {
        std::cerr << "Invalid configuration entry (expected key=value): " << added.error() << '\n';
        return EXIT_FAILURE;
    }

    Stderr_Logger logger { severity_arg.Get(), files, &memory };
    const Builtin_Directive_Set directives { &memory };

    // The parsers must outlive the placeholders in the tree,
    // which are resolved only once every document has been parsed.
    std::pmr::vector<std::unique_ptr<Markup_Parser>> parsers { &memory };
    parsers.reserve(files.size());
    for (const Loaded_File& file : files) {
        const Parse_Options options {
            .file_name = file.name,
            .logger = logger,
            .max_nesting_depth = depth_arg.Get(),
            .memory = &memory,
        };
        parsers.push_back(std::make_unique<Markup_Parser>(
            directives.span_directives(), directives.block_directives(), options
        ));
        tree.documents.push_back(parsers.back()->parse_document(file.source()));
    }

    resolve_placeholders(tree, logger);

    std::pmr::u8string out { &memory };
    for (const Document& document : tree.documents) {
        dump_document(out, document);
    }
    std::cout << std::u8string_view { out };
    std::cout.flush();

    return logger.any_errors ? EXIT_FAILURE : EXIT_SUCCESS;
}

} // namespace
} // namespace lamp

// NOLINTNEXTLINE(bugprone-exception-escape)
int main(int argc, const char* const* argv)
{
    return lamp::main(argc, argv);
}
