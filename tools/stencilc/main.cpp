/**
 * Template compiler CLI
 * Usage: stencilc [options] [file.xml], or pipe markup to stdin
 */

#include "stencil/compiler/compiler.hpp"
#include "stencil/tags/core_tags.hpp"
#include "stencil/core/logger.hpp"
#include <iostream>
#include <fstream>
#include <sstream>

using namespace stencil;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [file]\n"
              << "  -o FILE            write generated code to FILE instead of stdout\n"
              << "  --keep-comments    pass markup comments through\n"
              << "  --keep-xmlns       keep tag library namespace declarations\n"
              << "  --no-escape        do not re-escape passed-through text\n"
              << "  --log-level LEVEL  trace, debug, info, warn, error, fatal or off\n"
              << "  --log-file FILE    also write log records to FILE\n";
}

} // namespace

int main(int argc, char* argv[]) {
    compiler::CompilerOptions options;
    LogLevel log_level = LogLevel::Warn;
    const char* input_path = nullptr;
    const char* output_path = nullptr;
    const char* log_path = nullptr;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next_value = [&]() -> const char* {
            return i + 1 < argc ? argv[++i] : nullptr;
        };

        if (arg == "-o") {
            output_path = next_value();
            if (!output_path) {
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "--keep-comments") {
            options.keep_comments = true;
        } else if (arg == "--keep-xmlns") {
            options.strip_vocabulary_declarations = false;
        } else if (arg == "--no-escape") {
            options.escape_text = false;
        } else if (arg == "--log-level") {
            const char* value = next_value();
            std::optional<LogLevel> level;
            if (value) {
                level = parse_log_level(value);
            }
            if (!level) {
                std::cerr << "Error: Unknown log level: " << (value ? value : "") << "\n";
                return 1;
            }
            log_level = *level;
        } else if (arg == "--log-file") {
            log_path = next_value();
            if (!log_path) {
                print_usage(argv[0]);
                return 1;
            }
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg.starts_with("-") && arg != "-") {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        } else if (!input_path) {
            input_path = argv[i];
        } else {
            print_usage(argv[0]);
            return 1;
        }
    }

    logging::init();
    logging::set_level(log_level);
    if (log_path) {
        auto sink = std::make_unique<FileSink>(log_path);
        if (!sink->is_open()) {
            std::cerr << "Error: Cannot open log file: " << log_path << "\n";
            logging::shutdown();
            return 1;
        }
        logging::add_sink(std::move(sink));
    }

    std::string source;
    if (input_path && std::string_view(input_path) != "-") {
        std::ifstream file(input_path, std::ios::in | std::ios::binary);
        if (!file) {
            std::cerr << "Error: Cannot open file: " << input_path << "\n";
            logging::shutdown();
            return 1;
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();
        source = buffer.str();
        options.source_name = String(input_path);
    } else {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        source = buffer.str();
        options.source_name = "<stdin>"_s;
    }

    compiler::Compiler compiler(options);
    compiler.register_vocabulary<tags::CoreTags>(String(tags::CoreTags::NAMESPACE_URI));

    auto result = compiler.compile(std::string_view(source));
    if (!result) {
        std::cerr << result.error().to_string().c_str() << "\n";
        logging::shutdown();
        return 1;
    }

    bool written = false;
    if (output_path) {
        // A failed open, write or close all leave failbit set
        std::ofstream out(output_path, std::ios::out | std::ios::binary);
        out.write(result.value().data(), static_cast<std::streamsize>(result.value().size()));
        out.close();
        written = !out.fail();
    } else {
        std::cout.write(result.value().data(), static_cast<std::streamsize>(result.value().size()));
        written = static_cast<bool>(std::cout.flush());
    }

    if (!written) {
        std::cerr << "Error: Cannot write output: " << (output_path ? output_path : "<stdout>") << "\n";
        logging::shutdown();
        return 1;
    }

    logging::shutdown();
    return 0;
}
