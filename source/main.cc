// gqlc
// This is free and unencumbered software released into the public domain.
// See LICENSE.md for more details.

#include "compiler.hh"
#include "emitter.hh"
#include "file_util.hh"
#include "introspection.hh"
#include "json.hh"
#include "log.hh"
#include "schema.hh"
#include "string_util.hh"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

namespace {
    struct Config {
        fs::path input;
        fs::path output;
        fs::path deps;
        std::string namespaceName = "schema";
        gqlc::FetchOptions fetch;
        bool strict = false;

        enum class Mode {
            Cpp,
            Ir,
            Fetch,
            Help,
        } mode = Mode::Cpp;
    };

    bool parse_arguments(int argc, char* argv[], Config& config) {
        enum class Arg {
            None,
            OutputFile,
            DepsFile,
            Namespace,
            Url,
            Header,
        } mode = Arg::None;
        std::string_view mode_argument;

        bool allow_options = true;

        for (int arg_index = 1; arg_index != argc; ++arg_index) {
            auto arg = std::string_view{ argv[arg_index] };
            auto const original_arg = arg;

            switch (mode) {
            case Arg::OutputFile:
                config.output = arg;
                mode = Arg::None;
                break;
            case Arg::DepsFile:
                config.deps = arg;
                mode = Arg::None;
                break;
            case Arg::Namespace:
                config.namespaceName = arg;
                mode = Arg::None;
                break;
            case Arg::Url:
                config.fetch.url = arg;
                mode = Arg::None;
                break;
            case Arg::Header: {
                auto const colon = arg.find(':');
                if (colon == std::string_view::npos) {
                    std::cerr << "error: Expected 'Name: value' after '" << mode_argument << "'\n";
                    return false;
                }
                config.fetch.headers.emplace_back(gqlc::trim(arg.substr(0, colon)), gqlc::trim(arg.substr(colon + 1)));
                mode = Arg::None;
                break;
            }
            default:
                if (arg == "--") {
                    allow_options = false;
                    break;
                }
                else if (allow_options && gqlc::starts_with(arg, "--"))
                    arg = arg.substr(2);
                else if (allow_options && (gqlc::starts_with(arg, "/") || gqlc::starts_with(arg, "-")))
                    arg = arg.substr(1);
                else if (config.input.empty()) {
                    config.input = arg;
                    break;
                }
                else {
                    std::cerr << "Unexpected command parameter '" << arg << "'\n";
                    return false;
                }

                mode_argument = original_arg;
                if (arg == "o" || arg == "output")
                    mode = Arg::OutputFile;
                else if (arg == "d" || arg == "deps")
                    mode = Arg::DepsFile;
                else if (arg == "n" || arg == "namespace")
                    mode = Arg::Namespace;
                else if (arg == "u" || arg == "url")
                    mode = Arg::Url;
                else if (arg == "H" || arg == "header")
                    mode = Arg::Header;
                else if (arg == "fetch")
                    config.mode = Config::Mode::Fetch;
                else if (arg == "ir")
                    config.mode = Config::Mode::Ir;
                else if (arg == "cpp")
                    config.mode = Config::Mode::Cpp;
                else if (arg == "strict")
                    config.strict = true;
                else if (arg == "h" || arg == "help")
                    config.mode = Config::Mode::Help;
                else {
                    std::cerr << "error: Unknown command argument '" << original_arg << "'\n";
                    return false;
                }

                break;
            }
        }

        if (mode != Arg::None) {
            std::cerr << "error: Expected parameter after '" << mode_argument << "'\n";
            return false;
        }

        return true;
    }
}

static int write_output(Config const& config, std::string_view text) {
    if (config.output.empty()) {
        std::cout << text;
        return 0;
    }

    if (!gqlc::saveText(config.output, text)) {
        std::cerr << "error: Failed to write '" << config.output.string() << "'\n";
        return 3;
    }

    if (!config.deps.empty()) {
        std::ofstream deps_stream(config.deps);
        if (!deps_stream) {
            std::cerr << "error: Failed to open '" << config.deps.string() << "' for writing\n";
            return 3;
        }

        deps_stream << config.output.string() << ':';
        if (!config.input.empty())
            deps_stream << ' ' << config.input.string();
        deps_stream << '\n';
    }

    return 0;
}

static int fetch(Config const& config) {
    std::cerr << "Fetching schema from " << config.fetch.url << "...\n";

    std::string sdl;
    gqlc::SchemaFetchError error;
    if (!gqlc::fetchSchema(config.fetch, sdl, error)) {
        std::cerr << "error: " << error << '\n';
        return 2;
    }

    return write_output(config, sdl);
}

static int compile(Config const& config) {
    if (config.input.empty()) {
        std::cerr << "error: No input file provided; use --help to see options\n";
        return 1;
    }

    std::string sdl;
    if (!gqlc::loadText(config.input, sdl)) {
        std::cerr << "error: Failed to read '" << config.input.string() << "'\n";
        return 3;
    }

    gqlc::Log log;
    auto const schema = gqlc::parseSchema(sdl, log, config.input);
    log.flush(std::cerr);

    if (log.countErrors != 0 || (config.strict && log.countWarnings != 0))
        return 2;

    if (config.mode == Config::Mode::Ir)
        return write_output(config, gqlc::serializeToJson(schema).dump(4) + '\n');

    gqlc::EmitOptions options;
    options.namespaceName = config.namespaceName;
    options.sourceName = config.input.filename().string();
    return write_output(config, gqlc::emitHeader(schema, options));
}

static int help(std::filesystem::path program) {
    std::cout <<
        "usage: " << program.filename().string() << " [--fetch|--ir|--cpp] [-o <output>] [-d <depfile>] [-n <namespace>] [-u <url>] [-H <header>]... [--strict] [-h] [--] [<input>]\n" <<
        "  --fetch                  Fetch the schema by introspection and write it as SDL\n" <<
        "  --ir                     Write the parsed schema of <input> as JSON\n" <<
        "  --cpp                    Write a C++ header for the schema of <input> (default)\n" <<
        "  -o|--output <output>     Output file path, otherwise prints to stdout\n" <<
        "  -d|--deps <depfile>      Specify the path that a Make-style deps file will be written to for build system integration\n" <<
        "  -n|--namespace <name>    Namespace of the generated C++ code (default: schema)\n" <<
        "  -u|--url <url>           Endpoint for --fetch (default: https://api.linear.app/graphql)\n" <<
        "  -H|--header <name: val>  Add a request header for --fetch, e.g. 'Authorization: <token>'\n" <<
        "  --strict                 Fail if the schema produced any warnings\n" <<
        "  -h|--help                Print this help information\n" <<
        "  <input>                  The input GraphQL SDL file\n";
    return 0;
}

int main(int argc, char* argv[]) {
    Config config;
    if (!parse_arguments(argc, argv, config)) {
        return 1;
    }

    switch (config.mode) {
    case Config::Mode::Cpp:
    case Config::Mode::Ir: return compile(config);
    case Config::Mode::Fetch: return fetch(config);
    case Config::Mode::Help: return help(argv[0]);
    default: return 1;
    }
}
