#include "cli/options.hpp"

#include <boost/program_options.hpp>
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <fstream>

namespace ctbind
{

std::expected<Options, std::string> parse_command_line(int argc, char* argv[])
{
    namespace po = boost::program_options;

    Options opts;
    auto& gen = opts.generation;
    std::string config_value;

    // clang-format off
    po::options_description generic("Options");
    generic.add_options()
        ("help,h", "Show help message")
        ("schema,s", po::value<std::string>(&opts.schema_file)->value_name("FILE")->required(),
            "Domain schema file (*.ctbs).")
        ("check-only,c", po::bool_switch(&opts.check_only), "Only parse and validate the schema")
        ("print-schema,p", po::bool_switch(&opts.print_schema), "Print the resolved schema model as JSON")
        ("config", po::value<std::string>(&config_value)->value_name("FILE"),
            "INI file supplying generation options")
        ("verbose,v", po::bool_switch(&opts.verbose), "Enable debug logging");

    po::options_description generation("Generation");
    generation.add_options()
        ("output,o", po::value<std::string>(&gen.output)->value_name("FILE")->default_value(gen.output),
            "Output file. '-' writes to standard output.")
        ("runtime-module", po::value<std::string>(&gen.runtime_module)->value_name("NAME")
            ->default_value(gen.runtime_module), "Module the runtime helpers are imported from")
        ("library-handle", po::value<std::string>(&gen.library_handle)->value_name("NAME")
            ->default_value(gen.library_handle), "Name of the loaded native library in the runtime module")
        ("function-prefix", po::value<std::string>(&gen.function_prefix)->value_name("NAME")
            ->default_value(gen.function_prefix), "Prefix of the native lifecycle functions")
        ("mixin-name", po::value<std::string>(&gen.mixin_name)->value_name("NAME")
            ->default_value(gen.mixin_name), "Base name of the generated method-set classes");
    // clang-format on

    po::options_description desc;
    desc.add(generic).add(generation);

    po::positional_options_description positional;
    positional.add("schema", 1);

    po::variables_map vm;

    try {
        auto parser = po::command_line_parser(argc, argv).options(desc).positional(positional).run();
        po::store(parser, vm);

        if (vm.count("help")) {
            // if help is specified, return the options object with help set, ignore other options
            std::string prog_name = argc > 0 ? argv[0] : "ctbind";
            opts.help_message = fmt::format("Usage: {} [options] SCHEMA:\n{}\n", prog_name, fmt::streamed(desc));
            return opts;
        }

        if (vm.count("config")) {
            const auto config_path = vm["config"].as<std::string>();
            std::ifstream config(config_path);
            if (!config) {
                return std::unexpected("Failed to open config file: " + config_path);
            }
            // values already stored from the command line are kept
            po::store(po::parse_config_file(config, generation), vm);
        }

        po::notify(vm);

        if (!config_value.empty()) {
            opts.config_file = std::move(config_value);
        }
        return opts;
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}

}  // namespace ctbind
