// ____________________________________ LICENSE ____________________________________
//
// Project: flamegraph-profiler
//
// This project is licensed under the MIT License.
//
// ____________________________________ CONTENT ____________________________________
//
// Program entry point. Handles CLI args and invokes the backend & frontends.
// _________________________________________________________________________________

#include <chrono>
#include <cstdlib>
#include <filesystem>

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include "backend/config.hpp"
#include "backend/flamegraph.hpp"
#include "backend/invoke.hpp"
#include "frontend/json.hpp"
#include "frontend/terminal.hpp"
#include "frontend/text.hpp"
#include "utility/exception.hpp"
#include "utility/time.hpp"
#include "utility/version.hpp"


constexpr auto style_step    = fmt::fg(fmt::color::dark_blue) | fmt::emphasis::bold;
constexpr auto style_hint    = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
constexpr auto style_error   = fmt::fg(fmt::color::indian_red) | fmt::emphasis::bold;
constexpr auto style_path    = fmt::fg(fmt::color::saddle_brown);
constexpr auto style_enum    = fmt::fg(fmt::color::teal);
constexpr auto style_command = fmt::fg(fmt::color::purple) | fmt::emphasis::bold;

const auto start_time = std::chrono::steady_clock::now();

std::string elapsed_string() {
    return fgp::time::format_duration(std::chrono::steady_clock::now() - start_time);
}

template <class... Args>
void exit_failure(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println("Execution failed with with code {}, elapsed time: {}", EXIT_FAILURE, elapsed_string());
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_FAILURE);
}

template <class... Args>
void exit_failure_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_FAILURE);
}

template <class... Args>
void exit_success(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println("Execution finished, elapsed time: {}", elapsed_string());
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_SUCCESS);
}

template <class... Args>
void exit_success_quiet(fmt::format_string<Args...> fmt, Args&&... args) {
    fmt::println(fmt, std::forward<Args>(args)...);

    std::exit(EXIT_SUCCESS);
}

int main(int argc, char* argv[]) try {
    // Handle CLI args
    const std::string version = fgp::version::format_full();

    argparse::ArgumentParser cli(fgp::version::program, version, argparse::default_arguments::none);

    cli.add_description("Flamegraph & flamechart report generator for evented and sampled profiling traces");

    cli                                //
        .add_argument("-h", "--help")  //
        .flag()                        //
        .help("Displays help message") //
        .action([&](const auto&) {     //
            exit_success_quiet("{}", cli.help().str());
        });

    cli                                       //
        .add_argument("-v", "--version")      //
        .flag()                               //
        .help("Displays application version") //
        .action([&](const auto&) {            //
            exit_success_quiet("{}", version);
        });

    cli                                                                         //
        .add_argument("-w", "--write-config")                                   //
        .flag()                                                                 //
        .help("Creates config file corresponding to the default configuration") //
        .action([](const auto&) {                                               //
            const std::string path = fgp::config::default_path;
            fgp::config{}.to_file(path);
            exit_success("Serialized a copy of default config to {{ {} }}", path);
        });

    cli                                           //
        .add_argument("-c", "--config")           //
        .default_value(std::string{fgp::config::default_path}) //
        .required()                               //
        .help("Specifies custom config path");    //

    cli                                             //
        .add_argument("-a", "--artifacts")          //
        .default_value(std::string{".fgp/"})        //
        .required()                                 //
        .help("Specifies custom output directory"); //

    cli                                                 //
        .add_argument("-f", "--file")                   //
        .required()                                     //
        .help("Selects the trace document to analyze"); //

    cli                                                                     //
        .add_argument("-p", "--profile")                                    //
        .scan<'u', std::size_t>()                                           //
        .help("Selects profile index, defaults to the active profile of the document"); //

    cli                                                           //
        .add_argument("-s", "--sort")                             //
        .choices("call order", "left heavy", "alphabetical")      //
        .help("Overrides sorting strategy of the config");        //

    cli                                                 //
        .add_argument("-i", "--inverted")               //
        .flag()                                         //
        .help("Roots the flamegraph by the leaf frames"); //

    cli                                                    //
        .add_argument("--collapse")                        //
        .choices("none", "system frames")                  //
        .help("Overrides frame collapsing of the config"); //

    cli                                                  //
        .add_argument("-t", "--type")                    //
        .choices("flamegraph", "flamechart")             //
        .help("Overrides profile type of the config");   //

    cli                                               //
        .add_argument("-o", "--output")               //
        .required()                                   //
        .choices("terminal", "json", "text")          //
        .default_value(std::string{"terminal"})       //
        .help("Selects profiling output format");     //

    try {
        cli.parse_args(argc, argv);
    } catch (std::exception& e) {
        fmt::println("{}", fmt::styled("Error parsing CLI arguments:", style_error));
        fmt::println("");
        fmt::println("{}", e.what());
        fmt::println("");
        fmt::println("Run {} to see the full usage guide.", fmt::styled("flamegraph-report --help", style_command));
        exit_failure_quiet("");
    }

    // Parse config
    const std::string config_path = cli.get<std::string>("--config");

    fmt::print(style_step, "Step 1/4: ");
    fmt::println("Parsing config {{ {} }}...", fmt::styled(config_path, style_path));

    fgp::config config = std::filesystem::exists(config_path) ? fgp::config::from_file(config_path) : fgp::config{};

    if (auto sort = cli.present<std::string>("--sort")) config.flamegraph.sort = std::move(*sort);
    if (auto collapse = cli.present<std::string>("--collapse")) config.flamegraph.collapse = std::move(*collapse);
    if (auto type = cli.present<std::string>("--type")) config.flamegraph.type = std::move(*type);
    if (cli.get<bool>("--inverted")) config.flamegraph.inverted = true;

    if (const auto err = config.validate()) exit_failure("Config validation error:\n{}", err.value());

    // Read the trace
    const std::string trace_path = cli.get<std::string>("--file");

    fmt::print(style_step, "Step 2/4: ");
    fmt::println("Reading trace document {{ {} }}...", fmt::styled(trace_path, style_path));

    const fgp::trace_document document = fgp::read_trace_document(trace_path);

    // Build the flamegraph
    const std::size_t profile_index = cli.present<std::size_t>("--profile").value_or(document.active_profile_index);

    fmt::print(style_step, "Step 3/4: ");
    fmt::println("Building {{ {} }} flamegraph of profile {} out of {}...",
                 fmt::styled(config.flamegraph.sort, style_enum), profile_index, document.profiles.size());

    const fgp::profile_ptr profile = fgp::load_profile(document, profile_index, config.make_profile_options(),
                                                       config.make_frame_index_options());

    const fgp::flamegraph flamegraph{profile, profile_index, config.make_flamegraph_options()};

    // Invoke the frontend
    const std::string selected_output = cli.get("--output");

    fmt::print(style_step, "Step 4/4: ");
    fmt::println("Invoking frontend for {{ {} }}...", fmt::styled(selected_output, style_enum));

    const std::filesystem::path output_directory_path = cli.get<std::string>("--artifacts");

    if (selected_output == "terminal") {
        fgp::output::terminal(flamegraph, config);
    } else if (selected_output == "json") {
        fgp::output::json(flamegraph, config, output_directory_path);

        const auto report_path = output_directory_path / "flamegraph.json";

        fmt::print(style_hint, "Hint: ");
        fmt::print("Flamegraph frames were written to ");
        fmt::print(style_path, "{}", report_path.string());
        fmt::println("");

    } else if (selected_output == "text") {
        fgp::output::text(flamegraph, config, output_directory_path);

        const auto report_path = output_directory_path / "report.txt";

        fmt::print(style_hint, "Hint: ");
        fmt::print("To open the generated report in text editor run ");
        fmt::print(style_command, "open {}", report_path.string());
        fmt::println("");

    } else {
        exit_failure("Unknown output format {{ {} }}.", selected_output);
    }

    exit_success("");

} catch (fgp::exception& e) {
    fmt::println("Terminated due to exception:\n{}", e.what());
    // we use a custom exception class with more debug info & colored formatting
    return EXIT_FAILURE;
} catch (std::exception& e) {
    fmt::println("Terminated due to unhandled exception:\n{}", e.what());
    // there should be no other exceptions unless we run into an 'std::bad_alloc'
    return EXIT_FAILURE;
}
