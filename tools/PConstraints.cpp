#include <fstream>
#include <iostream>
#include <map>
#include <random>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#ifdef BACKEND_MPI
#include <bulk/backends/mpi/mpi.hpp>
using environment = bulk::mpi::environment;
#else
#include <bulk/backends/thread/thread.hpp>
using environment = bulk::thread::environment;
#endif

#include <pconstraints.hpp>

int main(int argc, char** argv) {

    /* Sequential reading of parameters */
    CLI::App app("PConstraints settings");

    app.set_config("--config", "../tools/defaults.toml", "Read a TOML file", false);

    struct cli_settings {
        int p = 2;
        std::string constraints_file;
        std::string generate_file;
        long generate_count = 1000;
    };

    cli_settings settings;

    auto options = pconstraints::options();

    app.add_option("-p, --processors", settings.p,
                   "Number of processors to be used", true)
    ->check(CLI::PositiveNumber);

    CLI::Option* fopt =
    app.add_option("-f, --file", settings.constraints_file,
                   "File with a list of constraints that every processor encodes");
    fopt->check(CLI::ExistingFile);

    app.add_option("--generate", settings.generate_file,
                   "Write a list of random constraints to this file and exit");
    app.add_option("--generate_count", settings.generate_count,
                   "Number of constraints written by --generate", true)
    ->check(CLI::NonNegativeNumber);

    app.add_option("--nodes", options.nodes_per_processor,
                   "Number of nodes measured per processor", true);
    app.add_option("--max_size", options.max_size,
                   "Largest bound or size that is generated", true)
    ->check(CLI::NonNegativeNumber);
    app.add_option("--unbounded", options.unbounded_fraction,
                   "Fraction of the generated maxima that is infinite", true)
    ->check(CLI::Range(0.0, 1.0));
    app.add_option("--seed", options.seed, "Seed of the random generator", true);

    std::map<std::string, pconstraints::size_mode> mode_map{
    {"uniform", pconstraints::size_mode::uniform},
    {"tiered", pconstraints::size_mode::tiered}};

    app.add_option("--mode", options.mode, "How bounds are drawn")
    ->transform(CLI::CheckedTransformer(mode_map, CLI::ignore_case));

    CLI11_PARSE(app, argc, argv);

    if (!settings.generate_file.empty()) {
        if (!pconstraints::create_random_constraints(settings.generate_file,
                                                     settings.generate_count, options)) {
            std::cerr << "Error: failed to write constraints\n";
            return 1;
        }
        return 0;
    }

    auto list = std::vector<pconstraints::bounds>();
    if (!settings.constraints_file.empty()) {
        auto constraints = pconstraints::read_constraints(settings.constraints_file);
        if (!constraints) {
            std::cerr << "Error: failed to load constraints\n";
            return 1;
        }
        for (const auto& c : constraints.value()) {
            list.push_back(c.unpack());
        }
    } else {
        std::mt19937 rng(options.seed);
        for (size_t i = 0; i < options.nodes_per_processor; i++) {
            list.push_back(pconstraints::random_constraints(rng, options).unpack());
        }
    }

    environment env;
    /* Start parallel part */
    env.spawn(settings.p, [&options, &list, &app](bulk::world& world) {
        auto s = world.rank();

        if (s == 0) {
            // write the settings to the run file
            auto conf = app.config_to_str();
            std::ofstream out("../tools/settings_run.toml");
            out << conf;
            out.close();
        }

        std::mt19937 rng(options.seed + s);
        auto stats = pconstraints::layout_pass(world, options, rng);
        pconstraints::log_statistics(world, stats);

        auto canonical = pconstraints::canonical_across_processors(world, list);
        if (s == 0) {
            world.log("Encoded %zu constraints on every processor, words %s", list.size(),
                      canonical ? "identical" : "differ");
        }

        world.sync();
    });

    return 0;
}
