#include "echelon/algorithms.hpp"
#include "echelon/nullspace.hpp"
#include "echelon/random.hpp"

#include <boost/program_options.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>

namespace po = boost::program_options;
using namespace echelon;

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("systems,n", po::value<int>()->default_value(1000), "number of random systems")
        ("rows,m", po::value<int>()->default_value(8), "equations per system")
        ("cols,c", po::value<int>()->default_value(10), "unknowns per system")
        ("threads,r", po::value<int>()->default_value(4), "number of threads")
        ("tolerance,t", po::value<double>()->default_value(k_default_zero_tolerance), "zero tolerance relative to the largest entry")
        ("seed,s", po::value<int>()->default_value(4), "random seed")
    ;

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }
        po::notify(vm);
    } catch (const po::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << desc << std::endl;
        return 1;
    }

    SolverConfig config;
    config.threads        = vm["threads"].as<int>();
    config.zero_tolerance = vm["tolerance"].as<double>();

    const auto count = static_cast<index_t>(std::max(0, vm["systems"].as<int>()));
    const auto rows  = static_cast<index_t>(std::max(1, vm["rows"].as<int>()));
    const auto cols  = static_cast<index_t>(std::max(1, vm["cols"].as<int>()));

    Rng  rng(static_cast<index_t>(vm["seed"].as<int>()));
    auto systems = rng.sample_systems(count, rows, cols);

    const auto start    = std::chrono::steady_clock::now();
    auto       outcomes = solve_linear_systems(systems, config);
    const auto elapsed  = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);

    index_t  failed         = 0;
    scalar_t worst_residual = 0.0;
    scalar_t worst_kernel   = 0.0;
    for (index_t i = 0; i < outcomes.size(); ++i) {
        if (!outcomes[i].ok()) {
            ++failed;
            std::cerr << "system " << i << ": " << outcomes[i].message << std::endl;
            continue;
        }
        const auto& sol = *outcomes[i].solution;
        worst_residual  = std::max(worst_residual, residual(systems[i].A, systems[i].b, sol.particular));
        for (const auto& v : sol.null_space_basis)
            worst_kernel = std::max(worst_kernel, (systems[i].A * v).max_abs());
    }

    std::cerr << count << " systems " << rows << "x" << cols << " in " << elapsed.count() << " ms ("
              << config.threads << " threads)" << std::endl
              << "failed: " << failed << ", worst |Ap-b|: " << worst_residual << ", worst |An|: " << worst_kernel
              << std::endl;
    return failed == 0 ? 0 : 1;
}
