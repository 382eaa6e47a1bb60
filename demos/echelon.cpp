#include "echelon/algorithms.hpp"
#include "echelon/errors.hpp"
#include "echelon/matrix.hpp"
#include "echelon/nullspace.hpp"

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;
using namespace echelon;

// "1,1,1;2,1,1" -> rows separated by ';', entries by ',' or whitespace
static std::vector<Row> parse_rows(const std::string& literal) {
    std::vector<std::string> row_tokens;
    boost::split(row_tokens, literal, boost::is_any_of(";"));

    std::vector<Row> rows;
    for (auto& token : row_tokens) {
        boost::trim(token);
        if (token.empty())
            continue;
        std::vector<std::string> entries;
        boost::split(entries, token, boost::is_any_of(", \t"), boost::token_compress_on);

        std::vector<scalar_t> values;
        for (const auto& e : entries)
            if (!e.empty())
                values.push_back(boost::lexical_cast<scalar_t>(e));
        rows.emplace_back(std::move(values));
    }
    return rows;
}

static bool is_npy(const std::string& arg) { return boost::iends_with(arg, ".npy"); }

static Matrix load_matrix(const std::string& arg) {
    if (is_npy(arg))
        return Matrix::from_npy(arg);
    return Matrix::from_rows(parse_rows(arg));
}

static Vector load_vector(const std::string& arg) {
    if (is_npy(arg))
        return Row::from_npy(arg);
    auto rows = parse_rows(arg);
    if (rows.size() == 1)
        return rows.front();
    // one entry per row: "3;4"
    return Matrix::from_rows(rows).column(0);
}

static void report(const Error& e) {
    std::cerr << "error: " << to_string(e.kind());
    if (e.row() != npos)
        std::cerr << " row=" << e.row();
    if (e.col() != npos)
        std::cerr << " column=" << e.col();
    std::cerr << ": " << e.what() << std::endl;
}

int main(int argc, char* argv[]) {
    po::options_description desc("Allowed options");
    desc.add_options()
        ("help,h", "produce help message")
        ("matrix,A", po::value<std::string>()->required(), "coefficient matrix: .npy file or literal \"1,1,1;2,1,1\"")
        ("rhs,b", po::value<std::string>()->required(), "right-hand side: .npy file or literal \"3,4\"")
        ("output,o", po::value<std::string>()->default_value(""), "prefix for .npy output of the solution")
        ("tolerance,t", po::value<double>()->default_value(k_default_zero_tolerance), "zero tolerance relative to the largest entry")
        ("precision,p", po::value<int>()->default_value(4), "digits when printing")
        ("steps,s", po::bool_switch()->default_value(false), "print augmented, REF and RREF matrices")
        ("no-consistency-check", po::bool_switch()->default_value(false), "return a particular solution even for inconsistent systems")
    ;

    po::positional_options_description p;
    p.add("matrix", 1);
    p.add("rhs", 1);

    po::variables_map vm;

    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);

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
    config.zero_tolerance    = vm["tolerance"].as<double>();
    config.check_consistency = !vm["no-consistency-check"].as<bool>();
    const int precision      = vm["precision"].as<int>();

    try {
        const Matrix A = load_matrix(vm["matrix"].as<std::string>());
        const Vector b = load_vector(vm["rhs"].as<std::string>());
        std::cout << std::setprecision(precision);

        if (vm["steps"].as<bool>()) {
            const Matrix aug  = augment(A, b);
            const Matrix ref  = to_row_echelon(aug, config.zero_tolerance);
            const Matrix rref = to_reduced_row_echelon(ref, config.zero_tolerance);
            const auto   cls  = classify_columns(rref, config.zero_tolerance);
            std::cout << "Augmented Matrix:\n" << aug << "\nRow Echelon Form:\n" << ref
                      << "\nReduced Row Echelon Form:\n" << rref << "\n"
                      << cls << "\npivot column -> row: " << cls.pivot_row_of_col() << std::endl;
        }

        const SolutionSpace space(A, b, config);
        std::cout << space.solution() << "\n"
                  << general_solution_string(space.solution(), precision) << std::endl;
        std::cerr << "rank " << space.solution().rank() << ", free variables " << space.dim() << ", residual "
                  << residual(A, b, space.particular()) << std::endl;

        const auto output = vm["output"].as<std::string>();
        if (!output.empty()) {
            space.particular().save_npy(output + ".particular.npy");
            Matrix basis(0, space.unknowns());
            for (const auto& v : space.basis())
                basis.push_back(v);
            basis.save_npy(output + ".basis.npy");
        }
    } catch (const Error& e) {
        report(e);
        return 1;
    } catch (const boost::bad_lexical_cast& e) {
        std::cerr << "error: cannot parse number: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
