/**
 * @file main.cpp
 * @brief Command-line entry point for the sector portfolio optimizer
 *
 * Loads a configuration, ingests prices or returns, estimates the
 * covariance, solves for the maximum Sharpe portfolio under sector bounds
 * and reports the result.
 */

#include "sectoropt/data/data_loader.hpp"
#include "sectoropt/optimizer/optimizer_config.hpp"
#include "sectoropt/optimizer/sector_portfolio_optimizer.hpp"
#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace sectoropt;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "Sector Portfolio Optimizer\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --prices PATH         Wide-format price CSV (overrides config)\n"
              << "  --returns PATH        Wide-format return CSV (overrides config)\n"
              << "  --synthetic DAYS      Use DAYS of synthetic prices instead of a file\n"
              << "  --output PATH         Write the result as JSON to PATH\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/nifty_sectors.json --prices data/prices.csv\n"
              << "  " << program_name << " --config config/nifty_sectors.json --synthetic 500\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string prices_path;
    std::string returns_path;
    std::string output_path;
    size_t synthetic_days = 0;
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--prices" && i + 1 < argc)
            {
                args.prices_path = argv[++i];
            }
            else if (arg == "--returns" && i + 1 < argc)
            {
                args.returns_path = argv[++i];
            }
            else if (arg == "--synthetic" && i + 1 < argc)
            {
                const long days = std::stol(argv[++i]);
                if (days < 2)
                {
                    throw std::invalid_argument("--synthetic needs at least 2 days, got " + std::to_string(days));
                }
                args.synthetic_days = static_cast<size_t>(days);
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_path = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty();
    }
};

/**
 * @brief Load the return series named by the arguments or the configuration
 */
data::ReturnSeries load_returns(const CommandLineArgs &args, const optimizer::OptimizerConfig &config)
{
    const auto &tickers = config.universe.get_asset_names();

    if (args.synthetic_days > 0)
    {
        auto table = data::DataLoader::generate_synthetic_prices(tickers, args.synthetic_days);
        return data::ReturnSeries::from_prices(table.values, table.tickers, table.dates);
    }

    std::string returns_path = args.returns_path.empty() ? config.returns_file : args.returns_path;
    std::string prices_path = args.prices_path.empty() ? config.prices_file : args.prices_path;

    if (!returns_path.empty())
    {
        return data::DataLoader::load_returns_csv(returns_path, tickers);
    }
    if (!prices_path.empty())
    {
        return data::DataLoader::load_prices_csv(prices_path, tickers);
    }

    throw std::runtime_error("No data source: pass --prices, --returns or --synthetic, or set data.prices_file");
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/4] Loading configuration..." << std::endl;

        auto config = optimizer::OptimizerConfig::load(args.config_path);
        if (args.verbose)
        {
            config.settings.solver.verbose = true;
            std::cout << "  - Assets: " << config.universe.size()
                      << " in " << config.universe.num_sectors() << " sectors\n";
            std::cout << "  - Risk model: " << config.settings.risk_model.type << "\n";
        }

        // ====================================================================
        // 2. Load Market Data
        // ====================================================================
        std::cout << "[2/4] Loading market data..." << std::endl;

        auto returns = load_returns(args, config);
        std::cout << "  - Loaded " << returns.num_observations() << " observations, "
                  << returns.num_assets() << " assets" << std::endl;

        if (args.verbose)
        {
            returns.print_summary();
        }

        // ====================================================================
        // 3. Risk Model Estimation
        // ====================================================================
        std::cout << "[3/4] Estimating covariance..." << std::endl;

        optimizer::SectorPortfolioOptimizer portfolio_optimizer(config.universe, config.settings);
        portfolio_optimizer.set_returns(returns);
        portfolio_optimizer.set_sector_bounds(config.sector_bounds);

        std::cout << "  - Shrinkage intensity: " << std::fixed << std::setprecision(4)
                  << portfolio_optimizer.get_shrinkage_intensity() << "\n";

        for (const auto &sector : portfolio_optimizer.get_constraint_set().unconstrained_sectors())
        {
            std::cerr << "Warning: sector '" << sector << "' has no bounds and is unconstrained\n";
        }

        // ====================================================================
        // 4. Portfolio Optimization
        // ====================================================================
        std::cout << "[4/4] Running portfolio optimization..." << std::endl;

        auto outcome = portfolio_optimizer.try_optimize();
        if (!outcome)
        {
            std::cerr << "\nOptimization failed (" << to_string(outcome.status) << "): "
                      << outcome.message << std::endl;
            return 2;
        }

        outcome.portfolio->print_summary();

        if (!args.output_path.empty())
        {
            std::ofstream out(args.output_path);
            if (!out.is_open())
            {
                throw std::runtime_error("Could not open output file: " + args.output_path);
            }
            out << outcome.portfolio->to_json().dump(2) << "\n";
            std::cout << "Result written to: " << args.output_path << "\n";
        }

        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "Optimization completed in " << duration << " ms" << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    CommandLineArgs args;
    try
    {
        args = CommandLineArgs::parse(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (args.show_help || !args.is_valid())
    {
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    return run(args);
}
