#include "CSV/simple_csv.hpp"
#include "RC/RC.hpp"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <format>
#include <iostream>
#include <map>
#include <numbers>
#include <string>
#include <tuple>
#include <vector>

namespace
{

using T = double;

// x = sin(pi t), y = 2 cos(pi t), t_i = offset + 0.02 i
std::tuple<UTIL::Mat<T>, UTIL::Mat<T>>
sine_to_cosine( const UTIL::Index n_samples, const T offset = T{ 0. } ) {
    UTIL::Mat<T> x( n_samples, 1 ), y( n_samples, 1 );
    for ( UTIL::Index i{ 0 }; i < n_samples; ++i ) {
        const T t{ offset + T{ 0.02 } * static_cast<T>( i ) };
        x( i, 0 ) = std::sin( std::numbers::pi_v<T> * t );
        y( i, 0 ) = T{ 2. } * std::cos( std::numbers::pi_v<T> * t );
    }
    return { x, y };
}

void
print_scores( const std::string_view label,
              const std::map<std::string, T> & scores ) {
    for ( const auto & [name, value] : scores ) {
        std::cout << std::format( "{} {}: {}\n", label, name, value );
    }
}

int
run( const nlohmann::json & config ) {
    const auto model_config{
        config.contains( "model" )
            ? config.at( "model" ).get<RC::ReservoirComputerConfig<T>>()
            : RC::ReservoirComputerConfig<T>{ .num_nodes = 200, .seed = 42 }
    };

    // Training & test data
    UTIL::Mat<T> train_x, train_y, test_x, test_y;
    if ( config.contains( "input_csv" ) && config.contains( "target_csv" ) ) {
        const CSV::SimpleCSV input_csv(
            config.at( "input_csv" ).get<std::string>(),
            config.value( "col_titles", false ) );
        const CSV::SimpleCSV target_csv(
            config.at( "target_csv" ).get<std::string>(),
            config.value( "col_titles", false ) );
        const auto inputs{ input_csv.atv<T>() };
        const auto targets{ target_csv.atv<T>() };
        if ( inputs.rows() != targets.rows() || inputs.rows() < 2 ) {
            std::cerr << std::format(
                "Input ({}) & target ({}) files need the same number of rows, "
                "at least 2.\n",
                inputs.rows(), targets.rows() );
            return EXIT_FAILURE;
        }

        const auto train_fraction{ config.value( "train_fraction", 0.75 ) };
        const auto n_train{ std::clamp<UTIL::Index>(
            static_cast<UTIL::Index>( train_fraction
                                      * static_cast<T>( inputs.rows() ) ),
            1, inputs.rows() - 1 ) };
        train_x = inputs.topRows( n_train );
        train_y = targets.topRows( n_train );
        test_x = inputs.bottomRows( inputs.rows() - n_train );
        test_y = targets.bottomRows( targets.rows() - n_train );
    }
    else {
        const auto n_samples{ config.value( "n_samples", UTIL::Index{ 300 } ) };
        std::tie( train_x, train_y ) = sine_to_cosine( n_samples );
        std::tie( test_x, test_y ) = sine_to_cosine(
            n_samples, T{ 0.02 } * static_cast<T>( n_samples ) );
    }

    std::cout << std::format(
        "nodes: {}, leakage_rate: {}, spectral_radius: {}, sparsity: {}, "
        "ridge_alpha: {}\n",
        model_config.num_nodes, model_config.leakage_rate,
        model_config.spectral_radius, model_config.sparsity,
        model_config.ridge_alpha );
    std::cout << std::format( "train: {}, test: {}\n",
                              UTIL::mat_shape_str<T>( train_x ),
                              UTIL::mat_shape_str<T>( test_x ) );

    const auto init_start{ std::chrono::steady_clock::now() };
    RC::ReservoirComputer<T> model( model_config );
    const auto init_finish{ std::chrono::steady_clock::now() };

    std::cout << "Train..." << std::endl;
    const auto train_start{ std::chrono::steady_clock::now() };
    model.fit( RC::to_batch<T>( train_x ), RC::to_batch<T>( train_y ) );
    const auto train_finish{ std::chrono::steady_clock::now() };

    std::cout << "Predict..." << std::endl;
    const auto predict_start{ std::chrono::steady_clock::now() };
    const auto prediction{ RC::from_batch<T>(
        model.predict( RC::to_batch<T>( test_x ) ) ) };
    const auto predict_finish{ std::chrono::steady_clock::now() };

    print_scores( "train", model.evaluate( RC::to_batch<T>( train_x ),
                                           RC::to_batch<T>( train_y ) ) );
    print_scores( "test", model.evaluate( RC::to_batch<T>( test_x ),
                                          RC::to_batch<T>( test_y ) ) );

    const T target_power{ test_y.squaredNorm()
                          / static_cast<T>( test_y.size() ) };
    if ( target_power > T{ 0. } ) {
        std::cout << std::format(
            "test normalised mse: {}\n",
            ( prediction - test_y ).squaredNorm()
                / static_cast<T>( test_y.size() ) / target_power );
    }

    std::cout << std::format(
        "Initialising took: {}\n",
        std::chrono::duration_cast<std::chrono::duration<T>>( init_finish
                                                              - init_start ) );
    std::cout << std::format(
        "Training took: {}\n",
        std::chrono::duration_cast<std::chrono::duration<T>>( train_finish
                                                              - train_start ) );
    std::cout << std::format(
        "Predicting took: {}\n",
        std::chrono::duration_cast<std::chrono::duration<T>>(
            predict_finish - predict_start ) );

    // Write results to file
    if ( config.contains( "forecast_output" ) ) {
        const std::filesystem::path write_path{
            config.at( "forecast_output" ).get<std::string>()
        };

        std::vector<std::string> col_titles;
        for ( UTIL::Index i{ 0 }; i < prediction.cols(); ++i ) {
            col_titles.push_back( std::format( "prediction_{}", i ) );
        }
        for ( UTIL::Index i{ 0 }; i < test_y.cols(); ++i ) {
            col_titles.push_back( std::format( "target_{}", i ) );
        }

        UTIL::Mat<T> forecast_data( prediction.rows(),
                                    prediction.cols() + test_y.cols() );
        forecast_data << prediction, test_y;

        CSV::SimpleCSV::write( write_path, forecast_data, col_titles );
        std::cout << std::format( "Wrote forecast to {}\n",
                                  write_path.string() );
    }

    return EXIT_SUCCESS;
}

} // namespace

int
main( int argc, char * argv[] ) {
    try {
        const nlohmann::json config = argc > 1 ? RC::load_json( argv[1] )
                                               : nlohmann::json::object();
        return run( config );
    }
    catch ( const RC::Error & e ) {
        std::cerr << std::format( "rc_demo: {}\n", e.what() );
    }
    catch ( const nlohmann::json::exception & e ) {
        std::cerr << std::format( "rc_demo: invalid config: {}\n", e.what() );
    }
    return EXIT_FAILURE;
}
