#pragma once

#include "RC/RC_errors.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include "nlohmann/json.hpp"

#include <cmath>
#include <concepts>
#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace RC
{

using Seed = UTIL::DefaultGenerator::result_type;

// Hyperparameters of a single random reservoir layer
template <UTIL::Weight T>
struct ReservoirConfig
{
    UTIL::Index         nodes{ 100 };
    std::string         activation{ "tanh" };
    T                   fraction_input{ 0.5 };
    T                   leakage_rate{ 0.5 };
    T                   spectral_radius{ 0.9 };
    T                   sparsity{ 0.9 };
    weight_dist_t       weight_distribution{ weight_dist_t::uniform };
    T                   input_scale{ 1. };
    UTIL::Index         n_input{ any_size };
    std::optional<Seed> seed{ std::nullopt };
    UTIL::Index         dense_eigen_limit{ 512 };
    bool                verbose{ false };

    void validate() const {
        if ( nodes < 1 ) {
            throw ConfigError( std::format(
                "Reservoir must have at least one node (nodes = {}).", nodes ) );
        }
        if ( !( leakage_rate > T{ 0. } && leakage_rate <= T{ 1. } ) ) {
            throw ConfigError( std::format(
                "Leakage rate must satisfy: 0 < leakage_rate <= 1 "
                "(leakage_rate = {}).",
                leakage_rate ) );
        }
        if ( !( spectral_radius > T{ 0. } ) || !std::isfinite( spectral_radius ) ) {
            throw ConfigError( std::format(
                "Spectral radius must be positive & finite (spectral_radius = "
                "{}).",
                spectral_radius ) );
        }
        if ( !( sparsity >= T{ 0. } && sparsity <= T{ 1. } ) ) {
            throw ConfigError( std::format(
                "Sparsity must satisfy: 0 <= sparsity <= 1 (sparsity = {}).",
                sparsity ) );
        }
        if ( !( fraction_input >= T{ 0. } && fraction_input <= T{ 1. } ) ) {
            throw ConfigError( std::format(
                "Input fraction must satisfy: 0 <= fraction_input <= 1 "
                "(fraction_input = {}).",
                fraction_input ) );
        }
        if ( !std::isfinite( input_scale ) ) {
            throw ConfigError( std::format(
                "Input scale must be finite (input_scale = {}).",
                input_scale ) );
        }
        if ( n_input != any_size && n_input < 1 ) {
            throw ConfigError( std::format(
                "Declared input channels must be -1 or positive (n_input = "
                "{}).",
                n_input ) );
        }
        if ( dense_eigen_limit < 0 ) {
            throw ConfigError( std::format(
                "dense_eigen_limit must be non-negative ({}).",
                dense_eigen_limit ) );
        }
        // Throws UnknownActivationError
        [[maybe_unused]] const auto id{ parse_activation( activation ) };
    }
};

// Options recorded by CustomModel::compile
template <UTIL::Weight T>
struct TrainingConfig
{
    T           alpha{ 1E-6 };
    UTIL::Index n_warmup{ 0 };
    feature_t   features{ feature_t::default_feature };
    int         n_threads{ 0 };
    bool        verbose{ false };

    void validate() const {
        if ( !( alpha >= T{ 0. } ) || !std::isfinite( alpha ) ) {
            throw ConfigError( std::format(
                "Ridge parameter alpha must be finite & >= 0 (alpha = {}).",
                alpha ) );
        }
        if ( n_warmup < 0 ) {
            throw ConfigError( std::format(
                "n_warmup must be non-negative (n_warmup = {}).", n_warmup ) );
        }
        if ( n_threads < 0 ) {
            throw ConfigError( std::format(
                "n_threads must be non-negative (n_threads = {}).",
                n_threads ) );
        }
    }
};

// Settings of the predefined Input -> Reservoir -> Readout model
template <UTIL::Weight T>
struct ReservoirComputerConfig
{
    UTIL::Index              num_nodes{ 100 };
    std::string              activation{ "tanh" };
    T                        leakage_rate{ 0.5 };
    T                        spectral_radius{ 0.9 };
    T                        fraction_input{ 0.5 };
    T                        sparsity{ 0.9 };
    T                        ridge_alpha{ 1E-6 };
    std::optional<Seed>      seed{ std::nullopt };
    weight_dist_t            weight_distribution{ weight_dist_t::uniform };
    T                        input_scale{ 1. };
    UTIL::Index              dense_eigen_limit{ 512 };
    UTIL::Index              n_warmup{ 0 };
    feature_t                features{ feature_t::default_feature };
    int                      n_threads{ 0 };
    std::vector<std::string> metrics{ "mse" };
    bool                     verbose{ false };

    [[nodiscard]] ReservoirConfig<T>
    reservoir_config( const UTIL::Index n_input = any_size ) const {
        return ReservoirConfig<T>{ .nodes = num_nodes,
                                   .activation = activation,
                                   .fraction_input = fraction_input,
                                   .leakage_rate = leakage_rate,
                                   .spectral_radius = spectral_radius,
                                   .sparsity = sparsity,
                                   .weight_distribution = weight_distribution,
                                   .input_scale = input_scale,
                                   .n_input = n_input,
                                   .seed = seed,
                                   .dense_eigen_limit = dense_eigen_limit,
                                   .verbose = verbose };
    }

    [[nodiscard]] TrainingConfig<T> training_config() const {
        return TrainingConfig<T>{ .alpha = ridge_alpha,
                                  .n_warmup = n_warmup,
                                  .features = features,
                                  .n_threads = n_threads,
                                  .verbose = verbose };
    }

    void validate() const {
        reservoir_config().validate();
        training_config().validate();
        [[maybe_unused]] const auto parsed{ parse_metrics( metrics ) };
    }
};

namespace detail
{

inline void
require_object( const nlohmann::json & j, const std::string_view what ) {
    if ( !j.is_object() ) {
        throw ConfigError( std::format( "{} must be a JSON object, got {}.",
                                        what, j.type_name() ) );
    }
}

// Reads j[key] into value when present & not null
template <typename V>
void
read_key( const nlohmann::json & j, const std::string & key, V & value ) {
    const auto it{ j.find( key ) };
    if ( it == j.end() || it->is_null() ) {
        return;
    }
    if constexpr ( std::integral<V> && !std::same_as<V, bool> ) {
        if ( !it->is_number_integer() ) {
            throw ConfigError( std::format(
                "Config key \"{}\" must be an integer, got {}.", key,
                it->dump() ) );
        }
    }
    try {
        value = it->template get<V>();
    }
    catch ( const nlohmann::json::exception & e ) {
        throw ConfigError( std::format( "Invalid value for config key \"{}\": {}",
                                        key, e.what() ) );
    }
}

inline void
read_seed( const nlohmann::json & j, const std::string & key,
           std::optional<Seed> & seed ) {
    const auto it{ j.find( key ) };
    if ( it == j.end() ) {
        return;
    }
    if ( it->is_null() ) {
        seed = std::nullopt;
        return;
    }
    if ( !it->is_number_integer()
         || ( !it->is_number_unsigned()
              && it->template get<std::int64_t>() < 0 ) ) {
        throw ConfigError( std::format(
            "Config key \"{}\" must be a non-negative integer or null, got {}.",
            key, it->dump() ) );
    }
    seed = it->template get<Seed>();
}

inline void
read_dist( const nlohmann::json & j, const std::string & key,
           weight_dist_t & dist ) {
    std::string name{ to_string( dist ) };
    read_key( j, key, name );
    dist = parse_weight_dist( name );
}

inline void
read_features( const nlohmann::json & j, const std::string & key,
               feature_t & features ) {
    std::vector<std::string> names{ feature_names( features ) };
    read_key( j, key, names );
    features = parse_features( names );
}

inline nlohmann::json
seed_json( const std::optional<Seed> & seed ) {
    return seed.has_value() ? nlohmann::json( *seed ) : nlohmann::json();
}

} // namespace detail

// JSON serialisation, found by nlohmann::json through ADL

template <UTIL::Weight T>
void
from_json( const nlohmann::json & j, ReservoirConfig<T> & config ) {
    detail::require_object( j, "Reservoir config" );
    ReservoirConfig<T> result{};
    detail::read_key( j, "nodes", result.nodes );
    detail::read_key( j, "activation", result.activation );
    detail::read_key( j, "fraction_input", result.fraction_input );
    detail::read_key( j, "leakage_rate", result.leakage_rate );
    detail::read_key( j, "spectral_radius", result.spectral_radius );
    detail::read_key( j, "sparsity", result.sparsity );
    detail::read_dist( j, "weight_distribution", result.weight_distribution );
    detail::read_key( j, "input_scale", result.input_scale );
    detail::read_key( j, "n_input", result.n_input );
    detail::read_seed( j, "seed", result.seed );
    detail::read_key( j, "dense_eigen_limit", result.dense_eigen_limit );
    detail::read_key( j, "verbose", result.verbose );
    result.validate();
    config = std::move( result );
}

template <UTIL::Weight T>
void
to_json( nlohmann::json & j, const ReservoirConfig<T> & config ) {
    j = nlohmann::json{
        { "nodes", config.nodes },
        { "activation", config.activation },
        { "fraction_input", config.fraction_input },
        { "leakage_rate", config.leakage_rate },
        { "spectral_radius", config.spectral_radius },
        { "sparsity", config.sparsity },
        { "weight_distribution", to_string( config.weight_distribution ) },
        { "input_scale", config.input_scale },
        { "n_input", config.n_input },
        { "seed", detail::seed_json( config.seed ) },
        { "dense_eigen_limit", config.dense_eigen_limit },
        { "verbose", config.verbose }
    };
}

template <UTIL::Weight T>
void
from_json( const nlohmann::json & j, TrainingConfig<T> & config ) {
    TrainingConfig<T> result{};
    if ( !j.is_null() ) {
        detail::require_object( j, "Training parameters" );
        detail::read_key( j, "alpha", result.alpha );
        detail::read_key( j, "n_warmup", result.n_warmup );
        detail::read_features( j, "features", result.features );
        detail::read_key( j, "n_threads", result.n_threads );
        detail::read_key( j, "verbose", result.verbose );
    }
    result.validate();
    config = result;
}

template <UTIL::Weight T>
void
to_json( nlohmann::json & j, const TrainingConfig<T> & config ) {
    j = nlohmann::json{ { "alpha", config.alpha },
                        { "n_warmup", config.n_warmup },
                        { "features", feature_names( config.features ) },
                        { "n_threads", config.n_threads },
                        { "verbose", config.verbose } };
}

template <UTIL::Weight T>
void
from_json( const nlohmann::json & j, ReservoirComputerConfig<T> & config ) {
    detail::require_object( j, "Model config" );
    ReservoirComputerConfig<T> result{};
    detail::read_key( j, "num_nodes", result.num_nodes );
    detail::read_key( j, "activation", result.activation );
    detail::read_key( j, "leakage_rate", result.leakage_rate );
    detail::read_key( j, "spectral_radius", result.spectral_radius );
    detail::read_key( j, "fraction_input", result.fraction_input );
    detail::read_key( j, "sparsity", result.sparsity );
    detail::read_key( j, "ridge_alpha", result.ridge_alpha );
    detail::read_seed( j, "seed", result.seed );
    detail::read_dist( j, "weight_distribution", result.weight_distribution );
    detail::read_key( j, "input_scale", result.input_scale );
    detail::read_key( j, "dense_eigen_limit", result.dense_eigen_limit );
    detail::read_key( j, "n_warmup", result.n_warmup );
    detail::read_features( j, "features", result.features );
    detail::read_key( j, "n_threads", result.n_threads );
    detail::read_key( j, "metrics", result.metrics );
    detail::read_key( j, "verbose", result.verbose );
    result.validate();
    config = std::move( result );
}

template <UTIL::Weight T>
void
to_json( nlohmann::json & j, const ReservoirComputerConfig<T> & config ) {
    j = nlohmann::json{
        { "num_nodes", config.num_nodes },
        { "activation", config.activation },
        { "leakage_rate", config.leakage_rate },
        { "spectral_radius", config.spectral_radius },
        { "fraction_input", config.fraction_input },
        { "sparsity", config.sparsity },
        { "ridge_alpha", config.ridge_alpha },
        { "seed", detail::seed_json( config.seed ) },
        { "weight_distribution", to_string( config.weight_distribution ) },
        { "input_scale", config.input_scale },
        { "dense_eigen_limit", config.dense_eigen_limit },
        { "n_warmup", config.n_warmup },
        { "features", feature_names( config.features ) },
        { "n_threads", config.n_threads },
        { "metrics", config.metrics },
        { "verbose", config.verbose }
    };
}

// Reads a JSON document from disk
[[nodiscard]] inline nlohmann::json
load_json( const std::filesystem::path & path ) {
    const std::filesystem::directory_entry entry{ path };
    if ( !entry.exists() ) {
        throw IOError(
            std::format( "Config file {} does not exist.", path.string() ) );
    }

    std::ifstream file( path, std::ios_base::binary );
    if ( !file.is_open() ) {
        throw IOError(
            std::format( "Unable to open config file {}.", path.string() ) );
    }

    try {
        return nlohmann::json::parse( file );
    }
    catch ( const nlohmann::json::parse_error & e ) {
        throw ConfigError( std::format( "Malformed config file {}:\n{}",
                                        path.string(), e.what() ) );
    }
}

} // namespace RC
