#include "RC/RC_util.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/trim.hpp>

#include <array>
#include <format>
#include <tuple>

namespace RC
{

namespace
{

constexpr std::array<std::tuple<std::string_view, activation_t>, 5>
    activation_table{ { { "identity", activation_t::identity },
                        { "linear", activation_t::identity },
                        { "tanh", activation_t::tanh },
                        { "sigmoid", activation_t::sigmoid },
                        { "relu", activation_t::relu } } };

constexpr std::array<std::tuple<std::string_view, metric_t>, 3> metric_table{
    { { "mse", metric_t::mse },
      { "mae", metric_t::mae },
      { "rmse", metric_t::rmse } }
};

constexpr std::array<std::tuple<std::string_view, feature_t>, 3>
    feature_table{ { { "reservoir", feature_t::reservoir },
                     { "bias", feature_t::bias },
                     { "linear", feature_t::linear } } };

std::string
normalise( const std::string_view name ) {
    return boost::algorithm::to_lower_copy(
        boost::algorithm::trim_copy( std::string{ name } ) );
}

template <typename Table>
std::string
known_names( const Table & table ) {
    std::vector<std::string> names;
    for ( const auto & [name, value] : table ) {
        names.emplace_back( name );
    }
    return boost::algorithm::join( names, ", " );
}

} // namespace

activation_t
parse_activation( const std::string_view name ) {
    const auto key{ normalise( name ) };
    for ( const auto & [entry, activation] : activation_table ) {
        if ( entry == key ) {
            return activation;
        }
    }
    throw UnknownActivationError(
        std::format( "Unknown activation function \"{}\". Known: {}.", name,
                     known_names( activation_table ) ) );
}

std::string_view
to_string( const activation_t activation ) noexcept {
    switch ( activation ) {
    case activation_t::identity: return "identity";
    case activation_t::tanh: return "tanh";
    case activation_t::sigmoid: return "sigmoid";
    case activation_t::relu: return "relu";
    };
    return "unknown";
}

std::vector<std::string_view>
activation_names() {
    std::vector<std::string_view> names;
    for ( const auto & [name, activation] : activation_table ) {
        names.push_back( name );
    }
    return names;
}

optimizer_t
parse_optimizer( const std::string_view name ) {
    if ( normalise( name ) == "ridge" ) {
        return optimizer_t::ridge;
    }
    throw UnsupportedOptimizerError( std::format(
        "Unsupported optimizer \"{}\". Only \"ridge\" is available.", name ) );
}

std::string_view
to_string( const optimizer_t optimizer ) noexcept {
    switch ( optimizer ) {
    case optimizer_t::ridge: return "ridge";
    };
    return "unknown";
}

metric_t
parse_metric( const std::string_view name ) {
    const auto key{ normalise( name ) };
    for ( const auto & [entry, metric] : metric_table ) {
        if ( entry == key ) {
            return metric;
        }
    }
    throw UnknownMetricError(
        std::format( "Unknown metric \"{}\". Known: {}.", name,
                     known_names( metric_table ) ) );
}

std::string_view
to_string( const metric_t metric ) noexcept {
    switch ( metric ) {
    case metric_t::mse: return "mse";
    case metric_t::mae: return "mae";
    case metric_t::rmse: return "rmse";
    };
    return "unknown";
}

std::vector<metric_t>
parse_metrics( const std::vector<std::string> & names ) {
    std::vector<metric_t> metrics;
    metrics.reserve( names.size() );
    for ( const auto & name : names ) { metrics.push_back( parse_metric( name ) ); }
    return metrics;
}

weight_dist_t
parse_weight_dist( const std::string_view name ) {
    const auto key{ normalise( name ) };
    if ( key == "uniform" ) {
        return weight_dist_t::uniform;
    }
    if ( key == "normal" ) {
        return weight_dist_t::normal;
    }
    throw ConfigError( std::format(
        "Unknown weight distribution \"{}\". Known: uniform, normal.", name ) );
}

std::string_view
to_string( const weight_dist_t dist ) noexcept {
    switch ( dist ) {
    case weight_dist_t::uniform: return "uniform";
    case weight_dist_t::normal: return "normal";
    };
    return "unknown";
}

feature_t
parse_features( const std::vector<std::string> & names ) {
    // Reservoir states are always part of the feature vector
    feature_t features{ feature_t::reservoir };
    for ( const auto & name : names ) {
        const auto key{ normalise( name ) };
        bool       found{ false };
        for ( const auto & [entry, flag] : feature_table ) {
            if ( entry == key ) {
                features = features | flag;
                found = true;
            }
        }
        if ( !found ) {
            throw ConfigError(
                std::format( "Unknown feature block \"{}\". Known: {}.", name,
                             known_names( feature_table ) ) );
        }
    }
    return features;
}

std::vector<std::string>
feature_names( const feature_t features ) {
    std::vector<std::string> names;
    for ( const auto & [name, flag] : feature_table ) {
        if ( has_flag( features, flag ) ) {
            names.emplace_back( name );
        }
    }
    return names;
}

std::string
shape_str( const Shape & shape ) {
    const auto dim_str{ []( const UTIL::Index n ) {
        return n == any_size ? std::string{ "*" } : std::to_string( n );
    } };
    return std::format( "({}, {})", dim_str( shape.n_time ),
                        dim_str( shape.n_states ) );
}

} // namespace RC
