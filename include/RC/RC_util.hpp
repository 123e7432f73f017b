#pragma once

#include "RC/RC_errors.hpp"
#include "util/common.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <functional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace RC
{

// Elementwise activation functions known to the registry
enum class activation_t { identity, tanh, sigmoid, relu };

// Readout training strategies
enum class optimizer_t { ridge };

// Metric reductions available to evaluate()
enum class metric_t { mse, mae, rmse };

// Distribution the recurrent & input weights are drawn from
enum class weight_dist_t { uniform, normal };

// Blocks making up a row of the collected-states matrix
enum class feature_t : UTIL::Index {
    reservoir = 1 /* Always required */,
    bias = 2,
    linear = 4,
    default_feature = 3, // reservoir & bias
    max = 8              // Past every flag
};
RC_ENUM_FLAGS( feature_t )

// Name lookups, defined in RC_util.cpp. Lookups are case-insensitive.
[[nodiscard]] activation_t     parse_activation( std::string_view name );
[[nodiscard]] std::string_view to_string( activation_t activation ) noexcept;
[[nodiscard]] std::vector<std::string_view> activation_names();

[[nodiscard]] optimizer_t      parse_optimizer( std::string_view name );
[[nodiscard]] std::string_view to_string( optimizer_t optimizer ) noexcept;

[[nodiscard]] metric_t         parse_metric( std::string_view name );
[[nodiscard]] std::string_view to_string( metric_t metric ) noexcept;
[[nodiscard]] std::vector<metric_t>
parse_metrics( const std::vector<std::string> & names );

[[nodiscard]] weight_dist_t    parse_weight_dist( std::string_view name );
[[nodiscard]] std::string_view to_string( weight_dist_t dist ) noexcept;

[[nodiscard]] feature_t
parse_features( const std::vector<std::string> & names );
[[nodiscard]] std::vector<std::string> feature_names( feature_t features );

template <UTIL::Weight T>
[[nodiscard]] std::function<T( const T )>
activation_function( const activation_t activation ) {
    switch ( activation ) {
    case activation_t::identity: {
        return []( const T x ) { return x; };
    }
    case activation_t::tanh: {
        return []( const T x ) { return std::tanh( x ); };
    }
    case activation_t::sigmoid: {
        return []( const T x ) { return T{ 1. } / ( T{ 1. } + std::exp( -x ) ); };
    }
    case activation_t::relu: {
        return []( const T x ) { return x > T{ 0. } ? x : T{ 0. }; };
    }
    };

    throw UnknownActivationError( std::format(
        "Activation id {} has no function.",
        static_cast<int>( activation ) ) );
}

// Registry entry point: name -> pure elementwise function
template <UTIL::Weight T>
[[nodiscard]] inline std::function<T( const T )>
resolve_activation( const std::string_view name ) {
    return activation_function<T>( parse_activation( name ) );
}

// Free dimension in a declared shape
constexpr UTIL::Index any_size{ -1 };

[[nodiscard]] constexpr inline bool
dims_compatible( const UTIL::Index a, const UTIL::Index b ) noexcept {
    return a == any_size || b == any_size || a == b;
}

// Declared [time, channel] shape of a layer
struct Shape
{
    UTIL::Index n_time{ any_size };
    UTIL::Index n_states{ any_size };

    [[nodiscard]] constexpr bool
    accepts( const UTIL::Index time, const UTIL::Index states ) const noexcept {
        return dims_compatible( n_time, time )
               && dims_compatible( n_states, states );
    }
    [[nodiscard]] constexpr bool
    compatible( const Shape & other ) const noexcept {
        return accepts( other.n_time, other.n_states );
    }

    bool operator==( const Shape & ) const = default;
};

[[nodiscard]] std::string shape_str( const Shape & shape );

// Shape of a uniform batch
struct BatchShape
{
    UTIL::Index n_batch;
    UTIL::Index n_time;
    UTIL::Index n_states;

    bool operator==( const BatchShape & ) const = default;
};

// Validates that a batch is non-empty & uniform, returning its shape
template <UTIL::Weight T>
[[nodiscard]] BatchShape
batch_shape( const UTIL::Batch<T> & batch, const std::string_view what = "batch" ) {
    if ( batch.empty() ) {
        throw ShapeError( std::format( "{} must hold at least one sequence.",
                                       what ) );
    }

    const BatchShape shape{ static_cast<UTIL::Index>( batch.size() ),
                            batch.front().rows(), batch.front().cols() };
    if ( shape.n_time == 0 || shape.n_states == 0 ) {
        throw ShapeError( std::format( "{} sequences must be non-empty: {}.",
                                       what,
                                       UTIL::mat_shape_str<T>( batch.front() ) ) );
    }

    for ( const auto [i, seq] : batch | std::views::enumerate ) {
        if ( seq.rows() != shape.n_time || seq.cols() != shape.n_states ) {
            throw ShapeError( std::format(
                "{} element {} has shape {}, expected ({}, {}).", what, i,
                UTIL::mat_shape_str<T>( seq ), shape.n_time, shape.n_states ) );
        }
    }

    return shape;
}

// Stacks a batch into a single matrix, row = b * n_time + t
template <UTIL::Weight T>
[[nodiscard]] UTIL::Mat<T>
stack_batch( const UTIL::Batch<T> & batch ) {
    const auto   shape{ batch_shape<T>( batch ) };
    UTIL::Mat<T> result( shape.n_batch * shape.n_time, shape.n_states );
    for ( const auto [i, seq] : batch | std::views::enumerate ) {
        result.middleRows( i * shape.n_time, shape.n_time ) = seq;
    }
    return result;
}

// Inverse of stack_batch
template <UTIL::Weight T>
[[nodiscard]] UTIL::Batch<T>
split_rows( const UTIL::ConstRefMat<T> & m, const UTIL::Index n_time ) {
    if ( n_time <= 0 || m.rows() % n_time != 0 ) {
        throw ShapeError( std::format(
            "Cannot split {} rows into sequences of length {}.", m.rows(),
            n_time ) );
    }

    UTIL::Batch<T> result;
    result.reserve( static_cast<std::size_t>( m.rows() / n_time ) );
    for ( UTIL::Index offset{ 0 }; offset < m.rows(); offset += n_time ) {
        result.emplace_back( m.middleRows( offset, n_time ) );
    }
    return result;
}

// One-element batch from a single [time, channel] sequence
template <UTIL::Weight T>
[[nodiscard]] inline UTIL::Batch<T>
to_batch( const UTIL::ConstRefMat<T> & sequence ) {
    return UTIL::Batch<T>{ UTIL::Mat<T>{ sequence } };
}

template <UTIL::Weight T>
[[nodiscard]] inline UTIL::Mat<T>
from_batch( const UTIL::Batch<T> & batch ) {
    return stack_batch<T>( batch );
}

// Selects the batch elements at the given indices
template <UTIL::Weight T>
[[nodiscard]] UTIL::Batch<T>
take( const UTIL::Batch<T> & batch, const std::vector<UTIL::Index> & indices ) {
    UTIL::Batch<T> result;
    result.reserve( indices.size() );
    for ( const auto i : indices ) {
        result.push_back( batch.at( static_cast<std::size_t>( i ) ) );
    }
    return result;
}

} // namespace RC
