#pragma once

#include "RC/RC_errors.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include <cmath>
#include <format>
#include <map>
#include <string>
#include <vector>

namespace RC
{

namespace detail
{

// Validates that prediction & target batches have identical shapes and
// returns the total number of entries
template <UTIL::Weight T>
UTIL::Index
metric_entries( const UTIL::Batch<T> & y_pred, const UTIL::Batch<T> & y_true ) {
    const auto pred_shape{ batch_shape<T>( y_pred, "Prediction batch" ) };
    const auto true_shape{ batch_shape<T>( y_true, "Target batch" ) };
    if ( pred_shape != true_shape ) {
        throw ShapeError( std::format(
            "Prediction [{}, {}, {}] & target [{}, {}, {}] shapes differ.",
            pred_shape.n_batch, pred_shape.n_time, pred_shape.n_states,
            true_shape.n_batch, true_shape.n_time, true_shape.n_states ) );
    }
    return pred_shape.n_batch * pred_shape.n_time * pred_shape.n_states;
}

} // namespace detail

// Mean squared error over all batch elements, time steps & channels
template <UTIL::Weight T>
[[nodiscard]] T
mse( const UTIL::Batch<T> & y_pred, const UTIL::Batch<T> & y_true ) {
    const auto n{ detail::metric_entries<T>( y_pred, y_true ) };
    T          total{ 0. };
    for ( std::size_t b{ 0 }; b < y_pred.size(); ++b ) {
        total += ( y_pred[b] - y_true[b] ).squaredNorm();
    }
    return total / static_cast<T>( n );
}

// Mean absolute error
template <UTIL::Weight T>
[[nodiscard]] T
mae( const UTIL::Batch<T> & y_pred, const UTIL::Batch<T> & y_true ) {
    const auto n{ detail::metric_entries<T>( y_pred, y_true ) };
    T          total{ 0. };
    for ( std::size_t b{ 0 }; b < y_pred.size(); ++b ) {
        total += ( y_pred[b] - y_true[b] ).cwiseAbs().sum();
    }
    return total / static_cast<T>( n );
}

template <UTIL::Weight T>
[[nodiscard]] inline T
rmse( const UTIL::Batch<T> & y_pred, const UTIL::Batch<T> & y_true ) {
    return std::sqrt( mse<T>( y_pred, y_true ) );
}

template <UTIL::Weight T>
[[nodiscard]] T
compute_metric( const metric_t metric, const UTIL::Batch<T> & y_pred,
                const UTIL::Batch<T> & y_true ) {
    switch ( metric ) {
    case metric_t::mse: return mse<T>( y_pred, y_true );
    case metric_t::mae: return mae<T>( y_pred, y_true );
    case metric_t::rmse: return rmse<T>( y_pred, y_true );
    };
    throw UnknownMetricError( std::format( "Metric id {} has no reduction.",
                                           static_cast<int>( metric ) ) );
}

// Evaluates each metric, keyed by its canonical name
template <UTIL::Weight T>
[[nodiscard]] std::map<std::string, T>
compute_metrics( const std::vector<metric_t> & metrics,
                 const UTIL::Batch<T> & y_pred, const UTIL::Batch<T> & y_true ) {
    std::map<std::string, T> scores;
    for ( const auto metric : metrics ) {
        scores[std::string{ to_string( metric ) }] =
            compute_metric<T>( metric, y_pred, y_true );
    }
    return scores;
}

} // namespace RC
