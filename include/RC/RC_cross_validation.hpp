#pragma once

#include "RC/RC_errors.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include <concepts>
#include <format>
#include <functional>
#include <map>
#include <numeric>
#include <string>
#include <type_traits>
#include <vector>

namespace RC
{

// Anything that can be fitted on & evaluated against sequence batches
template <typename M, typename T>
concept Model = requires( M model, const M const_model, const UTIL::Batch<T> X,
                          const std::vector<std::string> metrics ) {
    requires UTIL::Weight<T>;
    { model.fit( X, X ) };
    {
        const_model.evaluate( X, X, metrics )
    } -> std::same_as<std::map<std::string, T>>;
};

// Contiguous fold boundaries, sizes differ by at most one
[[nodiscard]] inline std::vector<std::pair<UTIL::Index, UTIL::Index>>
fold_ranges( const UTIL::Index n, const UTIL::Index k ) {
    if ( k < 2 || k > n ) {
        throw ConfigError( std::format(
            "Number of folds must satisfy: 2 <= k <= n_batch (k = {}, n_batch "
            "= {}).",
            k, n ) );
    }

    std::vector<std::pair<UTIL::Index, UTIL::Index>> ranges;
    ranges.reserve( static_cast<std::size_t>( k ) );
    UTIL::Index start{ 0 };
    for ( UTIL::Index fold{ 0 }; fold < k; ++fold ) {
        const UTIL::Index size{ n / k + ( fold < n % k ? 1 : 0 ) };
        ranges.emplace_back( start, start + size );
        start += size;
    }
    return ranges;
}

// k-fold cross validation over batch elements. A fresh model is produced by
// factory() for every fold, fitted on the remaining folds and evaluated on the
// held-out one.
template <UTIL::Weight T, std::invocable Factory>
    requires Model<std::invoke_result_t<Factory>, T>
[[nodiscard]] std::vector<std::map<std::string, T>>
k_fold_cross_validate( Factory && factory, const UTIL::Batch<T> & X,
                       const UTIL::Batch<T> & y, const UTIL::Index k,
                       const std::vector<std::string> & metrics = { "mse" } ) {
    if ( X.size() != y.size() ) {
        throw ShapeError( std::format(
            "Input batch ({}) & target batch ({}) sizes differ.", X.size(),
            y.size() ) );
    }
    [[maybe_unused]] const auto x_shape{ batch_shape<T>( X, "Input batch" ) };
    [[maybe_unused]] const auto y_shape{ batch_shape<T>( y, "Target batch" ) };

    const auto n{ static_cast<UTIL::Index>( X.size() ) };

    std::vector<std::map<std::string, T>> results;
    results.reserve( static_cast<std::size_t>( k ) );
    for ( const auto & [start, stop] : fold_ranges( n, k ) ) {
        std::vector<UTIL::Index> train_idx, test_idx;
        for ( UTIL::Index i{ 0 }; i < n; ++i ) {
            ( i >= start && i < stop ? test_idx : train_idx ).push_back( i );
        }

        auto model{ std::invoke( factory ) };
        model.fit( take<T>( X, train_idx ), take<T>( y, train_idx ) );
        results.push_back(
            model.evaluate( take<T>( X, test_idx ), take<T>( y, test_idx ),
                            metrics ) );
    }

    return results;
}

// Average of each metric over folds
template <UTIL::Weight T>
[[nodiscard]] std::map<std::string, T>
mean_scores( const std::vector<std::map<std::string, T>> & results ) {
    std::map<std::string, T> mean;
    if ( results.empty() ) {
        return mean;
    }
    for ( const auto & scores : results ) {
        for ( const auto & [name, value] : scores ) { mean[name] += value; }
    }
    for ( auto & [name, value] : mean ) {
        value /= static_cast<T>( results.size() );
    }
    return mean;
}

} // namespace RC
