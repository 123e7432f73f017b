#pragma once

#include "RC/RC_errors.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

// Includes to calculate eigenvalues of sparse matrices
#include "Eigen/Eigenvalues"
#include "Spectra/GenEigsSolver.h"
#include "Spectra/MatOp/SparseGenMatProd.h"

#include <boost/random/bernoulli_distribution.hpp>
#include <boost/random/normal_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <complex>
#include <format>
#include <functional>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <vector>

namespace RC
{

// Spectral radii below this fraction of the matrix norm are treated as zero
template <UTIL::Weight T>
constexpr T degenerate_radius_tol{ std::numeric_limits<T>::epsilon() * T{ 1E3 } };

template <UTIL::Weight T>
struct ReservoirWeights
{
    // Recurrent weights, nodes x nodes
    UTIL::SMat<T> W_res;
    // Input weights, nodes x n_input
    UTIL::Mat<T> W_in;
    // Spectral radius of W_res before rescaling
    T raw_spectral_radius;
};

// Draws one weight value from the configured symmetric distribution
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
[[nodiscard]] std::function<T( Generator & )>
weight_sampler( const weight_dist_t dist ) {
    switch ( dist ) {
    case weight_dist_t::normal: {
        return []( Generator & gen ) {
            boost::random::normal_distribution<T> normal( T{ 0. }, T{ 1. } );
            return normal( gen );
        };
    }
    case weight_dist_t::uniform: {
        return []( Generator & gen ) {
            boost::random::uniform_real_distribution<T> uniform( T{ -1. },
                                                                 T{ 1. } );
            return uniform( gen );
        };
    }
    };

    throw ConfigError( std::format( "Weight distribution id {} has no sampler.",
                                    static_cast<int>( dist ) ) );
}

// Samples the non-zero entries of a rows x cols matrix. Each entry is kept
// with probability (1 - sparsity).
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
[[nodiscard]] std::vector<Eigen::Triplet<T, UTIL::Index>>
generate_sparse_triplets( const UTIL::Index rows, const UTIL::Index cols,
                          const T sparsity, Generator & gen,
                          const std::function<T( Generator & )> & gen_value ) {
    if ( T{ 0. } > sparsity || T{ 1. } < sparsity ) {
        throw ConfigError( std::format(
            "Matrix sparsity must satisfy: 0 <= sparsity <= 1 (sparsity = {})",
            sparsity ) );
    }

    const T density{ T{ 1. } - sparsity };
    boost::random::uniform_real_distribution<T> distribution( T{ 0. },
                                                              T{ 1. } );

    // Storage for triplets reserved based on estimated no. of elements
    std::vector<Eigen::Triplet<T, UTIL::Index>> triplets;
    triplets.reserve(
        static_cast<std::size_t>( static_cast<T>( rows * cols ) * density ) );

    for ( UTIL::Index j{ 0 }; j < cols; ++j ) {
        for ( UTIL::Index i{ 0 }; i < rows; ++i ) {
            const auto x{ distribution( gen ) };
            if ( density == T{ 1. } || x < density ) {
                triplets.emplace_back( i, j, gen_value( gen ) );
            }
        }
    }

    return triplets;
}

// Generates sparse matrix
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
[[nodiscard]] UTIL::SMat<T>
generate_sparse( const UTIL::Index rows, const UTIL::Index cols,
                 const T sparsity, Generator & gen,
                 const std::function<T( Generator & )> & gen_value ) {
    const auto triplets{ generate_sparse_triplets<T, Generator>(
        rows, cols, sparsity, gen, gen_value ) };

    UTIL::SMat<T> result( rows, cols );
    result.setFromTriplets( triplets.cbegin(), triplets.cend() );
    result.makeCompressed();
    return result;
}

// Largest eigenvalue magnitude via a dense eigen decomposition
template <UTIL::Weight T>
[[nodiscard]] T
spectral_radius_dense( const UTIL::ConstRefMat<T> & m ) {
    if ( m.rows() != m.cols() ) {
        throw ShapeError( std::format(
            "Spectral radius requires a square matrix, got {}.",
            UTIL::mat_shape_str<T>( m ) ) );
    }
    if ( m.size() == 0 ) {
        return T{ 0. };
    }

    const Eigen::EigenSolver<UTIL::Mat<T>> solver( m, false );
    if ( solver.info() != Eigen::Success ) {
        throw InitializationError(
            "Eigenvalues of dense matrix did not converge." );
    }
    return solver.eigenvalues().cwiseAbs().maxCoeff();
}

// Largest eigenvalue magnitude using Spectra's implicitly restarted Arnoldi
// method. Returns std::nullopt when Spectra does not produce a result.
template <UTIL::Weight T>
[[nodiscard]] std::optional<T>
spectral_radius_arnoldi( const UTIL::SMat<T> & m,
                         const UTIL::Index     max_it = 1000,
                         const T               tol = T{ 1E-10 } ) {
    const UTIL::Index n{ m.rows() };
    const UTIL::Index nev{ 1 };
    const UTIL::Index ncv{ std::min<UTIL::Index>( n, 40 ) };

    // Spectra requires: nev + 2 <= ncv <= n
    if ( !( nev + 2 <= ncv && ncv <= n ) ) {
        return std::nullopt;
    }

    Spectra::SparseGenMatProd<T, Eigen::ColMajor, UTIL::Index> op( m );
    Spectra::GenEigsSolver<
        Spectra::SparseGenMatProd<T, Eigen::ColMajor, UTIL::Index>>
        eigs( op, nev, ncv );

    // Initialise & compute
    eigs.init();
    [[maybe_unused]] const auto nconv{ eigs.compute(
        Spectra::SortRule::LargestMagn, max_it, tol,
        Spectra::SortRule::LargestMagn ) };

    if ( eigs.info() != Spectra::CompInfo::Successful ) {
        return std::nullopt;
    }

    const Eigen::Vector<std::complex<T>, Eigen::Dynamic> eigenvalues{
        eigs.eigenvalues() };
    if ( eigenvalues.size() == 0 ) {
        return std::nullopt;
    }
    return std::abs( eigenvalues( 0 ) );
}

// Largest eigenvalue magnitude of a sparse matrix. Matrices with at most
// dense_limit rows use the dense solver, larger ones the Arnoldi solver with
// the dense solver as fallback.
template <UTIL::Weight T>
[[nodiscard]] T
spectral_radius( const UTIL::SMat<T> & m, const UTIL::Index dense_limit = 512,
                 const bool verbose = false ) {
    if ( m.rows() != m.cols() ) {
        throw ShapeError(
            std::format( "Spectral radius requires a square matrix, got ({}, "
                         "{}).",
                         m.rows(), m.cols() ) );
    }
    if ( m.nonZeros() == 0 ) {
        return T{ 0. };
    }

    if ( m.rows() > dense_limit ) {
        if ( const auto radius{ spectral_radius_arnoldi<T>( m ) } ) {
            return *radius;
        }
        if ( verbose ) {
            std::cerr << std::format(
                "Arnoldi iteration did not converge for a {} node "
                "reservoir, using dense eigen decomposition.\n",
                m.rows() );
        }
    }

    return spectral_radius_dense<T>( UTIL::Mat<T>( m ) );
}

// Input weights: every node is connected to all inputs with probability
// fraction_input, otherwise its row is zero.
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
[[nodiscard]] UTIL::Mat<T>
generate_input_weights( const UTIL::Index n_node, const UTIL::Index n_input,
                        const T fraction_input, Generator & gen,
                        const std::function<T( Generator & )> & gen_value ) {
    if ( T{ 0. } > fraction_input || T{ 1. } < fraction_input ) {
        throw ConfigError( std::format(
            "Input fraction must satisfy: 0 <= fraction_input <= 1 "
            "(fraction_input = {})",
            fraction_input ) );
    }

    boost::random::bernoulli_distribution<T> connected( fraction_input );

    UTIL::Mat<T> result{ UTIL::Mat<T>::Zero( n_node, n_input ) };
    for ( UTIL::Index i{ 0 }; i < n_node; ++i ) {
        if ( connected( gen ) ) {
            for ( UTIL::Index j{ 0 }; j < n_input; ++j ) {
                result( i, j ) = gen_value( gen );
            }
        }
    }

    return result;
}

// Samples W_res & W_in for a reservoir. W_res is rescaled so its spectral
// radius equals spectral_radius.
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
[[nodiscard]] ReservoirWeights<T>
initialize_weights(
    const UTIL::Index n_node, const UTIL::Index n_input,
    const T fraction_input, const T spectral_radius, const T sparsity,
    const std::optional<typename Generator::result_type> seed = std::nullopt,
    const weight_dist_t dist = weight_dist_t::uniform,
    const UTIL::Index dense_limit = 512, const bool verbose = false ) {
    if ( n_node < 1 || n_input < 1 ) {
        throw ConfigError( std::format(
            "Reservoir needs at least one node & one input (nodes = {}, "
            "inputs = {}).",
            n_node, n_input ) );
    }
    if ( !( spectral_radius > T{ 0. } ) || !std::isfinite( spectral_radius ) ) {
        throw ConfigError( std::format(
            "Spectral radius must be positive & finite (spectral_radius = {}).",
            spectral_radius ) );
    }

    Generator gen( seed.has_value()
                       ? *seed
                       : static_cast<typename Generator::result_type>(
                             std::random_device{}() ) );
    gen.discard( static_cast<unsigned long long>( gen() ) );

    const auto sampler{ weight_sampler<T, Generator>( dist ) };

    const auto start{ std::chrono::steady_clock::now() };

    // Adjacency matrix
    UTIL::SMat<T> W_res{ generate_sparse<T, Generator>( n_node, n_node,
                                                        sparsity, gen,
                                                        sampler ) };
    if ( verbose ) {
        std::cout << std::format(
            "Reservoir density: {}\n",
            static_cast<T>( W_res.nonZeros() )
                / static_cast<T>( n_node * n_node ) );
    }

    const T raw_radius{ RC::spectral_radius<T>( W_res, dense_limit,
                                                verbose ) };
    const T norm{ W_res.norm() };
    if ( !( raw_radius > degenerate_radius_tol<T> * std::max( norm, T{ 1. } ) ) ) {
        throw InitializationError( std::format(
            "Sampled reservoir has a degenerate spectral radius ({}) and "
            "cannot be rescaled (nodes = {}, sparsity = {}).",
            raw_radius, n_node, sparsity ) );
    }
    W_res *= spectral_radius / raw_radius;

    // Input weights
    UTIL::Mat<T> W_in{ generate_input_weights<T, Generator>(
        n_node, n_input, fraction_input, gen, sampler ) };
    if ( ( W_in.array() != T{ 0. } ).rowwise().any().count() == 0 ) {
        throw InitializationError( std::format(
            "No reservoir node receives input (nodes = {}, fraction_input = "
            "{}).",
            n_node, fraction_input ) );
    }

    if ( verbose ) {
        std::cout << std::format(
            "Initialised {} node reservoir (raw spectral radius {}) in {}\n",
            n_node, raw_radius,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start ) );
    }

    return ReservoirWeights<T>{ std::move( W_res ), std::move( W_in ),
                                raw_radius };
}

} // namespace RC
