#pragma once

#include "RC/RC_errors.hpp"
#include "util/common.hpp"

#include "Eigen/Cholesky"
#include "Eigen/LU"
#include "nlohmann/json.hpp"

#include <cmath>
#include <concepts>
#include <format>
#include <iostream>

namespace RC
{

// Readout trainers: built from JSON parameters, map (features, targets) to
// readout weights of shape (n_features, n_outputs).
template <class S, typename T>
concept Solver = requires( const S solver, const UTIL::ConstRefMat<T> features,
                           const UTIL::ConstRefMat<T> Y,
                           const nlohmann::json &     params ) {
    requires UTIL::Weight<T>;
    { S( params ) } -> std::same_as<S>;
    { solver.solve( features, Y ) } -> std::same_as<UTIL::Mat<T>>;
};

// Ridge regression, W = (Phi^T Phi + alpha I)^-1 Phi^T Y
template <UTIL::Weight T>
class L2Solver
{
    private:
    T    m_alpha;
    bool m_verbose;

    static constexpr T default_alpha{ 1E-6 };

    static inline T validated_alpha( const T alpha ) {
        if ( !( alpha >= T{ 0. } ) || !std::isfinite( alpha ) ) {
            throw ConfigError( std::format(
                "Ridge parameter alpha must be finite & >= 0 (alpha = {}).",
                alpha ) );
        }
        return alpha;
    }

    public:
    explicit L2Solver( const T alpha = default_alpha,
                       const bool verbose = false ) :
        m_alpha( validated_alpha( alpha ) ), m_verbose( verbose ) {}

    L2Solver( const nlohmann::json & params ) :
        m_alpha( default_alpha ), m_verbose( false ) {
        try {
            m_alpha = validated_alpha(
                params.value( "alpha", default_alpha ) );
            m_verbose = params.value( "verbose", false );
        }
        catch ( const nlohmann::json::exception & e ) {
            throw ConfigError( std::format(
                "Unable to construct L2Solver from parameters:\n\t- alpha "
                "(Weight = std::floating_point).\nERROR: {}",
                e.what() ) );
        }
    }

    [[nodiscard]] constexpr inline T alpha() const noexcept { return m_alpha; }

    [[nodiscard]] UTIL::Mat<T>
    solve( const UTIL::ConstRefMat<T> features,
           const UTIL::ConstRefMat<T> Y ) const {
        if ( features.rows() != Y.rows() ) {
            throw ShapeError( std::format(
                "Number of feature rows ({}) must match number of target rows "
                "({}).",
                features.rows(), Y.rows() ) );
        }
        if ( features.rows() == 0 || features.cols() == 0 || Y.cols() == 0 ) {
            throw ShapeError( std::format(
                "Cannot solve for readout weights with features {} and "
                "targets {}.",
                UTIL::mat_shape_str<T>( features ),
                UTIL::mat_shape_str<T>( Y ) ) );
        }

        const bool finite_input{ features.allFinite() && Y.allFinite() };
        if ( !finite_input && m_verbose ) {
            std::cerr << "L2Solver: non-finite values in features or targets."
                      << std::endl;
        }

        const UTIL::Index n_feat{ features.cols() };
        const UTIL::Mat<T> gram{ features.transpose() * features
                                 + m_alpha
                                       * UTIL::Mat<T>::Identity( n_feat,
                                                                 n_feat ) };
        const UTIL::Mat<T> rhs{ features.transpose() * Y };

        if ( m_verbose ) {
            std::cout << std::format(
                "Solving ridge system: features {}, alpha {}, condition {}\n",
                UTIL::mat_shape_str<T>( features ), m_alpha,
                UTIL::inversion_condition<T>( gram ) );
        }

        UTIL::Mat<T> W;
        if ( m_alpha > T{ 0. } ) {
            const Eigen::LLT<UTIL::Mat<T>> llt( gram );
            if ( finite_input && llt.info() != Eigen::Success ) {
                throw SingularMatrixError( std::format(
                    "Regularised normal equations are not positive definite "
                    "(alpha = {}).",
                    m_alpha ) );
            }
            W = llt.solve( rhs );
        }
        else {
            const Eigen::FullPivLU<UTIL::Mat<T>> lu( gram );
            if ( finite_input && !lu.isInvertible() ) {
                throw SingularMatrixError( std::format(
                    "Normal equations are singular (rank {} of {}); use "
                    "alpha > 0.",
                    lu.rank(), n_feat ) );
            }
            W = lu.solve( rhs );
        }

        if ( finite_input && !W.allFinite() ) {
            throw SingularMatrixError(
                "Ridge solution contains non-finite values." );
        }

        return W;
    }
};

static_assert( Solver<L2Solver<double>, double> );

} // namespace RC
