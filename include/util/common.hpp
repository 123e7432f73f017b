#pragma once

#include "Eigen/Core"
#include "Eigen/Sparse"
#include "Eigen/SVD"

#include <boost/random/mersenne_twister.hpp>
#include <concepts>
#include <format>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

// Bitwise operators for enum classes used as flag sets
#define RC_ENUM_FLAGS( T )                                                     \
    [[nodiscard]] constexpr inline T operator|( const T lhs,                   \
                                                const T rhs ) noexcept {       \
        return static_cast<T>( std::to_underlying( lhs )                       \
                               | std::to_underlying( rhs ) );                  \
    }                                                                          \
    [[nodiscard]] constexpr inline T operator&( const T lhs,                   \
                                                const T rhs ) noexcept {       \
        return static_cast<T>( std::to_underlying( lhs )                       \
                               & std::to_underlying( rhs ) );                  \
    }                                                                          \
    [[nodiscard]] constexpr inline bool has_flag( const T set,                 \
                                                  const T flag ) noexcept {    \
        return ( std::to_underlying( set ) & std::to_underlying( flag ) )      \
               == std::to_underlying( flag );                                  \
    }

namespace UTIL
{

// Type concepts

template <typename T>
concept InStream = std::convertible_to<T, std::istream &>;
template <typename T>
concept OutStream = std::convertible_to<T, std::ostream &>;

template <typename T>
concept Streamable =
    requires( T x, const T y, std::ostream & os, std::istream & is ) {
        { os << y } -> OutStream;
        { is >> x } -> InStream;
    };

// RandomNumberEngine concept
template <typename Engine>
concept RandomNumberEngine =
    requires( Engine e, const typename Engine::result_type seed,
              const unsigned long long n ) {
        requires std::unsigned_integral<typename Engine::result_type>;
        { e.seed( seed ) } -> std::same_as<void>;
        { e.operator()() } -> std::same_as<typename Engine::result_type>;
        { e.discard( n ) } -> std::same_as<void>;
        { e.min() } -> std::same_as<typename Engine::result_type>;
        { e.max() } -> std::same_as<typename Engine::result_type>;
    }
    && std::default_initializable<Engine>
    && std::constructible_from<Engine, const Engine &>
    && std::constructible_from<Engine, typename Engine::result_type>
    && std::equality_comparable<Engine> && Streamable<Engine>;

// Default generator for all weight sampling. Boost's engine & distributions
// produce the same sequence on every platform for a given seed.
using DefaultGenerator = boost::random::mt19937;

// Concept for weight types
template <typename T>
concept Weight = std::floating_point<T>;

// Typedef for all integral types. Same as Eigen::Index.
using Index = std::ptrdiff_t;

// Eigen vector typedefs
template <Weight T, Index N = Eigen::Dynamic>
using Vec = Eigen::Vector<T, N>;
template <Weight T, Index N = Eigen::Dynamic>
using ConstRefVec = Eigen::Ref<const Vec<T, N>>;

// Eigen matrix typedefs
template <Weight T, Index R = Eigen::Dynamic, Index C = Eigen::Dynamic>
using Mat = Eigen::Matrix<T, R, C>;
template <Weight T, Index R = Eigen::Dynamic, Index C = Eigen::Dynamic>
using ConstRefMat = Eigen::Ref<const Mat<T, R, C>>;
template <Weight T>
using SMat = Eigen::SparseMatrix<T, Eigen::ColMajor, Index>;

// A batch of sequences, indexed [batch][time, channel]
template <Weight T>
using Batch = std::vector<Mat<T>>;

// String version of Eigen::Matrix shape
template <Weight T>
std::string
mat_shape_str( const ConstRefMat<T> m ) {
    return std::format( "({}, {})", m.rows(), m.cols() );
}

// Ratio of smallest to largest singular value
template <Weight T>
inline T
inversion_condition( const ConstRefMat<T> m ) {
    const auto sing_values = m.jacobiSvd().singularValues();
    if ( sing_values.size() == 0 || sing_values( 0 ) == T{ 0. } ) {
        return T{ 0. };
    }
    return sing_values( Eigen::placeholders::last ) / sing_values( 0 );
}

} // namespace UTIL
