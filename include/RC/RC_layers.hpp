#pragma once

#include "RC/RC_config.hpp"
#include "RC/RC_errors.hpp"
#include "RC/RC_initializer.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include <atomic>
#include <exception>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace RC
{

// Number of OpenMP workers for a requested thread count, 0 = OpenMP default
[[nodiscard]] inline int
worker_count( const int n_threads ) noexcept {
#ifdef _OPENMP
    return n_threads > 0 ? n_threads : omp_get_max_threads();
#else
    static_cast<void>( n_threads );
    return 1;
#endif
}

// Declares the accepted [time, channel] shape of the raw input
template <UTIL::Weight T>
class InputLayer
{
    private:
    Shape m_shape;

    public:
    explicit InputLayer( const Shape shape = {} ) : m_shape( shape ) {}
    InputLayer( const UTIL::Index n_time, const UTIL::Index n_states ) :
        m_shape{ n_time, n_states } {}

    [[nodiscard]] constexpr inline const Shape & shape() const noexcept {
        return m_shape;
    }
    [[nodiscard]] constexpr inline UTIL::Index n_time() const noexcept {
        return m_shape.n_time;
    }
    [[nodiscard]] constexpr inline UTIL::Index n_states() const noexcept {
        return m_shape.n_states;
    }

    BatchShape validate( const UTIL::Batch<T> & X ) const {
        const auto shape{ batch_shape<T>( X, "Input batch" ) };
        if ( !m_shape.accepts( shape.n_time, shape.n_states ) ) {
            throw ShapeError( std::format(
                "Input sequences of shape ({}, {}) do not match the declared "
                "input shape {}.",
                shape.n_time, shape.n_states, shape_str( m_shape ) ) );
        }
        return shape;
    }
};

// Declares the target shape & holds the trained readout weights
template <UTIL::Weight T>
class ReadoutLayer
{
    public:
    using weights_ptr = std::shared_ptr<const UTIL::Mat<T>>;

    private:
    Shape                    m_shape;
    std::atomic<weights_ptr> m_weights;

    public:
    explicit ReadoutLayer( const Shape shape = {} ) :
        m_shape( shape ), m_weights( nullptr ) {}
    ReadoutLayer( const UTIL::Index n_time, const UTIL::Index n_states ) :
        m_shape{ n_time, n_states }, m_weights( nullptr ) {}

    ReadoutLayer( const ReadoutLayer & other ) :
        m_shape( other.m_shape ), m_weights( other.m_weights.load() ) {}
    ReadoutLayer( ReadoutLayer && other ) noexcept :
        m_shape( other.m_shape ), m_weights( other.m_weights.exchange( nullptr ) ) {}
    ReadoutLayer & operator=( const ReadoutLayer & other ) {
        m_shape = other.m_shape;
        m_weights.store( other.m_weights.load() );
        return *this;
    }
    ReadoutLayer & operator=( ReadoutLayer && other ) noexcept {
        m_shape = other.m_shape;
        m_weights.store( other.m_weights.exchange( nullptr ) );
        return *this;
    }

    [[nodiscard]] constexpr inline const Shape & shape() const noexcept {
        return m_shape;
    }
    [[nodiscard]] constexpr inline UTIL::Index n_time() const noexcept {
        return m_shape.n_time;
    }
    [[nodiscard]] constexpr inline UTIL::Index n_states() const noexcept {
        return m_shape.n_states;
    }

    BatchShape validate( const UTIL::Batch<T> & y ) const {
        const auto shape{ batch_shape<T>( y, "Target batch" ) };
        if ( !m_shape.accepts( shape.n_time, shape.n_states ) ) {
            throw ShapeError( std::format(
                "Target sequences of shape ({}, {}) do not match the declared "
                "output shape {}.",
                shape.n_time, shape.n_states, shape_str( m_shape ) ) );
        }
        return shape;
    }

    // Snapshot of the current weights, null before the first fit
    [[nodiscard]] inline weights_ptr weights() const noexcept {
        return m_weights.load();
    }
    [[nodiscard]] inline bool is_fitted() const noexcept {
        return m_weights.load() != nullptr;
    }

    // Drops the trained weights, the layer reports unfitted afterwards
    inline void reset() noexcept { m_weights.store( nullptr ); }

    void set_weights( UTIL::Mat<T> W ) {
        if ( !dims_compatible( m_shape.n_states, W.cols() ) ) {
            throw ShapeError( std::format(
                "Readout weights {} do not produce the declared {} output "
                "channels.",
                UTIL::mat_shape_str<T>( W ), m_shape.n_states ) );
        }
        m_weights.store( std::make_shared<const UTIL::Mat<T>>( std::move( W ) ) );
    }
};

// Capability interface shared by all reservoir variants
template <UTIL::Weight T>
class ReservoirLayer
{
    public:
    virtual ~ReservoirLayer() = default;

    // Declared channel counts, any_size until bound
    [[nodiscard]] virtual UTIL::Index input_states() const noexcept = 0;
    [[nodiscard]] virtual UTIL::Index output_states() const noexcept = 0;
    [[nodiscard]] virtual bool        is_bound() const noexcept = 0;

    // Fixes the input channel count & creates the input dependent weights
    virtual void bind( UTIL::Index n_input ) = 0;

    // [time, n_input] -> [time, output_states]
    [[nodiscard]] virtual UTIL::Mat<T>
    collect_states( const UTIL::ConstRefMat<T> & sequence ) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// Leaky echo state reservoir with randomly sampled weights
template <UTIL::Weight T,
          UTIL::RandomNumberEngine Generator = UTIL::DefaultGenerator>
class RandomReservoirLayer : public ReservoirLayer<T>
{
    private:
    ReservoirConfig<T>          m_config;
    std::function<T( const T )> m_activation;

    // Empty until bound
    UTIL::SMat<T> m_W_res;
    UTIL::Mat<T>  m_W_in;
    T             m_raw_radius;
    UTIL::Index   m_n_input;

    void require_bound( const std::string_view caller ) const {
        if ( !is_bound() ) {
            throw CompositionError( std::format(
                "RandomReservoirLayer::{} requires the layer to be bound to an "
                "input channel count.",
                caller ) );
        }
    }

    public:
    explicit RandomReservoirLayer( const ReservoirConfig<T> & config ) :
        m_config( config ),
        m_raw_radius( T{ 0. } ),
        m_n_input( any_size ) {
        m_config.validate();
        m_activation = resolve_activation<T>( m_config.activation );
        if ( m_config.n_input != any_size ) {
            bind( m_config.n_input );
        }
    }

    RandomReservoirLayer( const UTIL::Index nodes,
                          const std::string_view activation = "tanh",
                          const T fraction_input = T{ 0.5 },
                          const T leakage_rate = T{ 0.5 },
                          const T spectral_radius = T{ 0.9 },
                          const T sparsity = T{ 0.9 },
                          const std::optional<Seed> seed = std::nullopt,
                          const UTIL::Index n_input = any_size ) :
        RandomReservoirLayer( ReservoirConfig<T>{
            .nodes = nodes,
            .activation = std::string{ activation },
            .fraction_input = fraction_input,
            .leakage_rate = leakage_rate,
            .spectral_radius = spectral_radius,
            .sparsity = sparsity,
            .n_input = n_input,
            .seed = seed } ) {}

    [[nodiscard]] UTIL::Index input_states() const noexcept override {
        return m_n_input;
    }
    [[nodiscard]] UTIL::Index output_states() const noexcept override {
        return m_config.nodes;
    }
    [[nodiscard]] bool is_bound() const noexcept override {
        return m_n_input != any_size;
    }

    void bind( const UTIL::Index n_input ) override {
        if ( is_bound() ) {
            if ( n_input != m_n_input ) {
                throw IncompatibleShapeError( std::format(
                    "Reservoir already bound to {} input channels, cannot "
                    "rebind to {}.",
                    m_n_input, n_input ) );
            }
            return;
        }
        if ( n_input < 1 ) {
            throw ShapeError( std::format(
                "Reservoir needs at least one input channel (n_input = {}).",
                n_input ) );
        }

        auto weights{ initialize_weights<T, Generator>(
            m_config.nodes, n_input, m_config.fraction_input,
            m_config.spectral_radius, m_config.sparsity,
            m_config.seed.has_value()
                ? std::optional<typename Generator::result_type>(
                      static_cast<typename Generator::result_type>(
                          *m_config.seed ) )
                : std::nullopt,
            m_config.weight_distribution, m_config.dense_eigen_limit,
            m_config.verbose ) };

        m_W_res = std::move( weights.W_res );
        m_W_in = std::move( weights.W_in );
        m_raw_radius = weights.raw_spectral_radius;
        m_n_input = n_input;
    }

    // One leaky update of the reservoir state
    [[nodiscard]] UTIL::Vec<T>
    step( const UTIL::ConstRefVec<T> & prev_state,
          const UTIL::ConstRefVec<T> & input ) const {
        require_bound( "step" );
        if ( prev_state.size() != m_config.nodes || input.size() != m_n_input ) {
            throw ShapeError( std::format(
                "Reservoir step expects state of size {} & input of size {}, "
                "got {} & {}.",
                m_config.nodes, m_n_input, prev_state.size(), input.size() ) );
        }

        const T leak{ m_config.leakage_rate };
        return ( T{ 1. } - leak ) * prev_state
               + leak
                     * ( m_W_res * prev_state
                         + m_W_in * ( m_config.input_scale * input ) )
                           .unaryExpr( m_activation );
    }

    // Runs the recurrence over a whole sequence starting from the zero state
    [[nodiscard]] UTIL::Mat<T>
    collect_states( const UTIL::ConstRefMat<T> & sequence ) const override {
        require_bound( "collect_states" );
        if ( sequence.cols() != m_n_input ) {
            throw ShapeError( std::format(
                "Sequence {} has {} channels, reservoir expects {}.",
                UTIL::mat_shape_str<T>( sequence ), sequence.cols(),
                m_n_input ) );
        }

        const T leak{ m_config.leakage_rate };

        // Input drive for every time step, nodes x time
        const UTIL::Mat<T> drive{ m_W_in
                                  * ( m_config.input_scale
                                      * sequence.transpose() ) };

        UTIL::Mat<T> states( m_config.nodes, sequence.rows() );
        UTIL::Vec<T> state{ UTIL::Vec<T>::Zero( m_config.nodes ) };
        for ( UTIL::Index t{ 0 }; t < sequence.rows(); ++t ) {
            state = ( T{ 1. } - leak ) * state
                    + leak
                          * ( m_W_res * state + drive.col( t ) )
                                .unaryExpr( m_activation );
            states.col( t ) = state;
        }

        return states.transpose();
    }

    [[nodiscard]] std::string name() const override {
        return std::format( "RandomReservoirLayer({} nodes, {})",
                            m_config.nodes, m_config.activation );
    }

    // Getters
    [[nodiscard]] constexpr inline const ReservoirConfig<T> &
    config() const noexcept {
        return m_config;
    }
    [[nodiscard]] constexpr inline const UTIL::SMat<T> & W_res() const noexcept {
        return m_W_res;
    }
    [[nodiscard]] constexpr inline const UTIL::Mat<T> & W_in() const noexcept {
        return m_W_in;
    }
    [[nodiscard]] constexpr inline T leakage_rate() const noexcept {
        return m_config.leakage_rate;
    }
    [[nodiscard]] constexpr inline T raw_spectral_radius() const noexcept {
        return m_raw_radius;
    }
};

// Runs layer.collect_states over every batch element. Elements are
// independent & distributed over an OpenMP team; each worker owns its state.
template <UTIL::Weight T>
[[nodiscard]] UTIL::Batch<T>
collect_states( const ReservoirLayer<T> & layer, const UTIL::Batch<T> & batch,
                const int n_threads = 0 ) {
    const auto shape{ batch_shape<T>( batch ) };
    if ( !layer.is_bound() ) {
        throw CompositionError( std::format(
            "{} must be bound before collecting states.", layer.name() ) );
    }
    if ( layer.input_states() != shape.n_states ) {
        throw ShapeError( std::format(
            "Batch has {} channels, {} expects {}.", shape.n_states,
            layer.name(), layer.input_states() ) );
    }

    UTIL::Batch<T>                  result( batch.size() );
    std::vector<std::exception_ptr> errors( batch.size() );

#pragma omp parallel for num_threads( worker_count( n_threads ) ) \
    schedule( dynamic )
    for ( UTIL::Index b = 0; b < shape.n_batch; ++b ) {
        const auto i{ static_cast<std::size_t>( b ) };
        try {
            result[i] = layer.collect_states( batch[i] );
        }
        catch ( ... ) {
            errors[i] = std::current_exception();
        }
    }

    for ( const auto & error : errors ) {
        if ( error ) {
            std::rethrow_exception( error );
        }
    }

    return result;
}

} // namespace RC
