#pragma once

#include "RC/RC_config.hpp"
#include "RC/RC_errors.hpp"
#include "RC/RC_layers.hpp"
#include "RC/RC_metrics.hpp"
#include "RC/RC_solvers.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include "nlohmann/json.hpp"

#include <chrono>
#include <concepts>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace RC
{

// Number of columns of a collected-states matrix
[[nodiscard]] constexpr inline UTIL::Index
feature_size( const feature_t features, const UTIL::Index n_nodes,
              const UTIL::Index n_input ) noexcept {
    return n_nodes + ( has_flag( features, feature_t::bias ) ? 1 : 0 )
           + ( has_flag( features, feature_t::linear ) ? n_input : 0 );
}

// Builds the collected-states matrix: one row per (batch, time) sample after
// the first n_warmup steps, columns [state, bias, raw input]
template <UTIL::Weight T>
[[nodiscard]] UTIL::Mat<T>
construct_features( const UTIL::Batch<T> & states, const UTIL::Batch<T> & inputs,
                    const feature_t features, const UTIL::Index n_warmup = 0 ) {
    const auto state_shape{ batch_shape<T>( states, "State batch" ) };
    const auto input_shape{ batch_shape<T>( inputs, "Input batch" ) };
    if ( state_shape.n_batch != input_shape.n_batch
         || state_shape.n_time != input_shape.n_time ) {
        throw ShapeError( std::format(
            "States [{}, {}, *] & inputs [{}, {}, *] disagree.",
            state_shape.n_batch, state_shape.n_time, input_shape.n_batch,
            input_shape.n_time ) );
    }
    if ( n_warmup < 0 || n_warmup >= state_shape.n_time ) {
        throw ShapeError( std::format(
            "n_warmup ({}) leaves no samples in sequences of length {}.",
            n_warmup, state_shape.n_time ) );
    }

    const UTIL::Index n_used{ state_shape.n_time - n_warmup };
    const UTIL::Index n_cols{ feature_size( features, state_shape.n_states,
                                            input_shape.n_states ) };

    UTIL::Mat<T> result( state_shape.n_batch * n_used, n_cols );
    for ( UTIL::Index b{ 0 }; b < state_shape.n_batch; ++b ) {
        const auto i{ static_cast<std::size_t>( b ) };
        auto       rows{ result.middleRows( b * n_used, n_used ) };

        UTIL::Index offset{ 0 };
        rows.leftCols( state_shape.n_states ) =
            states[i].bottomRows( n_used );
        offset += state_shape.n_states;

        if ( has_flag( features, feature_t::bias ) ) {
            rows.col( offset ).setOnes();
            offset++;
        }

        if ( has_flag( features, feature_t::linear ) ) {
            rows.middleCols( offset, input_shape.n_states ) =
                inputs[i].bottomRows( n_used );
        }
    }

    return result;
}

// Pipeline of Input -> Reservoir(s) -> Readout with a trainable readout
template <UTIL::Weight T, Solver<T> S = L2Solver<T>>
class CustomModel
{
    public:
    using weight_type = T;
    using solver_type = S;

    private:
    std::optional<InputLayer<T>>                     m_input;
    std::vector<std::unique_ptr<ReservoirLayer<T>>> m_reservoirs;
    std::optional<ReadoutLayer<T>>                   m_readout;

    // Set by compile
    bool                  m_compiled;
    std::vector<metric_t> m_metrics;
    TrainingConfig<T>     m_training;
    std::optional<S>      m_solver;

    [[nodiscard]] UTIL::Index last_output_states() const noexcept {
        return m_reservoirs.empty() ? m_input->n_states()
                                    : m_reservoirs.back()->output_states();
    }

    void require_forward_path( const std::string_view caller ) const {
        if ( !m_input || m_reservoirs.empty() ) {
            throw CompositionError( std::format(
                "CustomModel::{} requires an input layer & at least one "
                "reservoir layer.",
                caller ) );
        }
    }

    // Forward pass through every reservoir, validated against the input layer
    [[nodiscard]] UTIL::Batch<T>
    forward( const UTIL::Batch<T> & X ) const {
        UTIL::Batch<T> states{ RC::collect_states<T>(
            *m_reservoirs.front(), X, m_training.n_threads ) };
        for ( std::size_t i{ 1 }; i < m_reservoirs.size(); ++i ) {
            states = RC::collect_states<T>( *m_reservoirs[i], states,
                                            m_training.n_threads );
        }
        return states;
    }

    [[nodiscard]] UTIL::Mat<T>
    features( const UTIL::Batch<T> & X, const UTIL::Index n_warmup ) const {
        return construct_features<T>( forward( X ), X, m_training.features,
                                      n_warmup );
    }

    public:
    CustomModel() : m_compiled( false ) {}

    CustomModel( CustomModel && ) noexcept = default;
    CustomModel & operator=( CustomModel && ) noexcept = default;

    // Input layer, must be first
    CustomModel & add( InputLayer<T> layer ) {
        if ( m_input ) {
            throw CompositionError(
                "Model already has an input layer; it must be the first & "
                "only input layer." );
        }
        m_input.emplace( std::move( layer ) );
        return *this;
    }

    // Reservoir layer, after the input layer & before the readout
    CustomModel & add( std::unique_ptr<ReservoirLayer<T>> layer ) {
        if ( !layer ) {
            throw CompositionError( "Cannot add a null reservoir layer." );
        }
        if ( !m_input ) {
            throw CompositionError( std::format(
                "{} added before the input layer.", layer->name() ) );
        }
        if ( m_readout ) {
            throw CompositionError( std::format(
                "{} added after the readout layer.", layer->name() ) );
        }

        const UTIL::Index prev_states{ last_output_states() };
        if ( layer->is_bound() ) {
            if ( !dims_compatible( layer->input_states(), prev_states ) ) {
                throw IncompatibleShapeError( std::format(
                    "{} expects {} input channels, previous layer provides {}.",
                    layer->name(), layer->input_states(), prev_states ) );
            }
        }
        else if ( prev_states != any_size ) {
            layer->bind( prev_states );
        }
        else if ( !m_reservoirs.empty() ) {
            throw CompositionError( std::format(
                "{} cannot be bound, previous layer declares no output "
                "channels.",
                layer->name() ) );
        }

        m_reservoirs.push_back( std::move( layer ) );
        m_compiled = false;
        return *this;
    }

    template <typename Layer>
        requires std::derived_from<std::remove_cvref_t<Layer>, ReservoirLayer<T>>
    CustomModel & add( Layer && layer ) {
        return add( std::unique_ptr<ReservoirLayer<T>>(
            std::make_unique<std::remove_cvref_t<Layer>>(
                std::forward<Layer>( layer ) ) ) );
    }

    // Readout layer, must be last
    CustomModel & add( ReadoutLayer<T> layer ) {
        if ( !m_input || m_reservoirs.empty() ) {
            throw CompositionError(
                "Readout layer must follow an input layer & at least one "
                "reservoir layer." );
        }
        if ( m_readout ) {
            throw CompositionError( "Model already has a readout layer." );
        }
        if ( !dims_compatible( layer.n_time(), m_input->n_time() ) ) {
            throw IncompatibleShapeError( std::format(
                "Readout declares {} time steps, input layer declares {}.",
                layer.n_time(), m_input->n_time() ) );
        }
        m_readout.emplace( std::move( layer ) );
        return *this;
    }

    // Records the training strategy, does not train. Previously trained
    // readout weights are discarded.
    CustomModel & compile( const std::string_view             optimizer,
                           const std::vector<std::string> &   metrics = { "mse" },
                           const nlohmann::json &             params = {} ) {
        [[maybe_unused]] const auto opt{ parse_optimizer( optimizer ) };
        auto metric_ids{ parse_metrics( metrics ) };
        auto training{ params.is_null() ? TrainingConfig<T>{}
                                        : params.template get<TrainingConfig<T>>() };
        auto solver{ params.is_null() ? S( nlohmann::json::object() )
                                      : S( params ) };

        if ( !is_complete() ) {
            throw CompositionError(
                "Cannot compile an incomplete model; add an input layer, at "
                "least one reservoir layer & a readout layer." );
        }

        m_metrics = std::move( metric_ids );
        m_training = training;
        m_solver.emplace( std::move( solver ) );
        m_compiled = true;

        // Weights trained under the previous feature layout no longer apply
        m_readout->reset();

        if ( m_training.verbose ) {
            std::cout << std::format(
                "Compiled model: {} reservoir layer(s), optimizer {}, alpha "
                "{}, n_warmup {}\n",
                m_reservoirs.size(), to_string( opt ), m_training.alpha,
                m_training.n_warmup );
        }
        return *this;
    }

    // Trains the readout on (X, y)
    void fit( const UTIL::Batch<T> & X, const UTIL::Batch<T> & y ) {
        if ( !m_compiled ) {
            throw CompositionError( "Call compile() before fit()." );
        }

        const auto x_shape{ m_input->validate( X ) };
        const auto y_shape{ m_readout->validate( y ) };
        if ( x_shape.n_batch != y_shape.n_batch
             || x_shape.n_time != y_shape.n_time ) {
            throw ShapeError( std::format(
                "Inputs [{}, {}, *] & targets [{}, {}, *] must share batch & "
                "time dimensions.",
                x_shape.n_batch, x_shape.n_time, y_shape.n_batch,
                y_shape.n_time ) );
        }
        if ( m_training.n_warmup >= x_shape.n_time ) {
            throw ShapeError( std::format(
                "n_warmup ({}) must be smaller than the sequence length ({}).",
                m_training.n_warmup, x_shape.n_time ) );
        }

        if ( !m_reservoirs.front()->is_bound() ) {
            m_reservoirs.front()->bind( x_shape.n_states );
        }

        const auto start{ std::chrono::steady_clock::now() };

        const UTIL::Mat<T> Phi{ features( X, m_training.n_warmup ) };

        UTIL::Batch<T> targets;
        targets.reserve( y.size() );
        for ( const auto & seq : y ) {
            targets.emplace_back(
                seq.bottomRows( y_shape.n_time - m_training.n_warmup ) );
        }
        const UTIL::Mat<T> Y{ stack_batch<T>( targets ) };

        if ( m_training.verbose ) {
            std::cout << std::format( "Features: {}, targets: {}\n",
                                      UTIL::mat_shape_str<T>( Phi ),
                                      UTIL::mat_shape_str<T>( Y ) );
        }

        m_readout->set_weights( m_solver->solve( Phi, Y ) );

        if ( m_training.verbose ) {
            std::cout << std::format(
                "Fit took {}\n",
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - start ) );
        }
    }

    // [n_batch, n_time, n_input] -> [n_batch, n_time, n_output]
    [[nodiscard]] UTIL::Batch<T> predict( const UTIL::Batch<T> & X ) const {
        const auto W{ m_readout ? m_readout->weights() : nullptr };
        if ( !W ) {
            throw NotFittedError( "Call fit() before predict()." );
        }

        const auto         x_shape{ m_input->validate( X ) };
        const UTIL::Mat<T> Phi{ features( X, 0 ) };
        if ( Phi.cols() != W->rows() ) {
            throw ShapeError( std::format(
                "Readout weights {} do not match the feature matrix {}; refit "
                "the model.",
                UTIL::mat_shape_str<T>( *W ), UTIL::mat_shape_str<T>( Phi ) ) );
        }
        return split_rows<T>( Phi * ( *W ), x_shape.n_time );
    }

    // Metric name -> scalar; the compiled metrics are used when none are given
    [[nodiscard]] std::map<std::string, T>
    evaluate( const UTIL::Batch<T> & X, const UTIL::Batch<T> & y,
              const std::vector<std::string> & metrics = {} ) const {
        const auto metric_ids{ metrics.empty() ? m_metrics
                                               : parse_metrics( metrics ) };
        return compute_metrics<T>( metric_ids, predict( X ), y );
    }

    // States of the final reservoir layer for every batch element
    [[nodiscard]] UTIL::Batch<T>
    collect_states( const UTIL::Batch<T> & X ) const {
        require_forward_path( "collect_states" );
        [[maybe_unused]] const auto shape{ m_input->validate( X ) };
        return forward( X );
    }

    // Collected-states matrix for X, every time step included
    [[nodiscard]] UTIL::Mat<T> features( const UTIL::Batch<T> & X ) const {
        require_forward_path( "features" );
        [[maybe_unused]] const auto shape{ m_input->validate( X ) };
        return features( X, 0 );
    }

    // Getters
    [[nodiscard]] bool is_complete() const noexcept {
        return m_input.has_value() && !m_reservoirs.empty()
               && m_readout.has_value();
    }
    [[nodiscard]] constexpr inline bool is_compiled() const noexcept {
        return m_compiled;
    }
    [[nodiscard]] bool is_fitted() const noexcept {
        return m_readout && m_readout->is_fitted();
    }
    [[nodiscard]] std::size_t n_layers() const noexcept {
        return ( m_input ? 1 : 0 ) + m_reservoirs.size() + ( m_readout ? 1 : 0 );
    }
    [[nodiscard]] std::size_t n_reservoirs() const noexcept {
        return m_reservoirs.size();
    }
    [[nodiscard]] const ReservoirLayer<T> & reservoir( const std::size_t i ) const {
        if ( i >= m_reservoirs.size() ) {
            throw CompositionError( std::format(
                "Reservoir index {} out of range ({} layers).", i,
                m_reservoirs.size() ) );
        }
        return *m_reservoirs[i];
    }
    [[nodiscard]] const std::optional<InputLayer<T>> & input_layer() const noexcept {
        return m_input;
    }
    [[nodiscard]] const std::optional<ReadoutLayer<T>> &
    readout_layer() const noexcept {
        return m_readout;
    }
    [[nodiscard]] const std::vector<metric_t> & metrics() const noexcept {
        return m_metrics;
    }
    [[nodiscard]] const TrainingConfig<T> & training_config() const noexcept {
        return m_training;
    }
};

} // namespace RC
