#pragma once

#include "RC/RC_config.hpp"
#include "RC/RC_cross_validation.hpp"
#include "RC/RC_errors.hpp"
#include "RC/RC_initializer.hpp"
#include "RC/RC_layers.hpp"
#include "RC/RC_metrics.hpp"
#include "RC/RC_model.hpp"
#include "RC/RC_solvers.hpp"
#include "RC/RC_util.hpp"
#include "util/common.hpp"

#include "nlohmann/json.hpp"

#include <atomic>
#include <format>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace RC
{

// Predefined Input -> RandomReservoirLayer -> Readout estimator. The
// composition is built on the first fit from the channel counts of the data.
template <UTIL::Weight T>
class ReservoirComputer
{
    public:
    using model_type = CustomModel<T>;

    private:
    ReservoirComputerConfig<T>              m_config;
    std::atomic<std::shared_ptr<model_type>> m_model;

    [[nodiscard]] std::shared_ptr<model_type>
    build_model( const UTIL::Index n_input, const UTIL::Index n_output ) const {
        if ( m_config.verbose ) {
            std::cout << std::format(
                "Building reservoir computer: {} inputs, {} nodes, {} "
                "outputs\n",
                n_input, m_config.num_nodes, n_output );
        }

        auto model{ std::make_shared<model_type>() };
        model->add( InputLayer<T>( any_size, n_input ) );
        model->add( RandomReservoirLayer<T>(
            m_config.reservoir_config( n_input ) ) );
        model->add( ReadoutLayer<T>( any_size, n_output ) );

        nlohmann::json params;
        to_json( params, m_config.training_config() );
        model->compile( "ridge", m_config.metrics, params );
        return model;
    }

    [[nodiscard]] std::shared_ptr<const model_type> fitted_model() const {
        std::shared_ptr<const model_type> model{ m_model.load() };
        if ( !model || !model->is_fitted() ) {
            throw NotFittedError( "Call ReservoirComputer::fit() first." );
        }
        return model;
    }

    public:
    explicit ReservoirComputer( const ReservoirComputerConfig<T> & config = {} ) :
        m_config( config ), m_model( nullptr ) {
        m_config.validate();
    }

    ReservoirComputer( const UTIL::Index num_nodes,
                       const std::string_view activation = "tanh",
                       const T leakage_rate = T{ 0.5 },
                       const T spectral_radius = T{ 0.9 },
                       const T fraction_input = T{ 0.5 },
                       const T sparsity = T{ 0.9 },
                       const T ridge_alpha = T{ 1E-6 },
                       const std::optional<Seed> seed = std::nullopt ) :
        ReservoirComputer( ReservoirComputerConfig<T>{
            .num_nodes = num_nodes,
            .activation = std::string{ activation },
            .leakage_rate = leakage_rate,
            .spectral_radius = spectral_radius,
            .fraction_input = fraction_input,
            .sparsity = sparsity,
            .ridge_alpha = ridge_alpha,
            .seed = seed } ) {}

    explicit ReservoirComputer( const nlohmann::json & config ) :
        ReservoirComputer( config.template get<ReservoirComputerConfig<T>>() ) {}

    ReservoirComputer( ReservoirComputer && other ) noexcept :
        m_config( std::move( other.m_config ) ),
        m_model( other.m_model.exchange( nullptr ) ) {}

    void fit( const UTIL::Batch<T> & X, const UTIL::Batch<T> & y ) {
        const auto x_shape{ batch_shape<T>( X, "Input batch" ) };
        const auto y_shape{ batch_shape<T>( y, "Target batch" ) };

        auto model{ m_model.load() };
        const bool rebuild{
            !model
            || model->input_layer()->n_states() != x_shape.n_states
            || model->readout_layer()->n_states() != y_shape.n_states
        };

        if ( rebuild ) {
            auto fresh{ build_model( x_shape.n_states, y_shape.n_states ) };
            fresh->fit( X, y );
            m_model.store( std::move( fresh ) );
        }
        else {
            model->fit( X, y );
        }
    }

    [[nodiscard]] UTIL::Batch<T> predict( const UTIL::Batch<T> & X ) const {
        return fitted_model()->predict( X );
    }

    [[nodiscard]] std::map<std::string, T>
    evaluate( const UTIL::Batch<T> & X, const UTIL::Batch<T> & y,
              const std::vector<std::string> & metrics = {} ) const {
        return fitted_model()->evaluate( X, y, metrics );
    }

    // Getters
    [[nodiscard]] constexpr inline const ReservoirComputerConfig<T> &
    config() const noexcept {
        return m_config;
    }
    [[nodiscard]] bool is_fitted() const noexcept {
        const auto model{ m_model.load() };
        return model && model->is_fitted();
    }
    // Current composition, null before the first fit
    [[nodiscard]] std::shared_ptr<const model_type> model() const noexcept {
        return m_model.load();
    }
};

} // namespace RC
