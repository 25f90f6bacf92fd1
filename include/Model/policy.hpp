//
// Created by moinshaikh on 1/28/26.
//

#ifndef PSPPO_POLICY_HPP
#define PSPPO_POLICY_HPP

#include<optional>
#include<string>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

#include"NetworkBuilder.hpp"
#include"../ExperienceBuffer.hpp"
#include"../TrainingParameters.hpp"

namespace PsPpo
{
    /**
     * @class PolicyImpl
     * @brief Actor-critic network shared by every agent.
     *
     * The actor maps a state vector to the logits of a categorical distribution over
     * the actions; the critic maps the same state to a scalar value estimate. Illegal
     * actions are removed with a boolean mask before the distribution is normalised.
     *
     * Two layouts are supported:
     * - separate: the actor and the critic are independent multi-layer perceptrons;
     * - shared: the hidden layers of the critic form a trunk that both heads read from,
     *   followed by a private linear head each. The trunk parameters exist once.
     *
     * Every linear layer is orthogonally initialized with gain sqrt(2) and zero bias.
     * The output layer of the actor is then scaled by `lastActorLayerScaling` and the
     * output layer of the critic by `lastCriticLayerScaling`, so a small actor scale
     * starts the policy close to uniform.
     *
     * @note Wrapped with TORCH_MODULE; use the `Policy` holder.
     */
    class PolicyImpl : public torch::nn::Module
    {
    private:
        int64_t stateSize;
        int64_t actionSize;
        bool shared;
        Activation activation;

        torch::nn::Sequential trunk;   ///< Shared hidden layers, empty in the separate layout
        torch::nn::Sequential actor;   ///< Produces action logits
        torch::nn::Sequential critic;  ///< Produces the state value

        torch::Tensor features(torch::Tensor states);
        torch::Device device() const;

    public:
        using torch::nn::Module::save;
        using torch::nn::Module::load;

        /**
         * @brief Builds and initializes the actor and critic.
         *
         * @param stateSize Number of features of a state vector, agent id included
         * @param actionSize Number of discrete actions
         * @param parameters Network fields of the training parameters: depths, widths,
         *                   activation, last layer scalings, shared flag and an optional
         *                   path to restore
         *
         * @throws ConfigurationError if a depth is <= 0, if the shared layout is requested
         *         with a critic depth <= 1, or if the activation name is unknown
         */
        PolicyImpl(int64_t stateSize, int64_t actionSize, const TrainingParameters &parameters);

        /**
         * @brief Chooses an action for one agent.
         *
         * The agent id is read from the trailing element of `state`. When `buffer` is
         * given, the state, the action, its log probability and the mask are appended
         * to that agent's trajectory. Runs without gradient tracking.
         *
         * @param state 1-D state vector of size stateSize
         * @param mask 1-D bool tensor of size actionSize, true for legal actions
         * @param buffer Experience buffer to record into, or nullptr
         * @param explicitAction Action to take instead of sampling one, e.g. a forced
         *                       "do nothing" for an agent that cannot move
         * @return The chosen action index
         */
        int64_t act(torch::Tensor state,
                    torch::Tensor mask,
                    ExperienceBuffer *buffer = nullptr,
                    std::optional<int64_t> explicitAction = std::nullopt);

        /**
         * @brief Re-evaluates stored transitions under the current parameters.
         *
         * @param states [n, stateSize] float tensor
         * @param actions [n] action indices
         * @param masks [n, actionSize] bool tensor
         * @return {values [n], action log probabilities [n], distribution entropy [n]}
         */
        std::vector<torch::Tensor> evaluate(torch::Tensor states,
                                            torch::Tensor actions,
                                            torch::Tensor masks);

        /**
         * @brief Action probabilities after masking, for inspection and tests.
         *
         * @return [..., actionSize] probabilities
         */
        torch::Tensor getProbability(torch::Tensor states, torch::Tensor masks);

        /** @return Critic estimate for each state, [...] without the trailing unit dimension */
        torch::Tensor getValue(torch::Tensor states);

        /** @brief Writes the full parameter set to `path`. */
        void save(const std::string &path);

        /**
         * @brief Restores the parameter set written by save().
         *
         * A missing file is logged and leaves the parameters as they are.
         *
         * @return True if the parameters were loaded
         */
        bool load(const std::string &path);

        inline int64_t getStateSize() const
        {
            return stateSize;
        }

        inline int64_t getActionSize() const
        {
            return actionSize;
        }

        inline bool isShared() const
        {
            return shared;
        }
    };
    TORCH_MODULE(Policy);
}

#endif //PSPPO_POLICY_HPP
