//
// Created by moinshaikh on 1/27/26.
//

#ifndef PSPPO_CATEGORICAL_HPP
#define PSPPO_CATEGORICAL_HPP

#include"Distribution.hpp"
#include<c10/util/ArrayRef.h>

namespace PsPpo
{
    /**
    * @class Categorical
    * @brief A categorical distribution over discrete actions with optional action masking.
    *
    * The distribution can be parameterized using either probabilities or logits. An
    * optional boolean mask marks the actions that are legal; illegal actions get the
    * log probability maskedLogit. Its exponential underflows to exactly zero, so they
    * are never sampled and add nothing to the entropy, while their log probability
    * stays finite when an illegal action is forced.
    */
    class Categorical : public Distribution
    {
    private:
        torch::Tensor probs;      ///< Probability tensor for each event
        torch::Tensor logits;     ///< Normalised log probabilities for each event
        torch::Tensor param;      ///< Primary parameterization (either probs or logits)
        int numEvents;            ///< Number of possible discrete events

    public:
        static constexpr float maskedLogit = -1e8f;

        /**
         * @brief Constructs a Categorical distribution.
         *
         * Exactly one of `probs` and `logits` must be provided.
         *
         * @param probs Pointer to a probability tensor, summing to 1 over the last
         *              dimension. Can be nullptr if logits is provided.
         * @param logits Pointer to a tensor of unnormalised log-odds. Can be nullptr if
         *               probs is provided.
         * @param mask Optional pointer to a bool tensor broadcastable to the parameter,
         *             true for legal events.
         *
         * @throws std::runtime_error If both or neither of `probs` and `logits` are provided.
         */
        Categorical(const torch::Tensor *probs,
                    const torch::Tensor *logits,
                    const torch::Tensor *mask = nullptr);

        /**
         * @brief Computes the entropy of the distribution, in nats.
         *
         * @return Entropy per batch element
         */
        torch::Tensor entropy() override;

        /**
         * @brief Computes the log-probability of the given event indices.
         *
         * @param value Event indices in [0, num_events-1]
         * @return Log probabilities, same shape as `value`
         */
        torch::Tensor logProbability(torch::Tensor value) override;

        /**
         * @brief Samples event indices.
         *
         * @param sampleShape Additional leading sample dimensions, {} for one sample
         * @return Sampled indices shaped [sampleShape, batch_shape]
        */
        torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) override;

        inline torch::Tensor getLogits() { return logits; }
        inline torch::Tensor getParam() { return param; }
        inline torch::Tensor getProbability() { return probs; }
    };
}

#endif //PSPPO_CATEGORICAL_HPP
