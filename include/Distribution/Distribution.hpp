//
// Created by moinshaikh on 1/27/26.
//

#ifndef PSPPO_DISTRIBUTION_HPP
#define PSPPO_DISTRIBUTION_HPP

#include<vector>
#include<torch/torch.h>

namespace PsPpo
{
    /**
     * @class Distribution
     * @brief Abstract base class for the action distributions produced by the actor.
     *
     * Defines sampling, entropy and log probability evaluation. Shapes follow the
     * usual convention: samples are laid out as [sample_shape, batch_shape, event_shape].
     *
     * @see Categorical
    */
    class Distribution
    {
    protected:
        std::vector<int64_t> batch_shape;  ///< Shape of the batch dimension(s)
        std::vector<int64_t> event_shape;  ///< Shape of the event dimension(s)

        /**
         * @brief Combines the sample shape, batch shape and event shape.
         *
         * @param sampleShapes The desired shape for samples
         * @return The extended shape used to lay out samples
        */
        std::vector<int64_t> extendedShape(c10::ArrayRef<int64_t> &sampleShapes);
    public:
        virtual ~Distribution() = 0;

        /**
         * @brief Computes the entropy of the distribution.
         *
         * @return Entropy values with shape matching batch_shape
        */
        virtual torch::Tensor entropy() = 0;

        /**
         * @brief Computes the log probability of a value under this distribution.
         *
         * @param value Value(s) to evaluate
         * @return Log probabilities with shape matching batch_shape
         */
        virtual torch::Tensor logProbability(torch::Tensor value) = 0;

        /**
         * @brief Generates samples from the distribution.
         *
         * @param sampleShape Number of samples and their dimensions (default: {})
         * @return Samples shaped [sample_shape, batch_shape, event_shape]
        */
        virtual torch::Tensor sample(c10::ArrayRef<int64_t> sampleShape = {}) = 0;
    };

    inline Distribution::~Distribution() {

    }
}

#endif //PSPPO_DISTRIBUTION_HPP
