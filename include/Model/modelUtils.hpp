//
// Created by moinshaikh on 1/28/26.
//

#ifndef PSPPO_MODELUTILS_HPP
#define PSPPO_MODELUTILS_HPP

#include<torch/nn.h>

#include<string>

namespace PsPpo
{
    /**
     * @brief Fills `tensor` in-place with a (semi) orthogonal matrix scaled by `gain`.
     *
     * @param tensor An n-dimensional tensor, n >= 2. Tensors with fewer dimensions are
     *               returned unchanged.
     * @param gain Multiplier applied to the orthogonal matrix
     * @return The same tensor, for chaining
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain);

    /**
     * @brief Initializes weights and biases of a set of named parameters.
     *
     * Parameters whose name ends with "weight" are orthogonally initialized with
     * `weightGain`; parameters whose name ends with "bias" are set to `biasGain`.
     *
     * @param parameters Named parameters, typically `module->named_parameters()`
     * @param weightGain Gain of the orthogonal weight initialization (sqrt(2) for the
     *                   hidden layers of ReLU/Tanh networks)
     * @param biasGain Constant assigned to every bias, usually 0
     */
    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters, double weightGain, double biasGain);

}


#endif //PSPPO_MODELUTILS_HPP
