//
// Created by moinshaikh on 2/12/26.
//

#ifndef PSPPO_NETWORKBUILDER_HPP
#define PSPPO_NETWORKBUILDER_HPP

#include<string>
#include<vector>

#include<torch/torch.h>
#include<torch/nn.h>

namespace PsPpo
{
    /** @brief Activation functions available between hidden layers. */
    enum class Activation
    {
        ReLU,
        Tanh
    };

    /**
     * @brief Parses an activation name ("ReLU" or "Tanh").
     *
     * @throws ConfigurationError for any other name
     */
    Activation activationFromName(const std::string &name);

    std::string activationName(Activation activation);

    /**
     * @brief One entry of a network layout: either a linear layer or an activation.
     */
    struct LayerDescriptor
    {
        enum class Kind
        {
            Linear,
            Activation
        };

        Kind kind;
        int64_t inputs = 0;   ///< Only meaningful for Kind::Linear
        int64_t outputs = 0;  ///< Only meaningful for Kind::Linear
        Activation activation = Activation::Tanh; ///< Only meaningful for Kind::Activation

        static LayerDescriptor linear(int64_t inputs, int64_t outputs);
        static LayerDescriptor activationLayer(Activation activation);

        bool operator==(const LayerDescriptor &other) const;
    };

    /**
     * @brief Assembles multi-layer perceptrons from ordered, typed layer descriptors.
     *
     * The builder first produces a plain list of LayerDescriptor values and then
     * materializes it into a torch::nn::Sequential. A network of depth `d` has `d`
     * linear layers: the input layer, `d - 2` hidden layers and the output layer, with
     * an activation after every linear layer except the last. A depth of 1 is a single
     * linear map from the state to the outputs.
     *
     * The shared actor-critic layout uses trunk() to obtain the same hidden stack
     * without its output layer, so that the stack can be owned once and followed by
     * two private heads.
     */
    class NetworkBuilder
    {
    private:
        int64_t stateSize;
        Activation activation;

    public:
        NetworkBuilder(int64_t stateSize, Activation activation);

        /**
         * @brief Layout of a full network.
         *
         * @param depth Number of linear layers, output layer included
         * @param width Width of the hidden layers
         * @param outputs Size of the output layer
         * @throws ConfigurationError if depth <= 0
         */
        std::vector<LayerDescriptor> mlp(int depth, int width, int64_t outputs) const;

        /**
         * @brief Layout of a depth-`depth` network with its output layer removed.
         *
         * The result ends with an activation and produces `width` features.
         *
         * @throws ConfigurationError if depth <= 1, since nothing would remain
         */
        std::vector<LayerDescriptor> trunk(int depth, int width) const;

        /** @brief Creates the modules described by `layout`, in order. */
        static torch::nn::Sequential materialize(const std::vector<LayerDescriptor> &layout);
    };
}

#endif //PSPPO_NETWORKBUILDER_HPP
