//
// Created by moinshaikh on 2/12/26.
//

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/NetworkBuilder.hpp"
#include"../../include/ConfigurationError.hpp"

namespace PsPpo
{
    Activation activationFromName(const std::string &name)
    {
        if (name == "ReLU")
        {
            return Activation::ReLU;
        }
        if (name == "Tanh")
        {
            return Activation::Tanh;
        }
        throw ConfigurationError("Unknown activation function: " + name);
    }

    std::string activationName(Activation activation)
    {
        return activation == Activation::ReLU ? "ReLU" : "Tanh";
    }

    LayerDescriptor LayerDescriptor::linear(int64_t inputs, int64_t outputs)
    {
        LayerDescriptor descriptor;
        descriptor.kind = Kind::Linear;
        descriptor.inputs = inputs;
        descriptor.outputs = outputs;
        return descriptor;
    }

    LayerDescriptor LayerDescriptor::activationLayer(Activation activation)
    {
        LayerDescriptor descriptor;
        descriptor.kind = Kind::Activation;
        descriptor.activation = activation;
        return descriptor;
    }

    bool LayerDescriptor::operator==(const LayerDescriptor &other) const
    {
        if (kind != other.kind)
        {
            return false;
        }
        if (kind == Kind::Linear)
        {
            return inputs == other.inputs && outputs == other.outputs;
        }
        return activation == other.activation;
    }

    NetworkBuilder::NetworkBuilder(int64_t stateSize, Activation activation) :
    stateSize(stateSize),
    activation(activation)
    {
    }

    std::vector<LayerDescriptor> NetworkBuilder::mlp(int depth, int width, int64_t outputs) const
    {
        if (depth <= 0)
        {
            throw ConfigurationError("Network depth must be greater than 0, got " + std::to_string(depth));
        }

        std::vector<LayerDescriptor> layout;
        layout.push_back(LayerDescriptor::linear(stateSize, depth > 1 ? width : outputs));
        for (int layer = 1; layer < depth; ++layer)
        {
            layout.push_back(LayerDescriptor::activationLayer(activation));
            layout.push_back(LayerDescriptor::linear(width, layer == depth - 1 ? outputs : width));
        }
        return layout;
    }

    std::vector<LayerDescriptor> NetworkBuilder::trunk(int depth, int width) const
    {
        if (depth <= 1)
        {
            throw ConfigurationError("Shared networks must have depth greater than 1");
        }
        auto layout = mlp(depth, width, width);
        layout.pop_back();
        return layout;
    }

    torch::nn::Sequential NetworkBuilder::materialize(const std::vector<LayerDescriptor> &layout)
    {
        torch::nn::Sequential sequential;
        for (const auto &descriptor : layout)
        {
            if (descriptor.kind == LayerDescriptor::Kind::Linear)
            {
                sequential->push_back(torch::nn::Linear(descriptor.inputs, descriptor.outputs));
            }
            else if (descriptor.activation == Activation::ReLU)
            {
                sequential->push_back(torch::nn::ReLU());
            }
            else
            {
                sequential->push_back(torch::nn::Tanh());
            }
        }
        return sequential;
    }

    TEST_CASE("NetworkBuilder")
    {
        NetworkBuilder builder(6, Activation::ReLU);

        SUBCASE("Depth 1 is a single linear map")
        {
            auto layout = builder.mlp(1, 32, 4);
            REQUIRE(layout.size() == 1);
            CHECK(layout[0] == LayerDescriptor::linear(6, 4));
        }

        SUBCASE("Activations sit between linear layers only")
        {
            auto layout = builder.mlp(3, 32, 4);
            std::vector<LayerDescriptor> expected{
                LayerDescriptor::linear(6, 32),
                LayerDescriptor::activationLayer(Activation::ReLU),
                LayerDescriptor::linear(32, 32),
                LayerDescriptor::activationLayer(Activation::ReLU),
                LayerDescriptor::linear(32, 4)};
            CHECK(layout == expected);
        }

        SUBCASE("Trunk drops the output layer")
        {
            auto layout = builder.trunk(2, 16);
            REQUIRE(layout.size() == 2);
            CHECK(layout[0] == LayerDescriptor::linear(6, 16));
            CHECK(layout[1] == LayerDescriptor::activationLayer(Activation::ReLU));
        }

        SUBCASE("Invalid depths are configuration errors")
        {
            CHECK_THROWS_AS(builder.mlp(0, 16, 4), ConfigurationError);
            CHECK_THROWS_AS(builder.mlp(-2, 16, 4), ConfigurationError);
            CHECK_THROWS_AS(builder.trunk(1, 16), ConfigurationError);
        }

        SUBCASE("Materialized network has the described shape")
        {
            auto network = NetworkBuilder::materialize(builder.mlp(3, 8, 5));
            CHECK(network->size() == 5);
            std::vector<int64_t> expected{7, 5};
            CHECK(network->forward(torch::rand({7, 6})).sizes().vec() == expected);
        }
    }

    TEST_CASE("activationFromName()")
    {
        CHECK(activationFromName("ReLU") == Activation::ReLU);
        CHECK(activationFromName("Tanh") == Activation::Tanh);
        CHECK_THROWS_AS(activationFromName("Sigmoid"), ConfigurationError);
        CHECK_THROWS_AS(activationFromName("relu"), ConfigurationError);
        CHECK(activationName(activationFromName("ReLU")) == "ReLU");
        CHECK(activationName(Activation::Tanh) == "Tanh");
    }
}
