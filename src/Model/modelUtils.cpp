//
// Created by moinshaikh on 2/4/26.
//

#include<cmath>
#include<string>
#include<tuple>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Model/modelUtils.hpp"


namespace PsPpo
{
    /**
     * @brief Orthogonal initialization through a QR decomposition.
     *
     * A matrix drawn from N(0, 1) is decomposed as A = QR, Q is sign-corrected with
     * diag(sign(diag(R))) and copied into `tensor` before scaling by `gain`. Wide
     * matrices are handled by decomposing the transpose.
     *
     * @warning Runs under torch::NoGradGuard; the tensor is modified in place.
     */
    torch::Tensor orthogonal_(torch::Tensor tensor, double gain)
    {
        torch::NoGradGuard guard;
        if (tensor.dim() < 2)
        {
            return tensor;
        }

        const auto rows = tensor.size(0);
        const auto columns = tensor.numel() / rows;
        const bool wide = rows < columns;

        auto gaussian = wide ? torch::randn({columns, rows}) : torch::randn({rows, columns});
        auto decomposition = torch::linalg_qr(gaussian);
        auto q = std::get<0>(decomposition) * std::get<1>(decomposition).diagonal().sign();
        if (wide)
        {
            q = q.t();
        }

        tensor.copy_(q.reshape(tensor.sizes()).mul(gain));
        return tensor;
    }

    static bool endsWith(const std::string &name, const std::string &suffix)
    {
        return name.size() >= suffix.size() &&
               name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    void initWeights(torch::OrderedDict<std::string, torch::Tensor> parameters,
                     double weightGain,
                     double biasGain)
    {
        for (auto &parameter : parameters)
        {
            auto &value = parameter.value();
            if (value.numel() == 0)
            {
                continue;
            }
            if (endsWith(parameter.key(), "bias"))
            {
                torch::nn::init::constant_(value, biasGain);
            }
            else if (endsWith(parameter.key(), "weight"))
            {
                orthogonal_(value, weightGain);
            }
        }
    }

    TEST_CASE("orthogonal_()")
    {
        SUBCASE("Tall matrices have orthonormal columns")
        {
            auto weight = torch::empty({8, 3});
            orthogonal_(weight, 1);

            auto gram = torch::mm(weight.t(), weight);
            CHECK(torch::allclose(gram, torch::eye(3), 1e-4, 1e-5));
        }

        SUBCASE("Wide matrices have orthonormal rows scaled by the gain")
        {
            auto weight = torch::empty({2, 6});
            orthogonal_(weight, std::sqrt(2.));

            auto gram = torch::mm(weight, weight.t());
            CHECK(torch::allclose(gram, torch::eye(2) * 2, 1e-4, 1e-5));
        }

        SUBCASE("Vectors are left unchanged")
        {
            auto bias = torch::full({4}, 3.f);
            orthogonal_(bias, 1);
            CHECK(bias.eq(3).all().item().toBool());
        }
    }

    TEST_CASE("initWeights()")
    {
        auto module = torch::nn::Sequential(
            torch::nn::Linear(5, 10),
            torch::nn::Functional(torch::relu),
            torch::nn::Linear(10, 8));

        initWeights(module->named_parameters(), 1, 0);

        SUBCASE("Bias weights are initialized to 0")
        {
            for (const auto &parameter : module->named_parameters())
            {
                if (parameter.key().find("bias") != std::string::npos)
                {
                    CHECK(parameter.value().abs().sum().item().toDouble() == doctest::Approx(0));
                }
            }
        }

        SUBCASE("Weights are orthogonal")
        {
            auto weight = module->named_parameters()["0.weight"];
            auto gram = torch::mm(weight.t(), weight);
            CHECK(torch::allclose(gram, torch::eye(5), 1e-4, 1e-5));
        }
    }
}
