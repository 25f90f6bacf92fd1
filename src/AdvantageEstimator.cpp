//
// Created by moinshaikh on 2/13/26.
//

#include<stdexcept>

#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../include/AdvantageEstimator.hpp"
#include"../include/ConfigurationError.hpp"

namespace PsPpo
{
    static AdvantageEstimator::Mode modeFromName(const std::string &name)
    {
        if (name == "gae")
        {
            return AdvantageEstimator::Mode::GAE;
        }
        if (name == "n-steps")
        {
            return AdvantageEstimator::Mode::NSteps;
        }
        throw ConfigurationError("Unknown advantage estimator: " + name + " (expected gae or n-steps)");
    }

    AdvantageEstimator::AdvantageEstimator(const std::string &mode, float gamma, float lambda) :
    AdvantageEstimator(modeFromName(mode), gamma, lambda)
    {
    }

    AdvantageEstimator::AdvantageEstimator(Mode mode, float gamma, float lambda) :
    mode(mode),
    gamma(gamma),
    lambda(lambda)
    {
    }

    torch::Tensor AdvantageEstimator::compute(torch::Tensor rewards, torch::Tensor dones, torch::Tensor values) const
    {
        const auto length = rewards.numel();
        if (dones.numel() != length || values.numel() != length + 1)
        {
            throw std::invalid_argument("Advantage estimation needs T rewards, T dones and T + 1 values, got " +
                                        std::to_string(length) + ", " + std::to_string(dones.numel()) + " and " +
                                        std::to_string(values.numel()));
        }

        // The recursion runs backwards one step at a time, so it is done on the CPU.
        auto device = values.device();
        auto rewardsCpu = rewards.detach().reshape({-1}).to(torch::kCPU, torch::kFloat).contiguous();
        auto notDone = 1 - dones.detach().reshape({-1}).to(torch::kCPU, torch::kFloat).ne(0).to(torch::kFloat);
        auto valuesCpu = values.detach().reshape({-1}).to(torch::kCPU, torch::kFloat).contiguous();

        auto reward = rewardsCpu.accessor<float, 1>();
        auto keep = notDone.accessor<float, 1>();
        auto value = valuesCpu.accessor<float, 1>();

        auto advantages = torch::zeros({length});
        auto advantage = advantages.accessor<float, 1>();

        if (mode == Mode::GAE)
        {
            float next = 0;
            for (int64_t step = length - 1; step >= 0; --step)
            {
                float delta = reward[step] + gamma * value[step + 1] * keep[step] - value[step];
                next = delta + gamma * lambda * keep[step] * next;
                advantage[step] = next;
            }
        }
        else
        {
            float nextReturn = value[length];
            for (int64_t step = length - 1; step >= 0; --step)
            {
                nextReturn = reward[step] + gamma * keep[step] * nextReturn;
                advantage[step] = nextReturn - value[step];
            }
        }

        return advantages.to(device);
    }

    torch::Tensor AdvantageEstimator::standardize(torch::Tensor advantages, double epsilon)
    {
        if (advantages.numel() < 2)
        {
            return torch::zeros_like(advantages);
        }
        return (advantages - advantages.mean()) / (advantages.std() + epsilon);
    }

    TEST_CASE("AdvantageEstimator")
    {
        SUBCASE("Unknown mode is a configuration error")
        {
            CHECK_THROWS_AS(AdvantageEstimator("td", 0.99, 0.95), ConfigurationError);
            CHECK(AdvantageEstimator("gae", 0.99, 0.95).getMode() == AdvantageEstimator::Mode::GAE);
            CHECK(AdvantageEstimator("n-steps", 0.99, 0.95).getMode() == AdvantageEstimator::Mode::NSteps);
        }

        SUBCASE("Mismatched lengths are rejected")
        {
            AdvantageEstimator estimator("gae", 0.99, 0.95);
            CHECK_THROWS_AS(estimator.compute(torch::zeros({3}), torch::zeros({3}), torch::zeros({3})),
                            std::invalid_argument);
            CHECK_THROWS_AS(estimator.compute(torch::zeros({3}), torch::zeros({2}), torch::zeros({4})),
                            std::invalid_argument);
        }

        SUBCASE("Single step is the temporal difference error in both modes")
        {
            auto rewards = torch::tensor({2.f});
            auto dones = torch::tensor({0.f});
            auto values = torch::tensor({1.f, 3.f});
            float expected = 2.f + 0.9f * 3.f - 1.f;

            auto gae = AdvantageEstimator("gae", 0.9, 0.5).compute(rewards, dones, values);
            auto nSteps = AdvantageEstimator("n-steps", 0.9, 0.5).compute(rewards, dones, values);
            REQUIRE(gae.numel() == 1);
            CHECK(gae[0].item<float>() == doctest::Approx(expected));
            CHECK(nSteps[0].item<float>() == doctest::Approx(expected));
        }

        SUBCASE("Episode end cuts the bootstrap")
        {
            auto rewards = torch::tensor({1.f, 0.f});
            auto dones = torch::tensor({0.f, 1.f});
            auto values = torch::tensor({0.5f, 0.4f, 0.f});

            auto gae = AdvantageEstimator("gae", 0.99, 0.95).compute(rewards, dones, values);
            CHECK(gae[1].item<float>() == doctest::Approx(-0.4));
            CHECK(gae[0].item<float>() == doctest::Approx(1 + 0.99 * 0.4 - 0.5 + 0.99 * 0.95 * -0.4));

            auto nSteps = AdvantageEstimator("n-steps", 0.99, 0.95).compute(rewards, dones, values);
            CHECK(nSteps[0].item<float>() == doctest::Approx(0.5));
            CHECK(nSteps[1].item<float>() == doctest::Approx(-0.4));
        }

        SUBCASE("Bootstrap value is ignored after a terminal step")
        {
            auto rewards = torch::tensor({1.f});
            auto dones = torch::tensor({1.f});
            AdvantageEstimator estimator("gae", 0.99, 0.95);
            auto low = estimator.compute(rewards, dones, torch::tensor({0.f, -100.f}));
            auto high = estimator.compute(rewards, dones, torch::tensor({0.f, 100.f}));
            CHECK(low[0].item<float>() == doctest::Approx(1));
            CHECK(high[0].item<float>() == doctest::Approx(1));
        }

        SUBCASE("Lambda of one makes GAE equal to n-step advantages")
        {
            torch::manual_seed(0);
            auto rewards = torch::rand({6});
            auto dones = torch::tensor({0.f, 0.f, 1.f, 0.f, 0.f, 0.f});
            auto values = torch::rand({7});
            auto gae = AdvantageEstimator("gae", 0.9, 1).compute(rewards, dones, values);
            auto nSteps = AdvantageEstimator("n-steps", 0.9, 1).compute(rewards, dones, values);
            CHECK(torch::allclose(gae, nSteps, 1e-5, 1e-6));
        }
    }

    TEST_CASE("AdvantageEstimator::standardize()")
    {
        SUBCASE("Equal advantages become zeros")
        {
            auto standardized = AdvantageEstimator::standardize(torch::full({5}, 3.f));
            CHECK(torch::equal(standardized, torch::zeros({5})));
        }

        SUBCASE("A single advantage becomes zero")
        {
            auto standardized = AdvantageEstimator::standardize(torch::tensor({7.f}));
            CHECK(standardized[0].item<float>() == 0);
        }

        SUBCASE("Result has zero mean and unit standard deviation")
        {
            auto standardized = AdvantageEstimator::standardize(torch::tensor({1.f, 2.f, 3.f, 10.f}));
            CHECK(standardized.mean().item<float>() == doctest::Approx(0).epsilon(1e-5));
            CHECK(standardized.std().item<float>() == doctest::Approx(1).epsilon(1e-5));
        }
    }
}
