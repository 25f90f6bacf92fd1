/**
 * @file PPO.cpp
 * @brief Implementation of the parameter-shared PPO trainer
 * @author moinshaikh
 * @date 2/13/26
 *
 * Contents:
 * - construction of the current and old policies, the optimiser and the advantage
 *   estimator
 * - update(), the clipped-objective optimisation over one agent's window
 * - acting, outcome recording and readiness helpers used by the driver loop
 * - tests that train small policies on trivial reward patterns
 */

#include<algorithm>
#include<cmath>
#include<filesystem>
#include<stdexcept>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Algorithms/PPO.hpp"
#include"../../include/ConfigurationError.hpp"

namespace PsPpo
{
    static torch::Device selectDevice(bool useCuda)
    {
        if (useCuda)
        {
            if (torch::cuda::is_available())
            {
                return torch::Device(torch::kCUDA);
            }
            spdlog::warn("CUDA was requested but is not available, training on the CPU");
        }
        return torch::Device(torch::kCPU);
    }

    /** The old policy is overwritten right away, so it never restores a checkpoint itself. */
    static TrainingParameters withoutCheckpoint(TrainingParameters parameters)
    {
        parameters.loadModelPath.clear();
        return parameters;
    }

    static void validate(const TrainingParameters &parameters)
    {
        if (parameters.horizon <= 0)
        {
            throw ConfigurationError("Horizon must be greater than 0, got " + std::to_string(parameters.horizon));
        }
        if (parameters.batchSize <= 0)
        {
            throw ConfigurationError("Batch size must be greater than 0, got " + std::to_string(parameters.batchSize));
        }
        if (parameters.epochs <= 0)
        {
            throw ConfigurationError("Epochs must be greater than 0, got " + std::to_string(parameters.epochs));
        }
    }

    PPO::PPO(int64_t stateSize, int64_t actionSize, const TrainingParameters &parameters) :
    parameters(parameters),
    device(selectDevice(parameters.useCuda)),
    policy(stateSize, actionSize, parameters),
    oldPolicy(stateSize, actionSize, withoutCheckpoint(parameters)),
    advantageEstimator(parameters.advantageEstimator, parameters.discountFactor, parameters.lambda)
    {
        validate(parameters);

        policy->to(device);
        oldPolicy->to(device);
        synchronizeOldPolicy();

        optimizer = std::make_unique<torch::optim::Adam>(
            policy->parameters(),
            torch::optim::AdamOptions(parameters.learningRate).eps(parameters.adamEpsilon));

        spdlog::info("PPO: {} state features, {} actions, {} {} networks, {} advantages, horizon {}, device {}",
                     stateSize,
                     actionSize,
                     parameters.shared ? "shared" : "separate",
                     activationName(activationFromName(parameters.activation)),
                     parameters.advantageEstimator,
                     parameters.horizon,
                     device.str());
    }

    void PPO::synchronizeOldPolicy()
    {
        torch::NoGradGuard noGrad;
        auto source = policy->named_parameters();
        auto target = oldPolicy->named_parameters();
        for (const auto &item : source)
        {
            target[item.key()].copy_(item.value());
        }
    }

    int64_t PPO::act(torch::Tensor state,
                     torch::Tensor mask,
                     ExperienceBuffer *buffer,
                     std::optional<int64_t> explicitAction)
    {
        return oldPolicy->act(state, mask, buffer, explicitAction);
    }

    void PPO::recordOutcome(ExperienceBuffer &buffer, int agent, float reward, bool done)
    {
        buffer.appendOutcome(agent, reward, done);
    }

    bool PPO::isReady(const ExperienceBuffer &buffer, int agent) const
    {
        return buffer.size(agent) >= static_cast<size_t>(parameters.horizon) + 1;
    }

    std::optional<std::vector<UpdateDatum>> PPO::updateIfReady(ExperienceBuffer &buffer, int agent)
    {
        if (!isReady(buffer, agent))
        {
            return std::nullopt;
        }
        return update(buffer, agent);
    }

    torch::Tensor PPO::clippedSurrogate(torch::Tensor ratio, torch::Tensor advantages, float clipParam)
    {
        auto unclipped = ratio * advantages;
        auto clipped = torch::clamp(ratio, 1.0 - clipParam, 1.0 + clipParam) * advantages;
        return torch::min(unclipped, clipped).mean();
    }

    /**
     * @brief Clipped PPO optimisation over one agent's window
     *
     * Process:
     * 1. Freeze the window (states, actions, masks, behaviour log probabilities, rewards
     *    and dones) plus the bootstrap row into detached tensors
     * 2. For every epoch, walk the window in contiguous mini-batches. Rows
     *    [start, min(start + batchSize, n)] are evaluated; the last row only provides
     *    the bootstrap value
     * 3. Estimate and standardise the advantages of the mini-batch from its rewards,
     *    dones and detached values
     * 4. Minimise the clipped surrogate loss plus the value and entropy terms, clip the
     *    gradient norm and step Adam
     * 5. Copy the current parameters into the old policy and keep only the bootstrap
     *    transition in the agent's trajectory
     */
    std::vector<UpdateDatum> PPO::update(ExperienceBuffer &buffer, int agent)
    {
        const auto &trajectory = buffer.trajectory(agent);
        const auto length = static_cast<int64_t>(trajectory.size());
        if (length < 2)
        {
            throw std::invalid_argument("Updating agent " + std::to_string(agent) +
                                        " needs at least 2 transitions, got " + std::to_string(length));
        }
        if (trajectory.states.size() != trajectory.rewards.size())
        {
            throw std::invalid_argument("Agent " + std::to_string(agent) + " has " +
                                        std::to_string(trajectory.states.size()) + " actions but " +
                                        std::to_string(trajectory.rewards.size()) +
                                        " outcomes; record the outcome before updating");
        }
        const auto windowSize = length - 1;

        // Window rows plus the bootstrap row
        std::vector<torch::Tensor> stateRows(trajectory.states.begin(), trajectory.states.begin() + length);
        std::vector<torch::Tensor> maskRows(trajectory.masks.begin(), trajectory.masks.begin() + length);
        std::vector<int64_t> actionRows(trajectory.actions.begin(), trajectory.actions.begin() + length);
        std::vector<float> logProbRows(trajectory.logProbs.begin(), trajectory.logProbs.begin() + windowSize);
        std::vector<float> rewardRows(trajectory.rewards.begin(), trajectory.rewards.begin() + windowSize);
        std::vector<float> doneRows;
        for (int64_t step = 0; step < windowSize; ++step)
        {
            doneRows.push_back(trajectory.dones[step] ? 1.f : 0.f);
        }

        auto states = torch::stack(stateRows).to(device, torch::kFloat).detach();
        auto masks = torch::stack(maskRows).to(device, torch::kBool).detach();
        auto actions = torch::tensor(actionRows).to(device);
        auto oldLogProbs = torch::tensor(logProbRows).to(device);
        auto rewards = torch::tensor(rewardRows).to(device);
        auto dones = torch::tensor(doneRows).to(device);

        float totalActionLoss = 0;
        float totalValueLoss = 0;
        float totalEntropy = 0;
        float clipFraction = 0;
        int numUpdates = 0;

        for (int epoch = 0; epoch < parameters.epochs; ++epoch)
        {
            for (int64_t start = 0; start < windowSize; start += parameters.batchSize)
            {
                const auto end = std::min<int64_t>(start + parameters.batchSize, windowSize);
                const auto count = end - start;

                auto evaluation = policy->evaluate(states.slice(0, start, end + 1),
                                                   actions.slice(0, start, end + 1),
                                                   masks.slice(0, start, end + 1));
                auto values = evaluation[0];
                auto logProbs = evaluation[1].slice(0, 0, count);
                auto entropy = evaluation[2].slice(0, 0, count);

                auto batchRewards = rewards.slice(0, start, end);
                auto ratio = torch::exp(logProbs - oldLogProbs.slice(0, start, end));
                auto advantages = AdvantageEstimator::standardize(
                    advantageEstimator.compute(batchRewards, dones.slice(0, start, end), values.detach()));

                auto actionLoss = -clippedSurrogate(ratio, advantages, parameters.clipParam);
                auto valueLoss = 0.5 * (values.slice(0, 0, count) - batchRewards).pow(2).mean();
                auto entropyMean = entropy.mean();

                auto total = actionLoss +
                             valueLoss * parameters.valueLossCoefficient -
                             entropyMean * parameters.entropyCoefficient;

                optimizer->zero_grad();
                total.backward();
                if (parameters.maxGradNorm.has_value())
                {
                    torch::nn::utils::clip_grad_norm_(policy->parameters(), *parameters.maxGradNorm);
                }
                optimizer->step();
                ++numUpdates;

                loss = total.item<float>();
                totalActionLoss += actionLoss.item<float>();
                totalValueLoss += valueLoss.item<float>();
                totalEntropy += entropyMean.item<float>();
                clipFraction += (ratio.detach() - 1.0).abs().gt(parameters.clipParam)
                                    .to(torch::kFloat).mean().item<float>();
            }
        }

        synchronizeOldPolicy();
        buffer.clearExceptLast(agent);

        std::vector<UpdateDatum> data{{"Loss", loss},
                                      {"Action loss", totalActionLoss / numUpdates},
                                      {"Value loss", totalValueLoss / numUpdates},
                                      {"Entropy", totalEntropy / numUpdates},
                                      {"Clip fraction", clipFraction / numUpdates}};
        spdlog::debug("Agent {} updated on {} transitions", agent, windowSize);
        for (const auto &datum : data)
        {
            spdlog::debug("{}: {}", datum.name, datum.value);
        }
        return data;
    }

    void PPO::save(const std::string &path)
    {
        policy->save(path);
    }

    bool PPO::load(const std::string &path)
    {
        if (!policy->load(path))
        {
            return false;
        }
        synchronizeOldPolicy();
        return true;
    }

    static TrainingParameters smallParameters()
    {
        TrainingParameters parameters;
        parameters.actorMlpDepth = 2;
        parameters.actorMlpWidth = 16;
        parameters.criticMlpDepth = 2;
        parameters.criticMlpWidth = 16;
        parameters.horizon = 8;
        parameters.batchSize = 4;
        parameters.epochs = 3;
        parameters.learningRate = 1e-2;
        return parameters;
    }

    /** Two random features followed by the agent id. */
    static torch::Tensor observation(int agent)
    {
        return torch::cat({torch::rand({2}), torch::tensor({static_cast<float>(agent)})});
    }

    static bool parametersEqual(Policy &first, Policy &second)
    {
        auto left = first->parameters();
        auto right = second->parameters();
        for (size_t i = 0; i < left.size(); ++i)
        {
            if (!torch::equal(left[i], right[i]))
            {
                return false;
            }
        }
        return true;
    }

    /** The reward is the action; every action is legal. */
    static void playStep(PPO &ppo, ExperienceBuffer &buffer, int agent)
    {
        auto action = ppo.act(observation(agent), torch::ones({2}, torch::kBool), &buffer);
        ppo.recordOutcome(buffer, agent, static_cast<float>(action), false);
    }

    TEST_CASE("PPO::clippedSurrogate()")
    {
        SUBCASE("Ratios inside the clip range are not clipped")
        {
            auto ratio = torch::tensor({0.9f, 1.f, 1.1f});
            auto advantages = torch::tensor({1.f, -2.f, 3.f});
            auto surrogate = PPO::clippedSurrogate(ratio, advantages, 0.2);
            CHECK(surrogate.item<float>() == doctest::Approx((ratio * advantages).mean().item<float>()));
        }

        SUBCASE("Large ratios with positive advantages are capped")
        {
            auto surrogate = PPO::clippedSurrogate(torch::tensor({2.f}), torch::tensor({1.f}), 0.2);
            CHECK(surrogate.item<float>() == doctest::Approx(1.2));
        }

        SUBCASE("Small ratios with negative advantages keep the pessimistic bound")
        {
            auto surrogate = PPO::clippedSurrogate(torch::tensor({0.5f}), torch::tensor({-1.f}), 0.2);
            CHECK(surrogate.item<float>() == doctest::Approx(-0.8));
        }
    }

    TEST_CASE("PPO construction")
    {
        SUBCASE("Old policy starts as a copy of the current policy")
        {
            PPO ppo(3, 2, smallParameters());
            CHECK(parametersEqual(ppo.getPolicy(), ppo.getOldPolicy()));
        }

        SUBCASE("Requesting CUDA falls back to the CPU when it is missing")
        {
            auto parameters = smallParameters();
            parameters.useCuda = true;
            PPO ppo(3, 2, parameters);
            auto expected = torch::cuda::is_available() ? torch::kCUDA : torch::kCPU;
            CHECK(ppo.getDevice().type() == expected);
            CHECK(ppo.getPolicy()->parameters().front().device().type() == expected);
        }

        SUBCASE("Invalid settings are configuration errors")
        {
            auto parameters = smallParameters();
            parameters.advantageEstimator = "monte-carlo";
            CHECK_THROWS_AS(PPO(3, 2, parameters), ConfigurationError);

            parameters = smallParameters();
            parameters.horizon = 0;
            CHECK_THROWS_AS(PPO(3, 2, parameters), ConfigurationError);

            parameters = smallParameters();
            parameters.batchSize = 0;
            CHECK_THROWS_AS(PPO(3, 2, parameters), ConfigurationError);

            parameters = smallParameters();
            parameters.shared = true;
            parameters.criticMlpDepth = 1;
            CHECK_THROWS_AS(PPO(3, 2, parameters), ConfigurationError);
        }
    }

    TEST_CASE("PPO update cycle")
    {
        torch::manual_seed(0);
        auto parameters = smallParameters();
        PPO ppo(3, 2, parameters);
        ExperienceBuffer buffer(2);

        SUBCASE("Agents become ready at horizon + 1 transitions")
        {
            for (int step = 0; step < parameters.horizon; ++step)
            {
                playStep(ppo, buffer, 0);
                CHECK_FALSE(ppo.isReady(buffer, 0));
                CHECK_FALSE(ppo.updateIfReady(buffer, 0).has_value());
            }
            playStep(ppo, buffer, 0);
            CHECK(ppo.isReady(buffer, 0));
            CHECK_FALSE(ppo.isReady(buffer, 1));
        }

        SUBCASE("Old policy changes only when the update finishes")
        {
            std::vector<torch::Tensor> before;
            for (const auto &parameter : ppo.getOldPolicy()->parameters())
            {
                before.push_back(parameter.clone());
            }

            for (int step = 0; step <= parameters.horizon; ++step)
            {
                playStep(ppo, buffer, 0);
            }
            auto oldParameters = ppo.getOldPolicy()->parameters();
            for (size_t i = 0; i < before.size(); ++i)
            {
                CHECK(torch::equal(before[i], oldParameters[i]));
            }

            auto data = ppo.updateIfReady(buffer, 0);
            REQUIRE(data.has_value());
            CHECK(parametersEqual(ppo.getPolicy(), ppo.getOldPolicy()));

            bool changed = false;
            oldParameters = ppo.getOldPolicy()->parameters();
            for (size_t i = 0; i < before.size(); ++i)
            {
                changed = changed || !torch::equal(before[i], oldParameters[i]);
            }
            CHECK(changed);
        }

        SUBCASE("Only the bootstrap transition survives an update")
        {
            for (int step = 0; step <= parameters.horizon; ++step)
            {
                playStep(ppo, buffer, 0);
            }
            playStep(ppo, buffer, 1);
            auto bootstrapState = buffer.trajectory(0).states.back().clone();
            auto bootstrapReward = buffer.trajectory(0).rewards.back();

            ppo.update(buffer, 0);

            REQUIRE(buffer.size(0) == 1);
            CHECK(torch::equal(buffer.trajectory(0).states[0], bootstrapState));
            CHECK(buffer.trajectory(0).rewards[0] == bootstrapReward);
            CHECK(buffer.size(1) == 1);
        }

        SUBCASE("Update reports its metrics")
        {
            for (int step = 0; step <= parameters.horizon; ++step)
            {
                playStep(ppo, buffer, 0);
            }
            auto data = ppo.update(buffer, 0);

            std::vector<std::string> names;
            for (const auto &datum : data)
            {
                names.push_back(datum.name);
                CHECK(std::isfinite(datum.value));
            }
            std::vector<std::string> expected{"Loss", "Action loss", "Value loss", "Entropy", "Clip fraction"};
            CHECK(names == expected);
            CHECK(data[0].value == ppo.getLoss());
        }

        SUBCASE("Windows shorter than two transitions are rejected")
        {
            CHECK_THROWS_AS(ppo.update(buffer, 0), std::invalid_argument);
            playStep(ppo, buffer, 0);
            CHECK_THROWS_AS(ppo.update(buffer, 0), std::invalid_argument);
        }

        SUBCASE("An action without its outcome blocks the update")
        {
            for (int step = 0; step <= parameters.horizon; ++step)
            {
                playStep(ppo, buffer, 0);
            }
            ppo.act(observation(0), torch::ones({2}, torch::kBool), &buffer);

            CHECK_THROWS_AS(ppo.update(buffer, 0), std::invalid_argument);
            CHECK(buffer.trajectory(0).states.size() == static_cast<size_t>(parameters.horizon) + 2);
            CHECK(buffer.size(0) == static_cast<size_t>(parameters.horizon) + 1);

            ppo.recordOutcome(buffer, 0, 0, false);
            CHECK_NOTHROW(ppo.update(buffer, 0));
        }

        SUBCASE("Forcing an action the mask forbids keeps every parameter finite")
        {
            auto noOpForbidden = torch::tensor({false, true});
            for (int step = 0; step <= parameters.horizon; ++step)
            {
                CHECK(ppo.act(observation(0), noOpForbidden, &buffer, 0) == 0);
                ppo.recordOutcome(buffer, 0, static_cast<float>(step % 3), step == 4);
            }
            for (int step = 0; step < 4; ++step)
            {
                playStep(ppo, buffer, 1);
            }
            ppo.act(observation(1), noOpForbidden, &buffer, 0);
            ppo.recordOutcome(buffer, 1, 1, false);

            for (const auto &datum : ppo.update(buffer, 0))
            {
                CHECK(std::isfinite(datum.value));
            }
            CHECK_NOTHROW(ppo.update(buffer, 1));

            for (const auto &parameter : ppo.getPolicy()->parameters())
            {
                CHECK(torch::isfinite(parameter).all().item<bool>());
            }
            for (const auto &parameter : ppo.getOldPolicy()->parameters())
            {
                CHECK(torch::isfinite(parameter).all().item<bool>());
            }
            CHECK(parametersEqual(ppo.getPolicy(), ppo.getOldPolicy()));
        }

        SUBCASE("A window that is not a multiple of the batch size is consumed")
        {
            for (int step = 0; step < 7; ++step)
            {
                playStep(ppo, buffer, 1);
            }
            CHECK_NOTHROW(ppo.update(buffer, 1));
            CHECK(buffer.size(1) == 1);
        }
    }

    TEST_CASE("PPO learning")
    {
        torch::manual_seed(0);

        SUBCASE("Agents updating at different times learn that action 1 pays")
        {
            auto parameters = smallParameters();
            parameters.entropyCoefficient = 0;
            PPO ppo(3, 2, parameters);
            ExperienceBuffer buffer(2);

            auto probe = torch::tensor({0.5f, 0.5f, 0.f}).unsqueeze(0);
            auto all = torch::ones({1, 2}, torch::kBool);
            auto before = ppo.getPolicy()->getProbability(probe, all)[0][1].item<float>();

            // Agent 1 joins three steps late, so the agents never update on the same step
            for (int step = 0; step < 3; ++step)
            {
                playStep(ppo, buffer, 0);
            }
            int updates = 0;
            for (int step = 0; step < 400; ++step)
            {
                for (int agent = 0; agent < 2; ++agent)
                {
                    playStep(ppo, buffer, agent);
                    if (ppo.updateIfReady(buffer, agent).has_value())
                    {
                        ++updates;
                    }
                }
            }

            auto after = ppo.getPolicy()->getProbability(probe, all)[0][1].item<float>();
            INFO("Probability of action 1 before: " << before << ", after: " << after);
            CHECK(updates > 80);
            CHECK(after > before);
            CHECK(after > 0.8);
        }

        SUBCASE("Shared networks learn through the common trunk")
        {
            auto parameters = smallParameters();
            parameters.shared = true;
            parameters.entropyCoefficient = 0;
            PPO ppo(3, 2, parameters);
            ExperienceBuffer buffer(1);

            auto probe = torch::tensor({0.5f, 0.5f, 0.f}).unsqueeze(0);
            auto all = torch::ones({1, 2}, torch::kBool);
            auto before = ppo.getPolicy()->getProbability(probe, all)[0][1].item<float>();

            for (int step = 0; step < 400; ++step)
            {
                playStep(ppo, buffer, 0);
                ppo.updateIfReady(buffer, 0);
            }

            auto after = ppo.getPolicy()->getProbability(probe, all)[0][1].item<float>();
            CHECK(after > before);
        }

        SUBCASE("Masked actions stay unused while learning")
        {
            auto parameters = smallParameters();
            PPO ppo(3, 3, parameters);
            ExperienceBuffer buffer(1);
            auto mask = torch::tensor({true, true, false});

            for (int step = 0; step < 100; ++step)
            {
                auto action = ppo.act(observation(0), mask, &buffer);
                CHECK(action != 2);
                ppo.recordOutcome(buffer, 0, static_cast<float>(action), step % 10 == 9);
                ppo.updateIfReady(buffer, 0);
            }
        }
    }

    TEST_CASE("PPO value regression")
    {
        // Known deviation from canonical PPO: the critic regresses onto the immediate
        // reward, not onto the discounted return, so a constant reward of 1 is learned
        // as a value of 1 whatever the discount.
        torch::manual_seed(0);
        auto parameters = smallParameters();
        parameters.discountFactor = 0.99;
        parameters.epochs = 5;
        PPO ppo(3, 2, parameters);
        ExperienceBuffer buffer(1);

        for (int step = 0; step < 300; ++step)
        {
            ppo.act(observation(0), torch::ones({2}, torch::kBool), &buffer);
            ppo.recordOutcome(buffer, 0, 1, false);
            ppo.updateIfReady(buffer, 0);
        }

        auto states = torch::stack({observation(0), observation(0), observation(0)});
        auto values = ppo.getPolicy()->getValue(states);
        INFO("Values: " << values);
        CHECK(values.sub(1).abs().max().item<float>() < 0.25);
    }

    TEST_CASE("PPO persistence")
    {
        torch::manual_seed(0);
        auto path = (std::filesystem::temp_directory_path() / "psppo_trainer_test.pt").string();
        auto parameters = smallParameters();

        PPO trained(3, 2, parameters);
        ExperienceBuffer buffer(1);
        for (int step = 0; step <= parameters.horizon; ++step)
        {
            playStep(trained, buffer, 0);
        }
        trained.update(buffer, 0);
        trained.save(path);

        SUBCASE("Loading restores both policies")
        {
            PPO restored(3, 2, parameters);
            CHECK(restored.load(path));
            CHECK(parametersEqual(restored.getPolicy(), trained.getPolicy()));
            CHECK(parametersEqual(restored.getOldPolicy(), trained.getPolicy()));
        }

        SUBCASE("Checkpoint path in the parameters is restored at construction")
        {
            parameters.loadModelPath = path;
            PPO restored(3, 2, parameters);
            CHECK(parametersEqual(restored.getPolicy(), trained.getPolicy()));
            CHECK(parametersEqual(restored.getOldPolicy(), trained.getPolicy()));
        }

        SUBCASE("A missing file leaves the trainer untouched")
        {
            PPO fresh(3, 2, parameters);
            CHECK_FALSE(fresh.load(path + ".missing"));
            CHECK(parametersEqual(fresh.getPolicy(), fresh.getOldPolicy()));
        }

        std::filesystem::remove(path);
    }
}
