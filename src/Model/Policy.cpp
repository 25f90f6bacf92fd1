/**
 * @file Policy.cpp
 * @brief Implementation of the parameter-shared actor-critic policy
 * @author moinshaikh
 * @date 2/12/26
 *
 * The same PolicyImpl instance acts for every agent. Acting uses the masked
 * categorical distribution of the actor and records the transition in the agent's
 * trajectory; evaluation recomputes log probabilities, values and entropies for a
 * batch of stored transitions during optimisation.
 */

#include<cmath>
#include<filesystem>

#include<torch/torch.h>
#include<spdlog/spdlog.h>
#include<doctest/doctest.h>

#include"../../include/Model/policy.hpp"
#include"../../include/Model/modelUtils.hpp"
#include"../../include/Distribution/Categorical.hpp"
#include"../../include/ConfigurationError.hpp"

namespace PsPpo
{
    /**
     * @brief Multiplies the weight of the final linear layer of `network` by `scale`.
     *
     * Every network built by NetworkBuilder ends with a linear layer.
     */
    static void scaleOutputLayer(torch::nn::Sequential &network, double scale)
    {
        torch::NoGradGuard guard;
        auto output = network->ptr(network->size() - 1)->as<torch::nn::Linear>();
        output->weight.mul_(scale);
    }

    /**
     * @brief PolicyImpl constructor
     *
     * - Separate layout: actor = mlp(actorDepth, actorWidth, actionSize) and
     *   critic = mlp(criticDepth, criticWidth, 1).
     * - Shared layout: trunk = the critic's hidden layers, critic head =
     *   Linear(criticWidth, 1), actor head = Linear(criticWidth, actionSize). The actor
     *   depth and width are still validated but do not shape the network.
     *
     * All modules are registered before initialization so that initWeights() reaches
     * every linear layer through named_parameters().
     */
    PolicyImpl::PolicyImpl(int64_t stateSize, int64_t actionSize, const TrainingParameters &parameters) :
    stateSize(stateSize),
    actionSize(actionSize),
    shared(parameters.shared),
    activation(activationFromName(parameters.activation)),
    trunk(nullptr),
    actor(nullptr),
    critic(nullptr)
    {
        NetworkBuilder builder(stateSize, activation);
        auto actorLayout = builder.mlp(parameters.actorMlpDepth, parameters.actorMlpWidth, actionSize);
        auto criticLayout = builder.mlp(parameters.criticMlpDepth, parameters.criticMlpWidth, 1);

        if (shared)
        {
            trunk = NetworkBuilder::materialize(builder.trunk(parameters.criticMlpDepth,
                                                              parameters.criticMlpWidth));
            critic = NetworkBuilder::materialize({LayerDescriptor::linear(parameters.criticMlpWidth, 1)});
            actor = NetworkBuilder::materialize({LayerDescriptor::linear(parameters.criticMlpWidth, actionSize)});
            register_module("trunk", trunk);
        }
        else
        {
            actor = NetworkBuilder::materialize(actorLayout);
            critic = NetworkBuilder::materialize(criticLayout);
        }
        register_module("actor", actor);
        register_module("critic", critic);

        initWeights(named_parameters(), std::sqrt(2.), 0);
        scaleOutputLayer(critic, parameters.lastCriticLayerScaling);
        scaleOutputLayer(actor, parameters.lastActorLayerScaling);

        if (!parameters.loadModelPath.empty())
        {
            load(parameters.loadModelPath);
        }
    }

    torch::Tensor PolicyImpl::features(torch::Tensor states)
    {
        if (shared)
        {
            return trunk->forward(states);
        }
        return states;
    }

    torch::Device PolicyImpl::device() const
    {
        return parameters().front().device();
    }

    /**
     * @brief Sample (or force) an action from the masked actor distribution
     *
     * Process:
     * 1. Read the agent id from the trailing state element
     * 2. Compute the actor logits and mask illegal actions
     * 3. Sample, unless an explicit action was supplied
     * 4. Record (state, action, log probability, mask) for the agent
     */
    int64_t PolicyImpl::act(torch::Tensor state,
                            torch::Tensor mask,
                            ExperienceBuffer *buffer,
                            std::optional<int64_t> explicitAction)
    {
        torch::NoGradGuard noGrad;

        state = state.to(device(), torch::kFloat);
        mask = mask.to(device(), torch::kBool);
        auto agentId = static_cast<int>(state[-1].item<float>());

        auto logits = actor->forward(features(state));
        Categorical distribution(nullptr, &logits, &mask);

        torch::Tensor action;
        if (explicitAction.has_value())
        {
            action = torch::tensor(*explicitAction, torch::TensorOptions(device()).dtype(torch::kLong));
        }
        else
        {
            action = distribution.sample();
        }
        auto logProbability = distribution.logProbability(action).item<float>();
        auto actionIndex = action.item<int64_t>();

        if (buffer != nullptr)
        {
            buffer->appendAction(agentId, state, actionIndex, logProbability, mask);
        }
        return actionIndex;
    }

    std::vector<torch::Tensor> PolicyImpl::evaluate(torch::Tensor states,
                                                    torch::Tensor actions,
                                                    torch::Tensor masks)
    {
        auto hidden = features(states);
        auto logits = actor->forward(hidden);
        Categorical distribution(nullptr, &logits, &masks);

        auto values = critic->forward(hidden).squeeze(-1);
        return {values,
                distribution.logProbability(actions),
                distribution.entropy()};
    }

    torch::Tensor PolicyImpl::getProbability(torch::Tensor states, torch::Tensor masks)
    {
        auto logits = actor->forward(features(states));
        Categorical distribution(nullptr, &logits, &masks);
        return distribution.getProbability();
    }

    torch::Tensor PolicyImpl::getValue(torch::Tensor states)
    {
        return critic->forward(features(states)).squeeze(-1);
    }

    void PolicyImpl::save(const std::string &path)
    {
        torch::serialize::OutputArchive archive;
        torch::nn::Module::save(archive);
        archive.save_to(path);
        spdlog::info("Policy saved to {}", path);
    }

    bool PolicyImpl::load(const std::string &path)
    {
        if (!std::filesystem::exists(path))
        {
            spdlog::error("Loading file failed. File not found: {}", path);
            return false;
        }
        torch::serialize::InputArchive archive;
        archive.load_from(path, device());
        torch::nn::Module::load(archive);
        spdlog::info("Policy loaded from {}", path);
        return true;
    }

    static TrainingParameters testParameters(bool shared)
    {
        TrainingParameters parameters;
        parameters.actorMlpDepth = 3;
        parameters.actorMlpWidth = 16;
        parameters.criticMlpDepth = 3;
        parameters.criticMlpWidth = 16;
        parameters.activation = "ReLU";
        parameters.shared = shared;
        return parameters;
    }

    static torch::Tensor stateFor(int agent, int64_t stateSize)
    {
        auto state = torch::rand({stateSize});
        state[-1] = agent;
        return state;
    }

    TEST_CASE("Policy construction")
    {
        SUBCASE("Separate and shared layouts build")
        {
            Policy separate(5, 4, testParameters(false));
            Policy shared(5, 4, testParameters(true));
            CHECK_FALSE(separate->isShared());
            CHECK(shared->isShared());
            CHECK(shared->getStateSize() == 5);
            CHECK(shared->getActionSize() == 4);
        }

        SUBCASE("Shared layout needs a critic deeper than 1")
        {
            auto parameters = testParameters(true);
            parameters.criticMlpDepth = 1;
            CHECK_THROWS_AS(Policy(5, 4, parameters), ConfigurationError);
            parameters.criticMlpDepth = 0;
            CHECK_THROWS_AS(Policy(5, 4, parameters), ConfigurationError);
            parameters.criticMlpDepth = 2;
            CHECK_NOTHROW(Policy(5, 4, parameters));
        }

        SUBCASE("Non-positive depths are rejected")
        {
            auto parameters = testParameters(false);
            parameters.actorMlpDepth = 0;
            CHECK_THROWS_AS(Policy(5, 4, parameters), ConfigurationError);

            parameters = testParameters(false);
            parameters.criticMlpDepth = -1;
            CHECK_THROWS_AS(Policy(5, 4, parameters), ConfigurationError);
        }

        SUBCASE("Unknown activations are rejected")
        {
            auto parameters = testParameters(false);
            parameters.activation = "Softplus";
            CHECK_THROWS_AS(Policy(5, 4, parameters), ConfigurationError);
        }

        SUBCASE("Shared trunk parameters are owned once")
        {
            Policy policy(5, 4, testParameters(true));

            // trunk: 5x16 + 16, 16x16 + 16; heads: 16x1 + 1, 16x4 + 4
            int64_t count = 0;
            for (const auto &parameter : policy->parameters())
            {
                count += parameter.numel();
            }
            CHECK(count == (5 * 16 + 16) + (16 * 16 + 16) + (16 + 1) + (16 * 4 + 4));
        }

        SUBCASE("Zero output scaling gives a uniform actor and a zero critic")
        {
            auto parameters = testParameters(false);
            parameters.lastActorLayerScaling = 0;
            parameters.lastCriticLayerScaling = 0;
            Policy policy(5, 4, parameters);

            auto states = torch::rand({3, 5});
            auto masks = torch::ones({3, 4}, torch::kBool);
            auto probabilities = policy->getProbability(states, masks);

            CHECK(torch::allclose(probabilities, torch::full({3, 4}, 0.25)));
            CHECK(policy->getValue(states).abs().max().item().toDouble() == doctest::Approx(0));
        }
    }

    TEST_CASE("Policy acting")
    {
        torch::manual_seed(0);
        Policy policy(5, 4, testParameters(false));

        SUBCASE("A single legal action is always chosen")
        {
            auto mask = torch::tensor({false, false, true, false});
            for (int i = 0; i < 100; ++i)
            {
                CHECK(policy->act(stateFor(0, 5), mask) == 2);
            }
        }

        SUBCASE("Masked actions are never sampled")
        {
            auto mask = torch::tensor({true, false, true, false});
            for (int i = 0; i < 100; ++i)
            {
                auto action = policy->act(stateFor(0, 5), mask);
                CHECK((action == 0 || action == 2));
            }
        }

        SUBCASE("Transitions are recorded for the agent in the state")
        {
            ExperienceBuffer buffer(3);
            auto mask = torch::ones({4}, torch::kBool);

            auto action = policy->act(stateFor(2, 5), mask, &buffer);

            CHECK(buffer.trajectory(0).states.empty());
            const auto &trajectory = buffer.trajectory(2);
            REQUIRE(trajectory.states.size() == 1);
            CHECK(trajectory.actions[0] == action);
            CHECK(trajectory.masks[0].all().item().toBool());
            CHECK(trajectory.states[0][-1].item().toFloat() == doctest::Approx(2));
            CHECK(buffer.size(2) == 0);
        }

        SUBCASE("Explicit actions are used and recorded with their log probability")
        {
            ExperienceBuffer buffer(1);
            auto state = stateFor(0, 5);
            auto mask = torch::ones({4}, torch::kBool);

            auto action = policy->act(state, mask, &buffer, 3);
            CHECK(action == 3);

            auto evaluation = policy->evaluate(state.unsqueeze(0),
                                               torch::tensor({3}, torch::kLong),
                                               mask.unsqueeze(0));
            CHECK(buffer.trajectory(0).logProbs[0] ==
                  doctest::Approx(evaluation[1][0].item().toFloat()).epsilon(1e-5));
        }

        SUBCASE("An explicit action the mask forbids is recorded with a finite log probability")
        {
            ExperienceBuffer buffer(1);
            auto state = stateFor(0, 5);
            auto mask = torch::tensor({false, true, true, true});

            CHECK(policy->act(state, mask, &buffer, 0) == 0);
            auto recorded = buffer.trajectory(0).logProbs[0];
            CHECK(std::isfinite(recorded));

            auto evaluation = policy->evaluate(state.unsqueeze(0),
                                               torch::tensor({0}, torch::kLong),
                                               mask.unsqueeze(0));
            CHECK(evaluation[1][0].item().toFloat() == recorded);
            CHECK(torch::isfinite(evaluation[2]).all().item().toBool());
        }

        SUBCASE("Acting does not track gradients")
        {
            ExperienceBuffer buffer(1);
            policy->act(stateFor(0, 5), torch::ones({4}, torch::kBool), &buffer);
            CHECK(!buffer.trajectory(0).states[0].requires_grad());
        }
    }

    TEST_CASE("Policy evaluation")
    {
        Policy policy(5, 4, testParameters(true));
        auto states = torch::rand({6, 5});
        auto actions = torch::tensor({0, 1, 2, 3, 0, 1}, torch::kLong);
        auto masks = torch::ones({6, 4}, torch::kBool);

        auto evaluation = policy->evaluate(states, actions, masks);

        SUBCASE("Outputs are one value per transition")
        {
            REQUIRE(evaluation.size() == 3);
            CHECK(evaluation[0].sizes().vec() == std::vector<int64_t>{6});
            CHECK(evaluation[1].sizes().vec() == std::vector<int64_t>{6});
            CHECK(evaluation[2].sizes().vec() == std::vector<int64_t>{6});
        }

        SUBCASE("Log probabilities and entropies are consistent with the probabilities")
        {
            auto probabilities = policy->getProbability(states, masks);
            auto expected = probabilities.gather(-1, actions.unsqueeze(-1)).squeeze(-1).log();
            CHECK(torch::allclose(evaluation[1], expected, 1e-4, 1e-5));
            CHECK((evaluation[2] <= std::log(4.) + 1e-5).all().item().toBool());
        }

        SUBCASE("Gradients reach the shared trunk from both heads")
        {
            policy->zero_grad();
            evaluation[1].sum().backward(torch::Tensor(), true);
            auto trunkGrad = policy->named_parameters()["trunk.0.weight"].grad();
            REQUIRE(trunkGrad.defined());
            CHECK(trunkGrad.abs().sum().item().toDouble() > 0);

            policy->zero_grad();
            evaluation[0].sum().backward();
            trunkGrad = policy->named_parameters()["trunk.0.weight"].grad();
            CHECK(trunkGrad.abs().sum().item().toDouble() > 0);
        }
    }

    TEST_CASE("Policy persistence")
    {
        auto path = (std::filesystem::temp_directory_path() / "psppo_policy_test.pt").string();
        std::filesystem::remove(path);

        torch::manual_seed(1);
        Policy original(5, 4, testParameters(true));
        original->save(path);

        torch::manual_seed(2);
        Policy restored(5, 4, testParameters(true));

        SUBCASE("Saved parameters restore identical outputs")
        {
            REQUIRE(restored->load(path));

            auto states = torch::rand({4, 5});
            auto actions = torch::tensor({0, 1, 2, 3}, torch::kLong);
            auto masks = torch::tensor({true, true, false, true}).repeat({4, 1});

            auto expected = original->evaluate(states, actions, masks);
            auto actual = restored->evaluate(states, actions, masks);
            for (size_t i = 0; i < expected.size(); ++i)
            {
                CHECK(torch::equal(expected[i], actual[i]));
            }

            auto state = stateFor(0, 5);
            for (int i = 0; i < 10; ++i)
            {
                torch::manual_seed(100 + i);
                auto first = original->act(state, masks[0]);
                torch::manual_seed(100 + i);
                CHECK(restored->act(state, masks[0]) == first);
            }
        }

        SUBCASE("Restoring from the constructor")
        {
            auto parameters = testParameters(true);
            parameters.loadModelPath = path;
            Policy fromPath(5, 4, parameters);

            auto states = torch::rand({3, 5});
            CHECK(torch::equal(fromPath->getValue(states), original->getValue(states)));
        }

        SUBCASE("A missing file leaves the parameters untouched")
        {
            auto before = restored->named_parameters()["critic.0.weight"].clone();
            CHECK_FALSE(restored->load(path + ".missing"));
            CHECK(torch::equal(before, restored->named_parameters()["critic.0.weight"]));
        }

        std::filesystem::remove(path);
    }
}
