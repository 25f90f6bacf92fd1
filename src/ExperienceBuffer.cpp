//
// Created by moinshaikh on 2/11/26.
//

#include<stdexcept>
#include<string>

#include<doctest/doctest.h>

#include"../include/ExperienceBuffer.hpp"

namespace PsPpo
{
    void Trajectory::clear()
    {
        states.clear();
        actions.clear();
        logProbs.clear();
        masks.clear();
        rewards.clear();
        dones.clear();
    }

    template<typename T>
    static void keepLastElement(std::vector<T> &sequence)
    {
        if (sequence.size() > 1)
        {
            sequence.erase(sequence.begin(), sequence.end() - 1);
        }
    }

    void Trajectory::keepLast()
    {
        keepLastElement(states);
        keepLastElement(actions);
        keepLastElement(logProbs);
        keepLastElement(masks);
        keepLastElement(rewards);
        keepLastElement(dones);
    }

    ExperienceBuffer::ExperienceBuffer(int numAgents)
    {
        if (numAgents <= 0)
        {
            throw std::invalid_argument("ExperienceBuffer needs at least one agent");
        }
        trajectories.resize(numAgents);
    }

    void ExperienceBuffer::appendAction(int agent,
                                        torch::Tensor state,
                                        int64_t action,
                                        float logProb,
                                        torch::Tensor mask)
    {
        auto &trajectory = trajectories.at(agent);
        trajectory.states.push_back(state);
        trajectory.actions.push_back(action);
        trajectory.logProbs.push_back(logProb);
        trajectory.masks.push_back(mask);
    }

    void ExperienceBuffer::appendOutcome(int agent, float reward, bool done)
    {
        auto &trajectory = trajectories.at(agent);
        trajectory.rewards.push_back(reward);
        trajectory.dones.push_back(done);
    }

    void ExperienceBuffer::clear()
    {
        for (auto &trajectory : trajectories)
        {
            trajectory.clear();
        }
    }

    void ExperienceBuffer::clearExceptLast(int agent)
    {
        trajectories.at(agent).keepLast();
    }

    size_t ExperienceBuffer::size(int agent) const
    {
        return trajectories.at(agent).size();
    }

    const Trajectory &ExperienceBuffer::trajectory(int agent) const
    {
        return trajectories.at(agent);
    }

    static void appendStep(ExperienceBuffer &buffer, int agent, float value)
    {
        buffer.appendAction(agent,
                            torch::full({3}, value),
                            static_cast<int64_t>(value),
                            -value,
                            torch::ones({4}, torch::kBool));
        buffer.appendOutcome(agent, value, false);
    }

    TEST_CASE("ExperienceBuffer")
    {
        ExperienceBuffer buffer(3);

        SUBCASE("Starts empty for every agent")
        {
            CHECK(buffer.numAgents() == 3);
            for (int agent = 0; agent < 3; ++agent)
            {
                CHECK(buffer.size(agent) == 0);
                CHECK(buffer.trajectory(agent).empty());
            }
        }

        SUBCASE("Agents are stored independently")
        {
            appendStep(buffer, 0, 1);
            appendStep(buffer, 0, 2);
            appendStep(buffer, 2, 7);

            CHECK(buffer.size(0) == 2);
            CHECK(buffer.size(1) == 0);
            CHECK(buffer.size(2) == 1);
            CHECK(buffer.trajectory(2).actions[0] == 7);
        }

        SUBCASE("Acting half is visible before the outcome is recorded")
        {
            buffer.appendAction(1, torch::zeros({3}), 2, -0.5, torch::ones({4}, torch::kBool));

            CHECK(buffer.size(1) == 0);
            CHECK(buffer.trajectory(1).states.size() == 1);
            CHECK(buffer.trajectory(1).logProbs[0] == doctest::Approx(-0.5));

            buffer.appendOutcome(1, 1.5, true);
            CHECK(buffer.size(1) == 1);
            CHECK(buffer.trajectory(1).dones[0]);
        }

        SUBCASE("clearExceptLast() keeps exactly the final transition")
        {
            for (int length : {1, 2, 5, 17})
            {
                buffer.clear();
                for (int i = 0; i < length; ++i)
                {
                    appendStep(buffer, 1, static_cast<float>(i));
                }
                buffer.clearExceptLast(1);

                const auto &trajectory = buffer.trajectory(1);
                INFO("Prior length: " << length);
                CHECK(trajectory.states.size() == 1);
                CHECK(trajectory.actions.size() == 1);
                CHECK(trajectory.logProbs.size() == 1);
                CHECK(trajectory.masks.size() == 1);
                CHECK(trajectory.rewards.size() == 1);
                CHECK(trajectory.dones.size() == 1);
                CHECK(trajectory.actions[0] == length - 1);
                CHECK(trajectory.rewards[0] == doctest::Approx(length - 1));
                CHECK(trajectory.states[0][0].item().toFloat() == doctest::Approx(length - 1));
            }
        }

        SUBCASE("clearExceptLast() leaves other agents untouched")
        {
            appendStep(buffer, 0, 1);
            appendStep(buffer, 0, 2);
            appendStep(buffer, 1, 3);
            appendStep(buffer, 1, 4);

            buffer.clearExceptLast(0);

            CHECK(buffer.size(0) == 1);
            CHECK(buffer.size(1) == 2);
        }

        SUBCASE("clear() resets every agent")
        {
            appendStep(buffer, 0, 1);
            appendStep(buffer, 2, 1);
            buffer.clear();

            for (int agent = 0; agent < 3; ++agent)
            {
                CHECK(buffer.trajectory(agent).empty());
            }
        }

        SUBCASE("Unknown agents are rejected")
        {
            CHECK_THROWS_AS(buffer.appendOutcome(3, 0, false), std::out_of_range);
            CHECK_THROWS_AS(buffer.size(-1), std::out_of_range);
        }
    }
}
