//
// Created by moinshaikh on 2/11/26.
//

#ifndef PSPPO_EXPERIENCEBUFFER_HPP
#define PSPPO_EXPERIENCEBUFFER_HPP

#include<vector>

#include<torch/torch.h>

namespace PsPpo
{
    /**
     * @brief Ordered experience of a single agent.
     *
     * Six parallel sequences indexed by a common step position. The acting half of a
     * step (state, action, log probability, mask) is appended before the environment is
     * stepped and the outcome half (reward, done) afterwards, so between the two calls
     * the acting sequences are one element longer than the outcome sequences.
     */
    struct Trajectory
    {
        std::vector<torch::Tensor> states;    ///< 1-D float tensors of size stateSize
        std::vector<int64_t> actions;
        std::vector<float> logProbs;          ///< Log probability of the action under the behaviour policy
        std::vector<torch::Tensor> masks;     ///< 1-D bool tensors of size actionSize
        std::vector<float> rewards;
        std::vector<bool> dones;

        /** @return Number of complete transitions */
        inline size_t size() const
        {
            return rewards.size();
        }

        inline bool empty() const
        {
            return states.empty() && rewards.empty();
        }

        void clear();

        /** @brief Keeps only the final element of every sequence. */
        void keepLast();
    };

    /**
     * @brief Per-agent experience storage used by the parameter-shared trainer.
     *
     * `ExperienceBuffer` owns one Trajectory per agent, addressed by the integer agent
     * id. Every agent fills its own trajectory independently, so agents reach the
     * update horizon at different steps and are trained one at a time.
     *
     * After an update the trajectory is truncated to its final transition with
     * clearExceptLast(). That transition is the bootstrap sample of the window that
     * was just consumed and becomes the first sample of the next window.
     */
    class ExperienceBuffer
    {
    private:
        std::vector<Trajectory> trajectories;

    public:
        /**
         * @brief Creates empty trajectories for agents 0 .. numAgents-1.
         *
         * @param numAgents Number of agents sharing the policy
         */
        explicit ExperienceBuffer(int numAgents);

        /**
         * @brief Appends the acting half of a transition.
         *
         * @param agent Agent id
         * @param state Observed state, 1-D float tensor
         * @param action Chosen action index
         * @param logProb Log probability of `action` under the behaviour policy
         * @param mask Action validity mask, 1-D bool tensor
         */
        void appendAction(int agent,
                          torch::Tensor state,
                          int64_t action,
                          float logProb,
                          torch::Tensor mask);

        /**
         * @brief Appends the environment half of a transition.
         *
         * @param agent Agent id
         * @param reward Scalar reward received after acting
         * @param done True when the agent's episode terminated on this step
         */
        void appendOutcome(int agent, float reward, bool done);

        /** @brief Resets every agent to an empty trajectory. */
        void clear();

        /**
         * @brief Truncates every sequence of `agent` to its final element.
         *
         * Leaves exactly one element per sequence whatever the prior length was, as long
         * as the trajectory was not empty.
         */
        void clearExceptLast(int agent);

        /** @return Number of complete transitions stored for `agent` */
        size_t size(int agent) const;

        const Trajectory &trajectory(int agent) const;

        inline int numAgents() const
        {
            return static_cast<int>(trajectories.size());
        }
    };
}

#endif //PSPPO_EXPERIENCEBUFFER_HPP
