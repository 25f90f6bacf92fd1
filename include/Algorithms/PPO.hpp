//
// Created by moinshaikh on 1/28/26.
//

#ifndef PSPPO_PPO_HPP
#define PSPPO_PPO_HPP

#include<memory>
#include<optional>
#include<string>
#include<vector>

#include<torch/torch.h>

#include"Algorithm.hpp"
#include"../AdvantageEstimator.hpp"
#include"../ExperienceBuffer.hpp"
#include"../TrainingParameters.hpp"
#include"../Model/policy.hpp"

namespace PsPpo
{
    /**
     * @class PPO
     * @brief Parameter-shared Proximal Policy Optimization trainer.
     *
     * One actor-critic network is trained from the experience of every agent. The
     * trainer keeps two copies of it:
     * - the current policy, optimised by Adam during an update;
     * - the old (behaviour) policy, which acts and whose log probabilities are
     *   recorded. It changes only when an update finishes, by copying the current
     *   parameters into it.
     *
     * Each agent collects its own trajectory. When an agent has gathered `horizon + 1`
     * transitions, the first `horizon` form the learning window and the last one is the
     * bootstrap sample. The update runs `epochs` passes over the window in contiguous
     * mini-batches of `batchSize` transitions. Every mini-batch carries one extra row
     * (the next transition of the window, or the bootstrap sample for the final
     * mini-batch) whose value bootstraps the advantage estimate of the mini-batch.
     *
     * Loss of a mini-batch:
     * \f[ L = -\mathrm{mean}(\min(\rho A, \mathrm{clip}(\rho, 1-\epsilon, 1+\epsilon) A))
     *         + c_v \cdot 0.5 \cdot \mathrm{mean}((V - r)^2) - c_e \cdot \mathrm{mean}(H) \f]
     * where the value regresses onto the immediate reward r.
     *
     * Agents are updated one at a time from the same thread; nothing here is locked.
     */
    class PPO : public Algorithms
    {
    private:
        TrainingParameters parameters;
        torch::Device device;
        Policy policy;       ///< Optimised by the update
        Policy oldPolicy;    ///< Acts, refreshed at the end of every update
        std::unique_ptr<torch::optim::Adam> optimizer;
        AdvantageEstimator advantageEstimator;
        float loss = 0;

        /** @brief Copies every parameter of the current policy into the old policy. */
        void synchronizeOldPolicy();

    public:
        /**
         * @brief Builds both policies and the optimiser.
         *
         * The old policy starts as an exact copy of the current one. When
         * `parameters.loadModelPath` is set the current policy is restored from it first.
         *
         * @param stateSize Size of a state vector, trailing agent id included
         * @param actionSize Number of discrete actions
         * @param parameters Hyperparameters
         * @throws ConfigurationError on invalid network settings, an unknown advantage
         *         estimator or a non-positive horizon, batch size or epoch count
         */
        PPO(int64_t stateSize, int64_t actionSize, const TrainingParameters &parameters);

        /**
         * @brief Chooses an action with the old policy and records it.
         *
         * @see PolicyImpl::act
         */
        int64_t act(torch::Tensor state,
                    torch::Tensor mask,
                    ExperienceBuffer *buffer = nullptr,
                    std::optional<int64_t> explicitAction = std::nullopt);

        /** @brief Records the reward and done flag that followed the last action of `agent`. */
        void recordOutcome(ExperienceBuffer &buffer, int agent, float reward, bool done);

        /** @return True once `agent` holds at least `horizon + 1` transitions */
        bool isReady(const ExperienceBuffer &buffer, int agent) const;

        /**
         * @brief Runs update() when `agent` is ready.
         *
         * @return The metrics of the update, or nothing if the agent is still collecting
         */
        std::optional<std::vector<UpdateDatum>> updateIfReady(ExperienceBuffer &buffer, int agent);

        /**
         * @brief Optimises the current policy on the trajectory of `agent`.
         *
         * Every transition but the last is learned from; the last one only bootstraps
         * the final mini-batch. Afterwards the old policy is synchronised and the
         * trajectory is truncated to its last transition, which starts the next window.
         *
         * @return "Loss" of the last mini-batch, plus "Action loss", "Value loss",
         *         "Entropy" and "Clip fraction" averaged over all mini-batch steps
         * @throws std::invalid_argument if the agent holds fewer than 2 transitions
         */
        std::vector<UpdateDatum> update(ExperienceBuffer &buffer, int agent) override;

        /**
         * @brief Clipped surrogate objective.
         *
         * @param ratio Probability ratios of the new over the behaviour policy
         * @param advantages Advantages aligned with `ratio`
         * @param clipParam Clipping range epsilon
         * @return mean(min(ratio * A, clamp(ratio, 1 - eps, 1 + eps) * A))
         */
        static torch::Tensor clippedSurrogate(torch::Tensor ratio, torch::Tensor advantages, float clipParam);

        /** @brief Saves the current policy. */
        void save(const std::string &path);

        /**
         * @brief Restores the current policy and copies it into the old policy.
         *
         * @return False if the file does not exist
         */
        bool load(const std::string &path);

        /** @return Total loss of the last optimised mini-batch */
        inline float getLoss() const
        {
            return loss;
        }

        inline Policy &getPolicy()
        {
            return policy;
        }

        inline Policy &getOldPolicy()
        {
            return oldPolicy;
        }

        inline torch::Device getDevice() const
        {
            return device;
        }
    };
}

#endif //PSPPO_PPO_HPP
