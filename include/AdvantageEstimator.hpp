//
// Created by moinshaikh on 2/13/26.
//

#ifndef PSPPO_ADVANTAGEESTIMATOR_HPP
#define PSPPO_ADVANTAGEESTIMATOR_HPP

#include<string>

#include<torch/torch.h>

namespace PsPpo
{
    /**
     * @brief Estimates advantages over a window of one agent's experience.
     *
     * Two modes are available, chosen once at construction:
     *
     * - Generalized Advantage Estimation ("gae"):
     *   \f[ \delta_t = r_t + \gamma V_{t+1} (1 - d_t) - V_t \f]
     *   \f[ A_t = \delta_t + \gamma \lambda (1 - d_t) A_{t+1}, \quad A_T = 0 \f]
     *
     * - N-step returns ("n-steps"):
     *   \f[ G_T = V_T, \quad G_t = r_t + \gamma (1 - d_t) G_{t+1}, \quad A_t = G_t - V_t \f]
     *
     * The done flag of a step cuts the bootstrap from the following state, so the value
     * of a successor across an episode boundary never leaks into the advantage.
     */
    class AdvantageEstimator
    {
    public:
        enum class Mode
        {
            GAE,
            NSteps
        };

    private:
        Mode mode;
        float gamma;
        float lambda;

    public:
        /**
         * @param mode "gae" or "n-steps"
         * @param gamma Discount factor
         * @param lambda GAE smoothing factor, unused by n-step returns
         * @throws ConfigurationError for an unknown mode name
         */
        AdvantageEstimator(const std::string &mode, float gamma, float lambda);

        AdvantageEstimator(Mode mode, float gamma, float lambda);

        /**
         * @brief Computes the advantages of a window of length T.
         *
         * @param rewards [T] rewards
         * @param dones [T] done flags (any dtype, non-zero means done)
         * @param values [T + 1] value estimates; the last one bootstraps the state that
         *               follows the window
         * @return [T] advantages aligned with `rewards`
         * @throws std::invalid_argument if `values` is not one longer than `rewards`
         */
        torch::Tensor compute(torch::Tensor rewards, torch::Tensor dones, torch::Tensor values) const;

        /**
         * @brief Rescales `advantages` to zero mean and unit variance.
         *
         * Uses the unbiased standard deviation plus `epsilon` in the denominator, so a
         * constant sequence maps to zeros. A single advantage also maps to zero.
         */
        static torch::Tensor standardize(torch::Tensor advantages, double epsilon = 1e-10);

        inline Mode getMode() const
        {
            return mode;
        }
    };
}

#endif //PSPPO_ADVANTAGEESTIMATOR_HPP
