//
// Created by moinshaikh on 1/28/26.
//

#ifndef PSPPO_ALGORITHM_HPP
#define PSPPO_ALGORITHM_HPP

#include<string>
#include<vector>

#include"../ExperienceBuffer.hpp"

namespace PsPpo
{
    /**
     * @brief A named scalar produced by a training update.
     *
     * Updates return a vector of these so that the caller can log or plot them
     * without knowing which metrics a particular algorithm reports.
     */
    struct UpdateDatum
    {
        std::string name; ///< Metric name, e.g. "Value loss"
        float value;
    };

    /**
     * @brief Interface of an on-policy algorithm trained from per-agent experience.
     *
     * The update consumes the trajectory of one agent. Agents that share the policy
     * are updated one after the other as their trajectories fill up.
     */
    class Algorithms
    {
    public:
        virtual ~Algorithms() = 0;

        /**
         * @brief Runs one optimisation cycle on the experience of `agent`.
         *
         * @param buffer Experience of every agent
         * @param agent Agent whose trajectory is consumed
         * @return Metrics of the update
         */
        virtual std::vector<UpdateDatum> update(ExperienceBuffer &buffer, int agent) = 0;
    };
    inline Algorithms::~Algorithms() {}
}

#endif //PSPPO_ALGORITHM_HPP
