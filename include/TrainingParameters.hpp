//
// Created by moinshaikh on 2/11/26.
//

#ifndef PSPPO_TRAININGPARAMETERS_HPP
#define PSPPO_TRAININGPARAMETERS_HPP

#include<optional>
#include<string>

namespace PsPpo
{
    /**
     * @brief Hyperparameters shared by the policy networks and the PPO trainer.
     *
     * A plain aggregate: callers fill in the fields they care about and leave the rest
     * at their defaults. Nothing here is validated on assignment; the components that
     * consume a field validate it when they are constructed and raise
     * ConfigurationError on bad values.
     */
    struct TrainingParameters
    {
        // Network
        std::string activation = "Tanh";      ///< "ReLU" or "Tanh"
        int actorMlpDepth = 2;                ///< Linear layers in the actor, output layer included
        int actorMlpWidth = 128;
        int criticMlpDepth = 2;               ///< Linear layers in the critic, output layer included
        int criticMlpWidth = 128;
        float lastActorLayerScaling = 0.01;   ///< Keeps the initial policy close to uniform
        float lastCriticLayerScaling = 1.0;
        bool shared = false;                  ///< Actor reuses the critic's hidden layers
        std::string loadModelPath;            ///< Restored at construction when not empty

        // Optimisation
        float learningRate = 1e-3;
        float adamEpsilon = 1e-5;
        float discountFactor = 0.99;
        float lambda = 0.95;
        int epochs = 3;
        int batchSize = 32;
        float clipParam = 0.2;
        std::optional<float> maxGradNorm = 0.5f;
        float valueLossCoefficient = 0.5;
        float entropyCoefficient = 0.01;
        std::string advantageEstimator = "gae"; ///< "gae" or "n-steps"

        // Experience
        int horizon = 128;                    ///< Steps per agent between two updates

        bool useCuda = false;
    };
}

#endif //PSPPO_TRAININGPARAMETERS_HPP
