//
// Created by moinshaikh on 1/28/26.
//

#pragma once
#include"Algorithms/Algorithm.hpp"
#include"Algorithms/PPO.hpp"

#include"AdvantageEstimator.hpp"
#include"ConfigurationError.hpp"

#include"Distribution/Categorical.hpp"
#include"Distribution/Distribution.hpp"

#include"ExperienceBuffer.hpp"

#include"Model/modelUtils.hpp"
#include"Model/NetworkBuilder.hpp"
#include"Model/policy.hpp"

#include"TrainingParameters.hpp"
