//
// Created by moinshaikh on 1/30/26.
//


#include<c10/util/ArrayRef.h>
#include<torch/torch.h>
#include<doctest/doctest.h>

#include"../../include/Distribution/Categorical.hpp"


namespace PsPpo
{
    /**
     * @brief Constructs a Categorical distribution from probabilities or logits.
     *
     * @details
     * - If `probs` are provided they are normalised to sum to 1 along the last
     *   dimension and clamped away from 0 and 1; masked entries are then forced to
     *   exactly 0 and `logits` is log(probs).
     * - If `logits` are provided, masked entries are replaced with maskedLogit and the
     *   logits are normalised with log-sum-exp; `probs` is their softmax.
     *
     * In both cases the normalised log probability of a masked entry is exactly
     * maskedLogit. It stays finite, so a forced masked action has the same log
     * probability under every parameter set and its probability ratio is exactly 1.
     *
     * @param probs Pointer to a tensor of probabilities. Can be nullptr.
     * @param logits Pointer to a tensor of logits. Can be nullptr.
     * @param mask Optional pointer to a bool tensor of legal events.
     * @throws std::runtime_error If both or neither of `probs` and `logits` are provided.
     * @throws std::runtime_error If the input tensor has fewer than 1 dimension.
     */
    Categorical::Categorical(const torch::Tensor *probs,
                             const torch::Tensor *logits,
                             const torch::Tensor *mask)
    {
        if ((probs == nullptr) == (logits == nullptr))
        {
            throw std::runtime_error("Exactly one of probs and logits must be provided");
        }
        if (probs != nullptr)
        {
            if (probs->dim() < 1)
            {
                throw std::runtime_error("At least one dimension is required for probs");
            }
            this->probs = *probs / probs->sum(-1, true);
            this->probs = this->probs.clamp(1.21e-7, 1. - 1.21e-7);
            if (mask != nullptr)
            {
                this->probs = torch::where(*mask, this->probs, torch::zeros_like(this->probs));
                this->probs = this->probs / this->probs.sum(-1, true);
            }
            this->logits = torch::log(this->probs);
            if (mask != nullptr)
            {
                this->logits = this->logits.masked_fill(mask->logical_not(), maskedLogit);
            }
        }
        else
        {
            if (logits->dim() < 1)
            {
                throw std::runtime_error("At least one dimension is required for logits");
            }
            auto masked = *logits;
            if (mask != nullptr)
            {
                masked = logits->masked_fill(mask->logical_not(), maskedLogit);
            }
            this->logits = masked - masked.logsumexp(-1, true);
            if (mask != nullptr)
            {
                this->logits = this->logits.masked_fill(mask->logical_not(), maskedLogit);
            }
            this->probs = torch::softmax(this->logits, -1);
        }
        param = probs != nullptr ? *probs : *logits;
        numEvents = param.size(-1);
        batch_shape = param.sizes().vec();
        batch_shape.resize(batch_shape.size() - 1);
    }

    /**
     * @brief Entropy as -sum(p * log(p)) over the events.
     *
     * Masked events have p = 0 and a finite log(p), so they contribute an exact zero.
     */
    torch::Tensor Categorical::entropy()
    {
        auto pLogP = logits * probs;
        return -pLogP.sum(-1);
    }

    torch::Tensor Categorical::logProbability(torch::Tensor value)
    {
        value = value.to(torch::kLong).unsqueeze(-1);
        auto broadcastedTensors = torch::broadcast_tensors({value, logits});
        value = broadcastedTensors[0];
        value = value.narrow(-1, 0, 1);
        return broadcastedTensors[1].gather(-1, value).squeeze(-1);
    }

    /**
     * @brief Samples from the categorical distribution with torch::multinomial.
     *
     * The probabilities are expanded to the requested sample shape and flattened to
     * 2D for sampling, then reshaped to [sampleShape, batch_shape].
     */
    torch::Tensor Categorical::sample(c10::ArrayRef<int64_t> sampleShape)
    {
        auto extrSampleShape = extendedShape(sampleShape);
        auto paramShape = extrSampleShape;
        paramShape.insert(paramShape.end(), {numEvents});

        torch::Tensor probs_expanded = probs;
        for (size_t i = 0; i < sampleShape.size(); ++i) {
            probs_expanded = probs_expanded.unsqueeze(0);
        }

        auto expProbability = probs_expanded.expand(paramShape);
        auto probs2D = expProbability.contiguous().view({-1, numEvents});
        auto sample2D = torch::multinomial(probs2D, 1, true);
        return sample2D.contiguous().view(extrSampleShape);
    }

    TEST_CASE("Categorical")
    {
        SUBCASE("Throws when provided both probs and logits")
        {
            auto tensor = torch::Tensor();
            CHECK_THROWS(Categorical(&tensor, &tensor));
        }

        SUBCASE("Throws when provided neither probs nor logits")
        {
            CHECK_THROWS(Categorical(nullptr, nullptr));
        }

        SUBCASE("Sampled numbers are in the right range")
        {
            float probabilities[] = {0.2, 0.2, 0.2, 0.2, 0.2};
            auto probabilities_tensor = torch::from_blob(probabilities, {5});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            auto output = dist.sample({100});
            CHECK(!(output > 4).any().item().toInt());
            CHECK(!(output < 0).any().item().toInt());
        }

        SUBCASE("Sampled tensors are of the right shape")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            CHECK(dist.sample().sizes().vec() == std::vector<int64_t>{2});
            CHECK(dist.sample({20}).sizes().vec() == std::vector<int64_t>{20, 2});
            CHECK(dist.sample({10, 5}).sizes().vec() == std::vector<int64_t>{10, 5, 2});
        }

        SUBCASE("entropy()")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            auto entropies = dist.entropy();

            CHECK(entropies.sizes().vec() == std::vector<int64_t>{2});
            CHECK(entropies[0].item().toDouble() == doctest::Approx(0.6931).epsilon(1e-3));
            CHECK(entropies[1].item().toDouble() == doctest::Approx(1.3863).epsilon(1e-3));
        }

        SUBCASE("logProbability()")
        {
            float probabilities[2][4] = {{0.5, 0.5, 0.0, 0.0},
                                         {0.25, 0.25, 0.25, 0.25}};
            auto probabilities_tensor = torch::from_blob(probabilities, {2, 4});
            auto dist = Categorical(&probabilities_tensor, nullptr);

            float actions[2] = {1, 3};
            auto actions_tensor = torch::from_blob(actions, {2});
            auto log_probs = dist.logProbability(actions_tensor);

            INFO(log_probs << "\n");
            CHECK(log_probs.sizes().vec() == std::vector<int64_t>{2});
            CHECK(log_probs[0].item().toDouble() == doctest::Approx(-0.6931).epsilon(1e-3));
            CHECK(log_probs[1].item().toDouble() == doctest::Approx(-1.3863).epsilon(1e-3));
        }
    }

    TEST_CASE("Categorical with an action mask")
    {
        auto logits = torch::tensor({1.5f, -0.3f, 0.8f, 2.0f});

        SUBCASE("Masked actions get exactly zero probability")
        {
            auto mask = torch::tensor({true, false, true, false});
            auto dist = Categorical(nullptr, &logits, &mask);
            auto probs = dist.getProbability();

            CHECK(probs[1].item().toDouble() == 0);
            CHECK(probs[3].item().toDouble() == 0);
            CHECK(probs.sum().item().toDouble() == doctest::Approx(1));
            CHECK(dist.logProbability(torch::tensor(1)).item().toFloat() == Categorical::maskedLogit);
        }

        SUBCASE("A single legal action is always sampled")
        {
            auto mask = torch::tensor({false, false, true, false});
            auto dist = Categorical(nullptr, &logits, &mask);

            auto samples = dist.sample({200});
            CHECK((samples == 2).all().item().toBool());
            CHECK(dist.logProbability(torch::tensor(2)).item().toDouble() == doctest::Approx(0));
        }

        SUBCASE("Forced masked actions keep the same finite log probability")
        {
            auto mask = torch::tensor({false, true, true, true});
            auto trainable = logits.clone().requires_grad_(true);
            auto shifted = logits * 3 + 1;
            auto current = Categorical(nullptr, &trainable, &mask);
            auto behaviour = Categorical(nullptr, &shifted, &mask);

            auto forced = torch::tensor(0);
            auto ratio = torch::exp(current.logProbability(forced) - behaviour.logProbability(forced));
            CHECK(ratio.item().toFloat() == 1);

            ratio.backward();
            CHECK(torch::isfinite(trainable.grad()).all().item().toBool());
        }

        SUBCASE("Entropy ignores masked actions")
        {
            auto mask = torch::tensor({true, false, true, false});
            auto dist = Categorical(nullptr, &logits, &mask);

            auto reference_logits = torch::tensor({1.5f, 0.8f});
            auto reference = Categorical(nullptr, &reference_logits);

            CHECK(dist.entropy().item().toDouble() ==
                  doctest::Approx(reference.entropy().item().toDouble()));
        }

        SUBCASE("Gradients stay finite through masked entries")
        {
            auto trainable = logits.clone().requires_grad_(true);
            auto mask = torch::tensor({true, false, false, false});
            auto dist = Categorical(nullptr, &trainable, &mask);

            auto loss = dist.entropy() + dist.logProbability(torch::tensor(0));
            loss.backward();

            CHECK(dist.entropy().item().toDouble() == doctest::Approx(0));
            CHECK(torch::isfinite(trainable.grad()).all().item().toBool());
        }

        SUBCASE("Batched masks apply per row")
        {
            auto batched = logits.repeat({2, 1});
            auto mask = torch::tensor({true, true, false, false,
                                       false, false, true, true}).view({2, 4});
            auto dist = Categorical(nullptr, &batched, &mask);
            auto probs = dist.getProbability();

            CHECK(probs[0].narrow(0, 2, 2).sum().item().toDouble() == 0);
            CHECK(probs[1].narrow(0, 0, 2).sum().item().toDouble() == 0);
            CHECK(probs.sum(-1)[1].item().toDouble() == doctest::Approx(1));
        }
    }
}
