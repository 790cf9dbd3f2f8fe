#pragma once

#ifndef GLIMPSERL_POLICYMODEL_HPP
#define GLIMPSERL_POLICYMODEL_HPP

#include<memory>
#include<mutex>

#include<torch/torch.h>
#include<torch/nn.h>

#include"../Dialogue.hpp"

namespace Glimpse
{
    /**
     * @brief Base class for policies that read a tokenized dialogue and predict its next tokens
     *
     * Concrete policies decide how frames and tokens are embedded; the
     * trainers only rely on forward() producing one row of vocabulary logits
     * per input token, where row t scores token t + 1.
     */
    class PolicyModel : public torch::nn::Module
    {
    public:
        /**
         * @brief Scores every next token of the dialogue
         *
         * @param dialogue Tokenized dialogue; its frames line up with its image positions
         * @return Logits tensor [T, V] on the policy's device
         */
        virtual torch::Tensor forward(const TokenizedDialogue &dialogue) = 0;

        /**
         * @brief Device holding the parameters, CPU for a parameterless policy
         */
        torch::Device getDevice() const;
    };

    /**
     * @brief Exclusive owner of the policy parameters shared by all trainers
     *
     * Trainers keep a reference to this object, never a copy of the model.
     * Each training call holds the lock returned by acquire() from start to
     * finish, so gradient accumulation and the optimizer step of two calls
     * can never interleave on the same parameters.
     */
    class SharedPolicy
    {
    private:
        std::shared_ptr<PolicyModel> model;
        std::mutex updateMutex;

    public:
        /**
         * @throws std::invalid_argument if `model` is null
         */
        explicit SharedPolicy(std::shared_ptr<PolicyModel> model);

        SharedPolicy(const SharedPolicy &) = delete;
        SharedPolicy &operator=(const SharedPolicy &) = delete;

        inline PolicyModel &get()
        {
            return *model;
        }

        inline PolicyModel *operator->()
        {
            return model.get();
        }

        /**
         * @brief Blocks until no other training call is using the parameters
         */
        std::unique_lock<std::mutex> acquire();
    };
}

#endif //GLIMPSERL_POLICYMODEL_HPP
