//
// Policy base and the shared owner that serialises updates.
//

#include<atomic>
#include<chrono>
#include<stdexcept>
#include<thread>

#include"../../include/Model/PolicyModel.hpp"

#include<doctest/doctest.h>

namespace Glimpse
{
    torch::Device PolicyModel::getDevice() const
    {
        auto parameters = this->parameters();
        if (parameters.empty())
        {
            return torch::kCPU;
        }
        return parameters.front().device();
    }

    SharedPolicy::SharedPolicy(std::shared_ptr<PolicyModel> model) : model(std::move(model))
    {
        if (!this->model)
        {
            throw std::invalid_argument("SharedPolicy requires a policy model");
        }
    }

    std::unique_lock<std::mutex> SharedPolicy::acquire()
    {
        return std::unique_lock<std::mutex>(updateMutex);
    }

    /**
     * @brief Policy that scores every token uniformly, for exercising the seam
     */
    class UniformPolicy : public PolicyModel
    {
    public:
        torch::Tensor forward(const TokenizedDialogue &dialogue) override
        {
            return torch::zeros({dialogue.size(), 4});
        }
    };

    TEST_CASE("SharedPolicy")
    {
        SUBCASE("A null model is rejected")
        {
            CHECK_THROWS_AS(SharedPolicy(nullptr), std::invalid_argument);
        }

        SUBCASE("A parameterless policy lives on the CPU")
        {
            SharedPolicy policy(std::make_shared<UniformPolicy>());
            CHECK(policy->getDevice().is_cpu());
        }

        SUBCASE("acquire() serializes access between threads")
        {
            SharedPolicy policy(std::make_shared<UniformPolicy>());
            std::atomic<bool> entered{false};

            auto lock = policy.acquire();
            std::thread other([&policy, &entered]()
                              {
                                  auto guard = policy.acquire();
                                  entered = true;
                              });
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            CHECK_FALSE(entered.load());

            lock.unlock();
            other.join();
            CHECK(entered.load());
        }
    }
}
