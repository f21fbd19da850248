#pragma once
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "agents.hpp"

// Runs a policy network exported to ONNX. Input is Observation::features()
// as a [1, featureSize] float tensor; output is one logit per mask entry.
class OnnxAgent : public Agent {
public:
    OnnxAgent(std::string name, const std::string& onnxPath, bool stochastic = true, uint32_t seed = 0)
    : Agent(std::move(name)),
      env(ORT_LOGGING_LEVEL_WARNING, "generals"),
      stochastic(stochastic), seed(seed), rng(seed)
    {
        Ort::SessionOptions opt;
        opt.SetIntraOpNumThreads(1);
        opt.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
        session = Ort::Session(env, onnxPath.c_str(), opt);

        allocator = Ort::AllocatorWithDefaultOptions();
        inputName  = session.GetInputNameAllocated(0, allocator).get();
        outputName = session.GetOutputNameAllocated(0, allocator).get();
    }

    void reset() override { rng.seed(seed); }

    Action play(const Observation& obs) override {
        std::vector<float> x = obs.features();
        const int actDim = (int)obs.actionMask.size();

        std::vector<int64_t> shape{1, (int64_t)x.size()};
        Ort::MemoryInfo mem = Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU);
        Ort::Value in = Ort::Value::CreateTensor<float>(
            mem, x.data(), x.size(),
            shape.data(), shape.size()
        );

        const char* inNames[] = { inputName.c_str() };
        const char* outNames[] = { outputName.c_str() };

        auto outs = session.Run(Ort::RunOptions{nullptr}, inNames, &in, 1, outNames, 1);
        size_t produced = outs[0].GetTensorTypeAndShapeInfo().GetElementCount();
        if((int)produced != actDim)
            throw std::runtime_error("policy produced " + std::to_string(produced) + " logits, expected "
                                     + std::to_string(actDim));
        const float* logits = outs[0].GetTensorData<float>();

        std::vector<double> probs(actDim, 0.0);
        double maxLogit = -1e100;
        for(int i=0;i<actDim;i++) if(obs.actionMask[i]) maxLogit = std::max(maxLogit, (double)logits[i]);

        double sum = 0.0;
        for(int i=0;i<actDim;i++){
            if(!obs.actionMask[i]) continue;
            double e = std::exp((double)logits[i] - maxLogit);
            probs[i] = e;
            sum += e;
        }
        if(sum <= 0.0) return Action::idle();

        for(double& p : probs) p /= sum;

        int choice;
        if(!stochastic){
            choice = (int)std::distance(probs.begin(), std::max_element(probs.begin(), probs.end()));
        } else {
            std::discrete_distribution<int> dist(probs.begin(), probs.end());
            choice = dist(rng);
        }
        return decodeAction(choice, obs.cols);
    }

private:
    Ort::Env env;
    Ort::Session session{nullptr};
    Ort::AllocatorWithDefaultOptions allocator;
    std::string inputName, outputName;
    bool stochastic;
    uint32_t seed;
    std::mt19937 rng;
};
