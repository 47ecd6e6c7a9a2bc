#include "voice_service/vad/model.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <stdexcept>

#ifdef VOICE_SERVICE_HAS_ONNX
#include <onnxruntime_cxx_api.h>
#endif

namespace voice_service {
namespace vad {

bool VadModel::supports_sampling_rate(int sampling_rate) {
    return sampling_rate == 16000 || sampling_rate == 8000;
}

int VadModel::window_size(int sampling_rate) {
    return sampling_rate == 8000 ? 256 : 512;
}

#ifdef VOICE_SERVICE_HAS_ONNX

namespace {

constexpr int64_t kStateSize = 2 * 1 * 128;

Ort::Env& ort_env() {
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "voice_service_vad");
    return env;
}

Ort::SessionOptions make_session_options() {
    Ort::SessionOptions options;
    options.SetIntraOpNumThreads(1);
    options.SetInterOpNumThreads(1);
    options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);
    return options;
}

std::vector<std::string> node_names(const Ort::Session& session, bool inputs) {
    Ort::AllocatorWithDefaultOptions allocator;
    const size_t count = inputs ? session.GetInputCount() : session.GetOutputCount();
    std::vector<std::string> names;
    names.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        auto name = inputs ? session.GetInputNameAllocated(i, allocator)
                           : session.GetOutputNameAllocated(i, allocator);
        names.emplace_back(name ? name.get() : "");
    }
    return names;
}

bool has_name(const std::vector<std::string>& names, const std::string& needle) {
    return std::find(names.begin(), names.end(), needle) != names.end();
}

}

struct VadModel::Impl {
    Ort::Session session;
    std::vector<std::string> input_names;
    std::vector<std::string> output_names;
    bool has_sr;
    bool has_state;
    bool has_state_out;

    explicit Impl(const std::filesystem::path& model_path)
        : session(ort_env(), model_path.c_str(), make_session_options()),
          input_names(node_names(session, true)),
          output_names(node_names(session, false)),
          has_sr(has_name(input_names, "sr")),
          has_state(has_name(input_names, "state")),
          has_state_out(has_name(output_names, "stateN")) {
        if (!has_name(input_names, "input")) {
            throw std::runtime_error("VAD model missing input node 'input'");
        }
        if (!has_name(output_names, "output")) {
            throw std::runtime_error("VAD model missing output node 'output'");
        }
    }
};

VadModel::VadModel(const std::filesystem::path& model_path)
    : impl_(std::make_unique<Impl>(model_path)) {}

VadModel::~VadModel() = default;

std::vector<float> VadModel::initialize_state() const {
    if (!impl_->has_state) {
        return {};
    }
    return std::vector<float>(kStateSize, 0.0f);
}

float VadModel::get_speech_prob(const std::vector<float>& window,
                                int sampling_rate,
                                std::vector<float>* state) const {
    if (window.empty()) {
        return 0.0f;
    }

    Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(
        OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<int64_t> input_shape{1, static_cast<int64_t>(window.size())};
    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;
    inputs.reserve(3);
    input_names.reserve(3);
    input_names.push_back("input");
    inputs.emplace_back(Ort::Value::CreateTensor<float>(
        mem_info, const_cast<float*>(window.data()),
        window.size(), input_shape.data(), input_shape.size()));

    std::vector<int64_t> state_shape{2, 1, 128};
    std::vector<float> local_state;
    if (impl_->has_state) {
        if (state && static_cast<int64_t>(state->size()) == kStateSize) {
            local_state = *state;
        } else {
            local_state = initialize_state();
        }
        input_names.push_back("state");
        inputs.emplace_back(Ort::Value::CreateTensor<float>(
            mem_info, local_state.data(), local_state.size(),
            state_shape.data(), state_shape.size()));
    }

    std::vector<int64_t> sr_shape{1};
    std::array<int64_t, 1> sr_value{sampling_rate};
    if (impl_->has_sr) {
        input_names.push_back("sr");
        inputs.emplace_back(Ort::Value::CreateTensor<int64_t>(
            mem_info, sr_value.data(), sr_value.size(),
            sr_shape.data(), sr_shape.size()));
    }

    std::vector<const char*> output_names{"output"};
    if (impl_->has_state_out) {
        output_names.push_back("stateN");
    }

    auto outputs = impl_->session.Run(
        Ort::RunOptions{nullptr},
        input_names.data(), inputs.data(), inputs.size(),
        output_names.data(), output_names.size());

    if (outputs.empty() || !outputs[0].IsTensor()) {
        throw std::runtime_error("VAD model returned no probability tensor");
    }
    const auto* prob_data = outputs[0].GetTensorData<float>();
    if (!prob_data) {
        throw std::runtime_error("VAD model returned an empty probability tensor");
    }
    const float prob = prob_data[0];

    if (impl_->has_state_out && outputs.size() > 1 && outputs[1].IsTensor()) {
        const auto* data = outputs[1].GetTensorData<float>();
        const auto count = outputs[1].GetTensorTypeAndShapeInfo().GetElementCount();
        if (state && data && count > 0) {
            state->assign(data, data + count);
        }
    }

    return std::clamp(prob, 0.0f, 1.0f);
}

#else

struct VadModel::Impl {};

VadModel::VadModel(const std::filesystem::path&) {
    throw std::runtime_error("ONNX Runtime not enabled");
}

VadModel::~VadModel() = default;

std::vector<float> VadModel::initialize_state() const {
    return {};
}

float VadModel::get_speech_prob(const std::vector<float>&,
                                int,
                                std::vector<float>*) const {
    throw std::runtime_error("ONNX Runtime not enabled");
}

#endif

}
}
