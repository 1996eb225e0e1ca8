/**
 * @file    onnx_inpaint_model.cpp
 * @brief   ONNX Runtime Inpaint Model Implementation
 * @author  AllenK (Kwyshell)
 * @date    2026.09.21
 * @license MIT
 */

#include "backend/onnx_inpaint_model.hpp"
#include "utils/path_formatter.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace wit {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool has_provider(const std::vector<std::string>& available, const char* name) {
    return std::find(available.begin(), available.end(), name) != available.end();
}

}  // namespace

OnnxInpaintModel::OnnxInpaintModel(int default_input_size)
    : env_(ORT_LOGGING_LEVEL_WARNING, "wit-inpaint")
    , input_size_(default_input_size) {}

OnnxInpaintModel::~OnnxInpaintModel() = default;

bool OnnxInpaintModel::load(const std::filesystem::path& model_path) {
    if (!std::filesystem::exists(model_path)) {
        spdlog::warn("Model file not found: {}", model_path);
        return false;
    }

    try {
        Ort::SessionOptions options;
        options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        providers_.clear();
        const std::vector<std::string> available = Ort::GetAvailableProviders();
        if (has_provider(available, "CUDAExecutionProvider")) {
            OrtCUDAProviderOptions cuda_options{};
            options.AppendExecutionProvider_CUDA(cuda_options);
            providers_.emplace_back("CUDAExecutionProvider");
            spdlog::info("CUDA execution provider enabled");
        }
        providers_.emplace_back("CPUExecutionProvider");

        auto session = std::make_unique<Ort::Session>(env_, model_path.c_str(), options);

        Ort::AllocatorWithDefaultOptions allocator;
        std::vector<std::string> names;
        std::vector<bool> is_mask;
        const size_t input_count = session->GetInputCount();
        for (size_t i = 0; i < input_count; ++i) {
            Ort::AllocatedStringPtr name = session->GetInputNameAllocated(i, allocator);
            names.emplace_back(name.get());
            is_mask.push_back(to_lower(names.back()).find("mask") != std::string::npos);

            // Static spatial dims override the configured size
            auto shape = session->GetInputTypeInfo(i).GetTensorTypeAndShapeInfo().GetShape();
            if (shape.size() == 4 && shape[2] > 0 && shape[2] == shape[3]) {
                input_size_ = static_cast<int>(shape[2]);
            }
        }
        if (session->GetOutputCount() == 0) {
            throw std::runtime_error("Model has no outputs");
        }
        Ort::AllocatedStringPtr out_name = session->GetOutputNameAllocated(0, allocator);

        input_names_ = std::move(names);
        input_is_mask_ = std::move(is_mask);
        output_name_ = out_name.get();
        session_ = std::move(session);

        spdlog::info("Loaded inpaint model: {} (input {}x{}, {} inputs)",
                     model_path.filename(), input_size_, input_size_, input_names_.size());
        return true;

    } catch (const Ort::Exception& e) {
        spdlog::error("Failed to load model {}: {}", model_path, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Failed to load model {}: {}", model_path, e.what());
    }
    session_.reset();
    return false;
}

Tensor OnnxInpaintModel::infer(const Tensor& image, const Tensor& mask) const {
    if (!session_) {
        throw std::runtime_error("Inpaint model not loaded");
    }

    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    // ORT wants mutable buffers; inputs are never written
    std::vector<float> image_data = image.data;
    std::vector<float> mask_data = mask.data;

    std::vector<Ort::Value> inputs;
    std::vector<const char*> input_names;
    inputs.reserve(input_names_.size());
    for (size_t i = 0; i < input_names_.size(); ++i) {
        const bool is_mask = input_is_mask_[i];
        std::vector<float>& data = is_mask ? mask_data : image_data;
        const std::vector<int64_t>& shape = is_mask ? mask.shape : image.shape;
        inputs.push_back(Ort::Value::CreateTensor<float>(
            memory_info, data.data(), data.size(), shape.data(), shape.size()));
        input_names.push_back(input_names_[i].c_str());
    }

    const char* output_names[] = {output_name_.c_str()};
    std::vector<Ort::Value> outputs = session_->Run(
        Ort::RunOptions{nullptr},
        input_names.data(), inputs.data(), inputs.size(),
        output_names, 1);

    if (outputs.empty() || !outputs[0].IsTensor()) {
        throw std::runtime_error("Model returned no tensor output");
    }

    auto info = outputs[0].GetTensorTypeAndShapeInfo();
    Tensor result;
    result.shape = info.GetShape();
    const size_t count = info.GetElementCount();
    result.data.resize(count);

    switch (info.GetElementType()) {
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT: {
            const float* src = outputs[0].GetTensorData<float>();
            std::copy(src, src + count, result.data.begin());
            break;
        }
        case ONNX_TENSOR_ELEMENT_DATA_TYPE_UINT8: {
            const uint8_t* src = outputs[0].GetTensorData<uint8_t>();
            std::transform(src, src + count, result.data.begin(),
                           [](uint8_t v) { return static_cast<float>(v); });
            break;
        }
        default:
            throw std::runtime_error("Unsupported model output element type");
    }
    return result;
}

}  // namespace wit
