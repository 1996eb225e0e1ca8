/**
 * @file    onnx_inpaint_model.hpp
 * @brief   LaMa-style inpainting model executed with ONNX Runtime
 * @author  AllenK (Kwyshell)
 * @date    2026.09.21
 * @license MIT
 *
 * @details
 * Load once at startup and share. Ort::Session::Run is safe for concurrent
 * calls, so infer() takes no lock.
 *
 * Input binding: any input whose name contains "mask" (case-insensitive)
 * receives the mask tensor, every other input the image tensor.
 */

#pragma once

#include "core/inpaint_model.hpp"

#include <onnxruntime_cxx_api.h>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace wit {

class OnnxInpaintModel : public InpaintModel {
public:
    /**
     * @param default_input_size  Used when the model declares dynamic H/W
     */
    explicit OnnxInpaintModel(int default_input_size = 512);
    ~OnnxInpaintModel() override;

    OnnxInpaintModel(const OnnxInpaintModel&) = delete;
    OnnxInpaintModel& operator=(const OnnxInpaintModel&) = delete;

    /**
     * Create the session; returns false (and logs) on any failure
     */
    bool load(const std::filesystem::path& model_path);

    bool is_loaded() const noexcept override { return session_ != nullptr; }
    int input_size() const noexcept override { return input_size_; }

    Tensor infer(const Tensor& image, const Tensor& mask) const override;

    const std::vector<std::string>& providers() const noexcept { return providers_; }

private:
    Ort::Env env_;
    std::unique_ptr<Ort::Session> session_;
    std::vector<std::string> input_names_;
    std::vector<bool> input_is_mask_;
    std::string output_name_;
    std::vector<std::string> providers_;
    int input_size_;
};

}  // namespace wit
