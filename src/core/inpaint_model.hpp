/**
 * @file    inpaint_model.hpp
 * @brief   Fixed-size neural inpainting model interface
 * @author  AllenK (Kwyshell)
 * @date    2026.09.10
 * @license MIT
 */

#pragma once

#include "core/tensor.hpp"

namespace wit {

/**
 * A loaded model maps (1x3xSxS image, 1x1xSxS mask) to a 1x3xSxS image.
 *
 * Instances are shared read-only between requests; infer() must be safe to
 * call concurrently.
 */
class InpaintModel {
public:
    virtual ~InpaintModel() = default;

    virtual bool is_loaded() const noexcept = 0;

    // Spatial input size S
    virtual int input_size() const noexcept = 0;

    // Throws on inference failure
    virtual Tensor infer(const Tensor& image, const Tensor& mask) const = 0;
};

}  // namespace wit
