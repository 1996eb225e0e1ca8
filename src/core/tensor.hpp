/**
 * @file    tensor.hpp
 * @brief   Minimal dense float tensor exchanged with neural backends
 * @author  AllenK (Kwyshell)
 * @date    2026.09.03
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <utility>
#include <vector>

namespace wit {

/**
 * Row-major float tensor (NCHW for images)
 */
struct Tensor {
    std::vector<int64_t> shape;
    std::vector<float> data;

    Tensor() = default;
    explicit Tensor(std::vector<int64_t> dims)
        : shape(std::move(dims)), data(static_cast<size_t>(element_count(shape)), 0.0f) {}

    static int64_t element_count(const std::vector<int64_t>& dims) {
        if (dims.empty()) return 0;
        return std::accumulate(dims.begin(), dims.end(), int64_t{1},
                               [](int64_t a, int64_t b) { return a * b; });
    }

    bool empty() const noexcept { return data.empty(); }

    // Dimension from the end: dim(-1) is width for NCHW
    int64_t dim(int index) const {
        if (index < 0) index += static_cast<int>(shape.size());
        return shape.at(static_cast<size_t>(index));
    }
};

}  // namespace wit
