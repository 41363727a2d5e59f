#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <cstddef>
#include <cstdint>
#include <vector>


namespace textdet
{
/**
 * @brief Dense float tensor in row-major NCHW layout
 */
struct Tensor
{
  std::vector<int64_t> shape;
  std::vector<float> data;

  // Product of the shape dimensions, 0 for an empty shape
  size_t element_count() const noexcept
  {
    if (shape.empty()) {
      return 0;
    }
    size_t count = 1;
    for (auto dim : shape) {
      count *= static_cast<size_t>(dim > 0 ? dim : 0);
    }
    return count;
  }

  bool empty() const noexcept { return data.empty(); }
};

/**
 * @brief Raw outputs of one network invocation
 * @details probability is the per-pixel text score map (logits or
 *          probabilities depending on the model), shaped [1, 1, H, W] or
 *          [1, H, W]. mask is the optional auxiliary mask output, empty
 *          when the model has none.
 */
struct BackendOutputs
{
  Tensor probability;
  Tensor mask;
};

} // namespace textdet
