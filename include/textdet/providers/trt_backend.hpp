#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <memory>
#include <string>
#include <vector>

// CUDA includes
#include <cuda_runtime.h>

// TensorRT includes
#include <NvInfer.h>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/inference_backend.hpp"

#define CUDA_CHECK(call) \
  do { \
    cudaError_t status__ = (call); \
    if (status__ != cudaSuccess) { \
      throw textdet::InferenceError(std::string("CUDA error at ") + __FILE__ + ":" + \
        std::to_string(__LINE__) + ": " + cudaGetErrorString(status__)); \
    } \
  } while (0)


namespace textdet
{
// TensorRT Logger with configurable severity
class TrtLogger : public nvinfer1::ILogger
{
public:
  explicit TrtLogger(Severity min_severity = Severity::kWARNING)
  : min_severity_(min_severity) {}

  void log(Severity severity, const char * msg) noexcept override;

private:
  Severity min_severity_;
};

// Text detection network running on TensorRT
class TrtBackend : public InferenceBackend
{
public:
  struct Config
  {
    /**
     * @brief Smallest input height/width of the optimization profile
     */
    int min_side;

    /**
     * @brief Input height/width TensorRT tunes kernels for
     */
    int opt_side;

    /**
     * @brief Largest input height/width of the optimization profile
     * @details Inputs beyond this fail with InferenceError. Covers the
     *          default max_side_len once aligned.
     */
    int max_side;

    /**
     * @brief Build the engine with FP16 kernels when the GPU supports them
     */
    bool fp16;

    /**
     * @brief Workspace memory pool limit in bytes for engine building
     */
    size_t workspace_size;

    /**
     * @brief Number of warmup iterations after loading
     * @details The first enqueue initializes CUDA kernels and lazily
     *          allocated GPU resources. Set to 0 to disable warmup.
     */
    int warmup_iterations;

    /**
     * @brief Log level for TensorRT messages
     * @details This controls the verbosity of TensorRT logging.
     */
    TrtLogger::Severity log_level;

    /**
     * @brief Default constructor
     * @details Initializes the configuration with default values.
     */
    Config()
    : min_side(32), opt_side(1024), max_side(2048), fp16(true),
      workspace_size(1ULL << 30), warmup_iterations(1),
      log_level(TrtLogger::Severity::kWARNING) {}
  };

  /**
   * @brief Load the engine cache or build an engine from the ONNX graph
   * @throws BackendLoadError on any failure, with all resources released
   */
  explicit TrtBackend(const ModelArtifact & artifact, const Config & config = Config());

  ~TrtBackend() override;

  // Disable copy and move semantics - use std::unique_ptr for ownership transfer
  TrtBackend(const TrtBackend &) = delete;
  TrtBackend & operator=(const TrtBackend &) = delete;
  TrtBackend(TrtBackend &&) = delete;
  TrtBackend & operator=(TrtBackend &&) = delete;

  BackendOutputs run(const Tensor & input) override;

  std::string provider_name() const override { return "tensorrt"; }

private:
  // Initialization methods
  void initialize_engine();
  void find_tensor_names();
  void initialize_memory();
  void initialize_streams();
  void warmup_engine();

  // Memory management
  void cleanup() noexcept;
  void ensure_capacity(void ** buffer, size_t & capacity, size_t bytes);

  // Helper methods
  std::vector<uint8_t> load_engine_file(const std::string & engine_path) const;
  std::vector<uint8_t> build_engine_from_onnx() const;
  void save_engine_file(const std::string & engine_path, const std::vector<uint8_t> & data) const;
  Tensor read_output(const std::string & name, void * device_buffer);

private:
  // Configuration
  ModelArtifact artifact_;
  Config config_;

  // TensorRT objects
  std::unique_ptr<TrtLogger> logger_;
  std::unique_ptr<nvinfer1::IRuntime> runtime_;
  std::unique_ptr<nvinfer1::ICudaEngine> engine_;
  std::unique_ptr<nvinfer1::IExecutionContext> context_;

  // Tensor information
  std::string input_name_;
  std::string probability_name_;
  std::string mask_name_;

  // Memory buffers, grown on demand and reused across calls
  struct MemoryBuffers
  {
    void * device_input;
    void * device_probability;
    void * device_mask;
    size_t input_capacity;
    size_t probability_capacity;
    size_t mask_capacity;

    MemoryBuffers()
    : device_input(nullptr), device_probability(nullptr), device_mask(nullptr),
      input_capacity(0), probability_capacity(0), mask_capacity(0) {}
  } buffers_;

  // CUDA stream
  cudaStream_t stream_;
};

// Provider "tensorrt"
class TrtProvider : public ExecutionProvider
{
public:
  explicit TrtProvider(const TrtBackend::Config & config = TrtBackend::Config())
  : config_(config) {}

  std::string name() const override { return "tensorrt"; }

  std::unique_ptr<InferenceBackend> create_backend(const ModelArtifact & artifact) const override;

private:
  TrtBackend::Config config_;
};

} // namespace textdet
