#include <fstream>
#include <iostream>

// TensorRT includes
#include <NvOnnxParser.h>

// Local includes
#include "textdet/exception.hpp"
#include "textdet/providers/trt_backend.hpp"


namespace textdet
{

// Logger implementation
void TrtLogger::log(Severity severity, const char * msg) noexcept
{
  if (severity <= min_severity_) {
    const char * severity_str;
    switch (severity) {
      case Severity::kINTERNAL_ERROR: severity_str = "INTERNAL_ERROR"; break;
      case Severity::kERROR: severity_str = "ERROR"; break;
      case Severity::kWARNING: severity_str = "WARNING"; break;
      case Severity::kINFO: severity_str = "INFO"; break;
      case Severity::kVERBOSE: severity_str = "VERBOSE"; break;
      default: severity_str = "UNKNOWN"; break;
    }
    std::cerr << "[TensorRT " << severity_str << "] " << msg << std::endl;
  }
}

// TrtBackend implementation
TrtBackend::TrtBackend(const ModelArtifact & artifact, const Config & config)
: artifact_(artifact), config_(config), stream_(nullptr)
{
  try {
    initialize_engine();
    find_tensor_names();
    initialize_memory();
    initialize_streams();
    warmup_engine();
  } catch (const std::exception & e) {
    cleanup();
    throw BackendLoadError("TensorRT initialization failed: " + std::string(e.what()));
  }
}

TrtBackend::~TrtBackend()
{
  cleanup();
}

void TrtBackend::initialize_engine()
{
  // Initialize logger
  logger_ = std::make_unique<TrtLogger>(config_.log_level);

  std::vector<uint8_t> engine_data;
  const std::string & cache = artifact_.engine_cache_path;
  if (!cache.empty() && std::ifstream(cache).good()) {
    std::cout << "Loading TensorRT engine from " << cache << std::endl;
    engine_data = load_engine_file(cache);
  } else {
    engine_data = build_engine_from_onnx();
    if (!cache.empty()) {
      save_engine_file(cache, engine_data);
    }
  }

  runtime_ = std::unique_ptr<nvinfer1::IRuntime>(
    nvinfer1::createInferRuntime(*logger_));
  if (!runtime_) {
    throw BackendLoadError("Failed to create TensorRT runtime");
  }

  engine_ = std::unique_ptr<nvinfer1::ICudaEngine>(
    runtime_->deserializeCudaEngine(engine_data.data(), engine_data.size()));
  if (!engine_) {
    throw BackendLoadError("Failed to deserialize CUDA engine");
  }

  context_ = std::unique_ptr<nvinfer1::IExecutionContext>(
    engine_->createExecutionContext());
  if (!context_) {
    throw BackendLoadError("Failed to create execution context");
  }
}

std::vector<uint8_t> TrtBackend::load_engine_file(const std::string & engine_path) const
{
  std::ifstream file(engine_path, std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw BackendLoadError("Failed to open engine file: " + engine_path);
  }

  std::streamsize size = file.tellg();
  file.seekg(0, std::ios::beg);

  std::vector<uint8_t> buffer(size);
  if (!file.read(reinterpret_cast<char *>(buffer.data()), size)) {
    throw BackendLoadError("Failed to read engine file: " + engine_path);
  }

  return buffer;
}

std::vector<uint8_t> TrtBackend::build_engine_from_onnx() const
{
  if (artifact_.onnx_path.empty() || !std::ifstream(artifact_.onnx_path).good()) {
    throw BackendLoadError("ONNX model not found: " + artifact_.onnx_path);
  }
  std::cout << "Building TensorRT engine from " << artifact_.onnx_path
            << " (this can take a few minutes)" << std::endl;

  auto builder = std::unique_ptr<nvinfer1::IBuilder>(nvinfer1::createInferBuilder(*logger_));
  if (!builder) {
    throw BackendLoadError("Failed to create TensorRT builder");
  }

  auto network = std::unique_ptr<nvinfer1::INetworkDefinition>(builder->createNetworkV2(0));
  if (!network) {
    throw BackendLoadError("Failed to create TensorRT network");
  }

  auto parser = std::unique_ptr<nvonnxparser::IParser>(
    nvonnxparser::createParser(*network, *logger_));
  if (!parser ||
    !parser->parseFromFile(artifact_.onnx_path.c_str(),
    static_cast<int>(nvinfer1::ILogger::Severity::kWARNING)))
  {
    std::string reason;
    for (int32_t i = 0; parser && i < parser->getNbErrors(); ++i) {
      reason += std::string("\n  ") + parser->getError(i)->desc();
    }
    throw BackendLoadError("Failed to parse ONNX model " + artifact_.onnx_path + reason);
  }

  auto builder_config = std::unique_ptr<nvinfer1::IBuilderConfig>(builder->createBuilderConfig());
  if (!builder_config) {
    throw BackendLoadError("Failed to create TensorRT builder config");
  }
  builder_config->setMemoryPoolLimit(nvinfer1::MemoryPoolType::kWORKSPACE, config_.workspace_size);
  if (config_.fp16 && builder->platformHasFastFp16()) {
    builder_config->setFlag(nvinfer1::BuilderFlag::kFP16);
  }

  // Height and width are dynamic, batch and channels are fixed
  const char * input_name = network->getInput(0)->getName();
  nvinfer1::IOptimizationProfile * profile = builder->createOptimizationProfile();
  profile->setDimensions(input_name, nvinfer1::OptProfileSelector::kMIN,
    nvinfer1::Dims4{1, 3, config_.min_side, config_.min_side});
  profile->setDimensions(input_name, nvinfer1::OptProfileSelector::kOPT,
    nvinfer1::Dims4{1, 3, config_.opt_side, config_.opt_side});
  profile->setDimensions(input_name, nvinfer1::OptProfileSelector::kMAX,
    nvinfer1::Dims4{1, 3, config_.max_side, config_.max_side});
  builder_config->addOptimizationProfile(profile);

  auto serialized = std::unique_ptr<nvinfer1::IHostMemory>(
    builder->buildSerializedNetwork(*network, *builder_config));
  if (!serialized || serialized->size() == 0) {
    throw BackendLoadError("Failed to build TensorRT engine from " + artifact_.onnx_path);
  }

  const auto * begin = static_cast<const uint8_t *>(serialized->data());
  return std::vector<uint8_t>(begin, begin + serialized->size());
}

void TrtBackend::save_engine_file(
  const std::string & engine_path, const std::vector<uint8_t> & data) const
{
  std::ofstream file(engine_path, std::ios::binary);
  if (!file.write(reinterpret_cast<const char *>(data.data()), data.size())) {
    // A missing cache only costs a rebuild next time
    std::cerr << "Failed to write engine cache: " << engine_path << std::endl;
    return;
  }
  std::cout << "Saved TensorRT engine to " << engine_path << std::endl;
}

void TrtBackend::find_tensor_names()
{
  bool found_input = false;
  bool found_probability = false;

  for (int i = 0; i < engine_->getNbIOTensors(); ++i) {
    const char * tensor_name = engine_->getIOTensorName(i);
    nvinfer1::TensorIOMode mode = engine_->getTensorIOMode(tensor_name);

    if (mode == nvinfer1::TensorIOMode::kINPUT) {
      // Engines exported under another input name still have a single input
      if (!found_input || artifact_.input_name == tensor_name) {
        input_name_ = tensor_name;
        found_input = true;
      }
    } else if (mode == nvinfer1::TensorIOMode::kOUTPUT) {
      std::string name_str(tensor_name);
      if (name_str == artifact_.probability_output) {
        probability_name_ = name_str;
        found_probability = true;
      } else if (!artifact_.mask_output.empty() && name_str == artifact_.mask_output) {
        mask_name_ = name_str;
      }
    }
  }

  if (!found_input || !found_probability) {
    throw BackendLoadError("Engine is missing the input or the '" +
      artifact_.probability_output + "' output tensor");
  }
}

void TrtBackend::initialize_memory()
{
  // The input buffer covers the largest profile shape up front
  const size_t max_input = 3ULL * config_.max_side * config_.max_side * sizeof(float);
  ensure_capacity(&buffers_.device_input, buffers_.input_capacity, max_input);
}

void TrtBackend::initialize_streams()
{
  CUDA_CHECK(cudaStreamCreate(&stream_));
  if (!stream_) {
    throw BackendLoadError("Failed to create CUDA stream");
  }
}

void TrtBackend::warmup_engine()
{
  if (config_.warmup_iterations <= 0) {
    return;
  }

  Tensor input;
  input.shape = {1, 3, config_.min_side, config_.min_side};
  input.data.assign(input.element_count(), 0.0f);

  for (int i = 0; i < config_.warmup_iterations; ++i) {
    // Run inference pipeline once to initialize CUDA kernels
    run(input);
  }

  std::cout << "Engine warmed up with " << config_.warmup_iterations << " iterations" << std::endl;
}

void TrtBackend::cleanup() noexcept
{
  // Free device memory
  if (buffers_.device_input) {
    cudaFree(buffers_.device_input);
  }

  if (buffers_.device_probability) {
    cudaFree(buffers_.device_probability);
  }

  if (buffers_.device_mask) {
    cudaFree(buffers_.device_mask);
  }

  // Reset all pointers to nullptr
  buffers_ = MemoryBuffers{};

  // Destroy streams safely
  if (stream_) {
    cudaStreamDestroy(stream_);
    stream_ = nullptr;
  }

  // Execution context before engine before runtime
  context_.reset();
  engine_.reset();
  runtime_.reset();
}

void TrtBackend::ensure_capacity(void ** buffer, size_t & capacity, size_t bytes)
{
  if (bytes <= capacity && *buffer) {
    return;
  }
  if (*buffer) {
    CUDA_CHECK(cudaFree(*buffer));
    *buffer = nullptr;
    capacity = 0;
  }
  CUDA_CHECK(cudaMalloc(buffer, bytes));
  capacity = bytes;
}

BackendOutputs TrtBackend::run(const Tensor & input)
{
  const auto & shape = input.shape;
  if (shape.size() != 4 || shape[0] != 1 || shape[1] != 3) {
    throw InferenceError("TensorRT backend expects a [1, 3, H, W] input");
  }
  if (input.data.size() != input.element_count()) {
    throw InferenceError("Input data does not match its shape");
  }
  if (shape[2] > config_.max_side || shape[3] > config_.max_side ||
    shape[2] < config_.min_side || shape[3] < config_.min_side)
  {
    throw InferenceError("Input " + std::to_string(shape[2]) + "x" + std::to_string(shape[3]) +
      " is outside the engine profile [" + std::to_string(config_.min_side) + ", " +
      std::to_string(config_.max_side) + "]");
  }

  const nvinfer1::Dims4 dims{1, 3, shape[2], shape[3]};
  if (!context_->setInputShape(input_name_.c_str(), dims)) {
    throw InferenceError("Failed to set the input shape");
  }

  const size_t input_bytes = input.data.size() * sizeof(float);
  ensure_capacity(&buffers_.device_input, buffers_.input_capacity, input_bytes);
  if (!context_->setTensorAddress(input_name_.c_str(), buffers_.device_input)) {
    throw InferenceError("Failed to set input tensor address");
  }

  // Output shapes follow the input shape, grow the buffers when needed
  auto bind_output = [this](const std::string & name, void ** buffer, size_t & capacity) {
      auto out_shape = context_->getTensorShape(name.c_str());
      size_t bytes = sizeof(float);
      for (int i = 0; i < out_shape.nbDims; ++i) {
        if (out_shape.d[i] < 0) {
          throw InferenceError("Unresolved dimension in output '" + name + "'");
        }
        bytes *= static_cast<size_t>(out_shape.d[i]);
      }
      ensure_capacity(buffer, capacity, bytes);
      if (!context_->setTensorAddress(name.c_str(), *buffer)) {
        throw InferenceError("Failed to set '" + name + "' tensor address");
      }
    };

  bind_output(probability_name_, &buffers_.device_probability, buffers_.probability_capacity);
  if (!mask_name_.empty()) {
    bind_output(mask_name_, &buffers_.device_mask, buffers_.mask_capacity);
  }

  // Copy input data to GPU
  CUDA_CHECK(cudaMemcpyAsync(buffers_.device_input, input.data.data(), input_bytes,
    cudaMemcpyHostToDevice, stream_));

  // Run inference
  if (!context_->enqueueV3(stream_)) {
    throw InferenceError("Failed to run inference");
  }

  // Wait for completion
  CUDA_CHECK(cudaStreamSynchronize(stream_));

  BackendOutputs outputs;
  outputs.probability = read_output(probability_name_, buffers_.device_probability);
  if (!mask_name_.empty()) {
    outputs.mask = read_output(mask_name_, buffers_.device_mask);
  }
  return outputs;
}

Tensor TrtBackend::read_output(const std::string & name, void * device_buffer)
{
  auto out_shape = context_->getTensorShape(name.c_str());

  Tensor tensor;
  for (int i = 0; i < out_shape.nbDims; ++i) {
    tensor.shape.push_back(out_shape.d[i]);
  }
  tensor.data.resize(tensor.element_count());

  // Copy results from GPU to CPU
  CUDA_CHECK(cudaMemcpy(tensor.data.data(), device_buffer,
    tensor.data.size() * sizeof(float), cudaMemcpyDeviceToHost));
  return tensor;
}

std::unique_ptr<InferenceBackend> TrtProvider::create_backend(const ModelArtifact & artifact) const
{
  int device_count = 0;
  if (cudaGetDeviceCount(&device_count) != cudaSuccess || device_count == 0) {
    throw BackendLoadError("No CUDA device available");
  }
  return std::make_unique<TrtBackend>(artifact, config_);
}

} // namespace textdet
