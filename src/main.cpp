#include <iostream>
#include <string>
#include <vector>

// OpenCV includes
#include <opencv2/imgcodecs.hpp>

// Local includes
#include "textdet/detection_utils.hpp"
#include "textdet/exception.hpp"
#include "textdet/session.hpp"


int main(int argc, char* argv[])
{
  // Parse command line arguments
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <model.onnx> <image_path> [provider ...]" << std::endl;
    std::cerr << "  providers are tried in order, default: tensorrt cuda cpu" << std::endl;
    return -1;
  }

  std::string model_path = argv[1];
  std::string image_path = argv[2];

  textdet::Session::Config config;
  config.model = textdet::ModelArtifact(model_path);
  config.model.engine_cache_path = model_path + ".engine";
  for (int i = 3; i < argc; ++i) {
    config.providers.push_back(argv[i]);
  }

  try {
    // Load test image
    auto image = textdet::ImageBuffer::from_file(image_path);

    textdet::Session session(config);
    auto detector = session.default_detector();
    detector->load();
    std::cout << "Using execution provider: " << detector->active_provider() << std::endl;

    // Run detection with default thresholds
    auto result = detector->detect(image);

    textdet::utils::print_detection_results(result, 20);

    // Create visualization of the detection results
    cv::Mat overlay = textdet::utils::plot_regions(image.mat(), result.regions, 0.0f);
    if (!cv::imwrite("textdet_regions.png", overlay)) {
      std::cerr << "Error: Could not write textdet_regions.png" << std::endl;
    }
    if (!cv::imwrite("textdet_mask.png", textdet::utils::render_mask(result.mask))) {
      std::cerr << "Error: Could not write textdet_mask.png" << std::endl;
    }

    detector->unload();

    std::cout << "\n=== Demo completed successfully! ===" << std::endl;

  } catch (const textdet::NoAcceleratorAvailable& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return -1;
  }

  return 0;
}
