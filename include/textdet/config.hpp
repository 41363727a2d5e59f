#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <array>
#include <string>
#include <vector>


namespace config
{
// DBNet normalization constants: (v - MEAN) * SCALE maps [0, 255] to [-1, 1]
constexpr std::array<float, 3> MEAN = {127.5f, 127.5f, 127.5f};
constexpr float SCALE = 1.0f / 127.5f;

// Spatial multiple the detection networks require for height and width
constexpr int INPUT_ALIGNMENT = 32;

// Fill value for the padded border (before normalization)
constexpr int PAD_VALUE = 0;

// Images whose shorter side is below this get a border up to it instead of
// being upscaled further; small images tend to hold large glyphs
constexpr int MIN_INPUT_SIDE = 400;

// Upper bound of DecodeOptions::max_side_len
constexpr int MAX_SIDE_LEN = 8192;

// A page is tiled when its long side exceeds TILE_MIN_DOWNSCALE times
// max_side_len and its aspect ratio exceeds TILE_MIN_ASPECT
constexpr double TILE_MIN_DOWNSCALE = 2.5;
constexpr double TILE_MIN_ASPECT = 3.0;

// Regions smaller than this (in original image pixels) are dropped
constexpr float MIN_REGION_AREA = 16.0f;

// Accelerators tried when a session is created without a preference list
const std::vector<std::string> DEFAULT_PROVIDERS = {"tensorrt", "cuda", "cpu"};

// Identifier of the provider that always runs on the host
const std::string CPU_PROVIDER = "cpu";

} // namespace config
