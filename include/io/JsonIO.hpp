#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"
#include "paper/Segmenter.hpp"
#include "paper/SegmenterConfig.hpp"

// Config overrides on top of the built-in defaults. Every key is optional;
// "aliases" replaces the pattern list of each section it names.
paper::SegmenterConfig parseSegmenterConfig(const nlohmann::json& j);

paper::SegmenterConfig loadSegmenterConfig(const std::string& path);

nlohmann::json segmentationToJson(const paper::SegmentationResult& r);

void writeJsonFile(const std::filesystem::path& path, const nlohmann::json& j);
