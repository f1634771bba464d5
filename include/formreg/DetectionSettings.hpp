#pragma once
#include <string>
#include "formreg/Types.hpp"

namespace formreg {

struct DetectionSettings {
    int minSize = 15;     // smallest accepted blob / region dimension (px)
    int threshold = 160;  // gray level separating dark from light
    int padding = 0;      // applied to detected rectangles, may be negative
};

// Accepted config ranges; minSize^2 and 2*padding must fit an int.
constexpr int kMaxMinSize = 46340;
constexpr int kMaxPadding = 1 << 20;

// Reads the "detection" node of a cv::FileStorage file (JSON or YAML).
// Missing file, node or keys keep the defaults; problems go to std::cerr.
DetectionSettings loadDetectionSettings(const std::string& path);

// "template.corners": 8 numbers, x/y of TL, TR, BR, BL.
bool loadTemplateCorners(const std::string& path, CornerSet& out);

}
