#pragma once
#include <opencv2/core.hpp>
#include <array>

namespace formreg {

enum class Status {
    Ok,
    NotFound,   // no region / no complete fiducial set
    Degenerate  // corner geometry cannot define a homography
};

const char* statusName(Status s);

enum CornerIndex { TL = 0, TR = 1, BR = 2, BL = 3 };

// Always four points, ordered TL, TR, BR, BL.
using CornerSet = std::array<cv::Point2f, 4>;

}
