#pragma once
#include <opencv2/core.hpp>
#include "formreg/Types.hpp"

namespace formreg {

struct HomographyResult {
    Status status = Status::Degenerate;
    cv::Matx33d H = cv::Matx33d::eye();
    bool ok() const { return status == Status::Ok; }
};

// Three points closer to a line than this (sine of the angle) are collinear.
constexpr double kCollinearEps = 1e-9;
// Smallest |det H| of an accepted transform.
constexpr double kMinDeterminant = 1e-12;

/*
  Projective transform taking src[i] onto dst[i], H(2,2) == 1.
  Solves the 8x8 DLT system with cv::solve (DECOMP_LU). Collinear or
  coincident corners and a singular system are reported as Degenerate.
*/
HomographyResult solveHomography(const CornerSet& src, const CornerSet& dst);

// Maps p through H. False when the projective divisor vanishes.
bool applyHomography(const cv::Matx33d& H, const cv::Point2d& p, cv::Point2d& out);

bool hasCollinearTriple(const CornerSet& pts);

}
