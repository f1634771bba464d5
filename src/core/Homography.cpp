#include "formreg/Homography.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace formreg {

bool hasCollinearTriple(const CornerSet& pts) {
    for (int i = 0; i < 4; ++i) {
        for (int j = i + 1; j < 4; ++j) {
            for (int k = j + 1; k < 4; ++k) {
                const cv::Point2d a = pts[i], b = pts[j], c = pts[k];
                const cv::Point2d ab = b - a, ac = c - a;
                const double cross = ab.x * ac.y - ab.y * ac.x;
                const double scale = std::max(1.0, cv::norm(ab) * cv::norm(ac));
                if (std::abs(cross) <= kCollinearEps * scale) return true;
            }
        }
    }
    return false;
}

HomographyResult solveHomography(const CornerSet& src, const CornerSet& dst) {
    HomographyResult R;
    if (hasCollinearTriple(src) || hasCollinearTriple(dst)) return R;

    // u = (h0 x + h1 y + h2) / (h6 x + h7 y + 1), likewise v with h3..h5
    cv::Matx<double, 8, 8> A;
    cv::Matx<double, 8, 1> b, h;
    for (int i = 0; i < 4; ++i) {
        const double x = src[i].x, y = src[i].y;
        const double u = dst[i].x, v = dst[i].y;
        const double rowU[8] = { x, y, 1, 0, 0, 0, -x * u, -y * u };
        const double rowV[8] = { 0, 0, 0, x, y, 1, -x * v, -y * v };
        for (int c = 0; c < 8; ++c) {
            A(2 * i, c) = rowU[c];
            A(2 * i + 1, c) = rowV[c];
        }
        b(2 * i) = u;
        b(2 * i + 1) = v;
    }

    // LU with partial pivoting; false on a singular system.
    if (!cv::solve(A, b, h, cv::DECOMP_LU)) return R;

    cv::Matx33d H(h(0), h(1), h(2),
                  h(3), h(4), h(5),
                  h(6), h(7), 1.0);

    for (int i = 0; i < 9; ++i) {
        if (!std::isfinite(H.val[i])) return R;
    }
    if (std::abs(cv::determinant(H)) < kMinDeterminant) return R;

    R.H = H;
    R.status = Status::Ok;
    return R;
}

bool applyHomography(const cv::Matx33d& H, const cv::Point2d& p, cv::Point2d& out) {
    const double w = H(2, 0) * p.x + H(2, 1) * p.y + H(2, 2);
    if (std::abs(w) < std::numeric_limits<double>::min()) return false;
    out.x = (H(0, 0) * p.x + H(0, 1) * p.y + H(0, 2)) / w;
    out.y = (H(1, 0) * p.x + H(1, 1) * p.y + H(1, 2)) / w;
    return std::isfinite(out.x) && std::isfinite(out.y);
}

}
