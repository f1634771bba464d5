#include "formreg/BlobAnalyzer.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <limits>

namespace formreg {

namespace {

const int kDx[4] = { 1, -1, 0, 0 };
const int kDy[4] = { 0, 0, 1, -1 };

struct BlobAccumulator {
    Blob blob;
    double sumX = 0.0;
    double sumY = 0.0;

    void add(int x, int y) {
        if (blob.pixelCount == 0) {
            blob.minX = blob.maxX = x;
            blob.minY = blob.maxY = y;
        } else {
            blob.minX = std::min(blob.minX, x);
            blob.maxX = std::max(blob.maxX, x);
            blob.minY = std::min(blob.minY, y);
            blob.maxY = std::max(blob.maxY, y);
        }
        blob.pixelCount++;
        sumX += x;
        sumY += y;
    }

    Blob finish() {
        if (blob.pixelCount > 0) {
            blob.centroid = cv::Point2f(static_cast<float>(sumX / blob.pixelCount),
                                        static_cast<float>(sumY / blob.pixelCount));
        }
        return blob;
    }
};

} // namespace

FillResult BlobAnalyzer::fillBrightRegion(cv::Point seed, const cv::Rect& window) const {
    FillResult R;
    const cv::Rect win = window & cv::Rect(0, 0, sampler_.width(), sampler_.height());
    if (win.area() <= 0 || !win.contains(seed)) return R;
    if (!isLight(seed.x, seed.y)) return R;   // seed sits on the border

    const double maxFill = kMaxBrightFillRatio * win.area();
    std::vector<unsigned char> visited(static_cast<size_t>(win.area()), 0);
    auto at = [&](int x, int y) -> unsigned char& {
        return visited[static_cast<size_t>(y - win.y) * win.width + (x - win.x)];
    };

    BlobAccumulator acc;
    std::deque<cv::Point> queue;
    at(seed.x, seed.y) = 1;
    queue.push_back(seed);

    while (!queue.empty()) {
        cv::Point p = queue.front();
        queue.pop_front();
        acc.add(p.x, p.y);
        // No real border around the seed.
        if (acc.blob.pixelCount > maxFill) return R;

        for (int k = 0; k < 4; ++k) {
            cv::Point n(p.x + kDx[k], p.y + kDy[k]);
            if (!win.contains(n)) continue;
            unsigned char& v = at(n.x, n.y);
            if (v) continue;
            v = 1;
            if (isLight(n.x, n.y)) queue.push_back(n);
        }
    }

    R.blob = acc.finish();
    R.status = Status::Ok;
    return R;
}

Blob BlobAnalyzer::floodDark(int sx, int sy, const cv::Rect& win,
                             std::vector<unsigned char>& visited) const {
    auto at = [&](int x, int y) -> unsigned char& {
        return visited[static_cast<size_t>(y - win.y) * win.width + (x - win.x)];
    };

    BlobAccumulator acc;
    std::deque<cv::Point> queue;
    at(sx, sy) = 1;
    queue.emplace_back(sx, sy);

    while (!queue.empty()) {
        cv::Point p = queue.front();
        queue.pop_front();
        acc.add(p.x, p.y);
        if (acc.blob.pixelCount >= kMaxDarkBlobPixels) break;

        for (int k = 0; k < 4; ++k) {
            cv::Point n(p.x + kDx[k], p.y + kDy[k]);
            if (!win.contains(n)) continue;
            unsigned char& v = at(n.x, n.y);
            if (v || !isDark(n.x, n.y)) continue;
            v = 1;
            queue.push_back(n);
        }
    }
    return acc.finish();
}

bool BlobAnalyzer::acceptDarkBlob(const Blob& b, int minSize) const {
    if (b.pixelCount <= 0) return false;
    if (b.pixelCount < static_cast<int64_t>(minSize) * minSize) return false;
    if (b.pixelCount >= kMaxDarkBlobAreaRatio * sampler_.area()) return false;

    const int w = b.width();
    const int h = b.height();
    const double aspect = static_cast<double>(std::max(w, h)) / std::min(w, h);
    // thin lines and table rulings
    return aspect < kMaxAspectRatio;
}

std::vector<Blob> BlobAnalyzer::findDarkBlobs(const cv::Rect& window, int minSize) const {
    std::vector<Blob> out;
    const cv::Rect win = window & cv::Rect(0, 0, sampler_.width(), sampler_.height());
    if (win.area() <= 0) return out;

    std::vector<unsigned char> visited(static_cast<size_t>(win.area()), 0);

    for (int y = win.y; y < win.y + win.height; ++y) {
        for (int x = win.x; x < win.x + win.width; ++x) {
            if (visited[static_cast<size_t>(y - win.y) * win.width + (x - win.x)]) continue;
            if (!isDark(x, y)) continue;

            Blob b = floodDark(x, y, win, visited);
            if (acceptDarkBlob(b, minSize)) out.push_back(b);
        }
    }
    return out;
}

FillResult BlobAnalyzer::closestBlob(const std::vector<Blob>& blobs, cv::Point2f target) {
    FillResult R;
    double best = std::numeric_limits<double>::max();
    for (const auto& b : blobs) {
        const double dx = b.centroid.x - target.x;
        const double dy = b.centroid.y - target.y;
        const double d2 = dx * dx + dy * dy;
        if (d2 < best) {
            best = d2;
            R.blob = b;
            R.status = Status::Ok;
        }
    }
    return R;
}

}
