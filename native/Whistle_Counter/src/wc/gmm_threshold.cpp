#include "wc/gmm_threshold.hpp"
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

namespace wc {

// Linear-interpolated percentile of an already sorted vector, p in [0, 100]
static double sorted_percentile(const std::vector<double>& v, double p) {
    if (p <= 0.0)   return v.front();
    if (p >= 100.0) return v.back();
    const double pos  = (p / 100.0) * static_cast<double>(v.size() - 1);
    const auto   idx  = static_cast<std::size_t>(std::floor(pos));
    const double frac = pos - static_cast<double>(idx);
    return (idx + 1 < v.size()) ? v[idx] + frac * (v[idx + 1] - v[idx]) : v[idx];
}

std::optional<LevelSplit> GmmThreshold::split(const std::vector<double>& level_db) const {
    if (level_db.size() < kMinLevels) return std::nullopt;

    std::vector<double> sorted(level_db);
    std::sort(sorted.begin(), sorted.end());
    const double lo = sorted_percentile(sorted, cfg_.p_low);
    const double hi = sorted_percentile(sorted, cfg_.p_high);

    std::vector<float> kept;
    kept.reserve(sorted.size());
    for (double x : sorted) if (x >= lo && x <= hi) kept.push_back(static_cast<float>(x));
    if (kept.size() < kMinLevels) return std::nullopt;

    cv::Mat samples(static_cast<int>(kept.size()), 1, CV_32F, kept.data());
    auto em = cv::ml::EM::create();
    em->setClustersNumber(2);
    em->setCovarianceMatrixType(cv::ml::EM::COV_MAT_DIAGONAL);
    em->setTermCriteria(cv::TermCriteria(cv::TermCriteria::COUNT + cv::TermCriteria::EPS,
                                         cfg_.max_iter, cfg_.eps));
    try {
        if (!em->trainEM(samples, cv::noArray(), cv::noArray(), cv::noArray()))
            return std::nullopt;

        const cv::Mat means   = em->getMeans();    // 2x1, CV_64F
        const cv::Mat weights = em->getWeights();  // 1x2, CV_64F
        int quiet = 0, loud = 1;
        if (means.at<double>(0, 0) > means.at<double>(1, 0)) std::swap(quiet, loud);

        LevelSplit s{};
        s.quiet_db     = means.at<double>(quiet, 0);
        s.loud_db      = means.at<double>(loud, 0);
        s.threshold_db = 0.5 * (s.quiet_db + s.loud_db);
        s.loud_share   = weights.at<double>(0, loud);
        s.n_used       = static_cast<int>(kept.size());

        if (s.loud_db - s.quiet_db < cfg_.min_separation_db) return std::nullopt;
        return s;
    } catch (const cv::Exception& e) {
        std::fprintf(stderr, "[CAL] EM failed: %s\n", e.what());
        return std::nullopt;
    }
}

} // namespace wc
