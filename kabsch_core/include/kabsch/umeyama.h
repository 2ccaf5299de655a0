#pragma once

#include <optional>

#include <opencv2/core.hpp>

#include "kabsch/estimate_options.h"
#include "kabsch/point_set.h"
#include "kabsch/similarity.h"

namespace kabsch
{
    /** Estimate the similarity (rotation, optional uniform scale, translation) mapping src onto dst
     * with Umeyama's closed-form least-squares solution.
     *
     * Row i of src is paired with row i of dst. The rotation is always proper (det = +1); when the
     * cross-covariance is singular the sign is taken from its singular vectors.
     *
     * @param src Source points, R x C, one channel
     * @param dst Destination points, same shape as src
     * @param options Scale estimation flag and rank tolerance
     * @return The similarity parts, or std::nullopt if the cross-covariance has rank 0, cannot be
     *         decomposed, or the source points have no variance
     * @throws dimension_mismatch if src and dst differ in shape, are empty or multi-channel
     * @throws std::invalid_argument if the options do not validate
     */
    [[nodiscard]] auto estimate_similarity
    (
        const cv::Mat&          src,
        const cv::Mat&          dst,
        const estimate_options& options
    ) -> std::optional<similarity>;

    /** Estimate the homogeneous (C+1) x (C+1) similarity transform mapping src onto dst.
     *
     * @return scale * R in the top-left C x C block, the translation in column C and
     *         [0, ..., 0, 1] as the last row; std::nullopt when there is no solution
     * @throws dimension_mismatch if src and dst differ in shape, are empty or multi-channel
     */
    [[nodiscard]] auto estimate
    (
        const cv::Mat&          src,
        const cv::Mat&          dst,
        const estimate_options& options
    ) -> std::optional<cv::Mat>;

    [[nodiscard]] auto estimate(const cv::Mat& src, const cv::Mat& dst, bool estimate_scale) -> std::optional<cv::Mat>;

    template <int R, int C>
    [[nodiscard]] auto estimate
    (
        const cv::Matx<double, R, C>& src,
        const cv::Matx<double, R, C>& dst,
        const bool                    estimate_scale
    ) -> std::optional<cv::Matx<double, C + 1, C + 1>>
    {
        const auto& transform = estimate(cv::Mat(src), cv::Mat(dst), estimate_scale);

        if (!transform)
            return std::nullopt;

        return cv::Matx<double, C + 1, C + 1>(*transform);
    }

    template <int R, int C>
    [[nodiscard]] auto estimate
    (
        const point_set<R, C>& src,
        const point_set<R, C>& dst,
        const bool             estimate_scale
    ) -> std::optional<cv::Matx<double, C + 1, C + 1>>
    {
        return estimate(static_cast<cv::Matx<double, R, C>>(src), static_cast<cv::Matx<double, R, C>>(dst), estimate_scale);
    }
} // namespace kabsch
