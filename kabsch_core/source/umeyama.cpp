#include "kabsch/umeyama.h"

#include <format>

#include <gsl/narrow>

#include <spdlog/spdlog.h>

#include "kabsch/errors.h"
#include "kabsch/formatters.h"
#include "kabsch/utils/linalg.h"
#include "kabsch/utils/transform.h"

auto kabsch::estimate_similarity
(
    const cv::Mat&          src,
    const cv::Mat&          dst,
    const estimate_options& options
) -> std::optional<similarity>
{
    options.validate();

    if (src.size() != dst.size())
    {
        throw dimension_mismatch
        (
            std::format("src is {}x{} but dst is {}x{}", src.rows, src.cols, dst.rows, dst.cols)
        );
    }

    if (src.empty())
        throw dimension_mismatch("point sets must hold at least one point of at least one dimension");

    if (src.channels() != 1 || dst.channels() != 1)
        throw dimension_mismatch("point sets must be single-channel matrices");

    const auto num = gsl::narrow<double>(src.rows);
    const auto dim = src.cols;

    // Working copies, the caller's matrices are left untouched
    cv::Mat src_demean, dst_demean;
    src.convertTo(src_demean, CV_64F);
    dst.convertTo(dst_demean, CV_64F);

    const auto src_mean = utils::row_mean(src_demean);
    const auto dst_mean = utils::row_mean(dst_demean);
    utils::demean(src_demean, src_mean);
    utils::demean(dst_demean, dst_mean);

    const cv::Mat A = dst_demean.t() * src_demean / num;

    SPDLOG_TRACE("cross-covariance: {}", A);

    // Sign correction, decided on the covariance itself before it is decomposed
    cv::Mat d = cv::Mat::ones(dim, 1, CV_64F);
    if (cv::determinant(A) < 0.0)
        d.at<double>(dim - 1) = -1.0;

    if (!cv::checkRange(A))
    {
        SPDLOG_WARN("cross-covariance is not finite, no transform estimated");
        return std::nullopt;
    }

    utils::svd_result svd;
    auto              rank = 0;
    try
    {
        rank = utils::rank(A, options.rank_tolerance);
        svd  = utils::svd(A, options.rank_tolerance);
    }
    catch (const cv::Exception& e)
    {
        SPDLOG_WARN("SVD of the cross-covariance failed: {}", e.what());
        return std::nullopt;
    }

    if (rank == 0)
    {
        SPDLOG_DEBUG("cross-covariance has rank 0, rotation is undetermined");
        return std::nullopt;
    }

    const auto& [U, S, Vt] = svd;

    cv::Mat M;
    if (rank < dim)
    {
        // det(A) carries no sign information once A is singular, the factors decide
        if (cv::determinant(U) * cv::determinant(Vt) > 0.0)
        {
            M = U * Vt;
        }
        else
        {
            // The flip only applies to the rotation, d keeps its value for the scale below
            cv::Mat flipped = d.clone();
            flipped.at<double>(dim - 1) = -1.0;
            M = U * cv::Mat::diag(flipped) * Vt;
        }
    }
    else
    {
        M = U * cv::Mat::diag(d) * Vt;
    }

    auto scale = 1.0;
    if (options.estimate_scale)
    {
        const auto variance = utils::variance_sum(src_demean);
        if (variance <= 0.0)
        {
            SPDLOG_DEBUG("source points have no variance, scale is undetermined");
            return std::nullopt;
        }

        scale = S.dot(d) / variance;
    }

    const cv::Mat translation = dst_mean - scale * (M * src_mean.t()).t();

    SPDLOG_TRACE("rank: {}, scale: {}, rotation: {}, translation: {}", rank, scale, M, translation);

    return similarity { scale, M, cv::Mat(translation.t()) };
}

auto kabsch::estimate
(
    const cv::Mat&          src,
    const cv::Mat&          dst,
    const estimate_options& options
) -> std::optional<cv::Mat>
{
    const auto& parts = estimate_similarity(src, dst, options);

    if (!parts)
        return std::nullopt;

    return utils::compose(*parts);
}

auto kabsch::estimate(const cv::Mat& src, const cv::Mat& dst, const bool estimate_scale) -> std::optional<cv::Mat>
{
    estimate_options options;
    options.estimate_scale = estimate_scale;

    return estimate(src, dst, options);
}
