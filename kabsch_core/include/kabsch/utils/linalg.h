#pragma once

#include <opencv2/core.hpp>

/// Linear-algebra building blocks of the estimator, all on single-channel CV_64F matrices
namespace kabsch::utils
{
    /// matrix = u * diag(w) * vt, singular values in w sorted in descending order
    struct svd_result
    {
        cv::Mat u  = { };
        cv::Mat w  = { };
        cv::Mat vt = { };
    };

    /**
     * Full singular value decomposition of a square matrix.
     *
     * Left singular vectors whose singular value is not above tolerance are not determined by the
     * matrix. They are completed from the matching right singular vectors, orthogonalized against
     * the determined left ones, so a symmetric matrix gets u == vt^T on its null space.
     *
     * @throws std::invalid_argument if the matrix is not square
     * @throws cv::Exception if OpenCV cannot decompose the matrix
     */
    auto svd(const cv::Mat& matrix, double tolerance) -> svd_result;

    /**
     * Mean of every column
     * @param points R x C matrix, one point per row
     * @return 1 x C row vector
     */
    auto row_mean(const cv::Mat& points) -> cv::Mat;

    /**
     * Subtract a row vector from every row, in place
     * @param points R x C matrix, one point per row
     * @param mean 1 x C row vector
     */
    auto demean(cv::Mat& points, const cv::Mat& mean) -> void;

    /**
     * Numerical rank: the number of singular values strictly greater than tolerance
     * @throws std::invalid_argument if tolerance is negative
     */
    auto rank(const cv::Mat& matrix, double tolerance) -> int;

    /// Sum over columns of the population variance (divisor R) of each column
    auto variance_sum(const cv::Mat& points) -> double;
}
