#include "kabsch/utils/linalg.h"

#include <stdexcept>
#include <vector>

#include <gsl/narrow>

auto kabsch::utils::row_mean(const cv::Mat& points) -> cv::Mat
{
    cv::Mat mean;
    cv::reduce(points, mean, 0, cv::REDUCE_AVG, CV_64F);
    return mean;
}

auto kabsch::utils::demean(cv::Mat& points, const cv::Mat& mean) -> void
{
    for (auto r = 0; r < points.rows; ++r)
    {
        points.row(r) -= mean;
    }
}

auto kabsch::utils::rank(const cv::Mat& matrix, const double tolerance) -> int
{
    if (tolerance < 0.0)
        throw std::invalid_argument("rank tolerance must be >= 0");

    cv::Mat singular_values;
    cv::SVD::compute(matrix, singular_values, cv::SVD::NO_UV);

    return cv::countNonZero(singular_values > tolerance);
}

auto kabsch::utils::variance_sum(const cv::Mat& points) -> double
{
    const auto mean = row_mean(points);

    auto sum = 0.0;
    for (auto r = 0; r < points.rows; ++r)
    {
        const cv::Mat deviation = points.row(r) - mean;
        sum += deviation.dot(deviation);
    }

    return sum / gsl::narrow<double>(points.rows);
}

auto kabsch::utils::svd(const cv::Mat& matrix, const double tolerance) -> svd_result
{
    if (matrix.rows != matrix.cols)
        throw std::invalid_argument("svd expects a square matrix");

    svd_result result;
    cv::SVD::compute(matrix, result.w, result.u, result.vt, cv::SVD::FULL_UV);

    const auto dim        = matrix.rows;
    const auto determined = cv::countNonZero(result.w > tolerance);

    // Candidates for an undetermined column, in order of preference
    auto candidates = [&result, dim](const int i)
    {
        std::vector<cv::Mat> columns { cv::Mat(result.vt.row(i).t()), result.u.col(i).clone() };
        for (auto k = 0; k < dim; ++k)
        {
            cv::Mat unit = cv::Mat::zeros(dim, 1, CV_64F);
            unit.at<double>(k) = 1.0;
            columns.push_back(unit);
        }
        return columns;
    };

    for (auto i = determined; i < dim; ++i)
    {
        for (auto candidate: candidates(i))
        {
            for (auto j = 0; j < i; ++j)
            {
                const cv::Mat u_j = result.u.col(j);
                candidate -= u_j.dot(candidate) * u_j;
            }

            const auto norm = cv::norm(candidate);
            if (norm > 1e-8)
            {
                cv::Mat(candidate / norm).copyTo(result.u.col(i));
                break;
            }
        }
    }

    return result;
}
