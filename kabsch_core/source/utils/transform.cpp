#include "kabsch/utils/transform.h"

#include <cmath>
#include <format>

#include <gsl/narrow>

#include "kabsch/errors.h"

auto kabsch::utils::compose(const similarity& similarity) -> cv::Mat
{
    const auto dim = similarity.rotation.rows;

    if (similarity.rotation.cols != dim || similarity.translation.rows != dim || similarity.translation.cols != 1)
    {
        throw dimension_mismatch
        (
            std::format
            (
                "rotation is {}x{} and translation {}x{}, expected CxC and Cx1",
                similarity.rotation.rows,
                similarity.rotation.cols,
                similarity.translation.rows,
                similarity.translation.cols
            )
        );
    }

    cv::Mat transform = cv::Mat::eye(dim + 1, dim + 1, CV_64F);

    const cv::Mat block = similarity.scale * similarity.rotation;
    block.copyTo(transform(cv::Rect(0, 0, dim, dim)));
    similarity.translation.copyTo(transform(cv::Rect(dim, 0, 1, dim)));

    return transform;
}

auto kabsch::utils::decompose(const cv::Mat& transform) -> similarity
{
    if (transform.rows != transform.cols || transform.rows < 2)
    {
        throw dimension_mismatch
        (
            std::format("a homogeneous transform must be square and at least 2x2, got {}x{}", transform.rows, transform.cols)
        );
    }

    const auto dim = transform.rows - 1;

    cv::Mat matrix;
    transform.convertTo(matrix, CV_64F);

    const cv::Mat block = matrix(cv::Rect(0, 0, dim, dim));

    similarity similarity;
    similarity.scale       = std::sqrt(block.dot(block) / gsl::narrow<double>(dim));
    similarity.rotation    = similarity.scale > 0.0 ? cv::Mat(block / similarity.scale) : cv::Mat::zeros(dim, dim, CV_64F);
    similarity.translation = matrix(cv::Rect(dim, 0, 1, dim)).clone();

    return similarity;
}

auto kabsch::utils::apply(const cv::Mat& transform, const cv::Mat& points) -> cv::Mat
{
    const auto& [scale, rotation, translation] = decompose(transform);

    if (points.cols != rotation.cols)
    {
        throw dimension_mismatch
        (
            std::format("points have {} columns, transform expects {}", points.cols, rotation.cols)
        );
    }

    cv::Mat source;
    points.convertTo(source, CV_64F);

    cv::Mat transformed = source * (scale * rotation).t();
    for (auto r = 0; r < transformed.rows; ++r)
    {
        transformed.row(r) += translation.t();
    }

    return transformed;
}

auto kabsch::utils::rmsd(const cv::Mat& transform, const cv::Mat& src, const cv::Mat& dst) -> double
{
    if (src.size() != dst.size())
    {
        throw dimension_mismatch
        (
            std::format("src is {}x{} but dst is {}x{}", src.rows, src.cols, dst.rows, dst.cols)
        );
    }

    if (src.empty())
        return 0.0;

    cv::Mat destination;
    dst.convertTo(destination, CV_64F);

    const cv::Mat residual = apply(transform, src) - destination;

    return std::sqrt(residual.dot(residual) / gsl::narrow<double>(src.rows));
}
