#pragma once

#include <string>

#include <opencv2/core.hpp>

#include <spdlog/fmt/fmt.h>

/**
 * SPDLOG formatter for single-channel cv::Mat, row-major: [[a, b], [c, d]]
 */
template <>
struct fmt::formatter<cv::Mat> : formatter<std::string>
{
    template <typename FormatContext>
    auto format(const cv::Mat& value, FormatContext& context) const
    {
        cv::Mat matrix;
        value.convertTo(matrix, CV_64F);

        std::string text = "[";
        for (auto r = 0; r < matrix.rows; ++r)
        {
            text += r == 0 ? "[" : ", [";
            for (auto c = 0; c < matrix.cols; ++c)
            {
                text += fmt::format("{}{:+.6f}", c == 0 ? "" : ", ", matrix.at<double>(r, c));
            }
            text += "]";
        }
        text += "]";

        return formatter<std::string>::format(text, context);
    }
};
