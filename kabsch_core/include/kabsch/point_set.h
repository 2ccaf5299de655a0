#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <format>
#include <span>
#include <vector>

#include <opencv2/core.hpp>

#include "kabsch/errors.h"

namespace kabsch
{
    /**
     * @brief Fixed-size set of R points in C dimensions, stored row-major
     *
     * Adapts nested arrays, flat sequences and flat fixed arrays to the matrix types consumed by
     * the estimator. Flat input is read row-major: value i lands in row i / C, column i % C.
     *
     * @tparam R Number of points (rows)
     * @tparam C Number of dimensions (columns)
     */
    template <int R, int C>
    class point_set
    {
        static_assert(R >= 1 && C >= 1, "a point set needs at least one point and one dimension");

    public:
        using row_type     = std::array<double, C>;
        using nested_array = std::array<row_type, R>;

        point_set() = default;

        point_set(const nested_array& values) :
            _values { values }
        {
        }

        /**
         * @brief Construct from a flat row-major sequence
         * @param values Exactly R * C values
         * @throws length_mismatch if values.size() != R * C
         */
        explicit point_set(std::span<const double> values)
        {
            if (values.size() != size())
            {
                throw length_mismatch
                (
                    std::format("point set of {}x{} needs {} values, got {}", R, C, size(), values.size())
                );
            }

            for (std::size_t i = 0; i < values.size(); ++i)
            {
                _values[i / C][i % C] = values[i];
            }
        }

        template <std::size_t N>
        explicit point_set(const std::array<double, N>& values) :
            point_set(std::span<const double> { values.data(), N })
        {
        }

        /**
         * @brief Construct from a runtime nested sequence
         * @throws length_mismatch if there are not R rows of C values each
         */
        static auto from_rows(const std::vector<std::vector<double>>& rows) -> point_set
        {
            if (rows.size() != R)
            {
                throw length_mismatch(std::format("point set needs {} rows, got {}", R, rows.size()));
            }

            point_set points;
            for (std::size_t r = 0; r < rows.size(); ++r)
            {
                if (rows[r].size() != C)
                {
                    throw length_mismatch(std::format("row {} needs {} values, got {}", r, C, rows[r].size()));
                }

                std::copy(rows[r].begin(), rows[r].end(), points._values[r].begin());
            }

            return points;
        }

        static constexpr auto rows() -> int { return R; }
        static constexpr auto cols() -> int { return C; }
        static constexpr auto size() -> std::size_t { return static_cast<std::size_t>(R) * C; }

        auto operator[](const std::size_t row) const -> const row_type& { return _values[row]; }

        [[nodiscard]] auto values() const -> const nested_array& { return _values; }

        operator cv::Matx<double, R, C>() const
        {
            cv::Matx<double, R, C> matrix;
            for (auto r = 0; r < R; ++r)
                for (auto c = 0; c < C; ++c)
                    matrix(r, c) = _values[r][c];
            return matrix;
        }

        /// Deep copy into a CV_64F matrix
        [[nodiscard]] auto to_mat() const -> cv::Mat
        {
            return cv::Mat(static_cast<cv::Matx<double, R, C>>(*this), true);
        }

    private:
        nested_array _values = { };
    };
} // namespace kabsch
