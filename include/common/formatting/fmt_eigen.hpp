// File: common/formatting/fmt_eigen.hpp

#ifndef FMT_EIGEN_HPP
#define FMT_EIGEN_HPP

#include <Eigen/Core>
#include <fmt/format.h>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

/*
 * fmt formatter for fixed-size Eigen matrices, one row per line.
 * Accepts an optional precision: fmt::format("{:2}", K) prints two decimals.
 */
template<typename Scalar, int Rows, int Cols>
struct fmt::formatter<Eigen::Matrix<Scalar, Rows, Cols>> {
    int precision = -1;

    constexpr auto parse(fmt::format_parse_context &ctx) -> decltype(ctx.begin()) {
        auto it = ctx.begin();
        const auto end = ctx.end();

        if (it != end && *it >= '0' && *it <= '9') {
            precision = 0;
            while (it != end && *it >= '0' && *it <= '9') {
                precision = precision * 10 + (*it - '0');
                ++it;
            }
        }
        if (it != end && *it != '}') {
            throw fmt::format_error("Invalid format specifier for Eigen matrix");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const Eigen::Matrix<Scalar, Rows, Cols> &matrix, FormatContext &ctx) const -> decltype(ctx.out()) {
        std::ostringstream oss;
        if (precision >= 0) {
            oss << std::fixed << std::setprecision(precision);
        } else {
            oss << std::setprecision(std::numeric_limits<Scalar>::digits10 + 1);
        }

        for (int row = 0; row < matrix.rows(); ++row) {
            for (int col = 0; col < matrix.cols(); ++col) {
                oss << matrix(row, col);
                if (col < matrix.cols() - 1) {
                    oss << ", ";
                }
            }
            if (row < matrix.rows() - 1) {
                oss << "\n";
            }
        }
        return fmt::format_to(ctx.out(), "\n{}", oss.str());
    }
};

#endif // FMT_EIGEN_HPP
