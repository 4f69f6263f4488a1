#pragma once

// ─── psgraph ↔ Eigen ────────────────────────────────────────────────────────
//
// Include this header to feed Eigen vectors and matrices to the chart
// builders without formatting them as CSV first.
//
// Requirements:
//   - Eigen 3.x  (header-only)
//   - Build with -DPSGRAPH_USE_EIGEN=ON
//
// Usage:
//
//   #include <psgraph/eigen.hpp>
//
//   Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(50, 0, 10);
//   Eigen::MatrixXd y(50, 2);
//   y.col(0) = x.array().sin();
//   y.col(1) = x.array().cos();
//
//   psgraph::XYChart chart;
//   chart.build(psgraph::xy_table(x, y, {"x", "sin", "cos"}));
//
// ─────────────────────────────────────────────────────────────────────────────

#include <eigen3/Eigen/Core>
#include <psgraph/data_table.hpp>
#include <psgraph/errors.hpp>
#include <psgraph/number_format.hpp>
#include <string>
#include <vector>

namespace psgraph
{

// ─── Tables from Eigen ──────────────────────────────────────────────────────

// One row per matrix row, one column per matrix column.
template <typename Derived>
DataTable matrix_table(const Eigen::MatrixBase<Derived>& m, std::vector<std::string> headers)
{
    if (headers.size() != static_cast<size_t>(m.cols()))
        throw DataShapeError("eigen: " + std::to_string(headers.size()) + " headers for "
                             + std::to_string(m.cols()) + " columns");

    DataTable table;
    table.headers = std::move(headers);
    table.rows.reserve(static_cast<size_t>(m.rows()));
    for (Eigen::Index r = 0; r < m.rows(); ++r)
    {
        std::vector<std::string> row;
        row.reserve(static_cast<size_t>(m.cols()));
        for (Eigen::Index c = 0; c < m.cols(); ++c)
            row.push_back(format_number(static_cast<double>(m(r, c))));
        table.rows.push_back(std::move(row));
    }
    return table;
}

// x as column 0 followed by each column of ys.
template <typename DerivedX, typename DerivedY>
DataTable xy_table(const Eigen::MatrixBase<DerivedX>& x,
                   const Eigen::MatrixBase<DerivedY>& ys,
                   std::vector<std::string>           headers)
{
    if (x.cols() != 1 || x.rows() != ys.rows())
        throw DataShapeError("eigen: x must be a column vector as long as the y columns");

    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic> m(x.rows(), ys.cols() + 1);
    m.col(0)                      = x.template cast<double>();
    m.rightCols(ys.cols())        = ys.template cast<double>();
    return matrix_table(m, std::move(headers));
}

// Category labels as column 0 followed by each column of values.
template <typename Derived>
DataTable bar_table(const std::vector<std::string>&      categories,
                    const Eigen::MatrixBase<Derived>&    values,
                    std::vector<std::string>             headers)
{
    if (static_cast<Eigen::Index>(categories.size()) != values.rows())
        throw DataShapeError("eigen: " + std::to_string(categories.size()) + " categories for "
                             + std::to_string(values.rows()) + " rows");

    std::vector<std::string> value_headers(headers.begin() + (headers.empty() ? 0 : 1),
                                           headers.end());
    DataTable table = matrix_table(values, std::move(value_headers));
    table.headers.insert(table.headers.begin(), headers.empty() ? std::string() : headers.front());
    for (size_t r = 0; r < table.rows.size(); ++r)
        table.rows[r].insert(table.rows[r].begin(), categories[r]);
    return table;
}

}   // namespace psgraph
