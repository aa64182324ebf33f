// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "named.h"

#include "errors.h"

#include <iterator>
#include <numeric>
#include <stdexcept>

namespace oem {

Axis::Axis(const std::vector<std::string>& names) : labels { names }
{
    for (int i {}; i < static_cast<int>(labels.size()); ++i) {
        if (!positions.emplace(labels[i], i).second) {
            throw ConfigurationError { "duplicate name in axis: "
                                       + labels[i] };
        }
    }
}

auto Axis::size() const -> int
{
    return static_cast<int>(labels.size());
}

auto Axis::empty() const -> bool
{
    return labels.empty();
}

auto Axis::names() const -> const std::vector<std::string>&
{
    return labels;
}

auto Axis::name(const int i) const -> const std::string&
{
    return labels.at(i);
}

auto Axis::index(const std::string& name) const -> int
{
    const auto it { positions.find(name) };
    if (it == positions.end()) {
        throw std::out_of_range { "unknown name: " + name };
    }
    return it->second;
}

auto Axis::contains(const std::string& name) const -> bool
{
    return positions.contains(name);
}

auto Axis::operator==(const Axis& other) const -> bool
{
    return labels == other.labels;
}

auto Axis::str() const -> std::string
{
    if (labels.empty()) {
        return "<empty>";
    }
    return std::accumulate(
      std::next(labels.begin()),
      labels.end(),
      labels.front(),
      [](const std::string& a, const std::string& b) { return a + ", " + b; });
}

auto concat(const Axis& a, const Axis& b) -> Axis
{
    std::vector<std::string> names { a.names() };
    names.insert(names.end(), b.names().begin(), b.names().end());
    return Axis { names };
}

auto checkAligned(const Axis& a,
                  const Axis& b,
                  const std::string& context) -> void
{
    if (!(a == b)) {
        throw std::invalid_argument { context + ": axes are not aligned ("
                                      + a.str() + ") vs (" + b.str() + ')' };
    }
}

NamedVector::NamedVector(const Axis& axis, const Eigen::VectorXd& values)
  : ax { axis }, vals { values }
{
    if (ax.size() != vals.size()) {
        throw ConfigurationError { "vector of length "
                                   + std::to_string(vals.size()) + " but "
                                   + std::to_string(ax.size())
                                   + " names: " + ax.str() };
    }
}

NamedVector::NamedVector(const std::vector<std::string>& names,
                         const Eigen::VectorXd& values)
  : NamedVector { Axis { names }, values }
{}

auto NamedVector::constant(const Axis& axis, const double value) -> NamedVector
{
    return { axis, Eigen::VectorXd::Constant(axis.size(), value) };
}

auto NamedVector::axis() const -> const Axis&
{
    return ax;
}

auto NamedVector::names() const -> const std::vector<std::string>&
{
    return ax.names();
}

auto NamedVector::size() const -> int
{
    return ax.size();
}

auto NamedVector::empty() const -> bool
{
    return ax.empty();
}

auto NamedVector::values() const -> const Eigen::VectorXd&
{
    return vals;
}

auto NamedVector::operator()(const int i) -> double&
{
    return vals(i);
}

auto NamedVector::operator()(const int i) const -> double
{
    return vals(i);
}

auto NamedVector::at(const std::string& name) -> double&
{
    return vals(ax.index(name));
}

auto NamedVector::at(const std::string& name) const -> double
{
    return vals(ax.index(name));
}

auto NamedVector::hasNaN() const -> bool
{
    return vals.hasNaN();
}

auto operator+(const NamedVector& a, const NamedVector& b) -> NamedVector
{
    checkAligned(a.axis(), b.axis(), "vector addition");
    return { a.axis(), a.values() + b.values() };
}

auto operator-(const NamedVector& a, const NamedVector& b) -> NamedVector
{
    checkAligned(a.axis(), b.axis(), "vector subtraction");
    return { a.axis(), a.values() - b.values() };
}

auto concat(const NamedVector& a, const NamedVector& b) -> NamedVector
{
    Eigen::VectorXd joined(a.size() + b.size());
    joined.head(a.size()) = a.values();
    joined.tail(b.size()) = b.values();
    return { concat(a.axis(), b.axis()), joined };
}

NamedMatrix::NamedMatrix(const Axis& rows,
                         const Axis& cols,
                         const Eigen::MatrixXd& values)
  : row_ax { rows }, col_ax { cols }, vals { values }
{
    if (row_ax.size() != vals.rows() || col_ax.size() != vals.cols()) {
        throw ConfigurationError {
            "matrix of shape (" + std::to_string(vals.rows()) + ", "
            + std::to_string(vals.cols()) + ") does not match axes ("
            + row_ax.str() + ") x (" + col_ax.str() + ')'
        };
    }
}

NamedMatrix::NamedMatrix(const std::vector<std::string>& rows,
                         const std::vector<std::string>& cols,
                         const Eigen::MatrixXd& values)
  : NamedMatrix { Axis { rows }, Axis { cols }, values }
{}

NamedMatrix::NamedMatrix(const Axis& axis, const Eigen::MatrixXd& values)
  : NamedMatrix { axis, axis, values }
{}

NamedMatrix::NamedMatrix(const std::vector<std::string>& names,
                         const Eigen::MatrixXd& values)
  : NamedMatrix { Axis { names }, values }
{}

auto NamedMatrix::constant(const Axis& rows,
                           const Axis& cols,
                           const double value) -> NamedMatrix
{
    return { rows,
             cols,
             Eigen::MatrixXd::Constant(rows.size(), cols.size(), value) };
}

auto NamedMatrix::rows() const -> const Axis&
{
    return row_ax;
}

auto NamedMatrix::cols() const -> const Axis&
{
    return col_ax;
}

auto NamedMatrix::values() const -> const Eigen::MatrixXd&
{
    return vals;
}

auto NamedMatrix::operator()(const int i, const int j) const -> double
{
    return vals(i, j);
}

auto NamedMatrix::at(const std::string& row,
                     const std::string& col) const -> double
{
    return vals(row_ax.index(row), col_ax.index(col));
}

auto NamedMatrix::isSquare() const -> bool
{
    return row_ax == col_ax;
}

auto NamedMatrix::diagonal() const -> NamedVector
{
    checkAligned(row_ax, col_ax, "matrix diagonal");
    return { row_ax, vals.diagonal() };
}

auto NamedMatrix::hasNaN() const -> bool
{
    return vals.hasNaN();
}

} // namespace oem
