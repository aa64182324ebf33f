// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Vectors and matrices whose axes carry the names of their
// elements. Example:
//
//   const NamedVector x_a { { "lwp", "r_eff" }, Eigen::Vector2d { 50, 8 } };
//   const double lwp { x_a.at("lwp") };
//
// Each axis is an ordered list of unique names. Whenever two named
// objects are combined their axes must be identical, i.e. the same
// names in the same order. Differently ordered axes are never
// reconciled silently and raise std::invalid_argument.

#pragma once

#include <Eigen/Dense>
#include <map>
#include <string>
#include <vector>

namespace oem {

class Axis
{
private:
    std::vector<std::string> labels {};
    // Name to position lookup
    std::map<std::string, int> positions {};

public:
    Axis() = default;
    // Throws ConfigurationError if the names are not unique
    explicit Axis(const std::vector<std::string>& names);
    [[nodiscard]] auto size() const -> int;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto names() const -> const std::vector<std::string>&;
    [[nodiscard]] auto name(const int i) const -> const std::string&;
    // Position of a name. Throws std::out_of_range for an unknown name.
    [[nodiscard]] auto index(const std::string& name) const -> int;
    [[nodiscard]] auto contains(const std::string& name) const -> bool;
    [[nodiscard]] auto operator==(const Axis& other) const -> bool;
    // Comma separated list of names, for messages
    [[nodiscard]] auto str() const -> std::string;
    ~Axis() = default;
};

// Append the names of b to those of a. Throws ConfigurationError if a
// name occurs in both.
[[nodiscard]] auto concat(const Axis& a, const Axis& b) -> Axis;

// Throw std::invalid_argument unless a and b are identical. The
// context is included in the error message.
auto checkAligned(const Axis& a,
                  const Axis& b,
                  const std::string& context) -> void;

class NamedVector
{
private:
    Axis ax {};
    Eigen::VectorXd vals {};

public:
    NamedVector() = default;
    // Throws ConfigurationError if the lengths differ
    NamedVector(const Axis& axis, const Eigen::VectorXd& values);
    NamedVector(const std::vector<std::string>& names,
                const Eigen::VectorXd& values);
    // Vector with all elements set to value
    [[nodiscard]] static auto constant(const Axis& axis,
                                       const double value) -> NamedVector;
    [[nodiscard]] auto axis() const -> const Axis&;
    [[nodiscard]] auto names() const -> const std::vector<std::string>&;
    [[nodiscard]] auto size() const -> int;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto values() const -> const Eigen::VectorXd&;
    auto operator()(const int i) -> double&;
    [[nodiscard]] auto operator()(const int i) const -> double;
    auto at(const std::string& name) -> double&;
    [[nodiscard]] auto at(const std::string& name) const -> double;
    [[nodiscard]] auto hasNaN() const -> bool;
    ~NamedVector() = default;
};

[[nodiscard]] auto operator+(const NamedVector& a,
                             const NamedVector& b) -> NamedVector;
[[nodiscard]] auto operator-(const NamedVector& a,
                             const NamedVector& b) -> NamedVector;

// Join two vectors, e.g. the state vector x and the parameter vector b
[[nodiscard]] auto concat(const NamedVector& a,
                          const NamedVector& b) -> NamedVector;

class NamedMatrix
{
private:
    Axis row_ax {};
    Axis col_ax {};
    Eigen::MatrixXd vals {};

public:
    NamedMatrix() = default;
    // Throws ConfigurationError if the shape does not match the axes
    NamedMatrix(const Axis& rows,
                const Axis& cols,
                const Eigen::MatrixXd& values);
    NamedMatrix(const std::vector<std::string>& rows,
                const std::vector<std::string>& cols,
                const Eigen::MatrixXd& values);
    // Square matrix, e.g. a covariance, with the same axis for rows
    // and columns.
    NamedMatrix(const Axis& axis, const Eigen::MatrixXd& values);
    NamedMatrix(const std::vector<std::string>& names,
                const Eigen::MatrixXd& values);
    [[nodiscard]] static auto constant(const Axis& rows,
                                       const Axis& cols,
                                       const double value) -> NamedMatrix;
    [[nodiscard]] auto rows() const -> const Axis&;
    [[nodiscard]] auto cols() const -> const Axis&;
    [[nodiscard]] auto values() const -> const Eigen::MatrixXd&;
    [[nodiscard]] auto operator()(const int i, const int j) const -> double;
    [[nodiscard]] auto at(const std::string& row,
                          const std::string& col) const -> double;
    // Whether both axes are identical
    [[nodiscard]] auto isSquare() const -> bool;
    // Diagonal of a square matrix. Throws std::invalid_argument if the
    // row and column axes differ.
    [[nodiscard]] auto diagonal() const -> NamedVector;
    [[nodiscard]] auto hasNaN() const -> bool;
    ~NamedMatrix() = default;
};

} // namespace oem
