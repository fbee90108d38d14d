// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

/// @file
/// @brief 2x2 complex Jones matrices in general, diagonal and Hermitian form.

#ifndef SELFCAL_COMMON_JONESMATRIX_H_
#define SELFCAL_COMMON_JONESMATRIX_H_

#include <complex>
#include <cstddef>
#include <ostream>
#include <random>
#include <stdexcept>
#include <string>

#include <xtensor/xfixed.hpp>

namespace selfcal::common {

/// Thrown by Inverse() and the division operators when the determinant of the
/// matrix is exactly zero.
class SingularMatrixError : public std::runtime_error {
 public:
  explicit SingularMatrixError(const std::string& what)
      : std::runtime_error(what) {}
};

class DiagonalJonesMatrix;
class HermitianJonesMatrix;

/**
 * General 2x2 complex matrix
 * @code
 *   [ xx xy ]
 *   [ yx yy ]
 * @endcode
 * describing the response of an antenna (or a medium) to polarized signal.
 */
class JonesMatrix {
 public:
  using Complex = std::complex<double>;

  constexpr JonesMatrix() : xx_(), xy_(), yx_(), yy_() {}
  constexpr JonesMatrix(Complex xx, Complex xy, Complex yx, Complex yy)
      : xx_(xx), xy_(xy), yx_(yx), yy_(yy) {}

  /// Promotes a diagonal matrix, off-diagonal terms become zero.
  explicit JonesMatrix(const DiagonalJonesMatrix& diagonal);
  /// Promotes a Hermitian matrix, yx is set to conj(xy).
  explicit JonesMatrix(const HermitianJonesMatrix& hermitian);

  static constexpr JonesMatrix Zero() { return JonesMatrix(); }
  static constexpr JonesMatrix Identity() {
    return JonesMatrix(1.0, 0.0, 0.0, 1.0);
  }
  /// Every element drawn from U(0, 1) for the real and imaginary part.
  static JonesMatrix Random(std::mt19937& rng);

  Complex Xx() const { return xx_; }
  Complex Xy() const { return xy_; }
  Complex Yx() const { return yx_; }
  Complex Yy() const { return yy_; }

  /// Element by 1-based column-major linear index: 1=xx, 2=yx, 3=xy, 4=yy.
  /// Throws std::out_of_range for any other index.
  Complex Element(size_t index) const;

  JonesMatrix& operator+=(const JonesMatrix& rhs) {
    xx_ += rhs.xx_;
    xy_ += rhs.xy_;
    yx_ += rhs.yx_;
    yy_ += rhs.yy_;
    return *this;
  }

  JonesMatrix& operator-=(const JonesMatrix& rhs) {
    xx_ -= rhs.xx_;
    xy_ -= rhs.xy_;
    yx_ -= rhs.yx_;
    yy_ -= rhs.yy_;
    return *this;
  }

  JonesMatrix& operator*=(Complex factor) {
    xx_ *= factor;
    xy_ *= factor;
    yx_ *= factor;
    yy_ *= factor;
    return *this;
  }

  Complex Determinant() const { return xx_ * yy_ - xy_ * yx_; }

  /// Inverts the matrix in place.
  /// @returns false when the matrix is singular, in which case it is left
  /// unchanged.
  bool Invert() {
    const Complex determinant = Determinant();
    if (determinant == Complex(0.0, 0.0)) return false;
    const Complex reciprocal = 1.0 / determinant;
    const Complex xx = yy_ * reciprocal;
    xy_ = -xy_ * reciprocal;
    yx_ = -yx_ * reciprocal;
    yy_ = xx_ * reciprocal;
    xx_ = xx;
    return true;
  }

  JonesMatrix Conj() const {
    return JonesMatrix(std::conj(xx_), std::conj(xy_), std::conj(yx_),
                       std::conj(yy_));
  }
  JonesMatrix Transpose() const { return JonesMatrix(xx_, yx_, xy_, yy_); }
  JonesMatrix HermitianTranspose() const {
    return JonesMatrix(std::conj(xx_), std::conj(yx_), std::conj(xy_),
                       std::conj(yy_));
  }

  /// Squared Frobenius norm.
  double Norm() const {
    return std::norm(xx_) + std::norm(xy_) + std::norm(yx_) + std::norm(yy_);
  }

  bool IsZero() const {
    return xx_ == Complex() && xy_ == Complex() && yx_ == Complex() &&
           yy_ == Complex();
  }

  bool operator==(const JonesMatrix& rhs) const {
    return xx_ == rhs.xx_ && xy_ == rhs.xy_ && yx_ == rhs.yx_ &&
           yy_ == rhs.yy_;
  }
  bool operator!=(const JonesMatrix& rhs) const { return !(*this == rhs); }

 private:
  Complex xx_;
  Complex xy_;
  Complex yx_;
  Complex yy_;
};

/**
 * Jones matrix without off-diagonal terms. Used for the complex gains of an
 * antenna when polarization leakage is ignored.
 */
class DiagonalJonesMatrix {
 public:
  using Complex = std::complex<double>;

  constexpr DiagonalJonesMatrix() : xx_(), yy_() {}
  constexpr DiagonalJonesMatrix(Complex xx, Complex yy) : xx_(xx), yy_(yy) {}

  static constexpr DiagonalJonesMatrix Zero() { return DiagonalJonesMatrix(); }
  static constexpr DiagonalJonesMatrix Identity() {
    return DiagonalJonesMatrix(1.0, 1.0);
  }
  /// Diagonal drawn from U(0, 1), real valued.
  static DiagonalJonesMatrix Random(std::mt19937& rng);

  Complex Xx() const { return xx_; }
  Complex Yy() const { return yy_; }

  /// Same indexing as JonesMatrix::Element(); indices 2 and 3 return zero.
  Complex Element(size_t index) const;

  DiagonalJonesMatrix& operator+=(const DiagonalJonesMatrix& rhs) {
    xx_ += rhs.xx_;
    yy_ += rhs.yy_;
    return *this;
  }

  DiagonalJonesMatrix& operator-=(const DiagonalJonesMatrix& rhs) {
    xx_ -= rhs.xx_;
    yy_ -= rhs.yy_;
    return *this;
  }

  Complex Determinant() const { return xx_ * yy_; }

  /// @returns false when one of the diagonal elements is zero.
  bool Invert() {
    if (xx_ == Complex() || yy_ == Complex()) return false;
    xx_ = 1.0 / xx_;
    yy_ = 1.0 / yy_;
    return true;
  }

  DiagonalJonesMatrix Conj() const {
    return DiagonalJonesMatrix(std::conj(xx_), std::conj(yy_));
  }
  DiagonalJonesMatrix Transpose() const { return *this; }
  DiagonalJonesMatrix HermitianTranspose() const { return Conj(); }

  double Norm() const { return std::norm(xx_) + std::norm(yy_); }

  bool IsZero() const { return xx_ == Complex() && yy_ == Complex(); }

  bool operator==(const DiagonalJonesMatrix& rhs) const {
    return xx_ == rhs.xx_ && yy_ == rhs.yy_;
  }
  bool operator!=(const DiagonalJonesMatrix& rhs) const {
    return !(*this == rhs);
  }

 private:
  Complex xx_;
  Complex yy_;
};

/**
 * Hermitian Jones matrix
 * @code
 *   [ xx       xy ]
 *   [ conj(xy) yy ]
 * @endcode
 * with real xx and yy. Used for the xx, xy, yx and yy flux of a source. Only
 * the independent terms are stored, so the result of Hermitian arithmetic is
 * Hermitian regardless of rounding.
 */
class HermitianJonesMatrix {
 public:
  using Complex = std::complex<double>;

  constexpr HermitianJonesMatrix() : xx_(), xy_(), yy_() {}
  constexpr HermitianJonesMatrix(double xx, Complex xy, double yy)
      : xx_(xx), xy_(xy), yy_(yy) {}

  static constexpr HermitianJonesMatrix Zero() {
    return HermitianJonesMatrix();
  }
  static constexpr HermitianJonesMatrix Identity() {
    return HermitianJonesMatrix(1.0, 0.0, 1.0);
  }
  static HermitianJonesMatrix Random(std::mt19937& rng);

  double Xx() const { return xx_; }
  Complex Xy() const { return xy_; }
  Complex Yx() const { return std::conj(xy_); }
  double Yy() const { return yy_; }

  /// Same indexing as JonesMatrix::Element(); index 2 returns conj(xy).
  Complex Element(size_t index) const;

  HermitianJonesMatrix& operator+=(const HermitianJonesMatrix& rhs) {
    xx_ += rhs.xx_;
    xy_ += rhs.xy_;
    yy_ += rhs.yy_;
    return *this;
  }

  HermitianJonesMatrix& operator-=(const HermitianJonesMatrix& rhs) {
    xx_ -= rhs.xx_;
    xy_ -= rhs.xy_;
    yy_ -= rhs.yy_;
    return *this;
  }

  double Determinant() const { return xx_ * yy_ - std::norm(xy_); }

  bool Invert() {
    const double determinant = Determinant();
    if (determinant == 0.0) return false;
    const double xx = yy_ / determinant;
    xy_ = -xy_ / determinant;
    yy_ = xx_ / determinant;
    xx_ = xx;
    return true;
  }

  HermitianJonesMatrix Conj() const {
    return HermitianJonesMatrix(xx_, std::conj(xy_), yy_);
  }
  HermitianJonesMatrix Transpose() const { return Conj(); }
  HermitianJonesMatrix HermitianTranspose() const { return *this; }

  double Norm() const { return xx_ * xx_ + 2.0 * std::norm(xy_) + yy_ * yy_; }

  bool operator==(const HermitianJonesMatrix& rhs) const {
    return xx_ == rhs.xx_ && xy_ == rhs.xy_ && yy_ == rhs.yy_;
  }
  bool operator!=(const HermitianJonesMatrix& rhs) const {
    return !(*this == rhs);
  }

 private:
  double xx_;
  Complex xy_;
  double yy_;
};

inline JonesMatrix::JonesMatrix(const DiagonalJonesMatrix& diagonal)
    : xx_(diagonal.Xx()), xy_(), yx_(), yy_(diagonal.Yy()) {}

inline JonesMatrix::JonesMatrix(const HermitianJonesMatrix& hermitian)
    : xx_(hermitian.Xx()),
      xy_(hermitian.Xy()),
      yx_(hermitian.Yx()),
      yy_(hermitian.Yy()) {}

// Same-shape addition and subtraction.

inline JonesMatrix operator+(JonesMatrix lhs, const JonesMatrix& rhs) {
  return lhs += rhs;
}
inline JonesMatrix operator-(JonesMatrix lhs, const JonesMatrix& rhs) {
  return lhs -= rhs;
}
inline DiagonalJonesMatrix operator+(DiagonalJonesMatrix lhs,
                                     const DiagonalJonesMatrix& rhs) {
  return lhs += rhs;
}
inline DiagonalJonesMatrix operator-(DiagonalJonesMatrix lhs,
                                     const DiagonalJonesMatrix& rhs) {
  return lhs -= rhs;
}
inline HermitianJonesMatrix operator+(HermitianJonesMatrix lhs,
                                      const HermitianJonesMatrix& rhs) {
  return lhs += rhs;
}
inline HermitianJonesMatrix operator-(HermitianJonesMatrix lhs,
                                      const HermitianJonesMatrix& rhs) {
  return lhs -= rhs;
}

// Scaling.

inline JonesMatrix operator*(JonesMatrix lhs, std::complex<double> factor) {
  return lhs *= factor;
}
inline JonesMatrix operator*(std::complex<double> factor, JonesMatrix rhs) {
  return rhs *= factor;
}
inline JonesMatrix operator/(JonesMatrix lhs, std::complex<double> divisor) {
  return lhs *= 1.0 / divisor;
}

inline DiagonalJonesMatrix operator*(const DiagonalJonesMatrix& lhs,
                                     std::complex<double> factor) {
  return DiagonalJonesMatrix(lhs.Xx() * factor, lhs.Yy() * factor);
}
inline DiagonalJonesMatrix operator*(std::complex<double> factor,
                                     const DiagonalJonesMatrix& rhs) {
  return rhs * factor;
}
inline DiagonalJonesMatrix operator/(const DiagonalJonesMatrix& lhs,
                                     std::complex<double> divisor) {
  return DiagonalJonesMatrix(lhs.Xx() / divisor, lhs.Yy() / divisor);
}

/// A real factor keeps the matrix Hermitian.
inline HermitianJonesMatrix operator*(const HermitianJonesMatrix& lhs,
                                      double factor) {
  return HermitianJonesMatrix(lhs.Xx() * factor, lhs.Xy() * factor,
                              lhs.Yy() * factor);
}
inline HermitianJonesMatrix operator*(double factor,
                                      const HermitianJonesMatrix& rhs) {
  return rhs * factor;
}
inline HermitianJonesMatrix operator/(const HermitianJonesMatrix& lhs,
                                      double divisor) {
  return HermitianJonesMatrix(lhs.Xx() / divisor, lhs.Xy() / divisor,
                              lhs.Yy() / divisor);
}
/// A complex factor does not, the result is a general matrix.
inline JonesMatrix operator*(const HermitianJonesMatrix& lhs,
                             std::complex<double> factor) {
  return JonesMatrix(lhs) * factor;
}
inline JonesMatrix operator*(std::complex<double> factor,
                             const HermitianJonesMatrix& rhs) {
  return JonesMatrix(rhs) * factor;
}
inline JonesMatrix operator/(const HermitianJonesMatrix& lhs,
                             std::complex<double> divisor) {
  return JonesMatrix(lhs) / divisor;
}

// Products. Mixed shapes promote to the general matrix, except for two
// diagonal matrices. The product of two Hermitian matrices is in general not
// Hermitian.

inline JonesMatrix operator*(const JonesMatrix& lhs, const JonesMatrix& rhs) {
  return JonesMatrix(lhs.Xx() * rhs.Xx() + lhs.Xy() * rhs.Yx(),
                     lhs.Xx() * rhs.Xy() + lhs.Xy() * rhs.Yy(),
                     lhs.Yx() * rhs.Xx() + lhs.Yy() * rhs.Yx(),
                     lhs.Yx() * rhs.Xy() + lhs.Yy() * rhs.Yy());
}

inline JonesMatrix operator*(const JonesMatrix& lhs,
                             const DiagonalJonesMatrix& rhs) {
  return JonesMatrix(lhs.Xx() * rhs.Xx(), lhs.Xy() * rhs.Yy(),
                     lhs.Yx() * rhs.Xx(), lhs.Yy() * rhs.Yy());
}

inline JonesMatrix operator*(const DiagonalJonesMatrix& lhs,
                             const JonesMatrix& rhs) {
  return JonesMatrix(lhs.Xx() * rhs.Xx(), lhs.Xx() * rhs.Xy(),
                     lhs.Yy() * rhs.Yx(), lhs.Yy() * rhs.Yy());
}

inline DiagonalJonesMatrix operator*(const DiagonalJonesMatrix& lhs,
                                     const DiagonalJonesMatrix& rhs) {
  return DiagonalJonesMatrix(lhs.Xx() * rhs.Xx(), lhs.Yy() * rhs.Yy());
}

inline JonesMatrix operator*(const HermitianJonesMatrix& lhs,
                             const HermitianJonesMatrix& rhs) {
  return JonesMatrix(lhs) * JonesMatrix(rhs);
}

inline JonesMatrix operator*(const HermitianJonesMatrix& lhs,
                             const JonesMatrix& rhs) {
  return JonesMatrix(lhs) * rhs;
}

inline JonesMatrix operator*(const JonesMatrix& lhs,
                             const HermitianJonesMatrix& rhs) {
  return lhs * JonesMatrix(rhs);
}

inline JonesMatrix operator*(const DiagonalJonesMatrix& lhs,
                             const HermitianJonesMatrix& rhs) {
  return lhs * JonesMatrix(rhs);
}

inline JonesMatrix operator*(const HermitianJonesMatrix& lhs,
                             const DiagonalJonesMatrix& rhs) {
  return JonesMatrix(lhs) * rhs;
}

// Inversion and division. These throw SingularMatrixError; use the Invert()
// members to test for singularity without an exception.

JonesMatrix Inverse(const JonesMatrix& matrix);
DiagonalJonesMatrix Inverse(const DiagonalJonesMatrix& matrix);
HermitianJonesMatrix Inverse(const HermitianJonesMatrix& matrix);

inline JonesMatrix operator/(const JonesMatrix& lhs, const JonesMatrix& rhs) {
  return lhs * Inverse(rhs);
}
inline DiagonalJonesMatrix operator/(const DiagonalJonesMatrix& lhs,
                                     const DiagonalJonesMatrix& rhs) {
  return lhs * Inverse(rhs);
}

/// Scalar divided by a matrix: factor * Inverse(matrix).
inline JonesMatrix operator/(std::complex<double> factor,
                             const JonesMatrix& matrix) {
  return factor * Inverse(matrix);
}
inline DiagonalJonesMatrix operator/(std::complex<double> factor,
                                     const DiagonalJonesMatrix& matrix) {
  return factor * Inverse(matrix);
}
inline HermitianJonesMatrix operator/(double factor,
                                      const HermitianJonesMatrix& matrix) {
  return factor * Inverse(matrix);
}
inline JonesMatrix operator/(std::complex<double> factor,
                             const HermitianJonesMatrix& matrix) {
  return factor * Inverse(matrix);
}

/// Kronecker product lhs (x) rhs, a 4x4 matrix in row-major order.
xt::xtensor_fixed<std::complex<double>, xt::xshape<4, 4>> Kronecker(
    const JonesMatrix& lhs, const JonesMatrix& rhs);

/**
 * Computes J K J^H. Unlike multiplying out the product, the diagonal of the
 * result is accumulated from real-valued terms, so the result is exactly
 * Hermitian.
 */
HermitianJonesMatrix CongruenceTransform(const JonesMatrix& j,
                                         const HermitianJonesMatrix& k);

/**
 * Forces a matrix to be Hermitian. The diagonal keeps its real part and the
 * off-diagonal becomes the average of xy and conj(yx). This is an
 * approximation: any anti-Hermitian part of the input is discarded.
 */
HermitianJonesMatrix MakeHermitian(const JonesMatrix& matrix);
HermitianJonesMatrix MakeHermitian(const DiagonalJonesMatrix& matrix);
inline HermitianJonesMatrix MakeHermitian(const HermitianJonesMatrix& matrix) {
  return matrix;
}

/// Drops the off-diagonal terms.
inline DiagonalJonesMatrix Diagonal(const JonesMatrix& matrix) {
  return DiagonalJonesMatrix(matrix.Xx(), matrix.Yy());
}

std::ostream& operator<<(std::ostream& stream, const JonesMatrix& matrix);
std::ostream& operator<<(std::ostream& stream,
                         const DiagonalJonesMatrix& matrix);
std::ostream& operator<<(std::ostream& stream,
                         const HermitianJonesMatrix& matrix);

}  // namespace selfcal::common

#endif  // SELFCAL_COMMON_JONESMATRIX_H_
