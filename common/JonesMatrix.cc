// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#include "JonesMatrix.h"

#include <string>

namespace selfcal::common {

namespace {

std::complex<double> RandomComplex(std::mt19937& rng) {
  std::uniform_real_distribution<double> distribution(0.0, 1.0);
  const double real = distribution(rng);
  const double imaginary = distribution(rng);
  return std::complex<double>(real, imaginary);
}

void CheckElementIndex(size_t index) {
  if (index < 1 || index > 4) {
    throw std::out_of_range("Jones matrix element index " +
                            std::to_string(index) +
                            " is out of range, valid indices are 1 to 4");
  }
}

}  // namespace

JonesMatrix JonesMatrix::Random(std::mt19937& rng) {
  const Complex xx = RandomComplex(rng);
  const Complex xy = RandomComplex(rng);
  const Complex yx = RandomComplex(rng);
  const Complex yy = RandomComplex(rng);
  return JonesMatrix(xx, xy, yx, yy);
}

JonesMatrix::Complex JonesMatrix::Element(size_t index) const {
  CheckElementIndex(index);
  switch (index) {
    case 1:
      return xx_;
    case 2:
      return yx_;
    case 3:
      return xy_;
    default:
      return yy_;
  }
}

DiagonalJonesMatrix DiagonalJonesMatrix::Random(std::mt19937& rng) {
  std::uniform_real_distribution<double> distribution(0.0, 1.0);
  const double xx = distribution(rng);
  const double yy = distribution(rng);
  return DiagonalJonesMatrix(xx, yy);
}

DiagonalJonesMatrix::Complex DiagonalJonesMatrix::Element(size_t index) const {
  CheckElementIndex(index);
  switch (index) {
    case 1:
      return xx_;
    case 4:
      return yy_;
    default:
      return Complex();
  }
}

HermitianJonesMatrix HermitianJonesMatrix::Random(std::mt19937& rng) {
  std::uniform_real_distribution<double> distribution(0.0, 1.0);
  const double xx = distribution(rng);
  const Complex xy = RandomComplex(rng);
  const double yy = distribution(rng);
  return HermitianJonesMatrix(xx, xy, yy);
}

HermitianJonesMatrix::Complex HermitianJonesMatrix::Element(
    size_t index) const {
  CheckElementIndex(index);
  switch (index) {
    case 1:
      return xx_;
    case 2:
      return std::conj(xy_);
    case 3:
      return xy_;
    default:
      return yy_;
  }
}

JonesMatrix Inverse(const JonesMatrix& matrix) {
  JonesMatrix result(matrix);
  if (!result.Invert())
    throw SingularMatrixError("Can not invert singular Jones matrix");
  return result;
}

DiagonalJonesMatrix Inverse(const DiagonalJonesMatrix& matrix) {
  DiagonalJonesMatrix result(matrix);
  if (!result.Invert())
    throw SingularMatrixError("Can not invert singular diagonal Jones matrix");
  return result;
}

HermitianJonesMatrix Inverse(const HermitianJonesMatrix& matrix) {
  HermitianJonesMatrix result(matrix);
  if (!result.Invert())
    throw SingularMatrixError(
        "Can not invert singular Hermitian Jones matrix");
  return result;
}

xt::xtensor_fixed<std::complex<double>, xt::xshape<4, 4>> Kronecker(
    const JonesMatrix& lhs, const JonesMatrix& rhs) {
  const std::complex<double> a[2][2] = {{lhs.Xx(), lhs.Xy()},
                                        {lhs.Yx(), lhs.Yy()}};
  const std::complex<double> b[2][2] = {{rhs.Xx(), rhs.Xy()},
                                        {rhs.Yx(), rhs.Yy()}};
  xt::xtensor_fixed<std::complex<double>, xt::xshape<4, 4>> result;
  for (size_t i = 0; i != 2; ++i) {
    for (size_t j = 0; j != 2; ++j) {
      for (size_t k = 0; k != 2; ++k) {
        for (size_t l = 0; l != 2; ++l) {
          result(2 * i + k, 2 * j + l) = a[i][j] * b[k][l];
        }
      }
    }
  }
  return result;
}

HermitianJonesMatrix CongruenceTransform(const JonesMatrix& j,
                                         const HermitianJonesMatrix& k) {
  const std::complex<double> j_xx = j.Xx();
  const std::complex<double> j_xy = j.Xy();
  const std::complex<double> j_yx = j.Yx();
  const std::complex<double> j_yy = j.Yy();
  const double k_xx = k.Xx();
  const std::complex<double> k_xy = k.Xy();
  const double k_yy = k.Yy();

  const double xx = std::norm(j_xx) * k_xx +
                    2.0 * std::real(j_xx * std::conj(j_xy) * k_xy) +
                    std::norm(j_xy) * k_yy;
  const std::complex<double> xy = j_xx * std::conj(j_yx) * k_xx +
                                  j_xx * std::conj(j_yy) * k_xy +
                                  j_xy * std::conj(j_yx) * std::conj(k_xy) +
                                  j_xy * std::conj(j_yy) * k_yy;
  const double yy = std::norm(j_yx) * k_xx +
                    2.0 * std::real(j_yx * std::conj(j_yy) * k_xy) +
                    std::norm(j_yy) * k_yy;
  return HermitianJonesMatrix(xx, xy, yy);
}

HermitianJonesMatrix MakeHermitian(const JonesMatrix& matrix) {
  const std::complex<double> xy = 0.5 * (matrix.Xy() + std::conj(matrix.Yx()));
  return HermitianJonesMatrix(matrix.Xx().real(), xy, matrix.Yy().real());
}

HermitianJonesMatrix MakeHermitian(const DiagonalJonesMatrix& matrix) {
  return HermitianJonesMatrix(matrix.Xx().real(), 0.0, matrix.Yy().real());
}

std::ostream& operator<<(std::ostream& stream, const JonesMatrix& matrix) {
  stream << "[" << matrix.Xx() << ", " << matrix.Xy() << "; " << matrix.Yx()
         << ", " << matrix.Yy() << "]";
  return stream;
}

std::ostream& operator<<(std::ostream& stream,
                         const DiagonalJonesMatrix& matrix) {
  stream << "diag[" << matrix.Xx() << ", " << matrix.Yy() << "]";
  return stream;
}

std::ostream& operator<<(std::ostream& stream,
                         const HermitianJonesMatrix& matrix) {
  stream << "[" << matrix.Xx() << ", " << matrix.Xy() << "; " << matrix.Yx()
         << ", " << matrix.Yy() << "]";
  return stream;
}

}  // namespace selfcal::common
