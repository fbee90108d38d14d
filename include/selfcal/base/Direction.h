// Copyright (C) 2025 ASTRON (Netherlands Institute for Radio Astronomy)
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SELFCAL_BASE_DIRECTION_H_
#define SELFCAL_BASE_DIRECTION_H_

#include <array>
#include <cmath>

namespace selfcal::base {

/// \brief A direction on the celestial sphere.
struct Direction {
  constexpr Direction() : ra(0.0), dec(0.0) {}

  /**
   * @param ra Right ascension in radians
   * @param dec Declination in radians
   */
  constexpr Direction(double _ra, double _dec) : ra(_ra), dec(_dec) {}

  double ra;   ///< Right ascension in radians
  double dec;  ///< Declination in radians
};

/**
 * Compute LMN coordinates of \p direction relative to \p reference.
 * \f{eqnarray*}{
 *   \ell &= \cos(\delta) \sin(\alpha - \alpha_0) \\
 *      m &= \sin(\delta) \cos(\delta_0) - \cos(\delta) \sin(\delta_0)
 *                                         \cos(\alpha - \alpha_0) \\
 *      n &= \sin(\delta) \sin(\delta_0) + \cos(\delta) \cos(\delta_0)
 *                                         \cos(\alpha - \alpha_0)
 * \f}
 * n is computed directly rather than as sqrt(1 - l^2 - m^2), so that it
 * keeps its sign for directions below the horizon of the phase centre.
 */
inline std::array<double, 3> RaDecToLmn(const Direction& reference,
                                        const Direction& direction) {
  const double delta_ra = direction.ra - reference.ra;
  const double sin_delta_ra = std::sin(delta_ra);
  const double cos_delta_ra = std::cos(delta_ra);
  const double sin_dec = std::sin(direction.dec);
  const double cos_dec = std::cos(direction.dec);
  const double sin_dec0 = std::sin(reference.dec);
  const double cos_dec0 = std::cos(reference.dec);

  return {cos_dec * sin_delta_ra,
          sin_dec * cos_dec0 - cos_dec * sin_dec0 * cos_delta_ra,
          sin_dec * sin_dec0 + cos_dec * cos_dec0 * cos_delta_ra};
}

}  // namespace selfcal::base

#endif  // SELFCAL_BASE_DIRECTION_H_
