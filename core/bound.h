/*  This file is part of PKDGRAV3 (http://www.pkdgrav.org/).
 *  Copyright (c) 2001-2018 Joachim Stadel & Douglas Potter
 *
 *  PKDGRAV3 is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  PKDGRAV3 is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with PKDGRAV3.  If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef CORE_BOUND_H
#define CORE_BOUND_H
#include <ostream>
#include <type_traits>
#include "blitz/array.h"
#include "shift.h"

namespace hopchain {

/// @brief Axis aligned box with an inclusive lower and exclusive upper corner
/// @tparam T Coordinate type
template<typename T>
class BoundBaseMinMax {
public:
    using value_type = T;
    using coord_type = blitz::TinyVector<value_type,3>;
protected:
    coord_type fLower;
    coord_type fUpper;
public:
    BoundBaseMinMax() = default;
    BoundBaseMinMax(const BoundBaseMinMax &) = default;
    BoundBaseMinMax(coord_type lower, coord_type upper) : fLower(lower), fUpper(upper) {}

    coord_type      apothem()     const {return (upper()-lower())/2;}
    coord_type      width()       const {return upper()-lower();}
    value_type      width(int d)  const {return upper(d)-lower(d);}
    coord_type      lower()       const {return fLower;}
    value_type      lower(int d)  const {return fLower[d];}
    coord_type      upper()       const {return fUpper;}
    value_type      upper(int d)  const {return fUpper[d];}
    coord_type      center()      const {return lower()/2 + upper()/2;}
    value_type      center(int d) const {return lower(d)/2 + upper(d)/2;}
    value_type      minside()     const {return blitz::min(width());}
    value_type      maxside()     const {return blitz::max(width());}
    int             maxdim()      const {
        auto fMax = width();
        return (fMax[0]>fMax[2]) ? (fMax[0]>fMax[1]?0:1) : (fMax[2]>fMax[1]?2:1);
    }
    /// @brief True when the box has positive extent along every axis
    bool valid() const {
        for (auto d=0; d<3; ++d) if (!(fUpper[d] > fLower[d])) return false;
        return true;
    }
    value_type mindist(coord_type r) const {
        coord_type x = blitz::abs(center()-r) - apothem();
        x = blitz::where(x>0.0,x,0.0);
        return blitz::dot(x,x);
    }
    value_type maxdist(coord_type r) const {
        coord_type x = blitz::abs(center()-r) + apothem();
        return blitz::dot(x,x);
    }
    /// @brief Is r inside the half open box [lower,upper) on every axis
    bool contains(coord_type r) const {
        for (auto d=0; d<3; ++d) {
            if (r[d] < fLower[d] || r[d] >= fUpper[d]) return false;
        }
        return true;
    }
    /// @brief Shift code of a position relative to this box
    /// @param r position
    /// @return shift::index of (+1 if r>=upper, -1 if r<lower, else 0) per axis
    int shift(coord_type r) const {
        int s[3];
        for (auto d=0; d<3; ++d) {
            if      (r[d] >= fUpper[d]) s[d] = 1;
            else if (r[d] <  fLower[d]) s[d] = -1;
            else                        s[d] = 0;
        }
        return shift::index(s[0],s[1],s[2]);
    }
    /// @brief Grow the box by a margin on every side
    BoundBaseMinMax expand(value_type margin) const {
        return BoundBaseMinMax(fLower - margin, fUpper + margin);
    }
    /// @brief Combine two bounds to form a new bound containing both
    BoundBaseMinMax combine(const BoundBaseMinMax &rhs) const {
        return BoundBaseMinMax(blitz::min(lower(),rhs.lower()),blitz::max(upper(),rhs.upper()));
    }

    template<typename D>
    friend std::ostream &operator<<(std::ostream &os, const BoundBaseMinMax<D> &b);
};

template<typename D>
inline std::ostream &operator<<(std::ostream &os, const BoundBaseMinMax<D> &b) {
    os << "[" << b.lower() << "," << b.upper() << "]";
    return os;
}

using Bound = BoundBaseMinMax<double>;
static_assert(std::is_standard_layout<Bound>());

} // namespace hopchain

#endif
