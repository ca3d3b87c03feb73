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

#ifndef CORE_SHIFT_H
#define CORE_SHIFT_H
#include <array>

namespace hopchain {
namespace shift {

// A shift is one step of -1, 0 or +1 along each axis. The 27 possible
// shifts are numbered 9*(sx+1) + 3*(sy+1) + (sz+1), so 13 is "no shift"
// and the opposite of shift i is 26-i.
constexpr int nShifts = 27;
constexpr int iSelf   = 13;

struct vector {
    int s[3];
    constexpr int operator[](int d) const { return s[d]; }
};

constexpr int index(int sx,int sy,int sz) {
    return 9*(sx+1) + 3*(sy+1) + (sz+1);
}
constexpr int opposite(int i) { return nShifts - 1 - i; }

namespace detail {
constexpr std::array<vector,nShifts> make_table() {
    std::array<vector,nShifts> t {};
    for (int i=0; i<nShifts; ++i) {
        t[i] = vector{{i/9 - 1, (i/3)%3 - 1, i%3 - 1}};
    }
    return t;
}
}

inline constexpr std::array<vector,nShifts> table = detail::make_table();

static_assert(index(0,0,0) == iSelf);
static_assert(table[opposite(index(1,-1,0))][0] == -1);

} // namespace shift
} // namespace hopchain

#endif
