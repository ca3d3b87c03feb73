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

#include "exchangelinks.h"
#include <algorithm>

static_assert(is_message<ServiceExchangeLinks::input>() && is_message<ServiceExchangeLinks::output>());

int ServiceExchangeLinks::Service(PST pst,void *vin,int nIn,void *vout,int nOut) {
    auto in = static_cast<input *>(vin);
    auto out = static_cast<output *>(vout);
    assert(nIn == sizeof(input));
    *out = hopchain::ExchangeRound(*pst->plcl->part,pst->mdl);
    pst->mdl->mdl_printf("Exchange round %d: %llu changed, %llu sent\n",in->iRound,
                         static_cast<unsigned long long>(out->nChanged),
                         static_cast<unsigned long long>(out->nSent));
    return sizeof(output);
}

int ServiceExchangeLinks::Combine(void *vout,void *vout2) {
    auto out  = static_cast<output *>(vout);
    auto out2 = static_cast<output *>(vout2);
    out->nChanged = std::max(out->nChanged,out2->nChanged);
    out->nSent = std::max(out->nSent,out2->nSent);
    out->nDropped = std::max(out->nDropped,out2->nDropped);
    return sizeof(output);
}
