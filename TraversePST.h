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

#ifndef TRAVERSEPST_H
#define TRAVERSEPST_H
#include "pst.h"
#include <type_traits>

// Service messages are copied byte for byte by MDL.
template<typename T>
constexpr bool is_message() {
    if constexpr (std::is_void<T>::value) return true;
    else return std::is_trivially_copyable<T>::value && std::is_standard_layout<T>::value;
}
template<typename T>
constexpr int message_size() {
    if constexpr (std::is_void<T>::value) return 0;
    else return sizeof(T);
}

// Runs a service on every leaf of the PST. Each inner node forwards the
// request to its upper half with Recurse() and descends into its lower half.
class TraversePST : public mdl::BasicService {
    PST node_pst;
public:
    TraversePST(PST node_pst,int service_id,int nInBytes,int nOutBytes,const char *service_name="")
        : BasicService(service_id,nInBytes,nOutBytes,service_name), node_pst(node_pst) {}
    virtual ~TraversePST() = default;
protected:
    virtual int operator()(int nIn, void *pIn, void *pOut) final;
    int Traverse(PST pst,void *vin,int nIn,void *vout,int nOut);
    virtual int Recurse(PST pst,void *vin,int nIn,void *vout,int nOut);
    virtual int Service(PST pst,void *vin,int nIn,void *vout,int nOut) = 0;
};

// The same input goes to every leaf; Combine() folds the reply of the
// upper half into the output of the lower half.
class TraverseCombinePST : public TraversePST {
public:
    TraverseCombinePST(PST node_pst,int service_id,int nInBytes,int nOutBytes,const char *service_name="")
        : TraversePST(node_pst,service_id,nInBytes,nOutBytes,service_name) {}
protected:
    virtual int Recurse(PST pst,void *vin,int nIn,void *vout,int nOut) final;
    virtual int Combine(void *vout,void *vout2) = 0;
};

// A partition service with typed messages. Either type may be void.
// Outputs from all leaves are summed with OUTPUT::operator+=.
template<class INPUT,class OUTPUT=void>
class TraversePartition : public TraverseCombinePST {
public:
    typedef INPUT input;
    typedef OUTPUT output;
    static_assert(is_message<input>(),"service input must be trivially copyable");
    static_assert(is_message<output>(),"service output must be trivially copyable");
    TraversePartition(PST pst,int service_id,const char *service_name)
        : TraverseCombinePST(pst,service_id,message_size<input>(),message_size<output>(),service_name) {}
protected:
    int Combine(void *vout,void *vout2) final {
        if constexpr (std::is_void<output>::value) return 0;
        else {
            *static_cast<output *>(vout) += *static_cast<const output *>(vout2);
            return sizeof(output);
        }
    }
};

#endif
