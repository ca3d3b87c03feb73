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

#ifndef PARAMETERS_HINCLUDED
#define PARAMETERS_HINCLUDED
#include "pyrameters.h"

/*
** The run parameters. Defaults are set by the constructor; a parameter
** file may override any of them. The interpreter must be running.
*/
class hop_parameters : public pyrameters {
public:
    hop_parameters();

    // Check ranges and relations between parameters; throws std::domain_error
    void validate() const;

    double dThreshold()       const {return get<double>("dThreshold");}
    double dSaddleFactor()    const {return get<double>("dSaddleFactor");}
    double dPeakFactor()      const {return get<double>("dPeakFactor");}
    double dSaddleThreshold() const {return dSaddleFactor() * dThreshold();}
    double dPeakThreshold()   const {return dPeakFactor() * dThreshold();}
    int    nSmooth()          const {return get<std::int64_t>("nSmooth");}
    int    nMerge()           const {return get<std::int64_t>("nMerge");}
    std::int64_t nMinMembers() const {return get<std::int64_t>("nMinMembers");}
    double dBoxSize()         const {return get<double>("dBoxSize");}
    double dPadding()         const {return get<double>("dPadding");}
    blitz::TinyVector<bool,3> bPeriodic() const {return get<blitz::TinyVector<bool,3>>("bPeriodic");}
    blitz::TinyVector<std::int64_t,3> nDomains() const {return get<blitz::TinyVector<std::int64_t,3>>("nDomains");}
    std::int64_t nParticles() const {return get<std::int64_t>("nParticles");}
    int    nClusters()        const {return get<std::int64_t>("nClusters");}
    double dClusterFraction() const {return get<double>("dClusterFraction");}
    double dClusterRadius()   const {return get<double>("dClusterRadius");}
    std::int64_t iSeed()      const {return get<std::int64_t>("iSeed");}
    bool   bVStep()           const {return get<bool>("bVStep");}
    std::int64_t nMaxRounds() const {return get<std::int64_t>("nMaxRounds");}
};

#endif
