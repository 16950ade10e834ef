/******************************************************************************
 *
 * HGTseek - Horizontal Gene Transfer Candidate Detection
 *
 * Copyright (C) 2024 The HGTseek developers
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *****************************************************************************/

#ifndef HS_CANDIDATE_SELECTION_H_
#define HS_CANDIDATE_SELECTION_H_


#include <cstddef>
#include <vector>

#include "scoring.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief ternary evidence class of a query
 *
 *****************************************************************************/
enum class evidence_class : int {
    good_ingroup  = 0,
    intermediate  = 1,
    good_outgroup = 2
};



/*************************************************************************//**
 *
 * @brief candidate decision thresholds
 *
 *****************************************************************************/
struct selection_thresholds
{
    //applies to hU or (if useAI) to AI
    double hU = 30.0;
    //minimum consensus hit support in percent
    double support = 90.0;
    //maximum hU for a "good ingroup" evidence class
    double ingroupHU = 0.0;
    bool useAI = false;
};



/*************************************************************************//**
 *
 * @brief decision for one query
 *
 *****************************************************************************/
struct candidate_decision
{
    bool candidate = false;
    evidence_class evidence = evidence_class::intermediate;
};



//-------------------------------------------------------------------
/**
 * @brief query is a candidate iff its metric (hU or AI) >= threshold,
 *        its winning category is outgroup and its support passes
 *        (undefined support never passes)
 */
candidate_decision
decide(const hgt_score&, const selection_thresholds&);

//-------------------------------------------------------------------
candidate_decision
decide(const hgt_score&, double hUThreshold, double supportThreshold);



/*************************************************************************//**
 *
 * @brief run-level counters
 *
 *****************************************************************************/
struct selection_statistics
{
    std::size_t queries = 0;
    std::size_t noEvidence = 0;
    std::size_t hUPassed = 0;
    std::size_t aiPassed = 0;
    std::size_t ingroup = 0;
    std::size_t outgroup = 0;
    std::size_t ingroupSupported = 0;
    std::size_t outgroupSupported = 0;
    std::size_t candidates = 0;
};



/*************************************************************************//**
 *
 * @brief decides all queries and collects statistics
 *
 *****************************************************************************/
class candidate_selector
{
public:
    explicit
    candidate_selector(const selection_thresholds& thresholds) :
        thresholds_(thresholds), stats_{}
    {}

    candidate_decision operator () (const hgt_score&);

    const selection_thresholds& thresholds() const noexcept { return thresholds_; }
    const selection_statistics& statistics() const noexcept { return stats_; }

private:
    selection_thresholds thresholds_;
    selection_statistics stats_;
};


} // namespace hs


#endif
