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

#include "candidate_selection.h"


namespace hs {


//-------------------------------------------------------------------
inline bool
support_passes(const hgt_score& score, double threshold) noexcept
{
    return score.has_support() && score.support >= threshold;
}



//-------------------------------------------------------------------
candidate_decision
decide(const hgt_score& score, const selection_thresholds& thresholds)
{
    candidate_decision d;

    const double metric = thresholds.useAI ? score.ai : score.hU;
    const bool supported = support_passes(score, thresholds.support);

    d.candidate = score.has_evidence()
               && metric >= thresholds.hU
               && score.winningCategory == taxon_category::outgroup
               && supported;

    if(d.candidate) {
        d.evidence = evidence_class::good_outgroup;
    }
    else if(score.has_evidence()
            && score.hU <= thresholds.ingroupHU
            && score.winningCategory == taxon_category::ingroup
            && supported)
    {
        d.evidence = evidence_class::good_ingroup;
    }
    else {
        d.evidence = evidence_class::intermediate;
    }
    return d;
}


//-------------------------------------------------------------------
candidate_decision
decide(const hgt_score& score, double hUThreshold, double supportThreshold)
{
    selection_thresholds thresholds;
    thresholds.hU = hUThreshold;
    thresholds.support = supportThreshold;
    return decide(score, thresholds);
}



//-------------------------------------------------------------------
candidate_decision
candidate_selector::operator () (const hgt_score& score)
{
    const auto d = decide(score, thresholds_);

    ++stats_.queries;
    if(score.hU >= thresholds_.hU) ++stats_.hUPassed;
    if(score.ai >= thresholds_.hU) ++stats_.aiPassed;

    if(!score.has_evidence()) {
        ++stats_.noEvidence;
    }
    else if(score.winningCategory == taxon_category::ingroup) {
        ++stats_.ingroup;
        if(support_passes(score, thresholds_.support)) ++stats_.ingroupSupported;
    }
    else {
        ++stats_.outgroup;
        if(support_passes(score, thresholds_.support)) ++stats_.outgroupSupported;
    }

    if(d.candidate) ++stats_.candidates;

    return d;
}


} // namespace hs
