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

#include "hit_aggregation.h"
#include "io_error.h"
#include "string_utils.h"


namespace hs {


//-------------------------------------------------------------------
const char* hit_status_name(hit_status s) noexcept
{
    switch(s) {
        case hit_status::accepted:           return "accepted";
        case hit_status::invalid_taxid:      return "invalid_taxid";
        case hit_status::unknown_parent:     return "unknown_parent";
        case hit_status::skipped_taxon:      return "skipped_taxon";
        case hit_status::unassigned:         return "unassigned";
        case hit_status::malformed_record:   return "malformed_record";
        case hit_status::malformed_taxonomy: return "malformed_taxonomy";
        default:                             return "unknown";
    }
}



//-------------------------------------------------------------------
std::string
hit_status_description(hit_status s, taxonomy::taxon_id skipId)
{
    switch(s) {
        case hit_status::invalid_taxid:
            return "invalid/unrecognised taxid";
        case hit_status::unknown_parent:
            return "invalid/unrecognised parent taxid";
        case hit_status::skipped_taxon:
            return "taxid within skipped (" + std::to_string(skipId) + ")";
        case hit_status::unassigned:
            return "taxid unassigned/unclassified";
        case hit_status::malformed_record:
            return "malformed record";
        case hit_status::malformed_taxonomy:
            return "malformed taxonomy lineage";
        default:
        case hit_status::accepted:
            return "";
    }
}



//-------------------------------------------------------------------
hit_aggregator::hit_aggregator(const lineage_classifier& lineages,
                               taxon_id thresholdId,
                               taxon_id skipId)
:
    lineages_{&lineages},
    thresholdId_{thresholdId},
    skipId_{skipId},
    evidence_{},
    stats_{}
{}



//-------------------------------------------------------------------
hit_status
hit_aggregator::filter(taxon_id taxonId) const
{
    if(!lineages_->has_parent(taxonId)) return hit_status::unknown_parent;

    try {
        if(skipId_ != taxonomy::none_id() &&
           lineages_->classify(taxonId, skipId_) == taxon_category::ingroup)
        {
            return hit_status::skipped_taxon;
        }
        if(lineages_->classify(taxonId, thresholdId_) ==
           taxon_category::unassigned)
        {
            return hit_status::unassigned;
        }
    }
    catch(const malformed_taxonomy&) {
        return hit_status::malformed_taxonomy;
    }
    return hit_status::accepted;
}



//-------------------------------------------------------------------
hit_status
hit_aggregator::ingest(const hit& h)
{
    //registers query even if all of its hits get rejected
    auto& queryEvidence = evidence_[h.queryId];

    taxon_id taxonId = taxonomy::none_id();

    const auto status = parse_positive_integer(h.taxon, taxonId)
                      ? filter(taxonId) : hit_status::invalid_taxid;

    if(status == hit_status::accepted) {
        auto& ev = queryEvidence[taxonId];
        ev.bitscores.push_back(h.bitscore);
        ev.evalues.push_back(h.evalue);
    }
    stats_.count(status);
    return status;
}



//-------------------------------------------------------------------
void hit_aggregator::count_malformed_record()
{
    stats_.count(hit_status::malformed_record);
}


} // namespace hs
