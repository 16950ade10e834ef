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

#include "lineage.h"
#include "io_error.h"
#include "string_utils.h"

#include <cstddef>


namespace hs {


using std::string;


//-------------------------------------------------------------------
taxon_category
lineage_classifier::classify(taxon_id taxonId, taxon_id thresholdId) const
{
    auto parent = tax_->parent_id(taxonId);
    if(parent == taxonomy::none_id()) return taxon_category::unassigned;

    const std::size_t maxSteps = tax_->size() + 1;

    for(std::size_t steps = 0; ; ++steps) {
        if(parent == thresholdId)             return taxon_category::ingroup;
        if(parent == taxonomy::root_id())     return taxon_category::outgroup;
        if(parent == taxonomy::unidentified_id() ||
           parent == taxonomy::unclassified_sequences_id())
        {
            return taxon_category::unassigned;
        }

        if(steps >= maxSteps) {
            throw malformed_taxonomy{
                "cyclic ancestor chain for taxon " + std::to_string(taxonId),
                taxonId};
        }

        const auto next = tax_->parent_id(parent);
        if(next == taxonomy::none_id()) {
            throw malformed_taxonomy{
                "unknown ancestor " + std::to_string(parent) +
                " in lineage of taxon " + std::to_string(taxonId),
                taxonId};
        }
        parent = next;
    }
}



//-------------------------------------------------------------------
string
lineage_classifier::lineage_to_high_rank(taxon_id taxonId) const
{
    static const std::vector<taxon_rank> ranks {
        taxon_rank::Domain, taxon_rank::Kingdom, taxon_rank::Phylum
    };
    return ranked_lineage_string(taxonId, ranks);
}



//-------------------------------------------------------------------
string
lineage_classifier::lineage_to_species(taxon_id taxonId) const
{
    static const std::vector<taxon_rank> ranks {
        taxon_rank::Domain, taxon_rank::Kingdom, taxon_rank::Phylum,
        taxon_rank::Class, taxon_rank::Order, taxon_rank::Family,
        taxon_rank::Genus, taxon_rank::Species
    };
    return ranked_lineage_string(taxonId, ranks);
}



//-------------------------------------------------------------------
string
lineage_classifier::ranked_lineage_string(
    taxon_id taxonId, const std::vector<taxon_rank>& ranks) const
{
    std::vector<string> names(ranks.size());

    const std::size_t maxSteps = tax_->size() + 1;

    //tolerant walk: stops at gaps, root, superkingdom or step bound
    auto id = tax_->parent_id(taxonId);
    for(std::size_t steps = 0;
        id != taxonomy::none_id() && steps < maxSteps; ++steps)
    {
        const auto r = tax_->rank_of(id);
        for(std::size_t i = 0; i < ranks.size(); ++i) {
            if(ranks[i] == r && names[i].empty()) {
                const auto& name = tax_->name_of(id);
                names[i] = name.empty() ? "<" + std::to_string(id) + ">"
                                        : underscore_whitespace(name);
                break;
            }
        }
        if(r == taxon_rank::Domain || id == taxonomy::root_id()) break;
        id = tax_->parent_id(id);
    }

    string lineage;
    for(std::size_t i = 0; i < names.size(); ++i) {
        if(i > 0) lineage += ';';
        lineage += names[i].empty() ? string("undef") : names[i];
    }
    return lineage;
}


} // namespace hs
