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

#ifndef HS_LINEAGE_H_
#define HS_LINEAGE_H_


#include <string>
#include <vector>

#include "taxonomy.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief position of a taxon relative to a threshold clade
 *
 *****************************************************************************/
enum class taxon_category {
    ingroup, outgroup, unassigned
};

//-------------------------------------------------------------------
inline const char*
category_name(taxon_category c) noexcept {
    switch(c) {
        case taxon_category::ingroup:    return "INGROUP";
        case taxon_category::outgroup:   return "OUTGROUP";
        default:
        case taxon_category::unassigned: return "UNASSIGNED";
    }
}



/*************************************************************************//**
 *
 * @brief classifies taxa by walking their ancestor chains
 *
 * @details all walks start at the parent of the queried taxon;
 *          the number of steps is bounded by the number of taxa
 *
 *****************************************************************************/
class lineage_classifier
{
public:
    using taxon_id   = taxonomy::taxon_id;
    using taxon_rank = taxonomy::rank;

    explicit
    lineage_classifier(const taxonomy& tax) : tax_{&tax} {}


    //---------------------------------------------------------------
    const taxonomy& taxa() const noexcept { return *tax_; }

    /// true, if taxon has a resolvable parent
    bool has_parent(taxon_id id) const {
        return tax_->parent_id(id) != taxonomy::none_id();
    }


    //---------------------------------------------------------------
    /**
     * @brief ingroup if 'thresholdId' is a proper ancestor of 'taxonId',
     *        outgroup if the root is reached first,
     *        unassigned if "unidentified" / "unclassified sequences"
     *        is reached first or if 'taxonId' has no parent
     *
     * @throws malformed_taxonomy on cycles or on unknown ancestors
     */
    taxon_category
    classify(taxon_id taxonId, taxon_id thresholdId) const;


    //---------------------------------------------------------------
    /**
     * @return "superkingdom;kingdom;phylum" with "undef" for missing ranks
     *         and whitespace in names replaced by underscores
     */
    std::string
    lineage_to_high_rank(taxon_id taxonId) const;

    /**
     * @return "superkingdom;kingdom;phylum;class;order;family;genus;species"
     */
    std::string
    lineage_to_species(taxon_id taxonId) const;


private:
    //---------------------------------------------------------------
    std::string
    ranked_lineage_string(taxon_id taxonId,
                          const std::vector<taxon_rank>& ranks) const;


    const taxonomy* tax_;
};


} // namespace hs


#endif
