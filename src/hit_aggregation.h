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

#ifndef HS_HIT_AGGREGATION_H_
#define HS_HIT_AGGREGATION_H_


#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "hit_io.h"
#include "lineage.h"
#include "string_utils.h"
#include "taxonomy.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief outcome of ingesting a single hit
 *
 *****************************************************************************/
enum class hit_status : int {
    accepted = 0,
    invalid_taxid,
    unknown_parent,
    skipped_taxon,
    unassigned,
    malformed_record,
    malformed_taxonomy
};

constexpr int num_hit_states = 7;

//-------------------------------------------------------------------
const char* hit_status_name(hit_status) noexcept;

/// reason text used in the warnings table
std::string hit_status_description(hit_status, taxonomy::taxon_id skipId = 0);



/*************************************************************************//**
 *
 * @brief bitscores / e-values of all hits of one query against one taxon
 *
 *****************************************************************************/
struct taxon_evidence
{
    std::vector<double> bitscores;
    std::vector<double> evalues;
};

/// taxon id -> evidence; ordered by taxon id
using query_evidence = std::map<taxonomy::taxon_id,taxon_evidence>;

/// query id -> evidence; queries in natural sort order
using evidence_map = std::map<std::string,query_evidence,natural_less>;



/*************************************************************************//**
 *
 * @brief hit counts per ingestion outcome
 *
 *****************************************************************************/
class hit_statistics
{
public:
    void count(hit_status s) noexcept {
        ++counts_[static_cast<int>(s)];
        ++total_;
    }

    std::size_t total() const noexcept { return total_; }

    std::size_t operator [] (hit_status s) const noexcept {
        return counts_[static_cast<int>(s)];
    }

    std::size_t rejected() const noexcept {
        return total_ - counts_[static_cast<int>(hit_status::accepted)];
    }

private:
    std::size_t total_ = 0;
    std::array<std::size_t,num_hit_states> counts_ {};
};



/*************************************************************************//**
 *
 * @brief accumulates per-query, per-taxon evidence from a stream of hits
 *
 * @details hits are filtered through a lineage classifier:
 *          invalid / unknown taxa, taxa within the skip clade and
 *          unassigned taxa are rejected
 *
 *****************************************************************************/
class hit_aggregator
{
public:
    using taxon_id = taxonomy::taxon_id;

    /**
     * @param skipId  taxon whose whole clade is ignored;
     *                taxonomy::none_id() disables skipping
     */
    hit_aggregator(const lineage_classifier&,
                   taxon_id thresholdId,
                   taxon_id skipId = taxonomy::none_id());


    //---------------------------------------------------------------
    /**
     * @brief adds hit to evidence if it passes all filters;
     *        the hit's query is registered in any case
     */
    hit_status ingest(const hit&);

    /// counts a line that could not be parsed into a hit
    void count_malformed_record();


    //---------------------------------------------------------------
    taxon_id threshold_id() const noexcept { return thresholdId_; }
    taxon_id skip_id() const noexcept { return skipId_; }

    const evidence_map& evidence() const noexcept { return evidence_; }
    evidence_map&& release_evidence() noexcept { return std::move(evidence_); }

    const hit_statistics& statistics() const noexcept { return stats_; }


private:
    hit_status filter(taxon_id taxonId) const;

    const lineage_classifier* lineages_;
    taxon_id thresholdId_;
    taxon_id skipId_;
    evidence_map evidence_;
    hit_statistics stats_;
};


} // namespace hs


#endif
