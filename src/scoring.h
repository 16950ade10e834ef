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

#ifndef HS_SCORING_H_
#define HS_SCORING_H_


#include <cstddef>
#include <string>
#include <thread>
#include <vector>

#include "hit_aggregation.h"
#include "io_options.h"
#include "lineage.h"
#include "taxonomy.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief HGT evidence of one query
 *
 * @details hU = best outgroup bitscore - best ingroup bitscore
 *          AI = log10(best ingroup e-value + 1e-200) -
 *               log10(best outgroup e-value + 1e-200)
 *          support: percentage of distinct hit taxa that fall into
 *          the winning category (consensus hit support)
 *
 *****************************************************************************/
struct hgt_score
{
    using taxon_id = taxonomy::taxon_id;

    std::string queryId;

    double hU = 0.0;
    double ai = 0.0;

    double ingroupBestBitscore  = 0.0;
    double outgroupBestBitscore = 0.0;
    double ingroupBestEvalue    = 1.0;
    double outgroupBestEvalue   = 1.0;

    double ingroupBitscoreSum  = 0.0;
    double outgroupBitscoreSum = 0.0;

    taxon_category winningCategory = taxon_category::outgroup;
    taxon_id winningTaxon = taxonomy::none_id();

    std::size_t taxonCount = 0;
    std::size_t supportingTaxa = 0;
    /// only meaningful if has_support()
    double support = 0.0;

    std::string lineage;

    bool has_evidence() const noexcept { return taxonCount > 0; }
    bool has_support() const noexcept { return taxonCount > 0; }
};



/*************************************************************************//**
 *
 * @brief reduces the per-taxon evidence of one query to an hgt_score
 *
 *****************************************************************************/
hgt_score
score_query(const std::string& queryId,
            const query_evidence&,
            const lineage_classifier&,
            taxonomy::taxon_id thresholdId);



/*************************************************************************//**
 *
 * @brief parallel execution parameters
 *
 *****************************************************************************/
struct performance_tuning_options
{
    unsigned numThreads = std::thread::hardware_concurrency() > 0
                        ? std::thread::hardware_concurrency() : 1;

    //number of queries per work item
    std::size_t batchSize = 4096;
};



/*************************************************************************//**
 *
 * @brief scores all queries in parallel
 *
 * @return one score per query in the (natural) order of the evidence map
 *
 *****************************************************************************/
std::vector<hgt_score>
score_queries(const evidence_map&,
              const lineage_classifier&,
              taxonomy::taxon_id thresholdId,
              const performance_tuning_options& = performance_tuning_options{},
              info_level = info_level::silent);


} // namespace hs


#endif
