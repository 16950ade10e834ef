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

#ifndef HS_CLASSIFICATION_H_
#define HS_CLASSIFICATION_H_


#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "candidate_selection.h"
#include "hit_aggregation.h"
#include "hit_io.h"
#include "io_options.h"
#include "lineage.h"
#include "scoring.h"
#include "taxonomy.h"


namespace hs {

struct classify_options;


/*************************************************************************//**
 *
 * @brief scores + decisions for all queries of one run
 *
 *****************************************************************************/
struct classification_results
{
    std::vector<hgt_score> scores;
    std::vector<candidate_decision> decisions;
    selection_statistics statistics;
};



/*************************************************************************//**
 *
 * @brief parses one hit line and feeds it to the aggregator;
 *        rejected hits are written to the warnings table
 *        (skipped taxa only if 'infoLvl' is verbose)
 *
 * @return ingestion outcome
 *
 *****************************************************************************/
hit_status
process_hit_line(const std::string& line,
                 std::size_t lineNumber,
                 const hit_format_options&,
                 hit_aggregator&,
                 std::ostream& warnings,
                 info_level infoLvl = info_level::moderate);



/*************************************************************************//**
 *
 * @brief reads all hits from a (plain or gzip compressed) hit file
 *
 * @throws file_access_error if the file can't be opened
 *         file_read_error   on read errors
 *
 *****************************************************************************/
void aggregate_hit_file(const std::string& filename,
                        const hit_format_options&,
                        hit_aggregator&,
                        std::ostream& warnings,
                        info_level infoLvl = info_level::moderate);



/*************************************************************************//**
 *
 * @brief scores all queries and decides on candidacy
 *
 *****************************************************************************/
classification_results
classify_queries(const evidence_map&,
                 const lineage_classifier&,
                 taxonomy::taxon_id ingroupId,
                 const selection_thresholds&,
                 const performance_tuning_options& = performance_tuning_options{},
                 info_level = info_level::silent,
                 const std::string& ingroupName = "");



/*************************************************************************//**
 *
 * @brief writes results table (all queries) and candidates table
 *
 *****************************************************************************/
void write_result_tables(const classification_results&,
                         const std::string& ingroupName,
                         std::ostream& results,
                         std::ostream& candidates);



/*************************************************************************//**
 *
 * @brief output file names
 *
 *****************************************************************************/
struct output_filenames
{
    std::string results;
    std::string candidates;
    std::string warnings;
};

output_filenames
make_output_filenames(const std::string& prefix,
                      const std::string& ingroupName,
                      const selection_thresholds&);



/*************************************************************************//**
 *
 * @brief display name of a taxon; falls back to its id
 *
 *****************************************************************************/
std::string taxon_display_name(const taxonomy&, taxonomy::taxon_id);



/*************************************************************************//**
 *
 * @brief runs the whole pipeline: hit file -> evidence -> scores -> tables
 *
 * @throws taxonomy_error if ingroup or skip taxon are not in the taxonomy
 *
 *****************************************************************************/
selection_statistics
run_classification(const taxonomy&, const classify_options&);


} // namespace hs


#endif
