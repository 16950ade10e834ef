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

#ifndef HS_PRINT_RESULTS_H_
#define HS_PRINT_RESULTS_H_


#include <cstddef>
#include <iosfwd>
#include <string>

#include "candidate_selection.h"
#include "hit_aggregation.h"
#include "scoring.h"


namespace hs {


/*************************************************************************//**
 *
 * @brief header line of results / candidates tables
 *
 *****************************************************************************/
void show_results_header(std::ostream&);



/*************************************************************************//**
 *
 * @brief one results table row (tab-separated)
 *
 *****************************************************************************/
void show_result_row(std::ostream&,
                     const hgt_score&,
                     const candidate_decision&,
                     const std::string& ingroupName);



/*************************************************************************//**
 *
 * @brief support as percentage with two decimals or "NA" if undefined
 *
 *****************************************************************************/
std::string format_support(const hgt_score&);



/*************************************************************************//**
 *
 * @brief one warnings table row: query, line number, taxid token, reason
 *
 *****************************************************************************/
void show_warning_row(std::ostream&,
                      const std::string& queryId,
                      std::size_t lineNumber,
                      const std::string& taxon,
                      const std::string& reason);



/*************************************************************************//**
 *
 * @brief per-query details for verbose logging
 *
 *****************************************************************************/
void show_score_details(std::ostream&, const hgt_score&,
                        const std::string& ingroupName);



/*************************************************************************//**
 *
 * @brief hit ingestion summary
 *
 *****************************************************************************/
void show_hit_statistics(std::ostream&, const hit_statistics&,
                         const std::string& prefix = "");



/*************************************************************************//**
 *
 * @brief query / candidate summary
 *
 *****************************************************************************/
void show_selection_statistics(std::ostream&,
                               const selection_statistics&,
                               const selection_thresholds&,
                               const std::string& ingroupName,
                               const std::string& prefix = "");


} // namespace hs


#endif
