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

#include "print_results.h"
#include "cmdline_utility.h"

#include <cstdio>
#include <iostream>


namespace hs {


//-------------------------------------------------------------------
void show_results_header(std::ostream& os)
{
    os << "# QUERY\tINGROUP_NAME\thU\tBIT_OUT\tBIT_IN\tAI\tEVAL_OUT\tEVAL_IN"
          "\tWINNING_CATEGORY\tSUPPORT\tLINEAGE\tEVIDENCE\n";
}



//-------------------------------------------------------------------
std::string format_support(const hgt_score& score)
{
    if(!score.has_support()) return "NA";

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", score.support);
    return buf;
}



//-------------------------------------------------------------------
void show_result_row(std::ostream& os,
                     const hgt_score& score,
                     const candidate_decision& decision,
                     const std::string& ingroupName)
{
    const auto oldPrecision = os.precision(15);

    os << score.queryId << '\t'
       << ingroupName << '\t'
       << score.hU << '\t'
       << score.outgroupBestBitscore << '\t'
       << score.ingroupBestBitscore << '\t'
       << score.ai << '\t'
       << score.outgroupBestEvalue << '\t'
       << score.ingroupBestEvalue << '\t'
       << (score.has_evidence() ? category_name(score.winningCategory) : "NONE")
       << '\t'
       << format_support(score) << '\t'
       << score.lineage << '\t'
       << static_cast<int>(decision.evidence) << '\n';

    os.precision(oldPrecision);
}



//-------------------------------------------------------------------
void show_warning_row(std::ostream& os,
                      const std::string& queryId,
                      std::size_t lineNumber,
                      const std::string& taxon,
                      const std::string& reason)
{
    os << queryId << '\t' << lineNumber << '\t' << taxon << '\t'
       << reason << '\n';
}



//-------------------------------------------------------------------
void show_score_details(std::ostream& os, const hgt_score& score,
                        const std::string& ingroupName)
{
    const auto& q = score.queryId;
    os << "[" << q << "] Bitscore sum for INGROUP (" << ingroupName << "): "
       << score.ingroupBitscoreSum << '\n'
       << "[" << q << "] Bitscore sum for OUTGROUP (non-" << ingroupName << "): "
       << score.outgroupBitscoreSum << '\n'
       << "[" << q << "] Decision: "
       << (score.has_evidence() ? category_name(score.winningCategory) : "NONE")
       << " (support = " << format_support(score) << ", "
       << score.supportingTaxa << " of " << score.taxonCount << " taxa)\n"
       << "[" << q << "] Best e-value INGROUP: " << score.ingroupBestEvalue
       << ", OUTGROUP: " << score.outgroupBestEvalue << '\n'
       << "[" << q << "] Alien Index = " << score.ai
       << ", HGT index = " << score.hU << '\n';
}



//-------------------------------------------------------------------
void show_hit_statistics(std::ostream& os, const hit_statistics& stats,
                         const std::string& prefix)
{
    constexpr hit_status rejections[] {
        hit_status::invalid_taxid,  hit_status::unknown_parent,
        hit_status::skipped_taxon,  hit_status::unassigned,
        hit_status::malformed_record, hit_status::malformed_taxonomy
    };

    os << prefix << "Total number of hits parsed: "
       << with_thousands_separators(stats.total()) << '\n';

    if(stats.total() < 1) return;

    for(auto s : rejections) {
        if(stats[s] > 0) {
            char rate[32];
            std::snprintf(rate, sizeof(rate), "%.2f",
                          100.0 * double(stats[s]) / double(stats.total()));
            os << prefix << "  rejected (" << hit_status_name(s) << "): "
               << with_thousands_separators(stats[s])
               << " (" << rate << "%)\n";
        }
    }
}



//-------------------------------------------------------------------
void show_selection_statistics(std::ostream& os,
                               const selection_statistics& stats,
                               const selection_thresholds& thresholds,
                               const std::string& ingroupName,
                               const std::string& prefix)
{
    auto n = [](std::size_t x) { return with_thousands_separators(x); };

    os << prefix << "Number of queries: " << n(stats.queries) << '\n'
       << prefix << "TOTAL NUMBER OF HGT CANDIDATES: " << n(stats.candidates) << '\n'
       << prefix << "Number of queries with HGT Index (hU) >= "
                 << thresholds.hU << ": " << n(stats.hUPassed) << '\n'
       << prefix << "Number of queries with Alien Index (AI) >= "
                 << thresholds.hU << ": " << n(stats.aiPassed) << '\n'
       << prefix << "Number of queries in INGROUP category ('"
                 << ingroupName << "'): " << n(stats.ingroup) << '\n'
       << prefix << "Number of queries in INGROUP category ('"
                 << ingroupName << "') with support >= " << thresholds.support
                 << "%: " << n(stats.ingroupSupported) << '\n'
       << prefix << "Number of queries in OUTGROUP category ('non-"
                 << ingroupName << "'): " << n(stats.outgroup) << '\n'
       << prefix << "Number of queries in OUTGROUP category ('non-"
                 << ingroupName << "') with support >= " << thresholds.support
                 << "%: " << n(stats.outgroupSupported) << '\n';

    if(stats.noEvidence > 0) {
        os << prefix << "Number of queries without usable hits: "
           << n(stats.noEvidence) << '\n';
    }
}


} // namespace hs
