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

#include <cstdint>
#include <fstream>
#include <iostream>
#include <sstream>

#include "classification.h"
#include "cmdline_utility.h"
#include "filesys_utility.h"
#include "io_error.h"
#include "line_istream.h"
#include "options.h"
#include "print_results.h"
#include "string_utils.h"


namespace hs {


using std::string;
using std::cout;
using std::cerr;
using std::endl;

using taxon_id = taxonomy::taxon_id;


//-------------------------------------------------------------------
hit_status
process_hit_line(const string& line,
                 std::size_t lineNumber,
                 const hit_format_options& fmt,
                 hit_aggregator& aggregator,
                 std::ostream& warnings,
                 info_level infoLvl)
{
    hit h;
    hit_status status = hit_status::malformed_record;

    if(parse_hit(line, fmt, h)) {
        status = aggregator.ingest(h);
    } else {
        aggregator.count_malformed_record();
    }

    if(status == hit_status::accepted) return status;

    if(status != hit_status::skipped_taxon || infoLvl == info_level::verbose) {
        show_warning_row(warnings, h.queryId, lineNumber, h.taxon,
            hit_status_description(status, aggregator.skip_id()));
    }
    return status;
}



//-------------------------------------------------------------------
void aggregate_hit_file(const string& filename,
                        const hit_format_options& fmt,
                        hit_aggregator& aggregator,
                        std::ostream& warnings,
                        info_level infoLvl)
{
    line_istream is{filename};
    if(!is.good()) {
        throw file_access_error{"Could not read hit file " + filename, filename};
    }

    const bool showInfo = infoLvl != info_level::silent;
    if(showInfo) cout << "Parsing hit file '" << filename << "' ... " << endl;

    const auto fsize = std::int_least64_t(file_size(filename));
    const bool showProgress = showInfo && fsize > 100000000;
    //update progress indicator every 64K lines
    constexpr std::size_t statStep = 1UL << 16;
    if(showProgress) show_progress_indicator(cout, 0);

    string line;
    while(is.getline(line)) {
        if(is_hit_comment_or_blank(line)) continue;

        process_hit_line(line, is.line_number(), fmt, aggregator,
                         warnings, infoLvl);

        if(showProgress && !(is.line_number() % statStep)) {
            show_progress_indicator(cout, is.raw_position() / float(fsize));
        }
    }
    if(showProgress) clear_current_line(cout);

    if(is.failed()) {
        throw file_read_error{"Error while reading hit file " + filename,
                              filename};
    }
    if(showInfo) cout << "done." << endl;
}



//-------------------------------------------------------------------
classification_results
classify_queries(const evidence_map& evidence,
                 const lineage_classifier& lineages,
                 taxon_id ingroupId,
                 const selection_thresholds& thresholds,
                 const performance_tuning_options& perf,
                 info_level infoLvl,
                 const string& ingroupName)
{
    classification_results res;

    res.scores = score_queries(evidence, lineages, ingroupId, perf, infoLvl);

    candidate_selector select{thresholds};

    res.decisions.reserve(res.scores.size());
    for(const auto& score : res.scores) {
        res.decisions.push_back(select(score));

        if(infoLvl == info_level::verbose) {
            show_score_details(cerr, score, ingroupName);
        }
    }
    res.statistics = select.statistics();

    return res;
}



//-------------------------------------------------------------------
void write_result_tables(const classification_results& res,
                         const string& ingroupName,
                         std::ostream& results,
                         std::ostream& candidates)
{
    show_results_header(results);
    show_results_header(candidates);

    for(std::size_t i = 0; i < res.scores.size(); ++i) {
        show_result_row(results, res.scores[i], res.decisions[i], ingroupName);
        if(res.decisions[i].candidate) {
            show_result_row(candidates, res.scores[i], res.decisions[i],
                            ingroupName);
        }
    }
}



//-------------------------------------------------------------------
output_filenames
make_output_filenames(const string& prefix,
                      const string& ingroupName,
                      const selection_thresholds& thresholds)
{
    std::ostringstream supp;
    supp << thresholds.support;
    std::ostringstream hu;
    hu << thresholds.hU;

    const auto name = underscore_whitespace(ingroupName);

    output_filenames files;
    files.results = prefix + ".HGT_results." + name + ".txt";
    files.candidates = prefix + ".HGT_candidates." + name +
                       ".supp" + supp.str() + ".hU" + hu.str() + ".txt";
    files.warnings = prefix + ".HGT_warnings.txt";
    return files;
}



//-------------------------------------------------------------------
string taxon_display_name(const taxonomy& tax, taxon_id id)
{
    const auto& name = tax.name_of(id);
    if(name.empty()) return std::to_string(id);
    return name;
}



//-------------------------------------------------------------------
inline std::ofstream
open_output_file(const string& filename)
{
    std::ofstream os{filename};
    if(!os.good()) {
        throw file_write_error{"Could not write to file " + filename, filename};
    }
    return os;
}



//-------------------------------------------------------------------
selection_statistics
run_classification(const taxonomy& tax, const classify_options& opt)
{
    const auto& scoring = opt.scoring;
    const bool showInfo = opt.infoLevel != info_level::silent;

    if(!tax.contains(scoring.ingroupId)) {
        throw taxonomy_error{"Ingroup taxon " +
            std::to_string(scoring.ingroupId) + " not found in taxonomy!"};
    }
    if(scoring.skipId != taxonomy::none_id() && !tax.contains(scoring.skipId)) {
        throw taxonomy_error{"Skip taxon " +
            std::to_string(scoring.skipId) + " not found in taxonomy!"};
    }

    if(!file_readable(opt.hitFile)) {
        throw file_access_error{"Could not read hit file " + opt.hitFile,
                                opt.hitFile};
    }

    const auto ingroupName = taxon_display_name(tax, scoring.ingroupId);

    if(showInfo) {
        cout << "Ingroup set to '" << ingroupName << "' ("
             << scoring.ingroupId << "); outgroup is therefore 'non-"
             << ingroupName << "'\n";
        if(scoring.skipId != taxonomy::none_id()) {
            cout << "Skipping any hits to taxon '"
                 << taxon_display_name(tax, scoring.skipId) << "' ("
                 << scoring.skipId << ")\n";
        } else {
            cerr << "WARNING: no taxon to skip set! Consider setting '-skip' "
                    "to the taxon id of the phylum your organism comes from."
                 << endl;
        }
    }

    //check output before doing any work
    const auto files = make_output_filenames(opt.prefix, ingroupName,
                                             scoring.thresholds);
    auto warningsOut   = open_output_file(files.warnings);
    auto resultsOut    = open_output_file(files.results);
    auto candidatesOut = open_output_file(files.candidates);

    lineage_classifier lineages{tax};
    hit_aggregator aggregator{lineages, scoring.ingroupId, scoring.skipId};

    aggregate_hit_file(opt.hitFile, opt.format, aggregator, warningsOut,
                       opt.infoLevel);

    if(showInfo) show_hit_statistics(cerr, aggregator.statistics());

    if(showInfo) {
        cout << "Scoring " << aggregator.evidence().size()
             << " queries ... " << endl;
    }

    const auto results = classify_queries(
        aggregator.evidence(), lineages, scoring.ingroupId,
        scoring.thresholds, opt.performance, opt.infoLevel, ingroupName);

    write_result_tables(results, ingroupName, resultsOut, candidatesOut);

    resultsOut.close();
    candidatesOut.close();
    warningsOut.close();
    if(!resultsOut || !candidatesOut || !warningsOut) {
        throw file_write_error{"Error while writing output files with prefix "
                               + opt.prefix};
    }

    if(showInfo) {
        show_selection_statistics(cerr, results.statistics, scoring.thresholds,
                                  ingroupName);
        cout << "Results written to " << files.results << '\n'
             << "Candidates written to " << files.candidates << endl;
    }

    return results.statistics;
}


} // namespace hs
