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

#include "scoring.h"
#include "cmdline_utility.h"

#include <concurrentqueue.h>

#include <algorithm>
#include <cmath>
#include <future>
#include <iostream>
#include <numeric>
#include <utility>


namespace hs {


using std::string;
using std::vector;

using taxon_id = taxonomy::taxon_id;


//-------------------------------------------------------------------
hgt_score
score_query(const string& queryId,
            const query_evidence& evidence,
            const lineage_classifier& lineages,
            taxon_id thresholdId)
{
    hgt_score score;
    score.queryId = queryId;

    std::size_t ingroupTaxa = 0;
    std::size_t outgroupTaxa = 0;
    double bestSum = 0.0;

    //evidence is ordered by taxon id: on ties the lowest id wins
    for(const auto& te : evidence) {
        const auto taxonId = te.first;
        const auto& bitscores = te.second.bitscores;
        const auto& evalues = te.second.evalues;
        if(bitscores.empty()) continue;

        ++score.taxonCount;

        const double maxBits = *std::max_element(bitscores.begin(), bitscores.end());
        const double minEval = *std::min_element(evalues.begin(), evalues.end());
        const double sumBits = std::accumulate(bitscores.begin(), bitscores.end(), 0.0);

        switch(lineages.classify(taxonId, thresholdId)) {
            case taxon_category::ingroup:
                ++ingroupTaxa;
                score.ingroupBestBitscore = std::max(score.ingroupBestBitscore, maxBits);
                score.ingroupBestEvalue   = std::min(score.ingroupBestEvalue, minEval);
                score.ingroupBitscoreSum += sumBits;
                break;
            case taxon_category::outgroup:
                ++outgroupTaxa;
                score.outgroupBestBitscore = std::max(score.outgroupBestBitscore, maxBits);
                score.outgroupBestEvalue   = std::min(score.outgroupBestEvalue, minEval);
                score.outgroupBitscoreSum += sumBits;
                break;
            default:
            case taxon_category::unassigned:
                break;
        }

        if(score.winningTaxon == taxonomy::none_id() || sumBits > bestSum) {
            score.winningTaxon = taxonId;
            bestSum = sumBits;
        }
    }

    score.hU = score.outgroupBestBitscore - score.ingroupBestBitscore;

    score.ai = std::log10(score.ingroupBestEvalue + 1e-200) -
               std::log10(score.outgroupBestEvalue + 1e-200);

    //ties go to outgroup
    score.winningCategory =
        score.ingroupBitscoreSum > score.outgroupBitscoreSum
        ? taxon_category::ingroup : taxon_category::outgroup;

    if(score.taxonCount > 0) {
        score.supportingTaxa =
            score.winningCategory == taxon_category::ingroup
            ? ingroupTaxa : outgroupTaxa;

        score.support = 100.0 * double(score.supportingTaxa)
                              / double(score.taxonCount);
    }

    score.lineage = lineages.lineage_to_high_rank(score.winningTaxon);

    return score;
}



//-------------------------------------------------------------------
vector<hgt_score>
score_queries(const evidence_map& evidence,
              const lineage_classifier& lineages,
              taxon_id thresholdId,
              const performance_tuning_options& opt,
              info_level infoLvl)
{
    using entry = evidence_map::const_iterator;

    vector<entry> entries;
    entries.reserve(evidence.size());
    for(auto i = evidence.begin(); i != evidence.end(); ++i) {
        entries.push_back(i);
    }

    vector<hgt_score> scores(entries.size());
    if(entries.empty()) return scores;

    const std::size_t batchSize = std::max(std::size_t(1), opt.batchSize);

    //work items: [first,last) index ranges into 'entries'
    using index_range = std::pair<std::size_t,std::size_t>;
    moodycamel::ConcurrentQueue<index_range> batchQueue;
    for(std::size_t first = 0; first < entries.size(); first += batchSize) {
        batchQueue.enqueue(index_range{
            first, std::min(entries.size(), first + batchSize)});
    }

    const unsigned numThreads = std::max(1u, opt.numThreads);

    concurrent_progress progress;
    progress.total = entries.size();

    //each result is written to its own slot; no locking needed
    vector<std::future<void>> threads;
    for(unsigned threadId = 0; threadId < numThreads; ++threadId) {
        threads.emplace_back(std::async(std::launch::async, [&] {
            index_range range;
            while(batchQueue.try_dequeue(range)) {
                for(auto i = range.first; i < range.second; ++i) {
                    scores[i] = score_query(entries[i]->first,
                                            entries[i]->second,
                                            lineages, thresholdId);
                }
                progress.counter += range.second - range.first;
            }
        }));
    }

    if(infoLvl != info_level::silent) {
        show_progress_until_ready(std::cerr, progress, threads);
    }
    else {
        for(auto& thread : threads) {
            thread.get();
        }
    }

    return scores;
}


} // namespace hs
