
#include "../src/classification.h"
#include "../src/options.h"
#include "../src/print_results.h"
#include "../src/io_error.h"

#include "test_taxonomy.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>


namespace hs_test {

using namespace hs;

//defined in taxonomy_test.cpp
void write_text_file(const std::string& filename, const std::string& content);
void write_gzip_file(const std::string& filename, const std::string& content);


//-------------------------------------------------------------------
/// @brief 13-column diamond line
std::string
diamond_line(const std::string& query, const std::string& subject,
             const std::string& evalue, const std::string& bitscore,
             const std::string& taxid)
{
    return query + "  " + subject + " 90.0 300 30 0 1 300 1 300 " +
           evalue + " " + bitscore + " " + taxid;
}


//-------------------------------------------------------------------
const char* const example_hits[] = {
    "# Q1: 2 of 3 taxa are outgroup",
    "Q1 sA 90.0 300 30 0 1 300 1 300 1e-20 100 9606",
    "Q1 sB 95.0 300 15 0 1 300 1 300 1e-30 150 562",
    "Q1 sC 40.0 300 180 0 1 300 1 300 1e-5 10 3702",
    "Q1 sD 40.0 300 180 0 1 300 1 300 1e-5 10 424242",
    "Q1 sE 40.0 300 180 0 1 300 1 300 1e-9 500 6239",
    "Q2 sF 99.0 300 3 0 1 300 1 300 1e-80 200 562",
    "Q3 sG 99.0 300 3 0 1 300 1 300 1e-80 200 NA",
    "Q4 broken",
    "Q10 sH 99.0 300 3 0 1 300 1 300 1e-100 300 9606",
    ""
};


//-------------------------------------------------------------------
std::string read_text_file(const std::string& filename)
{
    std::ifstream is{filename};
    std::ostringstream ss;
    ss << is.rdbuf();
    return ss.str();
}



//-------------------------------------------------------------------
void end_to_end_correctness()
{
    const auto tax = make_test_taxonomy();
    lineage_classifier lin{tax};
    hit_aggregator agg{lin, 33208, 6231};

    hit_format_options fmt;
    std::ostringstream warnings;

    std::size_t lineNo = 0;
    for(const auto line : example_hits) {
        ++lineNo;
        if(is_hit_comment_or_blank(line)) continue;
        process_hit_line(line, lineNo, fmt, agg, warnings, info_level::moderate);
    }

    //skipped taxa are only reported in verbose mode
    check(warnings.str() ==
        "Q1\t5\t424242\tinvalid/unrecognised parent taxid\n"
        "Q3\t8\tNA\tinvalid/unrecognised taxid\n"
        "Q4\t9\t\tmalformed record\n",
        "pipeline: wrong warnings table:\n" + warnings.str());

    const auto& hstats = agg.statistics();
    check(hstats.total() == 9, "pipeline: wrong number of hits");
    check(hstats[hit_status::skipped_taxon] == 1, "pipeline: wrong skip count");

    selection_thresholds thresholds;
    performance_tuning_options perf;
    perf.numThreads = 2;

    const auto res = classify_queries(agg.evidence(), lin, 33208,
                                      thresholds, perf);

    check(res.scores.size() == 4 && res.decisions.size() == 4,
          "pipeline: wrong number of results");

    const auto& q1 = res.scores[0];
    check(q1.queryId == "Q1", "pipeline: wrong query order");
    check(q1.hU == 50.0, "pipeline: Q1 hU must be 50");
    check(q1.winningCategory == taxon_category::outgroup,
          "pipeline: Q1 must be outgroup");
    check(q1.support == 100.0 * 2.0 / 3.0, "pipeline: Q1 support must be 2/3");
    check(!res.decisions[0].candidate, "pipeline: Q1 must not be a candidate");

    std::ostringstream results;
    std::ostringstream candidates;
    write_result_tables(res, "Metazoa", results, candidates);

    const std::string header =
        "# QUERY\tINGROUP_NAME\thU\tBIT_OUT\tBIT_IN\tAI\tEVAL_OUT\tEVAL_IN"
        "\tWINNING_CATEGORY\tSUPPORT\tLINEAGE\tEVIDENCE\n";

    const std::string q2row =
        "Q2\tMetazoa\t200\t200\t0\t80\t1e-80\t1\tOUTGROUP\t100.00"
        "\tBacteria;undef;Pseudomonadota\t2\n";

    check(results.str() == header +
        "Q1\tMetazoa\t50\t150\t100\t10\t1e-30\t1e-20\tOUTGROUP\t66.67"
        "\tBacteria;undef;Pseudomonadota\t1\n" +
        q2row +
        "Q3\tMetazoa\t0\t0\t0\t0\t1\t1\tNONE\tNA\tundef;undef;undef\t1\n"
        "Q10\tMetazoa\t-300\t0\t300\t-100\t1\t1e-100\tINGROUP\t100.00"
        "\tEukaryota;Metazoa;Chordata\t0\n",
        "pipeline: wrong results table:\n" + results.str());

    check(candidates.str() == header + q2row,
          "pipeline: wrong candidates table:\n" + candidates.str());

    const auto& st = res.statistics;
    check(st.queries == 4, "pipeline: wrong query count");
    check(st.noEvidence == 1, "pipeline: wrong no evidence count");
    check(st.candidates == 1, "pipeline: wrong candidate count");
    check(st.outgroup == 2 && st.ingroup == 1,
          "pipeline: wrong category counts");
    check(st.outgroupSupported == 1 && st.ingroupSupported == 1,
          "pipeline: wrong supported counts");
}



//-------------------------------------------------------------------
void verbose_warnings_correctness()
{
    const auto tax = make_test_taxonomy();
    lineage_classifier lin{tax};
    hit_aggregator agg{lin, 33208, 6231};

    std::ostringstream warnings;
    const auto status = process_hit_line(
        diamond_line("Q1", "s", "1e-9", "500", "6239"), 7,
        hit_format_options{}, agg, warnings, info_level::verbose);

    check(status == hit_status::skipped_taxon, "verbose: hit not skipped");
    check(warnings.str() == "Q1\t7\t6239\ttaxid within skipped (6231)\n",
          "verbose: skipped hit not reported");
}



//-------------------------------------------------------------------
void output_naming_correctness()
{
    selection_thresholds thresholds;
    auto files = make_output_filenames("out", "Homo sapiens", thresholds);

    check(files.results == "out.HGT_results.Homo_sapiens.txt",
          "filenames: wrong results file");
    check(files.candidates == "out.HGT_candidates.Homo_sapiens.supp90.hU30.txt",
          "filenames: wrong candidates file");
    check(files.warnings == "out.HGT_warnings.txt",
          "filenames: wrong warnings file");

    thresholds.support = 95.5;
    thresholds.hU = 100;
    files = make_output_filenames("dir/x", "Metazoa", thresholds);
    check(files.candidates == "dir/x.HGT_candidates.Metazoa.supp95.5.hU100.txt",
          "filenames: wrong candidates file with custom thresholds");

    const auto tax = make_test_taxonomy();
    check(taxon_display_name(tax, 33208) == "Metazoa",
          "display name: wrong name");
    check(taxon_display_name(tax, 424242) == "424242",
          "display name: unknown taxon must be shown by id");
}



//-------------------------------------------------------------------
void run_classification_correctness()
{
    const std::string hitFile = "hgtseek_test_hits.txt.gz";
    const std::string prefix  = "hgtseek_test_run";

    std::string content;
    for(const auto line : example_hits) {
        content += line;
        content += '\n';
    }
    write_gzip_file(hitFile, content);

    classify_options opt;
    opt.hitFile = hitFile;
    opt.prefix = prefix;
    opt.scoring.skipId = 6231;
    opt.performance.numThreads = 3;
    opt.performance.batchSize = 1;
    opt.infoLevel = info_level::silent;

    const auto tax = make_test_taxonomy();
    const auto stats = run_classification(tax, opt);

    const auto files = make_output_filenames(prefix, "Metazoa",
                                             opt.scoring.thresholds);
    const auto results = read_text_file(files.results);
    const auto candidates = read_text_file(files.candidates);
    const auto warnings = read_text_file(files.warnings);

    std::remove(hitFile.c_str());
    std::remove(files.results.c_str());
    std::remove(files.candidates.c_str());
    std::remove(files.warnings.c_str());

    check(stats.queries == 4 && stats.candidates == 1,
          "run: wrong statistics");
    check(results.find("\nQ10\tMetazoa\t-300\t") != std::string::npos,
          "run: results table incomplete");
    check(candidates.find("\nQ2\tMetazoa\t200\t") != std::string::npos,
          "run: candidate missing");
    check(candidates.find("\nQ1\t") == std::string::npos,
          "run: non-candidate in candidates table");
    check(warnings.find("Q3\t8\tNA\tinvalid/unrecognised taxid\n") !=
          std::string::npos, "run: warnings incomplete");

    //missing inputs
    bool thrown = false;
    try {
        opt.hitFile = "hgtseek_test_nonexistent_hits.txt";
        run_classification(tax, opt);
    }
    catch(file_access_error&) {
        thrown = true;
    }
    std::remove((prefix + ".HGT_warnings.txt").c_str());
    std::remove(files.results.c_str());
    std::remove(files.candidates.c_str());
    check(thrown, "run: missing hit file must throw file_access_error");

    thrown = false;
    try {
        opt.scoring.ingroupId = 424242;
        run_classification(tax, opt);
    }
    catch(taxonomy_error&) {
        thrown = true;
    }
    check(thrown, "run: unknown ingroup must throw taxonomy_error");
}



//-------------------------------------------------------------------
void command_line_correctness()
{
    auto opt = get_classify_options(cmdline_args{
        "hits.txt", "-taxonomy", "ncbi", "-skip", "6231",
        "-support", "95", "-hu", "40", "-ai", "-threads", "2",
        "-delimiter", "blast", "-taxid-col", "15", "-silent"});

    check(opt.hitFile == "hits.txt", "cli: wrong hit file");
    check(opt.prefix == "hits.txt", "cli: prefix must default to hit file");
    check(opt.taxonomy.path == "ncbi", "cli: wrong taxonomy path");
    check(opt.scoring.ingroupId == 33208, "cli: wrong default ingroup");
    check(opt.scoring.skipId == 6231, "cli: wrong skip taxon");
    check(opt.scoring.thresholds.support == 95.0, "cli: wrong support");
    check(opt.scoring.thresholds.hU == 40.0, "cli: wrong hU");
    check(opt.scoring.thresholds.useAI, "cli: AI flag not set");
    check(opt.performance.numThreads == 2, "cli: wrong thread count");
    check(opt.format.delimiter == hit_delimiter::tab, "cli: wrong delimiter");
    check(opt.format.columns.taxid == 15, "cli: wrong taxid column");
    check(opt.infoLevel == info_level::silent, "cli: wrong info level");

    opt = get_classify_options(cmdline_args{
        "hits.txt", "-nodesdb", "nodesDB.txt", "-prefix", "out", "-ingroup", "6231"});
    check(opt.prefix == "out", "cli: prefix not set");
    check(opt.taxonomy.nodesDbFile == "nodesDB.txt", "cli: nodesDB not set");
    check(opt.scoring.ingroupId == 6231, "cli: ingroup not set");

    auto rejected = [](const cmdline_args& args) {
        try {
            get_classify_options(args);
        }
        catch(std::invalid_argument&) {
            return true;
        }
        return false;
    };

    check(rejected({"hits.txt"}), "cli: missing taxonomy accepted");
    check(rejected({"-taxonomy", "ncbi"}), "cli: missing hit file accepted");
    check(rejected({"hits.txt", "-taxonomy", "ncbi", "-skip", "abc"}),
          "cli: invalid skip taxon accepted");
    check(rejected({"hits.txt", "-taxonomy", "ncbi", "-support", "120"}),
          "cli: support above 100 accepted");
    check(rejected({"hits.txt", "-taxonomy", "ncbi", "-delimiter", "csv"}),
          "cli: unknown delimiter accepted");
    check(rejected({"hits.txt", "-taxonomy", "ncbi", "-bogus"}),
          "cli: unknown argument accepted");

    auto lopt = get_lineage_options(cmdline_args{
        "9606", "562", "-taxonomy", "ncbi", "-ingroup", "2759"});
    check(lopt.taxa.size() == 2 && lopt.taxa[0] == 9606 && lopt.taxa[1] == 562,
          "cli: wrong lineage taxa");
    check(lopt.ingroupId == 2759, "cli: wrong lineage ingroup");
}



//-------------------------------------------------------------------
void pipeline_correctness()
{
    end_to_end_correctness();
    verbose_warnings_correctness();
    output_naming_correctness();
    run_classification_correctness();
    command_line_correctness();
}


} // namespace hs_test
