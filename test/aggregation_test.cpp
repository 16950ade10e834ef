
#include "../src/hit_io.h"
#include "../src/hit_aggregation.h"
#include "../src/lineage.h"
#include "../src/string_utils.h"

#include "test_taxonomy.h"

#include <string>
#include <vector>


namespace hs_test {

using namespace hs;


//-------------------------------------------------------------------
std::string
make_hit_line(const std::string& query, const std::string& taxon,
              const std::string& evalue, const std::string& bitscore,
              char sep = '\t')
{
    std::string line = query;
    line += sep; line += "subj_" + query;
    //pident ... send (8 columns)
    for(int i = 0; i < 8; ++i) {
        line += sep; line += std::to_string(i + 1);
    }
    line += sep; line += evalue;
    line += sep; line += bitscore;
    line += sep; line += taxon;
    return line;
}



//-------------------------------------------------------------------
void hit_parsing_correctness()
{
    hit_format_options fmt;
    hit h;

    check(parse_hit(make_hit_line("q1", "9606", "1e-30", "150.5"), fmt, h),
          "parse_hit: valid line rejected");
    check(h.queryId == "q1" && h.subjectId == "subj_q1",
          "parse_hit: wrong ids");
    check(h.taxon == "9606", "parse_hit: wrong taxon token");
    check(approx_equal(h.evalue, 1e-30) && approx_equal(h.bitscore, 150.5),
          "parse_hit: wrong numbers");

    //runs of whitespace separate columns
    check(parse_hit(make_hit_line("q2", "562", "0.0", "42", ' ') + "   ", fmt, h),
          "parse_hit: whitespace separated line rejected");
    check(h.taxon == "562" && h.evalue == 0.0, "parse_hit: wrong fields");

    //missing columns; query id is still extracted
    check(!parse_hit("q3\ts\t1\t2", fmt, h), "parse_hit: short line accepted");
    check(h.queryId == "q3", "parse_hit: query id of short line not kept");

    //bad numbers
    check(!parse_hit(make_hit_line("q4", "9606", "abc", "10"), fmt, h),
          "parse_hit: non-numeric e-value accepted");
    check(!parse_hit(make_hit_line("q4", "9606", "1e-5", "-3"), fmt, h),
          "parse_hit: negative bitscore accepted");

    //tab delimiter keeps empty fields
    hit_format_options tabs;
    tabs.delimiter = hit_delimiter::tab;
    auto line = make_hit_line("q5", "", "1e-5", "10");
    check(parse_hit(line, tabs, h) && h.taxon.empty(),
          "parse_hit: empty tab-delimited taxon field not kept");

    //custom columns
    hit_format_options custom;
    custom.columns.query = 3;
    custom.columns.subject = 1;
    custom.columns.evalue = 2;
    custom.columns.bitscore = 4;
    custom.columns.taxid = 5;
    check(custom.columns.max_column() == 5, "hit_columns: wrong max column");
    check(parse_hit("s1 0.001 qX 77 9606", custom, h),
          "parse_hit: custom columns rejected");
    check(h.queryId == "qX" && h.subjectId == "s1" && h.taxon == "9606" &&
          approx_equal(h.bitscore, 77.0) && approx_equal(h.evalue, 0.001),
          "parse_hit: custom columns misread");

    check(is_hit_comment_or_blank(""), "blank line not recognized");
    check(is_hit_comment_or_blank("  \t "), "whitespace line not recognized");
    check(is_hit_comment_or_blank("# header"), "comment line not recognized");
    check(!is_hit_comment_or_blank("q1 #"), "hit line taken as comment");
}



//-------------------------------------------------------------------
hit make_hit(const std::string& q, const std::string& taxon,
             double bitscore, double evalue)
{
    hit h;
    h.queryId = q;
    h.subjectId = "s";
    h.taxon = taxon;
    h.bitscore = bitscore;
    h.evalue = evalue;
    return h;
}



//-------------------------------------------------------------------
void hit_filtering_correctness()
{
    const auto tax = make_test_taxonomy();
    lineage_classifier lin{tax};

    //threshold Metazoa, skip Nematoda
    hit_aggregator agg{lin, 33208, 6231};

    check(agg.ingest(make_hit("q", "9606", 100, 1e-20)) == hit_status::accepted,
          "ingest: ingroup hit rejected");
    check(agg.ingest(make_hit("q", "562", 50, 1e-10)) == hit_status::accepted,
          "ingest: outgroup hit rejected");
    check(agg.ingest(make_hit("q", "562", 60, 1e-12)) == hit_status::accepted,
          "ingest: second hit to same taxon rejected");

    check(agg.ingest(make_hit("q", "NA", 10, 1)) == hit_status::invalid_taxid,
          "ingest: non-numeric taxid accepted");
    check(agg.ingest(make_hit("q", "9606.5", 10, 1)) == hit_status::invalid_taxid,
          "ingest: fractional taxid accepted");
    check(agg.ingest(make_hit("q", "0", 10, 1)) == hit_status::invalid_taxid,
          "ingest: zero taxid accepted");
    check(agg.ingest(make_hit("q", "", 10, 1)) == hit_status::invalid_taxid,
          "ingest: empty taxid accepted");
    check(agg.ingest(make_hit("q", "424242", 10, 1)) == hit_status::unknown_parent,
          "ingest: unknown taxid accepted");
    check(agg.ingest(make_hit("q", "6239", 10, 1)) == hit_status::skipped_taxon,
          "ingest: taxon in skipped clade accepted");
    check(agg.ingest(make_hit("q", "99999", 10, 1)) == hit_status::unassigned,
          "ingest: unclassified taxon accepted");
    check(agg.ingest(make_hit("q", "88888", 10, 1)) == hit_status::unassigned,
          "ingest: unidentified taxon accepted");
    check(agg.ingest(make_hit("q", "700", 10, 1)) == hit_status::malformed_taxonomy,
          "ingest: taxon with cyclic lineage accepted");
    check(agg.ingest(make_hit("q", "800", 10, 1)) == hit_status::malformed_taxonomy,
          "ingest: taxon with broken lineage accepted");
    agg.count_malformed_record();

    const auto& stats = agg.statistics();
    check(stats.total() == 14, "hit statistics: wrong total");
    check(stats[hit_status::accepted] == 3, "hit statistics: wrong accepted");
    check(stats[hit_status::invalid_taxid] == 4, "hit statistics: wrong invalid");
    check(stats[hit_status::unknown_parent] == 1, "hit statistics: wrong unknown");
    check(stats[hit_status::skipped_taxon] == 1, "hit statistics: wrong skipped");
    check(stats[hit_status::unassigned] == 2, "hit statistics: wrong unassigned");
    check(stats[hit_status::malformed_taxonomy] == 2,
          "hit statistics: wrong malformed taxonomy");
    check(stats[hit_status::malformed_record] == 1,
          "hit statistics: wrong malformed record");
    check(stats.rejected() == 11, "hit statistics: wrong rejected");

    //only accepted hits are evidence
    const auto& ev = agg.evidence();
    check(ev.size() == 1, "evidence: wrong number of queries");
    const auto& q = ev.at("q");
    check(q.size() == 2, "evidence: wrong number of taxa");
    check(q.at(562).bitscores.size() == 2 && q.at(562).evalues.size() == 2,
          "evidence: hits to the same taxon not collected");
    check(q.at(9606).bitscores.front() == 100.0,
          "evidence: wrong bitscore stored");

    check(hit_status_description(hit_status::skipped_taxon, 6231) ==
          "taxid within skipped (6231)", "wrong skip reason text");
    check(hit_status_description(hit_status::invalid_taxid) ==
          "invalid/unrecognised taxid", "wrong invalid reason text");
}



//-------------------------------------------------------------------
void hit_aggregation_order_correctness()
{
    const auto tax = make_test_taxonomy();
    lineage_classifier lin{tax};
    hit_aggregator agg{lin, 33208};

    //without skip clade Nematoda hits are ingroup evidence
    check(agg.ingest(make_hit("gene10", "6239", 10, 1)) == hit_status::accepted,
          "ingest: hit rejected without skip clade");
    //query whose hits are all rejected is still registered
    agg.ingest(make_hit("gene2", "NA", 10, 1));
    agg.ingest(make_hit("gene1", "562", 10, 1));
    agg.ingest(make_hit("Gene", "562", 10, 1));

    std::vector<std::string> order;
    for(const auto& q : agg.evidence()) order.push_back(q.first);

    const std::vector<std::string> expected {"Gene", "gene1", "gene2", "gene10"};
    check(order == expected, "evidence: queries not in natural order");
    check(agg.evidence().at("gene2").empty(),
          "evidence: query without accepted hits has evidence");

    auto released = agg.release_evidence();
    check(released.size() == 4, "evidence: release lost queries");

    natural_less less;
    check(less("a2", "a10") && !less("a10", "a2"), "natural_less: digits");
    check(less("a", "ab") && !less("ab", "a"), "natural_less: prefix");
    check(less("x01", "x1") || less("x1", "x01"),
          "natural_less: leading zeros must be ordered");
    check(!less("same", "same"), "natural_less: not irreflexive");
}



//-------------------------------------------------------------------
void aggregation_correctness()
{
    hit_parsing_correctness();
    hit_filtering_correctness();
    hit_aggregation_order_correctness();
}


} // namespace hs_test
