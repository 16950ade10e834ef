
#include "../src/taxonomy.h"
#include "../src/taxonomy_io.h"
#include "../src/options.h"
#include "../src/io_error.h"
#include "../src/lineage.h"

#include "test_taxonomy.h"

#include <zlib.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>


namespace hs_test {

using namespace hs;


//-------------------------------------------------------------------
void write_text_file(const std::string& filename, const std::string& content)
{
    std::ofstream os{filename};
    os << content;
    if(!os) throw std::runtime_error{"could not write test file " + filename};
}


//-------------------------------------------------------------------
void write_gzip_file(const std::string& filename, const std::string& content)
{
    gzFile f = gzopen(filename.c_str(), "wb");
    if(!f) throw std::runtime_error{"could not write test file " + filename};
    gzwrite(f, content.data(), unsigned(content.size()));
    gzclose(f);
}



//-------------------------------------------------------------------
void taxonomy_store_correctness()
{
    auto tax = make_test_taxonomy();

    check(tax.parent_id(9606) == 7711, "taxonomy: wrong parent of 9606");
    check(tax.parent_id(123456) == taxonomy::none_id(),
          "taxonomy: unknown taxon must have no parent");
    check(tax.rank_of(6231) == taxonomy::rank::Phylum,
          "taxonomy: wrong rank of 6231");
    check(tax.rank_of(123456) == taxonomy::rank::none,
          "taxonomy: unknown taxon must have no rank");
    check(tax.name_of(33208) == "Metazoa", "taxonomy: wrong name of 33208");
    check(tax.name_of(123456).empty(), "taxonomy: unknown taxon has name");
    check(tax[9606] && tax[9606]->name() == "Homo sapiens",
          "taxonomy: operator[] failed");
    check(!tax.emplace(9606, 1, "duplicate"),
          "taxonomy: duplicate id must not be inserted");
    check(tax.name_of(9606) == "Homo sapiens",
          "taxonomy: duplicate insertion changed taxon");
    check(!tax.emplace(taxonomy::none_id(), 1),
          "taxonomy: none id must not be inserted");

    //redirect: new entry for old id
    tax.redirect(1000, 9606);
    check(tax.parent_id(1000) == 9606, "taxonomy: redirect not inserted");
    //redirect: overwrite existing parent
    tax.redirect(5, 562);
    check(tax.parent_id(5) == 562, "taxonomy: redirect did not overwrite");

    using rank = taxonomy::rank;
    check(taxonomy::rank_from_name("superkingdom") == rank::Domain,
          "taxonomy: superkingdom not mapped to domain rank");
    check(taxonomy::rank_from_name("domain") == rank::Domain,
          "taxonomy: domain not mapped to domain rank");
    check(taxonomy::rank_from_name("Phylum") == rank::Phylum,
          "taxonomy: rank names must be case insensitive");
    check(taxonomy::rank_from_name("division") == rank::none,
          "taxonomy: division must not be a main rank");
    check(taxonomy::rank_from_name("no rank") == rank::none,
          "taxonomy: 'no rank' must map to none");
}



//-------------------------------------------------------------------
void taxonomy_dump_reading_correctness()
{
    const std::string nodes  = "hgtseek_test_nodes.dmp";
    const std::string names  = "hgtseek_test_names.dmp.gz";
    const std::string merged = "hgtseek_test_merged.dmp";

    write_text_file(nodes,
        "1\t|\t1\t|\tno rank\t|\t\t|\n"
        "2759\t|\t1\t|\tsuperkingdom\t|\t\t|\n"
        "33208\t|\t2759\t|\tkingdom\t|\t\t|\n"
        "7711\t|\t33208\t|\tphylum\t|\t\t|\n"
        "9606\t|\t7711\t|\tspecies\t|\t\t|\n"
        "# comment line\n"
        "not a number\t|\t1\t|\tspecies\t|\n"
        "2\t|\t1\t|\tdomain\t|\t\t|\n"
        "562\t|\t2\t|\tspecies\t|\t\t|\n");

    write_gzip_file(names,
        "1\t|\troot\t|\t\t|\tscientific name\t|\n"
        "2759\t|\tEukaryota\t|\t\t|\tscientific name\t|\n"
        "2759\t|\teucaryotes\t|\t\t|\tgenbank common name\t|\n"
        "33208\t|\tMetazoa\t|\t\t|\tscientific name\t|\n"
        "33208\t|\tanimals\t|\t\t|\tblast name\t|\n"
        "7711\t|\tChordata\t|\t\t|\tscientific name\t|\n"
        "9606\t|\thuman\t|\t\t|\tgenbank common name\t|\n"
        "9606\t|\tHomo sapiens\t|\t\t|\tscientific name\t|\n"
        "9606\t|\tman\t|\t\t|\tcommon name\t|\n"
        "2\t|\tBacteria\t|\tBacteria <bacteria>\t|\tscientific name\t|\n"
        "562\t|\tEscherichia coli\t|\t\t|\tscientific name\t|\n");

    write_text_file(merged,
        "63221\t|\t9606\t|\n"
        "12345\t|\t562\t|\n");

    auto tax = make_taxonomic_hierarchy(nodes, names, merged,
                                        info_level::silent);

    std::remove(nodes.c_str());
    std::remove(names.c_str());
    std::remove(merged.c_str());

    check(tax.contains(9606) && tax.contains(562),
          "dump reader: nodes missing");
    check(!tax.contains(0), "dump reader: malformed line was read");
    check(tax.name_of(9606) == "Homo sapiens",
          "dump reader: non-scientific name used");
    check(tax.name_of(2759) == "Eukaryota",
          "dump reader: non-scientific name used");
    check(tax.rank_of(2) == taxonomy::rank::Domain,
          "dump reader: 'domain' rank not recognized");
    check(tax.rank_of(1) == taxonomy::rank::root,
          "dump reader: root rank not set");

    //merged ids become direct children of their new ids
    check(tax.parent_id(63221) == 9606, "dump reader: merged id not redirected");
    check(tax.parent_id(12345) == 562, "dump reader: merged id not redirected");

    lineage_classifier lin{tax};
    check(lin.classify(63221, 33208) == taxon_category::ingroup,
          "dump reader: merged ingroup id not classified as ingroup");
    check(lin.classify(12345, 33208) == taxon_category::outgroup,
          "dump reader: merged outgroup id not classified as outgroup");
}



//-------------------------------------------------------------------
void taxonomy_nodesdb_reading_correctness()
{
    const std::string nodesdb = "hgtseek_test_nodesDB.txt";

    write_text_file(nodesdb,
        "# nodes_count = 5\n"
        "1\tno rank\troot\t1\n"
        "2759\tsuperkingdom\tEukaryota\t1\n"
        "33208\tkingdom\tMetazoa\t2759\n"
        "6231\tphylum\tNematoda\t33208\n"
        "6239\tspecies\tCaenorhabditis elegans\t6231\n");

    auto tax = make_taxonomic_hierarchy_from_nodesdb(nodesdb, info_level::silent);
    std::remove(nodesdb.c_str());

    check(tax.size() == 5, "nodesDB reader: wrong number of taxa");
    check(tax.parent_id(6239) == 6231, "nodesDB reader: wrong parent");
    check(tax.name_of(6239) == "Caenorhabditis elegans",
          "nodesDB reader: wrong name");
    check(tax.rank_of(6231) == taxonomy::rank::Phylum,
          "nodesDB reader: wrong rank");

    lineage_classifier lin{tax};
    check(lin.lineage_to_high_rank(6239) == "Eukaryota;Metazoa;Nematoda",
          "nodesDB reader: wrong lineage");
}



//-------------------------------------------------------------------
void taxonomy_options_correctness()
{
    //missing sources
    bool thrown = false;
    try {
        taxonomy_options opt;
        read_taxonomy(opt, info_level::silent);
    }
    catch(file_access_error&) {
        thrown = true;
    }
    check(thrown, "read_taxonomy: missing source must throw file_access_error");

    //unreadable nodes file
    thrown = false;
    try {
        taxonomy_options opt;
        opt.path = "hgtseek_test_nonexistent_directory";
        read_taxonomy(opt, info_level::silent);
    }
    catch(file_access_error&) {
        thrown = true;
    }
    check(thrown, "read_taxonomy: unreadable nodes must throw file_access_error");

    //file without a single valid record
    const std::string garbage = "hgtseek_test_garbage.txt";
    write_text_file(garbage, "# only a comment\nno taxa here\n");
    thrown = false;
    try {
        taxonomy_options opt;
        opt.nodesDbFile = garbage;
        read_taxonomy(opt, info_level::silent);
    }
    catch(io_format_error&) {
        thrown = true;
    }
    std::remove(garbage.c_str());
    check(thrown, "read_taxonomy: empty taxonomy must throw io_format_error");
}



//-------------------------------------------------------------------
void taxonomy_correctness()
{
    taxonomy_store_correctness();
    taxonomy_dump_reading_correctness();
    taxonomy_nodesdb_reading_correctness();
    taxonomy_options_correctness();
}


} // namespace hs_test
