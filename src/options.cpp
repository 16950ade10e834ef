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

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "options.h"
#include "filesys_utility.h"
#include "string_utils.h"

#include <clipp.h>


namespace hs {

using std::size_t;
using std::vector;
using std::string;
using std::to_string;

using namespace std::string_literals;



/*************************************************************************//**
 *
 * @brief collects all command line interface error messages
 *
 *****************************************************************************/
class error_messages {
public:
    error_messages& operator += (const string& message) {
        messages_.push_back(message);
        return *this;
    }
    error_messages& operator += (string&& message) {
        messages_.push_back(std::move(message));
        return *this;
    }

    bool any() const noexcept   { return !messages_.empty(); }

    string str() const {
        string s;
        for(const auto& msg : messages_) {
            if(!msg.empty()) s += msg + '\n';
        }
        return s;
    }

private:
    vector<string> messages_;
};




/*****************************************************************************
 *
 *  H E L P E R S
 *
 *****************************************************************************/

//-------------------------------------------------------------------
/// @brief prints number without trailing zeros
string number_string(double x)
{
    auto s = to_string(x);
    if(s.find('.') != string::npos) {
        while(!s.empty() && s.back() == '0') s.pop_back();
        if(!s.empty() && s.back() == '.') s.pop_back();
    }
    return s;
}



//-------------------------------------------------------------------
auto cli_doc_formatting()
{
    return clipp::doc_formatting{}
        .first_column(0)
        .doc_column(22)
        .last_column(80)
        .indent_size(4)
        .line_spacing(1)
        .alternatives_min_split_size(2)
        .paragraph_spacing(2)
        .max_flags_per_param_in_usage(1)
        .max_flags_per_param_in_doc(1)
        ;
}

auto cli_usage_formatting()
{
    return cli_doc_formatting().first_column(4).line_spacing(0);
}



//-------------------------------------------------------------------
/// @brief adds 'parameter' that catches unknown args with '-' prefix
clipp::parameter
catch_unknown(error_messages& err) {
    return clipp::any(clipp::match::prefix{"-"},
        [&](const string& arg) { err += "unknown argument: "s + arg; });
}



//-------------------------------------------------------------------
/// @brief parses taxon id argument; reports invalid ids
auto taxon_id_setter(taxonomy::taxon_id& target, const string& flag,
                     error_messages& err)
{
    return [&target,flag,&err](const string& arg) {
        taxonomy::taxon_id id = 0;
        if(parse_positive_integer(arg, id)) {
            target = id;
        } else {
            err += "Invalid taxon id '"s + arg + "' after '" + flag + "'!";
        }
    };
}



//-------------------------------------------------------------------
void raise_default_error(const error_messages& err,
                         const string& mode = "",
                         const string& usage = "",
                         const string& examples = "")
{
    auto msg = err.str();

    if(!msg.empty())      msg += "\n";

    if(!usage.empty())    msg += "USAGE:\n" + usage + "\n\n";
    if(!examples.empty()) msg += "EXAMPLES:\n" + examples + "\n\n";

    if(!mode.empty()) {
        msg += "\nYou can view the full interface documentation of mode '"s
            + mode + "' with:\n    hgtseek help " + mode + " | less";
    }

    throw std::invalid_argument{std::move(msg)};
}




/*****************************************************************************
 *
 *
 *  S H A R E D
 *
 *
 *****************************************************************************/

//-------------------------------------------------------------------
clipp::group
info_level_cli(info_level& lvl, error_messages& err)
{
    using namespace clipp;

    return one_of (
        option("-silent").set(lvl, info_level::silent),
        option("-verbose").set(lvl, info_level::verbose)
        .if_conflicted([&]{
            err += "Info level must be either '-silent' or '-verbose'!";
        })
    )
        % "information level during run:\n"
          "silent => none / verbose => most detailed\n"
          "default: neither => only errors/important info";
}



//-------------------------------------------------------------------
/// @brief shared command-line options for taxonomy
clipp::group
taxonomy_cli(taxonomy_options& opt, error_messages& err)
{
    using namespace clipp;

    return (
    (   option("-taxonomy") &
        value("path", opt.path)
            .if_missing([&]{ err += "Taxonomy path is missing after '-taxonomy'!"; })
    )
        % "directory with NCBI's taxonomic data files "
          "(nodes.dmp, names.dmp, optional merged.dmp)\n"
    ,
    (   option("-nodes") &
        value("file", opt.nodesFile)
            .if_missing([&]{ err += "File name is missing after '-nodes'!"; })
    )
        % "NCBI nodes.dmp file; overrides the one in '-taxonomy'"
    ,
    (   option("-names") &
        value("file", opt.namesFile)
            .if_missing([&]{ err += "File name is missing after '-names'!"; })
    )
        % "NCBI names.dmp file; overrides the one in '-taxonomy'"
    ,
    (   option("-merged") &
        value("file", opt.mergeFile)
            .if_missing([&]{ err += "File name is missing after '-merged'!"; })
    )
        % "NCBI merged.dmp file; overrides the one in '-taxonomy'"
    ,
    (   option("-nodesdb") &
        value("file", opt.nodesDbFile)
            .if_missing([&]{ err += "File name is missing after '-nodesdb'!"; })
    )
        % "blobtools nodesDB.txt file (taxid, rank, name, parent);\n"
          "takes precedence over all other taxonomy sources"
    );
}



//-------------------------------------------------------------------
void check_taxonomy_options(const taxonomy_options& opt, error_messages& err)
{
    if(opt.path.empty() && opt.nodesFile.empty() && opt.nodesDbFile.empty()) {
        err += "No taxonomy given! Use '-taxonomy', '-nodes' or '-nodesdb'.";
    }
}



//-------------------------------------------------------------------
clipp::group
ingroup_cli(taxonomy::taxon_id& ingroupId, error_messages& err)
{
    using namespace clipp;

    return (
        option("-ingroup") &
        value("taxid")
            .call(taxon_id_setter(ingroupId, "-ingroup", err))
            .if_missing([&]{ err += "Taxon id is missing after '-ingroup'!"; })
    )
        %("taxon id of the ingroup clade; all other taxa form the outgroup\n"
          "default: "s + to_string(ingroupId) + " (Metazoa)");
}





/*****************************************************************************
 *
 *
 *  C L A S S I F Y   M O D E
 *
 *
 *****************************************************************************/

/// @brief command line interface for hit file format
clipp::group
hit_format_cli(hit_format_options& opt, error_messages& err)
{
    using namespace clipp;

    auto& col = opt.columns;

    return (
    (   option("-query-col") &
        integer("#", col.query)
            .if_missing([&]{ err += "Number missing after '-query-col'!"; })
    )
        %("column with query ids\n"
          "default: "s + to_string(col.query))
    ,
    (   option("-subject-col") &
        integer("#", col.subject)
            .if_missing([&]{ err += "Number missing after '-subject-col'!"; })
    )
        %("column with subject ids\n"
          "default: "s + to_string(col.subject))
    ,
    (   option("-evalue-col") &
        integer("#", col.evalue)
            .if_missing([&]{ err += "Number missing after '-evalue-col'!"; })
    )
        %("column with e-values\n"
          "default: "s + to_string(col.evalue))
    ,
    (   option("-bitscore-col") &
        integer("#", col.bitscore)
            .if_missing([&]{ err += "Number missing after '-bitscore-col'!"; })
    )
        %("column with bitscores\n"
          "default: "s + to_string(col.bitscore))
    ,
    (   option("-taxid-col") &
        integer("#", col.taxid)
            .if_missing([&]{ err += "Number missing after '-taxid-col'!"; })
    )
        %("column with subject taxon ids\n"
          "default: "s + to_string(col.taxid))
    ,
    (   option("-delimiter") &
        value("diamond|blast", [&](const string& name) {
                if(name == "diamond") {
                    opt.delimiter = hit_delimiter::whitespace;
                } else if(name == "blast") {
                    opt.delimiter = hit_delimiter::tab;
                } else {
                    err += "Unknown delimiter '"s + name +
                           "'! Choose 'diamond' or 'blast'.";
                }
            })
            .if_missing([&]{ err += "Delimiter missing after '-delimiter'!"; })
    )
        %("column separator: 'diamond' => runs of whitespace, "
          "'blast' => tab characters\n"
          "default: "s +
          (opt.delimiter == hit_delimiter::tab ? "blast" : "diamond"))
    );
}



//-------------------------------------------------------------------
/// @brief command line interface for ingroup / skip / thresholds
clipp::group
scoring_cli(scoring_options& opt, error_messages& err)
{
    using namespace clipp;

    auto& thr = opt.thresholds;

    return (
        ingroup_cli(opt.ingroupId, err)
    ,
    (   option("-skip") &
        value("taxid")
            .call(taxon_id_setter(opt.skipId, "-skip", err))
            .if_missing([&]{ err += "Taxon id is missing after '-skip'!"; })
    )
        % "ignore all hits to taxa within this clade "
          "(e.g. the phylum of the studied organism)\n"
          "default: none"
    ,
    (   option("-support") &
        number("%", thr.support)
            .if_missing([&]{ err += "Number missing after '-support'!"; })
    )
        %("minimum consensus hit support (percentage of hit taxa "
          "agreeing with the winning category) of candidates\n"
          "default: "s + number_string(thr.support))
    ,
    (   option("-hu") &
        number("score", thr.hU)
            .if_missing([&]{ err += "Number missing after '-hu'!"; })
    )
        %("minimum HGT index (hU) of candidates; "
          "also used as Alien Index threshold\n"
          "default: "s + number_string(thr.hU))
    ,
    (   option("-ingroup-hu") &
        number("score", thr.ingroupHU)
            .if_missing([&]{ err += "Number missing after '-ingroup-hu'!"; })
    )
        %("maximum hU of queries with good ingroup evidence "
          "(EVIDENCE column = 0)\n"
          "default: "s + number_string(thr.ingroupHU))
    ,
    option("-ai").set(thr.useAI)
        %("use Alien Index (AI) instead of hU to select candidates\n"
          "default: "s + (thr.useAI ? "on" : "off"))
    );
}



//-------------------------------------------------------------------
/// @brief command line interface for parallel execution
clipp::group
performance_cli(performance_tuning_options& opt, error_messages& err)
{
    using namespace clipp;

    return (
    (   option("-threads") &
        integer("#", opt.numThreads)
            .if_missing([&]{ err += "Number missing after '-threads'!"; })
    )
        %("number of scoring threads\n"
          "default: "s + to_string(opt.numThreads))
    ,
    (   option("-batch-size") &
        integer("#", opt.batchSize)
            .if_missing([&]{ err += "Number missing after '-batch-size'!"; })
    )
        %("number of queries per work item\n"
          "default: "s + to_string(opt.batchSize))
    );
}



//-------------------------------------------------------------------
/// @brief classify mode command-line options
clipp::group
classify_mode_cli(classify_options& opt, error_messages& err)
{
    using namespace clipp;

    return (
    "REQUIRED PARAMETERS" %
    (
        value(match::prefix_not{"-"}, "hit file", opt.hitFile)
            .if_missing([&]{ err += "Hit file name is missing!"; })
            % "tabular Diamond/BLAST output (plain or gzip compressed) "
              "with subject taxon ids"
    ),
    "TAXONOMY" %
        taxonomy_cli(opt.taxonomy, err)
    ,
    "CLASSIFICATION" %
        scoring_cli(opt.scoring, err)
    ,
    "INPUT FORMAT" %
        hit_format_cli(opt.format, err)
    ,
    "OUTPUT & PERFORMANCE" %
    (
        (   option("-prefix") &
            value("prefix", opt.prefix)
                .if_missing([&]{ err += "Prefix is missing after '-prefix'!"; })
        )
            % "prefix of output files\n"
              "default: hit file name"
        ,
        performance_cli(opt.performance, err)
        ,
        info_level_cli(opt.infoLevel, err)
    ),
    catch_unknown(err)
    );
}



//-------------------------------------------------------------------
classify_options
get_classify_options(const cmdline_args& args, classify_options opt)
{
    error_messages err;

    auto cli = classify_mode_cli(opt, err);

    auto result = clipp::parse(args, cli);

    if(result) {
        check_taxonomy_options(opt.taxonomy, err);

        const auto& col = opt.format.columns;
        if(col.query < 1 || col.subject < 1 || col.evalue < 1 ||
           col.bitscore < 1 || col.taxid < 1)
        {
            err += "Column numbers must be >= 1!";
        }
        const auto& thr = opt.scoring.thresholds;
        if(thr.support < 0 || thr.support > 100) {
            err += "Support threshold must be within [0,100]!";
        }
        if(opt.performance.numThreads < 1) {
            err += "Number of threads must be >= 1!";
        }
    }

    if(!result || err.any()) {
        raise_default_error(err, "classify", classify_mode_usage());
    }

    if(opt.prefix.empty()) opt.prefix = opt.hitFile;

    return opt;
}



//-------------------------------------------------------------------
string classify_mode_usage()
{
    classify_options opt;
    error_messages err;
    const auto cli = classify_mode_cli(opt, err);
    return clipp::usage_lines(cli, "hgtseek classify", cli_usage_formatting()).str();
}



//-------------------------------------------------------------------
string classify_mode_examples() {
    return
    "    Find HGT candidates in a Diamond result (taxids in column 13)\n"
    "    of a nematode, ignoring all hits to other nematodes:\n"
    "        hgtseek classify hits.daa.txt -taxonomy ncbi_taxonomy -skip 6231\n"
    "\n"
    "    Use a blobtools nodesDB table and a stricter support threshold:\n"
    "        hgtseek classify hits.txt.gz -nodesdb nodesDB.txt -support 95\n"
    "\n"
    "    Tab separated BLAST output with taxids in column 15:\n"
    "        hgtseek classify hits.blast -taxonomy ncbi -delimiter blast -taxid-col 15\n";
}



//-------------------------------------------------------------------
string classify_mode_docs() {

    classify_options opt;
    error_messages err;
    const auto cli = classify_mode_cli(opt, err);

    string docs = "SYNOPSIS\n\n";

    docs += clipp::usage_lines(cli, "hgtseek classify", cli_usage_formatting()).str();

    docs += "\n\n\n"
        "DESCRIPTION\n"
        "\n"
        "    Classifies each query of a similarity search result as having\n"
        "    its closest relatives inside (INGROUP) or outside (OUTGROUP)\n"
        "    the ingroup clade and reports HGT evidence scores:\n"
        "      hU      best outgroup bitscore - best ingroup bitscore\n"
        "      AI      log10(best ingroup e-value + 1e-200)\n"
        "              - log10(best outgroup e-value + 1e-200)\n"
        "      SUPPORT percentage of hit taxa agreeing with the winning\n"
        "              category (consensus hit support)\n"
        "\n"
        "    A query is an HGT candidate if hU (or AI) >= threshold, its\n"
        "    winning category is OUTGROUP and its support >= threshold.\n"
        "\n"
        "    Output files:\n"
        "      <prefix>.HGT_results.<ingroup>.txt\n"
        "      <prefix>.HGT_candidates.<ingroup>.supp<S>.hU<L>.txt\n"
        "      <prefix>.HGT_warnings.txt\n"
        "\n\n";

    docs += clipp::documentation(cli, cli_doc_formatting()).str();

    docs += "\n\n\nEXAMPLES\n\n";
    docs += classify_mode_examples();

    return docs;
}





/*****************************************************************************
 *
 *
 *  L I N E A G E   M O D E
 *
 *
 *****************************************************************************/

/// @brief lineage mode command-line options
clipp::group
lineage_mode_cli(lineage_options& opt, error_messages& err)
{
    using namespace clipp;

    return (
    "REQUIRED PARAMETERS" %
    (
        values(match::prefix_not{"-"}, "taxid", [&](const string& arg) {
                taxonomy::taxon_id id = 0;
                if(parse_positive_integer(arg, id)) {
                    opt.taxa.push_back(id);
                } else {
                    err += "Invalid taxon id '"s + arg + "'!";
                }
            })
            .if_missing([&]{ err += "No taxon ids given!"; })
            % "taxon ids to look up"
    ),
    "OPTIONS" %
    (
        taxonomy_cli(opt.taxonomy, err),
        ingroup_cli(opt.ingroupId, err),
        info_level_cli(opt.infoLevel, err)
    ),
    catch_unknown(err)
    );
}



//-------------------------------------------------------------------
lineage_options
get_lineage_options(const cmdline_args& args, lineage_options opt)
{
    error_messages err;

    auto cli = lineage_mode_cli(opt, err);

    auto result = clipp::parse(args, cli);

    if(result) check_taxonomy_options(opt.taxonomy, err);

    if(!result || err.any()) {
        raise_default_error(err, "lineage", lineage_mode_usage());
    }

    return opt;
}



//-------------------------------------------------------------------
string lineage_mode_usage()
{
    lineage_options opt;
    error_messages err;
    const auto cli = lineage_mode_cli(opt, err);
    return clipp::usage_lines(cli, "hgtseek lineage", cli_usage_formatting()).str();
}



//-------------------------------------------------------------------
string lineage_mode_examples() {
    return
    "    Show lineage of human and E. coli relative to Metazoa:\n"
    "        hgtseek lineage 9606 562 -taxonomy ncbi_taxonomy\n";
}



//-------------------------------------------------------------------
string lineage_mode_docs() {

    lineage_options opt;
    error_messages err;
    const auto cli = lineage_mode_cli(opt, err);

    string docs = "SYNOPSIS\n\n";

    docs += clipp::usage_lines(cli, "hgtseek lineage", cli_usage_formatting()).str();

    docs += "\n\n\n"
        "DESCRIPTION\n"
        "\n"
        "    Prints name, rank, category relative to the ingroup and the\n"
        "    ranked lineages of the given taxa.\n"
        "\n\n";

    docs += clipp::documentation(cli, cli_doc_formatting()).str();

    docs += "\n\n\nEXAMPLES\n\n";
    docs += lineage_mode_examples();

    return docs;
}


} // namespace hs
