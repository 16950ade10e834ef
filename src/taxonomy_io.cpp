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

#include <iostream>
#include <unordered_map>
#include <vector>

#include "taxonomy_io.h"
#include "options.h"
#include "filesys_utility.h"
#include "line_istream.h"
#include "string_utils.h"
#include "io_error.h"


namespace hs {


using std::string;
using std::cout;
using std::cerr;

using taxon_id = taxonomy::taxon_id;


/*************************************************************************//**
 *
 * @brief splits NCBI dump line ("a\t|\tb\t|\t...") into trimmed fields
 *
 *****************************************************************************/
inline std::vector<string>
split_dump_line(const string& line)
{
    auto fields = split(line, '|');
    for(auto& f : fields) {
        triml(f);
        trimr(f);
    }
    return fields;
}


//-------------------------------------------------------------------
inline bool
is_dump_comment_or_blank(const string& line)
{
    auto i = line.find_first_not_of(" \t");
    return i == string::npos || line[i] == '#';
}


//-------------------------------------------------------------------
inline line_istream
open_taxonomy_file(const string& filename, const char* what)
{
    line_istream is{filename};
    if(!is.good()) {
        throw file_access_error{
            string("Could not read ") + what + " file " + filename, filename};
    }
    return is;
}


//-------------------------------------------------------------------
inline void
report_malformed_lines(std::size_t count, const string& filename,
                       info_level infoLvl)
{
    if(count > 0 && infoLvl != info_level::silent) {
        cerr << "WARNING: skipped " << count << " malformed line(s) in "
             << filename << std::endl;
    }
}



//-------------------------------------------------------------------
taxonomy
make_taxonomic_hierarchy(const string& taxNodesFile,
                         const string& taxNamesFile,
                         const string& mergeTaxFile,
                         info_level infoLvl)
{
    const bool showInfo = infoLvl != info_level::silent;

    //read scientific taxon names
    auto taxonNames = std::unordered_map<taxon_id,string>{};

    if(!taxNamesFile.empty()) {
        auto is = open_taxonomy_file(taxNamesFile, "taxon names");
        if(showInfo) cout << "Reading taxon names ... " << std::flush;

        std::size_t malformed = 0;
        string line;
        while(is.getline(line)) {
            if(is_dump_comment_or_blank(line)) continue;

            const auto fields = split_dump_line(line);
            taxon_id taxonId = 0;
            if(fields.size() < 4 || !parse_positive_integer(fields[0], taxonId)) {
                ++malformed;
                continue;
            }
            if(fields[3] == "scientific name") {
                taxonNames[taxonId] = fields[1];
            }
        }
        if(is.failed()) {
            throw file_read_error{"Error while reading " + taxNamesFile,
                                  taxNamesFile};
        }
        if(showInfo) cout << "done." << std::endl;
        report_malformed_lines(malformed, taxNamesFile, infoLvl);
    }

    taxonomy tax;

    //read taxonomic structure
    {
        auto is = open_taxonomy_file(taxNodesFile, "taxonomic nodes");
        if(showInfo) cout << "Reading taxonomic tree ... " << std::flush;

        std::size_t malformed = 0;
        string line;
        while(is.getline(line)) {
            if(is_dump_comment_or_blank(line)) continue;

            const auto fields = split_dump_line(line);
            taxon_id taxonId = 0;
            taxon_id parentId = 0;
            if(fields.size() < 3 ||
               !parse_positive_integer(fields[0], taxonId) ||
               !parse_positive_integer(fields[1], parentId))
            {
                ++malformed;
                continue;
            }

            auto it = taxonNames.find(taxonId);
            auto taxonName = (it != taxonNames.end()) ? it->second : string("");

            tax.emplace(taxonId, parentId, std::move(taxonName), fields[2]);
        }
        if(is.failed()) {
            throw file_read_error{"Error while reading " + taxNodesFile,
                                  taxNodesFile};
        }
        if(showInfo) cout << tax.size() << " taxa read." << std::endl;
        report_malformed_lines(malformed, taxNodesFile, infoLvl);

        if(tax.empty()) {
            throw io_format_error{"No valid taxon records in " + taxNodesFile};
        }
    }

    //read merged taxa; old ids become direct children of new ids
    if(!mergeTaxFile.empty()) {
        auto is = open_taxonomy_file(mergeTaxFile, "taxonomic node mergers");
        if(showInfo) cout << "Reading taxonomic node mergers ... " << std::flush;

        std::size_t merged = 0;
        std::size_t malformed = 0;
        string line;
        while(is.getline(line)) {
            if(is_dump_comment_or_blank(line)) continue;

            const auto fields = split_dump_line(line);
            taxon_id oldId = 0;
            taxon_id newId = 0;
            if(fields.size() < 2 ||
               !parse_positive_integer(fields[0], oldId) ||
               !parse_positive_integer(fields[1], newId))
            {
                ++malformed;
                continue;
            }
            tax.redirect(oldId, newId);
            ++merged;
        }
        if(is.failed()) {
            throw file_read_error{"Error while reading " + mergeTaxFile,
                                  mergeTaxFile};
        }
        if(showInfo) cout << merged << " mergers read." << std::endl;
        report_malformed_lines(malformed, mergeTaxFile, infoLvl);
    }

    //set rank of root
    tax.reset_rank(taxonomy::root_id(), taxonomy::rank::root);

    return tax;
}



//-------------------------------------------------------------------
taxonomy
make_taxonomic_hierarchy_from_nodesdb(const string& nodesDbFile,
                                      info_level infoLvl)
{
    const bool showInfo = infoLvl != info_level::silent;

    auto is = open_taxonomy_file(nodesDbFile, "nodesDB");
    if(showInfo) cout << "Reading taxonomy from nodesDB ... " << std::flush;

    taxonomy tax;
    std::size_t malformed = 0;
    string line;
    while(is.getline(line)) {
        if(is_dump_comment_or_blank(line)) continue;

        const auto fields = split(line, '\t');
        taxon_id taxonId = 0;
        taxon_id parentId = 0;
        if(fields.size() < 4 ||
           !parse_positive_integer(trimmed(fields[0]), taxonId) ||
           !parse_positive_integer(trimmed(fields[3]), parentId))
        {
            ++malformed;
            continue;
        }
        tax.emplace(taxonId, parentId, fields[2], trimmed(fields[1]));
    }
    if(is.failed()) {
        throw file_read_error{"Error while reading " + nodesDbFile, nodesDbFile};
    }
    if(showInfo) cout << tax.size() << " taxa read." << std::endl;
    report_malformed_lines(malformed, nodesDbFile, infoLvl);

    if(tax.empty()) {
        throw io_format_error{"No valid taxon records in " + nodesDbFile};
    }

    tax.reset_rank(taxonomy::root_id(), taxonomy::rank::root);

    return tax;
}



//-------------------------------------------------------------------
taxonomy
read_taxonomy(const taxonomy_options& opt, info_level infoLvl)
{
    if(!opt.nodesDbFile.empty()) {
        return make_taxonomic_hierarchy_from_nodesdb(opt.nodesDbFile, infoLvl);
    }

    auto nodesFile = opt.nodesFile;
    auto namesFile = opt.namesFile;
    auto mergeFile = opt.mergeFile;

    if(!opt.path.empty()) {
        if(nodesFile.empty()) {
            nodesFile = path_in_directory(opt.path, "nodes.dmp");
        }
        if(namesFile.empty()) {
            namesFile = path_in_directory(opt.path, "names.dmp");
        }
        //merged.dmp is optional in a taxonomy directory
        if(mergeFile.empty()) {
            auto candidate = path_in_directory(opt.path, "merged.dmp");
            if(file_readable(candidate)) mergeFile = std::move(candidate);
        }
    }

    if(nodesFile.empty()) {
        throw file_access_error{"No taxonomy source given"};
    }

    return make_taxonomic_hierarchy(nodesFile, namesFile, mergeFile, infoLvl);
}


} // namespace hs
