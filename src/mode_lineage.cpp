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

#include "io_error.h"
#include "lineage.h"
#include "options.h"
#include "taxonomy_io.h"


namespace hs {


//-------------------------------------------------------------------
void show_taxon_lineage(std::ostream& os,
                        const lineage_classifier& lineages,
                        taxonomy::taxon_id id,
                        taxonomy::taxon_id ingroupId)
{
    const auto& tax = lineages.taxa();
    const auto t = tax[id];

    os << id << '\t';
    if(!t) {
        os << "not found\n";
        return;
    }

    os << (t->name().empty() ? "--" : t->name()) << '\t'
       << t->rank_name() << '\t';

    try {
        os << category_name(lineages.classify(id, ingroupId));
    }
    catch(const malformed_taxonomy& e) {
        os << "MALFORMED (" << e.what() << ")";
    }

    os << '\t' << lineages.lineage_to_high_rank(id)
       << '\t' << lineages.lineage_to_species(id) << '\n';
}



//-------------------------------------------------------------------
void main_mode_lineage(const cmdline_args& args)
{
    auto opt = get_lineage_options(args);

    auto tax = read_taxonomy(opt.taxonomy, opt.infoLevel);

    if(!tax.contains(opt.ingroupId)) {
        throw taxonomy_error{"Ingroup taxon " + std::to_string(opt.ingroupId)
                             + " not found in taxonomy!"};
    }

    lineage_classifier lineages{tax};

    std::cout << "# TAXID\tNAME\tRANK\tCATEGORY\tHIGH_RANK_LINEAGE"
                 "\tSPECIES_LINEAGE\n";

    for(auto id : opt.taxa) {
        show_taxon_lineage(std::cout, lineages, id, opt.ingroupId);
    }
    std::cout.flush();
}


} // namespace hs
