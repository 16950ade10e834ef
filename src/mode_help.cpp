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

#include <string>
#include <iostream>
#include <vector>

#include "options.h"


namespace hs {


//-------------------------------------------------------------------
void main_mode_help(const cmdline_args& args)
{
    if(args.size() < 3 || args[1] != "help" || args[2] == "help") {

        if(args.size() > 1 && args[1] != "help") {
            std::cerr << "ERROR: Invalid command line arguments!\n\n";
        }
        else {
            std::cout <<
                "HGTseek  Copyright (C) 2024  The HGTseek developers\n"
                "This program comes with ABSOLUTELY NO WARRANTY.\n"
                "This is free software, and you are welcome to redistribute it\n"
                "under certain conditions. See the file 'LICENSE' for details.\n\n";
        }

        std::cout <<
            "USAGE:\n"
            "\n"
            "    hgtseek <MODE> [OPTION...]\n"
            "\n"
            "    Available modes:\n"
            "\n"
            "    help        shows documentation \n"
            "    classify    score taxified Diamond/BLAST hits and select HGT candidates\n"
            "    lineage     show category and lineage of taxa\n"
            "\n"
            "\n"
            "EXAMPLES:\n"
            "\n"
            "    Classify hits in 'hits.txt' against Metazoa (default ingroup):\n"
            "        hgtseek classify hits.txt -taxonomy ncbi_taxonomy\n"
            "\n"
            "    same, ignoring hits to nematodes, with Alien Index as metric:\n"
            "        hgtseek classify hits.txt -taxonomy ncbi_taxonomy -skip 6231 -ai\n"
            "\n"
            "    View documentation for classify mode:\n"
            "        hgtseek help classify\n";
    }
    else if(args[2] == "classify") {
        std::cout << classify_mode_docs() << '\n';
    }
    else if(args[2] == "lineage") {
        std::cout << lineage_mode_docs() << '\n';
    }
    else {
        std::cerr
            << "You need to specify a mode for which to show help :\n"
            << "    " << args[0] << " help <mode>\n\n"
            << "Unknown mode '" << args[2] << "'\n\n"
            << "Available modes are:\n"
            << "    classify\n"
            << "    lineage\n";
    }
}


} // namespace hs
