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


#include "modes.h"

#include <iostream>
#include <stdexcept>


/*************************************************************************//**
 *
 * @brief  selects & executes main mode / shows quick help
 *
 *****************************************************************************/
int main(int argc, char** argv)
{
    using namespace hs;

    std::string modestr;
    if(argc > 1) { modestr = argv[1]; }

    try {

        if(modestr == "classify") {
            main_mode_classify(make_args_list(argv+2, argv+argc));
        }
        else if(modestr == "lineage") {
            main_mode_lineage(make_args_list(argv+2, argv+argc));
        }
        else {
            main_mode_help(make_args_list(argv, argv+argc));
            if(!modestr.empty() && modestr != "help") return 1;
        }
    }
    catch(std::invalid_argument& e) {
        std::cerr << "ERROR: Invalid command line arguments!\n\n"
                  << e.what() << "\n";
        return 1;
    }
    catch(std::runtime_error& e) {
        std::cerr << "\nABORT: " << e.what() << '\n';
        return 1;
    }
    catch(std::exception& e) {
        std::cerr << e.what() << "\n\n";
        return 1;
    }

    return 0;
}
