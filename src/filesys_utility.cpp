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

#include "filesys_utility.h"


namespace hs {


//-------------------------------------------------------------------
std::string
path_in_directory(const std::string& directory, const std::string& filename)
{
    if(directory.empty()) return filename;

    const char last = directory.back();
    if(last == '/' || last == '\\') return directory + filename;
    return directory + '/' + filename;
}



//-------------------------------------------------------------------
std::ifstream::pos_type
file_size(const std::string& filename)
{
    std::ifstream is{filename, std::ifstream::ate | std::ifstream::binary};
    if(!is.good()) return 0;
    return is.tellg();
}



//-------------------------------------------------------------------
bool file_readable(const std::string& filename)
{
    return std::ifstream{filename}.good();
}


} // namespace hs
