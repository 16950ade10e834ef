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

#ifndef HS_FS_TOOLS_H_
#define HS_FS_TOOLS_H_


#include <string>
#include <fstream>


namespace hs {


/*************************************************************************//**
 *
 * @brief joins directory and file name; an empty directory yields 'filename'
 *
 *****************************************************************************/
std::string
path_in_directory(const std::string& directory, const std::string& filename);



/*************************************************************************//**
 *
 * @brief returns the size of a file in bytes
 *
 *****************************************************************************/
std::ifstream::pos_type file_size(const std::string& filename);



/*************************************************************************//**
 *
 * @return true, if file with name 'filename' could be opened for reading
 *
 *****************************************************************************/
bool file_readable(const std::string& filename);


} // namespace hs


#endif
