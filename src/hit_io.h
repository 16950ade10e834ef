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

#ifndef HS_HIT_IO_H_
#define HS_HIT_IO_H_


#include <string>
#include <vector>


namespace hs {


/*************************************************************************//**
 *
 * @brief column separator of tabular hit files
 *
 *****************************************************************************/
enum class hit_delimiter {
    whitespace,  // diamond: runs of whitespace
    tab          // blast: single tab characters
};



/*************************************************************************//**
 *
 * @brief 1-based column positions
 *
 *****************************************************************************/
struct hit_columns
{
    int query    = 1;
    int subject  = 2;
    int evalue   = 11;
    int bitscore = 12;
    int taxid    = 13;

    int max_column() const noexcept;
};



/*************************************************************************//**
 *
 * @brief hit file format
 *
 *****************************************************************************/
struct hit_format_options
{
    hit_columns columns;
    hit_delimiter delimiter = hit_delimiter::whitespace;
};



/*************************************************************************//**
 *
 * @brief one similarity search hit; taxon token is kept verbatim
 *
 *****************************************************************************/
struct hit
{
    std::string queryId;
    std::string subjectId;
    double evalue   = 1.0;
    double bitscore = 0.0;
    std::string taxon;
};



/*************************************************************************//**
 *
 * @brief true for lines that carry no hit (blank or starting with '#')
 *
 *****************************************************************************/
bool is_hit_comment_or_blank(const std::string& line);



/*************************************************************************//**
 *
 * @brief splits a hit line into fields according to delimiter
 *
 *****************************************************************************/
std::vector<std::string>
split_hit_line(const std::string& line, hit_delimiter);



/*************************************************************************//**
 *
 * @brief parses one hit line
 *
 * @return false if the line has too few columns or if e-value / bitscore
 *         are not non-negative numbers; fields that could be extracted
 *         (e.g. the query id) are still assigned to 'h'
 *
 *****************************************************************************/
bool parse_hit(const std::string& line, const hit_format_options&, hit& h);


} // namespace hs


#endif
