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

#include "hit_io.h"
#include "string_utils.h"

#include <algorithm>


namespace hs {


//-------------------------------------------------------------------
int hit_columns::max_column() const noexcept
{
    return std::max({query, subject, evalue, bitscore, taxid});
}



//-------------------------------------------------------------------
bool is_hit_comment_or_blank(const std::string& line)
{
    auto i = line.find_first_not_of(" \t\r");
    return i == std::string::npos || line[0] == '#';
}



//-------------------------------------------------------------------
std::vector<std::string>
split_hit_line(const std::string& line, hit_delimiter delim)
{
    if(delim == hit_delimiter::tab) return split(line, '\t');
    return split_on_whitespace(line);
}



//-------------------------------------------------------------------
bool parse_hit(const std::string& line, const hit_format_options& opt, hit& h)
{
    const auto fields = split_hit_line(line, opt.delimiter);
    const auto& col = opt.columns;

    auto field = [&](int column) -> const std::string* {
        if(column < 1 || std::size_t(column) > fields.size()) return nullptr;
        return &fields[column-1];
    };

    h = hit{};
    if(auto q = field(col.query))    h.queryId   = *q;
    if(auto s = field(col.subject))  h.subjectId = *s;
    if(auto t = field(col.taxid))    h.taxon     = *t;

    if(fields.size() < std::size_t(col.max_column())) return false;
    if(h.queryId.empty()) return false;

    if(!parse_non_negative_number(*field(col.evalue), h.evalue)) return false;
    if(!parse_non_negative_number(*field(col.bitscore), h.bitscore)) return false;

    return true;
}


} // namespace hs
