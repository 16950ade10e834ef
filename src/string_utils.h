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

#ifndef HS_STRING_UTILS_H_
#define HS_STRING_UTILS_H_

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>


namespace hs {


/*****************************************************************************
 *
 * @brief removes trailing whitespace from string
 *
 *****************************************************************************/
inline void
trimr(std::string& s)
{
    s.erase(
        std::find_if_not(s.rbegin(), s.rend(),
                         [](unsigned char c) { return std::isspace(c);} ).base(),
        s.end() );
}

/*****************************************************************************
 *
 * @brief removes leading whitespace from string
 *
 *****************************************************************************/
inline void
triml(std::string& s)
{
    s.erase(
        s.begin(),
        std::find_if_not(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c);})
    );
}

//-------------------------------------------------------------------
inline std::string
trimmed(std::string s)
{
    triml(s);
    trimr(s);
    return s;
}



/*****************************************************************************
 *
 * @brief splits on runs of whitespace; leading/trailing whitespace
 *        does not produce empty fields
 *
 *****************************************************************************/
inline std::vector<std::string>
split_on_whitespace(const std::string& line)
{
    std::vector<std::string> fields;

    auto i = line.begin();
    const auto e = line.end();
    while(i != e) {
        i = std::find_if_not(i, e, [](unsigned char c) { return std::isspace(c); });
        if(i == e) break;
        auto j = std::find_if(i, e, [](unsigned char c) { return std::isspace(c); });
        fields.emplace_back(i, j);
        i = j;
    }
    return fields;
}


/*****************************************************************************
 *
 * @brief splits on every occurrence of 'sep'; empty fields are kept
 *
 *****************************************************************************/
inline std::vector<std::string>
split(const std::string& line, char sep)
{
    std::vector<std::string> fields;

    std::string::size_type beg = 0;
    for(auto pos = line.find(sep); pos != std::string::npos;
        pos = line.find(sep, beg))
    {
        fields.push_back(line.substr(beg, pos - beg));
        beg = pos + 1;
    }
    fields.push_back(line.substr(beg));
    return fields;
}



/*****************************************************************************
 *
 * @brief replaces each run of whitespace with a single underscore
 *
 *****************************************************************************/
inline std::string
underscore_whitespace(const std::string& s)
{
    std::string res;
    res.reserve(s.size());
    bool inSpace = false;
    for(unsigned char c : s) {
        if(std::isspace(c)) {
            if(!inSpace) res += '_';
            inSpace = true;
        } else {
            res += char(c);
            inSpace = false;
        }
    }
    return res;
}



/*****************************************************************************
 *
 * @brief parses a strictly positive decimal integer;
 *        the whole string must be consumed
 *
 *****************************************************************************/
inline bool
parse_positive_integer(const std::string& s, std::int_least64_t& value)
{
    if(s.empty() || s.size() > 18) return false;

    std::int_least64_t v = 0;
    for(unsigned char c : s) {
        if(!std::isdigit(c)) return false;
        v = 10 * v + (c - '0');
    }
    if(v < 1) return false;
    value = v;
    return true;
}


/*****************************************************************************
 *
 * @brief parses a finite, non-negative floating point number;
 *        the whole string must be consumed
 *
 *****************************************************************************/
inline bool
parse_non_negative_number(const std::string& s, double& value)
{
    if(s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) {
        return false;
    }
    char* end = nullptr;
    const double v = std::strtod(s.c_str(), &end);
    if(end != s.c_str() + s.size()) return false;
    //overflow yields HUGE_VAL; underflow is accepted
    if(!std::isfinite(v) || v < 0.0) return false;
    value = v;
    return true;
}



/*************************************************************************//**
 *
 * @brief "natural" string ordering: embedded digit sequences are compared
 *        by their numeric value, so that "gene2" < "gene10"
 *
 *****************************************************************************/
struct natural_less
{
    bool operator () (const std::string& a, const std::string& b) const noexcept
    {
        std::size_t i = 0;
        std::size_t j = 0;
        const std::size_t na = a.size();
        const std::size_t nb = b.size();

        while(i < na && j < nb) {
            const auto ca = static_cast<unsigned char>(a[i]);
            const auto cb = static_cast<unsigned char>(b[j]);

            if(std::isdigit(ca) && std::isdigit(cb)) {
                //skip leading zeros
                auto si = i; while(si < na && a[si] == '0') ++si;
                auto sj = j; while(sj < nb && b[sj] == '0') ++sj;
                auto ei = si; while(ei < na && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
                auto ej = sj; while(ej < nb && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;

                const auto li = ei - si;
                const auto lj = ej - sj;
                if(li != lj) return li < lj;

                const int c = a.compare(si, li, b, sj, lj);
                if(c != 0) return c < 0;

                //same value; fewer leading zeros first
                if((ei - i) != (ej - j)) return (ei - i) < (ej - j);

                i = ei;
                j = ej;
            }
            else {
                if(ca != cb) return ca < cb;
                ++i;
                ++j;
            }
        }
        return (na - i) < (nb - j);
    }
};


}  // namespace hs


#endif
