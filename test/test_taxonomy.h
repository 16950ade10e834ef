#ifndef HS_TEST_TAXONOMY_H_
#define HS_TEST_TAXONOMY_H_

#include "../src/taxonomy.h"

#include <cmath>
#include <stdexcept>
#include <string>


namespace hs_test {


//-------------------------------------------------------------------
/**
 * @brief small NCBI-like tree
 *
 *   1 root
 *   +-- 2759 Eukaryota (superkingdom)
 *   |   +-- 33208 Metazoa (kingdom)
 *   |   |   +-- 6231 Nematoda (phylum) -- 6239 Caenorhabditis elegans
 *   |   |   +-- 7711 Chordata (phylum) -- 9606 Homo sapiens
 *   |   |   +-- 4 -- 5
 *   |   +-- 33090 Viridiplantae (kingdom)
 *   |       +-- 35493 Streptophyta (phylum) -- 3702 Arabidopsis thaliana
 *   +-- 2 Bacteria (superkingdom)
 *   |   +-- 1224 Pseudomonadota (phylum) -- 562 Escherichia coli
 *   +-- 12908 unclassified sequences -- 99999
 *   +-- 32644 unidentified -- 88888
 *
 *   700 <-> 701 (cycle), 800 -> 801 (unknown)
 */
inline hs::taxonomy
make_test_taxonomy()
{
    using rank = hs::taxonomy::rank;

    hs::taxonomy tax;
    tax.emplace(1,     1,     "root",                   rank::root);
    tax.emplace(2759,  1,     "Eukaryota",              rank::Domain);
    tax.emplace(33208, 2759,  "Metazoa",                rank::Kingdom);
    tax.emplace(6231,  33208, "Nematoda",               rank::Phylum);
    tax.emplace(6239,  6231,  "Caenorhabditis elegans", rank::Species);
    tax.emplace(7711,  33208, "Chordata",               rank::Phylum);
    tax.emplace(9606,  7711,  "Homo sapiens",           rank::Species);
    tax.emplace(4,     33208, "four",                   rank::none);
    tax.emplace(5,     4,     "five",                   rank::none);
    tax.emplace(33090, 2759,  "Viridiplantae",          rank::Kingdom);
    tax.emplace(35493, 33090, "Streptophyta",           rank::Phylum);
    tax.emplace(3702,  35493, "Arabidopsis thaliana",   rank::Species);
    tax.emplace(2,     1,     "Bacteria",               rank::Domain);
    tax.emplace(1224,  2,     "Pseudomonadota",         rank::Phylum);
    tax.emplace(562,   1224,  "Escherichia coli",       rank::Species);
    tax.emplace(12908, 1,     "unclassified sequences", rank::none);
    tax.emplace(99999, 12908, "some metagenome",        rank::Species);
    tax.emplace(32644, 1,     "unidentified",           rank::none);
    tax.emplace(88888, 32644, "unidentified thing",     rank::Species);
    tax.emplace(700,   701,   "cycle a",                rank::none);
    tax.emplace(701,   700,   "cycle b",                rank::none);
    tax.emplace(800,   801,   "orphan",                 rank::none);
    return tax;
}


//-------------------------------------------------------------------
inline void
check(bool condition, const std::string& message)
{
    if(!condition) throw std::runtime_error{message};
}


//-------------------------------------------------------------------
inline bool
approx_equal(double a, double b, double eps = 1e-9)
{
    return std::abs(a - b) <= eps * (1.0 + std::abs(a) + std::abs(b));
}


} // namespace hs_test


#endif
