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

#ifndef HS_TAXONOMY_H_
#define HS_TAXONOMY_H_


#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>


namespace hs {


/*************************************************************************//**
 *
 * @brief id-based taxonomy
 *
 * @details the directed graph is stored implicitly as (taxon -> parent)
 *          relations in a hash map keyed by taxon id
 *
 *****************************************************************************/
class taxonomy
{
public:
    //---------------------------------------------------------------
    using taxon_id   = std::int_least64_t;
    using taxon_name = std::string;

    static constexpr taxon_id none_id() noexcept { return 0; }
    static constexpr taxon_id root_id() noexcept { return 1; }

    /// NCBI's "unidentified" and "unclassified sequences" taxa
    static constexpr taxon_id unidentified_id() noexcept { return 32644; }
    static constexpr taxon_id unclassified_sequences_id() noexcept { return 12908; }


    //-----------------------------------------------------
    /**
     * @brief encodes taxnomic ranks
     */
    enum class rank : std::uint8_t {
                    subSpecies,
            Species,
                    subGenus,
            Genus,
                    subTribe,
                Tribe,
                    subFamily,
            Family,
                    subOrder,
            Order,
                    subClass,
            Class,
                    subPhylum,
            Phylum,
                    subKingdom,
            Kingdom,
            Domain,
        root,
        none
    };

    //---------------------------------------------------------------
    /**
     * @brief only exact NCBI rank names are mapped to main ranks;
     *        "superkingdom" was renamed to "domain" by NCBI in 2025
     */
    static rank
    rank_from_name(std::string name) noexcept {
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return char(std::tolower(c)); });
        if(name == "subspecies")       return rank::subSpecies;
        if(name == "species")          return rank::Species;
        if(name == "species group")    return rank::subGenus;
        if(name == "species subgroup") return rank::subGenus;
        if(name == "subgenus")         return rank::subGenus;
        if(name == "genus")            return rank::Genus;
        if(name == "subtribe")         return rank::subTribe;
        if(name == "tribe")            return rank::Tribe;
        if(name == "subfamily")        return rank::subFamily;
        if(name == "family")           return rank::Family;
        if(name == "superfamily")      return rank::subOrder;
        if(name == "parvorder")        return rank::subOrder;
        if(name == "infraorder")       return rank::subOrder;
        if(name == "suborder")         return rank::subOrder;
        if(name == "order")            return rank::Order;
        if(name == "superorder")       return rank::subClass;
        if(name == "infraclass")       return rank::subClass;
        if(name == "subclass")         return rank::subClass;
        if(name == "class")            return rank::Class;
        if(name == "superclass")       return rank::subPhylum;
        if(name == "subphylum")        return rank::subPhylum;
        if(name == "phylum")           return rank::Phylum;
        if(name == "superphylum")      return rank::subKingdom;
        if(name == "subkingdom")       return rank::subKingdom;
        if(name == "kingdom")          return rank::Kingdom;
        if(name == "superkingdom")     return rank::Domain;
        if(name == "domain")           return rank::Domain;
        if(name == "root")             return rank::root;
        return rank::none;
    }


    //---------------------------------------------------------------
    static const char*
    rank_name(rank r) noexcept {
        switch(r) {
            case rank::subSpecies:   return "subspecies";
            case rank::Species:      return "species";
            case rank::subGenus:     return "subgenus";
            case rank::Genus:        return "genus";
            case rank::subTribe:     return "subtribe";
            case rank::Tribe:        return "tribe";
            case rank::subFamily:    return "subfamily";
            case rank::Family:       return "family";
            case rank::subOrder:     return "suborder";
            case rank::Order:        return "order";
            case rank::subClass:     return "subclass";
            case rank::Class:        return "class";
            case rank::subPhylum:    return "subphylum";
            case rank::Phylum:       return "phylum";
            case rank::subKingdom:   return "subkingdom";
            case rank::Kingdom:      return "kingdom";
            case rank::Domain:       return "superkingdom";
            case rank::root:         return "root";
            default:
            case rank::none:         return "no rank";
        }
    }


    /************************************************************
     *
     * @brief taxonomic node
     *
     ************************************************************/
    class taxon {
        friend class taxonomy;
    public:
        //-----------------------------------------------------
        using rank_type = taxonomy::rank;

        //default: empty taxon
        explicit
        taxon(taxon_id taxonId = none_id(),
              taxon_id parentId = none_id(),
              std::string taxonName = "",
              rank_type rk = rank_type::none)
        :
            id_{taxonId}, parent_{parentId},
            name_{std::move(taxonName)},
            rank_{rk}
        {}

        taxon_id id() const noexcept { return id_; }

        const taxon_name& name() const noexcept { return name_; }

        rank_type rank() const noexcept { return rank_; }

        const char* rank_name() const noexcept {
            return taxonomy::rank_name(rank_);
        }

        taxon_id parent_id() const noexcept { return parent_; }

        bool has_parent() const noexcept {
            return parent_ != taxonomy::none_id();
        }

    private:
        taxon_id id_;
        taxon_id parent_;
        taxon_name name_;
        rank_type rank_;
    };


private:
    using taxon_store = std::unordered_map<taxon_id,taxon>;

public:
    //-----------------------------------------------------
    using size_type      = taxon_store::size_type;


    //-------------------------------------------------------------------
    /**
     * @brief inserts new taxon; an existing taxon with the same id
     *        is left untouched
     * @return false, if taxon was not inserted
     */
    bool
    emplace(taxon_id taxonId,
            taxon_id parentId,
            std::string taxonName,
            const std::string& rankName)
    {
        return emplace(taxonId, parentId, std::move(taxonName),
                       rank_from_name(rankName));
    }
    //-----------------------------------------------------
    bool
    emplace(taxon_id taxonId,
            taxon_id parentId = none_id(),
            std::string taxonName = "",
            rank rank = rank::none)
    {
        if(taxonId == none_id()) return false;

        return taxa_.emplace(taxonId, taxon{taxonId, parentId,
                                            std::move(taxonName), rank}).second;
    }


    //---------------------------------------------------------------
    bool reset_parent(taxon_id id, taxon_id parent)
    {
        if(id == none_id()) return false;
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return false;
        i->second.parent_ = parent;
        return true;
    }


    //---------------------------------------------------------------
    bool reset_rank(taxon_id id, rank rank)
    {
        if(id == none_id()) return false;
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return false;
        i->second.rank_ = rank;
        return true;
    }


    //---------------------------------------------------------------
    /**
     * @brief makes 'oldId' a direct child of 'newId'
     *        (overwrites the parent of an existing 'oldId')
     */
    void redirect(taxon_id oldId, taxon_id newId)
    {
        if(oldId == none_id() || oldId == newId) return;
        if(!reset_parent(oldId, newId)) {
            emplace(oldId, newId);
        }
    }


    //---------------------------------------------------------------
    /**
     * @return taxon to 'id' or nullptr;
     */
    const taxon*
    operator [] (taxon_id id) const {
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return nullptr;
        return &(i->second);
    }


    //---------------------------------------------------------------
    bool
    contains(taxon_id id) const {
        return taxa_.find(id) != taxa_.end();
    }


    //---------------------------------------------------------------
    /**
     * @return parent id of taxon 'id' or none_id() if 'id' is unknown
     */
    taxon_id
    parent_id(taxon_id id) const {
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return none_id();
        return i->second.parent_id();
    }

    //-----------------------------------------------------
    rank
    rank_of(taxon_id id) const {
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return rank::none;
        return i->second.rank();
    }

    //-----------------------------------------------------
    /**
     * @return scientific name or empty string if unknown
     */
    const taxon_name&
    name_of(taxon_id id) const {
        static const taxon_name unknown;
        auto i = taxa_.find(id);
        if(i == taxa_.end()) return unknown;
        return i->second.name();
    }


    //---------------------------------------------------------------
    size_type size() const noexcept {
        return taxa_.size();
    }
    //-----------------------------------------------------
    bool empty() const noexcept {
        return taxa_.empty();
    }


private:
    //---------------------------------------------------------------
    taxon_store taxa_;
};


}  // namespace hs


#endif
