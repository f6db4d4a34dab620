#include "catalog/item.hpp"
#include <algorithm>
#include <cmath>

namespace gearopt {

ItemCategory slotCategory(Slot slot) {
    switch (slot) {
        case Slot::Helmet:     return ItemCategory::Helmet;
        case Slot::Chestplate: return ItemCategory::Chestplate;
        case Slot::Leggings:   return ItemCategory::Leggings;
        case Slot::Boots:      return ItemCategory::Boots;
        case Slot::Ring1:
        case Slot::Ring2:      return ItemCategory::Ring;
        case Slot::Bracelet:   return ItemCategory::Bracelet;
        case Slot::Necklace:   return ItemCategory::Necklace;
        case Slot::Weapon:     return ItemCategory::Weapon;
    }
    return ItemCategory::Helmet;
}

const char* slotName(Slot slot) {
    switch (slot) {
        case Slot::Helmet:     return "helmet";
        case Slot::Chestplate: return "chestplate";
        case Slot::Leggings:   return "leggings";
        case Slot::Boots:      return "boots";
        case Slot::Ring1:      return "ring1";
        case Slot::Ring2:      return "ring2";
        case Slot::Bracelet:   return "bracelet";
        case Slot::Necklace:   return "necklace";
        case Slot::Weapon:     return "weapon";
    }
    return "unknown";
}

const char* categoryName(ItemCategory category) {
    switch (category) {
        case ItemCategory::Helmet:     return "helmet";
        case ItemCategory::Chestplate: return "chestplate";
        case ItemCategory::Leggings:   return "leggings";
        case ItemCategory::Boots:      return "boots";
        case ItemCategory::Ring:       return "ring";
        case ItemCategory::Bracelet:   return "bracelet";
        case ItemCategory::Necklace:   return "necklace";
        case ItemCategory::Weapon:     return "weapon";
    }
    return "unknown";
}

bool isAccessorySlot(Slot slot) {
    return slot == Slot::Ring1 || slot == Slot::Ring2 ||
           slot == Slot::Bracelet || slot == Slot::Necklace;
}

const char* className(CharacterClass cls) {
    switch (cls) {
        case CharacterClass::Warrior:  return "Warrior";
        case CharacterClass::Assassin: return "Assassin";
        case CharacterClass::Mage:     return "Mage";
        case CharacterClass::Archer:   return "Archer";
        case CharacterClass::Shaman:   return "Shaman";
    }
    return "Unknown";
}

const char* skillStatName(SkillStat stat) {
    switch (stat) {
        case SkillStat::Str: return "str";
        case SkillStat::Dex: return "dex";
        case SkillStat::Int: return "int";
        case SkillStat::Def: return "def";
        case SkillStat::Agi: return "agi";
    }
    return "?";
}

namespace {

constexpr std::array<const char*, kAttackSpeedCount> kAttackSpeedNames = {
    "SUPER_SLOW", "VERY_SLOW", "SLOW", "NORMAL", "FAST", "VERY_FAST", "SUPER_FAST"
};

} // namespace

const char* attackSpeedName(AttackSpeed speed) {
    return kAttackSpeedNames[static_cast<size_t>(speed)];
}

std::optional<AttackSpeed> parseAttackSpeed(const std::string& name) {
    for (size_t i = 0; i < kAttackSpeedNames.size(); i++) {
        if (name == kAttackSpeedNames[i]) return static_cast<AttackSpeed>(i);
    }
    return std::nullopt;
}

int shiftedAttackSpeedIndex(int base_index, int tier_shift) {
    return std::max(0, std::min(kAttackSpeedCount - 1, base_index + tier_shift));
}

double Item::numericValue(const std::string& key) const {
    auto it = numeric_index.find(key);
    return it == numeric_index.end() ? 0.0 : it->second;
}

int Item::atkTier() const {
    return static_cast<int>(std::lround(stats.atk_tier));
}

bool Item::hasMajorId(const std::string& major_id) const {
    return std::find(major_ids.begin(), major_ids.end(), major_id) != major_ids.end();
}

bool itemWearableBy(const Item& item, const std::optional<CharacterClass>& cls) {
    if (!cls || !item.class_req) return true;
    return *item.class_req == *cls;
}

void indexItemNumerics(Item& item) {
    const ItemStats& s = item.stats;
    auto& idx = item.numeric_index;
    idx.clear();

    idx["hp"] = s.hp;
    idx["hpBonus"] = s.hp_bonus;
    idx["hprRaw"] = s.hpr_raw;
    idx["hprPct"] = s.hpr_pct;
    idx["mr"] = s.mr;
    idx["ms"] = s.ms;
    idx["ls"] = s.ls;
    idx["sdPct"] = s.sd_pct;
    idx["sdRaw"] = s.sd_raw;
    idx["mdPct"] = s.md_pct;
    idx["mdRaw"] = s.md_raw;
    idx["poison"] = s.poison;
    idx["spd"] = s.spd;
    idx["atkTier"] = item.atkTier();
    idx["averageDps"] = s.base_dps;
    idx["strReq"] = s.req[0];
    idx["dexReq"] = s.req[1];
    idx["intReq"] = s.req[2];
    idx["defReq"] = s.req[3];
    idx["agiReq"] = s.req[4];
    idx["str"] = s.sp[0];
    idx["dex"] = s.sp[1];
    idx["int"] = s.sp[2];
    idx["def"] = s.sp[3];
    idx["agi"] = s.sp[4];
    idx["eDef"] = s.def[0];
    idx["tDef"] = s.def[1];
    idx["wDef"] = s.def[2];
    idx["fDef"] = s.def[3];
    idx["aDef"] = s.def[4];
    idx["eDamPct"] = s.elem_dam_pct[0];
    idx["tDamPct"] = s.elem_dam_pct[1];
    idx["wDamPct"] = s.elem_dam_pct[2];
    idx["fDamPct"] = s.elem_dam_pct[3];
    idx["aDamPct"] = s.elem_dam_pct[4];
    idx["damPct"] = s.dam_pct;
    idx["rDamPct"] = s.r_dam_pct;
    idx["nDamPct"] = s.n_dam_pct;
    idx["slots"] = item.powder_slots;

    double req_total = 0.0;
    double sp_total = 0.0;
    for (size_t i = 0; i < kSkillStatCount; i++) {
        req_total += s.req[i];
        sp_total += s.sp[i];
    }
    double def_total = 0.0;
    double elem_total = 0.0;
    for (size_t i = 0; i < 5; i++) {
        def_total += s.def[i];
        elem_total += s.elem_dam_pct[i];
    }

    RoughScoreFields& r = item.rough;
    r.base_dps = s.base_dps;
    r.req_total = req_total;
    r.skill_point_total = sp_total;
    r.offense = s.base_dps +
                s.sd_pct * 1.4 +
                s.md_pct * 1.15 +
                s.sd_raw * 0.12 +
                s.md_raw * 0.12 +
                (s.dam_pct + s.r_dam_pct + s.n_dam_pct) * 0.8 +
                elem_total * 0.5 +
                s.atk_tier * 7.0 +
                s.poison * 0.03;
    r.ehp_proxy = (s.hp + s.hp_bonus) +
                  def_total * 0.45 +
                  s.hpr_raw * 1.2 +
                  s.hpr_pct * 2.5;
    r.utility = s.spd * 1.8 + s.mr * 8.0 + s.ms * 7.0 + s.ls * 6.0;

    idx["reqTotal"] = r.req_total;
    idx["skillPointTotal"] = r.skill_point_total;
    idx["offenseScore"] = r.offense;
    idx["ehpProxy"] = r.ehp_proxy;
    idx["utilityScore"] = r.utility;

    // Extra keys win over derived ones so callers can override.
    for (const auto& [key, value] : item.extra_numeric) {
        idx[key] = value;
    }
}

} // namespace gearopt
