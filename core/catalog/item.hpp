#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gearopt {

// ─── Slots & Categories ────────────────────────────────────────

enum class Slot : uint8_t {
    Helmet,
    Chestplate,
    Leggings,
    Boots,
    Ring1,
    Ring2,
    Bracelet,
    Necklace,
    Weapon
};

constexpr size_t kSlotCount = 9;

constexpr std::array<Slot, kSlotCount> kAllSlots = {
    Slot::Helmet, Slot::Chestplate, Slot::Leggings, Slot::Boots,
    Slot::Ring1, Slot::Ring2, Slot::Bracelet, Slot::Necklace, Slot::Weapon
};

constexpr size_t slotIndex(Slot slot) { return static_cast<size_t>(slot); }

enum class ItemCategory : uint8_t {
    Helmet,
    Chestplate,
    Leggings,
    Boots,
    Ring,
    Bracelet,
    Necklace,
    Weapon
};

/// The single category a slot accepts. Ring1 and Ring2 share Ring.
ItemCategory slotCategory(Slot slot);

const char* slotName(Slot slot);
const char* categoryName(ItemCategory category);

/// Rings, bracelet and necklace: slots that mostly carry utility ids.
bool isAccessorySlot(Slot slot);

enum class CharacterClass : uint8_t { Warrior, Assassin, Mage, Archer, Shaman };

const char* className(CharacterClass cls);

// ─── Skill Stats ───────────────────────────────────────────────

enum class SkillStat : uint8_t { Str, Dex, Int, Def, Agi };

constexpr size_t kSkillStatCount = 5;

constexpr std::array<SkillStat, kSkillStatCount> kAllSkillStats = {
    SkillStat::Str, SkillStat::Dex, SkillStat::Int, SkillStat::Def, SkillStat::Agi
};

using SkillVec = std::array<int, kSkillStatCount>;

const char* skillStatName(SkillStat stat);

// ─── Attack Speed ──────────────────────────────────────────────
// Ordered slowest to fastest. An item's atkTier shifts the weapon's base
// speed along this ladder, clamped at both ends.

enum class AttackSpeed : uint8_t {
    SuperSlow,
    VerySlow,
    Slow,
    Normal,
    Fast,
    VeryFast,
    SuperFast
};

constexpr int kAttackSpeedCount = 7;

const char* attackSpeedName(AttackSpeed speed);
std::optional<AttackSpeed> parseAttackSpeed(const std::string& name);

/// clamp(base + tierShift) on the attack speed ladder.
int shiftedAttackSpeedIndex(int base_index, int tier_shift);

// ─── Item ──────────────────────────────────────────────────────

struct ItemStats {
    double hp = 0.0;
    double hp_bonus = 0.0;
    double hpr_raw = 0.0;
    double hpr_pct = 0.0;
    double mr = 0.0;
    double ms = 0.0;
    double ls = 0.0;
    double sd_pct = 0.0;
    double sd_raw = 0.0;
    double md_pct = 0.0;
    double md_raw = 0.0;
    double poison = 0.0;
    double spd = 0.0;
    double atk_tier = 0.0;
    double base_dps = 0.0;
    SkillVec req{};        // str, dex, int, def, agi requirements
    SkillVec sp{};         // skill point bonuses, may be negative
    std::array<double, 5> def{};      // earth, thunder, water, fire, air
    std::array<double, 5> elem_dam_pct{};
    double dam_pct = 0.0;
    double r_dam_pct = 0.0;
    double n_dam_pct = 0.0;
};

/// Per-item aggregates used by the rough (pre-evaluation) scorer.
struct RoughScoreFields {
    double base_dps = 0.0;
    double offense = 0.0;
    double ehp_proxy = 0.0;
    double utility = 0.0;
    double skill_point_total = 0.0;
    double req_total = 0.0;
};

struct Item {
    int id = 0;
    std::string name;
    ItemCategory category = ItemCategory::Helmet;
    std::string type;                 // weapon type ("wand", "bow", ...) or category name
    std::string tier = "Normal";
    int level = 1;
    std::optional<CharacterClass> class_req;
    std::vector<std::string> major_ids;
    int powder_slots = 0;
    AttackSpeed atk_spd = AttackSpeed::Normal;
    bool restricted = false;
    bool deprecated = false;
    ItemStats stats;

    /// Caller-provided numeric ids not covered by ItemStats.
    std::unordered_map<std::string, double> extra_numeric;

    // Filled in by Catalog::addItem.
    std::unordered_map<std::string, double> numeric_index;
    RoughScoreFields rough;

    /// Value of an arbitrary numeric key, 0 when the item lacks it.
    double numericValue(const std::string& key) const;

    /// atkTier rounded to the nearest integer tier shift.
    int atkTier() const;

    int req(SkillStat stat) const { return stats.req[static_cast<size_t>(stat)]; }
    int skillBonus(SkillStat stat) const { return stats.sp[static_cast<size_t>(stat)]; }

    bool hasMajorId(const std::string& major_id) const;
};

/// Whether a character of `cls` may wear the item. No class means anyone.
bool itemWearableBy(const Item& item, const std::optional<CharacterClass>& cls);

/// Build the string-keyed numeric index and the rough-score fields.
void indexItemNumerics(Item& item);

} // namespace gearopt
