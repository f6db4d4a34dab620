#pragma once

#include "catalog/catalog.hpp"
#include "build/slot_assignment.hpp"

#include <string>
#include <utility>

namespace gearopt {
namespace fixtures {

inline Item makeItem(int id, ItemCategory category, const std::string& name = "") {
    Item item;
    item.id = id;
    item.name = name.empty() ? "item-" + std::to_string(id) : name;
    item.category = category;
    item.type = category == ItemCategory::Weapon ? "wand" : categoryName(category);
    item.tier = "Unique";
    item.level = 80;
    return item;
}

inline Item makeWeapon(int id, const std::string& type, AttackSpeed speed, double base_dps) {
    Item item = makeItem(id, ItemCategory::Weapon);
    item.type = type;
    item.atk_spd = speed;
    item.stats.base_dps = base_dps;
    return item;
}

/// One complete loadout worth of items, with a second choice in the
/// helmet, chestplate, ring and weapon categories.
///
///   helmet 101 102   chestplate 201 202   leggings 301   boots 401
///   ring 501 502 503   bracelet 601   necklace 701   weapon 801 (wand) 802 (bow)
inline Catalog makeSmallCatalog() {
    Catalog catalog;

    Item helm_a = makeItem(101, ItemCategory::Helmet, "Iron Helm");
    helm_a.stats.hp = 400;
    Item helm_b = makeItem(102, ItemCategory::Helmet, "Swift Cap");
    helm_b.stats.hp = 200;
    helm_b.stats.spd = 10;
    catalog.addItem(helm_a);
    catalog.addItem(helm_b);

    Item chest_a = makeItem(201, ItemCategory::Chestplate, "Plated Mail");
    chest_a.stats.hp = 900;
    chest_a.stats.def = {20, 20, 20, 20, 20};
    Item chest_b = makeItem(202, ItemCategory::Chestplate, "Robe");
    chest_b.stats.hp = 500;
    chest_b.stats.sd_pct = 15;
    catalog.addItem(chest_a);
    catalog.addItem(chest_b);

    Item legs = makeItem(301, ItemCategory::Leggings, "Greaves");
    legs.stats.hp = 600;
    catalog.addItem(legs);

    Item boots = makeItem(401, ItemCategory::Boots, "Sandals");
    boots.stats.hp = 300;
    boots.stats.spd = 5;
    catalog.addItem(boots);

    Item ring_a = makeItem(501, ItemCategory::Ring, "Band of Tides");
    ring_a.stats.mr = 2;
    Item ring_b = makeItem(502, ItemCategory::Ring, "Ember Ring");
    ring_b.stats.sd_raw = 30;
    Item ring_c = makeItem(503, ItemCategory::Ring, "Plain Ring");
    ring_c.stats.hp = 50;
    catalog.addItem(ring_a);
    catalog.addItem(ring_b);
    catalog.addItem(ring_c);

    Item bracelet = makeItem(601, ItemCategory::Bracelet, "Cuff");
    bracelet.stats.ms = 1;
    catalog.addItem(bracelet);

    Item necklace = makeItem(701, ItemCategory::Necklace, "Pendant");
    necklace.stats.ls = 40;
    catalog.addItem(necklace);

    catalog.addItem(makeWeapon(801, "wand", AttackSpeed::Normal, 220));
    catalog.addItem(makeWeapon(802, "bow", AttackSpeed::Slow, 300));
    return catalog;
}

/// 150 high-hp distractors per armour/accessory category, plus two rare
/// mana-regen pieces each (ids base+900 and base+901, mr 10) and two weapons.
/// Bases: helmet 1000, chestplate 2000, leggings 3000, boots 4000, ring 5000,
/// bracelet 6000, necklace 7000; weapons 9000 (wand) and 9001 (bow).
inline Catalog makePressureCatalog() {
    Catalog catalog;
    const std::pair<ItemCategory, int> categories[] = {
        {ItemCategory::Helmet, 1000},   {ItemCategory::Chestplate, 2000},
        {ItemCategory::Leggings, 3000}, {ItemCategory::Boots, 4000},
        {ItemCategory::Ring, 5000},     {ItemCategory::Bracelet, 6000},
        {ItemCategory::Necklace, 7000},
    };
    for (const auto& entry : categories) {
        for (int i = 0; i < 150; i++) {
            Item distractor = makeItem(entry.second + i, entry.first);
            distractor.stats.hp = 2000 + i * 3;
            catalog.addItem(distractor);
        }
        for (int i = 900; i <= 901; i++) {
            Item rare = makeItem(entry.second + i, entry.first);
            rare.stats.mr = 10;
            rare.stats.hp = 50;
            catalog.addItem(rare);
        }
    }
    catalog.addItem(makeWeapon(9000, "wand", AttackSpeed::Normal, 200));
    catalog.addItem(makeWeapon(9001, "bow", AttackSpeed::Slow, 250));
    return catalog;
}

inline SlotAssignment fullBuild() {
    SlotAssignment slots = emptyAssignment();
    itemAt(slots, Slot::Helmet) = 101;
    itemAt(slots, Slot::Chestplate) = 201;
    itemAt(slots, Slot::Leggings) = 301;
    itemAt(slots, Slot::Boots) = 401;
    itemAt(slots, Slot::Ring1) = 501;
    itemAt(slots, Slot::Ring2) = 503;
    itemAt(slots, Slot::Bracelet) = 601;
    itemAt(slots, Slot::Necklace) = 701;
    itemAt(slots, Slot::Weapon) = 801;
    return slots;
}

} // namespace fixtures
} // namespace gearopt
