#pragma once

#include "catalog/item.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gearopt {

// ─── SetMeta ───────────────────────────────────────────────────
// Piece counts (1-based) at which wearing members of a set is illegal.

struct SetMeta {
    std::string name;
    std::vector<int> member_ids;
    std::vector<int> illegal_counts;

    bool isIllegalCount(int count) const;
};

// ─── Catalog ───────────────────────────────────────────────────
// Read-only item store once populated. Items are indexed by id and by
// category. Set membership is reverse-mapped from the registered sets.

class Catalog {
public:
    Catalog() = default;

    /// Index an item. Throws on a non-positive or duplicate id.
    void addItem(Item item);

    /// Register a set. Every member must already be in the catalog.
    void addSet(const std::string& name, std::vector<int> member_ids,
                std::vector<int> illegal_counts);

    const Item* find(int id) const;
    const std::vector<int>& itemsInCategory(ItemCategory category) const;
    const std::vector<Item>& items() const { return items_; }
    size_t size() const { return items_.size(); }

    /// Name of the set the item belongs to, if any.
    const std::string* setOf(int item_id) const;
    const SetMeta* setMeta(const std::string& name) const;

private:
    std::vector<Item> items_;
    std::unordered_map<int, size_t> index_by_id_;
    std::unordered_map<int, std::vector<int>> ids_by_category_;
    std::unordered_map<int, std::string> set_by_item_;
    std::unordered_map<std::string, SetMeta> sets_;
};

} // namespace gearopt
