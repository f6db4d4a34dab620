#include "catalog/catalog.hpp"
#include <algorithm>
#include <stdexcept>

namespace gearopt {

bool SetMeta::isIllegalCount(int count) const {
    return std::find(illegal_counts.begin(), illegal_counts.end(), count) != illegal_counts.end();
}

void Catalog::addItem(Item item) {
    if (item.id <= 0) {
        throw std::runtime_error("Item id must be positive: " + std::to_string(item.id));
    }
    if (index_by_id_.count(item.id)) {
        throw std::runtime_error("Item ID already exists: " + std::to_string(item.id));
    }
    indexItemNumerics(item);
    index_by_id_[item.id] = items_.size();
    ids_by_category_[static_cast<int>(item.category)].push_back(item.id);
    items_.push_back(std::move(item));
}

void Catalog::addSet(const std::string& name, std::vector<int> member_ids,
                     std::vector<int> illegal_counts) {
    if (name.empty()) {
        throw std::runtime_error("Set name must not be empty");
    }
    if (sets_.count(name)) {
        throw std::runtime_error("Set already exists: " + name);
    }
    for (int id : member_ids) {
        if (!index_by_id_.count(id)) {
            throw std::runtime_error("Set member not found: " + std::to_string(id));
        }
        auto [it, inserted] = set_by_item_.emplace(id, name);
        if (!inserted) {
            throw std::runtime_error("Item " + std::to_string(id) +
                                     " already belongs to set " + it->second);
        }
    }
    SetMeta meta;
    meta.name = name;
    meta.member_ids = std::move(member_ids);
    meta.illegal_counts = std::move(illegal_counts);
    sets_.emplace(name, std::move(meta));
}

const Item* Catalog::find(int id) const {
    auto it = index_by_id_.find(id);
    return it == index_by_id_.end() ? nullptr : &items_[it->second];
}

const std::vector<int>& Catalog::itemsInCategory(ItemCategory category) const {
    static const std::vector<int> kEmpty;
    auto it = ids_by_category_.find(static_cast<int>(category));
    return it == ids_by_category_.end() ? kEmpty : it->second;
}

const std::string* Catalog::setOf(int item_id) const {
    auto it = set_by_item_.find(item_id);
    return it == set_by_item_.end() ? nullptr : &it->second;
}

const SetMeta* Catalog::setMeta(const std::string& name) const {
    auto it = sets_.find(name);
    return it == sets_.end() ? nullptr : &it->second;
}

} // namespace gearopt
