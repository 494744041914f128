/**
 * @file error_code_table.cpp
 * @brief Implementation of the node defect side table
 */

#include "tagcheck/semantic/error_code_table.hpp"

#include <mutex>

namespace tagcheck::semantic {

void error_code_table::insert(std::string_view id, semantic_error_code code) {
    std::unique_lock lock(mutex_);
    auto it = codes_.find(id);
    if (it == codes_.end()) {
        it = codes_.emplace(node_id{id}, code_set{}).first;
    }
    it->second.insert(code);
}

error_code_table::code_set error_code_table::codes_for(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = codes_.find(id);
    if (it == codes_.end()) {
        return {};
    }
    return it->second;
}

bool error_code_table::contains(std::string_view id, semantic_error_code code) const {
    std::shared_lock lock(mutex_);
    auto it = codes_.find(id);
    return it != codes_.end() && it->second.contains(code);
}

std::size_t error_code_table::annotated_node_count() const {
    std::shared_lock lock(mutex_);
    return codes_.size();
}

std::size_t error_code_table::total_code_count() const {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [id, codes] : codes_) {
        total += codes.size();
    }
    return total;
}

bool error_code_table::empty() const {
    std::shared_lock lock(mutex_);
    return codes_.empty();
}

error_code_table::snapshot_type error_code_table::snapshot() const {
    std::shared_lock lock(mutex_);
    return codes_;
}

}  // namespace tagcheck::semantic
