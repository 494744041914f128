/**
 * @file semantic_node.cpp
 * @brief Implementation of the common node interface
 */

#include "tagcheck/semantic/semantic_node.hpp"
#include "tagcheck/compat/format.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <utility>

namespace tagcheck::semantic {

namespace {

std::atomic<std::uint64_t> next_node_id{1};

void collect_pre_order(const semantic_node& node, std::vector<const semantic_node*>& out) {
    out.push_back(&node);
    for (const auto& child : node.children()) {
        if (child) {
            collect_pre_order(*child, out);
        }
    }
}

}  // namespace

node_id generate_node_id() {
    return compat::format("node-{}", next_node_id.fetch_add(1, std::memory_order_relaxed));
}

semantic_node::semantic_node(semantic_type type, node_fields fields)
    : id_(fields.id.empty() ? generate_node_id() : std::move(fields.id)),
      type_(type),
      box_(fields.box),
      children_(std::move(fields.children)),
      attributes_(std::move(fields.attributes)),
      depth_(fields.depth) {
    std::erase(children_, nullptr);
}

std::optional<int> semantic_node::page_index() const noexcept {
    if (box_) {
        return box_->page_index();
    }
    return std::nullopt;
}

// =============================================================================
// Attributes
// =============================================================================

const attribute_value* semantic_node::attribute(std::string_view key) const {
    auto it = attributes_.find(key);
    return it != attributes_.end() ? &it->second : nullptr;
}

std::optional<std::string> semantic_node::string_attribute(std::string_view key) const {
    const auto* value = attribute(key);
    if (!value) {
        return std::nullopt;
    }
    auto text = value->as_string();
    if (!text || text->empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<std::string> semantic_node::alt_text() const {
    return string_attribute(attribute_keys::alt);
}

std::optional<std::string> semantic_node::actual_text() const {
    return string_attribute(attribute_keys::actual_text);
}

std::optional<std::string> semantic_node::language() const {
    return string_attribute(attribute_keys::lang);
}

std::optional<std::string> semantic_node::title() const {
    return string_attribute(attribute_keys::title);
}

bool semantic_node::has_text_alternative() const {
    return alt_text().has_value() || actual_text().has_value();
}

std::optional<std::string> semantic_node::text_description() const {
    if (auto alt = alt_text()) {
        return alt;
    }
    if (auto actual = actual_text()) {
        return actual;
    }
    return title();
}

// =============================================================================
// Text
// =============================================================================

std::string semantic_node::own_text() const {
    return {};
}

std::string semantic_node::collected_text() const {
    std::string result;
    for (const auto* node : all_descendants()) {
        auto text = node->own_text();
        if (text.empty()) {
            continue;
        }
        if (!result.empty()) {
            result += ' ';
        }
        result += text;
    }
    return result;
}

// =============================================================================
// Traversal
// =============================================================================

std::size_t semantic_node::descendant_count() const {
    std::size_t count = children_.size();
    for (const auto& child : children_) {
        count += child->descendant_count();
    }
    return count;
}

int semantic_node::max_depth() const {
    int deepest = depth_;
    for (const auto& child : children_) {
        deepest = std::max(deepest, child->max_depth());
    }
    return deepest;
}

std::vector<const semantic_node*> semantic_node::all_descendants() const {
    std::vector<const semantic_node*> nodes;
    collect_pre_order(*this, nodes);
    return nodes;
}

std::vector<const semantic_node*> semantic_node::descendants_of_type(semantic_type type) const {
    auto nodes = all_descendants();
    std::erase_if(nodes, [type](const semantic_node* n) { return n->type() != type; });
    return nodes;
}

const semantic_node* semantic_node::first_descendant(
    const std::function<bool(const semantic_node&)>& predicate) const {
    if (predicate(*this)) {
        return this;
    }
    for (const auto& child : children_) {
        if (const auto* found = child->first_descendant(predicate)) {
            return found;
        }
    }
    return nullptr;
}

const semantic_node* semantic_node::first_child_of_type(semantic_type type) const {
    for (const auto& child : children_) {
        if (child->type() == type) {
            return child.get();
        }
    }
    return nullptr;
}

}  // namespace tagcheck::semantic
