/**
 * @file error_code_table.hpp
 * @brief Side table of defect codes keyed by node id
 *
 * Analyzers annotate nodes here instead of on the nodes themselves, so one
 * tree can be shared by analyzers running on different threads.
 *
 * Thread Safety:
 * - std::shared_mutex for reader-writer locking
 * - insert() takes an exclusive lock, queries take a shared lock
 *
 * @code
 * error_code_table codes;
 * structure_analyzer{}.analyze(*root, &codes);
 * for (auto code : codes.codes_for("p1")) { ... }
 * @endcode
 */

#ifndef TAGCHECK_SEMANTIC_ERROR_CODE_TABLE_HPP
#define TAGCHECK_SEMANTIC_ERROR_CODE_TABLE_HPP

#include "tagcheck/semantic/error_code.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <shared_mutex>
#include <string_view>

namespace tagcheck::semantic {

class error_code_table {
public:
    using code_set = std::set<semantic_error_code>;
    using snapshot_type = std::map<node_id, code_set, std::less<>>;

    error_code_table() = default;

    error_code_table(const error_code_table&) = delete;
    error_code_table& operator=(const error_code_table&) = delete;

    /**
     * @brief Record @p code for @p id
     *
     * Codes are never removed; inserting an existing code is a no-op.
     */
    void insert(std::string_view id, semantic_error_code code);

    /// Codes recorded for @p id, empty when none
    [[nodiscard]] code_set codes_for(std::string_view id) const;

    [[nodiscard]] bool contains(std::string_view id, semantic_error_code code) const;

    /// Number of nodes with at least one code
    [[nodiscard]] std::size_t annotated_node_count() const;

    /// Number of (node, code) pairs
    [[nodiscard]] std::size_t total_code_count() const;

    [[nodiscard]] bool empty() const;

    /// Ordered copy of the whole table
    [[nodiscard]] snapshot_type snapshot() const;

private:
    mutable std::shared_mutex mutex_;
    snapshot_type codes_;
};

/**
 * @brief Insert into @p table when it is not null
 */
inline void annotate(error_code_table* table, std::string_view id, semantic_error_code code) {
    if (table != nullptr) {
        table->insert(id, code);
    }
}

}  // namespace tagcheck::semantic

#endif  // TAGCHECK_SEMANTIC_ERROR_CODE_TABLE_HPP
