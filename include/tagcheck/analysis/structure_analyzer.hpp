/**
 * @file structure_analyzer.hpp
 * @brief General nesting, required-child and attribute rules
 *
 * Single depth-first pass over a structure tree. Every check is
 * independent and additive; a defect in one subtree never hides defects in
 * its siblings.
 *
 * ## Checks
 *
 * 1. **Depth limit**: nodes deeper than max_depth (when positive)
 * 2. **Duplicate ids**: first occurrence wins, every repeat is reported
 * 3. **Empty elements**: no children, no text alternative and no text,
 *    unless the role may legitimately be empty
 * 4. **Nesting**: each child role is checked against its parent's legal
 *    child roles
 * 5. **Required children**: LI needs LBody, Table needs rows, TR needs cells
 * 6. **Attributes**: Figure needs Alt or ActualText, Link needs content or Alt
 *
 * Findings carry no severity; the reporting layer rates them.
 */

#ifndef TAGCHECK_ANALYSIS_STRUCTURE_ANALYZER_HPP
#define TAGCHECK_ANALYSIS_STRUCTURE_ANALYZER_HPP

#include "tagcheck/analysis/finding.hpp"
#include "tagcheck/semantic/error_code.hpp"
#include "tagcheck/semantic/error_code_table.hpp"
#include "tagcheck/semantic/semantic_node.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tagcheck::analysis {

// =============================================================================
// Structure Analysis Options
// =============================================================================

/**
 * @brief Options for structure analysis
 */
struct structure_analysis_options {
    /// Check child roles against the nesting table
    bool validate_nesting = true;

    /// Check LI/Table/TR required children
    bool validate_required_children = true;

    /// Check Figure and Link attributes
    bool validate_attributes = true;

    /// Report elements with no content
    bool check_empty_elements = true;

    /// Report repeated node ids
    bool check_duplicate_ids = true;

    /// Maximum node depth, 0 for unlimited
    int max_depth = 0;

    /// Every check enabled
    [[nodiscard]] static structure_analysis_options all() { return {}; }

    /// Nesting only
    [[nodiscard]] static structure_analysis_options nesting_only();

    /// Attributes only
    [[nodiscard]] static structure_analysis_options attributes_only();
};

// =============================================================================
// Structure Analysis Result
// =============================================================================

/**
 * @brief Single structural defect
 */
struct structure_error {
    semantic::semantic_error_code code;  ///< Defect code
    semantic::node_id node_id;           ///< Affected node
    semantic::semantic_type node_type;   ///< Role of the affected node
    std::string message;                 ///< Human-readable description
    std::optional<int> page_index;       ///< Page of the affected node
    finding_context context;             ///< Details

    bool operator==(const structure_error&) const = default;
};

/**
 * @brief Result of structure analysis
 */
struct structure_analysis_result {
    std::vector<structure_error> errors;
    std::size_t total_node_count = 0;
    int max_depth = 0;

    [[nodiscard]] bool is_valid() const noexcept { return errors.empty(); }

    [[nodiscard]] std::vector<structure_error> errors_with_code(
        semantic::semantic_error_code code) const;

    /// Number of errors per code
    [[nodiscard]] std::map<semantic::semantic_error_code, std::size_t> errors_by_code() const;
};

/**
 * @brief Convert to flat findings (category structure, no severity)
 */
[[nodiscard]] std::vector<finding> to_findings(const structure_analysis_result& result);

// =============================================================================
// Nesting Rules
// =============================================================================

/**
 * @brief Whether @p child may appear directly under @p parent
 *
 * Document accepts anything but Lbl and LBody; L accepts LI; LI accepts Lbl,
 * LBody and L; Table accepts TR and row groups; TR accepts TH and TD; row
 * groups accept TR; TOC accepts TOCI. Other roles accept any child.
 */
[[nodiscard]] bool is_valid_child(semantic::semantic_type parent,
                                  semantic::semantic_type child) noexcept;

/**
 * @brief Whether a node of @p type may have no content
 *
 * Artifact, Header, Footer, Note and the pure containers Document, Part,
 * Art, Sect and Div.
 */
[[nodiscard]] bool may_be_empty(semantic::semantic_type type) noexcept;

// =============================================================================
// Structure Analyzer
// =============================================================================

/**
 * @brief Checks general structural rules of a tree
 *
 * @example
 * @code
 * structure_analyzer analyzer;
 * auto result = analyzer.analyze(*root);
 * for (const auto& error : result.errors) {
 *     std::cout << error.message << "\n";
 * }
 * @endcode
 */
class structure_analyzer {
public:
    structure_analyzer() = default;

    explicit structure_analyzer(const structure_analysis_options& options);

    /**
     * @brief Analyze the subtree rooted at @p root
     * @param root Tree root, usually a Document node
     * @param codes Side table receiving defect codes, may be null
     */
    [[nodiscard]] structure_analysis_result analyze(
        const semantic::semantic_node& root,
        semantic::error_code_table* codes = nullptr) const;

    [[nodiscard]] const structure_analysis_options& options() const noexcept;

    void set_options(const structure_analysis_options& options);

private:
    struct traversal_state;

    void visit(const semantic::semantic_node& node, traversal_state& state) const;

    void check_depth(const semantic::semantic_node& node, traversal_state& state) const;
    void check_duplicate_id(const semantic::semantic_node& node, traversal_state& state) const;
    void check_empty(const semantic::semantic_node& node, traversal_state& state) const;
    void check_nesting(const semantic::semantic_node& node, traversal_state& state) const;
    void check_required_children(const semantic::semantic_node& node,
                                 traversal_state& state) const;
    void check_attributes(const semantic::semantic_node& node, traversal_state& state) const;

    structure_analysis_options options_;
};

}  // namespace tagcheck::analysis

#endif  // TAGCHECK_ANALYSIS_STRUCTURE_ANALYZER_HPP
