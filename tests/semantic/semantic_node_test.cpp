/**
 * @file semantic_node_test.cpp
 * @brief Unit tests for the node variants and tree helpers
 */

#include <tagcheck/semantic/error_code_table.hpp>
#include <tagcheck/semantic/node_tree.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <string>
#include <thread>
#include <type_traits>
#include <vector>

using namespace tagcheck::semantic;
using tagcheck::geometry::bounding_box;
using tagcheck::geometry::line_chunk;
using tagcheck::geometry::point;
using Catch::Matchers::WithinAbs;

namespace {

node_fields fields(std::string id, node_list children = {}) {
    node_fields f;
    f.id = std::move(id);
    f.children = std::move(children);
    return f;
}

node_fields boxed(std::string id, bounding_box box, node_list children = {}) {
    auto f = fields(std::move(id), std::move(children));
    f.box = box;
    return f;
}

node_ptr cell(std::string id, semantic_type type = semantic_type::table_cell) {
    return make_text_node(type, fields(std::move(id)), "value");
}

node_ptr row(std::string id, node_list cells) {
    return make_node(semantic_type::table_row, fields(std::move(id), std::move(cells)));
}

}  // namespace

// =============================================================================
// semantic_node
// =============================================================================

TEST_CASE("semantic_node identity and attributes", "[semantic][semantic_node]") {
    auto f = boxed("p1", bounding_box{2, 0.0, 0.0, 10.0, 10.0});
    f.attributes = {{"Alt", "alternative"}, {"Lang", "en"}, {"Title", ""}};
    auto node = make_paragraph(std::move(f), "text");

    CHECK(node->id() == "p1");
    CHECK(node->type() == semantic_type::paragraph);
    CHECK(node->kind() == node_kind::content);
    CHECK(node->page_index() == 2);
    CHECK(node->alt_text() == "alternative");
    CHECK(node->language() == "en");
    CHECK_FALSE(node->title().has_value());
    CHECK(node->has_text_alternative());
    CHECK(node->text_description() == "alternative");
}

TEST_CASE("semantic_node generates ids when none is given", "[semantic][semantic_node]") {
    auto a = make_node(semantic_type::div, node_fields{});
    auto b = make_node(semantic_type::div, node_fields{});

    CHECK_FALSE(a->id().empty());
    CHECK(a->id() != b->id());
}

TEST_CASE("semantic_node drops null children", "[semantic][semantic_node]") {
    auto parent = make_node(semantic_type::div,
                            fields("div", {nullptr, make_span(fields("s"), "x"), nullptr}));
    CHECK(parent->child_count() == 1);
}

TEST_CASE("semantic_node traversal", "[semantic][semantic_node]") {
    auto f_a = fields("a");
    f_a.depth = 2;
    auto f_sect = fields("sect", {make_paragraph(std::move(f_a), "Alpha")});
    f_sect.depth = 1;
    auto root = make_document(
        fields("doc", {make_node(semantic_type::section, std::move(f_sect)),
                       make_paragraph(fields("b"), "Beta")}));

    CHECK(root->descendant_count() == 3);
    CHECK(root->max_depth() == 2);

    auto order = root->all_descendants();
    REQUIRE(order.size() == 4);
    CHECK(order[0]->id() == "doc");
    CHECK(order[1]->id() == "sect");
    CHECK(order[2]->id() == "a");
    CHECK(order[3]->id() == "b");

    CHECK(root->descendants_of_type(semantic_type::paragraph).size() == 2);
    CHECK(root->collected_text() == "Alpha Beta");
    CHECK(root->first_child_of_type(semantic_type::paragraph)->id() == "b");

    const auto* found = root->first_descendant(
        [](const semantic_node& n) { return n.own_text() == "Beta"; });
    REQUIRE(found != nullptr);
    CHECK(found->id() == "b");
}

// =============================================================================
// content_node
// =============================================================================

TEST_CASE("content_node text and metrics", "[semantic][content_node]") {
    bounding_box box{0, 0.0, 0.0, 100.0, 20.0};
    std::vector<tagcheck::text::text_block> blocks{
        tagcheck::text::make_text_block(box, "Large heading text", 20.0, 700.0),
        tagcheck::text::make_text_block(box, "small", 10.0, 400.0)};
    content_node node{semantic_type::h1, fields("h"), blocks};

    CHECK(node.text() == "Large heading text\n\nsmall");
    CHECK(node.has_text_content());
    CHECK(node.text_block_count() == 2);
    CHECK(node.total_line_count() == 2);
    CHECK(node.total_chunk_count() == 2);
    CHECK(node.dominant_font_size() == 20.0);
    CHECK(node.dominant_font_weight() == 700.0);
    CHECK(node.is_large_text());
    CHECK(node.text_type() == tagcheck::text::text_type::large);
    CHECK(node.is_heading());
    CHECK(node.heading_level() == 1);
}

TEST_CASE("content_node explicit metrics take precedence", "[semantic][content_node]") {
    bounding_box box{0, 0.0, 0.0, 100.0, 20.0};
    content_metrics metrics;
    metrics.font_size = 14.0;
    metrics.font_weight = 700.0;
    content_node node{semantic_type::paragraph, fields("p"),
                      {tagcheck::text::make_text_block(box, "text", 9.0, 400.0)}, metrics};

    CHECK(node.dominant_font_size() == 14.0);
    CHECK(node.is_large_text());
}

TEST_CASE("content_node without text", "[semantic][content_node]") {
    auto node = make_node(semantic_type::div, fields("d"));
    const auto* content = as_content(*node);
    REQUIRE(content != nullptr);

    CHECK_FALSE(content->has_text_content());
    CHECK_FALSE(content->dominant_font_size().has_value());
    CHECK_FALSE(content->is_large_text());
    CHECK(content->own_text().empty());
}

// =============================================================================
// figure_node
// =============================================================================

TEST_CASE("figure_node visual content and caption", "[semantic][figure_node]") {
    image_chunk image;
    image.box = bounding_box{0, 10.0, 10.0, 100.0, 50.0};
    image.pixel_width = 400;
    image.pixel_height = 200;

    auto figure = make_figure(fields("fig", {make_caption(fields("cap"), "Sales by region")}),
                              {image});
    const auto* node = as_figure(*figure);
    REQUIRE(node != nullptr);

    CHECK(node->has_images());
    CHECK_FALSE(node->has_line_art());
    CHECK(node->has_caption());
    CHECK(node->caption_text() == "Sales by region");
    CHECK(node->best_description() == "Sales by region");
    CHECK_FALSE(node->appears_decorative());
    CHECK(node->validate_accessibility().count(semantic_error_code::figure_missing_alt_text) == 1);

    auto computed = node->computed_box();
    REQUIRE(computed.has_value());
    CHECK(*computed == image.box);
}

TEST_CASE("figure_node alternative text", "[semantic][figure_node]") {
    auto f = fields("fig");
    f.attributes = {{"Alt", "Company logo"}};
    auto figure = make_figure(std::move(f));
    const auto* node = as_figure(*figure);

    CHECK(node->best_description() == "Company logo");
    CHECK(node->validate_accessibility().empty());
}

TEST_CASE("figure_node without content appears decorative", "[semantic][figure_node]") {
    auto figure = make_figure(fields("fig"));
    const auto* node = as_figure(*figure);

    CHECK(node->appears_decorative());
    CHECK(node->validate_accessibility().empty());
    CHECK_FALSE(node->computed_box().has_value());
    CHECK_FALSE(has_content(*node));
}

TEST_CASE("image_chunk metadata", "[semantic][image_chunk]") {
    image_chunk image;
    image.box = bounding_box{0, 0.0, 0.0, 72.0, 36.0};
    image.pixel_width = 300;
    image.pixel_height = 150;
    image.component_count = 1;

    CHECK(image.pixel_count() == 45000);
    CHECK(image.is_grayscale());
    CHECK_THAT(*image.aspect_ratio(), WithinAbs(2.0, 1e-9));
    CHECK_THAT(*image.horizontal_resolution(), WithinAbs(300.0 / 72.0, 1e-9));
    CHECK_FALSE(image.has_alternative_text());

    image.actual_text = "Chart";
    CHECK(image.text_description() == "Chart");

    image_chunk degenerate;
    CHECK_FALSE(degenerate.aspect_ratio().has_value());
    CHECK_FALSE(degenerate.vertical_resolution().has_value());
}

TEST_CASE("line_art_chunk grid detection and box", "[semantic][line_art_chunk]") {
    std::vector<line_chunk> grid{
        line_chunk{0, point{0.0, 0.0}, point{100.0, 0.0}},
        line_chunk{0, point{0.0, 50.0}, point{100.0, 50.0}},
        line_chunk{0, point{0.0, 0.0}, point{0.0, 50.0}},
        line_chunk{0, point{100.0, 0.0}, point{100.0, 50.0}},
    };
    line_art_chunk art{grid};

    CHECK(art.line_count() == 4);
    CHECK(art.appears_grid_like());
    CHECK(art.total_length() == 300.0);
    CHECK(art.box() == bounding_box::from_corners(0, -0.5, -0.5, 100.5, 50.5));

    line_art_chunk single{{grid.front()}, std::nullopt, std::string{"rule"}};
    CHECK_FALSE(single.appears_grid_like());
    CHECK(single.text_description() == "rule");
}

// =============================================================================
// table_node
// =============================================================================

TEST_CASE("table_node row groups are ordered head, bodies, foot", "[semantic][table_node]") {
    auto head = make_node(semantic_type::table_head,
                          fields("thead", {row("r-head", {cell("h1", semantic_type::table_header),
                                                          cell("h2", semantic_type::table_header)})}));
    auto body = make_node(semantic_type::table_body,
                          fields("tbody", {row("r-body", {cell("d1"), cell("d2")})}));
    auto foot = make_node(semantic_type::table_foot,
                          fields("tfoot", {row("r-foot", {cell("f1"), cell("f2")})}));

    auto table = make_table(fields("t", {foot, body, head}));

    auto rows = table->rows();
    REQUIRE(rows.size() == 3);
    CHECK(rows[0]->id() == "r-head");
    CHECK(rows[1]->id() == "r-body");
    CHECK(rows[2]->id() == "r-foot");

    CHECK(table->has_explicit_row_groups());
    CHECK(table->head() != nullptr);
    CHECK(table->foot() != nullptr);
    CHECK(table->has_headers());
    CHECK(table->header_cells().size() == 2);
    CHECK(table->data_cells().size() == 4);
    CHECK(table->header_rows().size() == 1);
    CHECK(table->max_cells_per_row() == 2);
    CHECK(table->has_consistent_column_count());
}

TEST_CASE("table_node with direct rows", "[semantic][table_node]") {
    auto table = make_table(fields("t", {row("r1", {cell("a", semantic_type::table_header),
                                                    cell("b", semantic_type::table_header)}),
                                         row("r2", {cell("c"), cell("d"), cell("e")})}));

    CHECK_FALSE(table->has_explicit_row_groups());
    CHECK(table->row_count() == 2);
    CHECK(table->header_rows().size() == 1);
    CHECK(table->max_cells_per_row() == 3);
    CHECK_FALSE(table->has_consistent_column_count());
}

TEST_CASE("table_node visual border", "[semantic][table_node]") {
    auto table = make_table(fields("t"));
    CHECK_FALSE(table->has_visual_border());
    CHECK(table->visual_row_count() == 0);

    auto bordered = table->with_visual_border(visual_border{{300.0, 0.0, 100.0}, {50.0, 0.0}});
    CHECK(bordered->id() == "t");
    REQUIRE(bordered->has_visual_border());
    CHECK(bordered->border()->x_coordinates == std::vector<double>{0.0, 100.0, 300.0});
    CHECK(bordered->visual_column_count() == 2);
    CHECK(bordered->visual_row_count() == 1);
    CHECK_FALSE(table->has_visual_border());

    CHECK(visual_border{}.row_count() == 0);
    CHECK(visual_border{{5.0}, {5.0}}.column_count() == 0);
}

// =============================================================================
// list_node
// =============================================================================

namespace {

node_ptr list_item(std::string id, bool with_label, bool with_body, node_list body_children = {}) {
    node_list children;
    if (with_label) {
        children.push_back(make_text_node(semantic_type::list_label, fields(id + "-lbl"), "1."));
    }
    if (with_body) {
        children.push_back(
            make_node(semantic_type::list_body, fields(id + "-body", std::move(body_children))));
    }
    return make_node(semantic_type::list_item, fields(std::move(id), std::move(children)));
}

}  // namespace

TEST_CASE("list_node items, labels and bodies", "[semantic][list_node]") {
    auto list = make_list(fields("l", {list_item("i1", true, true), list_item("i2", false, true),
                                       list_item("i3", true, false)}),
                          list_kind::ordered_arabic, 1);

    CHECK(list->is_ordered());
    CHECK(list->start_number() == 1);
    CHECK(list->item_count() == 3);
    CHECK(list->labels().size() == 2);
    CHECK(list->bodies().size() == 2);
    CHECK(list->items_missing_labels().size() == 1);
    CHECK(list->items_missing_bodies().front()->id() == "i3");
    CHECK_FALSE(list->all_items_have_labels());

    auto codes = list->validate_structure();
    CHECK(codes == std::set<semantic_error_code>{semantic_error_code::list_item_missing_label,
                                                 semantic_error_code::list_item_missing_body});
}

TEST_CASE("list_node nesting depth", "[semantic][list_node]") {
    auto inner = make_list(fields("inner", {list_item("ii", true, true)}),
                           list_kind::unordered, std::nullopt, 1);
    auto outer = make_list(fields("outer", {list_item("oi", true, true, {inner})}),
                           list_kind::unordered);

    CHECK_FALSE(outer->is_ordered());
    REQUIRE(outer->nested_lists().size() == 1);
    CHECK(outer->max_nested_depth() == 1);
    CHECK(outer->validate_structure().empty());

    auto too_deep = make_list(fields("deep"), list_kind::unknown, std::nullopt,
                              max_list_nesting_level + 1);
    CHECK(too_deep->validate_structure().count(semantic_error_code::list_nesting_too_deep) == 1);
}

TEST_CASE("list_kind ordering", "[semantic][list_node]") {
    CHECK(is_ordered(list_kind::ordered_roman_lower));
    CHECK_FALSE(is_ordered(list_kind::unordered));
    CHECK_FALSE(is_ordered(list_kind::unknown));
}

// =============================================================================
// Tree helpers
// =============================================================================

TEST_CASE("visit_node dispatches on the variant", "[semantic][node_tree]") {
    auto table = make_table(fields("t"));
    auto list = make_list(fields("l"));
    auto figure = make_figure(fields("f"));
    auto paragraph = make_paragraph(fields("p"), "x");

    auto name = [](const auto& n) -> std::string {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, table_node>) return "table";
        else if constexpr (std::is_same_v<T, list_node>) return "list";
        else if constexpr (std::is_same_v<T, figure_node>) return "figure";
        else return "content";
    };

    CHECK(visit_node(*table, name) == "table");
    CHECK(visit_node(*list, name) == "list");
    CHECK(visit_node(*figure, name) == "figure");
    CHECK(visit_node(*paragraph, name) == "content");

    CHECK(as_table(*table) != nullptr);
    CHECK(as_table(*paragraph) == nullptr);
    CHECK(as_list(*list) != nullptr);
}

TEST_CASE("make_node builds the variant matching the role", "[semantic][node_tree]") {
    auto table = make_node(semantic_type::table,
                           fields("t", {row("r1", {cell("a")}), row("r2", {cell("b")})}));
    auto list = make_node(semantic_type::list, fields("l"));
    auto figure = make_node(semantic_type::figure, fields("f"));
    auto section = make_node(semantic_type::section, fields("s"));

    REQUIRE(as_table(*table) != nullptr);
    CHECK(as_table(*table)->row_count() == 2);
    CHECK(table->type() == semantic_type::table);
    CHECK(list->kind() == node_kind::list);
    CHECK(figure->kind() == node_kind::figure);
    CHECK(section->kind() == node_kind::content);
}

TEST_CASE("has_content rules", "[semantic][node_tree]") {
    CHECK_FALSE(has_content(*make_node(semantic_type::paragraph, fields("empty"))));
    CHECK(has_content(*make_paragraph(fields("text"), "words")));

    auto alt = fields("alt");
    alt.attributes = {{"ActualText", "x"}};
    CHECK(has_content(*make_node(semantic_type::span, std::move(alt))));

    image_chunk image;
    CHECK(has_content(*make_figure(fields("fig"), {image})));
}

TEST_CASE("path lookup", "[semantic][node_tree]") {
    auto root = make_document(
        fields("doc", {make_node(semantic_type::section,
                                 fields("sect", {make_paragraph(fields("p"), "x")}))}));

    auto path = find_path(*root, "p");
    REQUIRE(path.has_value());
    REQUIRE(path->size() == 2);
    CHECK(path->front()->id() == "doc");
    CHECK(path->back()->id() == "sect");

    CHECK(find_parent(*root, "p")->id() == "sect");
    CHECK(find_parent(*root, "doc") == nullptr);
    CHECK_FALSE(find_path(*root, "missing").has_value());

    std::vector<std::size_t> depths;
    walk_with_path(*root, [&depths](const semantic_node&, const node_path& ancestors) {
        depths.push_back(ancestors.size());
    });
    CHECK(depths == std::vector<std::size_t>{0, 1, 2});
}

// =============================================================================
// error_code_table
// =============================================================================

TEST_CASE("error_code_table set semantics", "[semantic][error_code_table]") {
    error_code_table table;
    CHECK(table.empty());

    table.insert("a", semantic_error_code::empty_element);
    table.insert("a", semantic_error_code::empty_element);
    table.insert("a", semantic_error_code::duplicate_id);
    table.insert("b", semantic_error_code::empty_element);

    CHECK(table.annotated_node_count() == 2);
    CHECK(table.total_code_count() == 3);
    CHECK(table.contains("a", semantic_error_code::duplicate_id));
    CHECK_FALSE(table.contains("b", semantic_error_code::duplicate_id));
    CHECK(table.codes_for("missing").empty());
    CHECK(table.snapshot().at("a").size() == 2);

    annotate(nullptr, "c", semantic_error_code::empty_element);
    annotate(&table, "c", semantic_error_code::empty_element);
    CHECK(table.annotated_node_count() == 3);
}

TEST_CASE("error_code_table concurrent inserts", "[semantic][error_code_table]") {
    error_code_table table;
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([&table, t] {
            for (int i = 0; i < 100; ++i) {
                table.insert("node-" + std::to_string(i), semantic_error_code::empty_element);
                table.insert("writer-" + std::to_string(t), semantic_error_code::duplicate_id);
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }

    CHECK(table.annotated_node_count() == 104);
    CHECK(table.total_code_count() == 104);
}
