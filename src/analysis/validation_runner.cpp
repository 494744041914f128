/**
 * @file validation_runner.cpp
 * @brief Implementation of the validation runner
 */

#include "tagcheck/analysis/validation_runner.hpp"

#include "tagcheck/integration/thread_adapter.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <iterator>

namespace tagcheck::analysis {

using semantic::error_code_table;
using semantic::semantic_node;

namespace {

template <typename Container>
void append(std::vector<finding>& target, Container&& source) {
    target.insert(target.end(), std::make_move_iterator(source.begin()),
                  std::make_move_iterator(source.end()));
}

}  // namespace

std::size_t validation_report::unrated_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        findings.begin(), findings.end(), [](const finding& f) { return !f.severity; }));
}

std::vector<finding> validation_report::findings_in(finding_category category) const {
    std::vector<finding> matching;
    std::copy_if(findings.begin(), findings.end(), std::back_inserter(matching),
                 [category](const finding& f) { return f.category == category; });
    return matching;
}

validation_runner::validation_runner(const validation_options& options,
                                     std::shared_ptr<di::ILogger> logger)
    : options_(options), logger_(logger ? std::move(logger) : di::null_logger()) {}

validation_report validation_runner::run(const semantic_node& root,
                                         error_code_table* codes) const {
    const auto start = std::chrono::steady_clock::now();
    logger_->debug_fmt("Validating tree '{}' ({} nodes, {})", root.id(),
                       root.descendant_count() + 1,
                       options_.runner.parallel ? "parallel" : "sequential");

    validation_report report;
    if (options_.runner.parallel) {
        run_parallel(root, codes, report);
    } else {
        run_sequential(root, codes, report);
    }
    collect_findings(report);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logger_->info_fmt("Validated '{}': {} findings ({} critical, {} error, {} warning) in {} ms",
                      root.id(), report.findings.size(),
                      report.count(finding_severity::critical),
                      report.count(finding_severity::error),
                      report.count(finding_severity::warning), elapsed.count());
    return report;
}

void validation_runner::run_sequential(const semantic_node& root, error_code_table* codes,
                                       validation_report& report) const {
    const auto& opts = options_.runner;
    if (opts.run_structure) {
        report.structure = structure_analyzer{options_.structure}.analyze(root, codes);
    }
    if (opts.run_headings) {
        report.headings = heading_hierarchy_checker{options_.headings}.validate(root, codes);
    }
    if (opts.run_reading_order) {
        report.reading_order =
            reading_order_validator{options_.reading_order}.validate(root, codes);
    }
    if (opts.run_tables) {
        report.tables = table_structure_validator{options_.tables}.validate_all(root, codes);
    }
}

void validation_runner::run_parallel(const semantic_node& root, error_code_table* codes,
                                     validation_report& report) const {
    if (auto started = integration::thread_adapter::start(); started.is_err()) {
        logger_->warn_fmt("Thread pool unavailable ({}), running sequentially",
                          started.error().message);
        run_sequential(root, codes, report);
        return;
    }

    const auto& opts = options_.runner;

    // Each task writes only its own slot of the report.
    auto dispatch = [this](auto task) {
        auto submitted = integration::thread_adapter::submit(task);
        if (submitted.is_ok()) {
            return std::move(submitted.value());
        }
        logger_->warn_fmt("Submitting analyzer failed ({}), running inline",
                          submitted.error().message);
        std::promise<void> done;
        try {
            task();
            done.set_value();
        } catch (...) {
            done.set_exception(std::current_exception());
        }
        return done.get_future();
    };

    std::vector<std::future<void>> pending;
    if (opts.run_structure) {
        pending.push_back(dispatch([&] {
            report.structure = structure_analyzer{options_.structure}.analyze(root, codes);
        }));
    }
    if (opts.run_headings) {
        pending.push_back(dispatch([&] {
            report.headings = heading_hierarchy_checker{options_.headings}.validate(root, codes);
        }));
    }
    if (opts.run_reading_order) {
        pending.push_back(dispatch([&] {
            report.reading_order =
                reading_order_validator{options_.reading_order}.validate(root, codes);
        }));
    }
    if (opts.run_tables) {
        pending.push_back(dispatch([&] {
            report.tables = table_structure_validator{options_.tables}.validate_all(root, codes);
        }));
    }

    // Tasks reference root, codes and report; none may outlive this frame.
    integration::thread_adapter::wait_all(pending);
}

void validation_runner::collect_findings(validation_report& report) const {
    if (report.structure) {
        append(report.findings, to_findings(*report.structure));
        logger_->debug_fmt("Structure: {} nodes, {} errors", report.structure->total_node_count,
                           report.structure->errors.size());
    }
    if (report.headings) {
        append(report.findings, to_findings(*report.headings));
        logger_->debug_fmt("Headings: {} headings, {} issues",
                           report.headings->total_heading_count,
                           report.headings->issues.size());
    }
    if (report.reading_order) {
        append(report.findings, to_findings(*report.reading_order));
        logger_->debug_fmt("Reading order: {} nodes on {} pages, {} issues",
                           report.reading_order->total_node_count,
                           report.reading_order->page_count,
                           report.reading_order->issues.size());
    }
    for (const auto& table : report.tables) {
        append(report.findings, to_findings(table));
    }
    if (options_.runner.run_tables) {
        logger_->debug_fmt("Tables: {} validated", report.tables.size());
    }
}

}  // namespace tagcheck::analysis
