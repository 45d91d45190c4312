/// \file check_driver.cpp
/// \brief Implementation of the compatibility-check driver.

#include <weave/check_driver.hpp>
#include <weave/diagnostics.hpp>
#include <weave/store.hpp>

#include <algorithm>
#include <exception>
#include <span>
#include <thread>
#include <vector>

namespace weave::check {

using diagnostics::LogLevel;

namespace {

struct Slot {
    std::optional<std::string> error;
    RecordOutcome              outcome;
};

/// Evaluate one environment and record the result. Ledger::record
/// serializes writers on the same item. An evaluator that throws is a
/// failed check on that environment, not a failed run.
void evaluate_into(item::FfiItem& ffi, const Environment& environment,
                   const Evaluator& evaluator, Slot& slot) {
    try {
        slot.error = evaluator(ffi, environment);
    } catch (const std::exception& e) {
        slot.error = std::string("evaluator threw: ") + e.what();
        diagnostics::log(LogLevel::Warning, "check",
                         "evaluator threw for " + ffi.describe() + " on "
                         + environment.to_string() + ": " + e.what());
    }
    slot.outcome = ffi.checks.record(environment, slot.error);
}

void run_item(item::FfiItem& ffi, std::span<const Environment> environments,
              const Evaluator& evaluator, const CheckOptions& options,
              std::vector<Slot>& slots) {
    slots.assign(environments.size(), Slot{});
    if (!options.parallel_environments || environments.size() < 2) {
        for (std::size_t i = 0; i < environments.size(); ++i)
            evaluate_into(ffi, environments[i], evaluator, slots[i]);
        return;
    }

    std::size_t batch = options.max_threads == 0 ? environments.size()
                                                 : std::max<std::size_t>(1, options.max_threads);
    for (std::size_t first = 0; first < environments.size(); first += batch) {
        std::size_t last = std::min(environments.size(), first + batch);
        std::vector<std::thread> workers;
        workers.reserve(last - first);
        for (std::size_t i = first; i < last; ++i) {
            workers.emplace_back([&, i] {
                evaluate_into(ffi, environments[i], evaluator, slots[i]);
            });
        }
        for (auto& worker : workers)
            worker.join();
    }
}

} // anonymous namespace

Result<RunReport> run(store::Store& store, const Evaluator& evaluator, const CheckOptions& options) {
    if (!evaluator)
        return std::unexpected(Error::validation("No evaluator supplied to the check driver"));

    RunReport report;
    // Copy: the environment list must not change under running workers.
    std::vector<Environment> environments(store.environments().begin(), store.environments().end());
    if (environments.empty()) {
        diagnostics::log(LogLevel::Warning, "check", "no environments registered; nothing to check");
        return report;
    }

    std::vector<item::FfiId> ids;
    for (const auto& ffi : store.ffi_items()) {
        if (options.skip_processed && ffi.processed)
            continue;
        ids.push_back(ffi.id);
    }

    std::vector<Slot> slots;
    for (auto id : ids) {
        auto ffi = store.ffi_item_mut(id);
        if (!ffi)
            return std::unexpected(diagnostics::enrich(ffi.error(), "check driver"));

        run_item(**ffi, environments, evaluator, options, slots);
        ++report.items_checked;

        for (std::size_t i = 0; i < slots.size(); ++i) {
            const auto& slot = slots[i];
            switch (slot.outcome.kind) {
                case RecordKind::Added:     ++report.added;     break;
                case RecordKind::Unchanged: ++report.unchanged; break;
                case RecordKind::Changed:   ++report.changed;   break;
            }
            if (slot.outcome.is_regression(slot.error)) {
                ++report.regressions;
                diagnostics::log(LogLevel::Warning, "check",
                                 "regression in " + (*ffi)->describe() + " on "
                                 + environments[i].to_string() + ": " + *slot.error);
            } else if (slot.outcome.is_fix(slot.error)) {
                ++report.fixes;
                diagnostics::log(LogLevel::Info, "check",
                                 "fixed " + (*ffi)->describe() + " on " + environments[i].to_string());
            }
        }
    }

    diagnostics::log(LogLevel::Info, "check",
                     "checked " + std::to_string(report.items_checked) + " items on "
                     + std::to_string(environments.size()) + " environments");
    return report;
}

} // namespace weave::check
