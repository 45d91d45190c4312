/// \file core_unit_test.cpp
/// \brief Unit tests for the error model, runtime options, and diagnostics.

#include <weave/weave.hpp>
#include "../test_harness.hpp"

#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

namespace {

void test_error_model() {
    SECTION("Error model");

    auto e1 = weave::Error::validation("bad input", "ctx");
    CHECK(e1.category == weave::ErrorCategory::Validation);
    CHECK(e1.message == "bad input");
    CHECK(e1.context == "ctx");
    CHECK(e1.code == 0);

    CHECK(weave::Error::not_found("x").category == weave::ErrorCategory::NotFound);
    CHECK(weave::Error::path("x").category == weave::ErrorCategory::PathError);
    CHECK(weave::Error::package_mismatch("x").category == weave::ErrorCategory::PackageMismatch);
    CHECK(weave::Error::conversion("x").category == weave::ErrorCategory::ConversionError);
    CHECK(weave::Error::internal("x").context.empty());

    CHECK_EQ(weave::category_name(weave::ErrorCategory::PathError), std::string_view("path error"));
    CHECK_EQ(weave::category_name(weave::ErrorCategory::PackageMismatch),
             std::string_view("package mismatch"));

    weave::Result<int> r = 42;
    CHECK(r.has_value() && *r == 42);

    weave::Status st = weave::ok();
    CHECK(st.has_value());

    weave::Result<int> failed = std::unexpected(weave::Error::not_found("gone"));
    CHECK_ERR(failed, weave::ErrorCategory::NotFound);
}

void test_shared_options() {
    SECTION("Shared options");

    weave::RuntimeOptions runtime;
    CHECK(runtime.log_level == weave::diagnostics::LogLevel::Warning);

    weave::CheckOptions check;
    CHECK(check.parallel_environments);
    CHECK(check.max_threads == 0);
    CHECK(!check.skip_processed);

    CHECK_EQ(weave::kStandardPackage, std::string_view("std"));
    CHECK_EQ(weave::kInitialPackageVersion, std::string_view("0.0.0"));
}

void test_runtime_options_from_environment() {
    SECTION("Runtime options from environment");
    using weave::diagnostics::LogLevel;

    ::unsetenv("WEAVE_LOG_LEVEL");
    CHECK_VAL(weave::runtime_options_from_environment(), _v.log_level == LogLevel::Warning);

    ::setenv("WEAVE_LOG_LEVEL", "debug", 1);
    CHECK_VAL(weave::runtime_options_from_environment(), _v.log_level == LogLevel::Debug);

    ::setenv("WEAVE_LOG_LEVEL", "loud", 1);
    auto bad = weave::runtime_options_from_environment();
    CHECK_ERR(bad, weave::ErrorCategory::Validation);
    if (!bad)
        CHECK_CONTAINS(bad.error().context, "WEAVE_LOG_LEVEL");

    ::unsetenv("WEAVE_LOG_LEVEL");

    weave::RuntimeOptions options;
    options.log_level = LogLevel::Error;
    CHECK_OK(weave::configure(options));
    CHECK(weave::diagnostics::log_level() == LogLevel::Error);
}

void test_diagnostics() {
    SECTION("Diagnostics");
    using namespace weave::diagnostics;
    reset_performance_counters();

    auto s1 = set_log_level(LogLevel::Debug);
    CHECK(s1.has_value());
    CHECK(log_level() == LogLevel::Debug);

    log(LogLevel::Info, "unit", "diagnostics smoke line");
    CHECK(performance_counters().log_messages >= 1);

    // Filtered out: above the current level.
    auto before = performance_counters().log_messages;
    log(LogLevel::Trace, "unit", "not shown");
    CHECK_EQ(performance_counters().log_messages, before);

    CHECK_VAL(parse_log_level("trace"), _v == LogLevel::Trace);
    CHECK_ERR(parse_log_level("TRACE"), weave::ErrorCategory::Validation);
    CHECK_EQ(log_level_name(LogLevel::Warning), std::string_view("warning"));

    auto inv_ok = assert_invariant(true, "must hold");
    CHECK(inv_ok.has_value());

    auto inv_bad = assert_invariant(false, "expected fail");
    CHECK_ERR(inv_bad, weave::ErrorCategory::Internal);
    CHECK(performance_counters().invariant_failures == 1);

    auto enriched = enrich(weave::Error::internal("x", "base"), "extra");
    CHECK_EQ(enriched.context, std::string("base | extra"));
    CHECK_EQ(enrich(weave::Error::internal("x"), "only").context, std::string("only"));

    set_log_level(LogLevel::Warning);
}

void test_concurrent_logging() {
    SECTION("Concurrent logging");
    using namespace weave::diagnostics;

    set_log_level(LogLevel::Info);
    reset_performance_counters();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t] {
            for (int i = 0; i < 25; ++i)
                log(LogLevel::Info, "stress", "thread " + std::to_string(t));
        });
    }
    for (auto& thread : threads)
        thread.join();
    CHECK_EQ(performance_counters().log_messages, std::uint64_t{100});
    set_log_level(LogLevel::Warning);
}

} // namespace

int main() {
    test_error_model();
    test_shared_options();
    test_runtime_options_from_environment();
    test_diagnostics();
    test_concurrent_logging();
    return weave_test::report("weave core unit tests");
}
