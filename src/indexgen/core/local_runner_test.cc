#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include <indexgen/api.hh>
#include <indexgen/test/functions.hh>

TEST(local_runner, num_threads) {
    ixg::job_context context;
    context.configuration().set(ixg::num_threads_property, 3);
    ixg::local_runner runner(context);
    EXPECT_EQ(3u, runner.num_threads());
    runner.num_threads(0);
    EXPECT_EQ(1u, runner.num_threads());
}

TEST(local_runner, collect) {
    ixg::job_context context;
    test::add_test_types(context.types());
    context.configuration().set(ixg::num_threads_property, 4);
    ixg::job_configuration conf;
    conf.set(ixg::parallelism_property, 7);
    const ixg::index_type n = 1000;
    auto source = ixg::make_function_source<sys::u64>(
        context, conf, n, std::make_shared<test::Square_function>());
    auto actual = ixg::collect(context, source, conf);
    ASSERT_EQ(n, actual.size());
    for (ixg::index_type i=0; i<n; ++i) { EXPECT_EQ(sys::u64(i)*i, actual[i]); }
}

TEST(local_runner, strings) {
    ixg::job_context context;
    test::add_test_types(context.types());
    ixg::job_configuration conf;
    conf.set(ixg::parallelism_property, 2);
    auto source = ixg::make_function_source<std::string>(
        context, conf, 3, std::make_shared<test::Name_function>());
    std::vector<std::string> expected{"element-0", "element-1", "element-2"};
    EXPECT_EQ(expected, ixg::collect(context, source, conf));
}

TEST(local_runner, expression) {
    ixg::job_context context;
    ixg::job_configuration conf;
    conf.set(ixg::parallelism_property, 3);
    auto source = ixg::from_expression(context, conf, 6, "(remainder i 2)");
    std::vector<sys::i64> expected{0,1,0,1,0,1};
    EXPECT_EQ(expected, ixg::collect(context, source, conf));
}

TEST(local_runner, function_exception) {
    ixg::job_context context;
    test::add_test_types(context.types());
    ixg::job_configuration conf;
    conf.set(ixg::parallelism_property, 5);
    auto source = ixg::make_function_source<sys::u64>(
        context, conf, 50, std::make_shared<test::Failing_function>(33));
    try {
        ixg::collect(context, source, conf);
        FAIL() << "collect did not throw";
    } catch (const std::runtime_error& err) {
        EXPECT_EQ(std::string("bad index"), err.what());
    }
}

TEST(local_runner, every_split_once) {
    ixg::job_context context;
    test::add_test_types(context.types());
    context.configuration().set(ixg::num_threads_property, 3);
    ixg::local_runner runner(context);
    auto f = std::make_shared<test::Square_function>();
    ixg::split_array splits;
    for (ixg::index_type i=0; i<20; ++i) { splits.emplace_back(i*10, 10, f); }
    std::vector<std::atomic<int>> calls(splits.size());
    for (auto& c : calls) { c = 0; }
    runner.run(splits, [&calls,&splits] (size_t i, const ixg::split& s) {
        EXPECT_EQ(splits[i].partition(), s.partition());
        ++calls[i];
    });
    for (auto& c : calls) { EXPECT_EQ(1, c.load()); }
}

TEST(local_runner, no_splits) {
    ixg::job_context context;
    ixg::local_runner runner(context);
    int calls = 0;
    runner.run(ixg::split_array(), [&calls] (size_t, const ixg::split&) { ++calls; });
    EXPECT_EQ(0, calls);
}
