#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include <indexgen/core/job_configuration.hh>

TEST(job_configuration, set_get) {
    ixg::job_configuration conf;
    EXPECT_TRUE(conf.empty());
    conf.set("indexgen.function.n", 10u);
    conf.set("name", "squares");
    EXPECT_EQ(10u, conf.get<unsigned>("indexgen.function.n", 0u));
    EXPECT_EQ("10", conf.get("indexgen.function.n"));
    EXPECT_EQ("squares", conf.get("name"));
    EXPECT_EQ(2u, conf.size());
    EXPECT_TRUE(conf.contains("name"));
    conf.unset("name");
    EXPECT_FALSE(conf.contains("name"));
}

TEST(job_configuration, defaults) {
    ixg::job_configuration conf;
    EXPECT_EQ(1u, conf.get<unsigned>("job.map-tasks", 1u));
    EXPECT_THROW(conf.get("job.map-tasks"), std::out_of_range);
}

TEST(job_configuration, bad_values) {
    ixg::job_configuration conf;
    conf.set("a", "x");
    conf.set("b", "-1");
    conf.set("c", "12 apples");
    EXPECT_THROW(conf.get<unsigned>("a", 0u), std::invalid_argument);
    EXPECT_THROW(conf.get<unsigned>("b", 0u), std::invalid_argument);
    EXPECT_THROW(conf.get<unsigned>("c", 0u), std::invalid_argument);
    EXPECT_EQ(-1, conf.get<int>("b", 0));
}

TEST(job_configuration, read_properties) {
    ixg::job_configuration conf;
    std::stringstream in;
    in << "job.map-tasks = 4\n# comment\nindexgen.function.n=100\n";
    conf.read(in, "string");
    EXPECT_EQ(4u, conf.get<unsigned>("job.map-tasks", 1u));
    EXPECT_EQ(100u, conf.get<unsigned>("indexgen.function.n", 0u));
    std::stringstream out;
    out << conf;
    EXPECT_EQ("indexgen.function.n=100\njob.map-tasks=4\n", out.str());
}

TEST(job_configuration, empty_key) {
    ixg::job_configuration conf;
    std::stringstream in;
    in << "=4\n";
    EXPECT_THROW(conf.read(in, "string"), std::runtime_error);
}
