#include <stdlib.h>
#include <unistd.h>

#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <indexgen/core/distributed_cache.hh>
#include <indexgen/core/error.hh>
#include <indexgen/test/functions.hh>

namespace {

    /// Temporary directory that is removed together with the files.
    class temporary_directory {
    private:
        std::string _path;
    public:
        temporary_directory() {
            char tmpl[] = "/tmp/indexgen-cache-XXXXXX";
            if (!::mkdtemp(tmpl)) { throw std::runtime_error("mkdtemp failed"); }
            this->_path = tmpl;
        }
        ~temporary_directory() {
            for (const char* name : {"a", "b", "f1"}) {
                ::unlink((this->_path + '/' + name).data());
            }
            ::rmdir(this->_path.data());
        }
        inline const std::string& path() const noexcept { return this->_path; }
    };

    void put_get(ixg::distributed_cache& cache) {
        cache.put("a", "first");
        cache.put("b", std::string("\0\1\2", 3));
        EXPECT_EQ("first", cache.get("a"));
        EXPECT_EQ(std::string("\0\1\2", 3), cache.get("b"));
        cache.put("a", "second");
        EXPECT_EQ("second", cache.get("a"));
        try {
            cache.get("missing");
            FAIL() << "get did not throw";
        } catch (const ixg::key_not_found& err) {
            EXPECT_EQ("missing", err.key());
        }
    }

    void push_pull(ixg::distributed_cache& cache) {
        ixg::function_type_registry types;
        test::add_test_types(types);
        ixg::push_function(cache, "f1", test::Linear_function(4, 5), types);
        auto f = ixg::pull_function(cache, "f1", types);
        auto* linear = dynamic_cast<test::Linear_function*>(f.get());
        ASSERT_TRUE(linear);
        EXPECT_EQ(4u, linear->offset());
        EXPECT_EQ(5u, linear->factor());
        EXPECT_EQ(24u, (*linear)(4));
    }

}

TEST(memory_cache, put_get) {
    ixg::memory_cache cache;
    put_get(cache);
    EXPECT_EQ(2u, cache.size());
}

TEST(memory_cache, push_pull) {
    ixg::memory_cache cache;
    push_pull(cache);
}

TEST(memory_cache, pull_corrupt) {
    ixg::function_type_registry types;
    test::add_test_types(types);
    ixg::memory_cache cache;
    ixg::push_function(cache, "f1", test::Linear_function(4, 5), types);
    auto value = cache.get("f1");
    cache.put("f1", value.substr(0, value.size()-1));
    EXPECT_THROW(ixg::pull_function(cache, "f1", types), ixg::corrupt_descriptor);
    cache.put("f1", value + 'x');
    EXPECT_THROW(ixg::pull_function(cache, "f1", types), ixg::corrupt_descriptor);
    cache.put("f1", std::string());
    EXPECT_THROW(ixg::pull_function(cache, "f1", types), ixg::corrupt_descriptor);
    EXPECT_THROW(ixg::pull_function(cache, "f2", types), ixg::key_not_found);
}

TEST(directory_cache, put_get) {
    temporary_directory dir;
    ixg::directory_cache cache(dir.path());
    EXPECT_EQ(dir.path(), cache.directory());
    put_get(cache);
}

TEST(directory_cache, push_pull) {
    temporary_directory dir;
    ixg::directory_cache cache(dir.path());
    push_pull(cache);
    ixg::directory_cache other(dir.path());
    ixg::function_type_registry types;
    test::add_test_types(types);
    EXPECT_NO_THROW(ixg::pull_function(other, "f1", types));
}

TEST(directory_cache, bad_key) {
    temporary_directory dir;
    ixg::directory_cache cache(dir.path());
    EXPECT_THROW(cache.put("", "x"), std::invalid_argument);
    EXPECT_THROW(cache.put(".", "x"), std::invalid_argument);
    EXPECT_THROW(cache.put("..", "x"), std::invalid_argument);
    EXPECT_THROW(cache.put("a/b", "x"), std::invalid_argument);
    EXPECT_THROW(cache.get("../a"), std::invalid_argument);
}

TEST(directory_cache, missing_directory) {
    ixg::directory_cache cache("/nonexistent-indexgen-directory");
    EXPECT_THROW(cache.put("a", "x"), ixg::error);
    EXPECT_THROW(cache.get("a"), ixg::key_not_found);
}
