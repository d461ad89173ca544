#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include <indexgen/core/error.hh>
#include <indexgen/core/function_buffer.hh>
#include <indexgen/test/functions.hh>

TEST(function_buffer, string) {
    const std::string inputs[] = {"", "a", "indexgen.function.f1", std::string(1000, 'x')};
    for (const auto& a : inputs) {
        std::string b;
        ixg::function_buffer buf;
        buf.write(a);
        buf.flip();
        buf.read(b);
        EXPECT_EQ(a, b);
        EXPECT_EQ(buf.limit(), buf.position());
        char tmp;
        EXPECT_THROW(buf.read(tmp), std::range_error);
    }
}

TEST(function_buffer, function) {
    ixg::function_type_registry types;
    test::add_test_types(types);
    test::Linear_function expected(10, 3);
    ixg::function_buffer buf;
    buf.types(&types);
    buf.write(static_cast<const ixg::function_base&>(expected));
    buf.flip();
    ixg::function_ptr actual;
    buf.read(actual);
    EXPECT_EQ(buf.limit(), buf.position());
    ASSERT_TRUE(actual.get());
    EXPECT_EQ(101u, actual->type_id());
    auto* linear = dynamic_cast<test::Linear_function*>(actual.get());
    ASSERT_TRUE(linear);
    EXPECT_EQ(10u, linear->offset());
    EXPECT_EQ(3u, linear->factor());
}

TEST(function_buffer, no_types) {
    test::Square_function f;
    ixg::function_buffer buf;
    EXPECT_THROW(buf.write(static_cast<const ixg::function_base&>(f)), ixg::error);
}

TEST(function_buffer, unregistered_type) {
    ixg::function_type_registry types;
    types.add<test::Square_function>(100);
    test::Linear_function f;
    ixg::function_buffer buf;
    buf.types(&types);
    EXPECT_THROW(buf.write(static_cast<const ixg::function_base&>(f)), ixg::error);
}

TEST(function_buffer, unknown_type_id) {
    ixg::function_type_registry types;
    ixg::function_buffer buf;
    buf.types(&types);
    buf.write(ixg::function_base::type_id_type(100));
    buf.flip();
    ixg::function_ptr f;
    EXPECT_THROW(buf.read(f), ixg::corrupt_descriptor);
}

TEST(payload, _) {
    sys::u32 x = 123, y = 0;
    ixg::function_buffer buf;
    {
        ixg::payload_write_guard g(buf);
        buf.write(x);
    }
    EXPECT_EQ(sizeof(sys::u32)*2, buf.position());
    buf.write(x);
    buf.flip();
    {
        ixg::payload_read_guard g(buf);
        EXPECT_TRUE(g);
        EXPECT_EQ(sizeof(sys::u32), g.size());
        buf.read(y);
        EXPECT_EQ(x, y);
        EXPECT_EQ(buf.limit(), buf.position());
        char tmp;
        EXPECT_THROW(buf.read(tmp), std::range_error);
    }
    EXPECT_EQ(sizeof(sys::u32)*2, buf.position());
    EXPECT_EQ(sizeof(sys::u32), buf.remaining());
}

TEST(payload, empty) {
    ixg::function_buffer buf;
    {
        ixg::payload_write_guard g(buf);
    }
    buf.flip();
    EXPECT_EQ(sizeof(sys::u32), buf.limit());
    {
        ixg::payload_read_guard g(buf);
        EXPECT_TRUE(g);
        EXPECT_EQ(0u, g.size());
    }
    EXPECT_EQ(buf.limit(), buf.position());
}

TEST(payload, truncated) {
    ixg::function_buffer buf;
    {
        ixg::payload_write_guard g(buf);
        buf.write(sys::u64(1));
    }
    buf.flip();
    buf.limit(buf.limit()-1);
    {
        ixg::payload_read_guard g(buf);
        EXPECT_FALSE(g);
    }
}

TEST(payload, no_size) {
    ixg::function_buffer buf;
    buf.write(sys::u8(1));
    buf.flip();
    ixg::payload_read_guard g(buf);
    EXPECT_FALSE(g);
    EXPECT_EQ(0u, buf.position());
}
