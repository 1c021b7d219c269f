#include <gtest/gtest.h>
#include "folio/core/types.hpp"
#include "folio/core/string.hpp"

using namespace folio;

// ============================================================================
// Result Tests
// ============================================================================

TEST(ResultTest, OkResult) {
    Result<int, String> result = 42;

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorResult) {
    Result<int, String> result = make_error(String("error message"));

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(result.error(), "error message");
}

TEST(ResultTest, SameValueAndErrorType) {
    Result<String, String> ok_result = String("value");
    Result<String, String> err_result = make_error(String("error"));

    ASSERT_TRUE(ok_result.is_ok());
    EXPECT_EQ(ok_result.value(), "value");
    ASSERT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "error");
}

TEST(ResultTest, ValueOr) {
    Result<int, String> ok_result = 42;
    Result<int, String> err_result = make_error(String("error"));

    EXPECT_EQ(ok_result.value_or(0), 42);
    EXPECT_EQ(err_result.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int, String> result = 21;
    auto mapped = result.map([](int x) { return x * 2; });

    EXPECT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 42);
}

TEST(ResultTest, MapPropagatesError) {
    Result<int, String> result = make_error(String("broken"));
    auto mapped = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), "broken");
}

TEST(ResultTest, MapErr) {
    Result<int, String> result = make_error(String("broken"));
    auto mapped = result.map_err([](const String& e) { return e.size(); });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error(), 6u);
}

TEST(ResultTest, MoveOutValue) {
    Result<std::vector<int>, String> result = std::vector<int>{1, 2, 3};
    auto values = std::move(result).value();

    EXPECT_EQ(values.size(), 3u);
}

TEST(ResultTest, VoidResult) {
    Result<void, String> ok_result;
    Result<void, String> err_result = make_error(String("error"));

    EXPECT_TRUE(ok_result.is_ok());
    EXPECT_TRUE(err_result.is_err());
    EXPECT_EQ(err_result.error(), "error");
}

// ============================================================================
// RefPtr Tests
// ============================================================================

class TestRefCounted : public RefCounted {
public:
    static int instance_count;

    TestRefCounted() { ++instance_count; }
    ~TestRefCounted() { --instance_count; }
};

int TestRefCounted::instance_count = 0;

TEST(RefPtrTest, BasicUsage) {
    TestRefCounted::instance_count = 0;

    {
        auto ptr = make_ref<TestRefCounted>();
        EXPECT_EQ(TestRefCounted::instance_count, 1);
        EXPECT_EQ(ptr->ref_count(), 1u);
    }

    EXPECT_EQ(TestRefCounted::instance_count, 0);
}

TEST(RefPtrTest, CopyIncrementsRefCount) {
    TestRefCounted::instance_count = 0;

    auto ptr1 = make_ref<TestRefCounted>();
    EXPECT_EQ(ptr1->ref_count(), 1u);

    {
        RefPtr<TestRefCounted> ptr2 = ptr1;
        EXPECT_EQ(ptr1->ref_count(), 2u);
        EXPECT_EQ(TestRefCounted::instance_count, 1);
    }

    EXPECT_EQ(ptr1->ref_count(), 1u);
}

TEST(RefPtrTest, MoveDoesNotIncrementRefCount) {
    auto ptr1 = make_ref<TestRefCounted>();
    EXPECT_EQ(ptr1->ref_count(), 1u);

    RefPtr<TestRefCounted> ptr2 = std::move(ptr1);
    EXPECT_EQ(ptr2->ref_count(), 1u);
    EXPECT_EQ(ptr1.get(), nullptr);
}

TEST(RefPtrTest, ConstConversionSharesOwnership) {
    TestRefCounted::instance_count = 0;

    RefPtr<const TestRefCounted> shared;
    {
        auto ptr = make_ref<TestRefCounted>();
        shared = ptr;
        EXPECT_EQ(ptr->ref_count(), 2u);
    }

    EXPECT_EQ(TestRefCounted::instance_count, 1);
    EXPECT_EQ(shared->ref_count(), 1u);
    shared.reset();
    EXPECT_EQ(TestRefCounted::instance_count, 0);
}
