/**
 * @file test_json.cpp
 * @brief Тесты минималистичного разбора JSON
 */

#include <gtest/gtest.h>

#include "core/json.hpp"

namespace ore::tests {

class JsonTest : public ::testing::Test {
protected:
    const std::string response_ =
        R"({"jsonrpc":"2.0","result":{"context":{"slot":341},)"
        R"("value":{"blockhash":"EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N","lastValidBlockHeight":3090}},"id":7})";
};

/**
 * @brief Тест: вложенные поля через цепочку get_raw
 */
TEST_F(JsonTest, NestedExtraction) {
    auto result = json::get_raw(response_, "result");
    ASSERT_TRUE(result.has_value());

    auto context = json::get_raw(*result, "context");
    ASSERT_TRUE(context.has_value());
    EXPECT_EQ(json::get_uint(*context, "slot"), 341u);

    auto value = json::get_raw(*result, "value");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(json::get_string(*value, "blockhash"),
              "EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N");
    EXPECT_EQ(json::get_uint(*value, "lastValidBlockHeight"), 3090u);
}

/**
 * @brief Тест: ключ ищется только на верхнем уровне
 */
TEST_F(JsonTest, TopLevelOnly) {
    EXPECT_FALSE(json::get_raw(response_, "slot").has_value());
    EXPECT_EQ(json::get_int(response_, "id"), 7);
}

/**
 * @brief Тест: строки сохраняют кавычки в get_raw
 */
TEST_F(JsonTest, RawKeepsQuotes) {
    EXPECT_EQ(json::get_raw(response_, "jsonrpc"), "\"2.0\"");
}

/**
 * @brief Тест: скобки внутри строк не ломают поиск
 */
TEST_F(JsonTest, BracesInsideStrings) {
    const std::string text = R"({"message":"a {weird] \"value\"","code":-32002})";
    EXPECT_EQ(json::get_string(text, "message"), "a {weird] \"value\"");
    EXPECT_EQ(json::get_int(text, "code"), -32002);
}

/**
 * @brief Тест: null, bool и отсутствующие ключи
 */
TEST_F(JsonTest, LiteralsAndMissing) {
    const std::string text = R"({ "value" : null, "ok" : true, "bad": false })";

    auto value = json::get_raw(text, "value");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(json::is_null(*value));

    EXPECT_EQ(json::get_bool(text, "ok"), true);
    EXPECT_EQ(json::get_bool(text, "bad"), false);
    EXPECT_FALSE(json::get_bool(text, "missing").has_value());
    EXPECT_FALSE(json::get_uint(text, "ok").has_value());
}

/**
 * @brief Тест: разбиение массива
 */
TEST_F(JsonTest, SplitArray) {
    auto items = json::split_array(R"([ 1, "two", {"x":[3,4]}, null ])");
    ASSERT_TRUE(items.has_value());
    ASSERT_EQ(items->size(), 4u);
    EXPECT_EQ((*items)[0], "1");
    EXPECT_EQ((*items)[1], "\"two\"");
    EXPECT_EQ((*items)[2], R"({"x":[3,4]})");
    EXPECT_EQ((*items)[3], "null");

    auto empty = json::split_array("[]");
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());

    EXPECT_FALSE(json::split_array("{}").has_value());
}

/**
 * @brief Тест: escape и unquote согласованы
 */
TEST_F(JsonTest, EscapeUnquote) {
    const std::string original = "line1\n\"quoted\"\\tab\t";
    auto restored = json::unquote("\"" + json::escape(original) + "\"");
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, original);

    EXPECT_EQ(json::unquote(R"("\u0041")"), "A");
    EXPECT_FALSE(json::unquote("no quotes").has_value());
}

/**
 * @brief Тест: неполная hex последовательность в \u не принимается
 */
TEST_F(JsonTest, UnicodeEscapeRequiresFourHexDigits) {
    EXPECT_FALSE(json::unquote(R"("\u00zz")").has_value());
    EXPECT_FALSE(json::unquote(R"("\u4x41")").has_value());
    EXPECT_FALSE(json::unquote(R"("\u12")").has_value());
    EXPECT_EQ(json::unquote(R"("a\u0042c")"), "aBc");
}

/**
 * @brief Тест: массив без разделителей или с лишней скобкой отклоняется
 */
TEST_F(JsonTest, MalformedArrayRejected) {
    EXPECT_FALSE(json::split_array("[}]").has_value());
    EXPECT_FALSE(json::split_array("[1 2]").has_value());
    EXPECT_FALSE(json::split_array("[1,").has_value());
    EXPECT_FALSE(json::split_array(R"(["a" "b"])").has_value());

    auto items = json::split_array("[1,2]");
    ASSERT_TRUE(items.has_value());
    EXPECT_EQ(items->size(), 2u);
}

/**
 * @brief Тест: объект с пустым значением или без запятой отклоняется
 */
TEST_F(JsonTest, MalformedObjectRejected) {
    EXPECT_FALSE(json::get_raw(R"({"a":})", "a").has_value());
    EXPECT_FALSE(json::get_raw(R"({"a":} "b":1})", "b").has_value());
    EXPECT_FALSE(json::get_raw(R"({"a":1 "b":2})", "b").has_value());
    EXPECT_FALSE(json::get_raw(R"({"a":1,})", "b").has_value());

    EXPECT_EQ(json::get_raw(R"({"a":1 , "b":2})", "b"), "2");
}

} // namespace ore::tests
