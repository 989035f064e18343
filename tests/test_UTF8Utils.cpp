/**
 * UTF8Utils 单元测试
 */
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>

#include "utils/UTF8Utils.h"

TEST(UTF8Utils, ValidTextIsUnchanged) {
    std::string text = "plain ascii, 中文日志, emoji \xF0\x9F\x98\x80";
    EXPECT_TRUE(UTF8Utils::isValid(text));
    EXPECT_EQ(UTF8Utils::sanitize(text), text);
}

TEST(UTF8Utils, InvalidBytesAreReplaced) {
    EXPECT_EQ(UTF8Utils::sanitize("ok\xFFok"), "ok?ok");
    EXPECT_EQ(UTF8Utils::sanitize("\xC0\xAF"), "??");            // 过长编码
    EXPECT_EQ(UTF8Utils::sanitize("\xED\xA0\x80"), "???");       // 代理区
    EXPECT_EQ(UTF8Utils::sanitize("tail \xE4\xB8"), "tail ??");  // 截断
    EXPECT_FALSE(UTF8Utils::isValid("ok\xFFok"));
}

TEST(UTF8Utils, SanitizedTextSerializes) {
    std::string binary = "line\x80\x81\xFE end";
    nlohmann::json j = {{"text", UTF8Utils::sanitize(binary)}};
    EXPECT_NO_THROW(j.dump());
}
