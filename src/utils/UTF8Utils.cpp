#include "utils/UTF8Utils.h"

namespace {
    bool isContinuation(unsigned char c) {
        return (c & 0xC0) == 0x80;
    }

    // 返回从 i 开始的合法序列长度,非法时返回 0
    size_t sequenceLength(const std::string& input, size_t i) {
        unsigned char c = static_cast<unsigned char>(input[i]);
        size_t remaining = input.size() - i;

        // 单字节 ASCII (0x00-0x7F)
        if (c <= 0x7F) return 1;

        // 2 字节序列 (0xC2-0xDF) - 0xC0/0xC1 是过长编码
        if (c >= 0xC2 && c <= 0xDF) {
            if (remaining >= 2 && isContinuation(input[i + 1])) return 2;
            return 0;
        }

        // 3 字节序列 (0xE0-0xEF)
        if (c >= 0xE0 && c <= 0xEF) {
            if (remaining < 3) return 0;
            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            if (!isContinuation(c1) || !isContinuation(input[i + 2])) return 0;
            if (c == 0xE0 && c1 < 0xA0) return 0;   // 过长编码
            if (c == 0xED && c1 > 0x9F) return 0;   // UTF-16 代理区
            return 3;
        }

        // 4 字节序列 (0xF0-0xF4)
        if (c >= 0xF0 && c <= 0xF4) {
            if (remaining < 4) return 0;
            unsigned char c1 = static_cast<unsigned char>(input[i + 1]);
            if (!isContinuation(c1) || !isContinuation(input[i + 2]) || !isContinuation(input[i + 3])) return 0;
            if ((c == 0xF0 && c1 < 0x90) || (c == 0xF4 && c1 > 0x8F)) return 0;
            return 4;
        }

        return 0;
    }
}

namespace UTF8Utils {
    std::string sanitize(const std::string& input) {
        std::string output;
        output.reserve(input.size());

        size_t i = 0;
        while (i < input.size()) {
            size_t len = sequenceLength(input, i);
            if (len == 0) {
                output.push_back('?');
                i++;
                continue;
            }
            output.append(input, i, len);
            i += len;
        }
        return output;
    }

    bool isValid(const std::string& input) {
        size_t i = 0;
        while (i < input.size()) {
            size_t len = sequenceLength(input, i);
            if (len == 0) return false;
            i += len;
        }
        return true;
    }
}
