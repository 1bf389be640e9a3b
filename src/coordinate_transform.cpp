#include "coordinate_transform.h"
#include "world_utils.h"

#include <cstdint>
#include <limits>

glm::ivec2 CoordinateTransform::unconvert(int col, int row) {
    // col - row == 2 * chunkX and col + row == 2 * chunkY
    return glm::ivec2(floorDiv(col - row, 2), floorDiv(col + row, 2));
}

std::string CoordinateTransform::base36Encode(int value) {
    static const char ALPHABET[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    if (value == 0) {
        return "0";
    }

    // Widen first so that INT_MIN can be negated
    int64_t magnitude = value < 0 ? -static_cast<int64_t>(value) : static_cast<int64_t>(value);

    std::string digits;
    while (magnitude != 0) {
        digits.insert(digits.begin(), ALPHABET[magnitude % 36]);
        magnitude /= 36;
    }

    if (value < 0) {
        digits.insert(digits.begin(), '-');
    }
    return digits;
}

bool CoordinateTransform::base36Decode(const std::string& text, int& value) {
    size_t pos = 0;
    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        pos = 1;
    }
    if (pos >= text.size()) {
        return false;
    }

    int64_t result = 0;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        int digit;
        if (c >= '0' && c <= '9') {
            digit = c - '0';
        } else if (c >= 'a' && c <= 'z') {
            digit = c - 'a' + 10;
        } else if (c >= 'A' && c <= 'Z') {
            digit = c - 'A' + 10;
        } else {
            return false;
        }

        result = result * 36 + digit;
        if (result > static_cast<int64_t>(std::numeric_limits<int>::max()) + 1) {
            return false;
        }
    }

    if (negative) {
        result = -result;
    }
    if (result > std::numeric_limits<int>::max() || result < std::numeric_limits<int>::min()) {
        return false;
    }

    value = static_cast<int>(result);
    return true;
}
