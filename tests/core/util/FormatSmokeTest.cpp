#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include "core/util/Format.hpp"

using namespace mirror::core::util;

void testHumanReadableBytes() {
    std::cout << "Testing humanReadableBytes...\n";

    assert(humanReadableBytes(0) == "0.00 B");
    assert(humanReadableBytes(1023) == "1023.00 B");
    assert(humanReadableBytes(1536) == "1.50 KB");
    assert(humanReadableBytes(1024ull * 1024 * 1024 * 3) == "3.00 GB");
    // Выше TB не растёт
    assert(humanReadableBytes(1024ull * 1024 * 1024 * 1024 * 2048) == "2048.00 TB");

    std::cout << "[OK] humanReadableBytes test\n";
}

void testFormatting() {
    std::cout << "Testing formatFixed and string helpers...\n";

    assert(formatFixed(0.25, 4) == "0.2500");
    assert(formatFixed(66.6666, 2) == "66.67");
    assert(formatFixed(0.0, 2) == "0.00");
    assert(toUpper("get") == "GET");
    assert(toLower("Test-Org") == "test-org");
    assert(trim("  \n text \t") == "text");
    assert(trim("   ").empty());

    std::cout << "[OK] formatFixed and string helpers test\n";
}

void testIsoTimestamp() {
    std::cout << "Testing isoTimestamp...\n";

    auto stamp = isoTimestamp(std::chrono::system_clock::now());
    // 2024-05-01T12:34:56.123456
    assert(stamp.size() == 26);
    assert(stamp[4] == '-' && stamp[7] == '-');
    assert(stamp[10] == 'T');
    assert(stamp[19] == '.');

    std::cout << "[OK] isoTimestamp test\n";
}

int main() {
    try {
        testHumanReadableBytes();
        testFormatting();
        testIsoTimestamp();
        std::cout << "All Format tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
