#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>
#include "agrocache/core/storage/Compression.hpp"
#include "agrocache/core/cache/CacheErrors.hpp"

using namespace agrocache::core;

void testCompressDecompress() {
    std::cout << "Testing zlib blob compression...\n";

    std::vector<uint8_t> data(8192);
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<uint8_t>(i % 16);
    }
    auto compressed = storage::compressBlob(data);
    assert(!compressed.empty());
    assert(compressed.size() < data.size());
    assert(storage::decompressBlob(compressed, data.size()) == data);

    assert(storage::compressBlob({}).empty());
    assert(storage::decompressBlob({}, 0).empty());

    std::cout << "[OK] Compression round test\n";
}

void testCorruptInput() {
    std::cout << "Testing zlib corrupt input handling...\n";

    auto expectFailure = [](const std::vector<uint8_t>& blob, size_t size) {
        try {
            storage::decompressBlob(blob, size);
        } catch (const cache::DeserializationError&) {
            return true;
        }
        return false;
    };

    assert(expectFailure({0x01, 0x02, 0x03, 0x04}, 16));
    assert(expectFailure({}, 16));

    // Неверный исходный размер
    std::vector<uint8_t> data(100, 7);
    auto compressed = storage::compressBlob(data);
    assert(expectFailure(compressed, 50));
    assert(expectFailure(compressed, 200));

    // Заявленный размер, недостижимый для deflate, отклоняется без аллокации
    assert(expectFailure(compressed, static_cast<size_t>(-1)));
    assert(expectFailure(compressed, compressed.size() * 2000));

    // Сильно сжимаемые данные укладываются в предел степени сжатия
    std::vector<uint8_t> zeros(1 << 20, 0);
    auto packed = storage::compressBlob(zeros);
    assert(storage::decompressBlob(packed, zeros.size()) == zeros);

    std::cout << "[OK] Compression corrupt input test\n";
}

int main() {
    try {
        testCompressDecompress();
        testCorruptInput();
        std::cout << "All Compression tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
