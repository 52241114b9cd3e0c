#include <cassert>
#include <iostream>
#include <string>
#include "agrocache/core/cache/codec/KeyCodec.hpp"

using agrocache::core::cache::KeyCodec;

void testKnownDigest() {
    std::cout << "Testing KeyCodec known SHA-256 digests...\n";

    assert(KeyCodec::digest("abc") ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(KeyCodec::digest("") ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    std::cout << "[OK] KeyCodec known digest test\n";
}

void testDigestShape() {
    std::cout << "Testing KeyCodec digest shape...\n";

    // Длинный ключ с не-ASCII символами
    std::string key = "датчик:участок-7:влажность/" + std::string(4096, 'x');
    auto digest = KeyCodec::digest(key);
    assert(digest.size() == KeyCodec::kDigestLength);
    for (char c : digest) {
        assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
    }
    assert(KeyCodec::digest(key) == digest);
    assert(KeyCodec::digest("sensor:1") != KeyCodec::digest("sensor:2"));

    std::cout << "[OK] KeyCodec digest shape test\n";
}

int main() {
    try {
        testKnownDigest();
        testDigestShape();
        std::cout << "All KeyCodec tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
