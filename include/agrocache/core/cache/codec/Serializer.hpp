#pragma once
#include <cstdint>
#include <cstring>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include "agrocache/core/cache/CacheErrors.hpp"

namespace agrocache {
namespace core {
namespace cache {

using Bytes = std::vector<uint8_t>;

// Serializer<T>: кодек значения в байты и обратно.
// Тип без специализации не может быть значением кэша.
template<typename T, typename Enable = void>
struct Serializer;

template<>
struct Serializer<Bytes> {
    static Bytes encode(const Bytes& value) { return value; }
    static Bytes decode(const Bytes& data) { return data; }
};

template<>
struct Serializer<std::string> {
    static Bytes encode(const std::string& value) {
        return Bytes(value.begin(), value.end());
    }
    static std::string decode(const Bytes& data) {
        return std::string(data.begin(), data.end());
    }
};

// Арифметические типы: побайтовый образ фиксированной ширины в порядке байтов хоста
template<typename T>
struct Serializer<T, std::enable_if_t<std::is_arithmetic_v<T>>> {
    static Bytes encode(const T& value) {
        Bytes data(sizeof(T));
        std::memcpy(data.data(), &value, sizeof(T));
        return data;
    }
    static T decode(const Bytes& data) {
        if (data.size() != sizeof(T)) {
            throw DeserializationError("Ожидалось " + std::to_string(sizeof(T)) +
                                       " байт, получено " + std::to_string(data.size()));
        }
        T value;
        std::memcpy(&value, data.data(), sizeof(T));
        return value;
    }
};

template<>
struct Serializer<nlohmann::json> {
    static Bytes encode(const nlohmann::json& value) {
        try {
            auto text = value.dump();
            return Bytes(text.begin(), text.end());
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::string("JSON dump: ") + e.what());
        }
    }
    static nlohmann::json decode(const Bytes& data) {
        try {
            return nlohmann::json::parse(data.begin(), data.end());
        } catch (const nlohmann::json::exception& e) {
            throw DeserializationError(std::string("JSON parse: ") + e.what());
        }
    }
};

// JsonSerializer<T>: для пользовательских типов с to_json/from_json
template<typename T>
struct JsonSerializer {
    static Bytes encode(const T& value) {
        try {
            return Serializer<nlohmann::json>::encode(nlohmann::json(value));
        } catch (const nlohmann::json::exception& e) {
            throw SerializationError(std::string("to_json: ") + e.what());
        }
    }
    static T decode(const Bytes& data) {
        auto j = Serializer<nlohmann::json>::decode(data);
        try {
            return j.template get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw DeserializationError(std::string("from_json: ") + e.what());
        }
    }
};

} // namespace cache
} // namespace core
} // namespace agrocache
