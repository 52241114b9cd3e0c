#pragma once
#include <stdexcept>
#include <string>

namespace agrocache {
namespace core {
namespace cache {

// CacheError: базовое исключение кэша
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Значение не удалось сериализовать
class SerializationError : public CacheError {
public:
    using CacheError::CacheError;
};

// Повреждённая запись (декодирование / распаковка)
class DeserializationError : public CacheError {
public:
    using CacheError::CacheError;
};

// Постоянное хранилище недоступно или вернуло ошибку
class StoreError : public CacheError {
public:
    using CacheError::CacheError;
};

// Некорректная конфигурация
class ConfigError : public CacheError {
public:
    using CacheError::CacheError;
};

} // namespace cache
} // namespace core
} // namespace agrocache
