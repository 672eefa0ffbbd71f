/**
 * @file lvm_file.cpp
 * @brief Реализация чтения файлов LVM с диска
 */

#include "lvm_file.hpp"
#include "lvm_error.hpp"
#include "lvm_json.hpp"
#include "lvm_reader.hpp"
#include "model/header_schema.hpp"
#include "text_utils.hpp"
#include <fstream>
#include <iostream>
#include <optional>

namespace lvmread::io {

namespace {

bool cacheIsFresh(const std::filesystem::path& source, const std::filesystem::path& cache) {
    std::error_code ec;
    if (!std::filesystem::exists(cache, ec) || ec) {
        return false;
    }
    if (!std::filesystem::exists(source, ec)) {
        return true;
    }
    auto cache_time = std::filesystem::last_write_time(cache, ec);
    if (ec) {
        return false;
    }
    auto source_time = std::filesystem::last_write_time(source, ec);
    if (ec) {
        return false;
    }
    return cache_time > source_time;
}

std::optional<ParseResult> loadCache(const std::filesystem::path& cache) {
    try {
        return loadResultJson(cache);
    } catch (const LvmIoError& e) {
        std::cerr << "Предупреждение: кэш " << cache.string()
                  << " не прочитан (" << e.what() << "), файл будет разобран заново\n";
        return std::nullopt;
    }
}

ParseResult parseFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LvmIoError("Не удалось открыть файл: " + path.string());
    }
    auto cursor = LineCursor::fromStream(file);
    return readLvmLines(cursor);
}

} // namespace

std::filesystem::path cachePathFor(const std::filesystem::path& path) {
    auto cache = path;
    cache += ".json";
    return cache;
}

ParseResult readLvm(const std::filesystem::path& path, const ReadOptions& options) {
    const auto cache = cachePathFor(path);

    if (options.use_cache && cacheIsFresh(path, cache)) {
        if (auto cached = loadCache(cache)) {
            return std::move(*cached);
        }
    }

    ParseResult result = parseFile(path);

    if (options.write_cache) {
        try {
            saveResultJson(result, cache);
        } catch (const LvmIoError& e) {
            std::cerr << "Предупреждение: " << e.what() << "\n";
        }
    }

    return result;
}

bool canReadLvm(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }

    std::string line;
    if (!std::getline(file, line)) {
        return false;
    }
    // Разделитель ещё неизвестен: достаточно префикса
    return stripLineTerminator(line).starts_with(kFileMagic);
}

} // namespace lvmread::io
