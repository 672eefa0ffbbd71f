/**
 * @file file_utils.cpp
 * @brief Вспомогательные функции для работы с файлами
 */

#include "file_utils.hpp"
#include "lvm_error.hpp"
#include <fstream>
#include <sstream>

namespace lvmread::io {

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    auto dir = path.parent_path();
    std::error_code ec;
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw LvmIoError("Не удалось создать каталог: " + dir.string());
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw LvmIoError("Не удалось открыть временный файл для записи: " + tmp.string());
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw LvmIoError("Ошибка записи во временный файл: " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw LvmIoError("Не удалось атомарно сохранить файл: " + path.string());
    }
}

std::string readWholeFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LvmIoError("Не удалось открыть файл: " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace lvmread::io
