/**
 * @file main.cpp
 * @brief Точка входа утилиты lvmread
 */

#include "io/lvm_error.hpp"
#include "io/lvm_file.hpp"
#include "io/lvm_json.hpp"
#include "model/header_schema.hpp"
#include "model/lvm_data.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#ifndef LVMREAD_VERSION
#define LVMREAD_VERSION "0.0.0"
#endif

namespace {

using namespace lvmread::model;

void printUsage(std::ostream& out) {
    out << "Использование: lvmread <файл.lvm> [--no-cache] [--no-dump] "
           "[--json <файл.json>] [--segments]\n"
        << "  --no-cache   не читать кэш <файл.lvm>.json\n"
        << "  --no-dump    не сохранять кэш после разбора\n"
        << "  --json       сохранить результат в JSON\n"
        << "  --segments   вывести сводку по каждому сегменту\n";
}

std::string fieldText(const HeaderFields& fields, std::string_view name) {
    auto it = fields.find(name);
    if (it == fields.end() || it->second.empty()) {
        return "-";
    }
    std::string text;
    for (size_t i = 0; i < it->second.values.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += formatFieldValue(it->second.values[i]);
    }
    return text;
}

void printSummary(const ParseResult& result, const std::filesystem::path& path) {
    const auto& header = result.file_header;
    std::cout << "Файл: " << path.string() << "\n"
              << "  Версия записи: " << fieldText(header.fields, fields::kWriterVersion) << "\n"
              << "  Дата: " << fieldText(header.fields, fields::kDate)
              << " " << fieldText(header.fields, fields::kTime) << "\n"
              << "  X_Columns: " << toString(header.xColumns())
              << ", заголовки сегментов: " << (header.multiHeadings() ? "у каждого" : "один") << "\n"
              << "  Сегментов: " << result.segments.size()
              << ", отсчётов: " << result.totalSamples() << std::endl;
}

void printSegments(const ParseResult& result) {
    for (size_t i = 0; i < result.segments.size(); ++i) {
        const auto& segment = result.segments[i];
        std::cout << "Сегмент " << (i + 1) << ": каналов " << segment.header.channels()
                  << ", строк " << segment.rowCount() << "\n";
        for (size_t ch = 0; ch < segment.channels.size(); ++ch) {
            const auto& channel = segment.channels[ch];
            std::cout << "  [" << ch << "] ";
            if (ch < segment.header.y_labels.size()) {
                std::cout << segment.header.y_labels[ch];
            }
            std::cout << ": " << channel.size() << " отсчётов";
            if (!channel.empty()) {
                std::cout << ", X " << channel.x.front() << " .. " << channel.x.back();
            }
            std::cout << "\n";
        }
    }
    std::cout.flush();
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::optional<std::filesystem::path> input_path;
        std::optional<std::filesystem::path> json_path;
        lvmread::io::ReadOptions options;
        bool show_segments = false;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg(argv[i]);
            if (arg == "--help" || arg == "-h") {
                printUsage(std::cout);
                return 0;
            } else if (arg == "--version") {
                std::cout << "lvmread " << LVMREAD_VERSION << std::endl;
                return 0;
            } else if (arg == "--no-cache") {
                options.use_cache = false;
            } else if (arg == "--no-dump") {
                options.write_cache = false;
            } else if (arg == "--segments") {
                show_segments = true;
            } else if (arg == "--json") {
                if (i + 1 >= argc) {
                    std::cerr << "Не указан путь для --json" << std::endl;
                    return 2;
                }
                json_path = std::filesystem::path(argv[++i]);
            } else if (!arg.empty() && arg.front() == '-') {
                std::cerr << "Неизвестный параметр: " << arg << std::endl;
                printUsage(std::cerr);
                return 2;
            } else if (!input_path.has_value()) {
                input_path = std::filesystem::path(argv[i]);
            } else {
                std::cerr << "Лишний аргумент: " << arg << std::endl;
                return 2;
            }
        }

        if (!input_path.has_value()) {
            printUsage(std::cerr);
            return 2;
        }

        lvmread::model::ParseResult result;
        try {
            result = lvmread::io::readLvm(*input_path, options);
        } catch (const lvmread::io::LvmFormatError& e) {
            std::cerr << "Ошибка формата (" << lvmread::io::toString(e.kind()) << ")";
            if (e.line() > 0) {
                std::cerr << ", строка " << e.line();
            }
            if (!e.field().empty()) {
                std::cerr << ", поле " << e.field();
            }
            std::cerr << ": " << e.what() << std::endl;
            return 1;
        }

        printSummary(result, *input_path);
        if (show_segments) {
            printSegments(result);
        }

        if (json_path.has_value()) {
            lvmread::io::saveResultJson(result, *json_path, 2);
            std::cout << "Результат сохранён в: " << json_path->string() << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
