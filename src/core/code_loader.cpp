/**
 * @file code_loader.cpp
 * @brief Implementation of snippet loading
 *
 * @date 2025
 */

#include "renju/core/code_loader.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace renju {
namespace core {

namespace {

// nbformat stores a cell source either as one string or as a list of lines
std::string CellSource(const json& cell) {
    if (!cell.contains("source")) {
        return "";
    }
    const auto& source = cell.at("source");
    if (source.is_string()) {
        return source.get<std::string>();
    }

    std::string text;
    for (const auto& line : source) {
        text += line.get<std::string>();
    }
    return text;
}

std::string CommentOutMagics(const std::string& source) {
    std::istringstream lines(source);
    std::ostringstream out;
    std::string line;
    bool first = true;

    while (std::getline(lines, line)) {
        if (!first) {
            out << '\n';
        }
        first = false;

        auto start = line.find_first_not_of(" \t");
        if (start != std::string::npos && (line[start] == '%' || line[start] == '!')) {
            out << line.substr(0, start) << "# " << line.substr(start);
        } else {
            out << line;
        }
    }

    return out.str();
}

} // anonymous namespace

Outcome<std::string> ExtractNotebookCode(const std::string& notebook_json) {
    std::string script;
    int code_cells = 0;

    try {
        json notebook = json::parse(notebook_json);

        if (!notebook.is_object() || !notebook.contains("cells") ||
            !notebook.at("cells").is_array()) {
            return Outcome<std::string>::Failure("not a notebook: missing 'cells' array");
        }

        for (const auto& cell : notebook.at("cells")) {
            if (cell.value("cell_type", "") != "code") {
                continue;
            }

            std::string source = CommentOutMagics(CellSource(cell));
            if (source.find_first_not_of(" \t\r\n") == std::string::npos) {
                continue;
            }

            if (!script.empty()) {
                script += "\n\n";
            }
            script += source;
            ++code_cells;
        }
    }
    catch (const json::exception& e) {
        return Outcome<std::string>::Failure(std::string("invalid notebook: ") + e.what());
    }

    if (!script.empty() && script.back() != '\n') {
        script += '\n';
    }

    spdlog::debug("Notebook reduced to {} code cell(s), {} bytes", code_cells, script.size());
    return Outcome<std::string>::Success(std::move(script));
}

Outcome<std::string> LoadCode(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Outcome<std::string>::Failure("cannot open " + path.string());
    }

    std::ostringstream content;
    content << file.rdbuf();

    if (path.extension() != ".ipynb") {
        return Outcome<std::string>::Success(content.str());
    }

    auto code = ExtractNotebookCode(content.str());
    if (!code.ok()) {
        code.error = path.string() + ": " + code.error;
    }
    return code;
}

} // namespace core
} // namespace renju
