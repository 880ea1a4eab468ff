/**
 * @file LevelLoader.cpp
 * @brief Implementação da leitura de níveis em texto.
 */
#include "LevelLoader.hpp"
#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gridnav {

/**
 * @brief Interpreta uma linha do nível.
 * @param line texto sem o '\n'
 * @param row saída com os códigos lidos
 * @return false se houver caractere inesperado
 */
static bool parse_row(const std::string& line, std::vector<int>& row) {
    row.clear();
    for (char ch : line) {
        if (ch == ' ' || ch == '\t' || ch == ',' || ch == '\r') continue;
        if (ch == '0') row.push_back(CELL_OPEN);
        else if (ch == '1') row.push_back(CELL_WALL);
        else if (ch == '3') row.push_back(CELL_GOAL);
        else return false;
    }
    return true;
}

std::optional<GridMap> LevelLoader::parse(const std::string& text) {
    std::vector<std::vector<int>> rows;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        std::vector<int> row;
        if (!parse_row(line, row)) {
            std::printf("LEVEL: invalid cell code at line %d\n", line_no);
            return std::nullopt;
        }
        rows.push_back(std::move(row));
    }
    if (rows.empty() || rows.front().empty()) {
        std::printf("LEVEL: empty level\n");
        return std::nullopt;
    }
    auto g = GridMap::from_rows(rows);
    if (!g) std::printf("LEVEL: rows have different widths\n");
    return g;
}

bool LevelLoader::loadFile(const std::string& file, GridMap* out) {
    if (!out) return false;
    std::ifstream ifs(file);
    if (!ifs) {
        std::printf("LEVEL[HOST]: open failed: %s\n", file.c_str());
        return false;
    }
    std::stringstream buffer; buffer << ifs.rdbuf();
    auto g = parse(buffer.str());
    if (!g) {
        std::printf("LEVEL[HOST]: rejected %s\n", file.c_str());
        return false;
    }
    *out = std::move(*g);
    std::printf("LEVEL[HOST]: loaded %s (%dx%d)\n", file.c_str(), out->rows(), out->cols());
    return true;
}

std::vector<std::string> LevelLoader::listLevels(const std::string& dir) {
    namespace fs = std::filesystem;
    std::vector<std::string> out;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return out;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == ".txt") out.push_back(it->path().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace gridnav
