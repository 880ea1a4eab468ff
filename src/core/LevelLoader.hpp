/**
 * @file LevelLoader.hpp
 * @brief Leitura de níveis em texto (uma linha da grade por linha do arquivo).
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include "GridMap.hpp"

namespace gridnav {

/**
 * @brief Fachada estática para carregar níveis do disco.
 *
 * Formato:
 * @code
 * # comentário
 * 1 1 1 1 1
 * 1 0 0 3 1
 * 1 1 1 1 1
 * @endcode
 * Cada dígito é um código de célula (0, 1 ou 3); espaços e vírgulas entre
 * dígitos são opcionais. Linhas vazias e linhas iniciadas por '#' são
 * ignoradas. Todas as linhas devem ter a mesma largura.
 */
class LevelLoader {
public:
    /**
     * @brief Converte o texto de um nível em grade.
     * @return grade, ou std::nullopt se houver código inválido, linhas de
     *         larguras diferentes ou nenhuma linha
     */
    static std::optional<GridMap> parse(const std::string& text);

    /**
     * @brief Carrega um nível de arquivo.
     * @param file caminho do arquivo
     * @param out grade de saída (só alterada em caso de sucesso)
     * @return false se o arquivo não abrir ou for inválido
     */
    static bool loadFile(const std::string& file, GridMap* out);

    /**
     * @brief Lista os arquivos `.txt` de um diretório, em ordem alfabética.
     * @return lista vazia se o diretório não existir
     */
    static std::vector<std::string> listLevels(const std::string& dir);
};

} // namespace gridnav
