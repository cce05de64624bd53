/**
 * @file code_loader.hpp
 * @brief Loading snippet source from plain files and Jupyter notebooks
 *
 * A `.ipynb` file is reduced to a runnable script: the sources of its code
 * cells, in order, separated by a blank line. Markdown and raw cells are
 * skipped. IPython magics and shell escapes (`%...`, `!...`) cannot run under
 * a plain interpreter and are commented out.
 *
 * @date 2025
 */

#pragma once

#include "renju/core/environment_provider.hpp"

#include <filesystem>
#include <string>

namespace renju {
namespace core {

/**
 * @brief Extract the code cells of a notebook document
 * @param notebook_json Contents of a .ipynb file (nbformat 4)
 * @return Script text, or an error if the document is not a notebook
 */
Outcome<std::string> ExtractNotebookCode(const std::string& notebook_json);

/**
 * @brief Read a snippet from disk
 *
 * Files with a `.ipynb` extension go through ExtractNotebookCode; anything
 * else is returned byte for byte.
 */
Outcome<std::string> LoadCode(const std::filesystem::path& path);

} // namespace core
} // namespace renju
