/**
 * @file move_parser.cpp
 * @brief Implementation of the coordinate parser
 *
 * @date 2025
 */

#include "renju/game/move_parser.hpp"

#include <regex>

namespace renju {
namespace game {

namespace {

// Digits strings longer than this are never valid coordinates
constexpr std::size_t kMaxCoordinateDigits = 3;

std::optional<Move> ToMove(const std::string& row, const std::string& col) {
    if (row.size() > kMaxCoordinateDigits || col.size() > kMaxCoordinateDigits) {
        return std::nullopt;
    }
    Move move{std::stoi(row), std::stoi(col)};
    if (!Board::InBounds(move)) {
        return std::nullopt;
    }
    return move;
}

} // anonymous namespace

std::optional<Move> MoveParser::Parse(const std::string& text) {
    static const std::regex kParenthesized(R"(\((\d+)\s*,\s*(\d+)\))");
    static const std::regex kCommaSeparated(R"((\d+)\s*,\s*(\d+))");
    static const std::regex kNumber(R"(\d+)");

    std::smatch match;

    if (std::regex_search(text, match, kParenthesized)) {
        if (auto move = ToMove(match[1].str(), match[2].str())) {
            return move;
        }
    }

    if (std::regex_search(text, match, kCommaSeparated)) {
        if (auto move = ToMove(match[1].str(), match[2].str())) {
            return move;
        }
    }

    auto begin = std::sregex_iterator(text.begin(), text.end(), kNumber);
    auto end = std::sregex_iterator();
    if (begin != end) {
        std::string first = begin->str();
        if (++begin != end) {
            return ToMove(first, begin->str());
        }
    }

    return std::nullopt;
}

} // namespace game
} // namespace renju
