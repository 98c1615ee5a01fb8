#pragma once

#include "board.hpp"

#include <string>

namespace xiangqi {

// Which part of the text could not be resolved.
enum class NotationToken {
    None,
    Format,
    Piece,
    Position,
    Action,
    Magnitude,
};

struct ParseResult {
    bool ok = false;
    Move move{};
    NotationToken failed_token = NotationToken::None;
    std::string error;
};

// Accepts simplified or traditional glyphs and Arabic, full-width, Chinese
// or financial numerals. Never throws.
ParseResult parse_notation(const std::string& text, const Board& board, Side side);

// Text for `m` on the board before the move is made. Empty when `m.from`
// is empty or the move does not fit the piece's shape.
std::string generate_notation(const Board& board, const Move& m);

std::string to_traditional(const std::string& text);

// Files are numbered 1-9 from each side's own right.
int column_numeral(Side side, int col);
int column_from_numeral(Side side, int n);

// Red writes 一..九, Black writes 1..9.
std::string numeral_text(Side side, int n);

std::string token_name(NotationToken t);

} // namespace xiangqi
