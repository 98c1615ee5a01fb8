#include "notation.hpp"

#include "move_validator.hpp"

#include <algorithm>
#include <cstdlib>
#include <map>
#include <unordered_map>
#include <vector>

namespace xiangqi {
namespace {

enum class Marker { Front, Middle, Back };
enum class Action { Advance, Retreat, Traverse };

struct Token {
    enum Type { Glyph, MarkerTok, ActionTok, Numeral } type = Glyph;
    PieceKind kind = PieceKind::Soldier;
    Marker marker = Marker::Front;
    Action action = Action::Traverse;
    int value = 0;
    std::string text;
};

static Token glyph(PieceKind k) { Token t; t.type = Token::Glyph; t.kind = k; return t; }
static Token marker(Marker m) { Token t; t.type = Token::MarkerTok; t.marker = m; return t; }
static Token action(Action a) { Token t; t.type = Token::ActionTok; t.action = a; return t; }
static Token numeral(int v) { Token t; t.type = Token::Numeral; t.value = v; return t; }

static const std::unordered_map<std::string, Token>& token_table() {
    static const std::unordered_map<std::string, Token> table = [] {
        std::unordered_map<std::string, Token> m;
        for (const char* s : {"帅", "将", "帥", "將"}) m[s] = glyph(PieceKind::General);
        for (const char* s : {"仕", "士"}) m[s] = glyph(PieceKind::Advisor);
        for (const char* s : {"相", "象"}) m[s] = glyph(PieceKind::Elephant);
        for (const char* s : {"马", "馬", "傌"}) m[s] = glyph(PieceKind::Horse);
        for (const char* s : {"车", "車", "俥"}) m[s] = glyph(PieceKind::Chariot);
        for (const char* s : {"炮", "砲", "包"}) m[s] = glyph(PieceKind::Cannon);
        for (const char* s : {"兵", "卒"}) m[s] = glyph(PieceKind::Soldier);

        m["前"] = marker(Marker::Front);
        m["中"] = marker(Marker::Middle);
        m["后"] = marker(Marker::Back);
        m["後"] = marker(Marker::Back);

        m["进"] = action(Action::Advance);
        m["進"] = action(Action::Advance);
        m["退"] = action(Action::Retreat);
        m["平"] = action(Action::Traverse);

        static const char* const CN[9]  = {"一", "二", "三", "四", "五", "六", "七", "八", "九"};
        static const char* const FW[9]  = {"１", "２", "３", "４", "５", "６", "７", "８", "９"};
        static const char* const FIN[9] = {"壹", "贰", "叁", "肆", "伍", "陆", "柒", "捌", "玖"};
        for (int i = 0; i < 9; i++) {
            m[CN[i]] = numeral(i + 1);
            m[FW[i]] = numeral(i + 1);
            m[FIN[i]] = numeral(i + 1);
            m[std::string(1, (char)('1' + i))] = numeral(i + 1);
        }
        m["貳"] = numeral(2);
        m["參"] = numeral(3);
        m["陸"] = numeral(6);
        return m;
    }();
    return table;
}

static bool is_space(const std::string& ch) {
    return ch == " " || ch == "\t" || ch == "\n" || ch == "\r" || ch == "\xE3\x80\x80";
}

// Splits UTF-8 into code point substrings; stray bytes come out alone.
static std::vector<std::string> split_utf8(const std::string& s) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = (unsigned char)s[i];
        size_t len = 1;
        if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        if (i + len > s.size()) len = s.size() - i;
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

static ParseResult fail(NotationToken t, const std::string& msg) {
    ParseResult r;
    r.ok = false;
    r.failed_token = t;
    r.error = msg;
    return r;
}

static bool straight_mover(PieceKind k) {
    return k == PieceKind::Chariot || k == PieceKind::Cannon ||
           k == PieceKind::Soldier || k == PieceKind::General;
}

// Front-to-back from the mover's point of view.
static void sort_front_to_back(std::vector<Piece>& v, Side side) {
    std::sort(v.begin(), v.end(), [side](const Piece& a, const Piece& b) {
        return side == Side::Red ? a.pos.row < b.pos.row : a.pos.row > b.pos.row;
    });
}

struct FileGroups {
    std::map<int, std::vector<Piece>> by_numeral; // ascending numeral = right to left
    std::vector<int> multi;                        // numerals holding 2+ pieces
};

static FileGroups group_files(const std::vector<Piece>& pieces, Side side) {
    FileGroups g;
    for (const auto& p : pieces) g.by_numeral[column_numeral(side, p.pos.col)].push_back(p);
    for (auto& kv : g.by_numeral) {
        sort_front_to_back(kv.second, side);
        if (kv.second.size() >= 2) g.multi.push_back(kv.first);
    }
    return g;
}

// Continuous ordinal sequence over the files that hold 2+ pieces.
static std::vector<Piece> ordinal_sequence(const FileGroups& g) {
    std::vector<Piece> out;
    for (int n : g.multi) {
        const auto& file = g.by_numeral.at(n);
        out.insert(out.end(), file.begin(), file.end());
    }
    return out;
}

// Destination described by action + magnitude for the piece at `from`.
static bool resolve_target(const Piece& p, Action act, int mag, Coord& to) {
    if (mag < 1 || mag > 9) return false;
    int fwd = forward_dir(p.side);
    if (act == Action::Traverse) {
        to = Coord{p.pos.row, column_from_numeral(p.side, mag)};
        return to.col != p.pos.col;
    }
    int sign = (act == Action::Advance) ? fwd : -fwd;
    if (straight_mover(p.kind)) {
        to = Coord{p.pos.row + sign * mag, p.pos.col};
        return on_board(to);
    }
    int dc = column_from_numeral(p.side, mag) - p.pos.col;
    int adc = std::abs(dc);
    int adr = 0;
    switch (p.kind) {
        case PieceKind::Horse:
            if (adc == 1) adr = 2;
            else if (adc == 2) adr = 1;
            else return false;
            break;
        case PieceKind::Elephant:
            if (adc != 2) return false;
            adr = 2;
            break;
        case PieceKind::Advisor:
            if (adc != 1) return false;
            adr = 1;
            break;
        default:
            return false;
    }
    to = Coord{p.pos.row + sign * adr, p.pos.col + dc};
    return on_board(to);
}

static bool feasible(const Board& board, const Piece& p, Action act, int mag) {
    Coord to;
    if (!resolve_target(p, act, mag, to)) return false;
    return is_valid_move(board, p.pos, to);
}

// Action and magnitude that describe m, the inverse of resolve_target.
static bool describe_action(const Piece& p, const Coord& to, Action& act, int& mag) {
    int dr = to.row - p.pos.row;
    if (dr == 0) {
        if (to.col == p.pos.col) return false;
        act = Action::Traverse;
        mag = column_numeral(p.side, to.col);
        return true;
    }
    act = (dr * forward_dir(p.side) > 0) ? Action::Advance : Action::Retreat;
    if (straight_mover(p.kind)) {
        if (to.col != p.pos.col) return false;
        mag = std::abs(dr);
    } else {
        mag = column_numeral(p.side, to.col);
    }
    Coord check;
    return resolve_target(p, act, mag, check) && check == to;
}

static std::string action_text(Action a) {
    switch (a) {
        case Action::Advance:  return "进";
        case Action::Retreat:  return "退";
        case Action::Traverse: return "平";
    }
    return "";
}

static std::string marker_text(Marker m) {
    switch (m) {
        case Marker::Front:  return "前";
        case Marker::Middle: return "中";
        case Marker::Back:   return "后";
    }
    return "";
}

static std::string describe_tokens(const std::vector<Token>& toks) {
    std::string s;
    for (const auto& t : toks) s += t.text;
    return s;
}

} // namespace

int column_numeral(Side side, int col) {
    return side == Side::Red ? 9 - col : col + 1;
}

int column_from_numeral(Side side, int n) {
    return side == Side::Red ? 9 - n : n - 1;
}

std::string numeral_text(Side side, int n) {
    static const char* const CN[9] = {"一", "二", "三", "四", "五", "六", "七", "八", "九"};
    if (n < 1 || n > 9) return "?";
    if (side == Side::Red) return CN[n - 1];
    return std::string(1, (char)('0' + n));
}

std::string token_name(NotationToken t) {
    switch (t) {
        case NotationToken::None:      return "none";
        case NotationToken::Format:    return "format";
        case NotationToken::Piece:     return "piece";
        case NotationToken::Position:  return "position";
        case NotationToken::Action:    return "action";
        case NotationToken::Magnitude: return "magnitude";
    }
    return "unknown";
}

ParseResult parse_notation(const std::string& text, const Board& board, Side side) {
    const auto& table = token_table();
    std::vector<Token> toks;
    for (const auto& ch : split_utf8(text)) {
        if (is_space(ch)) continue;
        auto it = table.find(ch);
        if (it == table.end()) return fail(NotationToken::Format, "unrecognised character '" + ch + "'");
        Token t = it->second;
        t.text = ch;
        toks.push_back(t);
    }
    if (toks.empty()) return fail(NotationToken::Format, "empty move text");

    // Exactly one action glyph splits descriptor from magnitude.
    int act_idx = -1;
    for (int i = 0; i < (int)toks.size(); i++) {
        if (toks[i].type != Token::ActionTok) continue;
        if (act_idx >= 0) return fail(NotationToken::Action, "more than one action in '" + text + "'");
        act_idx = i;
    }
    if (act_idx < 0) return fail(NotationToken::Action, "missing action (进/退/平) in '" + text + "'");
    Action act = toks[act_idx].action;

    if ((int)toks.size() != act_idx + 2 || toks[act_idx + 1].type != Token::Numeral)
        return fail(NotationToken::Magnitude, "expected one numeral after '" + toks[act_idx].text + "'");
    int mag = toks[act_idx + 1].value;

    std::vector<Token> head(toks.begin(), toks.begin() + act_idx);
    if (head.empty() || head.size() > 2)
        return fail(NotationToken::Format, "malformed descriptor '" + describe_tokens(head) + "'");
    int glyph_idx = -1;
    for (int i = 0; i < (int)head.size(); i++)
        if (head[i].type == Token::Glyph) {
            if (glyph_idx >= 0) return fail(NotationToken::Piece, "two piece glyphs in '" + text + "'");
            glyph_idx = i;
        }
    if (glyph_idx < 0) return fail(NotationToken::Piece, "missing piece glyph in '" + text + "'");
    PieceKind kind = head[glyph_idx].kind;

    std::vector<Piece> pool = board.pieces_of(kind, side);
    if (pool.empty())
        return fail(NotationToken::Piece, "no " + head[glyph_idx].text + " for " + side_name(side));

    std::vector<Piece> cands;
    if (head.size() == 1) {
        cands = pool;
    } else {
        const Token& desc = head[1 - glyph_idx];
        FileGroups g = group_files(pool, side);
        if (desc.type == Token::Numeral && glyph_idx == 0) {
            auto it = g.by_numeral.find(desc.value);
            if (it == g.by_numeral.end())
                return fail(NotationToken::Position, "no " + head[glyph_idx].text + " on file " + desc.text);
            cands = it->second;
        } else if (desc.type == Token::Numeral) {
            std::vector<Piece> seq;
            if (g.multi.empty()) {
                // Lone pieces only: ordinals fall back to front-to-back overall.
                seq = pool;
                sort_front_to_back(seq, side);
            } else {
                seq = ordinal_sequence(g);
            }
            if (desc.value > (int)seq.size())
                return fail(NotationToken::Position, "ordinal " + desc.text + " out of range");
            cands.push_back(seq[desc.value - 1]);
        } else if (desc.type == Token::MarkerTok) {
            if (g.multi.empty())
                return fail(NotationToken::Position, "no file holds more than one " + head[glyph_idx].text);
            for (int n : g.multi) {
                const auto& file = g.by_numeral.at(n);
                if (desc.marker == Marker::Front) cands.push_back(file.front());
                else if (desc.marker == Marker::Back) cands.push_back(file.back());
                else if (file.size() == 3) cands.push_back(file[1]);
            }
            if (cands.empty())
                return fail(NotationToken::Position, "'" + desc.text + "' needs three pieces on a file");
        } else {
            return fail(NotationToken::Position, "unrecognised descriptor '" + desc.text + "'");
        }
    }

    if (cands.size() > 1) {
        std::vector<Piece> ok;
        for (const auto& p : cands)
            if (feasible(board, p, act, mag)) ok.push_back(p);
        if (ok.size() != 1)
            return fail(NotationToken::Position,
                        ok.empty() ? "no " + head[glyph_idx].text + " can play '" + text + "'"
                                   : "ambiguous piece in '" + text + "'");
        cands = ok;
    }

    const Piece& mover = cands.front();
    Coord to;
    if (!resolve_target(mover, act, mag, to))
        return fail(NotationToken::Magnitude,
                    "'" + toks[act_idx + 1].text + "' is not a reachable target for " + mover.name);

    ParseResult r;
    r.ok = true;
    r.move = Move{mover.pos, to};
    return r;
}

std::string generate_notation(const Board& board, const Move& m) {
    const auto& cell = board.at(m.from);
    if (!cell || !on_board(m.to)) return "";
    const Piece& p = *cell;
    Action act;
    int mag = 0;
    if (!describe_action(p, m.to, act, mag)) return "";
    std::string tail = action_text(act) + numeral_text(p.side, mag);

    std::vector<Piece> pool = board.pieces_of(p.kind, p.side);
    if (pool.size() <= 1) return p.name + tail;

    FileGroups g = group_files(pool, p.side);
    int my_file = column_numeral(p.side, p.pos.col);
    const auto& file = g.by_numeral[my_file];
    if (file.size() == 1) return p.name + numeral_text(p.side, my_file) + tail;

    if (p.kind == PieceKind::Advisor || p.kind == PieceKind::Elephant) {
        int n = 0;
        bool mine = false;
        for (const auto& q : pool)
            if (feasible(board, q, act, mag)) {
                n++;
                if (q.pos == p.pos) mine = true;
            }
        if (n == 1 && mine) return p.name + tail;
    }

    auto index_in = [&p](const std::vector<Piece>& v) {
        for (int i = 0; i < (int)v.size(); i++)
            if (v[i].pos == p.pos) return i;
        return -1;
    };

    if (g.multi.size() == 1) {
        int i = index_in(file);
        if (file.size() == 2) return marker_text(i == 0 ? Marker::Front : Marker::Back) + p.name + tail;
        if (file.size() == 3) {
            Marker mk = i == 0 ? Marker::Front : (i == 1 ? Marker::Middle : Marker::Back);
            return marker_text(mk) + p.name + tail;
        }
        return numeral_text(p.side, i + 1) + p.name + tail;
    }

    int i = index_in(ordinal_sequence(g));
    return numeral_text(p.side, i + 1) + p.name + tail;
}

std::string to_traditional(const std::string& text) {
    static const std::unordered_map<std::string, std::string> table = {
        {"帅", "帥"}, {"将", "將"}, {"马", "馬"}, {"车", "車"}, {"炮", "砲"},
        {"进", "進"}, {"后", "後"}, {"贰", "貳"}, {"叁", "參"}, {"陆", "陸"},
    };
    std::string out;
    for (const auto& ch : split_utf8(text)) {
        auto it = table.find(ch);
        out += (it == table.end()) ? ch : it->second;
    }
    return out;
}

} // namespace xiangqi
