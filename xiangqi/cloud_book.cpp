#include "cloud_book.hpp"

#include "log.hpp"

#include <httplib.h>

#include <cctype>
#include <exception>

namespace xiangqi {
namespace {

static char fen_char(const Piece& p) {
    static const char LETTERS[KIND_COUNT] = {'k', 'a', 'b', 'n', 'r', 'c', 'p'};
    char ch = LETTERS[kind_index(p.kind)];
    return p.side == Side::Red ? (char)std::toupper((unsigned char)ch) : ch;
}

static bool decode_square(char file, char rank, Coord& out) {
    file = (char)std::tolower((unsigned char)file);
    if (file < 'a' || file > 'i' || rank < '0' || rank > '9') return false;
    out = Coord{9 - (rank - '0'), file - 'a'};
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

} // namespace

std::string encode_position(const Board& board, Side to_move) {
    std::string fen;
    for (int r = 0; r < ROWS; r++) {
        int empty = 0;
        for (int c = 0; c < COLS; c++) {
            const auto& p = board.at(r, c);
            if (!p) {
                empty++;
                continue;
            }
            if (empty > 0) {
                fen += std::to_string(empty);
                empty = 0;
            }
            fen += fen_char(*p);
        }
        if (empty > 0) fen += std::to_string(empty);
        if (r < ROWS - 1) fen += '/';
    }
    fen += to_move == Side::Red ? " w" : " b";
    return fen;
}

std::optional<Move> decode_book_move(const std::string& code) {
    if (code.size() != 4) return std::nullopt;
    Move m;
    if (!decode_square(code[0], code[1], m.from)) return std::nullopt;
    if (!decode_square(code[2], code[3], m.to)) return std::nullopt;
    return m;
}

BookResult parse_book_reply(const std::string& body) {
    BookResult r;
    std::string text = trim(body);
    // Some replies carry extra fields after a '|'.
    size_t bar = text.find('|');
    if (bar != std::string::npos) text = text.substr(0, bar);

    if (text == "nobestmove" || text == "unknown") {
        r.ok = true;
        return r;
    }
    if (text.rfind("move:", 0) == 0 || text.rfind("egtb:", 0) == 0) {
        auto m = decode_book_move(text.substr(5));
        if (!m) {
            r.error = "unparseable book move '" + text + "'";
            return r;
        }
        r.ok = true;
        r.move = m;
        return r;
    }
    r.error = "unexpected book reply '" + text + "'";
    return r;
}

CloudOpeningBook::CloudOpeningBook(std::string url, int timeout_ms)
    : timeout_ms_(timeout_ms > 0 ? timeout_ms : 3000) {
    size_t scheme = url.find("://");
    size_t path_at = url.find('/', scheme == std::string::npos ? 0 : scheme + 3);
    if (path_at == std::string::npos) {
        host_ = url;
        path_ = "/";
    } else {
        host_ = url.substr(0, path_at);
        path_ = url.substr(path_at);
    }
}

BookResult CloudOpeningBook::lookup(const Board& board, Side to_move) {
    BookResult out;
    std::string fen = encode_position(board, to_move);
    time_t sec = timeout_ms_ / 1000;
    time_t usec = (timeout_ms_ % 1000) * 1000;

    httplib::Result res;
    try {
        httplib::Client cli(host_);
        cli.set_connection_timeout(sec, usec);
        cli.set_read_timeout(sec, usec);
        cli.set_write_timeout(sec, usec);
        httplib::Params params{{"action", "querybest"}, {"board", fen}};
        res = cli.Get(path_, params, httplib::Headers{});
    } catch (const std::exception& e) {
        // httplib rejects unsupported schemes by throwing.
        out.error = std::string("bad book url: ") + e.what();
        log_warn("book", out.error);
        return out;
    }
    if (!res) {
        out.error = "request failed: " + httplib::to_string(res.error());
        log_warn("book", out.error);
        return out;
    }
    if (res->status != 200) {
        out.error = "HTTP " + std::to_string(res->status);
        log_warn("book", out.error);
        return out;
    }

    out = parse_book_reply(res->body);
    if (!out.ok) log_warn("book", out.error);
    else if (out.move) log_debug("book", "hit for " + fen);
    return out;
}

} // namespace xiangqi
