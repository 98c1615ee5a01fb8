#include "engine.hpp"

#include "xiangqi/log.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

using json = nlohmann::json;
using namespace xiangqi;

namespace {

json coord_to_json(const Coord& c) { return json{{"row", c.row}, {"col", c.col}}; }

json move_to_json(const Move& m) {
    return json{{"from", coord_to_json(m.from)}, {"to", coord_to_json(m.to)}};
}

bool parse_coord(const json& j, Coord& c) {
    if (!j.is_object()) return false;
    auto r = j.find("row");
    auto col = j.find("col");
    if (r == j.end() || col == j.end() || !r->is_number_integer() || !col->is_number_integer())
        return false;
    c = Coord{r->get<int>(), col->get<int>()};
    return true;
}

bool parse_player(const json& in, const char* key, int64_t& out) {
    auto it = in.find(key);
    if (it == in.end() || !it->is_number_integer()) return false;
    out = it->get<int64_t>();
    return true;
}

json state_to_json(const SerializedState& s) {
    const GameSnapshot& g = s.snapshot;
    json board = json::array();
    for (int r = 0; r < ROWS; r++) {
        json row = json::array();
        for (int c = 0; c < COLS; c++) {
            const auto& cell = g.cells[sq_index(Coord{r, c})];
            if (!cell) {
                row.push_back(nullptr);
                continue;
            }
            row.push_back(json{{"kind", kind_name(cell->kind)},
                               {"side", side_name(cell->side)},
                               {"name", cell->name}});
        }
        board.push_back(row);
    }

    json legal = json::array();
    for (const auto& m : s.legal_moves) legal.push_back(move_to_json(m));

    json out{
        {"game_id", g.id},
        {"turn", side_name(g.current)},
        {"game_over", g.status == GameStatus::Finished},
        {"result", g.result},
        {"difficulty", difficulty_name(g.difficulty)},
        {"red_player", s.red_player},
        {"black_player", s.black_player},
        {"history", g.history},
        {"status_text", s.status_text},
        {"board", board},
        {"legal_moves", legal},
    };
    out["winner"] = g.winner ? json(side_name(*g.winner)) : json(nullptr);
    out["last_move"] = g.last_move ? move_to_json(*g.last_move) : json(nullptr);
    out["last_notation"] = g.last_notation ? json(*g.last_notation) : json(nullptr);
    return out;
}

json status_to_json(const ActionStatus& st) {
    json out{{"ok", st.ok}, {"game_over", st.game_over}, {"result", st.result}};
    if (!st.game_id.empty()) out["game_id"] = st.game_id;
    if (!st.notation.empty()) out["notation"] = st.notation;
    if (!st.ai_notation.empty()) out["ai_move"] = st.ai_notation;
    if (st.code != ErrorCode::None) out["code"] = error_code_name(st.code);
    if (!st.error.empty()) out["error"] = st.error;
    if (st.failed_token != NotationToken::None) out["token"] = token_name(st.failed_token);
    return out;
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::NoActiveGame:
        case ErrorCode::InviteNotFound: return 404;
        case ErrorCode::PlayerBusy:
        case ErrorCode::GameAlreadyFinished: return 409;
        case ErrorCode::CorruptState: return 500;
        default: return 400;
    }
}

void set_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Attaches the current board when the call names a game.
void reply(GameService& service, httplib::Response& res, const ActionStatus& st) {
    json out = status_to_json(st);
    if (!st.game_id.empty()) {
        SerializedState s = service.serialize_state(st.game_id);
        if (s.found) out["state"] = state_to_json(s);
    }
    set_json(res, st.ok ? 200 : http_status_for(st.code), out);
}

bool read_body(const httplib::Request& req, httplib::Response& res, json& in) {
    in = json::parse(req.body, nullptr, false);
    if (in.is_discarded() || !in.is_object()) {
        set_json(res, 400, json{{"error", "invalid JSON body"}});
        return false;
    }
    return true;
}

template <typename Fn>
void register_post(httplib::Server& svr, const std::string& path, Fn&& fn) {
    svr.Post(path, fn);
    svr.Post("/api" + path, fn);
}

} // namespace

int main() {
    Config cfg = load_config_from_env();
    set_log_level(parse_log_level(cfg.log_level));

    SessionDirectory directory(std::chrono::seconds(cfg.invite_ttl_seconds));
    GameService service(cfg, directory);
    httplib::Server svr;

    auto health_handler = [&](const httplib::Request&, httplib::Response& res) {
        set_json(res, 200, json{{"ok", true}, {"games", directory.size()}});
    };
    svr.Get("/health", health_handler);
    svr.Get("/api/health", health_handler);

    // {player, side?: "red"|"black", opponent?: id (engine when absent), chat?, difficulty?}
    register_post(svr, "/new", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        int64_t player = 0;
        if (!parse_player(in, "player", player)) {
            set_json(res, 400, json{{"error", "missing player"}});
            return;
        }
        int64_t opponent = AI_PLAYER;
        if (in.contains("opponent") && !parse_player(in, "opponent", opponent)) {
            set_json(res, 400, json{{"error", "invalid opponent"}});
            return;
        }
        bool red = in.value("side", std::string("red")) != "black";
        Difficulty d = parse_difficulty(in.value("difficulty", std::string("normal")));
        std::string chat = in.value("chat", std::string());

        ActionStatus st = red ? service.create_game(player, opponent, chat, d)
                              : service.create_game(opponent, player, chat, d);
        reply(service, res, st);
    });

    // {player, move: "炮二平五"} or {player, from: {row, col}, to: {row, col}}
    register_post(svr, "/move", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        int64_t player = 0;
        if (!parse_player(in, "player", player)) {
            set_json(res, 400, json{{"error", "missing player"}});
            return;
        }
        auto text = in.find("move");
        if (text != in.end() && text->is_string()) {
            reply(service, res, service.submit_move_text(player, text->get<std::string>()));
            return;
        }
        Coord from{}, to{};
        if (!in.contains("from") || !in.contains("to") || !parse_coord(in["from"], from) ||
            !parse_coord(in["to"], to)) {
            set_json(res, 400, json{{"error", "missing/invalid move"}});
            return;
        }
        reply(service, res, service.submit_move(player, from, to));
    });

    register_post(svr, "/resign", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        std::string gid = in.value("game_id", std::string());
        int64_t player = 0;
        if (gid.empty() || !parse_player(in, "player", player)) {
            set_json(res, 400, json{{"error", "missing game_id or player"}});
            return;
        }
        if (!service.resign(gid, player)) {
            set_json(res, 409, json{{"error", "cannot resign this game"}});
            return;
        }
        SerializedState s = service.serialize_state(gid);
        set_json(res, 200, json{{"ok", true}, {"state", state_to_json(s)}});
    });

    register_post(svr, "/invite", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        int64_t player = 0, target = 0;
        if (!parse_player(in, "player", player) || !parse_player(in, "target", target)) {
            set_json(res, 400, json{{"error", "missing player or target"}});
            return;
        }
        reply(service, res, service.invite(player, target, in.value("chat", std::string())));
    });

    register_post(svr, "/accept", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        int64_t player = 0, inviter = 0;
        if (!parse_player(in, "player", player) || !parse_player(in, "inviter", inviter)) {
            set_json(res, 400, json{{"error", "missing player or inviter"}});
            return;
        }
        Difficulty d = parse_difficulty(in.value("difficulty", std::string("normal")));
        reply(service, res, service.accept_invite(player, inviter, d));
    });

    register_post(svr, "/state", [&](const httplib::Request& req, httplib::Response& res) {
        json in;
        if (!read_body(req, res, in)) return;
        std::string gid = in.value("game_id", std::string());
        if (gid.empty()) {
            set_json(res, 400, json{{"error", "missing game_id"}});
            return;
        }
        SerializedState s = service.serialize_state(gid);
        if (!s.found) {
            set_json(res, 404, json{{"error", "game_id not found"}});
            return;
        }
        set_json(res, 200, json{{"state", state_to_json(s)}});
    });

    std::mutex sweep_mu;
    std::condition_variable sweep_cv;
    bool stopping = false;
    std::thread sweeper([&]() {
        std::unique_lock<std::mutex> lk(sweep_mu);
        while (!sweep_cv.wait_for(lk, std::chrono::seconds(cfg.sweep_interval_seconds),
                                  [&] { return stopping; })) {
            lk.unlock();
            service.sweep();
            lk.lock();
        }
    });

    log_info("server", "xiangqi API listening on 0.0.0.0:" + std::to_string(cfg.port));
    bool listened = svr.listen("0.0.0.0", cfg.port);
    if (!listened) log_error("server", "cannot listen on port " + std::to_string(cfg.port));

    {
        std::lock_guard<std::mutex> lk(sweep_mu);
        stopping = true;
    }
    sweep_cv.notify_all();
    sweeper.join();
    return listened ? 0 : 1;
}
