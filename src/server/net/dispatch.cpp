// SPDX-License-Identifier: Apache-2.0
#include "server/net/dispatch.hpp"

#include "common/logger.hpp"
#include "common/metrics.hpp"

namespace astro::net {

namespace {

void reply_join(ServerServices &svc, const std::shared_ptr<astro::session::Session> &s, bool ok,
                const std::string &player_id, const std::string &reason)
{
    astro::ServerMessage msg;
    auto *resp = msg.mutable_join_response();
    resp->set_success(ok);
    resp->set_player_id(player_id);
    resp->set_reason(reason);
    svc.sessions->push_message(s, msg);
}

void handle_join(ServerServices &svc, const std::shared_ptr<astro::session::Session> &s,
                 const astro::JoinRequest &req, uint64_t now_ms)
{
    if (!s->player_id.empty() || s->is_display) {
        reply_join(svc, s, false, "", "already joined");
        return;
    }
    if (req.display()) {
        svc.sessions->attach_display(s);
        reply_join(svc, s, true, "", "");
        astro::ServerMessage sync;
        *sync.mutable_map_sync() = svc.sim->current_map_sync();
        astro::metrics::snapshot().map_sync_count.fetch_add(1, std::memory_order_relaxed);
        svc.sessions->push_message(s, sync);
        astro::log::info("[conn] {} attached as display", s->connection_id);
        return;
    }
    std::string name = req.name().substr(0, kMaxNameLength);
    auto id = svc.sim->join(name, now_ms);
    if (!id) {
        reply_join(svc, s, false, "", "room full");
        return;
    }
    svc.sessions->attach_player(s, *id);
    reply_join(svc, s, true, *id, "");
}

} // namespace

bool handle_client_message(
    ServerServices &svc,
    const std::shared_ptr<astro::session::Session> &session,
    const astro::ClientMessage &msg,
    uint64_t now_ms)
{
    switch (msg.payload_case()) {
        case astro::ClientMessage::kJoin:
            handle_join(svc, session, msg.join(), now_ms);
            return true;
        case astro::ClientMessage::kInput: {
            const auto &ev = msg.input();
            if (session->player_id.empty() || ev.player_id() != session->player_id) {
                astro::metrics::runtime().inputs_rejected.fetch_add(1, std::memory_order_relaxed);
                astro::log::debug("[conn] {} input for foreign player {} dropped", session->connection_id, ev.player_id());
                return true;
            }
            (void)svc.sim->handle_input(ev, now_ms);
            return true;
        }
        case astro::ClientMessage::kStartRound:
            if (!session->player_id.empty()) {
                (void)svc.sim->start_round(session->player_id, now_ms);
            }
            return true;
        case astro::ClientMessage::kResetRound:
            if (!session->player_id.empty()) {
                (void)svc.sim->reset_round(session->player_id, now_ms);
            }
            return true;
        case astro::ClientMessage::kLeave:
            release_session(svc, session);
            return false;
        case astro::ClientMessage::kHeartbeat: {
            svc.sessions->update_heartbeat(session);
            astro::ServerMessage hb;
            auto *hbr = hb.mutable_heartbeat_resp();
            hbr->set_client_time_ms(msg.heartbeat().time_ms());
            hbr->set_server_time_ms(now_ms);
            svc.sessions->push_message(session, hb);
            return true;
        }
        case astro::ClientMessage::PAYLOAD_NOT_SET:
            break;
    }
    astro::log::debug("[conn] {} sent empty message", session->connection_id);
    return true;
}

void release_session(ServerServices &svc, const std::shared_ptr<astro::session::Session> &session)
{
    if (auto player = svc.sessions->disconnect_session(session)) {
        (void)svc.sim->leave(*player);
    }
}

} // namespace astro::net
