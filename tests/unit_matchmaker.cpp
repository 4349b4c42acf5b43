// SPDX-License-Identifier: Apache-2.0
#include "server/matchmaking/matchmaker.hpp"
#include "server/matchmaking/session_manager.hpp"
#include "test_sessions.hpp"
#include "test_world.hpp"

#include <coro/io_scheduler.hpp>

#include <cassert>
#include <iostream>
#include <vector>

using namespace arena;
using PC = arena::ServerMessage::PayloadCase;

int main()
{
    auto sched = coro::io_scheduler::make_shared();
    auto &mgr = mm::instance();

    mm::MatchConfig cfg;
    cfg.content = test::builtin_content();
    cfg.layout = game::build_open_layout();
    cfg.fixed_seed = 5;
    cfg.create_interval_ms = 5000;
    cfg.modes = mm::default_modes();
    cfg.modes[0].min_players = 2;
    cfg.modes[0].max_players = 3;
    cfg.modes[0].countdown_ms = 1000;
    assert(mm::find_mode(cfg, "ffa") && mm::find_mode(cfg, "world"));
    assert(!mm::find_mode(cfg, "ctf"));

    mm::MatchmakerState state;

    // The persistent world exists before anyone queues for it.
    auto created = mm::matchmaker_poll(state, cfg, 0);
    assert(created.size() == 1);
    auto world_match = created.front();
    assert(world_match->mode.name == "world" && world_match->match_id == "match_1");
    assert(world_match->world.cfg.tick_rate == cfg.tick_rate);
    assert(mm::matchmaker_poll(state, cfg, 10).empty());

    // Four queued for a three-player mode: one match of three, one left waiting.
    std::vector<std::shared_ptr<mm::Session>> players;
    for (int i = 0; i < 4; ++i) {
        players.push_back(test::make_joined_session(sched, "p" + std::to_string(i)));
        assert(mgr.enqueue(players.back(), "ffa"));
    }
    created = mm::matchmaker_poll(state, cfg, 100);
    assert(created.size() == 1);
    auto ffa = created.front();
    assert(ffa->match_id == "match_2" && ffa->mode.name == "ffa");
    assert(ffa->expected_players() == 3);
    assert(!ffa->accepting_joins());
    for (int i = 0; i < 3; ++i) {
        assert(!players[i]->in_queue);
        assert(mgr.match_of(players[i]) == ffa);
        auto out = mgr.drain_messages(players[i]);
        const auto *mc = test::last_of(out, PC::kMatchCreated);
        assert(mc && mc->match_created().match_id() == "match_2");
        assert(mc->match_created().countdown_ms() == 1000);
        assert(mc->match_created().players_size() == 3);
    }
    {
        auto out = mgr.drain_messages(players[3]);
        assert(test::count_kind(out, PC::kMatchCreated) == 0);
        const auto *qu = test::last_of(out, PC::kQueueUpdate);
        assert(qu && qu->queue_update().position() == 1 && qu->queue_update().players_size() == 1);
    }

    // Inside the spacing window a short queue waits.
    assert(mm::matchmaker_poll(state, cfg, 2000).empty());
    assert(players[3]->in_queue);

    // Once the window has passed the remainder gets its own match.
    created = mm::matchmaker_poll(state, cfg, 5100);
    assert(created.size() == 1 && created.front()->match_id == "match_3");
    assert(!players[3]->in_queue);
    assert(created.front()->expected_players() == 1);

    // World joins go into the running world without a match_created notice.
    auto wanderer = test::make_joined_session(sched, "wanderer", "ranger");
    assert(mgr.enqueue(wanderer, "world"));
    assert(mm::matchmaker_poll(state, cfg, 5200).empty());
    assert(mgr.match_of(wanderer) == world_match);
    assert(world_match->expected_players() == 1);
    assert(test::count_kind(mgr.drain_messages(wanderer), PC::kMatchCreated) == 0);

    // Closed matches are forgotten; a closed world is recreated.
    world_match->done.store(true);
    ffa->done.store(true);
    created = mm::matchmaker_poll(state, cfg, 5300);
    assert(created.size() == 1 && created.front()->mode.name == "world");
    assert(created.front()->match_id == "match_4");
    assert(state.matches.size() == 2);

    for (auto &s : players)
        mgr.disconnect_session(s);
    mgr.disconnect_session(wanderer);
    std::cout << "unit_matchmaker OK" << std::endl;
    return 0;
}
