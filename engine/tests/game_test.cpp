#include "test_util.hpp"
#include "kingcap/game.hpp"

using namespace kingcap;

TEST(Game, RejectsIllegalMoveWithoutChange){
    Game g(fenPos("4k3/8/8/8/8/8/8/R3K3 w"));
    Position before = g.position();
    EXPECT_FALSE(g.play(mv("a1b2")));
    EXPECT_FALSE(g.play(mv("e8e7"))); // not white's piece
    EXPECT_EQ(g.position(), before);
}

TEST(Game, AcceptedMoveReplacesPosition){
    Game g(fenPos("4k3/8/8/8/8/8/8/R3K3 w"));
    EXPECT_TRUE(g.play(mv("a1a7")));
    EXPECT_EQ(g.position().side_to_move(), Side::Black);
    EXPECT_TRUE(g.position().piece_at(sq("a7")).has_value());
    EXPECT_EQ(g.outcome(), Outcome::Ongoing);
}

TEST(Game, KingCaptureEndsGame){
    Game g(fenPos("8/8/8/8/8/8/3k4/4K3 w"));
    EXPECT_TRUE(g.play(mv("e1d2")));
    EXPECT_EQ(g.outcome(), Outcome::WhiteWins);
    EXPECT_STREQ(outcome_name(g.outcome()), "White wins!");

    Game h(fenPos("8/8/8/8/8/8/3k4/4K3 b"));
    EXPECT_TRUE(h.play(mv("d2e1")));
    EXPECT_EQ(h.outcome(), Outcome::BlackWins);
}

TEST(Game, EngineMovePlaysSuggestion){
    SearchOptions opts; opts.depth = 1;
    Game g(fenPos("4k3/8/8/3q4/8/8/8/3RK3 w"), opts);
    auto hint = g.suggest();
    ASSERT_TRUE(hint.has_value());
    auto played = g.play_engine_move();
    ASSERT_TRUE(played.has_value());
    EXPECT_EQ(played->move, hint->move);
    EXPECT_EQ(g.position().side_to_move(), Side::Black);
    EXPECT_FALSE(g.position().piece_at(sq("d1")).has_value());
}

TEST(Game, EngineMoveWithoutMovesLeavesPosition){
    Game g(fenPos("kp6/pp6/pp6/pp6/pp6/pp6/pp6/pp5K b"));
    Position before = g.position();
    EXPECT_FALSE(g.suggest().has_value());
    EXPECT_FALSE(g.play_engine_move().has_value());
    EXPECT_EQ(g.position(), before);
    EXPECT_TRUE(g.moves().empty());
}

TEST(Game, ScoreUsesConfiguredDepth){
    SearchOptions opts; opts.depth = 4;
    Game g(fenPos("4k3/8/8/8/8/8/8/3QK3 w"), opts);
    EXPECT_EQ(g.score(), 200);
}
