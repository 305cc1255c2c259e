#include <gtest/gtest.h>

#include "../core/Hand.hpp"
#include "../core/Exception.hpp"
#include "../debug/Invariants.hpp"
#include "TestSupport.hpp"

using namespace uno::core;
using namespace uno::test;

namespace
{
    constexpr Color R = Color::Red;
    constexpr Color Y = Color::Yellow;
    constexpr Color G = Color::Green;
    constexpr Color B = Color::Blue;

    auto Two(Pile const& p1, Card const& top, Pile const& draw = {}) -> Hand
    {
        Pile p0{Num(Y, 1), Num(Y, 2), Num(Y, 3), Num(Y, 4), Num(Y, 5), Num(Y, 6), Num(Y, 7)};
        p0.resize(p1.size());
        return Deal({p0, p1}, top, draw);
    }
}

// ---------- Create ----------

TEST(Hand, Create_NumberedTop_NextSeatOpens)
{
    Hand const h = Two({Num(G, 1), Num(G, 2), Num(G, 3), Num(G, 4), Num(G, 5), Num(G, 6), Num(G, 7)}, Num(R, 5));

    EXPECT_EQ(h.TopOfDiscard(), Num(R, 5));
    EXPECT_EQ(h.CurrentColor(), R);
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_EQ(h.Direction(), 1);
    EXPECT_FALSE(h.PreviousPlayer().has_value());
    EXPECT_FALSE(h.IsAccusationWindowOpen());
    EXPECT_EQ(h.UnoCalls(), (std::vector<bool>{false, false}));
    EXPECT_EQ(h.DiscardPile().size(), 1u);
    EXPECT_EQ(h.DrawPile().size(), 108u - 2 * 7 - 1);
    EXPECT_EQ(h.HandOf(0).size(), 7u);
    EXPECT_EQ(h.HandOf(1).size(), 7u);
    EXPECT_FALSE(h.HasEnded());
    EXPECT_FALSE(h.Winner().has_value());
    EXPECT_FALSE(h.Score().has_value());
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, Create_DealsInSeatOrder)
{
    Hand const h = Hand::Create(Names(3), 0, std::make_shared<IdentityShuffler>(), 2);
    EXPECT_EQ(h.HandOf(0), (Pile{Num(R, 0), Num(R, 1)}));
    EXPECT_EQ(h.HandOf(1), (Pile{Num(R, 1), Num(R, 2)}));
    EXPECT_EQ(h.HandOf(2), (Pile{Num(R, 2), Num(R, 3)}));
    EXPECT_EQ(h.TopOfDiscard(), Num(R, 3));
    EXPECT_EQ(h.DrawPile().front(), Num(R, 4));
}

TEST(Hand, Create_RejectsBadTables)
{
    auto const s = std::make_shared<IdentityShuffler>();
    EXPECT_THROW((void)Hand::Create(Names(1), 0, s), error::InvalidPlayerCountError);
    EXPECT_THROW((void)Hand::Create(Names(11), 0, s), error::InvalidPlayerCountError);
    EXPECT_THROW((void)Hand::Create(Names(3), 3, s), error::PlayerIndexOutOfBoundsError);
    EXPECT_THROW((void)Hand::Create(Names(3), 0, s, 0), error::InvalidConfigError);
    EXPECT_NO_THROW((void)Hand::Create(Names(10), 9, s));
}

TEST(Hand, Create_DeckTooSmallForTheDeal)
{
    // 2 x 54 leaves nothing to reveal
    EXPECT_THROW((void)Hand::Create(Names(2), 0, std::make_shared<IdentityShuffler>(), 54),
                 error::NotEnoughCardsError);
    // 2 x 50 in catalog order leaves only wild cards to reveal
    EXPECT_THROW((void)Hand::Create(Names(2), 0, std::make_shared<IdentityShuffler>(), 50),
                 error::NotEnoughCardsError);
}

TEST(Hand, Create_WildTopGoesBackUntilAColoredCardSurfaces)
{
    Hand const h = Deal({{Num(Y, 1)}, {Num(G, 1)}}, Wild(), {WildDraw(), Num(R, 5)});

    EXPECT_EQ(h.TopOfDiscard(), Num(R, 5));
    EXPECT_EQ(h.CurrentColor(), R);
    ASSERT_GE(h.DrawPile().size(), 2u);
    EXPECT_EQ(h.DrawPile()[h.DrawPile().size() - 2], Wild());
    EXPECT_EQ(h.DrawPile().back(), WildDraw());
    EXPECT_EQ(TotalCards(h), constants::DeckSize);
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, Create_WildTopIsSetAsideBeforeTheReshuffle)
{
    // Reversed catalog: the deal takes four W+4 and two W, then a W is revealed.
    // Reshuffling must not bring that same W straight back to the top.
    Hand const h = Hand::Create(Names(2), 0, std::make_shared<ReversingShuffler>(), 3);

    EXPECT_EQ(h.HandOf(0), (Pile{WildDraw(), WildDraw(), WildDraw()}));
    EXPECT_EQ(h.HandOf(1), (Pile{WildDraw(), Wild(), Wild()}));
    EXPECT_EQ(h.TopOfDiscard(), Num(R, 0));
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{1});
    ASSERT_GE(h.DrawPile().size(), 2u);
    EXPECT_EQ(h.DrawPile()[h.DrawPile().size() - 2], Wild());
    EXPECT_EQ(h.DrawPile().back(), Wild());
    EXPECT_EQ(TotalCards(h), constants::DeckSize);
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, Create_OpeningReverse)
{
    Hand const h = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                        Act(CardType::Reverse, R));
    EXPECT_EQ(h.Direction(), -1);
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{2});
}

TEST(Hand, Create_OpeningSkip)
{
    Hand const h = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                        Act(CardType::Skip, R));
    EXPECT_EQ(h.Direction(), 1);
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{2});

    Hand const wrapped = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                              Act(CardType::Skip, R), {}, 2);
    EXPECT_EQ(wrapped.PlayerInTurn(), PlyrIdxT{1});
}

TEST(Hand, Create_OpeningDraw_VictimDrawsTwoAndNeverActs)
{
    Hand const h = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                        Act(CardType::Draw, R), {Num(Y, 9), Num(G, 9)});
    EXPECT_EQ(h.HandOf(1), (Pile{Num(G, 1), Num(G, 2), Num(Y, 9), Num(G, 9)}));
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{2});
    EXPECT_EQ(h.DrawPile().size() + h.DiscardPile().size() + 3 * 2 + 2, constants::DeckSize);

    Hand const wrapped = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                              Act(CardType::Draw, R), {Num(Y, 9), Num(G, 9)}, 2);
    EXPECT_EQ(wrapped.HandOf(0).size(), 4u);
    EXPECT_EQ(wrapped.PlayerInTurn(), PlyrIdxT{1});
}

TEST(Hand, Create_DealerWrapsToSeatZero)
{
    Hand const h = Deal({{Num(Y, 1)}, {Num(G, 1)}, {Num(B, 1)}}, Num(R, 5), {}, 2);
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_EQ(h.Dealer(), PlyrIdxT{2});
}

TEST(Hand, Create_SeededDealsAreReproducible)
{
    auto const a = Hand::Create(Names(4), 1, std::make_shared<SeededShuffler>(7));
    auto const b = Hand::Create(Names(4), 1, std::make_shared<SeededShuffler>(7));
    EXPECT_EQ(a.Hands(), b.Hands());
    EXPECT_EQ(a.DrawPile(), b.DrawPile());
    EXPECT_EQ(a.DiscardPile(), b.DiscardPile());
    EXPECT_FALSE(deck::IsWildCard(a.TopOfDiscard()));
    EXPECT_NO_THROW(debug::CheckInvariants(a));
}

// ---------- Play ----------

TEST(Hand, Play_NumberedMovesCardAndAdvances)
{
    Hand const h = Two({Num(B, 5), Num(G, 2)}, Num(R, 5));
    Hand const next = h.Play(0);

    EXPECT_EQ(next.TopOfDiscard(), Num(B, 5));
    EXPECT_EQ(next.CurrentColor(), B);
    EXPECT_EQ(next.HandOf(1), Pile{Num(G, 2)});
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_EQ(next.PreviousPlayer(), PlyrIdxT{1});
    EXPECT_TRUE(next.IsAccusationWindowOpen());
    EXPECT_EQ(next.DiscardPile().size(), 2u);
    EXPECT_NO_THROW(debug::CheckInvariants(next));

    // the prior value is untouched
    EXPECT_EQ(h.HandOf(1).size(), 2u);
    EXPECT_EQ(h.TopOfDiscard(), Num(R, 5));
}

TEST(Hand, Play_Errors_LeaveHandUntouched)
{
    Hand const h = Two({Num(B, 9), Wild(), Num(R, 2)}, Num(R, 5));

    EXPECT_THROW((void)h.Play(3), error::CardNotFoundError);
    EXPECT_THROW((void)h.Play(0), error::IllegalPlayError);
    EXPECT_THROW((void)h.Play(1), error::IllegalColorAssignmentError);
    EXPECT_THROW((void)h.Play(2, G), error::IllegalColorAssignmentError);

    EXPECT_EQ(h.HandOf(1), (Pile{Num(B, 9), Wild(), Num(R, 2)}));
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_EQ(h.DiscardPile().size(), 1u);
    EXPECT_FALSE(h.IsAccusationWindowOpen());
}

TEST(Hand, Play_IllegalPlayCarriesTheReason)
{
    Hand const h = Two({Num(B, 9), Num(G, 3)}, Num(R, 5));
    try
    {
        (void)h.Play(0);
        FAIL() << "expected IllegalPlayError";
    }
    catch (error::IllegalPlayError const& e)
    {
        EXPECT_EQ(e.data(), error::Code::IllegalPlay);
        EXPECT_NE(e.what().find("Numbered card"), std::string::npos) << e.what();
    }
}

TEST(Hand, Play_WildTakesTheChosenColor)
{
    Hand const next = Two({Wild(), Num(G, 3)}, Num(R, 5)).Play(0, B);

    EXPECT_EQ(next.TopOfDiscard().type, CardType::Wild);
    EXPECT_EQ(next.TopOfDiscard().color, B);
    EXPECT_EQ(next.CurrentColor(), B);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_NO_THROW(debug::CheckInvariants(next));
}

TEST(Hand, Play_SkipAdvancesTwoSeats)
{
    // Scenario B: with three seats P1's skip jumps P2 and lands on P0
    Hand const three = Deal({{Num(Y, 1), Num(Y, 2)}, {Act(CardType::Skip, R), Num(G, 1)}, {Num(B, 1), Num(B, 2)}},
                            Num(R, 5));
    ASSERT_EQ(three.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_EQ(three.Play(0).PlayerInTurn(), PlyrIdxT{0});

    // two seats: two steps wrap back to the actor
    Hand const two = Two({Act(CardType::Skip, R), Num(G, 1)}, Num(R, 5));
    EXPECT_EQ(two.Play(0).PlayerInTurn(), PlyrIdxT{1});
}

TEST(Hand, Play_ReverseFlipsDirection)
{
    Hand const h = Deal({{Num(R, 1), Num(Y, 2)}, {Act(CardType::Reverse, R), Num(G, 1)}, {Num(B, 1), Num(B, 2)}},
                        Num(R, 5));
    Hand const next = h.Play(0);
    EXPECT_EQ(next.Direction(), -1);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});

    // P0 continues counter-clockwise and wraps to P2
    Hand const after = next.Play(IndexOf(next.HandOf(0), Num(R, 1)));
    EXPECT_EQ(after.Direction(), -1);
    EXPECT_EQ(after.PlayerInTurn(), PlyrIdxT{2});
}

TEST(Hand, Play_ReverseHeadsUpReplays)
{
    Hand const next = Two({Act(CardType::Reverse, R), Num(G, 1)}, Num(R, 5)).Play(0);
    EXPECT_EQ(next.Direction(), 1);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_EQ(next.PreviousPlayer(), PlyrIdxT{1});
}

TEST(Hand, Play_DrawTwoHitsNextSeatAndSkipsIt)
{
    Hand const h = Deal({{Num(Y, 1), Num(Y, 2)}, {Act(CardType::Draw, R), Num(G, 1)}, {Num(B, 1), Num(B, 2)}},
                        Num(R, 5), {Num(G, 8), Num(G, 9)});
    Hand const next = h.Play(0);
    EXPECT_EQ(next.HandOf(2), (Pile{Num(B, 1), Num(B, 2), Num(G, 8), Num(G, 9)}));
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_NO_THROW(debug::CheckInvariants(next));
}

TEST(Hand, Play_WildDrawFourHitsNextSeat)
{
    Hand const h = Deal({{Num(Y, 1), Num(Y, 2)}, {WildDraw(), Num(G, 1)}, {Num(B, 1), Num(B, 2)}},
                        Num(R, 5), {Num(G, 6), Num(G, 7), Num(G, 8), Num(G, 9)});
    Hand const next = h.Play(0, Y);
    EXPECT_EQ(next.HandOf(2).size(), 6u);
    EXPECT_EQ(next.HandOf(2).back(), Num(G, 9));
    EXPECT_EQ(next.CurrentColor(), Y);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});
}

TEST(Hand, Play_CounterClockwiseDrawWrapsBelowZero)
{
    // P1 deals an opening reverse, so P0 acts first going counter-clockwise and P2 is the victim
    Hand const h = Deal({{Act(CardType::Draw, R), Num(Y, 2)}, {Num(G, 1), Num(G, 2)}, {Num(B, 1), Num(B, 2)}},
                        Act(CardType::Reverse, R), {}, 1);
    ASSERT_EQ(h.PlayerInTurn(), PlyrIdxT{0});
    Hand const next = h.Play(0);
    EXPECT_EQ(next.HandOf(2).size(), 4u);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{1});
}

TEST(Hand, Play_ResetsStaleUnoCalls)
{
    Hand h = Deal({{Num(Y, 1), Num(Y, 2)}, {Num(R, 3), Num(R, 4)}, {Num(R, 6), Num(R, 8)}}, Num(R, 5));
    h = h.SayUno(0).SayUno(2);
    ASSERT_EQ(h.UnoCalls(), (std::vector<bool>{true, false, true}));

    Hand const next = h.Play(0);
    // P2 is now in turn and P1 just played; P0's call is stale
    EXPECT_EQ(next.UnoCalls(), (std::vector<bool>{false, false, true}));
}

// ---------- Termination ----------

TEST(Hand, LastCard_EndsTheHand_AndScores)
{
    // Scenario C
    Hand h = Deal({{Wild(), Num(R, 7)}, {Num(R, 3), Num(R, 4)}}, Num(R, 5), {Num(G, 0)});

    h = h.Play(0);
    ASSERT_EQ(h.HandOf(1), Pile{Num(R, 4)});
    h = h.SayUno(1);
    EXPECT_TRUE(h.UnoCalls()[1]);
    EXPECT_FALSE(h.CheckUnoFailure(0, 1));

    h = h.Draw();
    ASSERT_EQ(h.HandOf(0), (Pile{Wild(), Num(R, 7), Num(G, 0)}));
    ASSERT_EQ(h.PlayerInTurn(), PlyrIdxT{1});

    h = h.Play(0);
    EXPECT_TRUE(h.HasEnded());
    EXPECT_FALSE(h.PlayerInTurn().has_value());
    EXPECT_EQ(h.PreviousPlayer(), PlyrIdxT{1});
    EXPECT_FALSE(h.IsAccusationWindowOpen());
    EXPECT_EQ(h.Winner(), PlyrIdxT{1});
    EXPECT_EQ(h.Score(), 57u);
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, LastCard_ForcedDrawStillLands)
{
    Hand const h = Deal({{Num(Y, 1)}, {Act(CardType::Draw, R)}, {Num(B, 1)}}, Num(R, 5), {Num(G, 9), Num(G, 8)});
    Hand const done = h.SayUno(0).SayUno(1).Play(0);

    EXPECT_TRUE(done.HasEnded());
    EXPECT_EQ(done.Winner(), PlyrIdxT{1});
    EXPECT_EQ(done.HandOf(2), (Pile{Num(B, 1), Num(G, 9), Num(G, 8)}));
    EXPECT_EQ(done.Score(), 1u + 1u + 9u + 8u);
    EXPECT_EQ(done.UnoCalls(), (std::vector<bool>{false, true, false}));
}

TEST(Hand, EndedHand_RejectsEveryTransition)
{
    Hand const done = Two({Num(R, 3)}, Num(R, 5)).Play(0);
    ASSERT_TRUE(done.HasEnded());

    EXPECT_THROW((void)done.Play(0), error::GameEndedError);
    EXPECT_THROW((void)done.Draw(), error::GameEndedError);
    EXPECT_THROW((void)done.SayUno(0), error::GameEndedError);
    EXPECT_THROW((void)done.Apply(DrawAction{ .actor = 0 }), error::GameEndedError);
    EXPECT_FALSE(done.CanPlayAny());
    EXPECT_FALSE(done.CanPlay(0));
}

// ---------- Draw ----------

TEST(Hand, Draw_UnplayableCardPassesTheTurn)
{
    Hand const next = Two({Num(G, 1), Num(G, 2)}, Num(R, 5), {Num(B, 9)}).Draw();
    EXPECT_EQ(next.HandOf(1), (Pile{Num(G, 1), Num(G, 2), Num(B, 9)}));
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_FALSE(next.IsAccusationWindowOpen());
}

TEST(Hand, Draw_PlayableCardKeepsTheTurn)
{
    Hand const next = Two({Num(G, 1), Num(G, 2)}, Num(R, 5), {Num(R, 9)}).Draw();
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_TRUE(next.CanPlay(2));

    Hand const played = next.Play(2);
    EXPECT_EQ(played.TopOfDiscard(), Num(R, 9));
    EXPECT_EQ(played.PlayerInTurn(), PlyrIdxT{0});
}

TEST(Hand, Draw_ClosesWindow_AndClearsOnlyTheDrawersCall)
{
    Hand h = Two({Num(R, 3), Num(G, 2)}, Num(R, 5), {Num(B, 9)});
    h = h.Play(0);
    ASSERT_TRUE(h.IsAccusationWindowOpen());
    h = h.SayUno(1).SayUno(0);
    ASSERT_EQ(h.UnoCalls(), (std::vector<bool>{true, true}));

    Hand const next = h.Draw();
    EXPECT_FALSE(next.IsAccusationWindowOpen());
    EXPECT_EQ(next.UnoCalls(), (std::vector<bool>{false, true}));
}

TEST(Hand, Draw_RecyclesDiscardWhenPileRunsDry)
{
    // Scenario E: eight wilds stacked on P0 leave 3 cards to draw under a blue reverse
    Pile const wilds{Wild(), Wild(), Wild(), Wild(), WildDraw(), WildDraw(), WildDraw(), WildDraw()};
    Hand h = Hand::Create(Names(2), 0, std::make_shared<StackedShuffler>(wilds), 52);

    ASSERT_EQ(h.TopOfDiscard(), Act(CardType::Reverse, B));
    ASSERT_EQ(h.DrawPile().size(), 3u);
    ASSERT_EQ(h.PlayerInTurn(), PlyrIdxT{1});
    ASSERT_EQ(h.Direction(), -1);

    h = h.Play(IndexOf(h.HandOf(1), Num(B, 1)));
    ASSERT_EQ(h.PlayerInTurn(), PlyrIdxT{0});

    h = h.Play(IndexOf(h.HandOf(0), WildDraw()), G);

    Pile const& victim = h.HandOf(1);
    ASSERT_EQ(victim.size(), 52u - 1 + 4);
    EXPECT_EQ(Pile(victim.end() - 4, victim.end()),
              (Pile{Act(CardType::Reverse, B), Act(CardType::Draw, B), Act(CardType::Draw, B), Num(B, 1)}));
    EXPECT_EQ(h.DiscardPile().size(), 1u);
    EXPECT_EQ(h.TopOfDiscard().type, CardType::WildDraw);
    EXPECT_EQ(h.TopOfDiscard().color, G);
    EXPECT_EQ(h.DrawPile(), Pile{Act(CardType::Reverse, B)});
    EXPECT_EQ(h.PlayerInTurn(), PlyrIdxT{0});
    EXPECT_EQ(TotalCards(h), constants::DeckSize);
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, Draw_RecycledWildsComeBackColorless)
{
    Hand h = Two({Wild(), Num(G, 2), Num(G, 3)}, Num(R, 5));
    h = h.Play(0, Y);
    h = h.Play(IndexOf(h.HandOf(0), Num(Y, 1)));
    ASSERT_EQ(h.DiscardPile().size(), 3u);

    // draw until the pile runs dry and the played wild goes back under
    for (int guard{}; guard < 200 && h.DiscardPile().size() > 1; ++guard)
    {
        h = h.Draw();
    }
    ASSERT_EQ(h.DiscardPile().size(), 1u);
    EXPECT_EQ(h.TopOfDiscard(), Num(Y, 1));

    auto colored_wild = [](Card const& c) { return deck::IsWildCard(c) && c.color.has_value(); };
    EXPECT_TRUE(std::ranges::none_of(h.DrawPile(), colored_wild));
    for (Pile const& p : h.Hands()) EXPECT_TRUE(std::ranges::none_of(p, colored_wild));
    EXPECT_EQ(TotalCards(h), constants::DeckSize);
    EXPECT_NO_THROW(debug::CheckInvariants(h));
}

TEST(Hand, Draw_ExhaustedDeckYieldsNothingAndPasses)
{
    Pile const wilds{Wild(), Wild(), Wild(), Wild(), WildDraw(), WildDraw(), WildDraw(), WildDraw()};
    Hand const h = Hand::Create(Names(2), 0, std::make_shared<StackedShuffler>(wilds), 53);

    // opening blue draw-two finds a single card left for P1
    ASSERT_EQ(h.TopOfDiscard(), Act(CardType::Draw, B));
    EXPECT_EQ(h.HandOf(1).size(), 54u);
    EXPECT_TRUE(h.DrawPile().empty());
    ASSERT_EQ(h.PlayerInTurn(), PlyrIdxT{0});

    Hand const next = h.Draw();
    EXPECT_EQ(next.HandOf(0).size(), 53u);
    EXPECT_EQ(next.PlayerInTurn(), PlyrIdxT{1});
    EXPECT_EQ(TotalCards(next), constants::DeckSize);
    EXPECT_NO_THROW(debug::CheckInvariants(next));
}

// ---------- Apply / snapshots ----------

TEST(Hand, Apply_ChecksTheActingSeat)
{
    Hand const h = Two({Num(R, 3), Num(G, 2)}, Num(R, 5));

    EXPECT_THROW((void)h.Apply(PlayAction{ .actor = 0, .card_idx = 0 }), error::NotPlayersTurnError);
    EXPECT_THROW((void)h.Apply(DrawAction{ .actor = 0 }), error::NotPlayersTurnError);
    EXPECT_THROW((void)h.Apply(DrawAction{ .actor = 7 }), error::PlayerIndexOutOfBoundsError);

    Hand const played = h.Apply(PlayAction{ .actor = 1, .card_idx = 0 });
    EXPECT_EQ(played.TopOfDiscard(), Num(R, 3));

    // UNO calls and accusations may come from any seat
    Hand const called = played.Apply(SayUnoAction{ .player = 1 });
    EXPECT_TRUE(called.UnoCalls()[1]);
    Hand const accused = called.Apply(AccuseAction{ .accuser = 0, .accused = 1 });
    EXPECT_EQ(accused.HandOf(1).size(), 1u);
}

TEST(Hand, Snapshot_ShowsOwnCardsAndOthersCounts)
{
    Hand const h = Two({Num(R, 3), Num(G, 2)}, Num(R, 5)).Play(0);
    auto const s = h.SnapshotFor(0);

    EXPECT_EQ(s->seat, PlyrIdxT{0});
    EXPECT_EQ(s->n_players, 2u);
    EXPECT_EQ(s->player_in_turn, PlyrIdxT{0});
    EXPECT_EQ(s->previous_player, PlyrIdxT{1});
    EXPECT_EQ(s->my_hand, h.HandOf(0));
    EXPECT_EQ(s->other_counts, (std::vector<uint8_t>{2, 1}));
    EXPECT_EQ(s->top, Num(R, 3));
    EXPECT_EQ(s->current_color, R);
    EXPECT_TRUE(s->accusation_window_open);
    EXPECT_FALSE(s->ended);
    EXPECT_EQ(s->draw_pile_size, h.DrawPile().size());
    EXPECT_EQ(s->discard_pile_size, 2u);

    EXPECT_THROW((void)h.SnapshotFor(2), error::PlayerIndexOutOfBoundsError);
}
