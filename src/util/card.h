#pragma once

#include <string>

enum { CLUB, DIAMOND, HEART, SPADE, SUITS };

static const int RANKS = 13;
static const int CARDS = 52;

inline int get_rank(const int card)
{
    return card >> 2;
}

inline int get_suit(const int card)
{
    return card & 3;
}

inline int get_card(const int rank, const int suit)
{
    return rank << 2 | suit;
}

// position of the card in a suit-major deck (2C 3C .. AC 2D .. AS)
inline int get_deck_index(const int card)
{
    return get_suit(card) * RANKS + get_rank(card);
}

inline const std::string get_card_string(const int card)
{
    if (card < 0 || card >= CARDS)
        return "?";

    std::string s(2, 0);

    switch (get_rank(card))
    {
    case 0: s[0] = '2'; break;
    case 1: s[0] = '3'; break;
    case 2: s[0] = '4'; break;
    case 3: s[0] = '5'; break;
    case 4: s[0] = '6'; break;
    case 5: s[0] = '7'; break;
    case 6: s[0] = '8'; break;
    case 7: s[0] = '9'; break;
    case 8: s[0] = 'T'; break;
    case 9: s[0] = 'J'; break;
    case 10: s[0] = 'Q'; break;
    case 11: s[0] = 'K'; break;
    case 12: s[0] = 'A'; break;
    }

    switch (get_suit(card))
    {
    case CLUB: s[1] = 'C'; break;
    case DIAMOND: s[1] = 'D'; break;
    case HEART: s[1] = 'H'; break;
    case SPADE: s[1] = 'S'; break;
    }

    return s;
}

inline int string_to_rank(const std::string& s)
{
    if (s.empty())
        return -1;

    int rank;

    switch (s[0])
    {
    case '2': rank = 0; break;
    case '3': rank = 1; break;
    case '4': rank = 2; break;
    case '5': rank = 3; break;
    case '6': rank = 4; break;
    case '7': rank = 5; break;
    case '8': rank = 6; break;
    case '9': rank = 7; break;
    case 'T': rank = 8; break;
    case 'J': rank = 9; break;
    case 'Q': rank = 10; break;
    case 'K': rank = 11; break;
    case 'A': rank = 12; break;
    default: rank = -1;
    }

    return rank;
}

inline int string_to_suit(const char c)
{
    switch (c)
    {
    case 'C': case 'c': return CLUB;
    case 'D': case 'd': return DIAMOND;
    case 'H': case 'h': return HEART;
    case 'S': case 's': return SPADE;
    default: return -1;
    }
}

// parses exactly one two-character token, -1 on error
inline int string_to_card(const std::string& s)
{
    if (s.size() != 2)
        return -1;

    const int rank = string_to_rank(s);

    if (rank == -1)
        return -1;

    const int suit = string_to_suit(s[1]);

    if (suit == -1)
        return -1;

    return get_card(rank, suit);
}
