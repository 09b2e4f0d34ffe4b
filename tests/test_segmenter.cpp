#include <doctest/doctest.h>
#include <string>
#include <vector>
#include "meshsplit/segmenter.hpp"
using namespace meshsplit;

static std::string span(const char* text, const Fragment& f) {
    return std::string(text + f.offset, f.length);
}

static std::string rejoin(const char* text, const FragmentList& frags) {
    std::string s;
    for (const auto& f : frags) s += span(text, f);
    return s;
}

TEST_CASE("next_cut: remaining text that fits is the Tail") {
    Cut c = next_cut("world", 5, 8);
    CHECK(c.kind == CutKind::Tail);
    CHECK(c.length == 5);
}

TEST_CASE("next_cut: budget 0 consumes nothing") {
    Cut c = next_cut("abc", 3, 0);
    CHECK(c.kind == CutKind::ForcedCut);
    CHECK(c.length == 0);
}

TEST_CASE("forced_cut_width: margin is min(10, budget/2), never below 1") {
    CHECK(forced_cut_width(230) == 220);
    CHECK(forced_cut_width(224) == 214);
    CHECK(forced_cut_width(20) == 10);
    CHECK(forced_cut_width(8) == 4);
    CHECK(forced_cut_width(1) == 1);
}

TEST_CASE("segment: word boundaries keep the whitespace with the left fragment") {
    const char* text = "hello mesh world";
    FragmentList frags;
    REQUIRE(segment(text, 16, 8, frags));
    REQUIRE(frags.size() == 3);
    CHECK(span(text, frags[0]) == "hello ");
    CHECK(frags[0].cut == CutKind::WordBoundaryCut);
    CHECK(span(text, frags[1]) == "mesh ");
    CHECK(frags[1].cut == CutKind::WordBoundaryCut);
    CHECK(span(text, frags[2]) == "world");
    CHECK(frags[2].cut == CutKind::Tail);
}

TEST_CASE("segment: whitespace at index budget-1 is used") {
    const char* text = "abc defg";
    FragmentList frags;
    REQUIRE(segment(text, 8, 4, frags));
    REQUIRE(frags.size() == 2);
    CHECK(span(text, frags[0]) == "abc ");
    CHECK(span(text, frags[1]) == "defg");
}

TEST_CASE("segment: whitespace below budget/2 is ignored in favour of a forced cut") {
    const char* text = "a bcdefghij";
    FragmentList frags;
    REQUIRE(segment(text, 11, 8, frags));
    CHECK(frags[0].cut == CutKind::ForcedCut);
    CHECK(span(text, frags[0]) == "a bc");
    CHECK(rejoin(text, frags) == text);
}

TEST_CASE("segment: a giant word is chunked at the forced width") {
    std::string text(20, 'a');
    FragmentList frags;
    REQUIRE(segment(text.c_str(), text.size(), 8, frags));
    REQUIRE(frags.size() == 4);
    CHECK(frags[0].length == 4);
    CHECK(frags[1].length == 4);
    CHECK(frags[2].length == 4);
    CHECK(frags[3].length == 8);
    CHECK(frags[3].cut == CutKind::Tail);
}

TEST_CASE("segment: every fragment fits and the concatenation is the input") {
    std::string text;
    for (int i = 0; i < 60; ++i) text += (i % 7 == 0) ? "supercalifragilistic " : "word ";
    FragmentList frags;
    REQUIRE(segment(text.c_str(), text.size(), 40, frags));
    for (const auto& f : frags) CHECK(f.length <= 40);
    for (size_t i = 0; i + 1 < frags.size(); ++i) CHECK(frags[i].length > 0);
    CHECK(rejoin(text.c_str(), frags) == text);
}

TEST_CASE("segment: empty text yields one empty Tail") {
    FragmentList frags;
    REQUIRE(segment("", 0, 10, frags));
    REQUIRE(frags.size() == 1);
    CHECK(frags[0].length == 0);
    CHECK(frags[0].cut == CutKind::Tail);
}

TEST_CASE("segment: refuses budget 0 and reports a full table") {
    FragmentList frags;
    CHECK_FALSE(segment("abc", 3, 0, frags));

    std::string text(MAX_CHUNKS * 4 + 40, 'x');
    CHECK_FALSE(segment(text.c_str(), text.size(), 2, frags));
}

TEST_CASE("segment: a std::vector store has no table limit") {
    std::string text(MAX_CHUNKS * 4 + 40, 'x');
    std::vector<Fragment> frags;
    REQUIRE(segment(text.c_str(), text.size(), 2, frags));
    CHECK(frags.size() == text.size() - 1);     // width-1 forced cuts, 2-char Tail
    CHECK(frags.back().cut == CutKind::Tail);
    CHECK(frags.back().length == 2);
}
