#include <doctest/doctest.h>
#include "meshsplit/truncator.hpp"
using namespace meshsplit;

TEST_CASE("text_length: counts up to NUL; nullptr is empty") {
    CHECK(text_length("mesh") == 4);
    CHECK(text_length("") == 0);
    CHECK(text_length(nullptr) == 0);
}

TEST_CASE("truncate: text within the limit passes through untouched") {
    const char* msg = "short reply";
    TruncatedText t = truncate(msg, 11, 1000);
    CHECK(t.data == msg);
    CHECK(t.length == 11);
    CHECK_FALSE(t.clipped);
}

TEST_CASE("truncate: text exactly at the limit is not clipped") {
    TruncatedText t = truncate("abcdef", 6, 6);
    CHECK(t.length == 6);
    CHECK_FALSE(t.clipped);
}

TEST_CASE("truncate: longer text is hard-cut to a prefix, mid-word if needed") {
    const char* msg = "hello mesh world";
    TruncatedText t = truncate(msg, 16, 8);
    CHECK(t.data == msg);            // prefix view, no copy
    CHECK(t.length == 8);            // "hello me"
    CHECK(t.clipped);
}

TEST_CASE("truncate: nullptr yields an empty message") {
    TruncatedText t = truncate(nullptr, 5, 10);
    CHECK(t.length == 0);
    CHECK(t.data != nullptr);
    CHECK_FALSE(t.clipped);
}
