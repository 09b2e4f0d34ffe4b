// tests/test-split/main.cpp
//
// Manual inspection of a split plan:
//   test-split --chunk-limit 40 hello mesh world, this is a longer reply
// Prints every pass decision the resolver made and each chunk with its cut kind.
#include <iostream>
#include <string>
#include <vector>

#include "CLI/CLI11.hpp"

#include "meshsplit/message_splitter.hpp"
#include "meshsplit/segment_message.hpp"

using namespace meshsplit;

static const char* kind(CutKind k) {
    switch (k) {
        case CutKind::Tail:            return "tail";
        case CutKind::WordBoundaryCut: return "word";
        case CutKind::ForcedCut:       return "forced";
    }
    return "?";
}

int main(int argc, char** argv) {
    SplitLimits limits;
    std::vector<std::string> words;

    CLI::App app{"meshsplit plan inspector"};
    app.add_option("--total-limit", limits.total_limit, "Characters kept")->capture_default_str();
    app.add_option("--chunk-limit", limits.chunk_limit, "Characters per chunk")->capture_default_str();
    app.add_option("text", words, "Message words")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // 1) Build a single raw string out of the positional words
    std::string raw;
    for (size_t i = 0; i < words.size(); ++i) {
        raw += words[i];
        if (i + 1 < words.size()) raw += ' ';
    }

    // 2) Split it
    HostChunkPlan plan;
    const SplitStatus st = split_message(raw.data(), raw.size(), limits, plan);
    if (st != SplitStatus::Ok) {
        std::cerr << "status=error reason=" << status_reason(st) << "\n";
        return 2;
    }

    // 3) Plan summary
    std::cout << "Input:   " << raw.size() << " chars" << (plan.clipped ? " (clipped)" : "") << "\n";
    std::cout << "Chunks:  " << plan.count() << "\n";
    std::cout << "Passes:  " << unsigned(plan.passes) << (plan.converged ? "" : " (fallback reservation)") << "\n";
    std::cout << "Marker:  " << plan.marker_width << " chars, body budget " << plan.body_budget << "\n\n";

    // 4) Chunks
    std::vector<std::string> chunks;
    render_all(plan, chunks);
    for (size_t i = 0; i < chunks.size(); ++i) {
        std::cout << "  [" << kind(plan.fragments[i].cut) << ", " << chunks[i].size() << "] "
                  << chunks[i] << "\n";
    }
    return 0;
}
