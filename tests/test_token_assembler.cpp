#include <cassert>
#include <chrono>
#include <string>
#include "transcript/token_assembler.hpp"

static Token partial(const std::string& text) {
    Token t;
    t.text = text;
    t.isFinal = false;
    return t;
}

static Token final_(const std::string& text) {
    Token t;
    t.text = text;
    t.isFinal = true;
    return t;
}

int main() {
    // Partials replace each other, the final settles them
    {
        TranscriptState s;
        s = transcript::reduce(s, partial("he"));
        assert(transcript::render(s) == "he");
        s = transcript::reduce(s, partial("hell"));
        assert(transcript::render(s) == "hell");
        s = transcript::reduce(s, partial("hello"));
        assert(s.wordCount == 0);
        s = transcript::reduce(s, final_("hello "));
        assert(transcript::render(s) == "hello ");
        assert(s.wordCount == 1);
        assert(!s.partial);
    }

    // Finalized segments are never altered by later tokens
    {
        TranscriptState s;
        s = transcript::reduce(s, final_("good"));
        s = transcript::reduce(s, final_("  morning  "));
        const TranscriptState before = s;
        s = transcript::reduce(s, partial("every"));
        s = transcript::reduce(s, partial("everyone"));
        assert(s.finalized == before.finalized);
        assert(transcript::render(s) == "good morning everyone");
        assert(transcript::finalText(s) == "good morning ");
        s = transcript::reduce(s, final_("everyone"));
        assert(s.finalized.size() == 3);
        assert(s.finalized[0] == "good " && s.finalized[1] == "morning ");
        assert(s.wordCount == 3);
    }

    // An empty final clears the partial without adding a segment
    {
        TranscriptState s;
        s = transcript::reduce(s, partial("uh"));
        s = transcript::reduce(s, final_("   "));
        assert(s.finalized.empty());
        assert(!s.partial);
        assert(transcript::render(s).empty());
    }

    // Word counting splits on any whitespace
    assert(transcript::countWords("") == 0);
    assert(transcript::countWords("  one\ttwo\nthree  ") == 3);

    // Stats view
    {
        TranscriptState s;
        s = transcript::reduce(s, final_("one two"));
        s = transcript::reduce(s, partial("three"));
        const TranscriptStats st = transcript::stats(s, std::chrono::milliseconds(2500), 4096);
        assert(st.elapsedSeconds == 2);
        assert(st.wordCount == 2);
        assert(st.bytesSent == 4096);
    }

    // Thread-safe owner
    {
        TokenAssembler assembler;
        assembler.apply(partial("hi"));
        assembler.apply(final_("hi there"));
        assert(assembler.render() == "hi there ");
        assert(assembler.snapshot().wordCount == 2);
        assembler.reset();
        assert(assembler.render().empty());
        assert(assembler.snapshot().finalized.empty());
    }

    return 0;
}
