#ifndef UYD_TESTS_TOKENIZER__
#define UYD_TESTS_TOKENIZER__

#include "uyd_test_harness.hpp"
#include "uyd_test_fixtures.hpp"

namespace uyd::tests
{
using namespace uyd;

inline bool header_basic()
{
    auto h = parse_header("--- !u!4 &101");
    EXPECT(h.has_value(), "Header should parse");
    EXPECT(h->cls == 4, "Class id should be 4");
    EXPECT(h->id == file_id{ 101 }, "File id should be 101");
    EXPECT(!h->stripped, "Plain header is not stripped");
    return true;
}

inline bool header_stripped_and_negative()
{
    auto s = parse_header("--- !u!4 &701 stripped");
    EXPECT(s && s->stripped, "Stripped suffix should be recognised");

    auto n = parse_header("--- !u!114 &-8679921383154817045");
    EXPECT(n.has_value(), "Negative ids are valid");
    EXPECT(n->id.val == -8679921383154817045LL, "Negative id value");
    return true;
}

inline bool header_rejects_garbage()
{
    EXPECT(!parse_header("--- !u!x &1"), "Non-numeric class");
    EXPECT(!parse_header("--- !u!1 1"), "Missing anchor");
    EXPECT(!parse_header("--- !u!1 &12abc"), "Trailing junk after id");
    EXPECT(!parse_header("GameObject:"), "Not a header");
    return true;
}

inline bool header_rebuild()
{
    block_header h{ 1, file_id{ 42 }, true };
    EXPECT(make_header_line(h) == "--- !u!1 &42 stripped", "Header line text");
    return true;
}

inline bool split_preamble_and_blocks()
{
    auto ctx = tokenize(SCENE);
    auto const & ts = ctx.result;

    EXPECT(ctx.errors.empty(), "No diagnostics expected");
    EXPECT(ts.preamble.size() == 2, "Two preamble lines");
    EXPECT(ts.blocks.size() == 7, "Seven blocks");
    EXPECT(ts.blocks[0].header.id == file_id{ 100 }, "First block is 100");
    EXPECT(ts.blocks[0].body.front() == "GameObject:", "Body starts with the type line");
    EXPECT(ts.blocks[1].source_line == 14, "Transform 101 header is on line 14");
    EXPECT(ts.ending == line_ending::lf, "LF file");
    EXPECT(ts.final_newline, "Trailing newline recorded");
    return true;
}

inline bool crlf_detection()
{
    auto ctx = tokenize("%YAML 1.1\r\n--- !u!1 &1\r\nGameObject:\r\n  m_Name: A\r\n");
    auto const & ts = ctx.result;

    EXPECT(ts.ending == line_ending::crlf, "CRLF detected from first break");
    EXPECT(ts.blocks.size() == 1, "One block");
    EXPECT(ts.blocks[0].body[1] == "  m_Name: A\r", "Carriage return kept in the line");
    EXPECT(ts.blocks[0].header.id == file_id{ 1 }, "Header parsed through the carriage return");
    return true;
}

inline bool bad_header_kept_as_body()
{
    auto ctx = tokenize("%YAML 1.1\n--- !u!1 &1\nGameObject:\n--- !u!oops &2\n  m_Name: A\n");

    EXPECT(ctx.errors.size() == 1, "One diagnostic");
    EXPECT(ctx.errors[0].line == 4, "Diagnostic on line 4");
    EXPECT(ctx.result.blocks.size() == 1, "Bad header does not open a block");
    EXPECT(ctx.result.blocks[0].body.size() == 3, "Bad header line stays in the body");
    return true;
}

inline bool no_blocks()
{
    auto ctx = tokenize("%YAML 1.1\nfoo: bar\n");
    EXPECT(ctx.result.blocks.empty(), "No anchors means no blocks");
    EXPECT(ctx.result.preamble.size() == 2, "Everything is preamble");
    return true;
}

inline void run_tokenizer_tests()
{
    SUBCAT("Headers");
    RUN_TEST(header_basic);
    RUN_TEST(header_stripped_and_negative);
    RUN_TEST(header_rejects_garbage);
    RUN_TEST(header_rebuild);

    SUBCAT("Splitting");
    RUN_TEST(split_preamble_and_blocks);
    RUN_TEST(crlf_detection);
    RUN_TEST(bad_header_kept_as_body);
    RUN_TEST(no_blocks);
}

}

#endif
