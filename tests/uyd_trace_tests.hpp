#ifndef UYD_TESTS_TRACE__
#define UYD_TESTS_TRACE__

#include "uyd_test_harness.hpp"
#include "uyd_test_fixtures.hpp"

#include <set>
#include <utility>

namespace uyd::tests
{
using namespace uyd;

    // Three behaviours referencing each other in a ring: 1 -> 2 -> 3 -> 1.
    constexpr std::string_view RING =
        "%YAML 1.1\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "--- !u!114 &1\n"
        "MonoBehaviour:\n"
        "  m_Script: {fileID: 11500000, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "  m_Next: {fileID: 2}\n"
        "--- !u!114 &2\n"
        "MonoBehaviour:\n"
        "  m_Next: {fileID: 3}\n"
        "--- !u!114 &3\n"
        "MonoBehaviour:\n"
        "  m_Next: {fileID: 1}\n"
        "  m_Self: {fileID: 3}\n";

inline bool trace_outgoing_ring()
{
    auto doc = load_scene(RING);
    auto r = trace(doc, file_id{ 1 }, direction::outgoing, 10);
    EXPECT(r.ok(), "Trace should succeed");
    EXPECT(r->size() == 3, "One edge per link of the ring");

    auto const & e = *r;
    EXPECT(e[0].source == file_id{ 1 } && e[0].target == file_id{ 2 } && e[0].depth == 1, "First hop");
    EXPECT(e[1].source == file_id{ 2 } && e[1].target == file_id{ 3 } && e[1].depth == 2, "Second hop");
    EXPECT(e[2].source == file_id{ 3 } && e[2].target == file_id{ 1 } && e[2].depth == 3, "Ring closes");
    EXPECT(e[0].source_class == classes::mono_behaviour, "Classes attached");
    return true;
}

inline bool trace_both_terminates()
{
    auto doc = load_scene(RING);
    auto r = trace(doc, file_id{ 1 }, direction::both, 5);
    EXPECT(r.ok(), "Trace should succeed");
    EXPECT(r->size() == 3, "Each link of the ring reported once");

    std::set<std::pair<file_id, file_id>> pairs;
    for (auto const & e : *r)
    {
        EXPECT(e.source != e.target, "Self references skipped");
        pairs.insert({ e.source, e.target });
    }
    EXPECT(pairs.size() == r->size(), "No edge repeated at a deeper level");

    // 1 reaches 2 outward and 3 inward at the first level; 2 -> 3 is the only new link after that.
    auto const & e = *r;
    EXPECT(e[0].source == file_id{ 1 } && e[0].target == file_id{ 2 } && e[0].depth == 1, "Outgoing first hop");
    EXPECT(e[1].source == file_id{ 3 } && e[1].target == file_id{ 1 } && e[1].depth == 1, "Incoming first hop");
    EXPECT(e[2].source == file_id{ 2 } && e[2].target == file_id{ 3 } && e[2].depth == 2, "Closing link at depth 2");
    return true;
}

inline bool trace_incoming()
{
    auto doc = load_scene(RING);
    auto r = trace(doc, file_id{ 1 }, direction::incoming, 1);
    EXPECT(r.ok() && r->size() == 1, "One referrer");
    EXPECT((*r)[0].source == file_id{ 3 } && (*r)[0].target == file_id{ 1 }, "3 points at 1");

    auto scene = load_scene();
    auto in = trace(scene, file_id{ 100 }, direction::incoming, 1);
    EXPECT(in.ok() && in->size() == 2, "Transform and Rigidbody point at Player");
    return true;
}

inline bool trace_bounds()
{
    auto doc = load_scene(RING);
    auto none = trace(doc, file_id{ 1 }, direction::outgoing, 0);
    EXPECT(none.ok() && none->empty(), "Depth 0 yields nothing");

    auto one = trace(doc, file_id{ 1 }, direction::outgoing, 1);
    EXPECT(one.ok() && one->size() == 1, "Script guid reference not followed");

    EXPECT_KIND(trace(doc, file_id{ 99 }, direction::both, 3), error_kind::not_found, "Unknown start");
    return true;
}

inline bool direction_names()
{
    EXPECT(direction_from_name("out") == std::optional<direction>{ direction::outgoing }, "Short form");
    EXPECT(direction_from_name("Incoming") == std::optional<direction>{ direction::incoming }, "Case insensitive");
    EXPECT(direction_from_name(" both ") == std::optional<direction>{ direction::both }, "Trimmed");
    EXPECT(!direction_from_name("sideways"), "Unknown name");
    return true;
}

inline void run_trace_tests()
{
    SUBCAT("Walks");
    RUN_TEST(trace_outgoing_ring);
    RUN_TEST(trace_both_terminates);
    RUN_TEST(trace_incoming);

    SUBCAT("Limits");
    RUN_TEST(trace_bounds);
    RUN_TEST(direction_names);
}

}

#endif
