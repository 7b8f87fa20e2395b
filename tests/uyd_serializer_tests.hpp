#ifndef UYD_TESTS_SERIALIZER__
#define UYD_TESTS_SERIALIZER__

#include "uyd_test_harness.hpp"
#include "uyd_test_fixtures.hpp"

namespace uyd::tests
{
using namespace uyd;

inline bool round_trip_identity()
{
    auto doc = load_scene();
    EXPECT(serialize(doc) == SCENE, "Unedited document serializes to its source");

    auto pi = load_scene(INSTANCE_SCENE);
    EXPECT(serialize(pi) == INSTANCE_SCENE, "Stripped blocks and nested sections survive");
    return true;
}

inline bool round_trip_crlf()
{
    std::string crlf;
    for (char c : SCENE)
    {
        if (c == '\n')
            crlf += '\r';
        crlf += c;
    }

    auto doc = document::from_string(crlf).value();
    EXPECT(doc.ending() == line_ending::crlf, "CRLF detected");
    EXPECT(serialize(doc) == crlf, "CRLF preserved byte for byte");
    return true;
}

inline bool round_trip_mixed_endings()
{
    std::string text =
        "%YAML 1.1\r\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "--- !u!1 &1\n"
        "GameObject:\r\n"
        "  m_Name: A\n"
        "  m_Layer: 0\r\n";

    auto doc = document::from_string(text).value();
    EXPECT(doc.ending() == line_ending::crlf, "First break decides");
    EXPECT(serialize(doc) == text, "Every line keeps its own break");

    EXPECT(set_field(*doc.find_by_id(file_id{ 1 }), "m_Name", "B").ok(), "Edit an LF line");
    EXPECT(set_field(*doc.find_by_id(file_id{ 1 }), "m_Layer", "5").ok(), "Edit a CRLF line");

    std::string expected = text;
    expected.replace(expected.find("m_Name: A"), 9, "m_Name: B");
    expected.replace(expected.find("m_Layer: 0"), 10, "m_Layer: 5");
    EXPECT(serialize(doc) == expected, "Edited lines keep their breaks");
    return true;
}

inline bool crlf_edits_follow_convention()
{
    std::string crlf;
    for (char c : SCENE)
    {
        if (c == '\n')
            crlf += '\r';
        crlf += c;
    }

    auto doc = document::from_string(crlf).value();
    editor ed(doc);
    EXPECT(ed.add_game_object("Scout", std::string_view("Enemy")).ok(), "Add under Enemy");
    EXPECT(ed.reparent("Weapon", "root").ok(), "Empty Player's child list");

    auto out = serialize(doc);
    size_t bare = 0;
    for (size_t i = 0; i < out.size(); ++i)
        if (out[i] == '\n' && (i == 0 || out[i - 1] != '\r'))
            ++bare;
    EXPECT(bare == 0, "New and rewritten lines use CRLF");
    EXPECT(out.find("  m_Children: []\r\n") != std::string::npos, "Collapsed list keeps its break");
    EXPECT(children_of(doc, file_id{ 201 }).size() == 1, "Child list read through carriage returns");
    return true;
}

inline bool round_trip_without_final_newline()
{
    std::string text(SCENE);
    text.pop_back();

    auto doc = document::from_string(text).value();
    EXPECT(!doc.final_newline(), "Missing final newline recorded");
    EXPECT(serialize(doc) == text, "No newline added");
    return true;
}

inline bool round_trip_odd_spacing()
{
    constexpr std::string_view src =
        "%YAML 1.1\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "\n"
        "--- !u!114 &-42 stripped\n"
        "MonoBehaviour:\n"
        "  m_Text: 'quoted: with colon' # note\n"
        "\n"
        "  m_List:\n"
        "    - a\n"
        "--- !u!1 &7\n"
        "GameObject:\n"
        "\n\n";

    auto doc = document::from_string(src).value();
    EXPECT(serialize(doc) == src, "Blank lines, quotes and comments preserved");
    return true;
}

inline bool save_writes_atomically()
{
    temp_dir tmp;
    auto file = tmp.write("Assets/scene.unity", SCENE);

    auto doc = document::load(file).value();
    EXPECT(set_field(*doc.find_by_id(file_id{ 200 }), "m_Name", "Boss").ok(), "Rename");
    EXPECT(doc.dirty(), "Dirty before save");

    auto written = save(doc);
    EXPECT(written.ok(), "Save should succeed");
    EXPECT(!doc.dirty(), "Clean after save");
    EXPECT(!std::filesystem::exists(file.string() + ".tmp"), "Temp file renamed away");

    auto text = read_file(file);
    EXPECT(*written == text.size(), "Byte count reported");
    EXPECT(text.find("m_Name: Boss") != std::string::npos, "Change persisted");

    auto reloaded = document::load(file);
    EXPECT(reloaded.ok() && reloaded->block_count() == 7, "Saved file reloads");
    return true;
}

inline bool save_to_missing_directory()
{
    temp_dir tmp;
    auto doc = load_scene();

    auto target = tmp.path() / "missing" / "scene.unity";
    auto r = save(doc, target);
    EXPECT_KIND(r, error_kind::io_failure, "Missing directory is an I/O failure");
    EXPECT(!std::filesystem::exists(target), "Nothing written");
    EXPECT(!std::filesystem::exists(target.string() + ".tmp"), "No temp left behind");
    return true;
}

inline bool save_without_path()
{
    auto doc = load_scene();
    EXPECT_KIND(save(doc), error_kind::io_failure, "No path to save to");
    return true;
}

inline bool validation_finds_problems()
{
    auto good = validate(load_scene(INSTANCE_SCENE));
    EXPECT(good.valid && good.problems.empty(), "Instance scene is valid");

    auto bad = document::from_string(
        "%YAML 1.1\n"
        "--- !u!1 &5\nGameObject:\n  m_Name: A\n"
        "--- !u!1 &5\nGameObject:\n  m_Name: B\n"
        "--- !u!114 &6\nMonoBehaviour:\n  m_Script: {fileID: 11500000, guid: abc123, type: 3}\n").value();

    auto report = validate(bad);
    EXPECT(!report.valid, "Problems found");
    EXPECT(report.problems.size() == 2, "Duplicate id and truncated guid");
    return true;
}

inline void run_serializer_tests()
{
    SUBCAT("Round trip");
    RUN_TEST(round_trip_identity);
    RUN_TEST(round_trip_crlf);
    RUN_TEST(round_trip_mixed_endings);
    RUN_TEST(crlf_edits_follow_convention);
    RUN_TEST(round_trip_without_final_newline);
    RUN_TEST(round_trip_odd_spacing);

    SUBCAT("Saving");
    RUN_TEST(save_writes_atomically);
    RUN_TEST(save_to_missing_directory);
    RUN_TEST(save_without_path);

    SUBCAT("Validation");
    RUN_TEST(validation_finds_problems);
}

}

#endif
