#ifndef UYD_TESTS_OVERRIDES__
#define UYD_TESTS_OVERRIDES__

#include "uyd_test_harness.hpp"
#include "uyd_test_fixtures.hpp"

namespace uyd::tests
{
using namespace uyd;

inline bool read_modifications()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto const & pi = *doc.find_by_id(file_id{ 700 });

    auto mods = modifications(pi);
    EXPECT(mods.ok(), "Modifications readable");
    EXPECT(mods->size() == 2, "Two entries");
    EXPECT((*mods)[0].target_id == file_id{ 1000 }, "Target id");
    EXPECT((*mods)[0].property_path == "m_Name", "Path");
    EXPECT((*mods)[0].value == "Crate (Big)", "Value");
    EXPECT((*mods)[1].object_reference == "{fileID: 0}", "Object reference");

    EXPECT(instance_name(pi) == std::optional<std::string>{ "Crate (Big)" }, "Instance name from m_Name");
    EXPECT(source_prefab_guid(pi) == std::optional<std::string>{ std::string(CRATE_GUID) }, "Source guid");
    EXPECT(transform_parent(pi) == file_id{ 801 }, "Transform parent");
    EXPECT(stripped_blocks_of(doc, file_id{ 700 }).size() == 1, "One stripped block");
    return true;
}

inline bool upsert_updates_in_place()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & pi = *doc.find_by_id(file_id{ 700 });
    size_t lines_before = pi.lines().size();

    auto r = upsert_override(pi, file_id{ 1001 }, "m_LocalPosition.x", "9");
    EXPECT(r.ok() && *r == upsert_action::updated, "Existing entry updated");
    EXPECT(pi.lines().size() == lines_before, "No lines added");
    EXPECT((*modifications(pi))[1].value == "9", "New value");
    return true;
}

inline bool upsert_appends_with_sibling_target()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & pi = *doc.find_by_id(file_id{ 700 });

    auto r = upsert_override(pi, file_id{ 1001 }, "m_LocalPosition.y", "4");
    EXPECT(r.ok() && *r == upsert_action::added, "New entry added");

    auto mods = modifications(pi).value();
    EXPECT(mods.size() == 3, "Three entries");
    EXPECT(mods[2].target == mods[1].target, "Target descriptor copied from sibling");
    EXPECT(mods[2].property_path == "m_LocalPosition.y" && mods[2].value == "4", "Entry contents");
    EXPECT(mods[2].object_reference == "{fileID: 0}", "Default object reference");

    EXPECT(removed_components(pi).value().size() == 1, "Following list intact");
    return true;
}

inline bool upsert_needs_descriptor()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & pi = *doc.find_by_id(file_id{ 700 });

    EXPECT_KIND(upsert_override(pi, file_id{ 1234 }, "m_Enabled", "0"), error_kind::not_found, "No sibling, no descriptor");

    std::string descriptor = "{fileID: 1234, guid: " + std::string(CRATE_GUID) + ", type: 3}";
    auto r = upsert_override(pi, file_id{ 1234 }, "m_Enabled", "0", std::nullopt, std::string_view(descriptor));
    EXPECT(r.ok() && *r == upsert_action::added, "Descriptor given");
    EXPECT(modifications(pi).value().back().target == descriptor, "Descriptor used");
    return true;
}

inline bool upsert_expands_empty_list()
{
    auto doc = document::from_string(
        "%YAML 1.1\n"
        "--- !u!1001 &5\n"
        "PrefabInstance:\n"
        "  m_Modification:\n"
        "    m_TransformParent: {fileID: 0}\n"
        "    m_Modifications: []\n"
        "    m_RemovedComponents: []\n"
        "  m_SourcePrefab: {fileID: 100100000, guid: 0123456789abcdef0123456789abcdef, type: 3}\n").value();
    auto & pi = *doc.find_by_id(file_id{ 5 });

    auto r = upsert_override(pi, file_id{ 7 }, "m_Name", "X", std::string_view("{fileID: 2}"), std::string_view("{fileID: 7, guid: g, type: 3}"));
    EXPECT(r.ok(), "Added to []");
    EXPECT(pi.lines()[3] == "    m_Modifications:", "List expanded");
    EXPECT(pi.lines()[4] == "    - target: {fileID: 7, guid: g, type: 3}", "Item line");
    EXPECT(pi.lines()[5] == "      propertyPath: m_Name", "Continuation indent");
    EXPECT(pi.lines()[7] == "      objectReference: {fileID: 2}", "Object reference");
    EXPECT(pi.lines()[8] == "    m_RemovedComponents: []", "Next key intact");
    return true;
}

inline bool remove_override_entry()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & pi = *doc.find_by_id(file_id{ 700 });

    EXPECT(remove_override(pi, file_id{ 1000 }, "m_Name").ok(), "Removed");
    EXPECT(modifications(pi).value().size() == 1, "One left");
    EXPECT(!instance_name(pi), "Name override gone");
    EXPECT_KIND(remove_override(pi, file_id{ 1000 }, "m_Name"), error_kind::not_found, "Already gone");
    return true;
}

inline bool removed_lists()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & pi = *doc.find_by_id(file_id{ 700 });

    std::string ref = "{fileID: 1000, guid: " + std::string(CRATE_GUID) + ", type: 3}";
    EXPECT(add_removed_game_object(pi, ref).ok(), "Add");
    EXPECT(removed_game_objects(pi).value().size() == 1, "Listed");

    std::string squeezed = "{fileID:1000,guid:" + std::string(CRATE_GUID) + ",type:3}";
    EXPECT(add_removed_game_object(pi, squeezed).ok(), "Duplicate add succeeds");
    EXPECT(removed_game_objects(pi).value().size() == 1, "Still one entry");

    EXPECT(remove_removed_game_object(pi, ref).ok(), "Remove");
    EXPECT(removed_game_objects(pi).value().empty(), "Empty again");
    EXPECT_KIND(remove_removed_game_object(pi, ref), error_kind::not_found, "Nothing to remove");

    std::string rc = "{fileID: 1002, guid: " + std::string(CRATE_GUID) + ", type: 3}";
    EXPECT(remove_removed_component(pi, rc).ok(), "Removed component entry dropped");
    EXPECT(removed_components(pi).value().empty(), "List empty");
    return true;
}

inline bool override_refusals()
{
    auto doc = load_scene(INSTANCE_SCENE);
    auto & holder = *doc.find_by_id(file_id{ 800 });
    EXPECT_KIND(upsert_override(holder, file_id{ 1 }, "m_Name", "X"), error_kind::not_found, "Not a PrefabInstance");

    auto bare = document::from_string(
        "%YAML 1.1\n--- !u!1001 &5\nPrefabInstance:\n  m_Modification:\n    m_Modifications: []\n").value();
    auto & pi = *bare.find_by_id(file_id{ 5 });
    EXPECT_KIND(add_removed_component(pi, "{fileID: 1}"), error_kind::malformed, "Missing list");
    return true;
}

inline bool resolve_instances()
{
    auto doc = load_scene(INSTANCE_SCENE);
    EXPECT(resolve_prefab_instance(doc, "700").value() == file_id{ 700 }, "By id");
    EXPECT(resolve_prefab_instance(doc, "Crate (Big)").value() == file_id{ 700 }, "By overridden name");
    EXPECT_KIND(resolve_prefab_instance(doc, "800"), error_kind::not_found, "Not an instance");
    return true;
}

inline void run_overrides_tests()
{
    SUBCAT("Reading");
    RUN_TEST(read_modifications);
    RUN_TEST(resolve_instances);

    SUBCAT("Modifications");
    RUN_TEST(upsert_updates_in_place);
    RUN_TEST(upsert_appends_with_sibling_target);
    RUN_TEST(upsert_needs_descriptor);
    RUN_TEST(upsert_expands_empty_list);
    RUN_TEST(remove_override_entry);

    SUBCAT("Removed lists");
    RUN_TEST(removed_lists);
    RUN_TEST(override_refusals);
}

}

#endif
