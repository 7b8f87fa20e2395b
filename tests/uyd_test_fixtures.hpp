#ifndef UYD_TESTS_FIXTURES__
#define UYD_TESTS_FIXTURES__

#include "../include/uyd.hpp"

#include <filesystem>
#include <fstream>
#include <random>

namespace uyd::tests
{
    // Player(100) with a Rigidbody and a child Weapon(300); Enemy(200) at root.
    constexpr std::string_view SCENE =
        "%YAML 1.1\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "--- !u!1 &100\n"
        "GameObject:\n"
        "  m_ObjectHideFlags: 0\n"
        "  serializedVersion: 6\n"
        "  m_Component:\n"
        "  - component: {fileID: 101}\n"
        "  - component: {fileID: 102}\n"
        "  m_Layer: 3\n"
        "  m_Name: Player\n"
        "  m_TagString: Player\n"
        "  m_IsActive: 1\n"
        "--- !u!4 &101\n"
        "Transform:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 100}\n"
        "  m_LocalRotation: {x: 0, y: 0, z: 0, w: 1}\n"
        "  m_LocalPosition: {x: 1, y: 2, z: 3}\n"
        "  m_LocalScale: {x: 1, y: 1, z: 1}\n"
        "  m_Children:\n"
        "  - {fileID: 301}\n"
        "  m_Father: {fileID: 0}\n"
        "  m_RootOrder: 0\n"
        "--- !u!54 &102\n"
        "Rigidbody:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 100}\n"
        "  m_Mass: 1\n"
        "  m_Drag: 0 # air\n"
        "--- !u!1 &200\n"
        "GameObject:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_Component:\n"
        "  - component: {fileID: 201}\n"
        "  m_Layer: 0\n"
        "  m_Name: Enemy\n"
        "  m_TagString: Untagged\n"
        "  m_IsActive: 1\n"
        "--- !u!4 &201\n"
        "Transform:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 200}\n"
        "  m_LocalPosition: {x: 0, y: 0, z: 0}\n"
        "  m_Children: []\n"
        "  m_Father: {fileID: 0}\n"
        "  m_RootOrder: 1\n"
        "--- !u!1 &300\n"
        "GameObject:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_Component:\n"
        "  - component: {fileID: 301}\n"
        "  m_Layer: 3\n"
        "  m_Name: Weapon\n"
        "  m_TagString: Untagged\n"
        "  m_IsActive: 0\n"
        "--- !u!4 &301\n"
        "Transform:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 300}\n"
        "  m_LocalPosition: {x: 0, y: 0, z: 0}\n"
        "  m_Children: []\n"
        "  m_Father: {fileID: 101}\n"
        "  m_RootOrder: 0\n";

    constexpr std::string_view CRATE_GUID = "0123456789abcdef0123456789abcdef";

    // Crate prefab: root GameObject 1000, Transform 1001, BoxCollider 1002.
    constexpr std::string_view CRATE_PREFAB =
        "%YAML 1.1\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "--- !u!1 &1000\n"
        "GameObject:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_CorrespondingSourceObject: {fileID: 0}\n"
        "  m_PrefabInstance: {fileID: 0}\n"
        "  m_PrefabAsset: {fileID: 0}\n"
        "  m_Component:\n"
        "  - component: {fileID: 1001}\n"
        "  - component: {fileID: 1002}\n"
        "  m_Layer: 0\n"
        "  m_Name: Crate\n"
        "  m_IsActive: 1\n"
        "--- !u!4 &1001\n"
        "Transform:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_CorrespondingSourceObject: {fileID: 0}\n"
        "  m_PrefabInstance: {fileID: 0}\n"
        "  m_PrefabAsset: {fileID: 0}\n"
        "  m_GameObject: {fileID: 1000}\n"
        "  m_LocalPosition: {x: 0, y: 0, z: 0}\n"
        "  m_Children: []\n"
        "  m_Father: {fileID: 0}\n"
        "  m_RootOrder: 0\n"
        "--- !u!65 &1002\n"
        "BoxCollider:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 1000}\n"
        "  m_Size: {x: 1, y: 1, z: 1}\n";

    // Holder(800) parents an instance (700) of the crate with a stripped
    // Transform stand-in (701).
    constexpr std::string_view INSTANCE_SCENE =
        "%YAML 1.1\n"
        "%TAG !u! tag:unity3d.com,2011:\n"
        "--- !u!1 &800\n"
        "GameObject:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_Component:\n"
        "  - component: {fileID: 801}\n"
        "  m_Layer: 0\n"
        "  m_Name: Holder\n"
        "  m_IsActive: 1\n"
        "--- !u!4 &801\n"
        "Transform:\n"
        "  m_ObjectHideFlags: 0\n"
        "  m_GameObject: {fileID: 800}\n"
        "  m_LocalPosition: {x: 0, y: 0, z: 0}\n"
        "  m_Children:\n"
        "  - {fileID: 701}\n"
        "  m_Father: {fileID: 0}\n"
        "  m_RootOrder: 0\n"
        "--- !u!1001 &700\n"
        "PrefabInstance:\n"
        "  m_ObjectHideFlags: 0\n"
        "  serializedVersion: 2\n"
        "  m_Modification:\n"
        "    serializedVersion: 3\n"
        "    m_TransformParent: {fileID: 801}\n"
        "    m_Modifications:\n"
        "    - target: {fileID: 1000, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "      propertyPath: m_Name\n"
        "      value: Crate (Big)\n"
        "      objectReference: {fileID: 0}\n"
        "    - target: {fileID: 1001, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "      propertyPath: m_LocalPosition.x\n"
        "      value: 7\n"
        "      objectReference: {fileID: 0}\n"
        "    m_RemovedComponents:\n"
        "    - {fileID: 1002, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "    m_RemovedGameObjects: []\n"
        "    m_AddedGameObjects: []\n"
        "    m_AddedComponents: []\n"
        "  m_SourcePrefab: {fileID: 100100000, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "--- !u!4 &701 stripped\n"
        "Transform:\n"
        "  m_CorrespondingSourceObject: {fileID: 1001, guid: 0123456789abcdef0123456789abcdef, type: 3}\n"
        "  m_PrefabInstance: {fileID: 700}\n"
        "  m_PrefabAsset: {fileID: 0}\n";

    inline document load_scene(std::string_view text = SCENE)
    {
        return document::from_string(text).value();
    }

    // Scratch directory removed on scope exit.
    class temp_dir
    {
    public:
        temp_dir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() / ("uyd_test_" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~temp_dir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        temp_dir(temp_dir const &) = delete;
        temp_dir & operator=(temp_dir const &) = delete;

        std::filesystem::path const & path() const { return path_; }

        std::filesystem::path write(std::filesystem::path const & rel, std::string_view content) const
        {
            auto full = path_ / rel;
            std::filesystem::create_directories(full.parent_path());
            std::ofstream out(full, std::ios::binary | std::ios::trunc);
            out.write(content.data(), static_cast<std::streamsize>(content.size()));
            return full;
        }

    private:
        std::filesystem::path path_;
    };

    inline std::string read_file(std::filesystem::path const & p)
    {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
}

#endif
