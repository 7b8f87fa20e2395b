// uyd_guid_resolver.hpp - Unity YAML Document (uyd) - Asset GUID lookup
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_GUID_RESOLVER_HPP
#define UYD_GUID_RESOLVER_HPP

#include "uyd_core.hpp"
#include "uyd_log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace uyd
{
    // Maps asset GUIDs to files by reading the `guid:` line of every
    // `Assets/**/*.meta`. The scan runs on the first lookup and is kept
    // until rebuild().
    class guid_resolver
    {
    public:
        explicit guid_resolver(std::filesystem::path project_root)
            : root_(std::move(project_root))
        {}

        std::filesystem::path const & root() const noexcept { return root_; }

        std::optional<std::filesystem::path> resolve(std::string_view guid);

        // Registers a mapping without touching the file system.
        void add(std::string guid, std::filesystem::path asset);

        void   rebuild();
        size_t size();

        // Nearest ancestor of `start` (inclusive) holding an Assets folder.
        static std::optional<std::filesystem::path> find_project_root(std::filesystem::path start);

        // 32 hex digit guid on a `guid:` line of meta text.
        static std::optional<std::string> guid_from_meta(std::string_view meta_text);

    private:
        std::filesystem::path                                  root_;
        std::unordered_map<std::string, std::filesystem::path> map_;
        bool                                                   scanned_ = false;

        void ensure_scanned();
        void scan();
    };

//========================================================================
// Implementation
//========================================================================

    inline std::optional<std::string> guid_resolver::guid_from_meta(std::string_view meta_text)
    {
        size_t start = 0;
        while (start <= meta_text.size())
        {
            size_t nl = meta_text.find('\n', start);
            if (nl == std::string_view::npos)
                nl = meta_text.size();

            auto line = meta_text.substr(start, nl - start);
            if (line.starts_with("guid:"))
            {
                auto v = detail::trim_sv(line.substr(5));
                if (v.size() >= 32)
                {
                    auto g = v.substr(0, 32);
                    bool hex = std::all_of(g.begin(), g.end(), [](char c)
                        { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
                    if (hex)
                        return std::string(g);
                }
            }
            start = nl + 1;
        }
        return std::nullopt;
    }

    inline std::optional<std::filesystem::path> guid_resolver::find_project_root(std::filesystem::path start)
    {
        std::error_code ec;
        auto dir = std::filesystem::absolute(start, ec);
        if (ec)
            return std::nullopt;

        if (!std::filesystem::is_directory(dir, ec))
            dir = dir.parent_path();

        while (!dir.empty())
        {
            if (std::filesystem::is_directory(dir / "Assets", ec))
                return dir;

            auto parent = dir.parent_path();
            if (parent == dir)
                break;
            dir = parent;
        }
        return std::nullopt;
    }

//------------------------------------------------------------------------

    inline std::optional<std::filesystem::path> guid_resolver::resolve(std::string_view guid)
    {
        ensure_scanned();

        auto it = map_.find(detail::to_lower(detail::trim_sv(guid)));
        if (it == map_.end())
            return std::nullopt;
        return it->second;
    }

    inline void guid_resolver::add(std::string guid, std::filesystem::path asset)
    {
        map_[detail::to_lower(guid)] = std::move(asset);
    }

    inline void guid_resolver::rebuild()
    {
        map_.clear();
        scanned_ = false;
        ensure_scanned();
    }

    inline size_t guid_resolver::size()
    {
        ensure_scanned();
        return map_.size();
    }

    inline void guid_resolver::ensure_scanned()
    {
        if (scanned_)
            return;
        scanned_ = true;
        scan();
    }

    inline void guid_resolver::scan()
    {
        namespace fs = std::filesystem;
        std::error_code ec;

        auto assets = root_ / "Assets";
        if (!fs::is_directory(assets, ec))
        {
            log::debug("no Assets folder under " + root_.string());
            return;
        }

        size_t found = 0;
        auto it = fs::recursive_directory_iterator(assets, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            auto const & entry = *it;
            std::error_code fec;
            if (!entry.is_regular_file(fec) || entry.path().extension() != ".meta")
                continue;

            std::ifstream in(entry.path(), std::ios::binary);
            if (!in)
            {
                log::warn("cannot read " + entry.path().string());
                continue;
            }

            std::ostringstream ss;
            ss << in.rdbuf();

            if (auto guid = guid_from_meta(ss.str()))
            {
                auto asset = entry.path();
                asset.replace_extension();
                map_.try_emplace(*guid, asset);
                ++found;
            }
        }

        if (ec)
            log::warn("scan of " + assets.string() + " stopped: " + ec.message());

        log::debug("indexed " + std::to_string(found) + " asset guids under " + assets.string());
    }

} // namespace uyd

#endif // UYD_GUID_RESOLVER_HPP
