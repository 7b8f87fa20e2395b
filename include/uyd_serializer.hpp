// uyd_serializer.hpp - Unity YAML Document (uyd) - Serializer
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_SERIALIZER_HPP
#define UYD_SERIALIZER_HPP

#include "uyd_core.hpp"
#include "uyd_document.hpp"
#include "uyd_log.hpp"

#include <filesystem>
#include <fstream>

namespace uyd
{
    //========================================================================
    // SERIALIZER API
    //========================================================================

    // Preamble, then every block in sequence order, with the line ending
    // and final newline the text was loaded with.
    std::string serialize(document const & doc);

    // Atomic: writes `<target>.tmp` beside the target and renames it over.
    // Returns the number of bytes written. Uses the document's own path
    // when none is given.
    result<size_t> save(document & doc, std::filesystem::path const & target = {});

    struct validation_report
    {
        bool                     valid = true;
        std::vector<std::string> problems;
    };

    // Signature present, GUIDs not truncated, file IDs unique.
    validation_report validate(document const & doc);

    //========================================================================
    // SERIALIZER IMPLEMENTATION
    //========================================================================

    namespace detail
    {
        class serializer_impl
        {
        public:
            explicit serializer_impl(document const & doc)
                : doc_(doc)
            {}

            std::string run()
            {
                first_ = true;
                out_.clear();

                for (auto const & l : doc_.preamble())
                    emit(l);

                for (auto const & b : doc_.blocks())
                {
                    emit(b.header_line());
                    for (auto const & l : b.lines())
                        emit(l);
                }

                if (doc_.final_newline() && !first_)
                    out_ += '\n';

                return std::move(out_);
            }

        private:
            document const &  doc_;
            std::string       out_;
            bool              first_ = true;

            void emit(std::string const & line)
            {
                if (!first_)
                    out_ += '\n';
                out_ += line;
                first_ = false;
            }
        };

        inline result<size_t> atomic_write(std::filesystem::path const & target, std::string const & content)
        {
            namespace fs = std::filesystem;
            std::error_code ec;

            auto dir = target.parent_path();
            if (!dir.empty() && !fs::is_directory(dir, ec))
                return make_error(error_kind::io_failure, "Directory does not exist: " + dir.string());

            fs::path tmp = target.string() + ".tmp";

            {
                std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
                if (!out)
                {
                    log::warn("failed to open temp file '" + tmp.string() + "' for writing");
                    return make_error(error_kind::io_failure, "Cannot write " + tmp.string());
                }

                out.write(content.data(), static_cast<std::streamsize>(content.size()));
                out.flush();
                if (!out)
                {
                    log::warn("stream error while writing temp '" + tmp.string() + "'");
                    out.close();
                    fs::remove(tmp, ec);
                    return make_error(error_kind::io_failure, "Write failed for " + tmp.string());
                }
            }

            fs::rename(tmp, target, ec);
            if (ec)
            {
                log::warn("rename('" + tmp.string() + "' -> '" + target.string() + "') failed: " + ec.message());
                std::error_code ignored;
                fs::remove(tmp, ignored);
                return make_error(error_kind::io_failure, "Cannot replace " + target.string() + ": " + ec.message());
            }

            return content.size();
        }

        // `guid:` followed by fewer than 30 hex digits.
        inline bool has_truncated_guid(std::string_view line)
        {
            constexpr std::string_view key = "guid:";
            size_t pos = 0;
            while ((pos = line.find(key, pos)) != std::string_view::npos)
            {
                pos += key.size();
                while (pos < line.size() && line[pos] == ' ')
                    ++pos;

                size_t n = 0;
                while (pos + n < line.size() && std::isxdigit(static_cast<unsigned char>(line[pos + n])))
                    ++n;

                bool word_end = pos + n == line.size() || !std::isalnum(static_cast<unsigned char>(line[pos + n]));
                if (n > 0 && n < 30 && word_end)
                    return true;
            }
            return false;
        }

    } // namespace detail

    //========================================================================
    // Public API
    //========================================================================

    inline std::string serialize(document const & doc)
    {
        detail::serializer_impl s(doc);
        return s.run();
    }

    inline result<size_t> save(document & doc, std::filesystem::path const & target)
    {
        auto path = target.empty() ? doc.path() : target;
        if (path.empty())
            return make_error(error_kind::io_failure,
                "No file path specified and document was not loaded from a file");

        auto written = detail::atomic_write(path, serialize(doc));
        if (!written)
            return written;

        doc.clear_dirty();
        log::debug("saved " + path.string() + " (" + std::to_string(*written) + " bytes)");
        return written;
    }

    inline validation_report validate(document const & doc)
    {
        validation_report report;
        auto fail = [&](std::string msg)
        {
            report.valid = false;
            report.problems.push_back(std::move(msg));
        };

        bool signed_ok = false;
        for (auto const & l : doc.preamble())
        {
            if (detail::is_blank(l))
                continue;
            signed_ok = l.starts_with(detail::YAML_SIGNATURE);
            break;
        }
        if (!signed_ok)
            fail("Missing or invalid YAML header");

        std::unordered_set<file_id> seen;
        for (auto const & b : doc.blocks())
        {
            if (!seen.insert(b.id()).second)
                fail("Duplicate fileID " + to_string(b.id()));

            for (auto const & l : b.lines())
            {
                if (detail::has_truncated_guid(l))
                {
                    fail("Invalid GUID format in block " + to_string(b.id()) + ": " + std::string(detail::trim_sv(l)));
                    break;
                }
            }
        }
        return report;
    }

} // namespace uyd

#endif // UYD_SERIALIZER_HPP
