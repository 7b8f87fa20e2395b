// uyd_document.hpp - Unity YAML Document (uyd) - Authoritative Document Model
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_DOCUMENT_HPP
#define UYD_DOCUMENT_HPP

#include "uyd_core.hpp"
#include "uyd_log.hpp"
#include "uyd_tokenizer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <random>
#include <unordered_map>
#include <unordered_set>

namespace uyd
{
//========================================================================
// Block
//========================================================================

    // One `--- !u!` anchored record. Header and body are kept verbatim;
    // only the lines a mutation touches ever change.
    class block
    {
    public:
        block(block_header header, std::string header_line, std::vector<std::string> body)
            : header_(header)
            , header_line_(std::move(header_line))
            , body_(std::move(body))
        {}

        explicit block(raw_block raw)
            : block(raw.header, std::move(raw.header_line), std::move(raw.body))
        {}

        //------------------------------------------------------------------------
        // Header
        //------------------------------------------------------------------------

        file_id     id() const noexcept          { return header_.id; }
        class_id    cls() const noexcept         { return header_.cls; }
        bool        is_stripped() const noexcept { return header_.stripped; }
        std::string type() const                 { return type_name(header_.cls); }

        std::string const & header_line() const noexcept { return header_line_; }

        // Rewrites the anchor in place; whatever follows it on the line stays.
        void set_id(file_id new_id)
        {
            auto amp = header_line_.find(" &");
            if (amp == std::string::npos)
            {
                header_.id = new_id;
                header_line_ = make_header_line(header_);
            }
            else
            {
                size_t start = amp + 2;
                size_t end = start;
                if (end < header_line_.size() && header_line_[end] == '-')
                    ++end;
                while (end < header_line_.size() && std::isdigit(static_cast<unsigned char>(header_line_[end])))
                    ++end;

                header_line_.replace(start, end - start, to_string(new_id));
                header_.id = new_id;
            }
            dirty_ = true;
        }

        //------------------------------------------------------------------------
        // Body
        //------------------------------------------------------------------------

        std::vector<std::string> const & lines() const noexcept { return body_; }

        // Write access; the block is considered modified from here on.
        std::vector<std::string> & edit_lines() noexcept
        {
            dirty_ = true;
            return body_;
        }

        // Header and body joined with '\n', no trailing break.
        std::string text() const
        {
            std::string out = header_line_;
            for (auto const & l : body_)
            {
                out += '\n';
                out += l;
            }
            return out;
        }

        bool dirty() const noexcept { return dirty_; }
        void clear_dirty() noexcept { dirty_ = false; }

    private:
        block_header             header_;
        std::string              header_line_;
        std::vector<std::string> body_;
        bool                     dirty_ = false;
    };

//========================================================================
// Document
//========================================================================

    class document
    {
    public:
        //------------------------------------------------------------------------
        // Construction
        //------------------------------------------------------------------------

        document() = default;

        static result<document> from_string(std::string_view text);
        static result<document> load(std::filesystem::path const & path);

        //------------------------------------------------------------------------
        // Layout
        //------------------------------------------------------------------------

        std::vector<std::string> const & preamble() const noexcept { return preamble_; }
        line_ending ending() const noexcept                        { return ending_; }
        bool final_newline() const noexcept                        { return final_newline_; }
        std::vector<diagnostic> const & diagnostics() const noexcept { return diagnostics_; }

        std::filesystem::path const & path() const noexcept { return path_; }
        void set_path(std::filesystem::path p) { path_ = std::move(p); }

        //------------------------------------------------------------------------
        // Block access
        //------------------------------------------------------------------------

        size_t block_count() const noexcept { return blocks_.size(); }

        std::vector<block> const & blocks() const noexcept { return blocks_; }

        // Pointers stay valid until the next structural change.
        block *       find_by_id(file_id id);
        block const * find_by_id(file_id id) const;

        std::vector<block *>       find_by_class(class_id cls);
        std::vector<block const *> find_by_class(class_id cls) const;

        bool contains(file_id id) const { return index_.contains(id); }

        std::unordered_set<file_id> all_ids() const;

        //------------------------------------------------------------------------
        // Structural mutation
        //------------------------------------------------------------------------

        // Random 10 digit positive id not already present.
        file_id generate_id();
        void seed(std::uint64_t s) { rng_.seed(s); }

        block & append(block b);
        size_t remove(std::unordered_set<file_id> const & ids);

        void rebuild_index();

        //------------------------------------------------------------------------
        // Dirty tracking
        //------------------------------------------------------------------------

        bool dirty() const noexcept;
        void clear_dirty() noexcept;

    private:
        std::vector<std::string>            preamble_;
        std::vector<block>                  blocks_;
        std::unordered_map<file_id, size_t> index_;   // first occurrence wins
        std::vector<diagnostic>             diagnostics_;
        line_ending                         ending_        = line_ending::lf;
        bool                                final_newline_ = true;
        bool                                structure_dirty_ = false;
        std::filesystem::path               path_;
        std::mt19937_64                     rng_ { std::random_device{}() };
    };

//========================================================================
// Lazy session
//========================================================================

    // Holds a path and parses on first access.
    class document_session
    {
    public:
        explicit document_session(std::filesystem::path path)
            : path_(std::move(path))
        {}

        result<document *> get();

        bool loaded() const noexcept { return doc_.has_value(); }
        void reset() { doc_.reset(); }

        std::filesystem::path const & path() const noexcept { return path_; }

    private:
        std::filesystem::path   path_;
        std::optional<document> doc_;
    };

//========================================================================
// Implementation
//========================================================================

    inline result<document> document::from_string(std::string_view text)
    {
        auto ctx = tokenize(text);
        auto & ts = ctx.result;

        bool signed_ok = false;
        for (auto const & l : ts.preamble)
        {
            if (detail::is_blank(l))
                continue;
            signed_ok = l.starts_with(detail::YAML_SIGNATURE);
            break;
        }

        if (!signed_ok)
            return make_error(error_kind::not_recognized, "Not a Unity YAML file (missing %YAML header)");
        if (ts.blocks.empty())
            return make_error(error_kind::not_recognized, "Not a Unity YAML file (no --- !u! blocks)");

        document doc;
        doc.preamble_      = std::move(ts.preamble);
        doc.ending_        = ts.ending;
        doc.final_newline_ = ts.final_newline;
        doc.diagnostics_   = std::move(ctx.errors);

        doc.blocks_.reserve(ts.blocks.size());
        for (auto & rb : ts.blocks)
            doc.blocks_.emplace_back(std::move(rb));

        for (auto const & d : doc.diagnostics_)
            log::warn("line " + std::to_string(d.line) + ": " + d.message);

        doc.rebuild_index();
        return doc;
    }

    inline result<document> document::load(std::filesystem::path const & path)
    {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || std::filesystem::is_directory(path, ec))
            return make_error(error_kind::not_found, "File not found: " + path.string());

        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in)
        {
            log::warn("cannot open " + path.string());
            return make_error(error_kind::io_failure, "Cannot read file: " + path.string());
        }

        std::ostringstream ss;
        ss << in.rdbuf();
        if (in.bad())
        {
            log::warn("read failed for " + path.string());
            return make_error(error_kind::io_failure, "Cannot read file: " + path.string());
        }

        auto doc = from_string(ss.str());
        if (!doc)
            return make_error(doc.err().kind, path.string() + ": " + doc.err().message);

        doc->path_ = path;
        log::debug("loaded " + path.string() + " (" + std::to_string(doc->block_count()) + " blocks)");
        return doc;
    }

//------------------------------------------------------------------------

    inline block * document::find_by_id(file_id id)
    {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &blocks_[it->second];
    }

    inline block const * document::find_by_id(file_id id) const
    {
        auto it = index_.find(id);
        return it == index_.end() ? nullptr : &blocks_[it->second];
    }

    inline std::vector<block *> document::find_by_class(class_id cls)
    {
        std::vector<block *> out;
        for (auto & b : blocks_)
            if (b.cls() == cls)
                out.push_back(&b);
        return out;
    }

    inline std::vector<block const *> document::find_by_class(class_id cls) const
    {
        std::vector<block const *> out;
        for (auto const & b : blocks_)
            if (b.cls() == cls)
                out.push_back(&b);
        return out;
    }

    inline std::unordered_set<file_id> document::all_ids() const
    {
        std::unordered_set<file_id> out;
        for (auto const & b : blocks_)
            out.insert(b.id());
        return out;
    }

//------------------------------------------------------------------------

    inline file_id document::generate_id()
    {
        std::uniform_int_distribution<std::int64_t> dist(1000000000LL, 9999999999LL);

        file_id id;
        do
        {
            id = file_id{ dist(rng_) };
        }
        while (contains(id));

        return id;
    }

    inline block & document::append(block b)
    {
        blocks_.push_back(std::move(b));
        structure_dirty_ = true;
        rebuild_index();
        return blocks_.back();
    }

    inline size_t document::remove(std::unordered_set<file_id> const & ids)
    {
        size_t removed = std::erase_if(blocks_,
            [&](block const & b) { return ids.contains(b.id()); });

        if (removed > 0)
        {
            structure_dirty_ = true;
            rebuild_index();
        }
        return removed;
    }

    inline void document::rebuild_index()
    {
        index_.clear();
        for (size_t i = 0; i < blocks_.size(); ++i)
            index_.try_emplace(blocks_[i].id(), i);
    }

//------------------------------------------------------------------------

    inline bool document::dirty() const noexcept
    {
        if (structure_dirty_)
            return true;
        return std::ranges::any_of(blocks_, [](block const & b) { return b.dirty(); });
    }

    inline void document::clear_dirty() noexcept
    {
        structure_dirty_ = false;
        for (auto & b : blocks_)
            b.clear_dirty();
    }

//------------------------------------------------------------------------

    inline result<document *> document_session::get()
    {
        if (!doc_)
        {
            auto loaded = document::load(path_);
            if (!loaded)
                return loaded.err();
            doc_.emplace(std::move(*loaded));
        }
        return &*doc_;
    }

} // namespace uyd

#endif // UYD_DOCUMENT_HPP
