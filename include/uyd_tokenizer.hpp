// uyd_tokenizer.hpp - Unity YAML Document (uyd) - Block splitter
// Version 0.1.0
// Copyright 2025 The uyd authors
// Licenced as-is under the MIT licence.

#ifndef UYD_TOKENIZER_HPP
#define UYD_TOKENIZER_HPP

#include "uyd_core.hpp"

namespace uyd
{
//========================================================================
// Token stream
//========================================================================

    enum class line_ending
    {
        lf,
        crlf
    };

    struct block_header
    {
        class_id cls      {0};
        file_id  id       {};
        bool     stripped {false};
    };

    struct raw_block
    {
        block_header             header;
        std::string              header_line;  // verbatim
        std::vector<std::string> body;         // verbatim, '\r' of a CRLF break kept
        size_t                   source_line {0};
    };

    struct token_stream
    {
        std::vector<std::string> preamble;     // %YAML / %TAG lines
        std::vector<raw_block>   blocks;       // file order
        line_ending              ending        {line_ending::lf};   // for lines created later
        bool                     final_newline {false};
    };

    struct diagnostic
    {
        size_t      line;
        std::string message;
    };

    using tokenize_context = context<token_stream, diagnostic>;

//========================================================================
// TOKENIZER API
//========================================================================

    // Pure: splits text into preamble and anchored blocks. Text without a
    // single anchor line yields zero blocks.
    tokenize_context tokenize(std::string_view text);

    // `--- !u!<class> &<id>[ stripped]`
    std::optional<block_header> parse_header(std::string_view line);

    std::string make_header_line(block_header const & h);

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        struct tokenizer_impl
        {
            tokenize_context ctx;
            raw_block *      current {nullptr};

            void run(std::string_view text);
            std::vector<std::string> split_lines(std::string_view text);
            void tokenize_line(std::string line, size_t line_no);
            void add_error(size_t line_no, std::string message);
        };

//---------------------------------------------------------------------------

        inline void tokenizer_impl::run(std::string_view text)
        {
            auto lines = split_lines(text);

            size_t line_no = 0;
            for (auto & line : lines)
                tokenize_line(std::move(line), ++line_no);
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::add_error(size_t line_no, std::string message)
        {
            ctx.errors.push_back(diagnostic{ line_no, std::move(message) });
        }

//---------------------------------------------------------------------------

        inline std::vector<std::string> tokenizer_impl::split_lines(std::string_view text)
        {
            std::vector<std::string> result;
            if (text.empty())
                return result;

            // Lines are split on '\n' only; a CRLF break leaves its '\r' in the
            // line text. The first break decides the convention for new lines.
            size_t first_nl = text.find('\n');
            if (first_nl != std::string_view::npos && first_nl > 0 && text[first_nl - 1] == '\r')
                ctx.result.ending = line_ending::crlf;

            size_t start = 0;
            while (start < text.size())
            {
                size_t nl = text.find('\n', start);
                if (nl == std::string_view::npos)
                {
                    result.emplace_back(text.substr(start));
                    ctx.result.final_newline = false;
                    return result;
                }

                result.emplace_back(text.substr(start, nl - start));
                start = nl + 1;
            }

            ctx.result.final_newline = true;
            return result;
        }

//---------------------------------------------------------------------------

        inline void tokenizer_impl::tokenize_line(std::string line, size_t line_no)
        {
            if (line.starts_with(ANCHOR_PREFIX))
            {
                if (auto h = parse_header(line))
                {
                    raw_block b;
                    b.header      = *h;
                    b.header_line = std::move(line);
                    b.source_line = line_no;

                    ctx.result.blocks.push_back(std::move(b));
                    current = &ctx.result.blocks.back();
                    return;
                }

                add_error(line_no, "unparseable block header kept as body text: \"" + std::string(strip_cr(line)) + "\"");
            }

            if (current)
                current->body.push_back(std::move(line));
            else
                ctx.result.preamble.push_back(std::move(line));
        }

    } // namespace detail

//========================================================================
// Tokenizer API implementation
//========================================================================

    inline std::optional<block_header> parse_header(std::string_view line)
    {
        using namespace detail;

        if (!line.starts_with(ANCHOR_PREFIX))
            return std::nullopt;

        std::string_view rest = line.substr(ANCHOR_PREFIX.size());

        size_t cls_len = 0;
        while (cls_len < rest.size() && std::isdigit(static_cast<unsigned char>(rest[cls_len])))
            ++cls_len;
        if (cls_len == 0)
            return std::nullopt;

        auto cls = parse_int(rest.substr(0, cls_len));
        rest = rest.substr(cls_len);

        if (!rest.starts_with(" &"))
            return std::nullopt;
        rest = rest.substr(2);

        size_t id_len = 0;
        if (id_len < rest.size() && rest[id_len] == '-')
            ++id_len;
        while (id_len < rest.size() && std::isdigit(static_cast<unsigned char>(rest[id_len])))
            ++id_len;

        auto id = parse_int(rest.substr(0, id_len));
        if (!cls || !id)
            return std::nullopt;

        rest = rest.substr(id_len);
        if (!rest.empty() && rest.front() != ' ' && rest.front() != '\t' && rest.front() != '\r')
            return std::nullopt;

        block_header h;
        h.cls      = static_cast<class_id>(*cls);
        h.id       = file_id{ *id };
        h.stripped = trim_sv(rest) == "stripped";
        return h;
    }

    inline std::string make_header_line(block_header const & h)
    {
        std::string line = std::string(detail::ANCHOR_PREFIX) + std::to_string(h.cls) + " &" + to_string(h.id);
        if (h.stripped)
            line += " stripped";
        return line;
    }

    inline tokenize_context tokenize(std::string_view text)
    {
        detail::tokenizer_impl t;
        t.run(text);
        return std::move(t.ctx);
    }

} // namespace uyd

#endif // UYD_TOKENIZER_HPP
