// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Split a raw METAR/TAF line into classified groups.
 *
 * The parsers never index groups by position; they walk a TokenCursor
 * and decide what a group is by looking at its shape.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <avgear/structure/exception.hxx>

namespace avgear {

class ReportToken
{
public:
    enum Shape {
        SHAPE_DIGITS,   ///< digits only
        SHAPE_LETTERS,  ///< letters only
        SHAPE_MIXED,    ///< letters and digits
        SHAPE_OTHER     ///< anything containing '/', '+', '-', ...
    };

    enum Keyword {
        KW_NONE,
        KW_METAR,
        KW_SPECI,
        KW_TAF,
        KW_AMD,
        KW_COR,
        KW_AUTO,
        KW_NIL,
        KW_CAVOK,
        KW_NOSIG,
        KW_NSW,
        KW_BECMG,
        KW_TEMPO,
        KW_PROB30,
        KW_PROB40,
        KW_RMK
    };

    ReportToken(const std::string& text, int index, int column);

    const std::string& text() const { return _text; }
    int index() const { return _index; }
    int column() const { return _column; }
    Shape shape() const { return _shape; }
    Keyword keyword() const { return _keyword; }

    av_location location() const { return av_location(_index, _column); }

    /**
     * Compare against a shape pattern of the same length: 'A' stands
     * for an upper-case letter, '9' for a digit, anything else must
     * match literally.
     *
     * @code
     * tok.matches("AAAA");       // station identifier
     * tok.matches("999999Z");    // day, hour and minute
     * @endcode
     */
    bool matches(const char* pattern) const;

    bool startsWith(const char* prefix) const;
    bool endsWith(const char* suffix) const;

private:
    std::string _text;
    int _index;
    int _column;
    Shape _shape;
    Keyword _keyword;
};


class ReportTokens
{
public:
    typedef std::vector<ReportToken>::const_iterator const_iterator;

    /**
     * Scan a raw report. Throws av_empty_input_exception if nothing but
     * whitespace is given; every other group is kept as it is.
     */
    explicit ReportTokens(const std::string& raw);

    const std::string& raw() const { return _raw; }

    std::size_t size() const { return _tokens.size(); }
    const ReportToken& operator[](std::size_t i) const { return _tokens[i]; }

    const_iterator begin() const { return _tokens.begin(); }
    const_iterator end() const { return _tokens.end(); }

private:
    std::string _raw;
    std::vector<ReportToken> _tokens;
};


/**
 * Forward-only reading position over a ReportTokens sequence.
 */
class TokenCursor
{
public:
    explicit TokenCursor(const ReportTokens& tokens);

    bool atEnd() const { return _pos >= _tokens.size(); }

    /// true if there are at least ahead + 1 groups left
    bool has(std::size_t ahead = 0) const { return _pos + ahead < _tokens.size(); }

    /// group at the current position plus ahead; has(ahead) must be true
    const ReportToken& peek(std::size_t ahead = 0) const { return _tokens[_pos + ahead]; }

    const ReportToken& next() { return _tokens[_pos++]; }
    void skip(std::size_t n = 1);

    std::size_t position() const { return _pos; }

    /// groups from the current position to the end, joined by spaces
    std::string remainder() const;

private:
    const ReportTokens& _tokens;
    std::size_t _pos;
};

} // namespace avgear
