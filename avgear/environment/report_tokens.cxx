// SPDX-License-Identifier: LGPL-2.1-or-later

/**
 * @file
 * @brief Split a raw METAR/TAF line into classified groups.
 */

#include "report_tokens.hxx"

#include <cctype>
#include <cstring>

#include <boost/tokenizer.hpp>

#include <avgear/debug/logstream.hxx>

namespace avgear {

namespace {

struct KeywordName {
    const char* text;
    ReportToken::Keyword keyword;
};

const KeywordName keywords[] = {
    { "METAR",  ReportToken::KW_METAR },
    { "SPECI",  ReportToken::KW_SPECI },
    { "TAF",    ReportToken::KW_TAF },
    { "AMD",    ReportToken::KW_AMD },
    { "COR",    ReportToken::KW_COR },
    { "AUTO",   ReportToken::KW_AUTO },
    { "NIL",    ReportToken::KW_NIL },
    { "CAVOK",  ReportToken::KW_CAVOK },
    { "NOSIG",  ReportToken::KW_NOSIG },
    { "NSW",    ReportToken::KW_NSW },
    { "BECMG",  ReportToken::KW_BECMG },
    { "TEMPO",  ReportToken::KW_TEMPO },
    { "PROB30", ReportToken::KW_PROB30 },
    { "PROB40", ReportToken::KW_PROB40 },
    { "RMK",    ReportToken::KW_RMK },
};

ReportToken::Shape classify(const std::string& s)
{
    bool digits = false, letters = false;
    for (unsigned char c : s) {
        if (std::isdigit(c))
            digits = true;
        else if (std::isalpha(c))
            letters = true;
        else
            return ReportToken::SHAPE_OTHER;
    }
    if (digits && letters)
        return ReportToken::SHAPE_MIXED;
    return digits ? ReportToken::SHAPE_DIGITS : ReportToken::SHAPE_LETTERS;
}

ReportToken::Keyword lookupKeyword(const std::string& s)
{
    for (const auto& k : keywords) {
        if (s == k.text)
            return k.keyword;
    }
    return ReportToken::KW_NONE;
}

} // anonymous namespace


ReportToken::ReportToken(const std::string& text, int index, int column) :
    _text(text),
    _index(index),
    _column(column),
    _shape(classify(text)),
    _keyword(lookupKeyword(text))
{
}

bool ReportToken::matches(const char* pattern) const
{
    if (std::strlen(pattern) != _text.size())
        return false;

    for (std::size_t i = 0; i < _text.size(); ++i) {
        const unsigned char c = _text[i];
        switch (pattern[i]) {
        case 'A':
            if (!std::isupper(c))
                return false;
            break;
        case '9':
            if (!std::isdigit(c))
                return false;
            break;
        default:
            if (c != static_cast<unsigned char>(pattern[i]))
                return false;
        }
    }
    return true;
}

bool ReportToken::startsWith(const char* prefix) const
{
    return _text.compare(0, std::strlen(prefix), prefix) == 0;
}

bool ReportToken::endsWith(const char* suffix) const
{
    const std::size_t n = std::strlen(suffix);
    return _text.size() >= n && _text.compare(_text.size() - n, n, suffix) == 0;
}


ReportTokens::ReportTokens(const std::string& raw) :
    _raw(raw)
{
    typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
    const boost::char_separator<char> sep(" \t\r\n");
    const tokenizer groups(_raw, sep);

    std::string::size_type pos = 0;
    int index = 0;
    for (tokenizer::const_iterator it = groups.begin(); it != groups.end(); ++it, ++index) {
        pos = _raw.find(*it, pos);
        _tokens.emplace_back(*it, index, static_cast<int>(pos));
        pos += it->size();
    }

    if (_tokens.empty())
        throw av_empty_input_exception("ReportTokens");

    AV_LOG(AV_ENVIRONMENT, AV_BULK, "scanned " << _tokens.size() << " groups from '" << _raw << "'");
}


TokenCursor::TokenCursor(const ReportTokens& tokens) :
    _tokens(tokens),
    _pos(0)
{
}

void TokenCursor::skip(std::size_t n)
{
    _pos += n;
    if (_pos > _tokens.size())
        _pos = _tokens.size();
}

std::string TokenCursor::remainder() const
{
    std::string result;
    for (std::size_t i = _pos; i < _tokens.size(); ++i) {
        if (!result.empty())
            result += ' ';
        result += _tokens[i].text();
    }
    return result;
}

} // namespace avgear
