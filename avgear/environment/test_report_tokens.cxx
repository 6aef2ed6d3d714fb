// SPDX-License-Identifier: LGPL-2.1-or-later

#include <avgear/misc/test_macros.hxx>

#include <iostream>
#include <string>

#include <avgear/structure/exception.hxx>

#include "report_tokens.hxx"

using namespace avgear;

void test_split()
{
    ReportTokens t("  METAR EGMC\t201650Z   31009KT\n");
    AV_CHECK_EQUAL(t.size(), 4u);
    AV_CHECK_EQUAL(t[0].text(), "METAR");
    AV_CHECK_EQUAL(t[1].text(), "EGMC");
    AV_CHECK_EQUAL(t[3].text(), "31009KT");

    AV_CHECK_EQUAL(t[0].index(), 0);
    AV_CHECK_EQUAL(t[3].index(), 3);
    AV_CHECK_EQUAL(t[0].column(), 2);
    AV_CHECK_EQUAL(t[1].column(), 8);
    AV_CHECK_EQUAL(t[2].column(), 13);

    // nothing is dropped, not even garbage
    ReportTokens g("EGMC ??? 201650Z");
    AV_CHECK_EQUAL(g.size(), 3u);
    AV_CHECK_EQUAL(g[1].text(), "???");
    AV_CHECK_EQUAL(g[1].shape(), ReportToken::SHAPE_OTHER);
}

void test_repeated_group_columns()
{
    ReportTokens t("BKN019 BKN019 BKN019");
    AV_CHECK_EQUAL(t[0].column(), 0);
    AV_CHECK_EQUAL(t[1].column(), 7);
    AV_CHECK_EQUAL(t[2].column(), 14);
}

void test_empty()
{
    AV_CHECK_THROW(ReportTokens(""), av_empty_input_exception);
    AV_CHECK_THROW(ReportTokens(" \t \r\n"), av_empty_input_exception);
}

void test_classification()
{
    ReportTokens t("TAF EGMC 201701Z 2018/2102 PROB30 TEMPO 9999 -SHRA RMK");
    AV_CHECK_EQUAL(t[0].keyword(), ReportToken::KW_TAF);
    AV_CHECK_EQUAL(t[1].keyword(), ReportToken::KW_NONE);
    AV_CHECK_EQUAL(t[1].shape(), ReportToken::SHAPE_LETTERS);
    AV_CHECK_EQUAL(t[2].shape(), ReportToken::SHAPE_MIXED);
    AV_CHECK_EQUAL(t[3].shape(), ReportToken::SHAPE_OTHER);
    AV_CHECK_EQUAL(t[4].keyword(), ReportToken::KW_PROB30);
    AV_CHECK_EQUAL(t[5].keyword(), ReportToken::KW_TEMPO);
    AV_CHECK_EQUAL(t[6].shape(), ReportToken::SHAPE_DIGITS);
    AV_CHECK_EQUAL(t[8].keyword(), ReportToken::KW_RMK);

    AV_VERIFY(t[1].matches("AAAA"));
    AV_VERIFY(!t[1].matches("AAA"));
    AV_VERIFY(t[2].matches("999999Z"));
    AV_VERIFY(t[3].matches("9999/9999"));
    AV_VERIFY(!t[6].matches("AAAA"));

    AV_VERIFY(t[7].startsWith("-SH"));
    AV_VERIFY(t[7].endsWith("RA"));
    AV_VERIFY(!t[7].endsWith("-SHRA-SHRA"));

    const av_location loc = t[2].location();
    AV_CHECK_EQUAL(loc.getToken(), 2);
    AV_CHECK_EQUAL(loc.getColumn(), 9);
}

void test_cursor()
{
    ReportTokens t("A B C D");
    TokenCursor c(t);
    AV_VERIFY(!c.atEnd());
    AV_VERIFY(c.has(3));
    AV_VERIFY(!c.has(4));
    AV_CHECK_EQUAL(c.peek(2).text(), "C");
    AV_CHECK_EQUAL(c.next().text(), "A");
    AV_CHECK_EQUAL(c.position(), 1u);
    AV_CHECK_EQUAL(c.remainder(), "B C D");
    c.skip(2);
    AV_CHECK_EQUAL(c.peek().text(), "D");
    c.skip(5);
    AV_VERIFY(c.atEnd());
    AV_CHECK_EQUAL(c.remainder(), "");
}

int main(int argc, char* argv[])
{
    try {
        test_split();
        test_repeated_group_columns();
        test_empty();
        test_classification();
        test_cursor();
    } catch (av_exception& e) {
        std::cerr << "Exception: " << e.getFormattedMessage() << std::endl;
        return -1;
    }

    std::cout << "all tests passed" << std::endl;
    return 0;
}
