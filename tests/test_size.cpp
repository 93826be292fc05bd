#include "test.h"

TEST_CASE("avr-size output with a header line") {
    const char *out =
        "   text\t   data\t    bss\t    dec\t    hex\tfilename\n"
        "    100\t     20\t     10\t    130\t     82\tdumpmaster64.elf\n";

    const SectionSizes s = parseSizeOutput(out);
    CHECK_EQ(s.text, 100u);
    CHECK_EQ(s.data, 20u);
    CHECK_EQ(s.bss, 10u);
    CHECK_EQ(s.flash(), 120u);
    CHECK_EQ(s.ram(), 30u);
}

TEST_CASE("only the first numeric line counts") {
    const char *out =
        "   text    data     bss     dec     hex filename\n"
        "   7312      96     411    7819    1e8b a.elf\n"
        "      1       2       3       6       6 b.elf\n";

    const SectionSizes s = parseSizeOutput(out);
    CHECK_EQ(s.flash(), 7408u);
    CHECK_EQ(s.ram(), 507u);
}

TEST_CASE("zero sized sections") {
    const SectionSizes s = parseSizeOutput("0 0 0 0 0 empty.elf");
    CHECK_EQ(s.flash(), 0u);
    CHECK_EQ(s.ram(), 0u);
}

TEST_CASE("malformed size output is an error") {
    CHECK_THROWS_AS(parseSizeOutput(""), build_exception);
    CHECK_THROWS_AS(parseSizeOutput("   text    data     bss\n"), build_exception);
    CHECK_THROWS_AS(parseSizeOutput("avr-size: 'x.elf': No such file\n"), build_exception);
    CHECK_THROWS_AS(parseSizeOutput("  100  20\n"), build_exception);
    CHECK_THROWS_AS(parseSizeOutput("  100  -20  10  110  6e x.elf\n"), build_exception);
}
