#include "test.h"

#include <cstdlib>

TEST_CASE("parseClock") {
    CHECK_EQ(parseClock("16000000"), 16000000UL);
    CHECK_EQ(parseClock("16M"), 16000000UL);
    CHECK_EQ(parseClock("20 MHz"), 20000000UL);
    CHECK_EQ(parseClock("32768Hz"), 32768UL);
    CHECK_EQ(parseClock("500k"), 500000UL);

    CHECK_THROWS_AS(parseClock(""), config_exception);
    CHECK_THROWS_AS(parseClock("0"), config_exception);
    CHECK_THROWS_AS(parseClock("-1"), config_exception);
    CHECK_THROWS_AS(parseClock("16G"), config_exception);
    CHECK_THROWS_AS(parseClock("fast"), config_exception);
}

TEST_CASE("parseClock keeps F_CPU within 32 bits") {
    CHECK_EQ(parseClock("4294967295"), 4294967295UL);
    CHECK_EQ(parseClock("4294M"), 4294000000UL);

    CHECK_THROWS_AS(parseClock("4294967296"), config_exception);
    CHECK_THROWS_AS(parseClock("4295M"), config_exception);
    CHECK_THROWS_AS(parseClock("18446744073709551615"), config_exception);
    CHECK_THROWS_AS(parseClock("99999999999999999999999"), config_exception);
}

TEST_CASE("fuse settings are formatted for tinyupdi") {
    CHECK_EQ(formatFuse(5, 0xC5), "5:0xC5");
    CHECK_EQ(formatFuse(0, 0x00), "0:0x00");
    CHECK_EQ(formatFuses(FuseMap{{2, 0x01}, {8, 0x0F}}), "2:0x01 8:0x0F");
    CHECK_EQ(formatFuses(FuseMap()), "");
}

TEST_CASE("parseFuseByte") {
    CHECK_EQ(parseFuseByte("0xC5"), 0xC5);
    CHECK_EQ(parseFuseByte("0x04"), 0x04);
    CHECK_EQ(parseFuseByte("197"), 197);
    CHECK_EQ(parseFuseByte("0b11000101"), 0xC5);
    CHECK_EQ(parseFuseByte("0"), 0);

    CHECK_THROWS_AS(parseFuseByte(""), config_exception);
    CHECK_THROWS_AS(parseFuseByte("0x100"), config_exception);
    CHECK_THROWS_AS(parseFuseByte("0xZZ"), config_exception);
    CHECK_THROWS_AS(parseFuseByte("-5"), config_exception);
}

TEST_CASE("defaults match the DumpMaster64 board") {
    BuildConfig cfg;
    CHECK_EQ(cfg.device, "attiny814");
    CHECK_EQ(cfg.clock, 16000000UL);
    CHECK_EQ(formatFuses(cfg.fuses), "0:0x00 1:0x00 2:0x01 4:0x00 5:0xC5 6:0x04 7:0x00 8:0x00");
    CHECK_EQ(cfg.artifact("elf"), "dumpmaster64.elf");
    CHECK_EQ(cfg.inWorkDir("a.bin"), "a.bin");

    cfg.workDir = "/tmp/build/";
    CHECK_EQ(cfg.inWorkDir("a.bin"), "/tmp/build/a.bin");
    CHECK_EQ(cfg.inWorkDir("/abs/a.bin"), "/abs/a.bin");
}

TEST_CASE("setFuse") {
    BuildConfig cfg;
    cfg.setFuse("5:0xC4");
    CHECK_EQ(cfg.fuses.at(5), 0xC4);
    cfg.setFuse("0:2");
    CHECK_EQ(cfg.fuses.at(0), 2);
    CHECK_EQ(cfg.fuses.size(), 8u);

    CHECK_THROWS_AS(cfg.setFuse("3:0x00"), config_exception);
    CHECK_THROWS_AS(cfg.setFuse("9:0x00"), config_exception);
    CHECK_THROWS_AS(cfg.setFuse("5"), config_exception);
    CHECK_THROWS_AS(cfg.setFuse(":0x00"), config_exception);
    CHECK_THROWS_AS(cfg.setFuse("x:0x00"), config_exception);
}

TEST_CASE("NAME=VALUE assignments") {
    BuildConfig cfg;
    CHECK(cfg.assign("DEVICE", "attiny1614"));
    CHECK(cfg.assign("CLOCK", "20M"));
    CHECK(cfg.assign("FUSE2", "0x02"));
    CHECK(cfg.assign("GCCPATH", "/usr"));
    CHECK_EQ(cfg.device, "attiny1614");
    CHECK_EQ(cfg.clock, 20000000UL);
    CHECK_EQ(cfg.fuses.at(2), 0x02);
    CHECK_EQ(cfg.gccPath, "/usr");

    CHECK_FALSE(cfg.assign("FUSE3", "0x00"));
    CHECK_FALSE(cfg.assign("CFLAGS", "-O2"));
    CHECK_THROWS_AS(cfg.assign("DEVICE", ""), config_exception);
    CHECK_THROWS_AS(cfg.assign("CLOCK", "soon"), config_exception);
}

TEST_CASE("environment overrides the defaults") {
    setenv("DEVICE", "attiny412", 1);
    setenv("FUSE5", "0xC4", 1);
    setenv("CLOCK", "20000000", 1);

    BuildConfig cfg;
    cfg.loadEnvironment();
    CHECK_EQ(cfg.device, "attiny412");
    CHECK_EQ(cfg.fuses.at(5), 0xC4);
    CHECK_EQ(cfg.clock, 20000000UL);

    // Later assignments win, as on the command line.
    cfg.assign("DEVICE", "attiny814");
    CHECK_EQ(cfg.device, "attiny814");

    unsetenv("DEVICE");
    unsetenv("FUSE5");
    unsetenv("CLOCK");
}

TEST_CASE("parseSizeBackend") {
    CHECK(parseSizeBackend("avr-size") == SizeBackend::AVR_SIZE);
    CHECK(parseSizeBackend("bfd") == SizeBackend::BFD);
    CHECK_THROWS_AS(parseSizeBackend("llvm"), config_exception);
}
