#include "test.h"

#include <algorithm>

#include "builder.h"

static std::vector<std::string> sorted(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    return v;
}

TEST_CASE("all builds every artifact and removes the intermediates") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    builder.run(Command::ALL);

    CHECK_EQ(sorted(dir.files()),
             std::vector<std::string>{"fw.asm", "fw.bin", "fw.elf", "fw.hex"});
    REQUIRE_EQ(tc.calls.size(), 5u);
    CHECK_EQ(tc.calls[0], "compile fw.elf");
    CHECK_EQ(tc.calls[1], "binary fw.elf fw.bin");
    CHECK_EQ(tc.calls[2], "ihex fw.elf fw.hex");
    CHECK_EQ(tc.calls[3], "disassemble fw.elf fw.asm");
    CHECK_EQ(tc.calls[4], "measure fw.elf");
    CHECK(prog.requests.empty());
}

TEST_CASE("elf keeps the elf only") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder(cfg, tc, prog).run(Command::ELF);

    CHECK_EQ(dir.files(), std::vector<std::string>{"fw.elf"});
}

TEST_CASE("bin, hex and asm each leave exactly their own artifact") {
    struct {
        Command cmd;
        const char *artifact;
    } cases[] = {
        {Command::BIN, "fw.bin"},
        {Command::HEX, "fw.hex"},
        {Command::ASM, "fw.asm"},
    };

    for (const auto &c : cases) {
        CAPTURE(c.artifact);
        TempDir dir;
        BuildConfig cfg = configIn(dir);
        MockToolchain tc;
        MockProgrammer prog;
        Builder(cfg, tc, prog).run(c.cmd);

        CHECK_EQ(dir.files(), std::vector<std::string>{c.artifact});
        CHECK_FALSE(dir.exists("fw.elf"));
    }
}

TEST_CASE("steps that consume the elf fail when it was never built") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    CHECK_THROWS_AS(builder.buildImage(ImageFormat::BINARY), precondition_exception);
    CHECK_THROWS_AS(builder.buildImage(ImageFormat::IHEX), precondition_exception);
    CHECK_THROWS_AS(builder.buildAsm(), precondition_exception);
    CHECK_THROWS_AS(builder.reportSize(), precondition_exception);
    CHECK(tc.calls.empty());

    try {
        builder.buildAsm();
    } catch (precondition_exception &e) {
        CHECK(std::string(e.what()).find("fw.elf") != std::string::npos);
        CHECK_EQ(e.exitStatus(), EXIT_BUILD_ERROR);
    }
}

TEST_CASE("reportSize sums text+data for flash and data+bss for RAM") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    builder.buildElf();
    const SectionSizes s = builder.reportSize();
    CHECK_EQ(s.flash(), 120u);
    CHECK_EQ(s.ram(), 30u);

    cfg.device = "attiny9999";
    CHECK_EQ(builder.reportSize().flash(), 120u);
}

TEST_CASE("clean removes artifacts, keeps other files and can run twice") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    dir.touch("DumpMaster64.ino");
    builder.buildElf();
    builder.buildImage(ImageFormat::BINARY);
    dir.touch("stale.lst");
    dir.touch("other.d");

    builder.run(Command::CLEAN);
    CHECK_EQ(dir.files(), std::vector<std::string>{"DumpMaster64.ino"});

    CHECK_NOTHROW(builder.run(Command::CLEAN));
    CHECK_EQ(dir.files(), std::vector<std::string>{"DumpMaster64.ino"});
}

TEST_CASE("a failing compile aborts the rest of the pipeline") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    tc.compileStatus = 2;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    try {
        builder.run(Command::INSTALL);
        FAIL("install should have failed");
    } catch (tool_exception &e) {
        CHECK_EQ(e.exitStatus(), 2);
        CHECK_EQ(e.toolName(), "avr-gcc");
    }
    CHECK_EQ(tc.calls.size(), 1u);
    CHECK(prog.requests.empty());
    CHECK(dir.files().empty());
}

TEST_CASE("programmer invocations") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    SUBCASE("install writes fuses and flash in one session") {
        builder.run(Command::INSTALL);
        REQUIRE_EQ(prog.requests.size(), 1u);
        REQUIRE(prog.requests[0].fuses.has_value());
        REQUIRE(prog.requests[0].flash.has_value());
        CHECK_EQ(*prog.requests[0].flash, "fw.bin");
        CHECK_EQ(*prog.requests[0].fuses, cfg.fuses);
        CHECK_EQ(dir.files(), std::vector<std::string>{"fw.bin"});
    }

    SUBCASE("upload writes flash only") {
        builder.run(Command::UPLOAD);
        REQUIRE_EQ(prog.requests.size(), 1u);
        CHECK_FALSE(prog.requests[0].fuses.has_value());
        REQUIRE(prog.requests[0].flash.has_value());
        CHECK_EQ(*prog.requests[0].flash, "fw.bin");
    }

    SUBCASE("fuses burns fuses only and compiles nothing") {
        cfg.setFuse("5:0xC4");
        builder.run(Command::FUSES);
        REQUIRE_EQ(prog.requests.size(), 1u);
        CHECK_FALSE(prog.requests[0].flash.has_value());
        REQUIRE(prog.requests[0].fuses.has_value());
        CHECK_EQ(prog.requests[0].fuses->at(5), 0xC4);
        CHECK(tc.calls.empty());
    }
}

TEST_CASE("flashing without an image is refused") {
    TempDir dir;
    BuildConfig cfg = configIn(dir);
    MockToolchain tc;
    MockProgrammer prog;
    Builder builder(cfg, tc, prog);

    CHECK_THROWS_AS(builder.program(false, true), precondition_exception);
    CHECK(prog.requests.empty());
}
