#pragma once

#include "doctest.h"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "avrforge.h"
#include "config.h"
#include "programmer.h"
#include "toolchain.h"

// A scratch directory below /tmp, removed with its files on destruction.
class TempDir {
    std::string dir;

  public:
    TempDir() {
        char tmpl[] = "/tmp/avrforge-test-XXXXXX";
        const char *p = mkdtemp(tmpl);
        REQUIRE(p != nullptr);
        dir = p;
    }

    ~TempDir() {
        for (const auto &name : files())
            unlink((dir + "/" + name).c_str());
        rmdir(dir.c_str());
    }

    const std::string &path() const { return dir; }

    std::string file(const std::string &name) const { return dir + "/" + name; }

    void touch(const std::string &name, const char *content = "") const {
        FILE *f = fopen(file(name).c_str(), "w");
        REQUIRE(f != nullptr);
        fputs(content, f);
        fclose(f);
    }

    bool exists(const std::string &name) const {
        struct stat st;
        return stat(file(name).c_str(), &st) == 0;
    }

    std::vector<std::string> files() const {
        std::vector<std::string> names;
        DIR *d = opendir(dir.c_str());
        if (d == nullptr)
            return names;
        while (dirent *e = readdir(d)) {
            const std::string n = e->d_name;
            if (n != "." && n != "..")
                names.push_back(n);
        }
        closedir(d);
        return names;
    }
};

inline void touchFile(const std::string &path) {
    FILE *f = fopen(path.c_str(), "w");
    REQUIRE(f != nullptr);
    fclose(f);
}

// Stands in for avr-gcc: every step creates the file a real run would,
// and compile also leaves some intermediates behind.
class MockToolchain : public Toolchain {
  public:
    std::vector<std::string> calls;
    SectionSizes sizes;
    int compileStatus = 0;

    MockToolchain() {
        sizes.text = 100;
        sizes.data = 20;
        sizes.bss = 10;
    }

    void compile(const BuildConfig &cfg, const std::string &elf) override {
        calls.push_back("compile " + elf);
        if (compileStatus != 0)
            throw tool_exception("avr-gcc", compileStatus);
        touchFile(cfg.inWorkDir(elf));
        touchFile(cfg.inWorkDir(cfg.target + ".o"));
        touchFile(cfg.inWorkDir(cfg.target + ".map"));
        touchFile(cfg.inWorkDir(cfg.target + ".eep.hex"));
    }

    void extract(const BuildConfig &cfg, const std::string &elf, ImageFormat format,
                 const std::string &out) override {
        calls.push_back(std::string(format == ImageFormat::IHEX ? "ihex " : "binary ") + elf +
                        " " + out);
        touchFile(cfg.inWorkDir(out));
    }

    void disassemble(const BuildConfig &cfg, const std::string &elf,
                     const std::string &out) override {
        calls.push_back("disassemble " + elf + " " + out);
        touchFile(cfg.inWorkDir(out));
    }

    SectionSizes measure(const BuildConfig &, const std::string &elf) override {
        calls.push_back("measure " + elf);
        return sizes;
    }
};

class MockProgrammer : public Programmer {
  public:
    std::vector<ProgramRequest> requests;

    void program(const BuildConfig &, const ProgramRequest &req) override {
        requests.push_back(req);
    }
};

inline BuildConfig configIn(const TempDir &dir) {
    BuildConfig cfg;
    cfg.workDir = dir.path();
    cfg.target = "fw";
    return cfg;
}
