#pragma once

#include "util/files.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

// Lays out <tmp>/work/<monorepo> so siblings land in <tmp>/work/.
class TempDirTest : public ::testing::Test {
protected:
    fs::path base;
    fs::path work;
    fs::path root;

    void SetUp() override {
        base = fs::temp_directory_path() / ("monosync-test-" + ms::util::generate_random_suffix(12));
        work = base / "work";
        root = work / "vendroo-monorepo";
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(base, ec);
    }

    fs::path makeSubmoduleDir(const std::string& name) const {
        fs::create_directories(root / name);
        return root / name;
    }

    fs::path makeSiblingDir(const std::string& name) const {
        fs::create_directories(work / name);
        return work / name;
    }

    static void writeFile(const fs::path& p, const std::string& content) {
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
    }
};
