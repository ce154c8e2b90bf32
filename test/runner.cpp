/*
 * ext4extract
 *
 * This software is distributed under the Common Public License 1.0
 */

#define CATCH_CONFIG_MAIN
#define CATCH_CONFIG_CONSOLE_WIDTH 120

#include "catch.hpp"
#include "runner.h"
#include <cstdio>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>

namespace runner {
    /* creates a fresh directory named prefix_<random hex> under the
     * system temporary directory */
    static std::filesystem::path make_temp_dir(const std::string & prefix) {
        std::random_device dev;
        std::mt19937_64 prng(dev());
        const std::filesystem::path base =
            std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 100; attempt++) {
            char suffix[17];
            snprintf(suffix, sizeof(suffix), "%016llx",
                (unsigned long long) prng());
            const std::filesystem::path p = base / (prefix + "_" + suffix);
            if (std::filesystem::create_directory(p))
                return p;
        }
        throw std::runtime_error("no temporary directory for " + prefix);
    }

    bool contains(std::string line, std::string substr) {
        return line.find(substr) != std::string::npos;
    }

    std::string file_contents(std::filesystem::path path) {
        std::ifstream in(path, std::ios::binary);
        REQUIRE(in.is_open());
        return std::string(std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>());
    }

    tempdir::tempdir(std::string testname)
    : path(make_temp_dir(testname)) {
    }

    tempdir::~tempdir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    tempfile::tempfile(std::string testname)
    : dir(testname), file_path(dir.path / "out.txt") {
        file = fopen(file_path.string().c_str(), "wb+");
        if (file == NULL)
            throw std::runtime_error("cannot create " + file_path.string());
    }

    tempfile::~tempfile() {
        fclose(file);
    }

    std::string tempfile::contents() {
        fflush(file);
        return file_contents(file_path);
    }

    bool tempfile::validate_contains(std::string substr) {
        return contains(contents(), substr);
    }

    bool tempfile::validate_contents(std::string expected) {
        return contents() == expected;
    }

    std::string tempfile::first_line() {
        const std::string all = contents();
        const size_t nl = all.find('\n');
        if (nl == std::string::npos)
            throw std::runtime_error(file_path.string() + " has no full line");
        return all.substr(0, nl);
    }
}
